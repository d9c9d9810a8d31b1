#include "stepflow/executor/step_executor.hpp"

#include "stepflow/core/asio_awaitable.hpp"
#include "stepflow/util/log.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <format>
#include <variant>

namespace stepflow {

// Exceptions thrown by an action are converted here so they never reach the
// coordinator. The text is kept for StepResult::error_message.
auto StepExecutor::invoke_guarded(ActionCall call, std::string &message)
    -> task<Result<JsonValue>> {
  try {
    co_return co_await resolver_->invoke(std::move(call));
  } catch (const boost::system::system_error &e) {
    if (is_aborted(e.code())) {
      co_return fail(Error::Cancelled);
    }
    message = e.what();
  } catch (const std::exception &e) {
    message = e.what();
  } catch (...) {
    message = "unknown exception";
  }
  co_return fail(Error::ActionFailed);
}

auto StepExecutor::execute_attempt(
    const Step &step, std::shared_ptr<const ExecutionContext> context,
    int attempt) -> task<AttemptOutcome> {
  AttemptOutcome outcome{.value = fail(Error::Unknown)};
  outcome.started_at = Clock::now();

  ActionCall call{.step_id = step.step_id,
                  .action_ref = step.action_ref,
                  .params = step.params,
                  .context = std::move(context),
                  .attempt = attempt};

  std::string caught;
  try {
    if (!step.timeout) {
      outcome.value = co_await invoke_guarded(std::move(call), caught);
    } else {
      using namespace awaitable_ops;
      auto executor = co_await boost::asio::this_coro::executor;
      boost::asio::steady_timer deadline(executor, *step.timeout);
      auto raced = co_await (invoke_guarded(std::move(call), caught) ||
                             deadline.async_wait(use_nothrow));
      if (raced.index() == 0) {
        outcome.value = std::move(std::get<0>(raced));
      } else if (auto [ec] = std::get<1>(raced); ec) {
        outcome.value = fail(Error::Cancelled);
      } else {
        log::warn("Step '{}' attempt {} timed out after {}ms", step.step_id,
                  attempt + 1, step.timeout->count());
        outcome.value = fail(Error::Timeout);
      }
    }
  } catch (const std::exception &e) {
    caught = e.what();
    outcome.value = fail(Error::ActionFailed);
  } catch (...) {
    caught = "unknown exception";
    outcome.value = fail(Error::ActionFailed);
  }

  outcome.ended_at = Clock::now();
  if (!caught.empty()) {
    log::warn("Step '{}' attempt {} raised: {}", step.step_id, attempt + 1,
              caught);
  }
  if (!outcome.value) {
    outcome.error_message =
        caught.empty() ? outcome.value.error().message()
                       : std::format("{}: {}",
                                     outcome.value.error().message(), caught);
  }
  co_return outcome;
}

} // namespace stepflow
