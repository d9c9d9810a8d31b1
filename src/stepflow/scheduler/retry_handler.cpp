#include "stepflow/scheduler/retry_handler.hpp"

#include "stepflow/io/context.hpp"
#include "stepflow/util/backoff.hpp"
#include "stepflow/util/log.hpp"

namespace stepflow {

namespace {

auto finish_cancelled(StepResult &result) -> StepResult {
  result.state = StepState::Failed;
  result.error = make_error_code(Error::Cancelled);
  result.error_message = result.error->message();
  result.ended_at = Clock::now();
  return std::move(result);
}

} // namespace

auto RetryHandler::run(const Step &step,
                       std::shared_ptr<const ExecutionContext> context)
    -> task<StepResult> {
  StepResult result{.step_id = step.step_id, .name = step.name};
  result.started_at = Clock::now();

  ExponentialBackoff backoff(
      {.initial = step.retry_base_delay, .max = step.retry_max_delay});

  for (int attempt = 0; attempt <= step.max_retries; ++attempt) {
    if (cancel_->stop_requested()) {
      co_return finish_cancelled(result);
    }

    auto outcome = co_await executor_->execute_attempt(step, context, attempt);
    result.attempts = attempt + 1;
    result.attempt_started_at.push_back(outcome.started_at);
    if (attempt == 0) {
      result.started_at = outcome.started_at;
    }

    if (outcome.succeeded()) {
      result.state = StepState::Completed;
      result.output = std::move(*outcome.value);
      result.ended_at = outcome.ended_at;
      co_return result;
    }

    result.error = outcome.value.error();
    result.error_message = std::move(outcome.error_message);
    // An unregistered action stays unregistered; retrying it only adds delay.
    if (attempt == step.max_retries ||
        outcome.value.error() == Error::Cancelled ||
        outcome.value.error() == Error::ActionNotFound) {
      break;
    }
    if (cancel_->stop_requested()) {
      co_return finish_cancelled(result);
    }

    auto delay = backoff.delay_for(attempt);
    log::info("Step '{}' attempt {}/{} failed ({}), retrying in {}ms",
              step.step_id, attempt + 1, step.max_retries + 1,
              result.error_message, delay.count());
    if (auto slept = co_await io::async_sleep(delay); !slept) {
      co_return finish_cancelled(result);
    }
  }

  result.state = StepState::Failed;
  result.ended_at = Clock::now();
  if (result.error != Error::Cancelled) {
    log::warn("Step '{}' exhausted after {} attempt(s): {}", step.step_id,
              result.attempts, result.error_message);
  }
  co_return result;
}

} // namespace stepflow
