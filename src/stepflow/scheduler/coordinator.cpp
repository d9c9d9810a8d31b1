#include "stepflow/scheduler/coordinator.hpp"

#include "stepflow/core/asio_awaitable.hpp"
#include "stepflow/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>

#include <format>
#include <string_view>
#include <utility>

namespace stepflow {

namespace {

[[nodiscard]] auto never_started(const Step &step) -> StepResult {
  StepResult result{.step_id = step.step_id, .name = step.name};
  result.state = StepState::Failed;
  result.error = make_error_code(Error::Cancelled);
  result.error_message = result.error->message();
  result.started_at = result.ended_at = Clock::now();
  return result;
}

// The retry loop itself threw. Report the step as attempted and failed so the
// run loop still settles it.
[[nodiscard]] auto escaped(const Step &step, std::string_view what)
    -> StepResult {
  StepResult result{.step_id = step.step_id, .name = step.name};
  result.state = StepState::Failed;
  result.error = make_error_code(Error::ActionFailed);
  result.error_message = std::format("{}: {}", result.error->message(), what);
  result.attempts = 1;
  result.started_at = result.ended_at = Clock::now();
  result.attempt_started_at.push_back(result.started_at);
  return result;
}

} // namespace

auto ExecutionCoordinator::create(Params params)
    -> std::shared_ptr<ExecutionCoordinator> {
  auto self =
      std::make_shared<ExecutionCoordinator>(Token{}, std::move(params));
  self->cancel_->set_wake_handler(
      [weak = self->weak_from_this()] {
        if (auto coordinator = weak.lock()) {
          coordinator->wake();
        }
      });
  return self;
}

ExecutionCoordinator::ExecutionCoordinator(Token, Params params)
    : executor_(std::move(params.executor)),
      workflow_id_(std::move(params.workflow_id)),
      def_(std::move(params.definition)), graph_(std::move(params.graph)),
      state_(graph_.make_run_state()),
      context_(std::make_shared<ExecutionContext>(
          std::move(params.initial_context))),
      cancel_(std::move(params.cancellation)),
      retry_(*params.step_executor, *cancel_),
      limiter_(executor_,
               static_cast<std::size_t>(def_->max_parallel_steps)),
      aggregator_(workflow_id_, *def_),
      events_(executor_, def_->steps.size() + 1), deadline_(executor_),
      on_progress_(std::move(params.on_progress)) {
  steps_by_node_.resize(graph_.size(), nullptr);
  for (const auto &step : def_->steps) {
    if (auto idx = graph_.index_of(step.step_id); idx != kInvalidNode) {
      steps_by_node_[idx] = &step;
    }
  }
}

auto ExecutionCoordinator::run() -> task<WorkflowResult> {
  co_await boost::asio::this_coro::throw_if_cancelled(false);

  aggregator_.mark_started();
  log::info("Workflow {} ('{}') started: {} step(s), max_parallel={}, "
            "continue_on_error={}",
            workflow_id_, def_->name, graph_.size(), def_->max_parallel_steps,
            def_->continue_on_error);
  arm_deadline();
  publish();

  for (;;) {
    if (cancel_->is_cancelled()) {
      co_return co_await finish_cancelled();
    }
    const bool paused = is_paused();
    sync_pause_state(paused);
    if (!paused) {
      dispatch_ready();
    }

    if (state_.in_flight.none()) {
      if (!graph_.has_pending_work(state_)) {
        co_return finish_resolved();
      }
      if (!paused) {
        co_return finish_deadlocked();
      }
    }

    auto event = co_await next_event();
    if (!event) {
      continue;
    }
    const auto step_id = event->step_id;
    if (record(std::move(*event)) && !def_->continue_on_error &&
        !cancel_->is_cancelled()) {
      co_return finish_aborted(step_id);
    }
  }
}

auto ExecutionCoordinator::dispatch_ready() -> void {
  auto ready = graph_.ready_steps(state_);
  if (ready.empty()) {
    return;
  }
  auto snapshot = std::make_shared<const ExecutionContext>(*context_);
  for (NodeIndex idx : ready) {
    spawn_step(idx, snapshot);
  }
}

auto ExecutionCoordinator::spawn_step(
    NodeIndex idx, std::shared_ptr<const ExecutionContext> snapshot) -> void {
  const auto &step_id = graph_.key_of(idx);
  state_.in_flight.set(idx);
  log::debug("Workflow {} dispatch step '{}' (in_flight={})", workflow_id_,
             step_id, state_.in_flight.count());
  auto slot = cancel_->register_step(step_id);
  co_spawn(executor_, run_step(shared_from_this(), idx, std::move(snapshot)),
           boost::asio::bind_cancellation_slot(slot, detached));
}

// One step task: wait for a permit, run the retry loop, report back. The
// result is queued before the permit is returned so the coordinator sees a
// failure before any queued sibling can start.
auto ExecutionCoordinator::run_step(
    std::shared_ptr<ExecutionCoordinator> self, NodeIndex idx,
    std::shared_ptr<const ExecutionContext> snapshot) -> task<void> {
  co_await boost::asio::this_coro::throw_if_cancelled(false);
  const Step &step = *self->steps_by_node_[idx];

  auto permit = co_await self->limiter_.acquire();
  if (!permit) {
    self->post_result(never_started(step));
    co_return;
  }
  StepResult result;
  try {
    result = co_await self->retry_.run(step, std::move(snapshot));
  } catch (const std::exception &e) {
    result = escaped(step, e.what());
  } catch (...) {
    result = escaped(step, "unknown exception");
  }
  self->post_result(std::move(result));
  permit->reset();
}

auto ExecutionCoordinator::post_result(StepResult result) -> void {
  if (!events_.try_send(boost::system::error_code{},
                        Event{std::move(result)})) {
    log::error("Workflow {} dropped a step result: event queue full",
               workflow_id_);
  }
}

auto ExecutionCoordinator::next_event() -> task<Event> {
  auto [ec, event] = co_await events_.async_receive(use_nothrow);
  if (ec) {
    co_return std::nullopt;
  }
  if (!event) {
    wake_pending_ = false;
  }
  co_return std::move(event);
}

// At most one wake-up is queued at a time, so results always fit in the
// channel buffer.
auto ExecutionCoordinator::wake() -> void {
  if (wake_pending_ || finished_) {
    return;
  }
  wake_pending_ = events_.try_send(boost::system::error_code{}, Event{});
}

auto ExecutionCoordinator::wake_from_any_thread() -> void {
  boost::asio::post(executor_, [weak = weak_from_this()] {
    if (auto self = weak.lock()) {
      self->wake();
    }
  });
}

auto ExecutionCoordinator::record(StepResult result) -> bool {
  const NodeIndex idx = graph_.index_of(result.step_id);
  if (idx == kInvalidNode || !state_.in_flight.test(idx)) {
    log::error("Workflow {} got a result for unknown step '{}'", workflow_id_,
               result.step_id);
    return false;
  }
  state_.in_flight.reset(idx);

  if (result.attempts == 0) {
    // Cancelled before its first attempt; it stays unresolved.
    return false;
  }

  const bool failed = !result.succeeded();
  if (failed) {
    state_.failed.set(idx);
    log::warn("Workflow {} step '{}' failed after {} attempt(s): {}",
              workflow_id_, result.step_id, result.attempts,
              result.error_message);
  } else {
    state_.completed.set(idx);
    context_->set_output(result.step_id, result.output);
    log::info("Workflow {} step '{}' completed in {}ms ({} attempt(s))",
              workflow_id_, result.step_id, result.duration().count(),
              result.attempts);
  }
  aggregator_.record(std::move(result));
  publish();
  return failed;
}

auto ExecutionCoordinator::pause() -> bool {
  if (paused_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  wake_from_any_thread();
  return true;
}

auto ExecutionCoordinator::resume() -> bool {
  if (!paused_.exchange(false, std::memory_order_acq_rel)) {
    return false;
  }
  wake_from_any_thread();
  return true;
}

auto ExecutionCoordinator::sync_pause_state(bool paused) -> void {
  const auto want = paused ? WorkflowState::Paused : WorkflowState::Running;
  if (aggregator_.result().state != want) {
    log::info("Workflow {} {}", workflow_id_,
              want == WorkflowState::Paused ? "paused" : "resumed");
    aggregator_.set_state(want);
    publish();
  }
}

auto ExecutionCoordinator::skip_unresolved(SkipReason reason) -> std::size_t {
  std::size_t skipped = 0;
  for (NodeIndex idx = 0; idx < graph_.size(); ++idx) {
    if (!state_.is_resolved(idx)) {
      aggregator_.skip(graph_.key_of(idx), reason);
      ++skipped;
    }
  }
  return skipped;
}

auto ExecutionCoordinator::arm_deadline() -> void {
  if (!def_->timeout) {
    return;
  }
  deadline_.expires_after(*def_->timeout);
  deadline_.async_wait([weak = weak_from_this()](boost::system::error_code ec) {
    auto self = weak.lock();
    if (ec || !self || self->finished_) {
      return;
    }
    log::warn("Workflow {} exceeded its {}ms timeout", self->workflow_id_,
              self->def_->timeout->count());
    self->timed_out_ = true;
    self->cancel_->request_cancel();
  });
}

auto ExecutionCoordinator::publish() -> void {
  if (on_progress_) {
    on_progress_(aggregator_.result());
  }
}

auto ExecutionCoordinator::finish_aborted(const StepId &failed)
    -> WorkflowResult {
  log::warn("Workflow {} aborting after step '{}' failed ({} step(s) still "
            "in flight)",
            workflow_id_, failed, state_.in_flight.count());
  cancel_->request_stop();
  skip_unresolved(SkipReason::Aborted);
  return seal(WorkflowState::Failed);
}

auto ExecutionCoordinator::finish_cancelled() -> task<WorkflowResult> {
  log::info("Workflow {} cancelling, waiting for {} in-flight step(s)",
            workflow_id_, state_.in_flight.count());
  while (state_.in_flight.any()) {
    auto event = co_await next_event();
    if (event) {
      record(std::move(*event));
    }
  }
  skip_unresolved(SkipReason::Cancelled);
  aggregator_.set_error(timed_out_ ? "workflow timeout" : "workflow cancelled");
  co_return seal(WorkflowState::Cancelled);
}

auto ExecutionCoordinator::finish_deadlocked() -> WorkflowResult {
  const bool attempted = state_.attempted_any();
  const auto blocked = skip_unresolved(SkipReason::UpstreamFailed);
  log::warn("Workflow {} cannot make progress: {} step(s) blocked by failed "
            "dependencies",
            workflow_id_, blocked);
  if (!attempted) {
    return seal(WorkflowState::Deadlocked);
  }
  return seal(std::nullopt);
}

auto ExecutionCoordinator::finish_resolved() -> WorkflowResult {
  return seal(std::nullopt);
}

auto ExecutionCoordinator::seal(std::optional<WorkflowState> forced)
    -> WorkflowResult {
  finished_ = true;
  deadline_.cancel();
  aggregator_.finalize(forced);
  publish();
  return aggregator_.result();
}

} // namespace stepflow
