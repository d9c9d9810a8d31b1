#include "stepflow/scheduler/result_aggregator.hpp"

#include "stepflow/util/log.hpp"

#include <format>

namespace stepflow {

ResultAggregator::ResultAggregator(WorkflowId id, const WorkflowDefinition &def) {
  result_.workflow_id = std::move(id);
  result_.name = def.name;
  result_.metadata = def.metadata;
  result_.state = WorkflowState::Pending;
}

auto ResultAggregator::mark_started() -> void {
  result_.state = WorkflowState::Running;
  result_.started_at = Clock::now();
}

auto ResultAggregator::record(StepResult step) -> void {
  const auto id = step.step_id;
  if (step.succeeded()) {
    result_.completed_steps.insert_or_assign(id, step);
  } else {
    result_.failed_steps.insert(id);
    if (result_.error.empty()) {
      result_.error = std::format("step '{}' failed: {}", id, step.error_message);
    }
  }
  result_.step_results.insert_or_assign(id, std::move(step));
}

auto ResultAggregator::skip(const StepId &step, SkipReason reason) -> void {
  if (result_.step_results.contains(step)) {
    return;
  }
  result_.skipped_steps.insert(step);
  result_.skip_reasons.insert_or_assign(step, reason);
}

auto ResultAggregator::set_error(std::string message) -> void {
  result_.error = std::move(message);
}

auto ResultAggregator::derive_state(std::size_t completed, std::size_t failed,
                                    std::size_t skipped) noexcept
    -> WorkflowState {
  if (failed == 0 && skipped == 0) {
    return WorkflowState::Completed;
  }
  if (failed > 0 && skipped > 0) {
    return WorkflowState::PartialFailure;
  }
  if (failed > 0 && completed == 0) {
    return WorkflowState::Failed;
  }
  return WorkflowState::PartialFailure;
}

auto ResultAggregator::finalize(std::optional<WorkflowState> forced)
    -> WorkflowState {
  result_.state = forced.value_or(derive_state(result_.completed_steps.size(),
                                               result_.failed_steps.size(),
                                               result_.skipped_steps.size()));
  result_.ended_at = Clock::now();
  log::info("Workflow {} finished: {} (completed={} failed={} skipped={} "
            "duration={}ms)",
            result_.workflow_id, to_string_view(result_.state),
            result_.completed_steps.size(), result_.failed_steps.size(),
            result_.skipped_steps.size(), result_.duration().count());
  return result_.state;
}

} // namespace stepflow
