#pragma once

#include "stepflow/workflow/results.hpp"
#include "stepflow/workflow/workflow_definition.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace stepflow {

/// Owns the WorkflowResult of one execution and every StepResult recorded
/// into it. Only the coordinator mutates it.
class ResultAggregator {
public:
  ResultAggregator(WorkflowId id, const WorkflowDefinition &def);

  auto mark_started() -> void;
  auto set_state(WorkflowState state) -> void { result_.state = state; }

  auto record(StepResult step) -> void;
  auto skip(const StepId &step, SkipReason reason) -> void;
  auto set_error(std::string message) -> void;

  /// Terminal state for a run that resolved or got stuck. Rules apply in
  /// order: nothing failed or skipped is Completed; failures next to skipped
  /// steps are PartialFailure; failures with nothing completed are Failed;
  /// anything else is PartialFailure.
  [[nodiscard]] static auto derive_state(std::size_t completed,
                                         std::size_t failed,
                                         std::size_t skipped) noexcept
      -> WorkflowState;

  /// Freezes the result. `forced` overrides the derived state (abort,
  /// cancellation, pure deadlock).
  auto finalize(std::optional<WorkflowState> forced = std::nullopt)
      -> WorkflowState;

  [[nodiscard]] auto result() const noexcept -> const WorkflowResult & {
    return result_;
  }
  [[nodiscard]] auto take() -> WorkflowResult { return std::move(result_); }

private:
  WorkflowResult result_;
};

} // namespace stepflow
