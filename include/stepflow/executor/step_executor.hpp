#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/executor/action.hpp"
#include "stepflow/workflow/execution_context.hpp"
#include "stepflow/workflow/results.hpp"
#include "stepflow/workflow/step.hpp"

#include <memory>
#include <string>

namespace stepflow {

/// Result of one attempt of one step.
struct AttemptOutcome {
  Result<JsonValue> value;
  std::string error_message;
  TimePoint started_at{};
  TimePoint ended_at{};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return value.has_value();
  }
};

/// Runs a single attempt: resolves the step's action and races it against
/// the step timeout. The losing branch receives a terminal cancellation, so
/// a timed out action is torn down before execute_attempt returns.
class StepExecutor {
public:
  explicit StepExecutor(IActionResolver &resolver) : resolver_(&resolver) {}

  [[nodiscard]] auto
  execute_attempt(const Step &step,
                  std::shared_ptr<const ExecutionContext> context, int attempt)
      -> task<AttemptOutcome>;

private:
  [[nodiscard]] auto invoke_guarded(ActionCall call, std::string &message)
      -> task<Result<JsonValue>>;

  IActionResolver *resolver_;
};

} // namespace stepflow
