#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/executor/step_executor.hpp"
#include "stepflow/scheduler/cancellation.hpp"
#include "stepflow/workflow/results.hpp"
#include "stepflow/workflow/step.hpp"

#include <memory>

namespace stepflow {

/// Drives one step through ATTEMPTING -> (SUCCESS | RETRY_WAIT | EXHAUSTED).
/// At most max_retries + 1 attempts; between attempt i and i+1 it waits
/// min(base * 2^i, max_delay).
class RetryHandler {
public:
  RetryHandler(StepExecutor &executor, const CancellationController &cancel)
      : executor_(&executor), cancel_(&cancel) {}

  [[nodiscard]] auto run(const Step &step,
                         std::shared_ptr<const ExecutionContext> context)
      -> task<StepResult>;

private:
  StepExecutor *executor_;
  const CancellationController *cancel_;
};

} // namespace stepflow
