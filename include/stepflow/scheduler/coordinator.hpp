#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/dag/dependency_graph.hpp"
#include "stepflow/executor/step_executor.hpp"
#include "stepflow/scheduler/cancellation.hpp"
#include "stepflow/scheduler/concurrency_limiter.hpp"
#include "stepflow/scheduler/result_aggregator.hpp"
#include "stepflow/scheduler/retry_handler.hpp"
#include "stepflow/workflow/execution_context.hpp"
#include "stepflow/workflow/workflow_definition.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace stepflow {

/// Runs one workflow to a terminal state. All graph, context and result
/// mutation happens inside run() on the owner executor; step tasks only talk
/// back through the event channel. pause()/resume() may be called from any
/// thread.
class ExecutionCoordinator
    : public std::enable_shared_from_this<ExecutionCoordinator> {
  struct Token {
    explicit Token() = default;
  };

public:
  using ProgressHandler = std::function<void(const WorkflowResult &)>;

  struct Params {
    boost::asio::any_io_executor executor;
    WorkflowId workflow_id;
    std::shared_ptr<const WorkflowDefinition> definition;
    DependencyGraph graph;
    ExecutionContext initial_context;
    StepExecutor *step_executor{nullptr};
    std::shared_ptr<CancellationController> cancellation;
    ProgressHandler on_progress;
  };

  [[nodiscard]] static auto create(Params params)
      -> std::shared_ptr<ExecutionCoordinator>;

  // Only create() can name Token.
  ExecutionCoordinator(Token, Params params);

  ExecutionCoordinator(const ExecutionCoordinator &) = delete;
  ExecutionCoordinator &operator=(const ExecutionCoordinator &) = delete;

  [[nodiscard]] auto run() -> task<WorkflowResult>;

  auto pause() -> bool;
  auto resume() -> bool;
  [[nodiscard]] auto is_paused() const noexcept -> bool {
    return paused_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto workflow_id() const noexcept -> const WorkflowId & {
    return workflow_id_;
  }
  [[nodiscard]] auto context() const noexcept -> const ExecutionContext & {
    return *context_;
  }
  [[nodiscard]] auto peak_parallelism() const noexcept -> std::size_t {
    return limiter_.peak();
  }

private:
  using Event = std::optional<StepResult>;
  using EventChannel = boost::asio::experimental::channel<void(
      boost::system::error_code, Event)>;

  [[nodiscard]] static auto run_step(std::shared_ptr<ExecutionCoordinator> self,
                                     NodeIndex idx,
                                     std::shared_ptr<const ExecutionContext>
                                         snapshot) -> task<void>;

  auto dispatch_ready() -> void;
  auto spawn_step(NodeIndex idx,
                  std::shared_ptr<const ExecutionContext> snapshot) -> void;
  [[nodiscard]] auto next_event() -> task<Event>;
  auto post_result(StepResult result) -> void;
  auto wake() -> void;
  auto wake_from_any_thread() -> void;

  /// Records a finished step. Returns true when it failed.
  auto record(StepResult result) -> bool;
  auto sync_pause_state(bool paused) -> void;
  auto skip_unresolved(SkipReason reason) -> std::size_t;
  auto arm_deadline() -> void;
  auto publish() -> void;

  auto finish_aborted(const StepId &failed) -> WorkflowResult;
  [[nodiscard]] auto finish_cancelled() -> task<WorkflowResult>;
  auto finish_deadlocked() -> WorkflowResult;
  auto finish_resolved() -> WorkflowResult;
  auto seal(std::optional<WorkflowState> forced) -> WorkflowResult;

  boost::asio::any_io_executor executor_;
  WorkflowId workflow_id_;
  std::shared_ptr<const WorkflowDefinition> def_;
  DependencyGraph graph_;
  GraphRunState state_;
  std::vector<const Step *> steps_by_node_;
  std::shared_ptr<ExecutionContext> context_;
  std::shared_ptr<CancellationController> cancel_;
  RetryHandler retry_;
  ConcurrencyLimiter limiter_;
  ResultAggregator aggregator_;
  EventChannel events_;
  boost::asio::steady_timer deadline_;
  ProgressHandler on_progress_;

  std::atomic<bool> paused_{false};
  bool wake_pending_{false};
  bool timed_out_{false};
  bool finished_{false};
};

} // namespace stepflow
