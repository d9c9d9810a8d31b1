#pragma once

#include "stepflow/config/engine_config.hpp"
#include "stepflow/core/constants.hpp"
#include "stepflow/core/coroutine.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/core/shard.hpp"
#include "stepflow/dag/dependency_graph.hpp"
#include "stepflow/executor/action.hpp"
#include "stepflow/executor/step_executor.hpp"
#include "stepflow/util/id.hpp"
#include "stepflow/workflow/execution_context.hpp"
#include "stepflow/workflow/results.hpp"
#include "stepflow/workflow/workflow_definition.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace stepflow {

class Runtime;
class CancellationController;
class ExecutionCoordinator;

/// Submission API. Each workflow is pinned to one runtime shard chosen by
/// hashing its id. Everything here is safe to call from any non-shard
/// thread; await_result() and shutdown() block and must not be called from
/// inside the runtime.
class WorkflowEngine {
public:
  WorkflowEngine(Runtime &runtime, IActionResolver &resolver,
                 EngineConfig config = {});
  ~WorkflowEngine();

  WorkflowEngine(const WorkflowEngine &) = delete;
  auto operator=(const WorkflowEngine &) -> WorkflowEngine & = delete;

  /// Validates synchronously and queues the workflow. On a validation
  /// failure `diagnostic` (if given) receives the offending step ids.
  [[nodiscard]] auto submit(WorkflowDefinition def,
                            ExecutionContext initial_context = {},
                            ValidationError *diagnostic = nullptr)
      -> Result<WorkflowId>;

  [[nodiscard]] auto
  await_result(const WorkflowId &id,
               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
      -> Result<WorkflowResult>;
  [[nodiscard]] auto async_await_result(WorkflowId id)
      -> task<Result<WorkflowResult>>;

  /// false when the workflow already reached a terminal state.
  [[nodiscard]] auto cancel(const WorkflowId &id) -> Result<bool>;
  [[nodiscard]] auto pause(const WorkflowId &id) -> Result<bool>;
  [[nodiscard]] auto resume(const WorkflowId &id) -> Result<bool>;

  [[nodiscard]] auto get_status(const WorkflowId &id) const
      -> Result<WorkflowResult>;
  [[nodiscard]] auto
  list_workflows(std::optional<WorkflowState> state = std::nullopt,
                 std::size_t limit = workflow_defaults::kListLimit) const
      -> std::vector<WorkflowResult>;

  [[nodiscard]] auto active_count() const -> std::size_t;
  [[nodiscard]] auto pending_count() const -> std::size_t;

  /// Cancels everything still queued or running and waits (bounded by
  /// shutdown_timeout) for the coordinators to wind down.
  auto shutdown() -> void;

  [[nodiscard]] auto config() const noexcept -> const EngineSection & {
    return config_;
  }

private:
  struct WorkflowRecord {
    WorkflowId id;
    std::uint64_t seq{0};
    shard_id owner{0};
    std::shared_ptr<const WorkflowDefinition> definition;
    std::shared_ptr<CancellationController> cancellation;
    // Handed to the coordinator at launch.
    std::optional<DependencyGraph> graph;
    ExecutionContext initial_context;

    mutable std::mutex mu;
    std::condition_variable cv;
    WorkflowResult snapshot;
    bool paused{false};
    bool done{false};
    std::weak_ptr<ExecutionCoordinator> coordinator;
  };
  using RecordPtr = std::shared_ptr<WorkflowRecord>;

  [[nodiscard]] auto find(const WorkflowId &id) const -> RecordPtr;
  auto launch(RecordPtr record) -> void;
  [[nodiscard]] auto drive(RecordPtr record) -> task<void>;
  static auto publish(WorkflowRecord &record, const WorkflowResult &progress)
      -> void;
  auto on_finished(const RecordPtr &record, WorkflowResult result) -> void;
  auto finish_unstarted(const RecordPtr &record) -> void;
  auto seal_record(const RecordPtr &record, WorkflowResult result) -> void;
  auto evict_finished_locked() -> void;

  Runtime &runtime_;
  StepExecutor step_executor_;
  EngineSection config_;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<WorkflowId, RecordPtr> records_;
  std::deque<RecordPtr> pending_;
  std::deque<RecordPtr> finished_;
  std::vector<std::weak_ptr<ExecutionCoordinator>> live_coordinators_;
  std::size_t running_{0};
  std::uint64_t next_seq_{0};
  bool shutting_down_{false};
};

} // namespace stepflow
