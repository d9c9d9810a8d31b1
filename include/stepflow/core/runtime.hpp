#pragma once

#include "stepflow/config/engine_config.hpp"
#include "stepflow/core/coroutine.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/core/shard.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace stepflow {

/// Fixed pool of shards. Workflows are pinned to one shard for their whole
/// life, so nothing a coordinator owns is ever touched by two threads.
class Runtime {
public:
  using executor_type = io::IoContext::executor_type;

  /// 0 picks one shard per hardware thread, capped at kMaxAutoShards.
  explicit Runtime(unsigned shards = 0);
  /// Sized from `engine.shards`, same rule as above.
  explicit Runtime(const EngineSection &engine);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  /// Stops every shard and joins its thread. Work still queued is dropped.
  auto stop() noexcept -> void;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return static_cast<unsigned>(shards_.size());
  }

  [[nodiscard]] auto executor_for(shard_id id) -> executor_type;

  /// True on one of this runtime's shard threads. Blocking calls such as
  /// WorkflowEngine::await_result() must not be made from there.
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  static constexpr unsigned kMaxAutoShards = 8;

private:
  auto run_shard(Shard &shard) noexcept -> void;

  std::atomic<bool> running_{false};
  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace stepflow
