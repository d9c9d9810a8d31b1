#include "stepflow/core/runtime.hpp"

#include "stepflow/util/log.hpp"

#include <algorithm>
#include <exception>

namespace stepflow {

namespace {
thread_local const Runtime *tls_runtime = nullptr;

[[nodiscard]] auto resolve_shard_count(unsigned requested) -> unsigned {
  if (requested > 0) {
    return requested;
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return std::clamp(hw, 1U, Runtime::kMaxAutoShards);
}
} // namespace

Runtime::Runtime(unsigned shards) {
  const auto count = resolve_shard_count(shards);
  shards_.reserve(count);
  for (shard_id id = 0; id < count; ++id) {
    shards_.push_back(std::make_unique<Shard>(id));
  }
}

Runtime::Runtime(const EngineSection &engine)
    : Runtime(static_cast<unsigned>(std::max(engine.shards, 0))) {}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return ok();
  }
  log::debug("Runtime starting {} shard(s)", shards_.size());
  try {
    for (auto &shard : shards_) {
      shard->ctx.restart();
      shard->work.emplace(shard->ctx.get_executor());
      shard->thread = std::jthread([this, s = shard.get()] { run_shard(*s); });
    }
  } catch (const std::system_error &e) {
    log::error("Runtime failed to start shard thread: {}", e.what());
    stop();
    return fail(Error::SystemNotRunning);
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  for (auto &shard : shards_) {
    shard->work.reset();
    shard->ctx.stop();
  }
  for (auto &shard : shards_) {
    if (shard->thread.joinable()) {
      shard->thread.join();
    }
  }
  log::debug("Runtime stopped");
}

auto Runtime::executor_for(shard_id id) -> executor_type {
  return shards_[id % shards_.size()]->ctx.get_executor();
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return tls_runtime == this;
}

auto Runtime::run_shard(Shard &shard) noexcept -> void {
  tls_runtime = this;
  try {
    shard.ctx.run();
  } catch (const std::exception &e) {
    log::error("Shard {} event loop died: {}", shard.id, e.what());
  }
  tls_runtime = nullptr;
}

} // namespace stepflow
