#pragma once

#include "stepflow/io/context.hpp"

#include <boost/asio/executor_work_guard.hpp>

#include <optional>
#include <thread>

namespace stepflow {

using shard_id = unsigned;

/// One single-threaded event loop. Every workflow owned by the shard runs
/// its coordinator, step tasks and timers on `ctx`.
struct Shard {
  using WorkGuard =
      boost::asio::executor_work_guard<io::IoContext::executor_type>;

  explicit Shard(shard_id shard) : id(shard), ctx(1) {}

  Shard(const Shard &) = delete;
  Shard &operator=(const Shard &) = delete;

  shard_id id;
  io::IoContext ctx;
  std::optional<WorkGuard> work;
  std::jthread thread;
};

} // namespace stepflow
