#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/executor/action.hpp"
#include "stepflow/io/context.hpp"
#include "stepflow/workflow/step.hpp"
#include "stepflow/workflow/workflow_definition.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace stepflow::test {

using namespace std::chrono_literals;

// Drives `coro` to completion on a private io_context and hands back its
// value. Detached work it started (step tasks, timers) runs on the same
// context. Throws std::runtime_error if nothing finished within `timeout`.
template <typename T>
auto run_coro(task<T> coro,
              std::chrono::milliseconds timeout = std::chrono::seconds(10))
    -> T {
  boost::asio::io_context io;
  std::exception_ptr failure;
  bool finished = false;
  std::conditional_t<std::is_void_v<T>, bool, std::optional<T>> value{};

  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        if constexpr (std::is_void_v<T>) {
          co_await std::move(coro);
        } else {
          value.emplace(co_await std::move(coro));
        }
        finished = true;
      },
      [&](std::exception_ptr e) { failure = e; });
  io.run_for(timeout);

  if (failure) {
    std::rethrow_exception(failure);
  }
  if (!finished) {
    throw std::runtime_error("run_coro timed out");
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*value);
  }
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

// Tracks how many action bodies run at the same time.
struct ConcurrencyGauge {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};

  auto enter() -> void {
    const int now = current.fetch_add(1) + 1;
    int seen = peak.load();
    while (seen < now && !peak.compare_exchange_weak(seen, now)) {
    }
  }
  auto leave() -> void { current.fetch_sub(1); }
};

// Per-step invocation log shared between a scripted action and the test.
class CallLog {
public:
  auto add(const ActionCall &call) -> void {
    std::scoped_lock lock(mu_);
    calls_.push_back(call.step_id.str());
  }

  [[nodiscard]] auto count(std::string_view step) const -> int {
    std::scoped_lock lock(mu_);
    return static_cast<int>(std::ranges::count(calls_, step));
  }

  [[nodiscard]] auto total() const -> std::size_t {
    std::scoped_lock lock(mu_);
    return calls_.size();
  }

  [[nodiscard]] auto order() const -> std::vector<std::string> {
    std::scoped_lock lock(mu_);
    return calls_;
  }

private:
  mutable std::mutex mu_;
  std::vector<std::string> calls_;
};

/// Sleeps for `delay` and returns the step id as a JSON string.
[[nodiscard]] inline auto sleep_action(std::chrono::milliseconds delay,
                                       CallLog *log = nullptr,
                                       ConcurrencyGauge *gauge = nullptr)
    -> ActionHandler {
  return [delay, log, gauge](ActionCall call) -> task<Result<JsonValue>> {
    if (log) {
      log->add(call);
    }
    if (gauge) {
      gauge->enter();
    }
    auto slept = co_await io::async_sleep(delay);
    if (gauge) {
      gauge->leave();
    }
    if (!slept) {
      co_return fail(slept.error());
    }
    co_return ok(JsonValue{call.step_id.str()});
  };
}

/// Fails the first `failures` calls with ActionFailed, then succeeds.
[[nodiscard]] inline auto flaky_action(int failures, CallLog *log)
    -> ActionHandler {
  return [failures, log](ActionCall call) -> task<Result<JsonValue>> {
    log->add(call);
    if (log->count(call.step_id.value()) <= failures) {
      co_return fail(Error::ActionFailed);
    }
    co_return ok(JsonValue{"recovered"});
  };
}

[[nodiscard]] inline auto failing_action(CallLog *log = nullptr)
    -> ActionHandler {
  return [log](ActionCall call) -> task<Result<JsonValue>> {
    if (log) {
      log->add(call);
    }
    co_return fail(Error::ActionFailed);
  };
}

[[nodiscard]] inline auto throwing_action(std::string what) -> ActionHandler {
  return [what](ActionCall) -> task<Result<JsonValue>> {
    throw std::runtime_error(what);
    co_return ok(JsonValue{});
  };
}

[[nodiscard]] inline auto
make_step(std::string_view id, std::string_view action,
          std::vector<std::string> deps = {}, int retries = 0,
          std::chrono::milliseconds base_delay = 1ms,
          std::chrono::milliseconds max_delay = 100ms) -> Step {
  auto builder = Step::builder()
                     .id(std::string(id))
                     .action(std::string(action))
                     .retry(retries, base_delay, max_delay);
  for (auto &dep : deps) {
    builder.depends_on(std::move(dep));
  }
  auto result = std::move(builder).build();
  if (!result) {
    throw std::runtime_error("Failed to build Step");
  }
  return std::move(*result);
}

[[nodiscard]] inline auto make_workflow(std::string_view name,
                                        std::vector<Step> steps,
                                        bool continue_on_error = false,
                                        int max_parallel = 5)
    -> WorkflowDefinition {
  auto builder = WorkflowDefinition::builder()
                     .name(std::string(name))
                     .continue_on_error(continue_on_error)
                     .max_parallel(max_parallel);
  for (auto &step : steps) {
    builder.step(std::move(step));
  }
  auto result = std::move(builder).build();
  if (!result) {
    throw std::runtime_error("Failed to build WorkflowDefinition");
  }
  return std::move(*result);
}

} // namespace stepflow::test
