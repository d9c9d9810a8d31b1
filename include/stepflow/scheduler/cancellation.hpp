#pragma once

#include "stepflow/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/cancellation_signal.hpp>

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <functional>
#include <memory>

namespace stepflow {

/// Fans a workflow-level stop out to the coordinator loop and to every
/// in-flight step task. Flags may be set from any thread; signals are
/// emitted on the owner executor only.
class CancellationController
    : public std::enable_shared_from_this<CancellationController> {
public:
  explicit CancellationController(boost::asio::any_io_executor executor)
      : executor_(std::move(executor)) {}

  CancellationController(const CancellationController &) = delete;
  CancellationController &operator=(const CancellationController &) = delete;

  /// External cancellation. Idempotent; returns true only for the call that
  /// flipped the flag.
  auto request_cancel() -> bool;

  /// Internal stop after an aborting failure. Stops retries and in-flight
  /// steps but does not mark the workflow cancelled.
  auto request_stop() -> bool;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return cancelled_.load(std::memory_order_acquire);
  }

  /// True once either cancel or stop was requested.
  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return stopped_.load(std::memory_order_acquire);
  }

  /// Owner executor only. Signals live as long as the controller, so a
  /// finished step's slot never dangles.
  [[nodiscard]] auto register_step(const StepId &step)
      -> boost::asio::cancellation_slot;
  [[nodiscard]] auto registered_count() const noexcept -> std::size_t {
    return signals_.size();
  }

  /// Invoked on the owner executor after the stop signals went out.
  auto set_wake_handler(std::function<void()> handler) -> void {
    wake_ = std::move(handler);
  }

private:
  auto stop_and_signal() -> bool;
  auto emit_all() -> void;

  boost::asio::any_io_executor executor_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> stopped_{false};
  ankerl::unordered_dense::map<StepId,
                               std::unique_ptr<boost::asio::cancellation_signal>>
      signals_;
  std::function<void()> wake_;
};

} // namespace stepflow
