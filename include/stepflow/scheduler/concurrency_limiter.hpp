#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <utility>

namespace stepflow {

/// Async counting semaphore for one workflow. A permit is a slot in a
/// bounded channel: acquiring sends into it, releasing receives from it, so
/// waiters are queued by the channel in FIFO order. Not thread-safe; use
/// from the owning shard only.
class ConcurrencyLimiter {
public:
  class Permit {
  public:
    Permit() = default;
    explicit Permit(ConcurrencyLimiter *owner) : owner_(owner) {}
    Permit(Permit &&other) noexcept
        : owner_(std::exchange(other.owner_, nullptr)) {}
    auto operator=(Permit &&other) noexcept -> Permit & {
      if (this != &other) {
        reset();
        owner_ = std::exchange(other.owner_, nullptr);
      }
      return *this;
    }
    Permit(const Permit &) = delete;
    auto operator=(const Permit &) -> Permit & = delete;
    ~Permit() { reset(); }

    auto reset() noexcept -> void {
      if (auto *owner = std::exchange(owner_, nullptr)) {
        owner->release();
      }
    }

    [[nodiscard]] auto held() const noexcept -> bool {
      return owner_ != nullptr;
    }

  private:
    ConcurrencyLimiter *owner_{nullptr};
  };

  ConcurrencyLimiter(boost::asio::any_io_executor executor,
                     std::size_t max_parallel);

  ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
  ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;

  /// Suspends until a permit is free. Error::Cancelled when the wait is
  /// cancelled.
  [[nodiscard]] auto acquire() -> task<Result<Permit>>;
  [[nodiscard]] auto try_acquire() -> Result<Permit>;

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }
  [[nodiscard]] auto in_use() const noexcept -> std::size_t { return in_use_; }
  [[nodiscard]] auto peak() const noexcept -> std::size_t { return peak_; }

private:
  auto release() noexcept -> void;
  auto on_acquired() noexcept -> void;

  using SlotChannel = boost::asio::experimental::channel<void(
      boost::system::error_code)>;

  SlotChannel slots_;
  std::size_t capacity_;
  std::size_t in_use_{0};
  std::size_t peak_{0};
};

} // namespace stepflow
