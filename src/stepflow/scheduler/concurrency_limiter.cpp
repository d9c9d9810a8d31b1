#include "stepflow/scheduler/concurrency_limiter.hpp"

#include "stepflow/core/asio_awaitable.hpp"
#include "stepflow/util/log.hpp"

#include <algorithm>

namespace stepflow {

ConcurrencyLimiter::ConcurrencyLimiter(boost::asio::any_io_executor executor,
                                       std::size_t max_parallel)
    : slots_(std::move(executor), std::max<std::size_t>(1, max_parallel)),
      capacity_(std::max<std::size_t>(1, max_parallel)) {}

auto ConcurrencyLimiter::acquire() -> task<Result<Permit>> {
  auto sent = as_result(co_await slots_.async_send(
      boost::system::error_code{}, use_nothrow));
  if (!sent) {
    co_return fail(sent.error());
  }
  on_acquired();
  co_return ok(Permit{this});
}

auto ConcurrencyLimiter::try_acquire() -> Result<Permit> {
  if (!slots_.try_send(boost::system::error_code{})) {
    return fail(Error::ResourceExhausted);
  }
  on_acquired();
  return ok(Permit{this});
}

auto ConcurrencyLimiter::on_acquired() noexcept -> void {
  ++in_use_;
  peak_ = std::max(peak_, in_use_);
}

auto ConcurrencyLimiter::release() noexcept -> void {
  // Taking one value out of the buffer lets the oldest blocked sender in.
  if (!slots_.try_receive([](boost::system::error_code) {})) {
    log::error("ConcurrencyLimiter released with no permit outstanding");
    return;
  }
  --in_use_;
}

} // namespace stepflow
