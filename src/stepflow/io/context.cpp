#include "stepflow/io/context.hpp"
#include "stepflow/core/asio_awaitable.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

namespace stepflow::io {

template <typename Rep, typename Period>
auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<Result<void>> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(
      executor, std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
  co_return as_result(co_await timer.async_wait(use_nothrow));
}

template auto async_sleep(std::chrono::nanoseconds) -> task<Result<void>>;
template auto async_sleep(std::chrono::microseconds) -> task<Result<void>>;
template auto async_sleep(std::chrono::milliseconds) -> task<Result<void>>;
template auto async_sleep(std::chrono::seconds) -> task<Result<void>>;

} // namespace stepflow::io
