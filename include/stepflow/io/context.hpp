#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/core/error.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>

namespace stepflow::io {

/// IoContext is directly boost::asio::io_context, no wrapper.
using IoContext = boost::asio::io_context;

/// Suspends the calling coroutine on its own executor. Returns
/// Error::Cancelled when the wait is interrupted by a cancellation signal.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<Result<void>>;

} // namespace stepflow::io
