#pragma once

#include "stepflow/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <tuple>

namespace stepflow {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

[[nodiscard]] inline auto is_aborted(const boost::system::error_code &ec)
    -> bool {
  return ec == boost::asio::error::operation_aborted ||
         ec == boost::asio::experimental::error::channel_cancelled ||
         ec == boost::asio::experimental::error::channel_closed;
}

/// Maps an Asio completion into the project error space. Aborted and closed
/// operations surface as Error::Cancelled so callers can test one code.
[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    if (is_aborted(ec)) {
      return fail(Error::Cancelled);
    }
    return fail(static_cast<std::error_code>(ec));
  }
  return ok();
}

} // namespace stepflow
