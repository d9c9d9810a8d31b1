#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/this_coro.hpp>

namespace stepflow {

/// Coordinators, step tasks and actions are all Asio awaitables running on
/// their workflow's owner shard.
template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::detached;

// `a || b` races (step timeouts), `a && b` joins (child process pipes).
namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

} // namespace stepflow
