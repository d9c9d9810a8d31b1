#include "stepflow/core/asio_awaitable.hpp"
#include "stepflow/core/constants.hpp"
#include "stepflow/executor/action.hpp"
#include "stepflow/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace stepflow {

namespace {

namespace bp = boost::process::v2;

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out) -> task<void> {
  std::array<char, io::kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    if (bytes > 0 && out.size() < io::kMaxOutputSize) {
      const auto remaining = io::kMaxOutputSize - out.size();
      out.append(buffer.data(), std::min<std::size_t>(remaining, bytes));
    }
    if (ec) {
      co_return;
    }
  }
}

[[nodiscard]] auto cmd_preview(std::string_view cmd) -> std::string_view {
  constexpr std::size_t kPreview = 80;
  return cmd.substr(0, std::min(cmd.size(), kPreview));
}

auto run_shell(ActionCall call) -> task<Result<JsonValue>> {
  const auto *command = find_string(call.params, "command");
  if (command == nullptr || command->empty()) {
    log::error("Step '{}': shell action needs a string 'command' param",
               call.step_id);
    co_return fail(Error::InvalidArgument);
  }

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);

  std::optional<bp::process> proc;
  try {
    std::vector<std::string> args{"-c", *command};
    proc.emplace(executor, "/bin/sh", args,
                 bp::process_stdio{
                     .in = nullptr, .out = stdout_pipe, .err = stderr_pipe});
  } catch (const std::exception &ex) {
    log::error("Step '{}': failed to spawn shell: {}", call.step_id, ex.what());
    co_return fail(Error::ActionFailed);
  }

  log::debug("shell started pid={} step={} cmd='{}'", proc->id(),
             call.step_id, cmd_preview(*command));

  std::string out;
  std::string err;
  out.reserve(io::kInitialOutputReserve);

  using namespace awaitable_ops;
  auto [wait_ec, exit_code] =
      co_await (read_pipe_all(stdout_pipe, out) &&
                read_pipe_all(stderr_pipe, err) &&
                proc->async_wait(use_nothrow));

  if (wait_ec) {
    // Interrupted (timeout or workflow cancel): kill and reap the child.
    boost::system::error_code ignored;
    proc->terminate(ignored);
    log::info("shell pid={} step={} killed: {}", proc->id(), call.step_id,
              wait_ec.message());
    co_return fail(Error::Cancelled);
  }

  if (exit_code != 0) {
    log::warn("shell step={} exit_code={} stderr='{}'", call.step_id,
              exit_code, cmd_preview(err));
    co_return fail(Error::ActionFailed);
  }
  co_return ok(JsonValue(std::move(out)));
}

} // namespace

auto make_shell_action() -> ActionHandler {
  return [](ActionCall call) -> task<Result<JsonValue>> {
    return run_shell(std::move(call));
  };
}

} // namespace stepflow
