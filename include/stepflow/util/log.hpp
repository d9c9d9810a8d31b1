#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace stepflow::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

namespace detail {
struct LevelStyle {
  std::string_view name;
  std::string_view tag;
  std::string_view color;
};

inline constexpr std::array<LevelStyle, 5> kLevelStyles{{
    {"trace", "TRACE", "\x1b[90m"},
    {"debug", "DEBUG", "\x1b[36m"},
    {"info", "INFO ", "\x1b[32m"},
    {"warn", "WARN ", "\x1b[33m"},
    {"error", "ERROR", "\x1b[31m"},
}};

inline constexpr std::string_view kColorReset = "\x1b[0m";
} // namespace detail

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return detail::kLevelStyles[std::to_underlying(level)].name;
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  for (std::size_t i = 0; i < detail::kLevelStyles.size(); ++i) {
    if (detail::kLevelStyles[i].name == name) {
      return static_cast<Level>(i);
    }
  }
  return std::nullopt;
}

/// Process-wide logger. Callers format on their own thread; once start() has
/// run, finished lines go through a bounded channel to a writer thread that
/// writes them in batches. Lines that do not fit in the channel are counted
/// in dropped(). Without a writer, lines are written inline.
class Logger {
public:
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  Logger() = default;
  ~Logger() {
    stop();
    std::scoped_lock lock(out_mu_);
    close_file_locked();
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    std::scoped_lock lock(lifecycle_mu_);
    if (queue_.load(std::memory_order_acquire)) {
      return;
    }
    writer_ctx_.restart();
    auto queue =
        std::make_shared<Queue>(writer_ctx_.get_executor(), kQueueCapacity);
    boost::asio::co_spawn(writer_ctx_, drain(queue), boost::asio::detached);
    queue_.store(queue, std::memory_order_release);
    writer_ = std::jthread([this] { writer_ctx_.run(); });
  }

  /// Flushes everything queued so far and joins the writer.
  auto stop() -> void {
    std::scoped_lock lock(lifecycle_mu_);
    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (!queue) {
      return;
    }
    queue->close();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_relaxed);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= this->level();
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(out_mu_);
    close_file_locked();
    redirect_locked(stderr);
  }

  /// Appends to `path`. An empty path goes back to stdout.
  auto set_output_file(std::string_view path) -> bool {
    std::scoped_lock lock(out_mu_);
    if (path.empty()) {
      close_file_locked();
      redirect_locked(stdout);
      return true;
    }
    FILE *file = std::fopen(std::string(path).c_str(), "a");
    if (file == nullptr) {
      return false;
    }
    close_file_locked();
    file_ = file;
    redirect_locked(file);
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    emit(render(level, std::format(fmt, std::forward<Args>(args)...)));
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

private:
  using Queue = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  // Color is only used when the sink is a terminal.
  auto render(Level level, std::string_view message) const -> std::string {
    const auto &style = detail::kLevelStyles[std::to_underlying(level)];
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto thread_tag =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    if (color_.load(std::memory_order_relaxed)) {
      return std::format("{:%F %T} {}{}{} [{:05}] {}\n", now, style.color,
                         style.tag, detail::kColorReset, thread_tag, message);
    }
    return std::format("{:%F %T} {} [{:05}] {}\n", now, style.tag, thread_tag,
                       message);
  }

  auto emit(std::string line) -> void {
    if (auto queue = queue_.load(std::memory_order_acquire)) {
      if (!queue->try_send(boost::system::error_code{}, std::move(line))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
      }
      return;
    }
    std::scoped_lock lock(out_mu_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

  auto write(const std::vector<std::string> &batch) -> void {
    std::scoped_lock lock(out_mu_);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out_);
    }
    std::fflush(out_);
  }

  auto drain(std::shared_ptr<Queue> queue) -> boost::asio::awaitable<void> {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);
    auto take_buffered = [&] {
      while (batch.size() < kBatchSize &&
             queue->try_receive(
                 [&](boost::system::error_code ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
    };

    for (;;) {
      auto [ec, line] = co_await queue->async_receive(
          boost::asio::as_tuple(boost::asio::use_awaitable));
      if (ec) {
        break;
      }
      batch.push_back(std::move(line));
      take_buffered();
      write(batch);
      batch.clear();
    }
    // Closed: flush whatever is still buffered.
    do {
      batch.clear();
      take_buffered();
      write(batch);
    } while (batch.size() == kBatchSize);
  }

  auto redirect_locked(FILE *out) -> void {
    out_ = out;
    color_.store(::isatty(::fileno(out)) != 0, std::memory_order_relaxed);
  }

  auto close_file_locked() -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> color_{::isatty(::fileno(stdout)) != 0};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex out_mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};

  std::mutex lifecycle_mu_;
  boost::asio::io_context writer_ctx_{1};
  std::atomic<std::shared_ptr<Queue>> queue_;
  std::jthread writer_;
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

/// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}
inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace stepflow::log
