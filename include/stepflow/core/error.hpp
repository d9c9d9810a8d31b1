#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace stepflow {

enum class Error : std::uint8_t {
  Success = 0,

  // Definition checks, reported by submit() before anything runs.
  InvalidArgument,
  CycleDetected,
  DanglingReference,
  DuplicateStep,

  // Step attempts.
  ActionNotFound,
  ActionFailed,
  Timeout,
  Cancelled,

  // Engine and configuration.
  NotFound,
  AlreadyExists,
  ResourceExhausted,
  SystemNotRunning,
  FileNotFound,
  ParseError,

  Unknown,
};

class ErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "stepflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
    case Error::Success:
      return "success";
    case Error::InvalidArgument:
      return "invalid argument";
    case Error::CycleDetected:
      return "cycle detected in workflow";
    case Error::DanglingReference:
      return "dependency references an unknown step";
    case Error::DuplicateStep:
      return "duplicate step id";
    case Error::ActionNotFound:
      return "action not registered";
    case Error::ActionFailed:
      return "action failed";
    case Error::Timeout:
      return "timeout";
    case Error::Cancelled:
      return "cancelled";
    case Error::NotFound:
      return "not found";
    case Error::AlreadyExists:
      return "already exists";
    case Error::ResourceExhausted:
      return "resource exhausted";
    case Error::SystemNotRunning:
      return "system not running";
    case Error::FileNotFound:
      return "file not found";
    case Error::ParseError:
      return "parse error";
    case Error::Unknown:
      break;
    }
    return "unknown error";
  }
};

[[nodiscard]] inline auto error_category() noexcept -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

[[nodiscard]] inline auto make_error_code(Error e) noexcept -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

/// Every fallible call in stepflow returns a Result. Nothing throws across
/// the public API.
template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace stepflow

template <> struct std::is_error_code_enum<stepflow::Error> : std::true_type {};
