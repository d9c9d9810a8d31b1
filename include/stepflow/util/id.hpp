#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace stepflow {

/// Ids are free-form text, but must be non-empty and free of control
/// characters so they log and print cleanly.
[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() &&
         std::none_of(value.begin(), value.end(), [](unsigned char ch) {
           return std::iscntrl(ch) != 0;
         });
}

struct WorkflowTag {};
struct StepTag {};

/// String id tagged with what it identifies, so a StepId can never be passed
/// where a WorkflowId is expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  friend auto operator<=>(const TypedId &, const TypedId &) = default;
  friend auto operator==(const TypedId &, const TypedId &) -> bool = default;
  friend auto operator==(const TypedId &lhs, std::string_view rhs) noexcept
      -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using WorkflowId = TypedId<WorkflowTag>;
using StepId = TypedId<StepTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_run_id_text() -> std::string;
} // namespace detail

/// 28 hex digits: wall clock millis, a process-wide sequence, then random
/// bits. Ids sort roughly by submission time.
[[nodiscard]] inline auto generate_workflow_run_id() -> WorkflowId {
  return WorkflowId{detail::generate_run_id_text()};
}

} // namespace stepflow

// `is_avalanching` lets ankerl::unordered_dense use this hash as is.
template <typename Tag> struct std::hash<stepflow::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const stepflow::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<stepflow::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const stepflow::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
