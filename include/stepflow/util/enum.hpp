#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace stepflow {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

/// Lowercase with every non-alphanumeric dropped, so "PARTIAL-FAILURE",
/// "partial_failure" and "PartialFailure" compare equal.
[[nodiscard]] inline auto fold_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  return out;
}

/// "PartialFailure" -> "partial_failure"
[[nodiscard]] inline auto snake_case(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  char prev = '\0';
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isupper(uc) != 0 &&
        std::islower(static_cast<unsigned char>(prev)) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
    prev = c;
  }
  return out;
}

/// Name table for a Boost.Describe'd enum, built once per type.
template <typename E> struct EnumNames {
  struct Entry {
    E value;
    std::string snake;
    std::string folded;
  };

  static auto get() -> const std::vector<Entry> & {
    static const std::vector<Entry> entries = [] {
      std::vector<Entry> out;
      boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
          [&](auto d) {
            out.push_back({d.value, snake_case(d.name), fold_enum_token(d.name)});
          });
      return out;
    }();
    return entries;
  }
};

template <typename E>
[[nodiscard]] inline auto enum_name(E value) noexcept -> std::string_view {
  for (const auto &entry : EnumNames<E>::get()) {
    if (entry.value == value) {
      return entry.snake;
    }
  }
  return "unknown";
}

template <typename E>
[[nodiscard]] inline auto enum_from_name(std::string_view text,
                                         E fallback) noexcept -> E {
  const auto folded = fold_enum_token(text);
  for (const auto &entry : EnumNames<E>::get()) {
    if (entry.folded == folded) {
      return entry.value;
    }
  }
  return fallback;
}

} // namespace util

// Snake-case to_string_view() and tolerant parse<E>() for a described enum.
// Unrecognised text parses to `Fallback`.
#define STEPFLOW_DEFINE_ENUM_SERDE(EnumType, Fallback)                         \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::stepflow::util::enum_name(value);                                 \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::stepflow::util::enum_from_name(s, Fallback);                      \
  }

} // namespace stepflow
