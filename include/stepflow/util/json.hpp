#pragma once

#include "stepflow/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace stepflow {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// Looks up a string member of an object, nullptr when absent or not a string.
[[nodiscard]] inline auto find_string(const JsonValue &object,
                                      std::string_view key)
    -> const std::string * {
  if (!object.is_object() || !object.contains(key)) {
    return nullptr;
  }
  const auto &member = object[key];
  if (!member.is_string()) {
    return nullptr;
  }
  return &member.get_string();
}

} // namespace stepflow
