#pragma once

#include "stepflow/util/id.hpp"
#include "stepflow/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace stepflow {

/// Key-value store carrying caller seeds and step outputs (keyed by step id)
/// to downstream steps. Owned by one coordinator; actions receive immutable
/// snapshots taken at dispatch time.
class ExecutionContext {
public:
  using Map = ankerl::unordered_dense::map<std::string, JsonValue>;

  ExecutionContext() = default;
  ExecutionContext(std::initializer_list<Map::value_type> init)
      : values_(init.begin(), init.end()) {}

  auto set(std::string key, JsonValue value) -> void {
    values_.insert_or_assign(std::move(key), std::move(value));
  }

  auto set_output(const StepId &step, JsonValue value) -> void {
    set(step.str(), std::move(value));
  }

  [[nodiscard]] auto get(std::string_view key) const -> const JsonValue * {
    auto it = values_.find(std::string(key));
    return it == values_.end() ? nullptr : &it->second;
  }

  [[nodiscard]] auto output_of(const StepId &step) const -> const JsonValue * {
    return get(step.value());
  }

  [[nodiscard]] auto contains(std::string_view key) const -> bool {
    return values_.contains(std::string(key));
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return values_.size();
  }

  [[nodiscard]] auto values() const noexcept -> const Map & { return values_; }

private:
  Map values_;
};

} // namespace stepflow
