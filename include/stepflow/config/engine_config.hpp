#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace stepflow {

struct EngineSection {
  int shards{0}; // 0 = runtime default
  int max_concurrent_workflows{10};
  std::size_t max_retained_results{1000};
  std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(30)};

  auto operator==(const EngineSection &) const -> bool = default;
};

struct LogSection {
  std::string level{"info"};
  std::string file; // empty = stdout

  auto operator==(const LogSection &) const -> bool = default;
};

struct EngineConfig {
  EngineSection engine;
  LogSection log;

  auto operator==(const EngineConfig &) const -> bool = default;
};

} // namespace stepflow
