#pragma once

#include "stepflow/config/engine_config.hpp"
#include "stepflow/core/error.hpp"

#include <string>
#include <string_view>

namespace stepflow {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;

  /// Applies STEPFLOW_* environment overrides, then validates.
  [[nodiscard]] static auto apply_env_overrides(EngineConfig cfg)
      -> Result<EngineConfig>;
};

/// Applies the [log] section to the global logger and starts its writer
/// thread.
[[nodiscard]] auto apply_log_config(const LogSection &cfg) -> Result<void>;

} // namespace stepflow
