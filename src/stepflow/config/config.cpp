#include "stepflow/config/config.hpp"
#include "stepflow/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace stepflow {
namespace detail {

struct EngineToml {
  int shards{0};
  int max_concurrent_workflows{10};
  std::int64_t max_retained_results{1000};
  std::int64_t shutdown_timeout_ms{30000};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ConfigToml {
  EngineToml engine{};
  LogToml log{};
};

} // namespace detail
} // namespace stepflow

namespace glz {
template <> struct meta<stepflow::detail::EngineToml> {
  using T = stepflow::detail::EngineToml;
  static constexpr auto value =
      object("shards", &T::shards, "max_concurrent_workflows",
             &T::max_concurrent_workflows, "max_retained_results",
             &T::max_retained_results, "shutdown_timeout_ms",
             &T::shutdown_timeout_ms);
};

template <> struct meta<stepflow::detail::LogToml> {
  using T = stepflow::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<stepflow::detail::ConfigToml> {
  using T = stepflow::detail::ConfigToml;
  static constexpr auto value = object("engine", &T::engine, "log", &T::log);
};
} // namespace glz

namespace stepflow {
namespace {

[[nodiscard]] auto slurp(std::string_view path) -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string(std::istreambuf_iterator<char>(in), {}));
}

// Unknown keys are tolerated so a config written for a newer engine still
// loads.
[[nodiscard]] auto read_config_toml(std::string_view text,
                                    std::string *diagnostic)
    -> Result<detail::ConfigToml> {
  detail::ConfigToml raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto what = glz::format_error(ec, text);
    log::error("engine config: {}", what);
    if (diagnostic != nullptr) {
      *diagnostic = std::move(what);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

[[nodiscard]] auto validate(const EngineConfig &cfg) -> Result<void> {
  if (cfg.engine.shards < 0 || cfg.engine.max_concurrent_workflows <= 0 ||
      cfg.engine.max_retained_results == 0 ||
      cfg.engine.shutdown_timeout.count() <= 0 ||
      !log::parse_level(cfg.log.level)) {
    return fail(Error::ParseError);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string *diagnostic)
    -> Result<EngineConfig> {
  auto raw_result = read_config_toml(toml_text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  if (raw.engine.max_retained_results <= 0 ||
      raw.engine.shutdown_timeout_ms <= 0) {
    return fail(Error::ParseError);
  }

  EngineConfig cfg{};
  cfg.engine.shards = raw.engine.shards;
  cfg.engine.max_concurrent_workflows = raw.engine.max_concurrent_workflows;
  cfg.engine.max_retained_results =
      static_cast<std::size_t>(raw.engine.max_retained_results);
  cfg.engine.shutdown_timeout =
      std::chrono::milliseconds(raw.engine.shutdown_timeout_ms);
  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);
  return ConfigLoader::apply_env_overrides(std::move(cfg));
}

} // namespace

auto ConfigLoader::apply_env_overrides(EngineConfig cfg)
    -> Result<EngineConfig> {
  try {
    if (const char *v = std::getenv("STEPFLOW_SHARDS"); v != nullptr) {
      cfg.engine.shards = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("STEPFLOW_MAX_CONCURRENT_WORKFLOWS");
        v != nullptr) {
      cfg.engine.max_concurrent_workflows = boost::lexical_cast<int>(v);
    }
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  }
  if (const char *v = std::getenv("STEPFLOW_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("STEPFLOW_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }

  if (auto valid = validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  auto text = slurp(path);
  if (!text) {
    log::error("Cannot read config file '{}'", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<EngineConfig> {
  try {
    return convert_toml(toml_str, diagnostic);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML engine configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto apply_log_config(const LogSection &cfg) -> Result<void> {
  auto level = log::parse_level(cfg.level);
  if (!level) {
    return fail(Error::InvalidArgument);
  }
  log::set_level(*level);
  if (!log::set_output_file(cfg.file)) {
    return fail(Error::FileNotFound);
  }
  log::start();
  return ok();
}

} // namespace stepflow
