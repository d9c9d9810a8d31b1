#pragma once

#include "stepflow/core/constants.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/util/id.hpp"
#include "stepflow/util/json.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stepflow {

struct Step {
  struct Builder;
  static auto builder() -> Builder;

  StepId step_id;
  std::string name;
  std::string action_ref;
  JsonValue params{};
  std::vector<StepId> dependencies;
  int max_retries{step_defaults::kMaxRetries};
  std::chrono::milliseconds retry_base_delay{step_defaults::kRetryBaseDelay};
  std::chrono::milliseconds retry_max_delay{step_defaults::kRetryMaxDelay};
  // Per-attempt limit; nullopt means an attempt may run indefinitely.
  std::optional<std::chrono::milliseconds> timeout;
};

struct Step::Builder {
  Step step_;

  auto id(std::string id_str) -> Builder && {
    step_.step_id = StepId{std::move(id_str)};
    return std::move(*this);
  }

  auto name(std::string n) -> Builder && {
    step_.name = std::move(n);
    return std::move(*this);
  }

  auto action(std::string ref) -> Builder && {
    step_.action_ref = std::move(ref);
    return std::move(*this);
  }

  auto params(JsonValue p) -> Builder && {
    step_.params = std::move(p);
    return std::move(*this);
  }

  auto depends_on(std::string dep_id) -> Builder && {
    step_.dependencies.emplace_back(std::move(dep_id));
    return std::move(*this);
  }

  auto retry(int max, std::chrono::milliseconds base,
             std::chrono::milliseconds max_delay) -> Builder && {
    step_.max_retries = max;
    step_.retry_base_delay = base;
    step_.retry_max_delay = max_delay;
    return std::move(*this);
  }

  auto retries(int max) -> Builder && {
    step_.max_retries = max;
    return std::move(*this);
  }

  auto timeout(std::chrono::milliseconds t) -> Builder && {
    step_.timeout = t;
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<Step> {
    if (!is_valid_id_text(step_.step_id.value()) || step_.action_ref.empty()) {
      return fail(Error::InvalidArgument);
    }
    if (step_.name.empty()) {
      step_.name = step_.step_id.str();
    }
    return ok(std::move(step_));
  }
};

inline auto Step::builder() -> Builder { return {}; }

} // namespace stepflow
