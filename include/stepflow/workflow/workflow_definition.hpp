#pragma once

#include "stepflow/core/constants.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/util/id.hpp"
#include "stepflow/workflow/step.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stepflow {

struct WorkflowDefinition {
  struct Builder;
  static auto builder() -> Builder;

  // Empty means "generate one at submit".
  WorkflowId workflow_id;
  std::string name;
  std::string description;
  std::string version{"1.0.0"};
  std::vector<Step> steps;
  bool continue_on_error{false};
  int max_parallel_steps{workflow_defaults::kMaxParallelSteps};
  std::optional<std::chrono::milliseconds> timeout;
  std::map<std::string, std::string> metadata;

  [[nodiscard]] auto find_step(const StepId &id) const -> const Step * {
    for (const auto &step : steps) {
      if (step.step_id == id) {
        return &step;
      }
    }
    return nullptr;
  }
};

struct WorkflowDefinition::Builder {
  WorkflowDefinition def_;

  auto id(std::string id_str) -> Builder && {
    def_.workflow_id = WorkflowId{std::move(id_str)};
    return std::move(*this);
  }

  auto name(std::string n) -> Builder && {
    def_.name = std::move(n);
    return std::move(*this);
  }

  auto description(std::string d) -> Builder && {
    def_.description = std::move(d);
    return std::move(*this);
  }

  auto version(std::string v) -> Builder && {
    def_.version = std::move(v);
    return std::move(*this);
  }

  auto step(Step s) -> Builder && {
    def_.steps.push_back(std::move(s));
    return std::move(*this);
  }

  auto continue_on_error(bool c) -> Builder && {
    def_.continue_on_error = c;
    return std::move(*this);
  }

  auto max_parallel(int n) -> Builder && {
    def_.max_parallel_steps = n;
    return std::move(*this);
  }

  auto timeout(std::chrono::milliseconds t) -> Builder && {
    def_.timeout = t;
    return std::move(*this);
  }

  auto metadata(std::string key, std::string value) -> Builder && {
    def_.metadata.insert_or_assign(std::move(key), std::move(value));
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<WorkflowDefinition> {
    if (def_.max_parallel_steps < 1) {
      return fail(Error::InvalidArgument);
    }
    if (!def_.workflow_id.empty() &&
        !is_valid_id_text(def_.workflow_id.value())) {
      return fail(Error::InvalidArgument);
    }
    return ok(std::move(def_));
  }
};

inline auto WorkflowDefinition::builder() -> Builder { return {}; }

} // namespace stepflow
