#include "stepflow/workflow/validation.hpp"

#include "stepflow/util/log.hpp"

namespace stepflow {

namespace {

[[nodiscard]] auto check_step(const Step &step)
    -> std::expected<void, ValidationError> {
  if (!is_valid_id_text(step.step_id.value()) || step.action_ref.empty() ||
      step.max_retries < 0 || step.retry_base_delay.count() < 0 ||
      step.retry_base_delay > step.retry_max_delay ||
      (step.timeout && step.timeout->count() <= 0)) {
    return invalid(Error::InvalidArgument, {step.step_id});
  }
  return {};
}

} // namespace

auto build_workflow_graph(const WorkflowDefinition &def)
    -> std::expected<DependencyGraph, ValidationError> {
  if (def.max_parallel_steps < 1 ||
      (def.timeout && def.timeout->count() <= 0)) {
    return invalid(Error::InvalidArgument);
  }

  DependencyGraph graph;
  for (const auto &step : def.steps) {
    if (auto checked = check_step(step); !checked) {
      return std::unexpected{std::move(checked.error())};
    }
    if (auto idx = graph.add_node(step.step_id); !idx) {
      return std::unexpected{ValidationError{idx.error(), {step.step_id}}};
    }
  }

  for (const auto &step : def.steps) {
    for (const auto &dep : step.dependencies) {
      if (auto r = graph.add_dependency(step.step_id, dep); !r) {
        return std::unexpected{ValidationError{r.error(), {step.step_id}}};
      }
    }
  }

  if (auto valid = graph.validate(); !valid) {
    log::warn("Workflow '{}' rejected: {}", def.name, valid.error().message());
    return std::unexpected{std::move(valid.error())};
  }
  return graph;
}

} // namespace stepflow
