#pragma once

#include "stepflow/dag/dependency_graph.hpp"
#include "stepflow/workflow/workflow_definition.hpp"

#include <expected>

namespace stepflow {

/// Checks step and workflow policy fields, then builds and validates the
/// dependency graph. Nothing is executed; a failure names the offending ids.
[[nodiscard]] auto build_workflow_graph(const WorkflowDefinition &def)
    -> std::expected<DependencyGraph, ValidationError>;

[[nodiscard]] inline auto validate(const WorkflowDefinition &def)
    -> std::expected<void, ValidationError> {
  auto graph = build_workflow_graph(def);
  if (!graph) {
    return std::unexpected{std::move(graph.error())};
  }
  return {};
}

} // namespace stepflow
