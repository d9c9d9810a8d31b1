#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/dag/run_state.hpp"
#include "stepflow/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace stepflow {

/// A rejected definition: the error plus the step ids that caused it. For a
/// cycle the ids are listed in dependency order along the cycle.
struct ValidationError {
  std::error_code code;
  std::vector<StepId> steps;

  [[nodiscard]] auto message() const -> std::string;
};

[[nodiscard]] inline auto invalid(Error e, std::vector<StepId> steps = {})
    -> std::unexpected<ValidationError> {
  return std::unexpected{ValidationError{make_error_code(e), std::move(steps)}};
}

class DependencyGraph {
public:
  [[nodiscard]] auto add_node(StepId step_id) -> Result<NodeIndex>;

  /// Declares that `step` waits for `dependency`. An unknown dependency is
  /// recorded and reported by validate() as a dangling reference.
  [[nodiscard]] auto add_dependency(const StepId &step,
                                    const StepId &dependency) -> Result<void>;

  [[nodiscard]] auto validate() const -> std::expected<void, ValidationError>;

  /// Nodes whose dependencies are all completed and which are themselves
  /// neither resolved nor in flight, in insertion order.
  [[nodiscard]] auto ready_steps(const GraphRunState &state) const
      -> std::vector<NodeIndex>;
  [[nodiscard]] auto has_pending_work(const GraphRunState &state) const
      -> bool;

  [[nodiscard]] auto topological_order() const -> std::vector<StepId>;

  [[nodiscard]] auto deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto has_node(const StepId &step_id) const -> bool;
  [[nodiscard]] auto index_of(const StepId &step_id) const -> NodeIndex;
  [[nodiscard]] auto key_of(NodeIndex idx) const -> const StepId &;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

  [[nodiscard]] auto make_run_state() const -> GraphRunState {
    return GraphRunState{nodes_.size()};
  }

private:
  [[nodiscard]] auto has_edge(NodeIndex from, NodeIndex to) const noexcept
      -> bool;
  [[nodiscard]] auto find_cycle() const -> std::vector<StepId>;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<StepId> keys_;
  ankerl::unordered_dense::map<StepId, NodeIndex> key_to_idx_;
  std::vector<std::pair<StepId, StepId>> dangling_;
};

} // namespace stepflow
