#include "stepflow/dag/dependency_graph.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>
#include <vector>

namespace stepflow {

namespace {
constexpr std::size_t kMaxNodes = 1'000'000;

enum class Visit : std::uint8_t { New, OnStack, Done };
} // namespace

auto ValidationError::message() const -> std::string {
  std::string out = code.message();
  if (!steps.empty()) {
    out += ": ";
    for (auto [i, step] : std::views::enumerate(steps)) {
      if (i > 0) {
        out += " -> ";
      }
      out += step.str();
    }
  }
  return out;
}

auto DependencyGraph::add_node(StepId step_id) -> Result<NodeIndex> {
  if (key_to_idx_.contains(step_id)) {
    return fail(Error::DuplicateStep);
  }
  if (nodes_.size() >= kMaxNodes) {
    return fail(Error::ResourceExhausted);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(step_id);
  key_to_idx_.emplace(std::move(step_id), idx);
  return ok(idx);
}

auto DependencyGraph::add_dependency(const StepId &step,
                                     const StepId &dependency) -> Result<void> {
  NodeIndex to = index_of(step);
  if (to == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  NodeIndex from = index_of(dependency);
  if (from == kInvalidNode) {
    dangling_.emplace_back(step, dependency);
    return ok();
  }
  if (has_edge(from, to)) {
    return ok();
  }
  nodes_[to].deps.emplace_back(from);
  nodes_[from].dependents.emplace_back(to);
  return ok();
}

auto DependencyGraph::has_edge(NodeIndex from, NodeIndex to) const noexcept
    -> bool {
  const auto &dependents = nodes_[from].dependents;
  return std::ranges::find(dependents, to) != dependents.end();
}

auto DependencyGraph::validate() const -> std::expected<void, ValidationError> {
  if (!dangling_.empty()) {
    const auto &[step, missing] = dangling_.front();
    return invalid(Error::DanglingReference, {step, missing});
  }
  if (auto cycle = find_cycle(); !cycle.empty()) {
    return invalid(Error::CycleDetected, std::move(cycle));
  }
  return {};
}

// Iterative DFS 3-colouring along dependency edges. On a back edge the
// current stack from the revisited node upward is the cycle.
auto DependencyGraph::find_cycle() const -> std::vector<StepId> {
  std::vector<Visit> visit(nodes_.size(), Visit::New);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start :
       std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(nodes_.size()))) {
    if (visit[start] != Visit::New)
      continue;

    stack.emplace_back(start, 0);
    visit[start] = Visit::OnStack;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &deps = nodes_[node].deps;

      if (child_idx < deps.size()) {
        NodeIndex child = deps[child_idx++];
        if (visit[child] == Visit::OnStack) {
          auto it = std::ranges::find_if(
              stack, [child](const auto &frame) { return frame.first == child; });
          std::vector<StepId> cycle;
          for (; it != stack.end(); ++it) {
            cycle.push_back(keys_[it->first]);
          }
          return cycle;
        }
        if (visit[child] == Visit::New) {
          visit[child] = Visit::OnStack;
          stack.emplace_back(child, 0);
        }
      } else {
        visit[node] = Visit::Done;
        stack.pop_back();
      }
    }
  }
  return {};
}

auto DependencyGraph::ready_steps(const GraphRunState &state) const
    -> std::vector<NodeIndex> {
  std::vector<NodeIndex> ready;
  for (NodeIndex idx = 0; idx < nodes_.size(); ++idx) {
    if (!state.is_untouched(idx)) {
      continue;
    }
    const auto &deps = nodes_[idx].deps;
    if (std::ranges::all_of(
            deps, [&](NodeIndex dep) { return state.completed.test(dep); })) {
      ready.push_back(idx);
    }
  }
  return ready;
}

auto DependencyGraph::has_pending_work(const GraphRunState &state) const
    -> bool {
  return (state.completed | state.failed).count() < nodes_.size();
}

auto DependencyGraph::topological_order() const -> std::vector<StepId> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(node.deps.size());
  }

  std::vector<NodeIndex> ready;
  ready.reserve(nodes_.size());
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      ready.emplace_back(static_cast<NodeIndex>(i));
    }
  }

  std::vector<StepId> result;
  result.reserve(nodes_.size());

  std::size_t head = 0;
  while (head < ready.size()) {
    NodeIndex current = ready[head++];
    result.emplace_back(keys_[current]);

    for (NodeIndex dependent : nodes_[current].dependents) {
      if (--in_degree[dependent] == 0) {
        ready.emplace_back(dependent);
      }
    }
  }

  return result;
}

auto DependencyGraph::deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DependencyGraph::dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DependencyGraph::has_node(const StepId &step_id) const -> bool {
  return key_to_idx_.contains(step_id);
}

auto DependencyGraph::index_of(const StepId &step_id) const -> NodeIndex {
  auto it = key_to_idx_.find(step_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::key_of(NodeIndex idx) const -> const StepId & {
  return keys_.at(idx);
}

} // namespace stepflow
