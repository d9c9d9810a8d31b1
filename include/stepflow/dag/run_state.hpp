#pragma once

#include <boost/dynamic_bitset.hpp>

#include <cstddef>
#include <cstdint>

namespace stepflow {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

/// Per-execution graph state, one bit per node. A node is in at most one of
/// the three sets at any time.
struct GraphRunState {
  explicit GraphRunState(std::size_t n)
      : completed(n), failed(n), in_flight(n) {}

  [[nodiscard]] auto is_resolved(NodeIndex idx) const -> bool {
    return completed.test(idx) || failed.test(idx);
  }

  [[nodiscard]] auto is_untouched(NodeIndex idx) const -> bool {
    return !is_resolved(idx) && !in_flight.test(idx);
  }

  [[nodiscard]] auto attempted_any() const -> bool {
    return completed.any() || failed.any();
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return completed.size();
  }

  boost::dynamic_bitset<> completed;
  boost::dynamic_bitset<> failed;
  boost::dynamic_bitset<> in_flight;
};

} // namespace stepflow
