/* Immutable directed multigraph of timestamped edges. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "trustflow/core/types.hpp"

namespace trustflow::core {

// Notes on edge identifiers:
// - EdgeId is the position of an edge in the order it was supplied. Unlike a
//   cost-sorted layout, edges are never reordered: per-edge weight vectors
//   are positionally aligned with this order.
// - Static out-degree is derived once from topology and ignores weights.

class TemporalGraph {
public:
  [[nodiscard]] static TemporalGraph from_arrays(
      std::int32_t num_nodes,
      std::span<const std::int32_t> src,
      std::span<const std::int32_t> dst,
      std::span<const Timestamp> creation_time);
  [[nodiscard]] static TemporalGraph from_edges(
      std::int32_t num_nodes,
      std::span<const Edge> edges);
  ~TemporalGraph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edges_.size()); }

  [[nodiscard]] std::span<const Edge> edges() const noexcept { return edges_; }
  [[nodiscard]] const Edge& edge(EdgeId e) const noexcept { return edges_[static_cast<std::size_t>(e)]; }
  // Count of outgoing edges per node (length == num_nodes()).
  [[nodiscard]] std::span<const std::int32_t> out_degree_view() const noexcept { return out_degree_; }

private:
  std::int32_t num_nodes_ {0};
  std::vector<Edge> edges_ {};
  std::vector<std::int32_t> out_degree_ {};
};

} // namespace trustflow::core
