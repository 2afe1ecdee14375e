/*
  TemporalGraph — immutable directed multigraph of timestamped edges.

  Construction validates inputs and derives the static out-degree of every
  node. Edge order is kept exactly as supplied so that per-edge vectors
  (decayed weights) stay positionally aligned.
*/
#include "trustflow/core/temporal_graph.hpp"

#include <string>

#include "trustflow/core/error.hpp"

namespace trustflow::core {

TemporalGraph TemporalGraph::from_arrays(
    std::int32_t num_nodes,
    std::span<const std::int32_t> src,
    std::span<const std::int32_t> dst,
    std::span<const Timestamp> creation_time) {
  if (src.size() != dst.size() || src.size() != creation_time.size()) {
    throw InvalidInput("src, dst, and creation_time must have the same length");
  }
  std::vector<Edge> edges;
  edges.reserve(src.size());
  for (std::size_t i = 0; i < src.size(); ++i) {
    edges.push_back(Edge{src[i], dst[i], creation_time[i]});
  }
  return from_edges(num_nodes, edges);
}

TemporalGraph TemporalGraph::from_edges(std::int32_t num_nodes,
                                        std::span<const Edge> edges) {
  if (num_nodes <= 0) {
    throw InvalidInput("num_nodes must be > 0");
  }
  // Invariants: ids within [0, num_nodes), non-negative creation times
  for (std::size_t i = 0; i < edges.size(); ++i) {
    const Edge& e = edges[i];
    if (e.source < 0 || e.target < 0 || e.source >= num_nodes || e.target >= num_nodes) {
      throw InvalidInput("edge " + std::to_string(i) + " endpoint out of range of num_nodes");
    }
    if (e.creation_time < 0) {
      throw InvalidInput("edge " + std::to_string(i) + " creation_time must be >= 0");
    }
  }
  TemporalGraph g;
  g.num_nodes_ = num_nodes;
  g.edges_.assign(edges.begin(), edges.end());
  const auto n = static_cast<std::size_t>(num_nodes);

  g.out_degree_.assign(n, 0);
  for (const auto& e : g.edges_) {
    g.out_degree_[static_cast<std::size_t>(e.source)]++;
  }
  return g;
}

} // namespace trustflow::core
