#include "trustflow/core/edge_decay.hpp"

#include <cmath>

#include "trustflow/core/constants.hpp"

namespace trustflow::core {

Weight current_weight(const Edge& edge, Timestamp query_time,
                      double decay_constant) noexcept {
  if (query_time < edge.creation_time) return 0.0;  // not created yet
  const auto age = static_cast<double>(query_time - edge.creation_time);
  return kBaseEdgeWeight * std::exp(-age * decay_constant);
}

std::vector<Weight> decayed_weights(const TemporalGraph& g, Timestamp query_time,
                                    double decay_constant) {
  const auto edges = g.edges();
  std::vector<Weight> out(edges.size(), 0.0);
  for (std::size_t i = 0; i < edges.size(); ++i) {
    out[i] = current_weight(edges[i], query_time, decay_constant);
  }
  return out;
}

} // namespace trustflow::core
