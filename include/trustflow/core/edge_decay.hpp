/* Exponential time decay of edge strength. */
#pragma once

#include <vector>

#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/types.hpp"

namespace trustflow::core {

// Weight of an edge observed at query_time. Edges created after query_time do
// not exist yet and weigh 0; otherwise the base weight decays as
// exp(-(query_time - creation_time) * decay_constant). A negative
// decay_constant is not rejected (weights then grow with age).
[[nodiscard]] Weight current_weight(const Edge& edge, Timestamp query_time,
                                    double decay_constant) noexcept;

// Weights for every edge of g at query_time, aligned with g.edges().
[[nodiscard]] std::vector<Weight> decayed_weights(const TemporalGraph& g,
                                                  Timestamp query_time,
                                                  double decay_constant);

} // namespace trustflow::core
