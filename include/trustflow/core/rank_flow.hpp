/* Mass-conserving, time-decayed PageRank variant ("trust flow"). */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "trustflow/core/constants.hpp"
#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/types.hpp"

namespace trustflow::core {

struct RankFlowOptions {
  double damping_factor { kDefaultDampingFactor };
  // Exact number of rounds; there is no convergence test.
  std::int32_t iterations { kDefaultIterations };
};

// Runs `iterations` synchronous rounds starting from the uniform rank 1/N.
//
// Each round seeds (1 - d) * teleport, pushes d * rank[s] * w / out_degree[s]
// along every edge, and gathers whatever a node could not route (its decayed
// outflow falls short of its static out-degree, or it has no out-edges) into
// a dangling pool that is spread evenly over all nodes. Total rank stays 1.
//
// weights must be aligned with g.edges(); teleport must have one entry per
// node, be non-negative and sum to 1. Throws InvalidInput before iterating
// if any precondition fails.
[[nodiscard]] std::vector<Rank> rank_flow(const TemporalGraph& g,
                                          std::span<const Weight> weights,
                                          std::span<const double> teleport,
                                          double damping_factor,
                                          std::int32_t iterations);

[[nodiscard]] std::vector<Rank> rank_flow(const TemporalGraph& g,
                                          std::span<const Weight> weights,
                                          std::span<const double> teleport,
                                          const RankFlowOptions& opts);

} // namespace trustflow::core
