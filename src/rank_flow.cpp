/*
  rank_flow — fixed-iteration trust flow over a TemporalGraph.

  Rank is treated as mass. Every round is computed from the previous round's
  rank only (Jacobi update), so edge order does not change the result beyond
  floating-point summation order.

  Normalization uses the static (structural) out-degree, not the current
  decayed outflow: capacity lost to decay is recaptured as dangling mass and
  spread uniformly instead of being routed along the surviving edges.
*/
#include "trustflow/core/rank_flow.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "trustflow/core/error.hpp"

namespace trustflow::core {

namespace {
void validate_inputs(const TemporalGraph& g,
                     std::span<const Weight> weights,
                     std::span<const double> teleport,
                     double damping_factor,
                     std::int32_t iterations) {
  if (g.num_nodes() <= 0) {
    throw InvalidInput("rank_flow: graph must have at least one node");
  }
  if (weights.size() != static_cast<std::size_t>(g.num_edges())) {
    throw InvalidInput("rank_flow: weights length must equal num_edges");
  }
  if (teleport.size() != static_cast<std::size_t>(g.num_nodes())) {
    throw InvalidInput("rank_flow: teleport length must equal num_nodes");
  }
  if (!(damping_factor >= 0.0 && damping_factor <= 1.0)) {
    throw InvalidInput("rank_flow: damping_factor must be in [0, 1]");
  }
  if (iterations < 0) {
    throw InvalidInput("rank_flow: iterations must be >= 0");
  }
  for (std::size_t i = 0; i < weights.size(); ++i) {
    if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
      throw InvalidInput("rank_flow: weight of edge " + std::to_string(i) + " must be finite and >= 0");
    }
  }
  double total = 0.0;
  for (std::size_t i = 0; i < teleport.size(); ++i) {
    if (!std::isfinite(teleport[i]) || teleport[i] < 0.0) {
      throw InvalidInput("rank_flow: teleport entry " + std::to_string(i) + " must be finite and >= 0");
    }
    total += teleport[i];
  }
  if (std::abs(total - 1.0) > kMassTolerance) {
    throw InvalidInput("rank_flow: teleport must sum to 1 (got " + std::to_string(total) + ")");
  }
}
} // namespace

std::vector<Rank> rank_flow(const TemporalGraph& g,
                            std::span<const Weight> weights,
                            std::span<const double> teleport,
                            double damping_factor,
                            std::int32_t iterations) {
  validate_inputs(g, weights, teleport, damping_factor, iterations);

  const auto n = static_cast<std::size_t>(g.num_nodes());
  const auto edges = g.edges();
  const auto out_degree = g.out_degree_view();
  const double d = damping_factor;

  std::vector<Rank> rank(n, 1.0 / static_cast<double>(n));
  std::vector<Rank> next(n, 0.0);
  std::vector<Weight> outflow(n, 0.0);

  for (std::int32_t it = 0; it < iterations; ++it) {
    // Teleportation inflow
    for (std::size_t i = 0; i < n; ++i) next[i] = (1.0 - d) * teleport[i];
    std::fill(outflow.begin(), outflow.end(), 0.0);

    // Flow along edges at a rate proportional to the decayed weight.
    // out_degree[s] >= 1 here since edge e leaves s.
    for (std::size_t e = 0; e < edges.size(); ++e) {
      const auto s = static_cast<std::size_t>(edges[e].source);
      const auto t = static_cast<std::size_t>(edges[e].target);
      const Weight w = weights[e];
      outflow[s] += w;
      next[t] += d * rank[s] * (w / static_cast<double>(out_degree[s]));
    }

    // Whatever a node failed to route becomes dangling mass
    double dangling = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      const double damped = d * rank[i];
      if (out_degree[i] > 0) {
        const double allocated = damped * (outflow[i] / static_cast<double>(out_degree[i]));
        dangling += damped - allocated;
      } else {
        dangling += damped;
      }
    }
    const double share = dangling / static_cast<double>(n);
    for (std::size_t i = 0; i < n; ++i) next[i] += share;

    rank.swap(next);
  }
  return rank;
}

std::vector<Rank> rank_flow(const TemporalGraph& g,
                            std::span<const Weight> weights,
                            std::span<const double> teleport,
                            const RankFlowOptions& opts) {
  return rank_flow(g, weights, teleport, opts.damping_factor, opts.iterations);
}

} // namespace trustflow::core
