/* Rank snapshots over a sequence of query times. */
#pragma once

#include <span>
#include <vector>

#include "trustflow/core/constants.hpp"
#include "trustflow/core/rank_flow.hpp"
#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/types.hpp"

namespace trustflow::core {

struct TimelineOptions {
  double decay_constant { kDefaultDecayConstant };
  Timestamp max_time { kDefaultMaxTime };          // inclusive
  double expert_fraction { kDefaultExpertFraction };
  RankFlowOptions rank {};
};

struct RankSnapshot {
  Timestamp time {0};
  std::vector<Weight> weights;  // aligned with graph edges
  std::vector<Rank> ranks;      // one per node
};

// Computes one snapshot per time in [0, opts.max_time]. The teleport vector is
// built once; every snapshot restarts from uniform rank (no warm start).
[[nodiscard]] std::vector<RankSnapshot> rank_timeline(
    const TemporalGraph& g,
    std::span<const NodeId> experts,
    const TimelineOptions& opts);

} // namespace trustflow::core
