/*
  rank_timeline — snapshot orchestration across query times.

  The teleport vector does not depend on time and is built once. Weights are
  recomputed per time, and every rank_flow call starts again from uniform
  rank; nothing is carried between snapshots.
*/
#include "trustflow/core/timeline.hpp"

#include <string>
#include <utility>

#include "trustflow/core/edge_decay.hpp"
#include "trustflow/core/error.hpp"
#include "trustflow/core/teleport.hpp"

namespace trustflow::core {

std::vector<RankSnapshot> rank_timeline(const TemporalGraph& g,
                                        std::span<const NodeId> experts,
                                        const TimelineOptions& opts) {
  if (opts.max_time < 0) {
    throw InvalidInput("rank_timeline: max_time must be >= 0");
  }
  if (opts.max_time >= kMaxTimelineSnapshots) {
    throw InvalidInput("rank_timeline: max_time must be < " + std::to_string(kMaxTimelineSnapshots));
  }
  const auto teleport = build_teleport_vector(g.num_nodes(), experts, opts.expert_fraction);

  std::vector<RankSnapshot> out;
  out.reserve(static_cast<std::size_t>(opts.max_time) + 1);
  for (Timestamp t = 0; t <= opts.max_time; ++t) {
    RankSnapshot snap;
    snap.time = t;
    snap.weights = decayed_weights(g, t, opts.decay_constant);
    snap.ranks = rank_flow(g, snap.weights, teleport, opts.rank);
    out.push_back(std::move(snap));
  }
  return out;
}

} // namespace trustflow::core
