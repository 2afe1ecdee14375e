/* Graphviz DOT rendering of a single rank snapshot. */
#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/types.hpp"

namespace trustflow::core {

// Nodes evenly spaced on the unit circle, node 0 at angle 0.
[[nodiscard]] std::vector<NodePosition> circular_layout(std::int32_t num_nodes);

// White-to-blue ramp: rank 0 -> #FFFFFF, rank 1 -> #0000FF (rank clamped).
[[nodiscard]] std::string rank_fill_color(Rank rank);

// Everything needed to draw one frame. Spans are non-owning.
struct DotFrame {
  const TemporalGraph* graph {nullptr};
  std::span<const Rank> ranks;
  std::span<const Weight> weights;
  std::span<const NodeId> experts;
  std::span<const NodePosition> positions;
  std::int64_t frame {1};         // 1-based
  std::int64_t total_frames {1};
  std::string algorithm;
  std::string decay_description;
};

// Writes a neato digraph with pinned node positions. Rank drives node fill,
// weight drives pen width; zero-weight edges are emitted invisible so the
// layout stays stable across frames. Throws InvalidInput on length mismatch.
void write_dot_frame(std::ostream& os, const DotFrame& frame);

} // namespace trustflow::core
