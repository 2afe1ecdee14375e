/*
  DOT frame writer — one Graphviz digraph per rank snapshot.

  Positions are pinned so consecutive frames line up when rendered with
  neato. Experts get a thick dark green border.
*/
#include "trustflow/core/dot_frame.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "trustflow/core/error.hpp"

namespace trustflow::core {

std::vector<NodePosition> circular_layout(std::int32_t num_nodes) {
  if (num_nodes <= 0) {
    throw InvalidInput("circular_layout: num_nodes must be > 0");
  }
  std::vector<NodePosition> out;
  out.reserve(static_cast<std::size_t>(num_nodes));
  for (std::int32_t i = 0; i < num_nodes; ++i) {
    const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(num_nodes);
    out.push_back(NodePosition{std::cos(angle), std::sin(angle)});
  }
  return out;
}

std::string rank_fill_color(Rank rank) {
  const double r = std::clamp(rank, 0.0, 1.0);
  const auto level = static_cast<std::uint8_t>((1.0 - r) * 255.0);
  return fmt::format("#{:02X}{:02X}{:02X}", level, level, 255);
}

void write_dot_frame(std::ostream& os, const DotFrame& frame) {
  if (frame.graph == nullptr) {
    throw InvalidInput("write_dot_frame: graph is null");
  }
  const TemporalGraph& g = *frame.graph;
  const auto n = static_cast<std::size_t>(g.num_nodes());
  if (frame.ranks.size() != n) {
    throw InvalidInput("write_dot_frame: ranks length must equal num_nodes");
  }
  if (frame.positions.size() != n) {
    throw InvalidInput("write_dot_frame: positions length must equal num_nodes");
  }
  if (frame.weights.size() != static_cast<std::size_t>(g.num_edges())) {
    throw InvalidInput("write_dot_frame: weights length must equal num_edges");
  }
  std::vector<bool> is_expert(n, false);
  for (auto e : frame.experts) {
    if (e < 0 || static_cast<std::size_t>(e) >= n) {
      throw InvalidInput("write_dot_frame: expert id out of range");
    }
    is_expert[static_cast<std::size_t>(e)] = true;
  }

  fmt::print(os, "digraph G {{\n");
  fmt::print(os, "  nodesep=0.8;\n");
  fmt::print(os, "  graph [layout=neato, overlap=false, splines=true, pad=\"1.0,1.0\", fontsize=20];\n");
  fmt::print(os, "  labelloc=\"t\";\n");
  fmt::print(os, "  labeljust=\"l\";\n");
  fmt::print(os, "  labelfontsize=26;\n");
  fmt::print(os, "  label=\"Trust flow over time\\nAlgorithm: {}\\nEdge decay: {}\\nFrame: {}/{}\";\n",
             frame.algorithm, frame.decay_description, frame.frame, frame.total_frames);

  for (std::size_t i = 0; i < n; ++i) {
    const auto label = fmt::format("{} ({:.2f})", i, frame.ranks[i]);
    const auto fill = rank_fill_color(frame.ranks[i]);
    const auto& p = frame.positions[i];
    if (is_expert[i]) {
      fmt::print(os,
                 "  {} [label=\"{}\", shape=circle, style=filled, fillcolor=\"{}\", color=\"darkgreen\", "
                 "penwidth=8, fontsize=20, pos=\"{:.2f},{:.2f}!\", pin=true];\n",
                 i, label, fill, p.x, p.y);
    } else {
      fmt::print(os,
                 "  {} [label=\"{}\", shape=circle, style=filled, fillcolor=\"{}\", fontsize=20, "
                 "pos=\"{:.2f},{:.2f}!\", pin=true];\n",
                 i, label, fill, p.x, p.y);
    }
  }

  const auto edges = g.edges();
  for (std::size_t e = 0; e < edges.size(); ++e) {
    const Weight w = frame.weights[e];
    if (w == 0.0) {
      // Keep the edge for layout, hide it until it exists
      fmt::print(os, "  {} -> {} [style=invis];\n", edges[e].source, edges[e].target);
    } else {
      fmt::print(os, "  {} -> {} [penwidth={}];\n", edges[e].source, edges[e].target, 8.0 * w);
    }
  }
  fmt::print(os, "}}\n");
}

} // namespace trustflow::core
