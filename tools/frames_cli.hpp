/* Command-line options, logging setup and scenario loading for trustflow_frames. */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "CLI/App.hpp"
#include "spdlog/common.h"

#include "trustflow/core/constants.hpp"
#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/types.hpp"

namespace trustflow::tools {

struct FramesOptions {
  bool verbose {false};
  spdlog::level::level_enum log_level {spdlog::level::info};
  std::string output_dir {"output"};
  std::string scenario {"trust-flow-example"};
  double decay_constant {core::kDefaultDecayConstant};
  core::Timestamp max_time {core::kDefaultMaxTime};
  double damping_factor {core::kDefaultDampingFactor};
  std::int32_t iterations {core::kDefaultIterations};
  double expert_fraction {core::kDefaultExpertFraction};
  // Explicit --expert ids; see ExpertNodes() for the effective set
  std::vector<core::NodeId> experts;
  // "SRC:DST:TIME"; empty selects the built-in example topology
  std::vector<std::string> edge_specs;
  std::int32_t num_nodes {0};
};

void AddFramesOptions(CLI::App& app, FramesOptions& options);
void SetupLogging(const FramesOptions& options);

// Parses "SRC:DST:TIME". Throws core::InvalidInput on malformed text.
[[nodiscard]] core::Edge ParseEdgeSpec(const std::string& spec);

// The six-node example: 0->1@1, 1->2@2, 1->3@3, 3->4@4, 3->5@5, 5->1@6.
[[nodiscard]] core::TemporalGraph ExampleScenario();

// Graph from --edge/--nodes, or ExampleScenario() when no edges were given.
// When --nodes is 0 the node count is one past the largest endpoint.
// Throws core::InvalidInput if the inferred count does not fit in 32 bits.
[[nodiscard]] core::TemporalGraph LoadScenario(const FramesOptions& options);

// The --expert ids if any were given. Otherwise node 0, or no experts at all
// when --expert-fraction is 0.
[[nodiscard]] std::vector<core::NodeId> ExpertNodes(const FramesOptions& options);

} // namespace trustflow::tools
