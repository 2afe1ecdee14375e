/*
  trustflow_frames — renders one DOT file per query time for a scenario.

  Output: <output-dir>/<scenario>/frame_000.dot ... frame_<max_time>.dot
  Convert with e.g. `dot -Tpng`; the files only describe the graph.
*/
#include <exception>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <stdexcept>

#include "CLI/CLI.hpp"
#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "frames_cli.hpp"
#include "trustflow/core/backend.hpp"
#include "trustflow/core/dot_frame.hpp"
#include "trustflow/core/error.hpp"

namespace fs = std::filesystem;
using namespace trustflow;

int main(int argc, char** argv) {
  CLI::App app{"Render trust flow snapshots as Graphviz DOT frames"};
  tools::FramesOptions options;
  tools::AddFramesOptions(app, options);
  CLI11_PARSE(app, argc, argv);

  try {
    tools::SetupLogging(options);
  } catch (const std::exception&) {
    return 1;
  }

  try {
    const auto graph = tools::LoadScenario(options);
    spdlog::info("Scenario '{}': {} nodes, {} edges", options.scenario,
                 graph.num_nodes(), graph.num_edges());

    core::TimelineOptions topts;
    topts.decay_constant = options.decay_constant;
    topts.max_time = options.max_time;
    topts.expert_fraction = options.expert_fraction;
    topts.rank.damping_factor = options.damping_factor;
    topts.rank.iterations = options.iterations;

    const auto experts = tools::ExpertNodes(options);
    auto backend = core::make_cpu_backend();
    auto gh = backend->build_graph(graph);
    const auto snapshots = backend->rank_timeline(gh, experts, topts);
    const auto positions = core::circular_layout(graph.num_nodes());

    const fs::path folder = fs::path(options.output_dir) / options.scenario;
    fs::create_directories(folder);

    const auto total = static_cast<std::int64_t>(snapshots.size());
    for (const auto& snap : snapshots) {
      const double mass = std::accumulate(snap.ranks.begin(), snap.ranks.end(), 0.0);
      spdlog::debug("t={} total rank mass {:.12f}", snap.time, mass);

      const fs::path file = folder / fmt::format("frame_{:03}.dot", snap.time);
      std::ofstream out(file);
      if (!out) {
        throw std::runtime_error("cannot open " + file.string() + " for writing");
      }
      core::DotFrame frame;
      frame.graph = &graph;
      frame.ranks = snap.ranks;
      frame.weights = snap.weights;
      frame.experts = experts;
      frame.positions = positions;
      frame.frame = snap.time + 1;
      frame.total_frames = total;
      frame.algorithm = "Custom PageRank variant";
      frame.decay_description = "Exponential";
      core::write_dot_frame(out, frame);
      out.close();
      if (!out) {
        throw std::runtime_error("failed writing " + file.string());
      }
      spdlog::info("{} created", file.string());
    }
  } catch (const core::InvalidInput& ex) {
    spdlog::error("Invalid input: {}", ex.what());
    return 2;
  } catch (const std::exception& ex) {
    spdlog::error("{}", ex.what());
    return 1;
  }
  return 0;
}
