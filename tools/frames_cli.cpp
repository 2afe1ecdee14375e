#include "frames_cli.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <limits>
#include <map>
#include <string_view>
#include <system_error>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "trustflow/core/error.hpp"

namespace trustflow::tools {

void AddFramesOptions(CLI::App& app, FramesOptions& options) {
  app.add_flag("-v,--verbose", options.verbose, "Log to the console");
  app.add_option("--log-level", options.log_level,
                 "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));

  app.add_option("-o,--output-dir", options.output_dir, "Root folder for frame files")
      ->default_val("output");
  app.add_option("-s,--scenario", options.scenario, "Scenario name (sub-folder of output-dir)")
      ->default_val("trust-flow-example");
  app.add_option("--decay-constant", options.decay_constant, "Exponential edge decay constant")
      ->default_val(core::kDefaultDecayConstant);
  app.add_option("--max-time", options.max_time, "Last query time (inclusive)")
      ->default_val(core::kDefaultMaxTime)
      ->check(CLI::NonNegativeNumber);
  app.add_option("--damping-factor", options.damping_factor, "Share of rank routed along edges")
      ->default_val(core::kDefaultDampingFactor)
      ->check(CLI::Range(0.0, 1.0));
  app.add_option("--iterations", options.iterations, "Rounds per snapshot")
      ->default_val(core::kDefaultIterations)
      ->check(CLI::NonNegativeNumber);
  app.add_option("--expert-fraction", options.expert_fraction,
                 "Fraction of teleported rank directed to experts")
      ->default_val(core::kDefaultExpertFraction)
      ->check(CLI::Range(0.0, 1.0));
  app.add_option("--expert", options.experts, "Expert node id (repeatable; defaults to node 0 unless --expert-fraction is 0)")
      ->check(CLI::NonNegativeNumber);
  app.add_option("--edge", options.edge_specs, "Edge as SRC:DST:TIME (repeatable)");
  app.add_option("--nodes", options.num_nodes, "Node count for --edge graphs")
      ->check(CLI::NonNegativeNumber);
}

void SetupLogging(const FramesOptions& options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.verbose) {
      auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    } else {
      // Warnings and errors still reach the console
      auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      err_sink->set_pattern("[%^%l%$] %v");
      err_sink->set_level(spdlog::level::warn);
      sinks.push_back(err_sink);
    }
    auto logger = std::make_shared<spdlog::logger>("trustflow", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    throw;
  }
}

namespace {
template <typename T>
T parse_field(std::string_view text, const std::string& spec) {
  T value {};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw core::InvalidInput("malformed edge '" + spec + "', expected SRC:DST:TIME");
  }
  return value;
}
} // namespace

core::Edge ParseEdgeSpec(const std::string& spec) {
  const auto first = spec.find(':');
  const auto second = first == std::string::npos ? std::string::npos : spec.find(':', first + 1);
  if (second == std::string::npos) {
    throw core::InvalidInput("malformed edge '" + spec + "', expected SRC:DST:TIME");
  }
  std::string_view view(spec);
  core::Edge e;
  e.source = parse_field<core::NodeId>(view.substr(0, first), spec);
  e.target = parse_field<core::NodeId>(view.substr(first + 1, second - first - 1), spec);
  e.creation_time = parse_field<core::Timestamp>(view.substr(second + 1), spec);
  return e;
}

core::TemporalGraph ExampleScenario() {
  const std::vector<core::Edge> edges = {
      {0, 1, 1}, {1, 2, 2}, {1, 3, 3}, {3, 4, 4}, {3, 5, 5}, {5, 1, 6},
  };
  return core::TemporalGraph::from_edges(6, edges);
}

core::TemporalGraph LoadScenario(const FramesOptions& options) {
  if (options.edge_specs.empty()) {
    spdlog::debug("No --edge given, using the built-in example scenario");
    return ExampleScenario();
  }
  std::vector<core::Edge> edges;
  edges.reserve(options.edge_specs.size());
  core::NodeId max_id = 0;
  for (const auto& spec : options.edge_specs) {
    edges.push_back(ParseEdgeSpec(spec));
    max_id = std::max({max_id, edges.back().source, edges.back().target});
  }
  if (options.num_nodes > 0) {
    return core::TemporalGraph::from_edges(options.num_nodes, edges);
  }
  const std::int64_t inferred = static_cast<std::int64_t>(max_id) + 1;
  if (inferred > std::numeric_limits<std::int32_t>::max()) {
    throw core::InvalidInput("node id " + std::to_string(max_id) + " leaves no room for a node count");
  }
  return core::TemporalGraph::from_edges(static_cast<std::int32_t>(inferred), edges);
}

std::vector<core::NodeId> ExpertNodes(const FramesOptions& options) {
  if (!options.experts.empty()) return options.experts;
  if (options.expert_fraction > 0.0) return {0};
  return {};
}

} // namespace trustflow::tools
