/*
  CPU Backend — thin adapter that delegates to in-process algorithms.
*/
#include <utility>

#include "trustflow/core/backend.hpp"
#include "trustflow/core/error.hpp"
#include "trustflow/core/rank_flow.hpp"
#include "trustflow/core/timeline.hpp"

namespace trustflow::core {

namespace {
class CpuBackend final : public Backend {
public:
  GraphHandle build_graph(const TemporalGraph& g) override {
    // Create a non-owning shared_ptr with no-op deleter; lifetime is managed by caller
    return GraphHandle{ std::shared_ptr<const TemporalGraph>(&g, [](const TemporalGraph*){}) };
  }

  GraphHandle build_graph(std::shared_ptr<const TemporalGraph> g) override {
    return GraphHandle{ std::move(g) };
  }

  std::vector<Rank> rank_flow(
      const GraphHandle& gh, std::span<const Weight> weights,
      std::span<const double> teleport, const RankFlowOptions& opts) override {
    if (!gh.graph) {
      throw InvalidInput("CpuBackend::rank_flow: empty graph handle");
    }
    return trustflow::core::rank_flow(*gh.graph, weights, teleport, opts);
  }

  std::vector<RankSnapshot> rank_timeline(
      const GraphHandle& gh, std::span<const NodeId> experts,
      const TimelineOptions& opts) override {
    if (!gh.graph) {
      throw InvalidInput("CpuBackend::rank_timeline: empty graph handle");
    }
    return trustflow::core::rank_timeline(*gh.graph, experts, opts);
  }
};
} // namespace

BackendPtr make_cpu_backend() {
  return std::make_shared<CpuBackend>();
}

} // namespace trustflow::core
