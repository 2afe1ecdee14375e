/*
  Backend interface — abstracts rank-flow and timeline implementations.

  The default CPU backend delegates to in-process algorithm implementations.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual: method can be overridden in subclasses (like Python's inheritance)
  - = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <memory>
#include <span>
#include <vector>

#include "trustflow/core/rank_flow.hpp"
#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/timeline.hpp"

namespace trustflow::core {

// GraphHandle: opaque handle to a backend-owned graph.
struct GraphHandle {
  std::shared_ptr<const TemporalGraph> graph {};
};

class Backend {
public:
  virtual ~Backend() noexcept = default;

  // Non-owning handle; the caller keeps g alive.
  [[nodiscard]] virtual GraphHandle build_graph(const TemporalGraph& g) = 0;

  [[nodiscard]] virtual GraphHandle build_graph(std::shared_ptr<const TemporalGraph> g) = 0;

  [[nodiscard]] virtual std::vector<Rank> rank_flow(
      const GraphHandle& gh, std::span<const Weight> weights,
      std::span<const double> teleport, const RankFlowOptions& opts) = 0;

  [[nodiscard]] virtual std::vector<RankSnapshot> rank_timeline(
      const GraphHandle& gh, std::span<const NodeId> experts,
      const TimelineOptions& opts) = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

[[nodiscard]] BackendPtr make_cpu_backend();

} // namespace trustflow::core
