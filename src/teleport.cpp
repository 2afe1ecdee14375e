/*
  Teleportation vector — uniform floor plus an equal bonus for experts.
*/
#include "trustflow/core/teleport.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "trustflow/core/error.hpp"

namespace trustflow::core {

std::vector<double> build_teleport_vector(std::int32_t num_nodes,
                                          std::span<const NodeId> experts,
                                          double expert_fraction) {
  if (num_nodes <= 0) {
    throw InvalidInput("build_teleport_vector: num_nodes must be > 0");
  }
  if (!std::isfinite(expert_fraction) || expert_fraction < 0.0 || expert_fraction > 1.0) {
    throw InvalidInput("build_teleport_vector: expert_fraction must be in [0, 1]");
  }
  for (auto e : experts) {
    if (e < 0 || e >= num_nodes) {
      throw InvalidInput("build_teleport_vector: expert id " + std::to_string(e) + " out of range");
    }
  }
  // A node listed twice must not collect two bonuses.
  std::vector<NodeId> unique(experts.begin(), experts.end());
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

  if (expert_fraction > 0.0 && unique.empty()) {
    throw InvalidInput("build_teleport_vector: expert_fraction > 0 requires at least one expert");
  }

  const auto n = static_cast<std::size_t>(num_nodes);
  std::vector<double> out(n, (1.0 - expert_fraction) / static_cast<double>(num_nodes));
  if (!unique.empty()) {
    const double bonus = expert_fraction / static_cast<double>(unique.size());
    for (auto e : unique) out[static_cast<std::size_t>(e)] += bonus;
  }
  return out;
}

} // namespace trustflow::core
