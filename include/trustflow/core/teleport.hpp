/* Expert-biased teleportation (restart) distribution. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "trustflow/core/types.hpp"

namespace trustflow::core {

// Every node receives (1 - expert_fraction) / num_nodes; each distinct expert
// additionally receives expert_fraction / |distinct experts|. Duplicate
// expert ids count once. The result sums to 1.
//
// Throws InvalidInput when num_nodes <= 0, expert_fraction is outside [0, 1],
// an expert id is out of range, or expert_fraction > 0 with no experts.
[[nodiscard]] std::vector<double> build_teleport_vector(
    std::int32_t num_nodes,
    std::span<const NodeId> experts,
    double expert_fraction);

} // namespace trustflow::core
