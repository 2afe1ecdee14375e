/* Numeric constants and defaults shared across the library. */
#pragma once

#include <cstdint>

#include "trustflow/core/types.hpp"

namespace trustflow::core {

// Strength of every edge at its creation time.
inline constexpr Weight kBaseEdgeWeight = 1.0;

// Relative tolerance for "sums to 1.0" checks on teleport vectors.
inline constexpr double kMassTolerance = 1e-9;

// Defaults used by the example trust-flow scenario.
inline constexpr double kDefaultDampingFactor = 0.5;
inline constexpr std::int32_t kDefaultIterations = 10;
inline constexpr double kDefaultDecayConstant = 0.1;
inline constexpr double kDefaultExpertFraction = 0.8;  // share of teleported mass sent to experts
inline constexpr Timestamp kDefaultMaxTime = 20;

// Upper bound on snapshots per timeline; max_time must stay below it.
inline constexpr Timestamp kMaxTimelineSnapshots = 1'000'000;

} // namespace trustflow::core
