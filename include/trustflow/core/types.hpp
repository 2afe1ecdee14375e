/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId/EdgeId: int32 (matches np.int32)
 * - Timestamp: int64 (matches np.int64)
 * - Weight/Rank: double (matches np.float64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 */
#pragma once

#include <cstdint>

namespace trustflow::core {

// Node and edge identifiers are signed 32-bit integers (dense indices).
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Timestamp = std::int64_t;  // Discrete time step (>= 0)
using Weight = double;           // Decayed edge strength
using Rank   = double;           // Rank mass held by a node

// Edge: directed link with the discrete time at which it was created.
// Parallel edges and self-loops are allowed.
struct Edge {
  NodeId source {0};
  NodeId target {0};
  Timestamp creation_time {0};
  friend bool operator==(const Edge& a, const Edge& b) noexcept {
    return a.source==b.source && a.target==b.target && a.creation_time==b.creation_time;
  }
};

// Screen-space position of a node for rendering.
struct NodePosition {
  double x {0.0};
  double y {0.0};
};

} // namespace trustflow::core
