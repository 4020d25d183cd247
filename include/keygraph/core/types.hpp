/* Core type aliases and enums shared by the engine and the keyed layer.
 *
 * - VertexId/EdgeId: dense engine indices in [0, n) and [0, m).
 * - Distance: hop count returned to callers (unreachable is std::nullopt,
 *   never a sentinel).
 */
#pragma once

#include <cstdint>

namespace keygraph::core {

using VertexId = std::int32_t;
using EdgeId   = std::int32_t;
using Distance = std::int64_t;

// Fixed when a graph is created; never changes for the graph's lifetime.
enum class Directedness {
  Undirected = 0,
  Directed = 1
};

// Which incident direction counts during traversal of a directed graph.
// Undirected graphs treat every mode as All.
enum class NeiMode {
  Out = 1,
  In = 2,
  All = 3
};

enum class Connectedness {
  Weak = 1,
  Strong = 2   // Only differs from Weak on directed graphs
};

} // namespace keygraph::core
