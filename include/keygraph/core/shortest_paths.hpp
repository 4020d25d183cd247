/* Unweighted shortest paths (breadth-first) over an EngineGraph. */
#pragma once

#include <cstdint>
#include <vector>

#include "keygraph/core/engine_graph.hpp"
#include "keygraph/core/resolved_selector.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

// A concrete path: vertices[0] is the source, vertices.back() the target and
// edges[i] joins vertices[i] and vertices[i+1]. Both are empty when the
// target is unreachable.
struct PathResult {
  std::vector<VertexId> vertices;
  std::vector<EdgeId> edges;
};

// Dense row-major distance matrix. Row i belongs to the i-th vertex of the
// source selector, column j to the j-th vertex of the target selector, in
// selector_vertices() order. Unreachable entries hold kInfDistance.
struct DistanceMatrix {
  std::int32_t rows {0};
  std::int32_t cols {0};
  std::vector<double> values {};

  [[nodiscard]] double at(std::int32_t r, std::int32_t c) const {
    return values[static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) + static_cast<std::size_t>(c)];
  }
};

// Hop distance from src to every vertex; kInfDistance where unreachable.
[[nodiscard]] std::vector<double> bfs_distances(const EngineGraph& g, VertexId src, NeiMode mode);

// Among equal-length paths, the one found first when incident edges are
// scanned in edge-id order is returned.
[[nodiscard]] PathResult get_shortest_path(const EngineGraph& g, VertexId from, VertexId to, NeiMode mode);

[[nodiscard]] DistanceMatrix shortest_distances(const EngineGraph& g,
                                                const ResolvedSelector& from,
                                                const ResolvedSelector& to,
                                                NeiMode mode);

} // namespace keygraph::core
