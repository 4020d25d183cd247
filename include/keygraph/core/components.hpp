/* Adjacency, reachability, connectivity and induced subgraphs. */
#pragma once

#include <vector>

#include "keygraph/core/engine_graph.hpp"
#include "keygraph/core/resolved_selector.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

// True if an edge u->v exists (either orientation on undirected graphs).
// A vertex is only connected to itself through a self-loop.
[[nodiscard]] bool are_connected(const EngineGraph& g, VertexId u, VertexId v);

// Vertices reachable from v under mode, v first, then in breadth-first order.
[[nodiscard]] std::vector<VertexId> subcomponent(const EngineGraph& g, VertexId v, NeiMode mode);

// The null graph is not connected; a single vertex is. Strong connectivity
// of an undirected graph equals weak connectivity.
[[nodiscard]] bool is_connected(const EngineGraph& g, Connectedness mode);

// Induced subgraph over the selected vertices. New vertex i corresponds to
// parent vertex parent_ids[i]; parent_ids is ascending (duplicates in the
// selector collapse). Edges keep their relative order.
struct InducedSubgraph {
  EngineGraph graph;
  std::vector<VertexId> parent_ids;
};

[[nodiscard]] InducedSubgraph induced_subgraph(const EngineGraph& g, const ResolvedSelector& sel);

} // namespace keygraph::core
