/*
  Algorithms over keyed graphs.

  Each function resolves node values to engine ids, makes one engine call
  through the graph's Backend, and maps the ids in the result back to node
  values. Absent nodes are handled per operation:
    - lenient: are_connected (false), subcomponent (empty), selectors
      (resolve to no vertices);
    - strict:  get_shortest_path throws NodeNotFound.
  Engine failures surface as EngineError and are not caught here.
*/
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "keygraph/core/constants.hpp"
#include "keygraph/core/error.hpp"
#include "keygraph/core/graph.hpp"
#include "keygraph/core/identity_map.hpp"
#include "keygraph/core/logging.hpp"
#include "keygraph/core/types.hpp"
#include "keygraph/core/vertex_selector.hpp"

namespace keygraph::core {

template <typename Node>
struct ShortestPath {
  std::vector<Node> vertices;
  std::vector<Edge<Node>> edges;
};

// Row node -> column node -> hop count; std::nullopt where unreachable.
template <typename Node>
using DistanceTable = std::map<Node, std::map<Node, std::optional<Distance>>>;

// Engine adjacency test; false when either node is absent. An isolated
// vertex is not connected to itself.
template <typename Node>
[[nodiscard]] bool are_connected(const Graph<Node>& g, const Node& a, const Node& b) {
  const auto u = g.id_of(a);
  const auto v = g.id_of(b);
  if (!u || !v) return false;
  return g.backend().are_connected(g.engine(), *u, *v);
}

// Shortest path from `from` to `to` under mode. Both nodes must be present
// (NodeNotFound otherwise). An unreachable target yields an empty path.
// Edges of an undirected graph are oriented along the path, so edges[i]
// runs from vertices[i] to vertices[i + 1].
template <typename Node>
[[nodiscard]] ShortestPath<Node> get_shortest_path(const Graph<Node>& g, const Node& from, const Node& to,
                                                   NeiMode mode) {
  const auto u = g.id_of(from);
  const auto v = g.id_of(to);
  if (!u || !v) {
    throw NodeNotFound("get_shortest_path");
  }
  const auto path = g.backend().get_shortest_path(g.engine(), *u, *v, mode);
  ShortestPath<Node> out;
  out.vertices = g.to_nodes(path.vertices);
  out.edges.reserve(path.edges.size());
  for (std::size_t i = 0; i < path.edges.size(); ++i) {
    const auto e = path.edges[i];
    auto [s, d] = g.backend().edge(g.engine(), e);
    if (!g.is_directed() && s != path.vertices[i]) std::swap(s, d);
    out.edges.push_back(Edge<Node>{g.node_of(s), g.node_of(d), e, g.directedness()});
  }
  return out;
}

// Hop distances between every selected source and every selected target.
// The table's keys are exactly selected_vertices(from) x selected_vertices(to).
template <typename Node>
[[nodiscard]] DistanceTable<Node> shortest_paths(const Graph<Node>& g,
                                                 const VertexSelector<Node>& from,
                                                 const VertexSelector<Node>& to,
                                                 NeiMode mode) {
  const auto rf = resolve(from, g);
  const auto rt = resolve(to, g);
  auto& be = g.backend();
  const auto matrix = be.shortest_distances(g.engine(), rf, rt, mode);
  const auto rows = be.selector_vertices(g.engine(), rf);
  const auto cols = be.selector_vertices(g.engine(), rt);
  if (rows.size() != static_cast<std::size_t>(matrix.rows) ||
      cols.size() != static_cast<std::size_t>(matrix.cols)) {
    throw InvariantError("shortest_paths: distance matrix shape differs from selectors");
  }

  DistanceTable<Node> out;
  for (std::int32_t r = 0; r < matrix.rows; ++r) {
    auto& row = out[g.node_of(rows[static_cast<std::size_t>(r)])];
    for (std::int32_t c = 0; c < matrix.cols; ++c) {
      const double d = matrix.at(r, c);
      std::optional<Distance> cell;
      if (d != kInfDistance) cell = static_cast<Distance>(d);
      row.insert_or_assign(g.node_of(cols[static_cast<std::size_t>(c)]), cell);
    }
  }
  return out;
}

// Nodes reachable from `node` under mode (including itself); empty if absent.
template <typename Node>
[[nodiscard]] std::vector<Node> subcomponent(const Graph<Node>& g, const Node& node, NeiMode mode = NeiMode::All) {
  const auto id = g.id_of(node);
  if (!id) return {};
  return g.to_nodes(g.backend().subcomponent(g.engine(), *id, mode));
}

// Induced subgraph over the selected vertices as a new, independently owned
// Graph. Its ids are the engine's numbering of the new graph, and its
// identity map is built from that numbering.
template <typename Node>
[[nodiscard]] Graph<Node> subgraph(const Graph<Node>& g, const VertexSelector<Node>& sel) {
  auto [engine, parent_ids] = g.backend().induced_subgraph(g.engine(), resolve(sel, g));
  auto ids = IdentityMap<Node>::from_nodes(g.to_nodes(parent_ids));
  KEYGRAPH_LOG_GRAPH("subgraph nodes=" << ids.size() << " of " << g.number_of_nodes());
  return Graph<Node>::from_engine(g.directedness(), g.backend_ptr(), std::move(engine), std::move(ids));
}

template <typename Node>
[[nodiscard]] bool is_connected(const Graph<Node>& g, Connectedness mode = Connectedness::Weak) {
  return g.backend().is_connected(g.engine(), mode);
}

} // namespace keygraph::core
