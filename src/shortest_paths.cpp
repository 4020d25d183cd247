/*
  shortest_paths: breadth-first search over an EngineGraph.

  Features:
    - Direction mode selects outgoing, incoming or both adjacency lists on
      directed graphs; undirected graphs always use both.
    - Single-pair search stops as soon as the target is dequeued and rebuilds
      the path from a predecessor-edge array.
    - Many-to-many distances run one search per distinct source vertex.
*/
#include "keygraph/core/shortest_paths.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <utility>

#include "keygraph/core/constants.hpp"
#include "keygraph/core/error.hpp"

namespace keygraph::core {

namespace {
void check_mode(NeiMode mode, const char* op) {
  if (mode != NeiMode::Out && mode != NeiMode::In && mode != NeiMode::All) {
    throw_engine_error(op, ErrorCode::InvalidMode);
  }
}
} // namespace

std::vector<double> bfs_distances(const EngineGraph& g, VertexId src, NeiMode mode) {
  if (!g.valid_vertex(src)) {
    throw_engine_error("bfs_distances", ErrorCode::InvalidVertex);
  }
  check_mode(mode, "bfs_distances");
  std::vector<double> dist(static_cast<std::size_t>(g.num_vertices()), kInfDistance);
  dist[static_cast<std::size_t>(src)] = 0.0;
  std::deque<VertexId> queue{src};
  while (!queue.empty()) {
    auto u = queue.front(); queue.pop_front();
    const double next = dist[static_cast<std::size_t>(u)] + 1.0;
    g.for_each_incident(u, mode, [&](EdgeId, VertexId v) {
      auto vi = static_cast<std::size_t>(v);
      if (dist[vi] == kInfDistance) {
        dist[vi] = next;
        queue.push_back(v);
      }
    });
  }
  return dist;
}

PathResult get_shortest_path(const EngineGraph& g, VertexId from, VertexId to, NeiMode mode) {
  if (!g.valid_vertex(from) || !g.valid_vertex(to)) {
    throw_engine_error("get_shortest_path", ErrorCode::InvalidVertex);
  }
  check_mode(mode, "get_shortest_path");
  const auto n = static_cast<std::size_t>(g.num_vertices());
  // pred_edge[v] == -1: not reached; -2: the source itself
  std::vector<EdgeId> pred_edge(n, -1);
  std::vector<VertexId> pred_vertex(n, -1);
  pred_edge[static_cast<std::size_t>(from)] = -2;
  std::deque<VertexId> queue{from};
  while (!queue.empty()) {
    auto u = queue.front(); queue.pop_front();
    if (u == to) break;
    g.for_each_incident(u, mode, [&](EdgeId e, VertexId v) {
      auto vi = static_cast<std::size_t>(v);
      if (pred_edge[vi] == -1) {
        pred_edge[vi] = e;
        pred_vertex[vi] = u;
        queue.push_back(v);
      }
    });
  }

  PathResult out;
  if (pred_edge[static_cast<std::size_t>(to)] == -1) {
    return out;
  }
  for (VertexId v = to; v != from; v = pred_vertex[static_cast<std::size_t>(v)]) {
    out.vertices.push_back(v);
    out.edges.push_back(pred_edge[static_cast<std::size_t>(v)]);
  }
  out.vertices.push_back(from);
  std::reverse(out.vertices.begin(), out.vertices.end());
  std::reverse(out.edges.begin(), out.edges.end());
  return out;
}

DistanceMatrix shortest_distances(const EngineGraph& g,
                                  const ResolvedSelector& from,
                                  const ResolvedSelector& to,
                                  NeiMode mode) {
  check_mode(mode, "shortest_distances");
  const auto sources = selector_vertices(g, from);
  const auto targets = selector_vertices(g, to);

  DistanceMatrix out;
  out.rows = static_cast<std::int32_t>(sources.size());
  out.cols = static_cast<std::int32_t>(targets.size());
  out.values.reserve(sources.size() * targets.size());

  std::unordered_map<VertexId, std::vector<double>> cache;
  for (auto s : sources) {
    auto it = cache.find(s);
    if (it == cache.end()) {
      it = cache.emplace(s, bfs_distances(g, s, mode)).first;
    }
    const auto& dist = it->second;
    for (auto t : targets) {
      out.values.push_back(dist[static_cast<std::size_t>(t)]);
    }
  }
  return out;
}

} // namespace keygraph::core
