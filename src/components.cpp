/*
  Components: reachability queries and induced subgraph extraction.
*/
#include "keygraph/core/components.hpp"

#include <algorithm>
#include <deque>
#include <utility>

#include "keygraph/core/error.hpp"
#include "keygraph/core/logging.hpp"

namespace keygraph::core {

namespace {
// Marks every vertex reachable from src; returns the visit order.
std::vector<VertexId> reach(const EngineGraph& g, VertexId src, NeiMode mode) {
  std::vector<char> seen(static_cast<std::size_t>(g.num_vertices()), 0);
  std::vector<VertexId> order{src};
  seen[static_cast<std::size_t>(src)] = 1;
  std::deque<VertexId> queue{src};
  while (!queue.empty()) {
    auto u = queue.front(); queue.pop_front();
    g.for_each_incident(u, mode, [&](EdgeId, VertexId v) {
      auto vi = static_cast<std::size_t>(v);
      if (!seen[vi]) {
        seen[vi] = 1;
        order.push_back(v);
        queue.push_back(v);
      }
    });
  }
  return order;
}
} // namespace

bool are_connected(const EngineGraph& g, VertexId u, VertexId v) {
  if (!g.valid_vertex(u) || !g.valid_vertex(v)) {
    throw_engine_error("are_connected", ErrorCode::InvalidVertex);
  }
  return g.find_edge(u, v).has_value();
}

std::vector<VertexId> subcomponent(const EngineGraph& g, VertexId v, NeiMode mode) {
  if (!g.valid_vertex(v)) {
    throw_engine_error("subcomponent", ErrorCode::InvalidVertex);
  }
  if (mode != NeiMode::Out && mode != NeiMode::In && mode != NeiMode::All) {
    throw_engine_error("subcomponent", ErrorCode::InvalidMode);
  }
  return reach(g, v, mode);
}

bool is_connected(const EngineGraph& g, Connectedness mode) {
  if (mode != Connectedness::Weak && mode != Connectedness::Strong) {
    throw_engine_error("is_connected", ErrorCode::InvalidMode);
  }
  const auto n = static_cast<std::size_t>(g.num_vertices());
  if (n == 0) return false;
  if (!g.directed() || mode == Connectedness::Weak) {
    return reach(g, 0, NeiMode::All).size() == n;
  }
  return reach(g, 0, NeiMode::Out).size() == n && reach(g, 0, NeiMode::In).size() == n;
}

InducedSubgraph induced_subgraph(const EngineGraph& g, const ResolvedSelector& sel) {
  auto keep = selector_vertices(g, sel);
  std::sort(keep.begin(), keep.end());
  keep.erase(std::unique(keep.begin(), keep.end()), keep.end());

  std::vector<VertexId> new_id(static_cast<std::size_t>(g.num_vertices()), -1);
  for (std::size_t i = 0; i < keep.size(); ++i) {
    new_id[static_cast<std::size_t>(keep[i])] = static_cast<VertexId>(i);
  }
  const auto src = g.edge_src_view();
  const auto dst = g.edge_dst_view();
  std::vector<VertexId> sub_src, sub_dst;
  for (std::size_t e = 0; e < src.size(); ++e) {
    auto s = new_id[static_cast<std::size_t>(src[e])];
    auto d = new_id[static_cast<std::size_t>(dst[e])];
    if (s < 0 || d < 0) continue;
    sub_src.push_back(s);
    sub_dst.push_back(d);
  }
  KEYGRAPH_LOG_ENGINE("induced_subgraph vertices=" << keep.size() << " edges=" << sub_src.size());
  auto sub = EngineGraph::from_edges(g.directed(), static_cast<std::int32_t>(keep.size()), sub_src, sub_dst);
  return InducedSubgraph{std::move(sub), std::move(keep)};
}

} // namespace keygraph::core
