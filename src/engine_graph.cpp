/*
  EngineGraph: mutable multigraph with dense ids.

  Edges live in two parallel arrays (src_, dst_) indexed by EdgeId, with
  out/in incidence lists per vertex. Adding vertices or edges appends in
  O(1) amortized. Deleting an edge or vertex compacts the edge arrays and
  rebuilds the incidence lists in one O(n + m) pass, so the entries of a
  vertex are always ordered by edge id and all ids stay dense.
*/
#include "keygraph/core/engine_graph.hpp"

#include <algorithm>
#include <limits>

#include "keygraph/core/error.hpp"
#include "keygraph/core/logging.hpp"

namespace keygraph::core {

EngineGraph::EngineGraph(bool directed, std::int32_t num_vertices)
    : directed_(directed) {
  if (num_vertices < 0) {
    throw_engine_error("create_graph", ErrorCode::InvalidArgument);
  }
  num_vertices_ = num_vertices;
  out_edges_.resize(static_cast<std::size_t>(num_vertices));
  in_edges_.resize(static_cast<std::size_t>(num_vertices));
}

EngineGraph EngineGraph::from_edges(
    bool directed,
    std::int32_t num_vertices,
    std::span<const VertexId> src,
    std::span<const VertexId> dst) {
  if (src.size() != dst.size()) {
    throw_engine_error("from_edges", ErrorCode::InvalidArgument);
  }
  EngineGraph g(directed, num_vertices);
  for (std::size_t i = 0; i < src.size(); ++i) {
    if (!g.valid_vertex(src[i]) || !g.valid_vertex(dst[i])) {
      throw_engine_error("from_edges", ErrorCode::InvalidVertex);
    }
  }
  g.src_.assign(src.begin(), src.end());
  g.dst_.assign(dst.begin(), dst.end());
  g.rebuild_index();
  return g;
}

void EngineGraph::add_vertices(std::int32_t count) {
  if (count < 0) {
    throw_engine_error("add_vertices", ErrorCode::InvalidArgument);
  }
  if (count > std::numeric_limits<std::int32_t>::max() - num_vertices_) {
    throw_engine_error("add_vertices", ErrorCode::Overflow);
  }
  num_vertices_ += count;
  out_edges_.resize(static_cast<std::size_t>(num_vertices_));
  in_edges_.resize(static_cast<std::size_t>(num_vertices_));
}

void EngineGraph::delete_vertex(VertexId v) {
  if (!valid_vertex(v)) {
    throw_engine_error("delete_vertex", ErrorCode::InvalidVertex);
  }
  // Keep surviving edges in their original order; shift endpoints above v.
  std::size_t out = 0;
  for (std::size_t e = 0; e < src_.size(); ++e) {
    if (src_[e] == v || dst_[e] == v) continue;
    src_[out] = src_[e] > v ? src_[e] - 1 : src_[e];
    dst_[out] = dst_[e] > v ? dst_[e] - 1 : dst_[e];
    ++out;
  }
  KEYGRAPH_LOG_ENGINE("delete_vertex v=" << v << " dropped_edges=" << (src_.size() - out));
  src_.resize(out);
  dst_.resize(out);
  --num_vertices_;
  rebuild_index();
}

EdgeId EngineGraph::add_edge(VertexId u, VertexId v) {
  if (!valid_vertex(u) || !valid_vertex(v)) {
    throw_engine_error("add_edge", ErrorCode::InvalidVertex);
  }
  if (src_.size() >= static_cast<std::size_t>(std::numeric_limits<EdgeId>::max())) {
    throw_engine_error("add_edge", ErrorCode::Overflow);
  }
  const auto e = static_cast<EdgeId>(src_.size());
  src_.push_back(u);
  dst_.push_back(v);
  out_edges_[static_cast<std::size_t>(u)].push_back(e);
  in_edges_[static_cast<std::size_t>(v)].push_back(e);
  return e;
}

void EngineGraph::delete_edge(EdgeId e) {
  if (!valid_edge(e)) {
    throw_engine_error("delete_edge", ErrorCode::InvalidEdge);
  }
  src_.erase(src_.begin() + e);
  dst_.erase(dst_.begin() + e);
  rebuild_index();
}

std::optional<EdgeId> EngineGraph::find_edge(VertexId u, VertexId v) const {
  if (!valid_vertex(u) || !valid_vertex(v)) {
    throw_engine_error("find_edge", ErrorCode::InvalidVertex);
  }
  // An edge a->b sits in both out_edges_[a] and in_edges_[b]; scan the
  // shorter list. Undirected graphs also check the b->a orientation.
  std::optional<EdgeId> best;
  const auto scan = [&](VertexId a, VertexId b) {
    const auto& out_a = out_edges_[static_cast<std::size_t>(a)];
    const auto& in_b = in_edges_[static_cast<std::size_t>(b)];
    const bool by_out = out_a.size() <= in_b.size();
    for (auto e : by_out ? out_a : in_b) {
      const auto ei = static_cast<std::size_t>(e);
      if (by_out ? dst_[ei] == b : src_[ei] == a) {
        if (!best || e < *best) best = e;
        return;
      }
    }
  };
  scan(u, v);
  if (!directed_) scan(v, u);
  return best;
}

std::pair<VertexId, VertexId> EngineGraph::edge(EdgeId e) const {
  if (!valid_edge(e)) {
    throw_engine_error("edge", ErrorCode::InvalidEdge);
  }
  return {src_[static_cast<std::size_t>(e)], dst_[static_cast<std::size_t>(e)]};
}

std::vector<VertexId> EngineGraph::neighbors(VertexId v, NeiMode mode) const {
  if (!valid_vertex(v)) {
    throw_engine_error("neighbors", ErrorCode::InvalidVertex);
  }
  if (mode != NeiMode::Out && mode != NeiMode::In && mode != NeiMode::All) {
    throw_engine_error("neighbors", ErrorCode::InvalidMode);
  }
  std::vector<VertexId> out;
  for_each_incident(v, mode, [&](EdgeId, VertexId other) { out.push_back(other); });
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

void EngineGraph::rebuild_index() {
  const auto n = static_cast<std::size_t>(num_vertices_);
  out_edges_.assign(n, {});
  in_edges_.assign(n, {});
  for (std::size_t e = 0; e < src_.size(); ++e) {
    out_edges_[static_cast<std::size_t>(src_[e])].push_back(static_cast<EdgeId>(e));
    in_edges_[static_cast<std::size_t>(dst_[e])].push_back(static_cast<EdgeId>(e));
  }
}

} // namespace keygraph::core
