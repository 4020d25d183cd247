/* Mutable multigraph with dense vertex and edge ids and per-vertex incidence. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "keygraph/core/types.hpp"

namespace keygraph::core {

// Notes on identifiers:
// - Vertex ids are always exactly [0, num_vertices()). Deleting a vertex
//   shifts every greater id down by one.
// - Edge ids are the position of the edge in insertion order and are always
//   exactly [0, num_edges()). Deleting an edge (directly or through a vertex
//   deletion) shifts every greater edge id down.
// - Undirected edges are stored once with the endpoints as given; traversal
//   of an undirected graph always looks at both adjacency directions.

class EngineGraph {
public:
  EngineGraph(bool directed, std::int32_t num_vertices);
  // Bulk construction; edge i joins src[i] and dst[i] and gets EdgeId i.
  [[nodiscard]] static EngineGraph from_edges(
      bool directed,
      std::int32_t num_vertices,
      std::span<const VertexId> src,
      std::span<const VertexId> dst);

  [[nodiscard]] bool directed() const noexcept { return directed_; }
  [[nodiscard]] std::int32_t num_vertices() const noexcept { return num_vertices_; }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(src_.size()); }

  void add_vertices(std::int32_t count);
  // Removes v and all incident edges; vertex ids above v shift down.
  void delete_vertex(VertexId v);
  [[nodiscard]] EdgeId add_edge(VertexId u, VertexId v);
  void delete_edge(EdgeId e);

  // First (lowest id) edge joining u and v; either orientation when undirected.
  [[nodiscard]] std::optional<EdgeId> find_edge(VertexId u, VertexId v) const;
  [[nodiscard]] std::pair<VertexId, VertexId> edge(EdgeId e) const;
  // Distinct neighbours of v under mode, ascending.
  [[nodiscard]] std::vector<VertexId> neighbors(VertexId v, NeiMode mode) const;

  [[nodiscard]] bool valid_vertex(VertexId v) const noexcept { return v >= 0 && v < num_vertices_; }
  [[nodiscard]] bool valid_edge(EdgeId e) const noexcept { return e >= 0 && e < num_edges(); }

  [[nodiscard]] std::span<const VertexId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const VertexId> edge_dst_view() const noexcept { return dst_; }
  // Ids of edges leaving (entering) v, ascending. Unchecked; v must be valid.
  [[nodiscard]] std::span<const EdgeId> out_edges(VertexId v) const noexcept {
    return out_edges_[static_cast<std::size_t>(v)];
  }
  [[nodiscard]] std::span<const EdgeId> in_edges(VertexId v) const noexcept {
    return in_edges_[static_cast<std::size_t>(v)];
  }

  // Calls fn(edge, other_endpoint) for every edge incident to u under mode.
  // A self-loop may be reported twice for NeiMode::All.
  template <typename Fn>
  void for_each_incident(VertexId u, NeiMode mode, Fn&& fn) const {
    const auto ui = static_cast<std::size_t>(u);
    const bool out = !directed_ || mode == NeiMode::Out || mode == NeiMode::All;
    const bool in  = !directed_ || mode == NeiMode::In  || mode == NeiMode::All;
    if (out) {
      for (auto e : out_edges_[ui]) fn(e, dst_[static_cast<std::size_t>(e)]);
    }
    if (in) {
      for (auto e : in_edges_[ui]) fn(e, src_[static_cast<std::size_t>(e)]);
    }
  }

private:
  void rebuild_index();

  bool directed_ {false};
  std::int32_t num_vertices_ {0};
  std::vector<VertexId> src_ {};
  std::vector<VertexId> dst_ {};

  // Per-vertex incidence, ordered by edge id. Appends keep the order, so
  // only deletions (which shift edge ids) rebuild it.
  std::vector<std::vector<EdgeId>> out_edges_ {};
  std::vector<std::vector<EdgeId>> in_edges_ {};
};

} // namespace keygraph::core
