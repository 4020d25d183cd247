/*
  Resolved selector evaluation.

  Size is computed without building the id list for every kind that allows
  it (All, None, Single, Range, Vector); the adjacency-based kinds need the
  neighbour set of their vertex either way.
*/
#include "keygraph/core/resolved_selector.hpp"

#include <numeric>

#include "keygraph/core/error.hpp"

namespace keygraph::core {

namespace {
void check_vertex(const EngineGraph& g, VertexId v, const char* op) {
  if (!g.valid_vertex(v)) {
    throw_engine_error(op, ErrorCode::InvalidVertex);
  }
}

void check_selector(const EngineGraph& g, const ResolvedSelector& sel, const char* op) {
  switch (sel.kind) {
    case SelectorKind::Single:
    case SelectorKind::Adjacent:
    case SelectorKind::Nonadjacent:
      check_vertex(g, sel.vertex, op);
      break;
    case SelectorKind::Vector:
      for (auto v : sel.ids) check_vertex(g, v, op);
      break;
    case SelectorKind::Range:
      if (sel.from <= sel.to) {
        check_vertex(g, sel.from, op);
        check_vertex(g, sel.to, op);
      }
      break;
    case SelectorKind::All:
    case SelectorKind::None:
      break;
  }
}

std::vector<VertexId> nonadjacent_to(const EngineGraph& g, VertexId v, NeiMode mode) {
  std::vector<char> excluded(static_cast<std::size_t>(g.num_vertices()), 0);
  excluded[static_cast<std::size_t>(v)] = 1;
  for (auto u : g.neighbors(v, mode)) excluded[static_cast<std::size_t>(u)] = 1;
  std::vector<VertexId> out;
  for (VertexId u = 0; u < g.num_vertices(); ++u) {
    if (!excluded[static_cast<std::size_t>(u)]) out.push_back(u);
  }
  return out;
}
} // namespace

std::int32_t selector_size(const EngineGraph& g, const ResolvedSelector& sel) {
  check_selector(g, sel, "selector_size");
  switch (sel.kind) {
    case SelectorKind::All:         return g.num_vertices();
    case SelectorKind::None:        return 0;
    case SelectorKind::Single:      return 1;
    case SelectorKind::Vector:      return static_cast<std::int32_t>(sel.ids.size());
    case SelectorKind::Range:       return sel.from <= sel.to ? sel.to - sel.from + 1 : 0;
    case SelectorKind::Adjacent:
      return static_cast<std::int32_t>(g.neighbors(sel.vertex, sel.mode).size());
    case SelectorKind::Nonadjacent:
      return static_cast<std::int32_t>(nonadjacent_to(g, sel.vertex, sel.mode).size());
  }
  return 0;
}

std::vector<VertexId> selector_vertices(const EngineGraph& g, const ResolvedSelector& sel) {
  check_selector(g, sel, "selector_vertices");
  std::vector<VertexId> out;
  switch (sel.kind) {
    case SelectorKind::All:
      out.resize(static_cast<std::size_t>(g.num_vertices()));
      std::iota(out.begin(), out.end(), 0);
      break;
    case SelectorKind::None:
      break;
    case SelectorKind::Single:
      out.push_back(sel.vertex);
      break;
    case SelectorKind::Vector:
      out = sel.ids;
      break;
    case SelectorKind::Range:
      if (sel.from <= sel.to) {
        out.resize(static_cast<std::size_t>(sel.to - sel.from + 1));
        std::iota(out.begin(), out.end(), sel.from);
      }
      break;
    case SelectorKind::Adjacent:
      out = g.neighbors(sel.vertex, sel.mode);
      break;
    case SelectorKind::Nonadjacent:
      out = nonadjacent_to(g, sel.vertex, sel.mode);
      break;
  }
  return out;
}

} // namespace keygraph::core
