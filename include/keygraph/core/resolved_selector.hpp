/* Vertex selectors in engine id space. */
#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "keygraph/core/engine_graph.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

enum class SelectorKind {
  All,
  None,
  Single,
  Adjacent,
  Nonadjacent,
  Vector,
  Range
};

// A selector resolved against one graph's vertex ids. Only the fields that
// belong to `kind` are meaningful:
//   Single, Adjacent, Nonadjacent: vertex (and mode for the latter two)
//   Vector:                        ids (caller order, duplicates kept)
//   Range:                         [from, to], inclusive; empty if from > to
struct ResolvedSelector {
  SelectorKind kind {SelectorKind::None};
  VertexId vertex {-1};
  NeiMode mode {NeiMode::All};
  std::vector<VertexId> ids {};
  VertexId from {0};
  VertexId to {-1};

  [[nodiscard]] static ResolvedSelector all() { return {.kind = SelectorKind::All}; }
  [[nodiscard]] static ResolvedSelector none() { return {.kind = SelectorKind::None}; }
  [[nodiscard]] static ResolvedSelector single(VertexId v) {
    return {.kind = SelectorKind::Single, .vertex = v};
  }
  [[nodiscard]] static ResolvedSelector adjacent(VertexId v, NeiMode mode) {
    return {.kind = SelectorKind::Adjacent, .vertex = v, .mode = mode};
  }
  [[nodiscard]] static ResolvedSelector nonadjacent(VertexId v, NeiMode mode) {
    return {.kind = SelectorKind::Nonadjacent, .vertex = v, .mode = mode};
  }
  [[nodiscard]] static ResolvedSelector vector(std::vector<VertexId> ids) {
    return {.kind = SelectorKind::Vector, .ids = std::move(ids)};
  }
  [[nodiscard]] static ResolvedSelector range(VertexId from, VertexId to) {
    return {.kind = SelectorKind::Range, .from = from, .to = to};
  }
};

// Number of vertices designated by sel. Throws EngineError(InvalidVertex) if
// sel refers to an id outside the graph.
[[nodiscard]] std::int32_t selector_size(const EngineGraph& g, const ResolvedSelector& sel);

// Designated vertex ids. Ascending for every kind except Vector, which keeps
// the order it was built with.
[[nodiscard]] std::vector<VertexId> selector_vertices(const EngineGraph& g, const ResolvedSelector& sel);

} // namespace keygraph::core
