/* Vertex selectors over node values and their resolution to engine ids. */
#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "keygraph/core/graph.hpp"
#include "keygraph/core/logging.hpp"
#include "keygraph/core/resolved_selector.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

struct AllVertices {};
struct NoVertices {};

template <typename Node>
struct AdjacentTo {
  Node node;
  NeiMode mode {NeiMode::All};
};

template <typename Node>
struct NonadjacentTo {
  Node node;
  NeiMode mode {NeiMode::All};
};

template <typename Node>
struct SingleVertex {
  Node node;
};

template <typename Node>
struct ExplicitList {
  std::vector<Node> nodes;
};

// Vertices whose ids lie between the ids of `from` and `to`, inclusive.
template <typename Node>
struct ContiguousRange {
  Node from;
  Node to;
};

// Unresolved selector: holds node values until resolved against a graph.
template <typename Node>
using VertexSelector = std::variant<AllVertices,
                                    AdjacentTo<Node>,
                                    NonadjacentTo<Node>,
                                    NoVertices,
                                    SingleVertex<Node>,
                                    ExplicitList<Node>,
                                    ContiguousRange<Node>>;

namespace detail {
template <typename... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;
} // namespace detail

// Resolves sel against g's identity map. A selector that names an absent node
// resolves to the empty selector; for ExplicitList a single absent node
// empties the whole selection rather than dropping just that node.
template <typename Node>
[[nodiscard]] ResolvedSelector resolve(const VertexSelector<Node>& sel, const Graph<Node>& g) {
  return std::visit(detail::overloaded{
      [](const AllVertices&) { return ResolvedSelector::all(); },
      [](const NoVertices&) { return ResolvedSelector::none(); },
      [&g](const SingleVertex<Node>& s) {
        auto id = g.id_of(s.node);
        return id ? ResolvedSelector::single(*id) : ResolvedSelector::none();
      },
      [&g](const AdjacentTo<Node>& s) {
        auto id = g.id_of(s.node);
        return id ? ResolvedSelector::adjacent(*id, s.mode) : ResolvedSelector::none();
      },
      [&g](const NonadjacentTo<Node>& s) {
        auto id = g.id_of(s.node);
        return id ? ResolvedSelector::nonadjacent(*id, s.mode) : ResolvedSelector::none();
      },
      [&g](const ExplicitList<Node>& s) {
        std::vector<VertexId> ids;
        ids.reserve(s.nodes.size());
        for (const auto& n : s.nodes) {
          auto id = g.id_of(n);
          if (!id) {
            KEYGRAPH_LOG_SELECTOR("explicit list has an absent node; selecting nothing");
            return ResolvedSelector::none();
          }
          ids.push_back(*id);
        }
        return ResolvedSelector::vector(std::move(ids));
      },
      [&g](const ContiguousRange<Node>& s) {
        auto from = g.id_of(s.from);
        auto to = g.id_of(s.to);
        return from && to ? ResolvedSelector::range(*from, *to) : ResolvedSelector::none();
      },
  }, sel);
}

// Number of designated vertices, without translating them to node values.
template <typename Node>
[[nodiscard]] std::int32_t selector_size(const VertexSelector<Node>& sel, const Graph<Node>& g) {
  return g.backend().selector_size(g.engine(), resolve(sel, g));
}

// Designated vertices as node values. ContiguousRange (and AllVertices) are
// ascending by id; ExplicitList keeps the caller's order.
template <typename Node>
[[nodiscard]] std::vector<Node> selected_vertices(const VertexSelector<Node>& sel, const Graph<Node>& g) {
  return g.to_nodes(g.backend().selector_vertices(g.engine(), resolve(sel, g)));
}

} // namespace keygraph::core
