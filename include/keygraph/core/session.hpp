/* Session<Node>: threads one Graph through a sequence of operations. */
#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "keygraph/core/algorithms.hpp"
#include "keygraph/core/graph.hpp"
#include "keygraph/core/types.hpp"
#include "keygraph/core/vertex_selector.hpp"

namespace keygraph::core {

// A Session takes ownership of a Graph, lets a chain of queries and
// mutations run against it, and hands the (possibly modified) graph back
// with release(). It is the only owner of the graph while it runs; do not
// share a Session between threads.
template <typename Node>
class Session {
public:
  explicit Session(Graph<Node> g) : graph_(std::move(g)) {}

  [[nodiscard]] Graph<Node>& graph() noexcept { return graph_; }
  [[nodiscard]] const Graph<Node>& graph() const noexcept { return graph_; }
  [[nodiscard]] Graph<Node> release() && { return std::move(graph_); }

  // Construction and mutation
  VertexId insert_node(const Node& n) { return graph_.insert_node(n); }
  EdgeId insert_edge(const Node& a, const Node& b) { return graph_.insert_edge(a, b); }
  bool delete_edge(const Node& a, const Node& b) { return graph_.delete_edge(a, b); }
  bool delete_node(const Node& n) { return graph_.delete_node(n); }

  // Queries
  [[nodiscard]] std::int32_t number_of_nodes() const noexcept { return graph_.number_of_nodes(); }
  [[nodiscard]] std::int32_t number_of_edges() const { return graph_.number_of_edges(); }
  [[nodiscard]] bool member(const Node& n) const { return graph_.member(n); }
  [[nodiscard]] std::vector<Node> nodes() const { return graph_.nodes(); }
  [[nodiscard]] std::vector<Edge<Node>> edges() const { return graph_.edges(); }
  [[nodiscard]] std::vector<Node> neighbours(const Node& n, NeiMode mode = NeiMode::All) const {
    return graph_.neighbours(n, mode);
  }

  // Selectors
  [[nodiscard]] std::int32_t selector_size(const VertexSelector<Node>& sel) const {
    return keygraph::core::selector_size(sel, graph_);
  }
  [[nodiscard]] std::vector<Node> selected_vertices(const VertexSelector<Node>& sel) const {
    return keygraph::core::selected_vertices(sel, graph_);
  }

  // Algorithms
  [[nodiscard]] bool are_connected(const Node& a, const Node& b) const {
    return keygraph::core::are_connected(graph_, a, b);
  }
  [[nodiscard]] ShortestPath<Node> get_shortest_path(const Node& from, const Node& to,
                                                     NeiMode mode) const {
    return keygraph::core::get_shortest_path(graph_, from, to, mode);
  }
  [[nodiscard]] DistanceTable<Node> shortest_paths(const VertexSelector<Node>& from,
                                                   const VertexSelector<Node>& to,
                                                   NeiMode mode) const {
    return keygraph::core::shortest_paths(graph_, from, to, mode);
  }
  [[nodiscard]] std::vector<Node> subcomponent(const Node& n, NeiMode mode = NeiMode::All) const {
    return keygraph::core::subcomponent(graph_, n, mode);
  }
  [[nodiscard]] Graph<Node> subgraph(const VertexSelector<Node>& sel) const {
    return keygraph::core::subgraph(graph_, sel);
  }
  [[nodiscard]] bool is_connected(Connectedness mode = Connectedness::Weak) const {
    return keygraph::core::is_connected(graph_, mode);
  }

  // Runs fn in a nested session over `other` and returns fn's result. This
  // session's graph is not touched; `other` is dropped afterwards.
  template <typename Fn>
  auto local_graph(Graph<Node> other, Fn&& fn) {
    Session<Node> inner(std::move(other));
    return std::forward<Fn>(fn)(inner);
  }

private:
  Graph<Node> graph_;
};

// Runs fn(Session&) over g and returns fn's result together with the final
// graph.
template <typename Node, typename Fn>
[[nodiscard]] auto run_session(Graph<Node> g, Fn&& fn) {
  Session<Node> s(std::move(g));
  auto result = std::forward<Fn>(fn)(s);
  return std::make_pair(std::move(result), std::move(s).release());
}

// Like run_session, keeping only the result.
template <typename Node, typename Fn>
[[nodiscard]] auto eval_session(Graph<Node> g, Fn&& fn) {
  Session<Node> s(std::move(g));
  return std::forward<Fn>(fn)(s);
}

// Like run_session, keeping only the graph. fn may return void.
template <typename Node, typename Fn>
[[nodiscard]] Graph<Node> exec_session(Graph<Node> g, Fn&& fn) {
  Session<Node> s(std::move(g));
  if constexpr (std::is_void_v<std::invoke_result_t<Fn&&, Session<Node>&>>) {
    std::forward<Fn>(fn)(s);
  } else {
    (void)std::forward<Fn>(fn)(s);
  }
  return std::move(s).release();
}

} // namespace keygraph::core
