/* Graph<Node>: engine graph plus identity map, keyed by user node values. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "keygraph/core/backend.hpp"
#include "keygraph/core/error.hpp"
#include "keygraph/core/identity_map.hpp"
#include "keygraph/core/logging.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

// An edge between two node values. `id` is the engine edge id at the time
// the edge was read; it is not stable across deletions. Edges read from an
// undirected graph carry Directedness::Undirected, and their orientation is
// the one they were inserted or traversed with.
template <typename Node>
struct Edge {
  Node from;
  Node to;
  std::optional<EdgeId> id {};
  Directedness directedness {Directedness::Directed};

  // Structural equality on the endpoints; the id is ignored. The endpoint
  // pair is unordered when either side is undirected.
  friend bool operator==(const Edge& a, const Edge& b) {
    if (a.from == b.from && a.to == b.to) return true;
    const bool unordered = a.directedness == Directedness::Undirected ||
                           b.directedness == Directedness::Undirected;
    return unordered && a.from == b.to && a.to == b.from;
  }
};

struct GraphOptions {
  Directedness directedness {Directedness::Undirected};
  BackendPtr backend {};  // null selects the CPU backend
};

// Graph owns one engine graph and the identity map that names its vertices.
// After every public operation the map's ids are exactly
// [0, number_of_nodes()) and match the engine's vertex set one to one.
//
// Copying deep-copies the engine graph; two Graph values never share engine
// state. Not safe for concurrent use.
template <typename Node>
class Graph {
public:
  using node_type = Node;
  using edge_type = Edge<Node>;

  explicit Graph(GraphOptions opts = {})
      : directedness_(opts.directedness),
        backend_(opts.backend ? std::move(opts.backend) : make_cpu_backend()),
        engine_(backend_->create_graph(directedness_, 0)) {}

  [[nodiscard]] static Graph empty(Directedness directedness, BackendPtr backend = {}) {
    return Graph(GraphOptions{directedness, std::move(backend)});
  }

  // Inserts the edges in order, adding endpoints the first time they appear.
  [[nodiscard]] static Graph from_list(Directedness directedness,
                                       const std::vector<std::pair<Node, Node>>& edges,
                                       BackendPtr backend = {}) {
    return from_list(directedness, {}, edges, std::move(backend));
  }

  // As above; `nodes` are inserted first, so isolated vertices can be given.
  [[nodiscard]] static Graph from_list(Directedness directedness,
                                       const std::vector<Node>& nodes,
                                       const std::vector<std::pair<Node, Node>>& edges,
                                       BackendPtr backend = {}) {
    Graph g(GraphOptions{directedness, std::move(backend)});
    for (const auto& n : nodes) (void)g.insert_node(n);
    for (const auto& [a, b] : edges) (void)g.insert_edge(a, b);
    return g;
  }

  // Adopts an engine graph whose vertex i is named ids.node_of(i). Used for
  // graphs produced by the engine (subgraph extraction).
  [[nodiscard]] static Graph from_engine(Directedness directedness, BackendPtr backend,
                                         EngineHandle engine, IdentityMap<Node> ids) {
    Graph g(directedness, std::move(backend), std::move(engine), std::move(ids));
    g.check_invariant("Graph::from_engine");
    return g;
  }

  Graph(const Graph& other)
      : directedness_(other.directedness_),
        backend_(other.backend_),
        engine_(other.backend_->copy_graph(other.engine_)),
        ids_(other.ids_) {}

  Graph& operator=(const Graph& other) {
    if (this != &other) {
      Graph tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  Graph(Graph&&) noexcept = default;
  Graph& operator=(Graph&&) noexcept = default;
  ~Graph() = default;

  [[nodiscard]] Directedness directedness() const noexcept { return directedness_; }
  [[nodiscard]] bool is_directed() const noexcept { return directedness_ == Directedness::Directed; }

  // Returns the node's id, adding it as an isolated vertex if absent.
  VertexId insert_node(const Node& node) {
    if (auto id = ids_.id_of(node)) return *id;
    backend_->add_vertices(engine_, 1);
    return ids_.insert(node);
  }

  // Adds an edge, inserting missing endpoints first. If the endpoints are
  // already joined (in either orientation when undirected) the existing edge
  // id is returned and nothing changes.
  EdgeId insert_edge(const Node& from, const Node& to) {
    const auto u = insert_node(from);
    const auto v = insert_node(to);
    if (auto e = backend_->find_edge(engine_, u, v)) return *e;
    return backend_->add_edge(engine_, u, v);
  }

  // Removes the edge between the two nodes. Returns false (and changes
  // nothing) if either node or the edge is absent.
  bool delete_edge(const Node& from, const Node& to) {
    const auto u = ids_.id_of(from);
    const auto v = ids_.id_of(to);
    if (!u || !v) return false;
    const auto e = backend_->find_edge(engine_, *u, *v);
    if (!e) return false;
    backend_->delete_edge(engine_, *e);
    return true;
  }

  // Removes the node and its incident edges; greater ids shift down by one.
  // Returns false if the node is absent.
  bool delete_node(const Node& node) {
    const auto id = ids_.id_of(node);
    if (!id) return false;
    backend_->delete_vertex(engine_, *id);
    ids_.remove(node);
    KEYGRAPH_LOG_GRAPH("delete_node id=" << *id << " renumbered=" << (ids_.size() - *id));
    check_invariant("Graph::delete_node");
    return true;
  }

  [[nodiscard]] std::int32_t number_of_nodes() const noexcept { return ids_.size(); }
  [[nodiscard]] std::int32_t number_of_edges() const { return backend_->num_edges(engine_); }
  [[nodiscard]] bool member(const Node& node) const { return ids_.contains(node); }

  // Nodes in ascending id order.
  [[nodiscard]] std::vector<Node> nodes() const { return ids_.nodes(); }

  // Edges in engine id order, each carrying its current id.
  [[nodiscard]] std::vector<Edge<Node>> edges() const {
    std::vector<Edge<Node>> out;
    const auto m = backend_->num_edges(engine_);
    out.reserve(static_cast<std::size_t>(m));
    for (EdgeId e = 0; e < m; ++e) {
      auto [u, v] = backend_->edge(engine_, e);
      out.push_back(Edge<Node>{ids_.node_of(u), ids_.node_of(v), e, directedness_});
    }
    return out;
  }

  [[nodiscard]] std::optional<EdgeId> edge_id(const Node& from, const Node& to) const {
    const auto u = ids_.id_of(from);
    const auto v = ids_.id_of(to);
    if (!u || !v) return std::nullopt;
    return backend_->find_edge(engine_, *u, *v);
  }

  // Distinct neighbours under mode; empty if the node is absent.
  [[nodiscard]] std::vector<Node> neighbours(const Node& node, NeiMode mode = NeiMode::All) const {
    const auto id = ids_.id_of(node);
    if (!id) return {};
    return to_nodes(backend_->neighbors(engine_, *id, mode));
  }

  [[nodiscard]] std::optional<VertexId> id_of(const Node& node) const { return ids_.id_of(node); }
  [[nodiscard]] const Node& node_of(VertexId id) const { return ids_.node_of(id); }
  [[nodiscard]] std::vector<Node> to_nodes(const std::vector<VertexId>& ids) const {
    std::vector<Node> out;
    out.reserve(ids.size());
    for (auto id : ids) out.push_back(ids_.node_of(id));
    return out;
  }

  [[nodiscard]] const IdentityMap<Node>& identity() const noexcept { return ids_; }
  [[nodiscard]] Backend& backend() const noexcept { return *backend_; }
  [[nodiscard]] const BackendPtr& backend_ptr() const noexcept { return backend_; }
  [[nodiscard]] const EngineHandle& engine() const noexcept { return engine_; }

private:
  Graph(Directedness directedness, BackendPtr backend, EngineHandle engine, IdentityMap<Node> ids)
      : directedness_(directedness),
        backend_(backend ? std::move(backend) : make_cpu_backend()),
        engine_(std::move(engine)),
        ids_(std::move(ids)) {}

  void check_invariant(const char* op) const {
    if (backend_->num_vertices(engine_) != ids_.size()) {
      throw InvariantError(std::string(op) + ": identity map and engine vertex count differ");
    }
    if (backend_->is_directed(engine_) != is_directed()) {
      throw InvariantError(std::string(op) + ": engine directedness differs from graph");
    }
  }

  Directedness directedness_;
  BackendPtr backend_;
  EngineHandle engine_;
  IdentityMap<Node> ids_ {};
};

} // namespace keygraph::core
