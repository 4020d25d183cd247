/*
  CPU Backend: thin adapter that delegates to the in-process engine.
*/
#include "keygraph/core/backend.hpp"

#include "keygraph/core/components.hpp"
#include "keygraph/core/error.hpp"
#include "keygraph/core/shortest_paths.hpp"

namespace keygraph::core {

namespace {
// A moved-from or default handle has no graph; every call rejects it.
EngineGraph& deref(EngineHandle& h, const char* op) {
  if (!h.graph) throw_engine_error(op, ErrorCode::InvalidArgument);
  return *h.graph;
}

const EngineGraph& deref(const EngineHandle& h, const char* op) {
  if (!h.graph) throw_engine_error(op, ErrorCode::InvalidArgument);
  return *h.graph;
}

class CpuBackend final : public Backend {
public:
  EngineHandle create_graph(Directedness directedness, std::int32_t num_vertices) override {
    return EngineHandle{ std::make_unique<EngineGraph>(directedness == Directedness::Directed, num_vertices) };
  }

  EngineHandle copy_graph(const EngineHandle& h) override {
    return EngineHandle{ std::make_unique<EngineGraph>(deref(h, "copy_graph")) };
  }

  bool is_directed(const EngineHandle& h) override { return deref(h, "is_directed").directed(); }
  std::int32_t num_vertices(const EngineHandle& h) override { return deref(h, "num_vertices").num_vertices(); }
  std::int32_t num_edges(const EngineHandle& h) override { return deref(h, "num_edges").num_edges(); }

  void add_vertices(EngineHandle& h, std::int32_t count) override {
    deref(h, "add_vertices").add_vertices(count);
  }

  void delete_vertex(EngineHandle& h, VertexId v) override {
    deref(h, "delete_vertex").delete_vertex(v);
  }

  EdgeId add_edge(EngineHandle& h, VertexId u, VertexId v) override {
    return deref(h, "add_edge").add_edge(u, v);
  }

  void delete_edge(EngineHandle& h, EdgeId e) override {
    deref(h, "delete_edge").delete_edge(e);
  }

  std::optional<EdgeId> find_edge(const EngineHandle& h, VertexId u, VertexId v) override {
    return deref(h, "find_edge").find_edge(u, v);
  }

  std::pair<VertexId, VertexId> edge(const EngineHandle& h, EdgeId e) override {
    return deref(h, "edge").edge(e);
  }

  std::vector<VertexId> neighbors(const EngineHandle& h, VertexId v, NeiMode mode) override {
    return deref(h, "neighbors").neighbors(v, mode);
  }

  std::int32_t selector_size(const EngineHandle& h, const ResolvedSelector& sel) override {
    return keygraph::core::selector_size(deref(h, "selector_size"), sel);
  }

  std::vector<VertexId> selector_vertices(const EngineHandle& h, const ResolvedSelector& sel) override {
    return keygraph::core::selector_vertices(deref(h, "selector_vertices"), sel);
  }

  bool are_connected(const EngineHandle& h, VertexId u, VertexId v) override {
    return keygraph::core::are_connected(deref(h, "are_connected"), u, v);
  }

  PathResult get_shortest_path(const EngineHandle& h, VertexId from, VertexId to, NeiMode mode) override {
    return keygraph::core::get_shortest_path(deref(h, "get_shortest_path"), from, to, mode);
  }

  DistanceMatrix shortest_distances(const EngineHandle& h, const ResolvedSelector& from,
                                    const ResolvedSelector& to, NeiMode mode) override {
    return keygraph::core::shortest_distances(deref(h, "shortest_distances"), from, to, mode);
  }

  std::vector<VertexId> subcomponent(const EngineHandle& h, VertexId v, NeiMode mode) override {
    return keygraph::core::subcomponent(deref(h, "subcomponent"), v, mode);
  }

  std::pair<EngineHandle, std::vector<VertexId>> induced_subgraph(
      const EngineHandle& h, const ResolvedSelector& sel) override {
    auto sub = keygraph::core::induced_subgraph(deref(h, "induced_subgraph"), sel);
    return { EngineHandle{ std::make_unique<EngineGraph>(std::move(sub.graph)) }, std::move(sub.parent_ids) };
  }

  bool is_connected(const EngineHandle& h, Connectedness mode) override {
    return keygraph::core::is_connected(deref(h, "is_connected"), mode);
  }
};
} // namespace

BackendPtr make_cpu_backend() {
  return std::make_shared<CpuBackend>();
}

} // namespace keygraph::core
