/*
  Backend interface: the capability boundary to the graph engine.

  Everything above this interface speaks engine ids only through it, so an
  alternative engine (a native library binding, an instrumented test double)
  can be dropped in without touching the keyed layer. The default CPU backend
  delegates to the in-process EngineGraph implementation.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "keygraph/core/components.hpp"
#include "keygraph/core/engine_graph.hpp"
#include "keygraph/core/resolved_selector.hpp"
#include "keygraph/core/shortest_paths.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

// EngineHandle: exclusively owned engine-side graph. Released exactly once
// when the handle is destroyed; moving transfers ownership.
struct EngineHandle {
  std::unique_ptr<EngineGraph> graph {};
};

class Backend {
public:
  virtual ~Backend() noexcept = default;

  [[nodiscard]] virtual EngineHandle create_graph(Directedness directedness, std::int32_t num_vertices) = 0;
  // Deep copy; the result shares no state with h.
  [[nodiscard]] virtual EngineHandle copy_graph(const EngineHandle& h) = 0;

  [[nodiscard]] virtual bool is_directed(const EngineHandle& h) = 0;
  [[nodiscard]] virtual std::int32_t num_vertices(const EngineHandle& h) = 0;
  [[nodiscard]] virtual std::int32_t num_edges(const EngineHandle& h) = 0;

  virtual void add_vertices(EngineHandle& h, std::int32_t count) = 0;
  virtual void delete_vertex(EngineHandle& h, VertexId v) = 0;
  [[nodiscard]] virtual EdgeId add_edge(EngineHandle& h, VertexId u, VertexId v) = 0;
  virtual void delete_edge(EngineHandle& h, EdgeId e) = 0;

  [[nodiscard]] virtual std::optional<EdgeId> find_edge(const EngineHandle& h, VertexId u, VertexId v) = 0;
  [[nodiscard]] virtual std::pair<VertexId, VertexId> edge(const EngineHandle& h, EdgeId e) = 0;
  [[nodiscard]] virtual std::vector<VertexId> neighbors(const EngineHandle& h, VertexId v, NeiMode mode) = 0;

  [[nodiscard]] virtual std::int32_t selector_size(const EngineHandle& h, const ResolvedSelector& sel) = 0;
  [[nodiscard]] virtual std::vector<VertexId> selector_vertices(const EngineHandle& h, const ResolvedSelector& sel) = 0;

  [[nodiscard]] virtual bool are_connected(const EngineHandle& h, VertexId u, VertexId v) = 0;
  [[nodiscard]] virtual PathResult get_shortest_path(
      const EngineHandle& h, VertexId from, VertexId to, NeiMode mode) = 0;
  [[nodiscard]] virtual DistanceMatrix shortest_distances(
      const EngineHandle& h, const ResolvedSelector& from, const ResolvedSelector& to, NeiMode mode) = 0;
  [[nodiscard]] virtual std::vector<VertexId> subcomponent(const EngineHandle& h, VertexId v, NeiMode mode) = 0;
  // New, independently owned graph plus the parent id of each new vertex.
  [[nodiscard]] virtual std::pair<EngineHandle, std::vector<VertexId>> induced_subgraph(
      const EngineHandle& h, const ResolvedSelector& sel) = 0;
  [[nodiscard]] virtual bool is_connected(const EngineHandle& h, Connectedness mode) = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

[[nodiscard]] BackendPtr make_cpu_backend();

} // namespace keygraph::core
