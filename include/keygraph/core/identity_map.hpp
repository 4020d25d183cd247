/* Bidirectional map between user node values and dense engine vertex ids. */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "keygraph/core/error.hpp"
#include "keygraph/core/types.hpp"

namespace keygraph::core {

// IdentityMap keeps a bijection between node values and ids in [0, size()).
// Node values are compared with std::less<Node>; two values that are
// equivalent under it are the same node.
//
// Ids follow the engine's numbering: insert() hands out the next id, and
// remove() shifts every greater id down by one, mirroring a vertex deletion
// in the engine. Callers apply both in the same operation so the map never
// shows a gap.
template <typename Node>
class IdentityMap {
public:
  IdentityMap() = default;

  // Builds a map where nodes[i] has id i. Throws ValueError on duplicates.
  [[nodiscard]] static IdentityMap from_nodes(std::vector<Node> nodes) {
    IdentityMap m;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      auto [it, inserted] = m.ids_.emplace(nodes[i], static_cast<VertexId>(i));
      if (!inserted) {
        throw ValueError("IdentityMap::from_nodes: duplicate node");
      }
    }
    m.nodes_ = std::move(nodes);
    return m;
  }

  [[nodiscard]] std::int32_t size() const noexcept { return static_cast<std::int32_t>(nodes_.size()); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
  [[nodiscard]] bool contains(const Node& node) const { return ids_.find(node) != ids_.end(); }

  // Current id of node, or std::nullopt when absent.
  [[nodiscard]] std::optional<VertexId> id_of(const Node& node) const {
    auto it = ids_.find(node);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
  }

  // Inverse lookup. Ids only ever come from the engine, so an id outside
  // [0, size()) is a defect and raises InvariantError.
  [[nodiscard]] const Node& node_of(VertexId id) const {
    if (id < 0 || id >= size()) {
      throw InvariantError("IdentityMap::node_of: id " + std::to_string(id) +
                           " outside [0, " + std::to_string(size()) + ")");
    }
    return nodes_[static_cast<std::size_t>(id)];
  }

  // Assigns the next free id. Throws ValueError if node is already mapped.
  VertexId insert(const Node& node) {
    const auto id = size();
    auto [it, inserted] = ids_.emplace(node, id);
    if (!inserted) {
      throw ValueError("IdentityMap::insert: node already present");
    }
    nodes_.push_back(node);
    return id;
  }

  // Removes node and renumbers every node with a greater id. Returns the id
  // the node had. Throws ValueError if node is absent.
  VertexId remove(const Node& node) {
    auto it = ids_.find(node);
    if (it == ids_.end()) {
      throw ValueError("IdentityMap::remove: node not present");
    }
    const VertexId removed = it->second;
    ids_.erase(it);
    nodes_.erase(nodes_.begin() + removed);
    for (auto i = static_cast<std::size_t>(removed); i < nodes_.size(); ++i) {
      ids_.find(nodes_[i])->second = static_cast<VertexId>(i);
    }
    return removed;
  }

  // Nodes in ascending id order.
  [[nodiscard]] const std::vector<Node>& nodes() const noexcept { return nodes_; }

private:
  std::map<Node, VertexId> ids_ {};
  std::vector<Node> nodes_ {};
};

} // namespace keygraph::core
