#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "keygraph/core/algorithms.hpp"
#include "keygraph/core/error.hpp"
#include "keygraph/core/graph.hpp"
#include "test_utils.hpp"

using namespace keygraph::core;
using namespace keygraph::core::test;

using Sel = VertexSelector<int>;

TEST(AreConnected, AdjacencyAndAbsence) {
  auto g = make_path_graph(3);
  EXPECT_TRUE(are_connected(g, 1, 2));
  EXPECT_TRUE(are_connected(g, 2, 1));
  EXPECT_FALSE(are_connected(g, 1, 3));
  EXPECT_FALSE(are_connected(g, 1, 99));
  EXPECT_FALSE(are_connected(g, 99, 99));
}

TEST(AreConnected, DirectedIsOneWay) {
  auto g = make_path_graph(2, Directedness::Directed);
  EXPECT_TRUE(are_connected(g, 1, 2));
  EXPECT_FALSE(are_connected(g, 2, 1));
}

TEST(AreConnected, VertexNeedsSelfLoopToBeConnectedToItself) {
  auto g = Graph<int>::empty(Directedness::Undirected);
  (void)g.insert_node(5);
  EXPECT_FALSE(are_connected(g, 5, 5));
  (void)g.insert_edge(5, 5);
  EXPECT_TRUE(are_connected(g, 5, 5));
}

TEST(GetShortestPath, PathGraph) {
  auto g = Graph<int>::empty(Directedness::Undirected);
  (void)g.insert_edge(1, 2);
  (void)g.insert_edge(2, 3);
  (void)g.insert_edge(3, 4);
  auto p = get_shortest_path(g, 1, 4, NeiMode::All);
  EXPECT_EQ(p.vertices, (std::vector<int>{1, 2, 3, 4}));
  ASSERT_EQ(p.edges.size(), 3u);
  EXPECT_EQ(p.edges[0], (Edge<int>{1, 2}));
  EXPECT_EQ(p.edges[2], (Edge<int>{3, 4}));
  EXPECT_EQ(p.edges[1].id, std::optional<EdgeId>(1));
}

TEST(GetShortestPath, UndirectedEdgesFollowWalkDirection) {
  auto g = make_path_graph(4);
  auto p = get_shortest_path(g, 4, 1, NeiMode::All);
  EXPECT_EQ(p.vertices, (std::vector<int>{4, 3, 2, 1}));
  ASSERT_EQ(p.edges.size(), 3u);
  for (std::size_t i = 0; i < p.edges.size(); ++i) {
    EXPECT_EQ(p.edges[i].from, p.vertices[i]);
    EXPECT_EQ(p.edges[i].to, p.vertices[i + 1]);
    EXPECT_EQ(p.edges[i].directedness, Directedness::Undirected);
  }
  EXPECT_EQ(p.edges[0], (Edge<int>{4, 3}));
  EXPECT_EQ(p.edges[0], (Edge<int>{3, 4}));
  EXPECT_EQ(p.edges[0].id, std::optional<EdgeId>(2));
  EXPECT_EQ(p.edges[2].id, std::optional<EdgeId>(0));
}

TEST(GetShortestPath, DirectedEdgesKeepStoredOrientation) {
  auto g = make_path_graph(3, Directedness::Directed);
  auto p = get_shortest_path(g, 3, 1, NeiMode::In);
  ASSERT_EQ(p.edges.size(), 2u);
  EXPECT_EQ(p.edges[0].from, 2);
  EXPECT_EQ(p.edges[0].to, 3);
  EXPECT_EQ(p.edges[0], (Edge<int>{2, 3}));
  EXPECT_FALSE(p.edges[0] == (Edge<int>{3, 2}));
}

TEST(GetShortestPath, PrefersShorterRoute) {
  auto g = Graph<int>::from_list(Directedness::Undirected, {{1, 2}, {2, 3}, {3, 4}, {1, 4}});
  auto p = get_shortest_path(g, 1, 4, NeiMode::All);
  EXPECT_EQ(p.vertices, (std::vector<int>{1, 4}));
  EXPECT_EQ(p.edges.size(), 1u);
}

TEST(GetShortestPath, DirectedModes) {
  auto g = make_path_graph(3, Directedness::Directed);
  EXPECT_TRUE(get_shortest_path(g, 3, 1, NeiMode::Out).vertices.empty());
  EXPECT_EQ(get_shortest_path(g, 3, 1, NeiMode::In).vertices, (std::vector<int>{3, 2, 1}));
  EXPECT_EQ(get_shortest_path(g, 3, 1, NeiMode::All).vertices, (std::vector<int>{3, 2, 1}));
}

TEST(GetShortestPath, AbsentEndpointIsFatal) {
  auto g = make_path_graph(3);
  try {
    (void)get_shortest_path(g, 1, 99, NeiMode::All);
    FAIL() << "expected NodeNotFound";
  } catch (const NodeNotFound& e) {
    EXPECT_EQ(e.operation(), "get_shortest_path");
  }
  EXPECT_THROW((void)get_shortest_path(g, 99, 1, NeiMode::All), ValueError);
}

TEST(ShortestPaths, DisconnectedGraphTable) {
  auto g = make_two_component_graph();
  auto t = shortest_paths(g, Sel{AllVertices{}}, Sel{AllVertices{}}, NeiMode::All);
  ASSERT_EQ(t.size(), 4u);
  for (int n : {1, 2, 3, 4}) {
    ASSERT_EQ(t.at(n).size(), 4u);
    EXPECT_EQ(t.at(n).at(n), std::optional<Distance>(0));
  }
  EXPECT_EQ(t.at(1).at(2), std::optional<Distance>(1));
  EXPECT_EQ(t.at(4).at(3), std::optional<Distance>(1));
  EXPECT_FALSE(t.at(1).at(3).has_value());
  EXPECT_FALSE(t.at(2).at(4).has_value());
  EXPECT_FALSE(t.at(3).at(1).has_value());
}

TEST(ShortestPaths, KeysMatchSelectedVertices) {
  auto g = make_path_graph(5, Directedness::Directed);
  auto t = shortest_paths(g, Sel{SingleVertex<int>{2}}, Sel{ContiguousRange<int>{1, 4}}, NeiMode::Out);
  ASSERT_EQ(t.size(), 1u);
  const auto& row = t.at(2);
  ASSERT_EQ(row.size(), 4u);
  EXPECT_FALSE(row.at(1).has_value());
  EXPECT_EQ(row.at(2), std::optional<Distance>(0));
  EXPECT_EQ(row.at(4), std::optional<Distance>(2));
}

TEST(ShortestPaths, EmptySelectorsGiveEmptyTable) {
  auto g = make_path_graph(3);
  EXPECT_TRUE(shortest_paths(g, Sel{NoVertices{}}, Sel{AllVertices{}}, NeiMode::All).empty());
  auto t = shortest_paths(g, Sel{AllVertices{}}, Sel{ExplicitList<int>{{1, 9}}}, NeiMode::All);
  ASSERT_EQ(t.size(), 3u);
  EXPECT_TRUE(t.at(1).empty());
}

TEST(Subcomponent, ReachableSet) {
  auto g = make_two_component_graph();
  auto c = subcomponent(g, 1, NeiMode::All);
  std::sort(c.begin(), c.end());
  EXPECT_EQ(c, (std::vector<int>{1, 2}));
  EXPECT_TRUE(subcomponent(g, 99, NeiMode::All).empty());

  auto d = make_path_graph(4, Directedness::Directed);
  auto out = subcomponent(d, 2, NeiMode::Out);
  std::sort(out.begin(), out.end());
  EXPECT_EQ(out, (std::vector<int>{2, 3, 4}));
}

TEST(Subgraph, IndependentOfParent) {
  auto g = make_path_graph(4);
  ASSERT_TRUE(g.delete_node(2));

  auto sub = subgraph(g, Sel{ExplicitList<int>{{1, 3, 4}}});
  EXPECT_EQ(sub.number_of_nodes(), 3);
  EXPECT_EQ(sub.number_of_edges(), 1);
  EXPECT_TRUE(are_connected(sub, 3, 4));
  expect_identity_dense(sub);

  (void)sub.insert_edge(1, 3);
  EXPECT_TRUE(sub.delete_node(4));
  EXPECT_EQ(g.number_of_nodes(), 3);
  EXPECT_EQ(g.number_of_edges(), 1);
  EXPECT_TRUE(g.member(4));
  EXPECT_FALSE(are_connected(g, 1, 3));
  EXPECT_NE(g.engine().graph.get(), sub.engine().graph.get());
}

TEST(Subgraph, IdsFollowEngineNumbering) {
  auto g = Graph<int>::from_list(Directedness::Directed, {{10, 20}, {20, 30}, {30, 40}});
  auto sub = subgraph(g, Sel{ExplicitList<int>{{40, 20, 30}}});
  // Engine keeps parent id order: 20, 30, 40
  EXPECT_EQ(sub.nodes(), (std::vector<int>{20, 30, 40}));
  EXPECT_EQ(sub.id_of(20), std::optional<VertexId>(0));
  EXPECT_TRUE(sub.is_directed());
  EXPECT_EQ(sub.edges(), (std::vector<Edge<int>>{{20, 30}, {30, 40}}));
}

TEST(Subgraph, AbsentSelectionGivesEmptyGraph) {
  auto g = make_path_graph(3);
  auto sub = subgraph(g, Sel{ExplicitList<int>{{1, 77}}});
  EXPECT_EQ(sub.number_of_nodes(), 0);
  EXPECT_EQ(sub.number_of_edges(), 0);
}

TEST(IsConnected, WeakAndStrong) {
  EXPECT_TRUE(is_connected(make_path_graph(4)));
  EXPECT_FALSE(is_connected(make_two_component_graph()));

  auto d = make_path_graph(3, Directedness::Directed);
  EXPECT_TRUE(is_connected(d, Connectedness::Weak));
  EXPECT_FALSE(is_connected(d, Connectedness::Strong));
  (void)d.insert_edge(3, 1);
  EXPECT_TRUE(is_connected(d, Connectedness::Strong));

  EXPECT_FALSE(is_connected(Graph<int>::empty(Directedness::Undirected)));
}

TEST(IsConnected, StrongEqualsWeakWhenUndirected) {
  EXPECT_FALSE(is_connected(make_two_component_graph(), Connectedness::Strong));
  EXPECT_TRUE(is_connected(make_path_graph(4), Connectedness::Strong));
  EXPECT_TRUE(is_connected(make_path_graph(1), Connectedness::Strong));

  auto g = make_path_graph(4);
  (void)g.delete_edge(2, 3);
  EXPECT_EQ(is_connected(g, Connectedness::Strong), is_connected(g, Connectedness::Weak));
  EXPECT_FALSE(is_connected(g, Connectedness::Strong));
}
