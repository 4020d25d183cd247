#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "keygraph/core/components.hpp"
#include "keygraph/core/constants.hpp"
#include "keygraph/core/engine_graph.hpp"
#include "keygraph/core/error.hpp"
#include "keygraph/core/resolved_selector.hpp"
#include "keygraph/core/shortest_paths.hpp"
#include "test_utils.hpp"

using namespace keygraph::core;
using namespace keygraph::core::test;

TEST(EngineGraph, FromEdgesBuildsValidIncidence) {
  auto g = make_line_engine(5);
  EXPECT_EQ(g.num_vertices(), 5);
  EXPECT_EQ(g.num_edges(), 4);
  expect_incidence_valid(g);
}

TEST(EngineGraph, AddEdgeReturnsDenseIds) {
  EngineGraph g(false, 3);
  EXPECT_EQ(g.add_edge(0, 1), 0);
  EXPECT_EQ(g.add_edge(1, 2), 1);
  EXPECT_EQ(g.num_edges(), 2);
  expect_incidence_valid(g);
}

TEST(EngineGraph, DeleteVertexDropsIncidentEdgesAndRenumbers) {
  // 0-1, 1-2, 2-3
  auto g = make_line_engine(4, false);
  g.delete_vertex(1);
  EXPECT_EQ(g.num_vertices(), 3);
  ASSERT_EQ(g.num_edges(), 1);
  // old edge 2-3 becomes 1-2 with edge id 0
  EXPECT_EQ(g.edge(0), std::make_pair(VertexId{1}, VertexId{2}));
  expect_incidence_valid(g);
}

TEST(EngineGraph, DeleteEdgeShiftsGreaterEdgeIds) {
  auto g = make_line_engine(4);
  g.delete_edge(0);
  ASSERT_EQ(g.num_edges(), 2);
  EXPECT_EQ(g.edge(0), std::make_pair(VertexId{1}, VertexId{2}));
  EXPECT_EQ(g.edge(1), std::make_pair(VertexId{2}, VertexId{3}));
}

TEST(EngineGraph, DeleteEdgeKeepsIncidenceOrdered) {
  EngineGraph g(true, 3);
  (void)g.add_edge(0, 1);
  (void)g.add_edge(0, 2);
  (void)g.add_edge(1, 2);
  (void)g.add_edge(0, 1);
  g.delete_edge(1);
  ASSERT_EQ(g.num_edges(), 3);
  EXPECT_EQ(std::vector<EdgeId>(g.out_edges(0).begin(), g.out_edges(0).end()), (std::vector<EdgeId>{0, 2}));
  EXPECT_EQ(std::vector<EdgeId>(g.in_edges(2).begin(), g.in_edges(2).end()), std::vector<EdgeId>{1});
  expect_incidence_valid(g);
  (void)g.add_edge(2, 0);
  EXPECT_EQ(g.find_edge(2, 0), std::optional<EdgeId>(3));
  expect_incidence_valid(g);
}

TEST(EngineGraph, FindEdgeReturnsLowestParallelId) {
  EngineGraph g(false, 3);
  (void)g.add_edge(1, 0);
  (void)g.add_edge(0, 1);
  for (int i = 0; i < 5; ++i) (void)g.add_edge(0, 2);
  EXPECT_EQ(g.find_edge(0, 1), std::optional<EdgeId>(0));
  EXPECT_EQ(g.find_edge(1, 0), std::optional<EdgeId>(0));
  EXPECT_EQ(g.find_edge(2, 0), std::optional<EdgeId>(2));
  EXPECT_FALSE(g.find_edge(1, 2).has_value());
}

TEST(EngineGraph, IncrementalEdgeInsertsScaleLinearly) {
  // A star keeps one hub with a large incidence list; inserts must not
  // rescan the whole graph.
  constexpr int kEdges = 50000;
  EngineGraph g(false, 1);
  const auto start = std::chrono::steady_clock::now();
  for (int i = 1; i <= kEdges; ++i) {
    g.add_vertices(1);
    ASSERT_FALSE(g.find_edge(i, 0).has_value());
    (void)g.add_edge(0, i);
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(g.num_edges(), kEdges);
  EXPECT_EQ(g.find_edge(kEdges, 0), std::optional<EdgeId>(kEdges - 1));
  EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 3000);
}

TEST(EngineGraph, FindEdgeRespectsDirectedness) {
  auto d = make_line_engine(3, true);
  EXPECT_EQ(d.find_edge(0, 1), std::optional<EdgeId>(0));
  EXPECT_FALSE(d.find_edge(1, 0).has_value());

  auto u = make_line_engine(3, false);
  EXPECT_EQ(u.find_edge(1, 0), std::optional<EdgeId>(0));
  EXPECT_EQ(u.find_edge(2, 1), std::optional<EdgeId>(1));
  EXPECT_FALSE(u.find_edge(0, 2).has_value());
}

TEST(EngineGraph, NeighborsByMode) {
  auto g = make_line_engine(3, true);
  EXPECT_EQ(g.neighbors(1, NeiMode::Out), std::vector<VertexId>{2});
  EXPECT_EQ(g.neighbors(1, NeiMode::In), std::vector<VertexId>{0});
  EXPECT_EQ(g.neighbors(1, NeiMode::All), (std::vector<VertexId>{0, 2}));
}

TEST(EngineGraph, SelfLoopListedOnce) {
  EngineGraph g(false, 1);
  (void)g.add_edge(0, 0);
  EXPECT_EQ(g.neighbors(0, NeiMode::All), std::vector<VertexId>{0});
  EXPECT_TRUE(are_connected(g, 0, 0));
}

TEST(EngineGraph, InvalidVertexRaisesEngineError) {
  EngineGraph g(true, 2);
  try {
    (void)g.add_edge(0, 5);
    FAIL() << "expected EngineError";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.operation(), "add_edge");
    EXPECT_EQ(e.code(), ErrorCode::InvalidVertex);
    EXPECT_NE(std::string(e.what()).find("InvalidVertex"), std::string::npos);
  }
  EXPECT_THROW(g.delete_vertex(-1), EngineError);
  EXPECT_THROW(g.delete_edge(0), EngineError);
  EXPECT_THROW(EngineGraph(false, -1), EngineError);
}

TEST(EngineGraph, InvalidModeRaisesEngineError) {
  auto g = make_line_engine(2);
  try {
    (void)g.neighbors(0, static_cast<NeiMode>(7));
    FAIL() << "expected EngineError";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidMode);
  }
}

TEST(ResolvedSelector, SizesMatchEnumeration) {
  auto g = make_line_engine(5, false);
  const std::vector<ResolvedSelector> sels = {
      ResolvedSelector::all(),
      ResolvedSelector::none(),
      ResolvedSelector::single(3),
      ResolvedSelector::adjacent(2, NeiMode::All),
      ResolvedSelector::nonadjacent(2, NeiMode::All),
      ResolvedSelector::vector({4, 0, 4}),
      ResolvedSelector::range(1, 3),
      ResolvedSelector::range(3, 1),
  };
  for (const auto& s : sels) {
    EXPECT_EQ(static_cast<std::size_t>(selector_size(g, s)), selector_vertices(g, s).size());
  }
  EXPECT_EQ(selector_vertices(g, ResolvedSelector::range(1, 3)), (std::vector<VertexId>{1, 2, 3}));
  EXPECT_EQ(selector_vertices(g, ResolvedSelector::nonadjacent(2, NeiMode::All)), (std::vector<VertexId>{0, 4}));
  EXPECT_EQ(selector_vertices(g, ResolvedSelector::vector({4, 0, 4})), (std::vector<VertexId>{4, 0, 4}));
}

TEST(ResolvedSelector, OutOfRangeIdRaises) {
  auto g = make_line_engine(3);
  EXPECT_THROW((void)selector_vertices(g, ResolvedSelector::single(3)), EngineError);
  EXPECT_THROW((void)selector_size(g, ResolvedSelector::vector({0, 9})), EngineError);
}

TEST(ShortestPaths, LinePathAndUnreachable) {
  auto g = make_line_engine(4, true);
  auto p = get_shortest_path(g, 0, 3, NeiMode::Out);
  EXPECT_EQ(p.vertices, (std::vector<VertexId>{0, 1, 2, 3}));
  EXPECT_EQ(p.edges, (std::vector<EdgeId>{0, 1, 2}));

  auto back = get_shortest_path(g, 3, 0, NeiMode::Out);
  EXPECT_TRUE(back.vertices.empty());
  EXPECT_TRUE(back.edges.empty());

  auto rev = get_shortest_path(g, 3, 0, NeiMode::In);
  EXPECT_EQ(rev.vertices, (std::vector<VertexId>{3, 2, 1, 0}));
}

TEST(ShortestPaths, PathToSelfIsSingleVertex) {
  auto g = make_line_engine(3);
  auto p = get_shortest_path(g, 1, 1, NeiMode::Out);
  EXPECT_EQ(p.vertices, std::vector<VertexId>{1});
  EXPECT_TRUE(p.edges.empty());
}

TEST(ShortestPaths, DistanceMatrixUsesInfinityForUnreachable) {
  auto g = make_line_engine(3, true);
  auto m = shortest_distances(g, ResolvedSelector::all(), ResolvedSelector::all(), NeiMode::Out);
  ASSERT_EQ(m.rows, 3);
  ASSERT_EQ(m.cols, 3);
  EXPECT_EQ(m.at(0, 2), 2.0);
  EXPECT_EQ(m.at(2, 0), kInfDistance);
  EXPECT_EQ(m.at(1, 1), 0.0);
}

TEST(Components, IsConnectedWeakAndStrong) {
  auto line = make_line_engine(3, true);
  EXPECT_TRUE(is_connected(line, Connectedness::Weak));
  EXPECT_FALSE(is_connected(line, Connectedness::Strong));
  (void)line.add_edge(2, 0);
  EXPECT_TRUE(is_connected(line, Connectedness::Strong));

  EXPECT_FALSE(is_connected(EngineGraph(false, 0), Connectedness::Weak));
  EXPECT_TRUE(is_connected(EngineGraph(false, 1), Connectedness::Weak));
  EXPECT_FALSE(is_connected(EngineGraph(false, 2), Connectedness::Weak));
}

TEST(Components, SubcomponentStartsWithSource) {
  auto g = make_line_engine(4, true);
  EXPECT_EQ(subcomponent(g, 1, NeiMode::Out), (std::vector<VertexId>{1, 2, 3}));
  EXPECT_EQ(subcomponent(g, 1, NeiMode::In), (std::vector<VertexId>{1, 0}));
}

TEST(Components, InducedSubgraphRenumbersFromZero) {
  auto g = make_line_engine(5, false);
  auto sub = induced_subgraph(g, ResolvedSelector::vector({4, 2, 3, 2}));
  EXPECT_EQ(sub.parent_ids, (std::vector<VertexId>{2, 3, 4}));
  EXPECT_EQ(sub.graph.num_vertices(), 3);
  ASSERT_EQ(sub.graph.num_edges(), 2);
  EXPECT_EQ(sub.graph.edge(0), std::make_pair(VertexId{0}, VertexId{1}));
  EXPECT_EQ(sub.graph.edge(1), std::make_pair(VertexId{1}, VertexId{2}));
  expect_incidence_valid(sub.graph);
}
