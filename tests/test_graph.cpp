#include <gtest/gtest.h>
#include <graph/graph.hpp>
#include "test_helpers.hpp"

using namespace chromamap;

TEST(Graph, AddNodeKeepsCreationOrder) {
    Graph graph;
    graph.add_node("b");
    graph.add_node("a");
    graph.add_node("b");

    ASSERT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.nodes()[0].id, "b");
    EXPECT_EQ(graph.nodes()[1].id, "a");
}

TEST(Graph, EdgesAreSymmetric) {
    Graph graph;
    EXPECT_TRUE(graph.add_edge("a", "b"));

    EXPECT_TRUE(graph.are_adjacent("a", "b"));
    EXPECT_TRUE(graph.are_adjacent("b", "a"));
    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.degree("a"), 1u);
    EXPECT_EQ(graph.degree("b"), 1u);
}

TEST(Graph, DuplicateEdgeIsIgnored) {
    Graph graph;
    graph.add_edge("a", "b");
    EXPECT_FALSE(graph.add_edge("b", "a"));
    EXPECT_EQ(graph.edge_count(), 1u);
}

TEST(Graph, SelfEdgeThrows) {
    Graph graph;
    EXPECT_THROW(graph.add_edge("a", "a"), std::invalid_argument);
}

TEST(Graph, UnknownNodeThrows) {
    Graph graph;
    graph.add_node("a");
    EXPECT_THROW(graph.node("missing"), std::out_of_range);
    EXPECT_FALSE(graph.has_node("missing"));
    EXPECT_FALSE(graph.are_adjacent("missing", "a"));
}

TEST(Graph, Components) {
    Graph graph;
    graph.add_edge("a", "b");
    graph.add_edge("c", "d");
    graph.add_node("e");

    auto components = graph.components();
    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[0].size(), 2u);
    EXPECT_EQ(components[1].size(), 2u);
    EXPECT_EQ(components[2], std::vector<NodeId>{"e"});
    EXPECT_FALSE(graph.is_connected());

    graph.add_edge("b", "c");
    graph.add_edge("d", "e");
    EXPECT_TRUE(graph.is_connected());
}

TEST(Graph, EmptyGraphIsConnected) {
    Graph graph;
    EXPECT_TRUE(graph.is_connected());
    EXPECT_TRUE(graph.components().empty());
}

TEST(Graph, FromRegionsUsesRegionAdjacency) {
    Regions regions = test::abstract_regions(3, {{0, 1}, {1, 2}});
    // A dangling id is skipped
    regions[0].adjacent_regions.insert("ghost");

    Graph graph = Graph::from_regions(regions);
    EXPECT_EQ(graph.node_count(), 3u);
    EXPECT_EQ(graph.edge_count(), 2u);
    EXPECT_TRUE(graph.are_adjacent("n-0", "n-1"));
    EXPECT_FALSE(graph.are_adjacent("n-0", "n-2"));
    EXPECT_FALSE(graph.has_node("ghost"));
}

TEST(Graph, DotExportListsEachEdgeOnce) {
    Graph graph;
    graph.add_edge("region-1", "region-2");
    graph.add_edge("region-2", "region-3");

    std::string dot = graph.to_dot();
    EXPECT_NE(dot.find("graph Regions {"), std::string::npos);
    EXPECT_NE(dot.find("\"region-1\" -- \"region-2\""), std::string::npos);
    EXPECT_NE(dot.find("\"region-2\" -- \"region-3\""), std::string::npos);
    EXPECT_EQ(dot.find("\"region-2\" -- \"region-1\""), std::string::npos);
}
