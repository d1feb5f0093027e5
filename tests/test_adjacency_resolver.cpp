#include <gtest/gtest.h>
#include <adjacency/adjacency_resolver.hpp>
#include <coloring/coloring_solver.hpp>
#include <graph/graph.hpp>
#include <partition/region_partitioner.hpp>
#include "test_helpers.hpp"
#include <random>

using namespace chromamap;

TEST(AdjacencyResolver, RowOfCells) {
    Regions regions = test::grid_regions(3, 1);
    AdjacencyResolver::resolve(regions);

    EXPECT_TRUE(regions[0].is_adjacent_to("cell-0-1"));
    EXPECT_TRUE(regions[1].is_adjacent_to("cell-0-2"));
    EXPECT_FALSE(regions[0].is_adjacent_to("cell-0-2"));
    EXPECT_TRUE(test::adjacency_symmetric(regions));
}

TEST(AdjacencyResolver, CornerContactCountsAsBorder) {
    Regions regions = test::grid_regions(2, 2);
    auto stats = AdjacencyResolver::resolve(regions);

    EXPECT_TRUE(regions[0].is_adjacent_to("cell-1-1"));
    EXPECT_TRUE(regions[1].is_adjacent_to("cell-1-0"));
    EXPECT_EQ(stats.edge_count, 6u);
    EXPECT_EQ(ColoringSolver::chromatic_number(regions), 4);
}

TEST(AdjacencyResolver, ShareBorderTolerance) {
    Region a = test::rect_region("a", 0, 0, 100, 100);
    Region near = test::rect_region("near", 110, 0, 210, 100);
    Region far = test::rect_region("far", 120, 0, 220, 100);

    EXPECT_TRUE(AdjacencyResolver::share_border(a, near, 15.0));
    EXPECT_FALSE(AdjacencyResolver::share_border(a, far, 15.0));
    EXPECT_TRUE(AdjacencyResolver::share_border(a, far, 25.0));
}

TEST(AdjacencyResolver, ShareBorderAlongEdgesWithoutNearVertices) {
    // Offset so no two vertices are within tolerance
    Region a = test::rect_region("a", 0, 0, 100, 100);
    Region b = test::rect_region("b", 100, 30, 200, 70);
    EXPECT_TRUE(AdjacencyResolver::share_border(a, b, 5.0));
}

TEST(AdjacencyResolver, IsolatedRegionJoinsNearest) {
    Regions regions;
    regions.push_back(test::rect_region("a", 0, 0, 100, 100));
    regions.push_back(test::rect_region("b", 100, 0, 200, 100));
    regions.push_back(test::rect_region("c", 1000, 0, 1100, 100));

    AdjacencyConfig config;
    config.bridge_components = false;
    auto stats = AdjacencyResolver::resolve(regions, config);

    EXPECT_EQ(stats.repaired_isolated, 1u);
    EXPECT_TRUE(regions[2].is_adjacent_to("b"));
    EXPECT_TRUE(regions[1].is_adjacent_to("c"));
    EXPECT_EQ(stats.pair_count, 3u);
    EXPECT_EQ(stats.rejected_pairs, 2u);
    EXPECT_TRUE(test::adjacency_connected(regions));
}

TEST(AdjacencyResolver, BridgesDisconnectedGroups) {
    Regions regions;
    regions.push_back(test::rect_region("a", 0, 0, 100, 100));
    regions.push_back(test::rect_region("b", 100, 0, 200, 100));
    regions.push_back(test::rect_region("c", 1000, 0, 1100, 100));
    regions.push_back(test::rect_region("d", 1100, 0, 1200, 100));

    Regions unbridged = regions;
    AdjacencyConfig off;
    off.bridge_components = false;
    auto off_stats = AdjacencyResolver::resolve(unbridged, off);
    EXPECT_EQ(off_stats.bridged_components, 0u);
    EXPECT_FALSE(test::adjacency_connected(unbridged));

    auto stats = AdjacencyResolver::resolve(regions);
    EXPECT_EQ(stats.repaired_isolated, 0u);
    EXPECT_EQ(stats.bridged_components, 1u);
    EXPECT_TRUE(regions[1].is_adjacent_to("c"));
    EXPECT_TRUE(test::adjacency_connected(regions));
    EXPECT_EQ(stats.edge_count, 3u);
}

TEST(AdjacencyResolver, ReplacesStaleAdjacency) {
    Regions regions = test::grid_regions(3, 1);
    test::link(regions, 0, 2);
    regions[0].adjacent_regions.insert("ghost");

    AdjacencyResolver::resolve(regions);
    EXPECT_FALSE(regions[0].is_adjacent_to("cell-0-2"));
    EXPECT_FALSE(regions[0].is_adjacent_to("ghost"));
}

TEST(AdjacencyResolver, ResolveIsIdempotent) {
    std::mt19937 rng(13);
    auto shapes = RegionPartitioner::partition(10, 800.0, 600.0, 0.7, rng);
    Regions regions;
    for (size_t i = 0; i < shapes.size(); ++i) {
        Region region;
        region.id = "region-" + std::to_string(i + 1);
        region.vertices = shapes[i].vertices;
        region.center = shapes[i].center;
        regions.push_back(region);
    }

    AdjacencyResolver::resolve(regions);
    Regions first = regions;
    AdjacencyResolver::resolve(regions);

    for (size_t i = 0; i < regions.size(); ++i) {
        EXPECT_EQ(regions[i].adjacent_regions, first[i].adjacent_regions);
    }
    EXPECT_TRUE(test::adjacency_symmetric(regions));
    EXPECT_TRUE(test::adjacency_connected(regions));
}

TEST(AdjacencyResolver, SingleRegionHasNoNeighbors) {
    Regions regions = test::grid_regions(1, 1);
    auto stats = AdjacencyResolver::resolve(regions);
    EXPECT_TRUE(regions[0].adjacent_regions.empty());
    EXPECT_EQ(stats.edge_count, 0u);
    EXPECT_EQ(stats.repaired_isolated, 0u);
}

TEST(AdjacencyResolver, PathGraphGivesPathOfRegions) {
    Graph path;
    path.add_edge("region-1", "region-2");
    path.add_edge("region-2", "region-3");
    path.add_edge("region-3", "region-4");

    for (uint32_t seed = 0; seed < 20; ++seed) {
        std::mt19937 rng(seed);
        auto shapes = RegionPartitioner::partition(path, 800.0, 600.0, 0.3, rng);
        ASSERT_EQ(shapes.size(), 4u);

        Regions regions;
        for (size_t i = 0; i < shapes.size(); ++i) {
            Region region;
            region.id = path.nodes()[i].id;
            region.vertices = shapes[i].vertices;
            region.center = shapes[i].center;
            regions.push_back(region);
        }
        AdjacencyResolver::resolve(regions);

        EXPECT_TRUE(regions[0].is_adjacent_to("region-2")) << "seed " << seed;
        EXPECT_TRUE(regions[1].is_adjacent_to("region-3")) << "seed " << seed;
        EXPECT_TRUE(regions[2].is_adjacent_to("region-4")) << "seed " << seed;
        EXPECT_FALSE(regions[0].is_adjacent_to("region-3")) << "seed " << seed;
        EXPECT_FALSE(regions[0].is_adjacent_to("region-4")) << "seed " << seed;
        EXPECT_FALSE(regions[1].is_adjacent_to("region-4")) << "seed " << seed;
        EXPECT_EQ(ColoringSolver::chromatic_number(regions), 2) << "seed " << seed;
    }
}
