#include <gtest/gtest.h>
#include <coloring/coloring_solver.hpp>
#include "test_helpers.hpp"
#include <random>

using namespace chromamap;

namespace {

std::vector<std::pair<size_t, size_t>> cycle_edges(size_t n) {
    std::vector<std::pair<size_t, size_t>> edges;
    for (size_t i = 0; i < n; ++i) {
        edges.emplace_back(i, (i + 1) % n);
    }
    return edges;
}

std::vector<std::pair<size_t, size_t>> complete_edges(size_t n) {
    std::vector<std::pair<size_t, size_t>> edges;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            edges.emplace_back(i, j);
        }
    }
    return edges;
}

}  // namespace

TEST(ColoringSolver, TrivialCollections) {
    EXPECT_EQ(ColoringSolver::chromatic_number({}), 0);
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(1, {})), 1);
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(5, {})), 1);
}

TEST(ColoringSolver, KnownChromaticNumbers) {
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(4, {{0, 1}, {1, 2}, {2, 3}})), 2);
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(3, cycle_edges(3))), 3);
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(5, cycle_edges(5))), 3);
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(6, cycle_edges(6))), 2);
    EXPECT_EQ(ColoringSolver::chromatic_number(test::abstract_regions(4, complete_edges(4))), 4);
}

TEST(ColoringSolver, WheelNeedsFourColors) {
    // Hub 5 around an odd rim
    auto edges = cycle_edges(5);
    for (size_t i = 0; i < 5; ++i) {
        edges.emplace_back(5, i);
    }
    Regions wheel = test::abstract_regions(6, edges);
    EXPECT_EQ(ColoringSolver::chromatic_number(wheel), 4);
    EXPECT_GE(ColoringSolver::greedy_upper_bound(wheel), 4);
}

TEST(ColoringSolver, MatchesExhaustiveSearchOnRandomGraphs) {
    std::mt19937 rng(123);
    for (int trial = 0; trial < 30; ++trial) {
        size_t n = 2 + trial % 6;
        std::vector<std::pair<size_t, size_t>> edges;
        std::bernoulli_distribution coin(0.5);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                if (coin(rng)) edges.emplace_back(i, j);
            }
        }
        Regions regions = test::abstract_regions(n, edges);

        int chromatic = ColoringSolver::chromatic_number(regions);
        EXPECT_TRUE(test::colorable_exhaustive(regions, chromatic)) << "trial " << trial;
        EXPECT_FALSE(test::colorable_exhaustive(regions, chromatic - 1)) << "trial " << trial;
        EXPECT_GE(ColoringSolver::greedy_upper_bound(regions), chromatic);
    }
}

TEST(ColoringSolver, IgnoresDanglingNeighborIds) {
    Regions regions = test::abstract_regions(2, {{0, 1}});
    regions[0].adjacent_regions.insert("ghost");
    EXPECT_EQ(ColoringSolver::chromatic_number(regions), 2);
    EXPECT_EQ(ColoringSolver::greedy_upper_bound(regions), 2);
}

TEST(ColoringSolver, StepCapFallsBackToGreedy) {
    Regions k6 = test::abstract_regions(6, complete_edges(6));

    ColoringConfig config;
    config.max_steps = 10;
    ChromaticResult capped = ColoringSolver::chromatic_number_bounded(k6, config);
    EXPECT_FALSE(capped.exact);
    EXPECT_EQ(capped.colors, 6);
    EXPECT_LE(capped.steps, 10u);

    ChromaticResult full = ColoringSolver::chromatic_number_bounded(k6);
    EXPECT_TRUE(full.exact);
    EXPECT_EQ(full.colors, 6);
    EXPECT_GT(full.steps, 0u);
}

TEST(ColoringSolver, HasConflict) {
    Regions regions = test::abstract_regions(3, {{0, 1}, {1, 2}});
    regions[1].color = "red";

    EXPECT_TRUE(ColoringSolver::has_conflict("n-0", "red", regions));
    EXPECT_FALSE(ColoringSolver::has_conflict("n-0", "blue", regions));
    // Non-adjacent regions never conflict
    regions[2].color = "blue";
    EXPECT_FALSE(ColoringSolver::has_conflict("n-0", "blue", regions));
    // A region's own color is not a conflict
    EXPECT_FALSE(ColoringSolver::has_conflict("n-1", "red", regions));
}

TEST(ColoringSolver, HasConflictRejectsUnknownRegion) {
    Regions regions = test::abstract_regions(2, {{0, 1}});
    EXPECT_THROW(ColoringSolver::has_conflict("missing", "red", regions), std::out_of_range);
}

TEST(ColoringSolver, HasConflictSkipsDanglingIds) {
    Regions regions = test::abstract_regions(1, {});
    regions[0].adjacent_regions.insert("ghost");
    EXPECT_FALSE(ColoringSolver::has_conflict("n-0", "red", regions));
}

TEST(ColoringSolver, ProperColoring) {
    Regions regions = test::abstract_regions(3, cycle_edges(3));
    EXPECT_TRUE(ColoringSolver::is_proper_coloring(regions));

    regions[0].color = "red";
    regions[1].color = "green";
    EXPECT_TRUE(ColoringSolver::is_proper_coloring(regions));

    regions[2].color = "red";
    EXPECT_FALSE(ColoringSolver::is_proper_coloring(regions));
}
