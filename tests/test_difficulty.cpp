#include <gtest/gtest.h>
#include <puzzle/difficulty.hpp>
#include <random>

using namespace chromamap;

TEST(Difficulty, RegionCountRanges) {
    std::mt19937 rng(0);
    for (int i = 0; i < 100; ++i) {
        auto easy = difficulty_config(Difficulty::Easy, 1, rng);
        EXPECT_GE(easy.region_count, 4);
        EXPECT_LE(easy.region_count, 7);

        auto medium = difficulty_config(Difficulty::Medium, 1, rng);
        EXPECT_GE(medium.region_count, 8);
        EXPECT_LE(medium.region_count, 11);

        auto hard = difficulty_config(Difficulty::Hard, 1, rng);
        EXPECT_GE(hard.region_count, 12);
        EXPECT_LE(hard.region_count, 15);
    }
}

TEST(Difficulty, TargetColors) {
    std::mt19937 rng(0);
    EXPECT_EQ(difficulty_config(Difficulty::Easy, 1, rng).target_colors, 3);
    EXPECT_EQ(difficulty_config(Difficulty::Medium, 1, rng).target_colors, 4);
    EXPECT_EQ(difficulty_config(Difficulty::Hard, 1, rng).target_colors, 5);
}

TEST(Difficulty, ComplexityGrowsWithLevel) {
    std::mt19937 rng(0);
    EXPECT_FLOAT_EQ(difficulty_config(Difficulty::Easy, 1, rng).complexity, 0.3f);
    EXPECT_FLOAT_EQ(difficulty_config(Difficulty::Easy, 3, rng).complexity, 0.4f);
    EXPECT_FLOAT_EQ(difficulty_config(Difficulty::Medium, 1, rng).complexity, 0.5f);
    EXPECT_FLOAT_EQ(difficulty_config(Difficulty::Hard, 1, rng).complexity, 0.7f);
    EXPECT_FLOAT_EQ(difficulty_config(Difficulty::Hard, 20, rng).complexity, 0.9f);
    EXPECT_FLOAT_EQ(difficulty_config(Difficulty::Easy, 100, rng).complexity, 0.9f);
}

TEST(Difficulty, LevelMustBePositive) {
    std::mt19937 rng(0);
    EXPECT_THROW(difficulty_config(Difficulty::Easy, 0, rng), std::invalid_argument);
    EXPECT_THROW(difficulty_config(Difficulty::Hard, -2, rng), std::invalid_argument);
}

TEST(Difficulty, Names) {
    EXPECT_EQ(to_string(Difficulty::Easy), "easy");
    EXPECT_EQ(to_string(Difficulty::Medium), "medium");
    EXPECT_EQ(to_string(Difficulty::Hard), "hard");
    EXPECT_EQ(difficulty_from_string("medium"), Difficulty::Medium);
    EXPECT_THROW(difficulty_from_string("Expert"), std::invalid_argument);
}

TEST(Difficulty, TargetConnectivity) {
    EXPECT_DOUBLE_EQ(target_connectivity(4), 2.0);
    EXPECT_DOUBLE_EQ(target_connectivity(7), 2.0);
    EXPECT_DOUBLE_EQ(target_connectivity(10), 4.0);
    EXPECT_DOUBLE_EQ(target_connectivity(15), 6.0);
}
