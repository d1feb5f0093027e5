#ifndef CHROMAMAP_PUZZLE_HPP
#define CHROMAMAP_PUZZLE_HPP

#include "difficulty.hpp"
#include <adjacency/adjacency_resolver.hpp>
#include <coloring/coloring_solver.hpp>
#include <partition/region_partitioner.hpp>
#include <region/region.hpp>
#include <cstdint>

namespace chromamap {

// Everything that controls one generation run
struct GenerateConfig {
    // Seed for the generator threaded through synthesis and partitioning
    uint32_t random_seed = 42;

    PartitionConfig partition;
    AdjacencyConfig adjacency;
    ColoringConfig coloring;
};

// A playable region set and its certified minimum color count
struct Puzzle {
    Regions regions;
    int minimum_colors = 0;
    bool minimum_exact = true;  // False if the solver fell back to the greedy bound
    DifficultyConfig difficulty;
};

// Synthesizes a graph, partitions the board, resolves adjacency from the
// geometry and solves for the chromatic number. Equal seeds and inputs
// give equal puzzles. Throws std::invalid_argument for a non-positive
// board size or level < 1.
Puzzle generate_puzzle(Difficulty difficulty, int level,
                       double board_width, double board_height,
                       const GenerateConfig& config = GenerateConfig{});

// Same with explicit difficulty parameters
Puzzle generate_puzzle(const DifficultyConfig& difficulty,
                       double board_width, double board_height,
                       const GenerateConfig& config = GenerateConfig{});

}  // namespace chromamap

#endif // CHROMAMAP_PUZZLE_HPP
