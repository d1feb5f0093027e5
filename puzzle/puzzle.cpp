#include "puzzle.hpp"
#include <common/logging.hpp>
#include <graph/graph_synthesizer.hpp>
#include <random>
#include <stdexcept>

namespace chromamap {

namespace {

void check_board(double board_width, double board_height) {
    if (board_width <= 0.0 || board_height <= 0.0) {
        throw std::invalid_argument("generate_puzzle: board dimensions must be positive");
    }
}

Puzzle build_puzzle(const DifficultyConfig& difficulty,
                    double board_width, double board_height,
                    const GenerateConfig& config, std::mt19937& rng) {
    auto log = chromamap::logging::get_logger();

    if (difficulty.region_count < 0) {
        throw std::invalid_argument("generate_puzzle: region_count must be non-negative");
    }

    log->debug("Stage 1: Synthesizing graph");
    Graph graph = GraphSynthesizer::synthesize(
        difficulty.region_count, target_connectivity(difficulty.region_count), rng);

    // Candidate cuts are compared with the graph using the contact distance
    // the resolver applies afterwards
    log->debug("Stage 2: Partitioning board");
    PartitionConfig partition = config.partition;
    partition.guide_tolerance = config.adjacency.tolerance;
    std::vector<RegionShape> shapes = RegionPartitioner::partition(
        graph, board_width, board_height, difficulty.complexity, rng, partition);

    Puzzle puzzle;
    puzzle.difficulty = difficulty;
    puzzle.regions.reserve(shapes.size());
    for (size_t i = 0; i < shapes.size(); ++i) {
        Region region;
        region.id = graph.nodes()[i].id;
        region.vertices = std::move(shapes[i].vertices);
        region.center = shapes[i].center;
        puzzle.regions.push_back(std::move(region));
    }

    // Geometry decides adjacency from here on
    log->debug("Stage 3: Resolving adjacency");
    AdjacencyStats stats = AdjacencyResolver::resolve(puzzle.regions, config.adjacency);

    log->debug("Stage 4: Solving chromatic number");
    ChromaticResult chromatic = ColoringSolver::chromatic_number_bounded(puzzle.regions, config.coloring);
    puzzle.minimum_colors = chromatic.colors;
    puzzle.minimum_exact = chromatic.exact;

    log->info("Generated puzzle: {} regions, {} adjacencies, minimum {} colors{}",
              puzzle.regions.size(), stats.edge_count, puzzle.minimum_colors,
              puzzle.minimum_exact ? "" : " (greedy bound)");
    return puzzle;
}

}  // namespace

Puzzle generate_puzzle(Difficulty difficulty, int level,
                       double board_width, double board_height,
                       const GenerateConfig& config) {
    check_board(board_width, board_height);

    std::mt19937 rng(config.random_seed);
    DifficultyConfig params = difficulty_config(difficulty, level, rng);

    auto log = chromamap::logging::get_logger();
    log->info("Generating {} puzzle (level {}, seed {}): {} regions, complexity {:.2f}",
              to_string(difficulty), level, config.random_seed,
              params.region_count, params.complexity);

    return build_puzzle(params, board_width, board_height, config, rng);
}

Puzzle generate_puzzle(const DifficultyConfig& difficulty,
                       double board_width, double board_height,
                       const GenerateConfig& config) {
    check_board(board_width, board_height);

    std::mt19937 rng(config.random_seed);
    return build_puzzle(difficulty, board_width, board_height, config, rng);
}

}  // namespace chromamap
