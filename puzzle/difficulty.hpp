#ifndef CHROMAMAP_DIFFICULTY_HPP
#define CHROMAMAP_DIFFICULTY_HPP

#include <random>
#include <string>

namespace chromamap {

enum class Difficulty {
    Easy,
    Medium,
    Hard
};

// Generation parameters derived from a tier and a level
struct DifficultyConfig {
    int region_count = 4;
    int target_colors = 3;    // Informational: colors the tier aims for
    float complexity = 0.3f;  // 0 = smooth borders, 1 = most organic
};

std::string to_string(Difficulty difficulty);

// Parses "easy", "medium" or "hard"; throws std::invalid_argument otherwise
Difficulty difficulty_from_string(const std::string& name);

// Region count is drawn from the tier's range (easy 4-7, medium 8-11,
// hard 12-15); complexity grows by 0.05 per level above 1, capped at 0.9.
// Throws std::invalid_argument for level < 1.
DifficultyConfig difficulty_config(Difficulty difficulty, int level, std::mt19937& rng);

// Desired average extra edges per node handed to the graph synthesizer
double target_connectivity(int region_count);

}  // namespace chromamap

#endif // CHROMAMAP_DIFFICULTY_HPP
