#include "difficulty.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace chromamap {

std::string to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
    }
    return "unknown";
}

Difficulty difficulty_from_string(const std::string& name) {
    if (name == "easy") return Difficulty::Easy;
    if (name == "medium") return Difficulty::Medium;
    if (name == "hard") return Difficulty::Hard;
    throw std::invalid_argument("Unknown difficulty: " + name);
}

DifficultyConfig difficulty_config(Difficulty difficulty, int level, std::mt19937& rng) {
    if (level < 1) {
        throw std::invalid_argument("difficulty_config: level must be at least 1");
    }

    DifficultyConfig config;
    int min_regions = 4;
    float base_complexity = 0.3f;

    switch (difficulty) {
        case Difficulty::Easy:
            min_regions = 4;
            config.target_colors = 3;
            base_complexity = 0.3f;
            break;
        case Difficulty::Medium:
            min_regions = 8;
            config.target_colors = 4;
            base_complexity = 0.5f;
            break;
        case Difficulty::Hard:
            min_regions = 12;
            config.target_colors = 5;
            base_complexity = 0.7f;
            break;
    }

    std::uniform_int_distribution<int> count_dist(min_regions, min_regions + 3);
    config.region_count = count_dist(rng);
    config.complexity = std::min(base_complexity + (level - 1) * 0.05f, 0.9f);
    return config;
}

double target_connectivity(int region_count) {
    return std::max(2.0, std::floor(region_count * 0.4));
}

}  // namespace chromamap
