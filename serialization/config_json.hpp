#ifndef CHROMAMAP_SERIALIZATION_CONFIG_JSON_HPP
#define CHROMAMAP_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <adjacency/adjacency_resolver.hpp>
#include <coloring/coloring_solver.hpp>
#include <partition/region_partitioner.hpp>
#include <puzzle/difficulty.hpp>
#include <puzzle/puzzle.hpp>

namespace chromamap {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

NLOHMANN_JSON_SERIALIZE_ENUM(Difficulty, {
    {Difficulty::Easy, "easy"},
    {Difficulty::Medium, "medium"},
    {Difficulty::Hard, "hard"},
})

// DifficultyConfig serialization
inline void to_json(nlohmann::json& j, const DifficultyConfig& config) {
    j = {
        {"region_count", config.region_count},
        {"target_colors", config.target_colors},
        {"complexity", config.complexity}
    };
}

inline void from_json(const nlohmann::json& j, DifficultyConfig& config) {
    config.region_count = j.value("region_count", 4);
    config.target_colors = j.value("target_colors", 3);
    config.complexity = j.value("complexity", 0.3f);
}

// PartitionConfig serialization
inline void to_json(nlohmann::json& j, const PartitionConfig& config) {
    j = {
        {"margin", config.margin},
        {"perimeter_steps", config.perimeter_steps},
        {"perimeter_jitter", config.perimeter_jitter},
        {"cut_segments", config.cut_segments},
        {"min_cut_fraction", config.min_cut_fraction},
        {"max_cut_fraction", config.max_cut_fraction},
        {"cut_variation", config.cut_variation},
        {"connector_jitter", config.connector_jitter},
        {"connector_jitter_cap", config.connector_jitter_cap},
        {"max_split_attempts", config.max_split_attempts},
        {"min_area_fraction", config.min_area_fraction},
        {"fallback_min_area_fraction", config.fallback_min_area_fraction},
        {"guide_tolerance", config.guide_tolerance},
        {"guide_axis_ratio", config.guide_axis_ratio},
        {"guide_fraction_spread", config.guide_fraction_spread}
    };
}

inline void from_json(const nlohmann::json& j, PartitionConfig& config) {
    config.margin = j.value("margin", 60.0);
    config.perimeter_steps = j.value("perimeter_steps", 48);
    config.perimeter_jitter = j.value("perimeter_jitter", 0.02f);
    config.cut_segments = j.value("cut_segments", 8);
    config.min_cut_fraction = j.value("min_cut_fraction", 0.3f);
    config.max_cut_fraction = j.value("max_cut_fraction", 0.7f);
    config.cut_variation = j.value("cut_variation", 0.1f);
    config.connector_jitter = j.value("connector_jitter", 0.15f);
    config.connector_jitter_cap = j.value("connector_jitter_cap", 6.0);
    config.max_split_attempts = j.value("max_split_attempts", 12);
    config.min_area_fraction = j.value("min_area_fraction", 0.15f);
    config.fallback_min_area_fraction = j.value("fallback_min_area_fraction", 0.02f);
    config.guide_tolerance = j.value("guide_tolerance", 15.0);
    config.guide_axis_ratio = j.value("guide_axis_ratio", 2.0f);
    config.guide_fraction_spread = j.value("guide_fraction_spread", 0.05f);
}

// AdjacencyConfig serialization
inline void to_json(nlohmann::json& j, const AdjacencyConfig& config) {
    j = {
        {"tolerance", config.tolerance},
        {"rejection_factor", config.rejection_factor},
        {"bridge_components", config.bridge_components}
    };
}

inline void from_json(const nlohmann::json& j, AdjacencyConfig& config) {
    config.tolerance = j.value("tolerance", 15.0);
    config.rejection_factor = j.value("rejection_factor", 2.2);
    config.bridge_components = j.value("bridge_components", true);
}

// AdjacencyStats serialization (output only)
inline void to_json(nlohmann::json& j, const AdjacencyStats& stats) {
    j = {
        {"pair_count", stats.pair_count},
        {"rejected_pairs", stats.rejected_pairs},
        {"edge_count", stats.edge_count},
        {"repaired_isolated", stats.repaired_isolated},
        {"bridged_components", stats.bridged_components}
    };
}

// ColoringConfig serialization
inline void to_json(nlohmann::json& j, const ColoringConfig& config) {
    j = {
        {"max_steps", config.max_steps}
    };
}

inline void from_json(const nlohmann::json& j, ColoringConfig& config) {
    config.max_steps = j.value("max_steps", static_cast<uint64_t>(2000000));
}

// ChromaticResult serialization
inline void to_json(nlohmann::json& j, const ChromaticResult& result) {
    j = {
        {"colors", result.colors},
        {"exact", result.exact},
        {"steps", result.steps}
    };
}

inline void from_json(const nlohmann::json& j, ChromaticResult& result) {
    result.colors = j.value("colors", 0);
    result.exact = j.value("exact", true);
    result.steps = j.value("steps", static_cast<uint64_t>(0));
}

// GenerateConfig serialization
inline void to_json(nlohmann::json& j, const GenerateConfig& config) {
    j = {
        {"random_seed", config.random_seed},
        {"partition", config.partition},
        {"adjacency", config.adjacency},
        {"coloring", config.coloring}
    };
}

inline void from_json(const nlohmann::json& j, GenerateConfig& config) {
    config.random_seed = j.value("random_seed", 42u);
    if (j.contains("partition")) {
        config.partition = j["partition"].get<PartitionConfig>();
    }
    if (j.contains("adjacency")) {
        config.adjacency = j["adjacency"].get<AdjacencyConfig>();
    }
    if (j.contains("coloring")) {
        config.coloring = j["coloring"].get<ColoringConfig>();
    }
}

}  // namespace chromamap

#endif // CHROMAMAP_SERIALIZATION_CONFIG_JSON_HPP
