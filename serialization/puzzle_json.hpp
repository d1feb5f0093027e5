#ifndef CHROMAMAP_SERIALIZATION_PUZZLE_JSON_HPP
#define CHROMAMAP_SERIALIZATION_PUZZLE_JSON_HPP

#include <nlohmann/json.hpp>
#include <puzzle/puzzle.hpp>
#include <region/region.hpp>
#include "config_json.hpp"

namespace chromamap {

// Region serialization. color is a string or null.
inline void to_json(nlohmann::json& j, const Region& region) {
    j["id"] = region.id;
    j["vertices"] = region.vertices;
    j["center"] = region.center;
    if (region.color) {
        j["color"] = *region.color;
    } else {
        j["color"] = nullptr;
    }
    j["adjacent_regions"] = region.adjacent_regions;
}

inline void from_json(const nlohmann::json& j, Region& region) {
    region.id = j.at("id").get<RegionId>();
    region.vertices = j.at("vertices").get<Polygon>();
    if (j.contains("center")) {
        region.center = j["center"].get<Vec2>();
    } else {
        region.center = label_point(region.vertices);
    }
    if (j.contains("color") && !j["color"].is_null()) {
        region.color = j["color"].get<ColorToken>();
    } else {
        region.color.reset();
    }
    region.adjacent_regions.clear();
    if (j.contains("adjacent_regions")) {
        for (const auto& id : j["adjacent_regions"]) {
            region.adjacent_regions.insert(id.get<RegionId>());
        }
    }
}

// Puzzle serialization
inline void to_json(nlohmann::json& j, const Puzzle& puzzle) {
    j = {
        {"regions", puzzle.regions},
        {"minimum_colors", puzzle.minimum_colors},
        {"minimum_exact", puzzle.minimum_exact},
        {"difficulty", puzzle.difficulty}
    };
}

inline void from_json(const nlohmann::json& j, Puzzle& puzzle) {
    puzzle.regions = j.at("regions").get<Regions>();
    puzzle.minimum_colors = j.value("minimum_colors", 0);
    puzzle.minimum_exact = j.value("minimum_exact", true);
    if (j.contains("difficulty")) {
        puzzle.difficulty = j["difficulty"].get<DifficultyConfig>();
    }
}

// Headline numbers stored beside a puzzle payload
inline nlohmann::json puzzle_summary(const Puzzle& puzzle) {
    size_t adjacency_ends = 0;
    for (const auto& region : puzzle.regions) {
        adjacency_ends += region.adjacent_regions.size();
    }
    return {
        {"region_count", puzzle.regions.size()},
        {"adjacency_count", adjacency_ends / 2},
        {"minimum_colors", puzzle.minimum_colors},
        {"minimum_exact", puzzle.minimum_exact}
    };
}

}  // namespace chromamap

#endif // CHROMAMAP_SERIALIZATION_PUZZLE_JSON_HPP
