#ifndef CHROMAMAP_REGION_HPP
#define CHROMAMAP_REGION_HPP

#include <geometry/polygon.hpp>
#include <math/vec2.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chromamap {

using RegionId = std::string;
using ColorToken = std::string;

// One cell produced by the partitioner, before it becomes a Region
struct RegionShape {
    Polygon vertices;
    Vec2 center;
};

// A puzzle piece that must receive exactly one color.
// adjacent_regions is filled by the AdjacencyResolver and is symmetric
// across the collection; color is owned by the caller during play.
struct Region {
    RegionId id;
    Polygon vertices;
    Vec2 center;
    std::optional<ColorToken> color;
    std::set<RegionId> adjacent_regions;

    bool is_colored() const { return color.has_value(); }

    bool is_adjacent_to(const RegionId& other) const {
        return adjacent_regions.count(other) > 0;
    }
};

using Regions = std::vector<Region>;

// Linear lookup by id; returns nullptr when absent
inline const Region* find_region(const Regions& regions, const RegionId& id) {
    for (const auto& region : regions) {
        if (region.id == id) {
            return &region;
        }
    }
    return nullptr;
}

inline Region* find_region(Regions& regions, const RegionId& id) {
    for (auto& region : regions) {
        if (region.id == id) {
            return &region;
        }
    }
    return nullptr;
}

}  // namespace chromamap

#endif // CHROMAMAP_REGION_HPP
