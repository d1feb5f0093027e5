#include "gameplay.hpp"
#include <coloring/coloring_solver.hpp>
#include <common/logging.hpp>
#include <set>
#include <stdexcept>

namespace chromamap {

ColorAttempt attempt_color(const RegionId& region_id, const ColorToken& color,
                           const Regions& regions) {
    ColorAttempt result;
    result.conflict = ColoringSolver::has_conflict(region_id, color, regions);
    result.accepted = !result.conflict;
    return result;
}

ColorAttempt apply_color(const RegionId& region_id, const ColorToken& color,
                         Regions& regions) {
    ColorAttempt result = attempt_color(region_id, color, regions);
    if (result.accepted) {
        find_region(regions, region_id)->color = color;
    } else {
        auto log = chromamap::logging::get_logger();
        log->debug("Rejected {} for {}: an adjacent region already holds it", color, region_id);
    }
    return result;
}

void clear_color(const RegionId& region_id, Regions& regions) {
    Region* region = find_region(regions, region_id);
    if (!region) {
        throw std::out_of_range("clear_color: unknown region " + region_id);
    }
    region->color.reset();
}

void clear_colors(Regions& regions) {
    for (auto& region : regions) {
        region.color.reset();
    }
}

bool is_complete(const Regions& regions) {
    for (const auto& region : regions) {
        if (!region.is_colored()) {
            return false;
        }
    }
    return true;
}

size_t count_distinct_colors_used(const Regions& regions) {
    std::set<ColorToken> colors;
    for (const auto& region : regions) {
        if (region.color) {
            colors.insert(*region.color);
        }
    }
    return colors.size();
}

std::optional<RegionId> hint_region(const Regions& regions) {
    if (regions.empty()) {
        return std::nullopt;
    }

    const Region* best = &regions.front();
    for (const auto& region : regions) {
        if (region.adjacent_regions.size() > best->adjacent_regions.size()) {
            best = &region;
        }
    }
    return best->id;
}

}  // namespace chromamap
