#include "adjacency_resolver.hpp"
#include <common/logging.hpp>
#include <graph/graph.hpp>
#include <geometry/polygon.hpp>
#include <limits>
#include <unordered_set>
#include <vector>

namespace chromamap {

bool AdjacencyResolver::share_border(const Region& a, const Region& b, double tolerance) {
    return polygons_touch(a.vertices, b.vertices, tolerance);
}

void AdjacencyResolver::connect(Region& a, Region& b) {
    a.adjacent_regions.insert(b.id);
    b.adjacent_regions.insert(a.id);
}

AdjacencyStats AdjacencyResolver::resolve(Regions& regions, const AdjacencyConfig& config) {
    auto log = chromamap::logging::get_logger();
    AdjacencyStats stats;

    for (auto& region : regions) {
        region.adjacent_regions.clear();
    }

    std::vector<double> radii(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        radii[i] = max_radius(regions[i].vertices, regions[i].center);
    }

    for (size_t i = 0; i < regions.size(); ++i) {
        for (size_t j = i + 1; j < regions.size(); ++j) {
            ++stats.pair_count;

            double center_distance = regions[i].center.distance_to(regions[j].center);
            if (center_distance > config.rejection_factor * (radii[i] + radii[j])) {
                ++stats.rejected_pairs;
                continue;
            }

            if (share_border(regions[i], regions[j], config.tolerance)) {
                connect(regions[i], regions[j]);
                log->trace("AdjacencyResolver: {} borders {}", regions[i].id, regions[j].id);
            }
        }
    }

    if (regions.size() > 1) {
        stats.repaired_isolated = repair_isolated(regions);
        if (config.bridge_components) {
            stats.bridged_components = bridge_components(regions);
        }
    }

    for (const auto& region : regions) {
        stats.edge_count += region.adjacent_regions.size();
    }
    stats.edge_count /= 2;

    log->debug("AdjacencyResolver: {} regions, {} adjacent pairs ({} of {} pairs rejected early)",
               regions.size(), stats.edge_count, stats.rejected_pairs, stats.pair_count);
    return stats;
}

size_t AdjacencyResolver::repair_isolated(Regions& regions) {
    auto log = chromamap::logging::get_logger();
    size_t repaired = 0;

    for (size_t i = 0; i < regions.size(); ++i) {
        if (!regions[i].adjacent_regions.empty()) continue;

        size_t nearest = i;
        double nearest_distance = std::numeric_limits<double>::max();
        for (size_t j = 0; j < regions.size(); ++j) {
            if (j == i) continue;
            double d = regions[i].center.distance_to(regions[j].center);
            if (d < nearest_distance) {
                nearest_distance = d;
                nearest = j;
            }
        }

        connect(regions[i], regions[nearest]);
        ++repaired;
        log->warn("AdjacencyResolver: {} had no neighbors, joined to nearest region {}",
                  regions[i].id, regions[nearest].id);
    }
    return repaired;
}

size_t AdjacencyResolver::bridge_components(Regions& regions) {
    auto log = chromamap::logging::get_logger();
    size_t bridges = 0;

    auto components = Graph::from_regions(regions).components();
    while (components.size() > 1) {
        std::unordered_set<RegionId> first(components[0].begin(), components[0].end());

        // Closest pair of centers between the first group and the rest
        size_t best_a = 0;
        size_t best_b = 0;
        double best_distance = std::numeric_limits<double>::max();
        for (size_t i = 0; i < regions.size(); ++i) {
            if (!first.count(regions[i].id)) continue;
            for (size_t j = 0; j < regions.size(); ++j) {
                if (first.count(regions[j].id)) continue;
                double d = regions[i].center.distance_to(regions[j].center);
                if (d < best_distance) {
                    best_distance = d;
                    best_a = i;
                    best_b = j;
                }
            }
        }

        connect(regions[best_a], regions[best_b]);
        ++bridges;
        log->warn("AdjacencyResolver: bridged disconnected regions {} and {}",
                  regions[best_a].id, regions[best_b].id);

        components = Graph::from_regions(regions).components();
    }
    return bridges;
}

}  // namespace chromamap
