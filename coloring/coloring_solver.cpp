#include "coloring_solver.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace chromamap {

namespace {

// Region adjacency as index lists, dropping ids that name no region
std::vector<std::vector<size_t>> index_adjacency(const Regions& regions) {
    std::unordered_map<RegionId, size_t> index;
    for (size_t i = 0; i < regions.size(); ++i) {
        index[regions[i].id] = i;
    }

    std::vector<std::vector<size_t>> adjacency(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        for (const auto& other : regions[i].adjacent_regions) {
            auto it = index.find(other);
            if (it != index.end() && it->second != i) {
                adjacency[i].push_back(it->second);
            }
        }
    }
    return adjacency;
}

// Depth-first k-coloring search. coloring[i] == 0 means uncolored.
class Backtracker {
public:
    Backtracker(const std::vector<std::vector<size_t>>& adjacency, uint64_t max_steps)
        : adjacency_(adjacency), max_steps_(max_steps) {}

    bool can_color(int k) {
        coloring_.assign(adjacency_.size(), 0);
        return color_from(0, k);
    }

    bool exhausted() const { return exhausted_; }
    uint64_t steps() const { return steps_; }

private:
    bool is_safe(size_t region, int color) const {
        for (size_t neighbor : adjacency_[region]) {
            if (coloring_[neighbor] == color) {
                return false;
            }
        }
        return true;
    }

    bool color_from(size_t region, int k) {
        if (region == adjacency_.size()) {
            return true;
        }

        for (int color = 1; color <= k; ++color) {
            if (max_steps_ != 0 && steps_ >= max_steps_) {
                exhausted_ = true;
                return false;
            }
            ++steps_;

            if (!is_safe(region, color)) continue;

            coloring_[region] = color;
            if (color_from(region + 1, k)) {
                return true;
            }
            coloring_[region] = 0;

            if (exhausted_) {
                return false;
            }
        }
        return false;
    }

    const std::vector<std::vector<size_t>>& adjacency_;
    uint64_t max_steps_;
    uint64_t steps_ = 0;
    bool exhausted_ = false;
    std::vector<int> coloring_;
};

}  // namespace

int ColoringSolver::chromatic_number(const Regions& regions) {
    ColoringConfig unbounded;
    unbounded.max_steps = 0;
    return chromatic_number_bounded(regions, unbounded).colors;
}

ChromaticResult ColoringSolver::chromatic_number_bounded(const Regions& regions,
                                                         const ColoringConfig& config) {
    auto log = chromamap::logging::get_logger();
    ChromaticResult result;

    if (regions.empty()) {
        return result;
    }

    auto adjacency = index_adjacency(regions);
    Backtracker search(adjacency, config.max_steps);

    const int max_k = static_cast<int>(regions.size());
    for (int k = 1; k <= max_k; ++k) {
        if (search.can_color(k)) {
            result.colors = k;
            result.steps = search.steps();
            log->debug("ColoringSolver: chromatic number {} for {} regions ({} steps)",
                       k, regions.size(), result.steps);
            return result;
        }
        if (search.exhausted()) {
            break;
        }
    }

    result.exact = false;
    result.steps = search.steps();
    if (search.exhausted()) {
        result.colors = greedy_upper_bound(regions);
        log->warn("ColoringSolver: step cap of {} reached, using greedy bound {}",
                  config.max_steps, result.colors);
    } else {
        // Unreachable: k = |regions| always succeeds
        result.colors = max_k;
    }
    return result;
}

int ColoringSolver::greedy_upper_bound(const Regions& regions) {
    auto adjacency = index_adjacency(regions);

    std::vector<size_t> order(regions.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&adjacency](size_t a, size_t b) {
        return adjacency[a].size() > adjacency[b].size();
    });

    std::vector<int> coloring(regions.size(), 0);
    int max_color = 0;
    for (size_t region : order) {
        std::vector<bool> used(regions.size() + 2, false);
        for (size_t neighbor : adjacency[region]) {
            used[coloring[neighbor]] = true;
        }

        int color = 1;
        while (used[color]) {
            ++color;
        }
        coloring[region] = color;
        max_color = std::max(max_color, color);
    }
    return max_color;
}

bool ColoringSolver::has_conflict(const RegionId& region_id,
                                  const ColorToken& proposed_color,
                                  const Regions& regions) {
    const Region* region = find_region(regions, region_id);
    if (!region) {
        throw std::out_of_range("ColoringSolver::has_conflict: unknown region " + region_id);
    }

    for (const auto& adjacent_id : region->adjacent_regions) {
        const Region* adjacent = find_region(regions, adjacent_id);
        if (adjacent && adjacent->color == proposed_color) {
            return true;
        }
    }
    return false;
}

bool ColoringSolver::is_proper_coloring(const Regions& regions) {
    for (const auto& region : regions) {
        if (!region.color) continue;
        if (has_conflict(region.id, *region.color, regions)) {
            return false;
        }
    }
    return true;
}

}  // namespace chromamap
