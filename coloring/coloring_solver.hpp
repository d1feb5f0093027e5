#ifndef CHROMAMAP_COLORING_SOLVER_HPP
#define CHROMAMAP_COLORING_SOLVER_HPP

#include <region/region.hpp>
#include <cstdint>

namespace chromamap {

// Configuration for the exact solver
struct ColoringConfig {
    // Total color assignments the backtracking search may try across all k
    // before settling for the greedy upper bound. 0 disables the cap.
    uint64_t max_steps = 2000000;
};

// Result of a bounded chromatic number search
struct ChromaticResult {
    int colors = 0;
    bool exact = true;     // False when the step cap forced the greedy bound
    uint64_t steps = 0;    // Color assignments tried
};

// Graph coloring over the region adjacency. Stateless: every call works
// on the snapshot it is given.
class ColoringSolver {
public:
    // Minimum number of colors, by backtracking over regions in collection
    // order for k = 1, 2, ... Returns 0 for an empty collection.
    static int chromatic_number(const Regions& regions);

    // Same search with a step cap; falls back to greedy_upper_bound when hit
    static ChromaticResult chromatic_number_bounded(const Regions& regions,
                                                    const ColoringConfig& config = ColoringConfig{});

    // Welsh-Powell: color regions by descending degree with the smallest
    // free color. An upper bound on the chromatic number.
    static int greedy_upper_bound(const Regions& regions);

    // True if a region adjacent to region_id currently holds proposed_color.
    // Throws std::out_of_range for an unknown region_id.
    static bool has_conflict(const RegionId& region_id,
                             const ColorToken& proposed_color,
                             const Regions& regions);

    // No two adjacent colored regions share a color
    static bool is_proper_coloring(const Regions& regions);
};

}  // namespace chromamap

#endif // CHROMAMAP_COLORING_SOLVER_HPP
