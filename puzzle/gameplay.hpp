#ifndef CHROMAMAP_GAMEPLAY_HPP
#define CHROMAMAP_GAMEPLAY_HPP

#include <region/region.hpp>
#include <optional>

namespace chromamap {

// Outcome of a coloring move
struct ColorAttempt {
    bool accepted = false;
    bool conflict = false;
};

// Checks a move against the resolved adjacency without changing anything.
// Throws std::out_of_range for an unknown region.
ColorAttempt attempt_color(const RegionId& region_id, const ColorToken& color,
                           const Regions& regions);

// Checks a move and commits the color only when it is accepted
ColorAttempt apply_color(const RegionId& region_id, const ColorToken& color,
                         Regions& regions);

// Removes the color from one region; throws std::out_of_range if unknown
void clear_color(const RegionId& region_id, Regions& regions);

// Removes every color (restarting the same puzzle)
void clear_colors(Regions& regions);

// Every region holds a color
bool is_complete(const Regions& regions);

size_t count_distinct_colors_used(const Regions& regions);

// Region with the most neighbors, a good first move.
// Ties go to the earliest region; empty for an empty collection.
std::optional<RegionId> hint_region(const Regions& regions);

}  // namespace chromamap

#endif // CHROMAMAP_GAMEPLAY_HPP
