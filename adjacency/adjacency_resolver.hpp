#ifndef CHROMAMAP_ADJACENCY_RESOLVER_HPP
#define CHROMAMAP_ADJACENCY_RESOLVER_HPP

#include <region/region.hpp>
#include <cstddef>

namespace chromamap {

// Configuration for geometric adjacency detection
struct AdjacencyConfig {
    // Vertices or edges closer than this share a border
    double tolerance = 15.0;

    // Pairs whose centers are further apart than this factor times the sum
    // of both regions' radii are skipped without a border test
    double rejection_factor = 2.2;

    // Bridge disconnected groups of regions after the isolated-region repair
    bool bridge_components = true;
};

// What a resolve pass did
struct AdjacencyStats {
    size_t pair_count = 0;          // Unordered pairs examined
    size_t rejected_pairs = 0;      // Skipped by the radius test
    size_t edge_count = 0;          // Adjacent pairs after repairs
    size_t repaired_isolated = 0;   // Regions joined to their nearest neighbor
    size_t bridged_components = 0;  // Extra edges joining disconnected groups
};

// Derives region adjacency from polygon geometry alone.
// The result replaces whatever adjacent_regions held before.
class AdjacencyResolver {
public:
    static AdjacencyStats resolve(Regions& regions,
                                  const AdjacencyConfig& config = AdjacencyConfig{});

    // Border test for a single pair, without the radius rejection
    static bool share_border(const Region& a, const Region& b, double tolerance);

private:
    static void connect(Region& a, Region& b);
    static size_t repair_isolated(Regions& regions);
    static size_t bridge_components(Regions& regions);
};

}  // namespace chromamap

#endif // CHROMAMAP_ADJACENCY_RESOLVER_HPP
