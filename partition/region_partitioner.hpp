#ifndef CHROMAMAP_REGION_PARTITIONER_HPP
#define CHROMAMAP_REGION_PARTITIONER_HPP

#include <graph/graph.hpp>
#include <geometry/polygon.hpp>
#include <region/region.hpp>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace chromamap {

// Configuration for dividing the board into regions
struct PartitionConfig {
    // Inset of the outer perimeter from the board edge (shrunk on small boards)
    double margin = 60.0;

    // Samples along the organic board perimeter
    int perimeter_steps = 48;

    // Radial perimeter wobble, as a fraction of the smaller half-extent
    float perimeter_jitter = 0.02f;

    // Segments in each dividing polyline
    int cut_segments = 8;

    // Cut position range, as a fraction of the region's bounding box span
    float min_cut_fraction = 0.3f;
    float max_cut_fraction = 0.7f;

    // Sideways wobble of a dividing polyline, as a fraction of the
    // perpendicular bounding box span
    float cut_variation = 0.1f;

    // Perpendicular displacement of connector midpoints: fraction of the
    // connector length, capped at connector_jitter_cap units
    float connector_jitter = 0.15f;
    double connector_jitter_cap = 6.0;

    // Organic split attempts per region before falling back to straight cuts
    int max_split_attempts = 12;

    // Each child must keep at least this fraction of the parent's area
    float min_area_fraction = 0.15f;
    float fallback_min_area_fraction = 0.02f;

    // Graph-guided splits: contact distance used when comparing candidate
    // cuts with the graph's edges (generate_puzzle uses the adjacency tolerance)
    double guide_tolerance = 15.0;
    // A cell is also tried with a cut across its longer side while its
    // bounding box is at most this elongated
    float guide_axis_ratio = 2.0f;
    // Random spread around the cut position matching the group sizes
    float guide_fraction_spread = 0.05f;
};

// Turns the board rectangle into one simple polygon per graph node by
// recursively splitting regions along organic polylines.
class RegionPartitioner {
public:
    // Returns graph.node_count() shapes, in node creation order.
    // Each cell starts out holding a connected group of nodes. A cell's
    // group is halved across the spanning tree edge that balances it best,
    // and the cut is chosen among both axes and both side assignments as
    // the one whose contacts with the other cells best match the graph.
    // A graph without edges is partitioned like the count overload.
    static std::vector<RegionShape> partition(
        const Graph& graph,
        double board_width,
        double board_height,
        double complexity,
        std::mt19937& rng,
        const PartitionConfig& config = PartitionConfig{}
    );

    // Unguided: repeatedly splits the largest region, returned in spatial
    // split order
    static std::vector<RegionShape> partition(
        size_t region_count,
        double board_width,
        double board_height,
        double complexity,
        std::mt19937& rng,
        const PartitionConfig& config = PartitionConfig{}
    );

private:
    // A cell of the guided partition and the graph nodes it will hold
    struct GuidedCell {
        Polygon polygon;
        std::vector<size_t> nodes;
    };
    using NodeAdjacency = std::vector<std::vector<size_t>>;

    RegionPartitioner(double board_width, double board_height, double complexity,
                      std::mt19937& rng, const PartitionConfig& config);

    // Star-shaped approximation of the inset board rectangle
    Polygon make_perimeter();

    // Splits one region of cells in place; tries the largest first.
    // Returns false only if no region could be split at all.
    bool split_largest(std::vector<Polygon>& cells);

    // Splits the cell holding the most nodes (larger area first on ties);
    // falls through to the next cell if a cell cannot be split.
    bool split_guided(std::vector<GuidedCell>& cells, const NodeAdjacency& adjacency);

    // Best-matching split of one cell, empty if no cut succeeded
    std::optional<std::pair<GuidedCell, GuidedCell>> split_group(
        const std::vector<GuidedCell>& cells, size_t index, const NodeAdjacency& adjacency);

    // Other cells whose contact with polygon disagrees with the graph
    int graph_mismatches(const Polygon& polygon, const std::vector<size_t>& nodes,
                         const std::vector<GuidedCell>& cells, size_t parent_index,
                         const std::vector<size_t>& owner, const NodeAdjacency& adjacency) const;

    // Organic attempts followed by straight fallback cuts
    std::optional<std::pair<Polygon, Polygon>> split_region(const Polygon& parent);

    // Organic attempts on one axis with the cut position drawn from [lo, hi].
    // Counts a fallback split when every attempt fails.
    std::optional<std::pair<Polygon, Polygon>> organic_split(
        const Polygon& parent, bool vertical, double lo, double hi);

    // Straight cuts on one axis at fixed offsets around center
    std::optional<std::pair<Polygon, Polygon>> straight_split(
        const Polygon& parent, bool vertical, double center);

    // A single cut across the parent at the given fraction of its span.
    // jitter_scale 0 gives a straight cut with plain connectors.
    std::optional<std::pair<Polygon, Polygon>> try_split(
        const Polygon& parent, bool vertical, double fraction,
        double jitter_scale, double min_area_fraction, bool require_centroid);

    // Polyline spanning the whole bounding box, monotone along its axis
    Polygon make_cut_line(const Bounds& bounds, bool vertical, double fraction,
                          double jitter_scale);

    // Midpoint of a-b pushed sideways, kept inside the parent
    Vec2 jittered_midpoint(const Vec2& a, const Vec2& b, const Polygon& parent,
                           double jitter_scale);

    bool validate_split(const Polygon& parent, const Polygon& first, const Polygon& second,
                        double min_area_fraction, bool require_centroid) const;

    double uniform(double lo, double hi);

    double board_width_;
    double board_height_;
    double complexity_;
    std::mt19937& rng_;
    PartitionConfig config_;
    int fallback_splits_ = 0;
};

}  // namespace chromamap

#endif // CHROMAMAP_REGION_PARTITIONER_HPP
