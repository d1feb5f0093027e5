#include "region_partitioner.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace chromamap {

namespace {

// Crossing parameters too close to a polygon vertex are treated as
// degenerate and the cut is retried
constexpr double kVertexEpsilon = 1e-7;

// Boundary crossing of the dividing polyline
struct Crossing {
    double s = 0.0;      // Position along the polyline (segment index + t)
    size_t edge = 0;     // Polygon edge index
    double u = 0.0;      // Position along that edge
    Vec2 point;
};

// Number of boundary vertices walked going forward from a crossing on
// edge `from` to a crossing on edge `to`
size_t boundary_span(size_t from, double from_u, size_t to, double to_u, size_t vertex_count) {
    if (from == to) {
        return to_u > from_u ? 0 : vertex_count;
    }
    return (to + vertex_count - from) % vertex_count;
}

void check_board(double board_width, double board_height) {
    if (board_width <= 0.0 || board_height <= 0.0) {
        throw std::invalid_argument("RegionPartitioner: board dimensions must be positive");
    }
}

// Neighbor lists by node position in creation order
std::vector<std::vector<size_t>> node_adjacency(const Graph& graph) {
    std::unordered_map<NodeId, size_t> index;
    for (size_t i = 0; i < graph.node_count(); ++i) {
        index[graph.nodes()[i].id] = i;
    }

    std::vector<std::vector<size_t>> adjacency(graph.node_count());
    for (size_t i = 0; i < graph.node_count(); ++i) {
        for (const auto& neighbor : graph.nodes()[i].neighbors) {
            adjacency[i].push_back(index.at(neighbor));
        }
    }
    return adjacency;
}

// Divides a group of at least two nodes in two by removing the edge of its
// breadth-first spanning tree that best balances the parts. Both parts stay
// connected within the group. A disconnected group is divided into the
// first node's component and the rest.
std::pair<std::vector<size_t>, std::vector<size_t>> divide_group(
    const std::vector<size_t>& group, const std::vector<std::vector<size_t>>& adjacency) {

    std::unordered_map<size_t, size_t> position;
    for (size_t i = 0; i < group.size(); ++i) {
        position[group[i]] = i;
    }

    std::vector<size_t> parent(group.size(), 0);
    std::vector<bool> reached(group.size(), false);
    std::vector<size_t> order{0};
    reached[0] = true;
    for (size_t head = 0; head < order.size(); ++head) {
        size_t current = order[head];
        for (size_t neighbor : adjacency[group[current]]) {
            auto it = position.find(neighbor);
            if (it == position.end() || reached[it->second]) continue;
            reached[it->second] = true;
            parent[it->second] = current;
            order.push_back(it->second);
        }
    }

    std::vector<size_t> first;
    std::vector<size_t> second;

    if (order.size() < group.size()) {
        for (size_t i = 0; i < group.size(); ++i) {
            (reached[i] ? first : second).push_back(group[i]);
        }
        return {first, second};
    }

    // Subtree sizes, accumulated from the leaves up
    std::vector<size_t> subtree(group.size(), 1);
    for (size_t k = order.size() - 1; k > 0; --k) {
        subtree[parent[order[k]]] += subtree[order[k]];
    }

    auto imbalance = [&](size_t i) {
        size_t inside = 2 * subtree[i];
        return inside > group.size() ? inside - group.size() : group.size() - inside;
    };
    size_t cut = order[1];
    for (size_t k = 2; k < order.size(); ++k) {
        if (imbalance(order[k]) < imbalance(cut)) {
            cut = order[k];
        }
    }

    // The subtree below the cut edge forms the second part
    std::vector<bool> below(group.size(), false);
    for (size_t k = 1; k < order.size(); ++k) {
        size_t i = order[k];
        below[i] = i == cut || below[parent[i]];
    }
    for (size_t i = 0; i < group.size(); ++i) {
        (below[i] ? second : first).push_back(group[i]);
    }
    return {first, second};
}

}  // namespace

std::vector<RegionShape> RegionPartitioner::partition(
    const Graph& graph,
    double board_width,
    double board_height,
    double complexity,
    std::mt19937& rng,
    const PartitionConfig& config) {

    if (graph.edge_count() == 0) {
        return partition(graph.node_count(), board_width, board_height, complexity, rng, config);
    }

    auto log = chromamap::logging::get_logger();
    check_board(board_width, board_height);

    const size_t node_count = graph.node_count();
    NodeAdjacency adjacency = node_adjacency(graph);
    RegionPartitioner partitioner(board_width, board_height, complexity, rng, config);

    std::vector<GuidedCell> cells(1);
    cells[0].polygon = partitioner.make_perimeter();
    cells[0].nodes.resize(node_count);
    std::iota(cells[0].nodes.begin(), cells[0].nodes.end(), size_t{0});

    while (cells.size() < node_count) {
        if (!partitioner.split_guided(cells, adjacency)) {
            throw std::runtime_error("RegionPartitioner: no region can be subdivided further");
        }
    }

    // One node per cell now
    std::vector<RegionShape> shapes(node_count);
    for (auto& cell : cells) {
        RegionShape& shape = shapes[cell.nodes.front()];
        shape.center = label_point(cell.polygon);
        shape.vertices = std::move(cell.polygon);
    }

    log->info("RegionPartitioner: divided {}x{} board into {} regions along {} graph edges ({} fallback splits)",
              board_width, board_height, shapes.size(), graph.edge_count(), partitioner.fallback_splits_);
    return shapes;
}

std::vector<RegionShape> RegionPartitioner::partition(
    size_t region_count,
    double board_width,
    double board_height,
    double complexity,
    std::mt19937& rng,
    const PartitionConfig& config) {

    auto log = chromamap::logging::get_logger();
    check_board(board_width, board_height);

    std::vector<RegionShape> shapes;
    if (region_count == 0) {
        return shapes;
    }

    RegionPartitioner partitioner(board_width, board_height, complexity, rng, config);

    std::vector<Polygon> cells;
    cells.push_back(partitioner.make_perimeter());

    while (cells.size() < region_count) {
        if (!partitioner.split_largest(cells)) {
            throw std::runtime_error("RegionPartitioner: no region can be subdivided further");
        }
    }

    shapes.reserve(cells.size());
    for (auto& cell : cells) {
        RegionShape shape;
        shape.center = label_point(cell);
        shape.vertices = std::move(cell);
        shapes.push_back(std::move(shape));
    }

    log->info("RegionPartitioner: divided {}x{} board into {} regions ({} fallback splits)",
              board_width, board_height, shapes.size(), partitioner.fallback_splits_);
    return shapes;
}

RegionPartitioner::RegionPartitioner(double board_width, double board_height, double complexity,
                                     std::mt19937& rng, const PartitionConfig& config)
    : board_width_(board_width),
      board_height_(board_height),
      complexity_(std::clamp(complexity, 0.0, 1.0)),
      rng_(rng),
      config_(config) {
}

double RegionPartitioner::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

Polygon RegionPartitioner::make_perimeter() {
    double margin = std::min(config_.margin, 0.1 * std::min(board_width_, board_height_));
    double half_w = board_width_ * 0.5 - margin;
    double half_h = board_height_ * 0.5 - margin;
    Vec2 center(board_width_ * 0.5, board_height_ * 0.5);

    double amplitude = config_.perimeter_jitter * std::min(half_w, half_h) * (0.5 + complexity_);
    amplitude = std::min(amplitude, 0.5 * margin);
    double phase = uniform(0.0, 2.0 * std::numbers::pi);

    int steps = std::max(config_.perimeter_steps, 8);
    Polygon perimeter;
    perimeter.reserve(steps);

    for (int i = 0; i < steps; ++i) {
        double angle = 2.0 * std::numbers::pi * i / steps;
        Vec2 dir(std::cos(angle), std::sin(angle));

        // Distance from the center to the rectangle along this ray
        double reach = std::numeric_limits<double>::max();
        if (std::abs(dir.x) > 1e-12) reach = std::min(reach, half_w / std::abs(dir.x));
        if (std::abs(dir.y) > 1e-12) reach = std::min(reach, half_h / std::abs(dir.y));

        double wobble = 0.6 * std::sin(3.0 * angle + phase) + 0.4 * uniform(-1.0, 1.0);
        double radius = std::max(reach + amplitude * wobble, 0.1 * reach);
        perimeter.push_back(center + dir * radius);
    }

    ensure_counter_clockwise(perimeter);
    return perimeter;
}

bool RegionPartitioner::split_largest(std::vector<Polygon>& cells) {
    auto log = chromamap::logging::get_logger();

    std::vector<size_t> order(cells.size());
    std::iota(order.begin(), order.end(), 0);
    std::vector<double> areas(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        areas[i] = polygon_area(cells[i]);
    }
    std::stable_sort(order.begin(), order.end(),
                     [&areas](size_t a, size_t b) { return areas[a] > areas[b]; });

    for (size_t index : order) {
        auto children = split_region(cells[index]);
        if (!children) {
            log->warn("RegionPartitioner: region {} (area {:.1f}) could not be split, trying the next largest",
                      index, areas[index]);
            continue;
        }

        log->debug("RegionPartitioner: split region {} (area {:.1f}) into {:.1f} + {:.1f}",
                   index, areas[index],
                   polygon_area(children->first), polygon_area(children->second));

        // The children take the parent's place to keep spatial order
        cells[index] = std::move(children->first);
        cells.insert(cells.begin() + static_cast<std::ptrdiff_t>(index) + 1,
                     std::move(children->second));
        return true;
    }
    return false;
}

bool RegionPartitioner::split_guided(std::vector<GuidedCell>& cells, const NodeAdjacency& adjacency) {
    auto log = chromamap::logging::get_logger();

    std::vector<size_t> order;
    std::vector<double> areas(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        areas[i] = polygon_area(cells[i].polygon);
        if (cells[i].nodes.size() > 1) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(), [&cells, &areas](size_t a, size_t b) {
        if (cells[a].nodes.size() != cells[b].nodes.size()) {
            return cells[a].nodes.size() > cells[b].nodes.size();
        }
        return areas[a] > areas[b];
    });

    for (size_t index : order) {
        auto children = split_group(cells, index, adjacency);
        if (!children) {
            log->warn("RegionPartitioner: region {} ({} nodes) could not be split, trying the next one",
                      index, cells[index].nodes.size());
            continue;
        }

        log->debug("RegionPartitioner: split region {} ({} nodes) into {} + {} nodes",
                   index, cells[index].nodes.size(),
                   children->first.nodes.size(), children->second.nodes.size());

        cells[index] = std::move(children->first);
        cells.insert(cells.begin() + static_cast<std::ptrdiff_t>(index) + 1,
                     std::move(children->second));
        return true;
    }
    return false;
}

std::optional<std::pair<RegionPartitioner::GuidedCell, RegionPartitioner::GuidedCell>>
RegionPartitioner::split_group(const std::vector<GuidedCell>& cells, size_t index,
                               const NodeAdjacency& adjacency) {
    const GuidedCell& cell = cells[index];
    auto [first_nodes, second_nodes] = divide_group(cell.nodes, adjacency);

    std::vector<size_t> owner(adjacency.size(), 0);
    for (size_t j = 0; j < cells.size(); ++j) {
        for (size_t node : cells[j].nodes) {
            owner[node] = j;
        }
    }

    // The first half of a cut gets this share of the span
    const double min_fraction = config_.min_cut_fraction;
    const double max_fraction = config_.max_cut_fraction;
    const double share = static_cast<double>(first_nodes.size()) / cell.nodes.size();

    Bounds bounds = compute_bounds(cell.polygon);
    bool long_vertical = bounds.width() >= bounds.height();
    double long_side = std::max(bounds.width(), bounds.height());
    double short_side = std::min(bounds.width(), bounds.height());
    bool allow_cross = short_side > 0.0 && long_side <= config_.guide_axis_ratio * short_side;

    std::optional<std::pair<GuidedCell, GuidedCell>> best;
    int best_mismatches = std::numeric_limits<int>::max();

    for (bool vertical : {long_vertical, !long_vertical}) {
        if (vertical != long_vertical && !allow_cross) continue;

        // Either part of the group may take the first half
        for (bool swap : {false, true}) {
            const auto& a_nodes = swap ? second_nodes : first_nodes;
            const auto& b_nodes = swap ? first_nodes : second_nodes;

            double center = std::clamp(swap ? 1.0 - share : share, min_fraction, max_fraction);
            double lo = std::max(center - config_.guide_fraction_spread, min_fraction);
            double hi = std::min(center + config_.guide_fraction_spread, max_fraction);

            auto halves = organic_split(cell.polygon, vertical, lo, hi);
            if (!halves) {
                halves = straight_split(cell.polygon, vertical, center);
            }
            if (!halves) continue;

            int mismatches =
                graph_mismatches(halves->first, a_nodes, cells, index, owner, adjacency) +
                graph_mismatches(halves->second, b_nodes, cells, index, owner, adjacency);
            if (mismatches < best_mismatches) {
                best_mismatches = mismatches;
                best = std::make_pair(GuidedCell{std::move(halves->first), a_nodes},
                                      GuidedCell{std::move(halves->second), b_nodes});
            }
            if (best_mismatches == 0) {
                return best;
            }
        }
    }
    return best;
}

int RegionPartitioner::graph_mismatches(const Polygon& polygon, const std::vector<size_t>& nodes,
                                        const std::vector<GuidedCell>& cells, size_t parent_index,
                                        const std::vector<size_t>& owner,
                                        const NodeAdjacency& adjacency) const {
    std::vector<bool> linked(cells.size(), false);
    for (size_t node : nodes) {
        for (size_t neighbor : adjacency[node]) {
            linked[owner[neighbor]] = true;
        }
    }

    int mismatches = 0;
    for (size_t j = 0; j < cells.size(); ++j) {
        if (j == parent_index) continue;
        if (polygons_touch(polygon, cells[j].polygon, config_.guide_tolerance) != linked[j]) {
            ++mismatches;
        }
    }
    return mismatches;
}

std::optional<std::pair<Polygon, Polygon>> RegionPartitioner::split_region(const Polygon& parent) {
    Bounds bounds = compute_bounds(parent);
    bool vertical = bounds.width() >= bounds.height();

    auto children = organic_split(parent, vertical, config_.min_cut_fraction, config_.max_cut_fraction);
    if (children) {
        return children;
    }

    // Straight cuts, longer axis first
    children = straight_split(parent, vertical, 0.5);
    if (children) {
        return children;
    }
    return straight_split(parent, !vertical, 0.5);
}

std::optional<std::pair<Polygon, Polygon>> RegionPartitioner::organic_split(
    const Polygon& parent, bool vertical, double lo, double hi) {

    auto log = chromamap::logging::get_logger();

    int attempts = std::max(config_.max_split_attempts, 1);
    int organic_attempts = attempts / 2;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        // Full jitter first, then halve it on each further attempt
        double jitter_scale = attempt < organic_attempts
            ? 1.0
            : std::pow(0.5, attempt - organic_attempts + 1);
        double fraction = uniform(lo, hi);

        auto children = try_split(parent, vertical, fraction, jitter_scale,
                                  config_.min_area_fraction, true);
        if (children) {
            return children;
        }
        log->trace("RegionPartitioner: split attempt {} rejected (jitter scale {:.3f})",
                   attempt, jitter_scale);
    }

    ++fallback_splits_;
    log->warn("RegionPartitioner: organic split failed after {} attempts, using straight cuts",
              attempts);
    return std::nullopt;
}

std::optional<std::pair<Polygon, Polygon>> RegionPartitioner::straight_split(
    const Polygon& parent, bool vertical, double center) {

    const double offsets[] = {0.0, -0.1, 0.1, -0.15, 0.15, -0.2, 0.2};
    for (double offset : offsets) {
        double fraction = center + offset;
        if (fraction <= 0.0 || fraction >= 1.0) continue;

        auto children = try_split(parent, vertical, fraction, 0.0,
                                  config_.fallback_min_area_fraction, false);
        if (children) {
            return children;
        }
    }
    return std::nullopt;
}

Polygon RegionPartitioner::make_cut_line(const Bounds& bounds, bool vertical, double fraction,
                                         double jitter_scale) {
    int segments = std::max(config_.cut_segments, 1);
    Polygon line;
    line.reserve(segments + 1);

    // The line runs along `along` and is displaced along `across`
    double along_min = vertical ? bounds.min_y : bounds.min_x;
    double along_max = vertical ? bounds.max_y : bounds.max_x;
    double across_min = vertical ? bounds.min_x : bounds.min_y;
    double across_max = vertical ? bounds.max_x : bounds.max_y;

    // Overshoot so both ends lie outside the region
    double pad = 1.0 + 0.01 * (along_max - along_min);
    along_min -= pad;
    along_max += pad;

    double base = across_min + (across_max - across_min) * fraction;
    double max_variation = (across_max - across_min) * config_.cut_variation *
                           (0.5 + complexity_) * jitter_scale;

    for (int i = 0; i <= segments; ++i) {
        double t = static_cast<double>(i) / segments;
        double along = along_min + (along_max - along_min) * t;
        double variation = std::sin(t * std::numbers::pi * 2.0) * max_variation * uniform(-0.5, 0.5);
        double across = base + variation;
        line.push_back(vertical ? Vec2(across, along) : Vec2(along, across));
    }
    return line;
}

Vec2 RegionPartitioner::jittered_midpoint(const Vec2& a, const Vec2& b, const Polygon& parent,
                                          double jitter_scale) {
    Vec2 mid = (a + b) * 0.5;
    double length = a.distance_to(b);
    double max_offset = std::min(config_.connector_jitter * length, config_.connector_jitter_cap);
    double offset = max_offset * jitter_scale * uniform(-1.0, 1.0);

    Vec2 moved = mid + (b - a).perpendicular().normalized() * offset;
    if (!contains_point(parent, moved)) {
        return mid;
    }
    return moved;
}

std::optional<std::pair<Polygon, Polygon>> RegionPartitioner::try_split(
    const Polygon& parent, bool vertical, double fraction,
    double jitter_scale, double min_area_fraction, bool require_centroid) {

    const size_t n = parent.size();
    Polygon line = make_cut_line(compute_bounds(parent), vertical, fraction, jitter_scale);

    // Collect every crossing of the polyline with the region boundary
    std::vector<Crossing> crossings;
    for (size_t k = 0; k + 1 < line.size(); ++k) {
        for (size_t j = 0; j < n; ++j) {
            auto hit = intersect_segments(line[k], line[k + 1], parent[j], parent[(j + 1) % n]);
            if (!hit) continue;
            if (hit->u < kVertexEpsilon || hit->u > 1.0 - kVertexEpsilon) {
                return std::nullopt;  // Through a vertex
            }
            if (hit->t >= 1.0 && k + 2 < line.size()) {
                continue;  // Counted at the start of the next segment
            }
            crossings.push_back({static_cast<double>(k) + hit->t, j, hit->u, hit->point});
        }
    }

    if (crossings.size() < 2 || crossings.size() % 2 != 0) {
        return std::nullopt;
    }
    std::sort(crossings.begin(), crossings.end(),
              [](const Crossing& a, const Crossing& b) { return a.s < b.s; });

    // The line starts outside, so pairs (0,1), (2,3), ... are inside
    // intervals. Cut along the longest one.
    size_t best = 0;
    for (size_t i = 2; i + 1 < crossings.size(); i += 2) {
        if (crossings[i + 1].s - crossings[i].s > crossings[best + 1].s - crossings[best].s) {
            best = i;
        }
    }
    const Crossing& entry = crossings[best];
    const Crossing& exit = crossings[best + 1];

    // Interior path: entry point, polyline vertices inside, exit point,
    // with a jittered midpoint on each connector to the old boundary
    std::vector<Vec2> inner;
    for (size_t i = 0; i < line.size(); ++i) {
        double s = static_cast<double>(i);
        if (s > entry.s && s < exit.s) {
            inner.push_back(line[i]);
        }
    }

    Polygon path;
    path.push_back(entry.point);
    if (inner.empty()) {
        path.push_back(jittered_midpoint(entry.point, exit.point, parent, jitter_scale));
    } else {
        path.push_back(jittered_midpoint(entry.point, inner.front(), parent, jitter_scale));
        path.insert(path.end(), inner.begin(), inner.end());
        path.push_back(jittered_midpoint(inner.back(), exit.point, parent, jitter_scale));
    }
    path.push_back(exit.point);

    // First child: along the cut, then forward on the boundary back to the entry
    Polygon first = path;
    size_t first_span = boundary_span(exit.edge, exit.u, entry.edge, entry.u, n);
    for (size_t i = 1; i <= first_span; ++i) {
        first.push_back(parent[(exit.edge + i) % n]);
    }

    // Second child: the cut in reverse, then forward from the entry to the exit
    Polygon second(path.rbegin(), path.rend());
    size_t second_span = boundary_span(entry.edge, entry.u, exit.edge, exit.u, n);
    for (size_t i = 1; i <= second_span; ++i) {
        second.push_back(parent[(entry.edge + i) % n]);
    }

    ensure_counter_clockwise(first);
    ensure_counter_clockwise(second);

    if (!validate_split(parent, first, second, min_area_fraction, require_centroid)) {
        return std::nullopt;
    }
    return std::make_pair(std::move(first), std::move(second));
}

bool RegionPartitioner::validate_split(const Polygon& parent, const Polygon& first,
                                       const Polygon& second, double min_area_fraction,
                                       bool require_centroid) const {
    if (first.size() < 3 || second.size() < 3) {
        return false;
    }

    double parent_area = polygon_area(parent);
    double first_area = polygon_area(first);
    double second_area = polygon_area(second);
    if (first_area < parent_area * min_area_fraction ||
        second_area < parent_area * min_area_fraction) {
        return false;
    }

    // The children must tile the parent exactly
    if (std::abs(first_area + second_area - parent_area) > 1e-6 * parent_area + 1e-6) {
        return false;
    }

    if (!is_simple(first) || !is_simple(second)) {
        return false;
    }

    if (require_centroid) {
        if (!contains_point(first, polygon_centroid(first)) ||
            !contains_point(second, polygon_centroid(second))) {
            return false;
        }
    }
    return true;
}

}  // namespace chromamap
