#ifndef CHROMAMAP_GEOMETRY_POLYGON_HPP
#define CHROMAMAP_GEOMETRY_POLYGON_HPP

#include <math/vec2.hpp>
#include <optional>
#include <vector>

namespace chromamap {

// Closed polygon; the last vertex connects back to the first.
using Polygon = std::vector<Vec2>;

// Axis-aligned bounding box
struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

// Intersection of two segments p(t) = p1 + t*(p2-p1), q(u) = q1 + u*(q2-q1)
struct SegmentHit {
    double t = 0.0;
    double u = 0.0;
    Vec2 point;
};

Bounds compute_bounds(const Polygon& polygon);

// Shoelace formula. Positive for counter-clockwise winding (y up).
double signed_area(const Polygon& polygon);
double polygon_area(const Polygon& polygon);

// Area-weighted centroid; falls back to the vertex average for
// degenerate (zero-area) input.
Vec2 polygon_centroid(const Polygon& polygon);
Vec2 vertex_average(const Polygon& polygon);

// Reverse the winding if the polygon is clockwise
void ensure_counter_clockwise(Polygon& polygon);

// Even-odd ray casting test
bool contains_point(const Polygon& polygon, const Vec2& point);

// Largest vertex distance from center
double max_radius(const Polygon& polygon, const Vec2& center);

double point_segment_distance(const Vec2& point, const Vec2& seg_start, const Vec2& seg_end);

// Minimum distance between two segments: the smallest of the four
// endpoint-to-segment projections, or 0 when the segments cross.
double segment_distance(const Vec2& a1, const Vec2& a2, const Vec2& b1, const Vec2& b2);

// True if the closed segments share at least one point (touching and
// collinear overlap included)
bool segments_intersect(const Vec2& p1, const Vec2& p2, const Vec2& q1, const Vec2& q2);

// Crossing point of two non-parallel segments, if it lies on both
std::optional<SegmentHit> intersect_segments(const Vec2& p1, const Vec2& p2,
                                             const Vec2& q1, const Vec2& q2);

// True if some vertex pair or edge pair of the two polygons is closer than
// tolerance. Bounding boxes further apart than tolerance are rejected first.
bool polygons_touch(const Polygon& a, const Polygon& b, double tolerance);

// A polygon is simple if it has at least three vertices, no zero-length
// edges, no spikes folding back on themselves, and no two non-adjacent
// edges touch.
bool is_simple(const Polygon& polygon);

// A point guaranteed to lie inside the polygon: the midpoint of the widest
// horizontal interior chord through the centroid height.
Vec2 interior_point(const Polygon& polygon);

// Centroid if the polygon contains it, interior_point otherwise
Vec2 label_point(const Polygon& polygon);

}  // namespace chromamap

#endif // CHROMAMAP_GEOMETRY_POLYGON_HPP
