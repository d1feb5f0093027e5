#include "polygon.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace chromamap {

namespace {

constexpr double kEpsilon = 1e-9;

// Sign of the turn a -> b -> c, with a tolerance relative to the operand
// lengths so that nearly collinear triples count as collinear.
int orientation(const Vec2& a, const Vec2& b, const Vec2& c) {
    Vec2 ab = b - a;
    Vec2 ac = c - a;
    double value = ab.cross(ac);
    double scale = ab.length() * ac.length();
    if (std::abs(value) <= kEpsilon * scale) {
        return 0;
    }
    return value > 0.0 ? 1 : -1;
}

// p is known to be collinear with a-b; check it lies within the segment
bool on_segment(const Vec2& a, const Vec2& b, const Vec2& p) {
    return p.x <= std::max(a.x, b.x) + kEpsilon && p.x >= std::min(a.x, b.x) - kEpsilon &&
           p.y <= std::max(a.y, b.y) + kEpsilon && p.y >= std::min(a.y, b.y) - kEpsilon;
}

}  // namespace

Bounds compute_bounds(const Polygon& polygon) {
    Bounds bounds;
    if (polygon.empty()) {
        return bounds;
    }

    bounds.min_x = bounds.max_x = polygon[0].x;
    bounds.min_y = bounds.max_y = polygon[0].y;
    for (const auto& v : polygon) {
        bounds.min_x = std::min(bounds.min_x, v.x);
        bounds.max_x = std::max(bounds.max_x, v.x);
        bounds.min_y = std::min(bounds.min_y, v.y);
        bounds.max_y = std::max(bounds.max_y, v.y);
    }
    return bounds;
}

double signed_area(const Polygon& polygon) {
    double area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % polygon.size()];
        area += a.cross(b);
    }
    return area * 0.5;
}

double polygon_area(const Polygon& polygon) {
    return std::abs(signed_area(polygon));
}

Vec2 vertex_average(const Polygon& polygon) {
    if (polygon.empty()) {
        return vec2::zero();
    }
    Vec2 sum;
    for (const auto& v : polygon) {
        sum += v;
    }
    return sum / static_cast<double>(polygon.size());
}

Vec2 polygon_centroid(const Polygon& polygon) {
    double area = signed_area(polygon);
    if (std::abs(area) < kEpsilon) {
        return vertex_average(polygon);
    }

    // Shift to the first vertex to keep the products small
    const Vec2 origin = polygon[0];
    Vec2 acc;
    for (size_t i = 0; i < polygon.size(); ++i) {
        Vec2 a = polygon[i] - origin;
        Vec2 b = polygon[(i + 1) % polygon.size()] - origin;
        double cross = a.cross(b);
        acc += (a + b) * cross;
    }
    return origin + acc / (6.0 * area);
}

void ensure_counter_clockwise(Polygon& polygon) {
    if (signed_area(polygon) < 0.0) {
        std::reverse(polygon.begin(), polygon.end());
    }
}

bool contains_point(const Polygon& polygon, const Vec2& point) {
    bool inside = false;
    for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[j];
        if ((a.y > point.y) != (b.y > point.y)) {
            double x_cross = a.x + (point.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (point.x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double max_radius(const Polygon& polygon, const Vec2& center) {
    double radius = 0.0;
    for (const auto& v : polygon) {
        radius = std::max(radius, v.distance_to(center));
    }
    return radius;
}

double point_segment_distance(const Vec2& point, const Vec2& seg_start, const Vec2& seg_end) {
    Vec2 seg = seg_end - seg_start;
    double len_sq = seg.length_squared();
    if (len_sq == 0.0) {
        return point.distance_to(seg_start);
    }

    double param = (point - seg_start).dot(seg) / len_sq;
    if (param < 0.0) {
        return point.distance_to(seg_start);
    }
    if (param > 1.0) {
        return point.distance_to(seg_end);
    }
    return point.distance_to(seg_start + seg * param);
}

double segment_distance(const Vec2& a1, const Vec2& a2, const Vec2& b1, const Vec2& b2) {
    if (segments_intersect(a1, a2, b1, b2)) {
        return 0.0;
    }
    return std::min({
        point_segment_distance(a1, b1, b2),
        point_segment_distance(a2, b1, b2),
        point_segment_distance(b1, a1, a2),
        point_segment_distance(b2, a1, a2)
    });
}

bool segments_intersect(const Vec2& p1, const Vec2& p2, const Vec2& q1, const Vec2& q2) {
    int o1 = orientation(p1, p2, q1);
    int o2 = orientation(p1, p2, q2);
    int o3 = orientation(q1, q2, p1);
    int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) {
        return true;
    }

    // Collinear special cases
    if (o1 == 0 && on_segment(p1, p2, q1)) return true;
    if (o2 == 0 && on_segment(p1, p2, q2)) return true;
    if (o3 == 0 && on_segment(q1, q2, p1)) return true;
    if (o4 == 0 && on_segment(q1, q2, p2)) return true;

    return false;
}

std::optional<SegmentHit> intersect_segments(const Vec2& p1, const Vec2& p2,
                                             const Vec2& q1, const Vec2& q2) {
    Vec2 r = p2 - p1;
    Vec2 s = q2 - q1;
    double denom = r.cross(s);
    if (std::abs(denom) < kEpsilon * r.length() * s.length()) {
        return std::nullopt;  // Parallel or degenerate
    }

    Vec2 qp = q1 - p1;
    double t = qp.cross(s) / denom;
    double u = qp.cross(r) / denom;
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
        return std::nullopt;
    }

    return SegmentHit{t, u, p1 + r * t};
}

bool polygons_touch(const Polygon& a, const Polygon& b, double tolerance) {
    if (a.empty() || b.empty()) {
        return false;
    }

    Bounds ba = compute_bounds(a);
    Bounds bb = compute_bounds(b);
    if (ba.max_x + tolerance < bb.min_x || bb.max_x + tolerance < ba.min_x ||
        ba.max_y + tolerance < bb.min_y || bb.max_y + tolerance < ba.min_y) {
        return false;
    }

    for (const auto& va : a) {
        for (const auto& vb : b) {
            if (va.distance_to(vb) < tolerance) {
                return true;
            }
        }
    }

    for (size_t i = 0; i < a.size(); ++i) {
        const Vec2& a1 = a[i];
        const Vec2& a2 = a[(i + 1) % a.size()];
        for (size_t j = 0; j < b.size(); ++j) {
            if (segment_distance(a1, a2, b[j], b[(j + 1) % b.size()]) < tolerance) {
                return true;
            }
        }
    }
    return false;
}

bool is_simple(const Polygon& polygon) {
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }

    for (size_t i = 0; i < n; ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % n];
        const Vec2& c = polygon[(i + 2) % n];
        if (a.distance_to(b) < kEpsilon) {
            return false;
        }
        // Consecutive edges doubling back over each other
        if (orientation(a, b, c) == 0 && (b - a).dot(c - b) < 0.0) {
            return false;
        }
    }

    if (n == 3) {
        return std::abs(signed_area(polygon)) > kEpsilon;
    }

    for (size_t i = 0; i < n; ++i) {
        const Vec2& a1 = polygon[i];
        const Vec2& a2 = polygon[(i + 1) % n];
        for (size_t j = i + 2; j < n; ++j) {
            if (i == 0 && j == n - 1) {
                continue;  // Edges sharing the closing vertex
            }
            if (segments_intersect(a1, a2, polygon[j], polygon[(j + 1) % n])) {
                return false;
            }
        }
    }
    return true;
}

Vec2 interior_point(const Polygon& polygon) {
    Vec2 centroid = polygon_centroid(polygon);
    double y = centroid.y;

    std::vector<double> crossings;
    for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[j];
        if ((a.y > y) != (b.y > y)) {
            crossings.push_back(a.x + (y - a.y) * (b.x - a.x) / (b.y - a.y));
        }
    }
    std::sort(crossings.begin(), crossings.end());

    double best_width = -1.0;
    Vec2 best = vertex_average(polygon);
    for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
        double width = crossings[i + 1] - crossings[i];
        if (width > best_width) {
            best_width = width;
            best = Vec2((crossings[i] + crossings[i + 1]) * 0.5, y);
        }
    }
    return best;
}

Vec2 label_point(const Polygon& polygon) {
    Vec2 centroid = polygon_centroid(polygon);
    if (contains_point(polygon, centroid)) {
        return centroid;
    }
    return interior_point(polygon);
}

}  // namespace chromamap
