#ifndef CHROMAMAP_MATH_VEC2_HPP
#define CHROMAMAP_MATH_VEC2_HPP

#include <cmath>

namespace chromamap {

// A point or direction on the board plane.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    constexpr Vec2& operator/=(double scalar) {
        x /= scalar; y /= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // z component of the 3D cross product; positive when other is
    // counter-clockwise from this
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    // Counter-clockwise perpendicular
    constexpr Vec2 perpendicular() const {
        return {-y, x};
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y;
    }

    // Magnitude
    double length() const {
        return std::sqrt(length_squared());
    }

    // Normalized vector
    Vec2 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0};
    }

    // Distance to another point
    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

};

// Scalar * Vec2
constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Linear interpolation
constexpr Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return a * (1.0 - t) + b * t;
}

// Common constants
namespace vec2 {
    constexpr Vec2 zero() { return {0.0, 0.0}; }
    constexpr Vec2 unit_x() { return {1.0, 0.0}; }
    constexpr Vec2 unit_y() { return {0.0, 1.0}; }
}

}  // namespace chromamap

#endif // CHROMAMAP_MATH_VEC2_HPP
