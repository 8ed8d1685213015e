#ifndef DIFFGROWTH_MATH_VEC2_HPP
#define DIFFGROWTH_MATH_VEC2_HPP

#include <cmath>
#include <cstddef>

namespace diffgrowth {

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

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    // Normalized vector, zero for a zero-length input
    Vec2 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0};
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Scale down to max_length if longer, otherwise unchanged
    Vec2 capped(double max_length) const {
        double len = length();
        if (len > max_length) {
            return *this * (max_length / len);
        }
        return *this;
    }

    // Rescale to exactly `len`. A zero vector has no direction and stays zero.
    Vec2 with_length(double len) const {
        double current = length();
        if (current > 0.0) {
            return *this * (len / current);
        }
        return *this;
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

    // Array access
    constexpr double& operator[](size_t i) {
        if (i == 0) return x;
        return y;
    }

    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        return y;
    }
};

// Scalar * Vec2
constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Midpoint of two points
constexpr Vec2 midpoint(const Vec2& a, const Vec2& b) {
    return (a + b) / 2.0;
}

namespace vec2 {
    constexpr Vec2 zero() { return {0.0, 0.0}; }
}

}  // namespace diffgrowth

#endif // DIFFGROWTH_MATH_VEC2_HPP
