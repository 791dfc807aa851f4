#pragma once

#include <cmath>

constexpr double TWO_PI = 2.0 * M_PI;

// Continuous 2D coordinate / direction on the plane
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2() = default;
    Vec2(double x, double y) : x(x), y(y) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }
    Vec2& operator+=(const Vec2& o) {
        x += o.x;
        y += o.y;
        return *this;
    }

    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    double length() const { return std::sqrt(x * x + y * y); }
    double length_squared() const { return x * x + y * y; }

    Vec2 normalized() const {
        double len = length();
        if (len <= 0.0)
            return {0.0, 0.0};
        return {x / len, y / len};
    }
};

inline double distance(const Vec2& a, const Vec2& b) {
    return (a - b).length();
}

inline double distance_squared(const Vec2& a, const Vec2& b) {
    return (a - b).length_squared();
}

inline Vec2 heading_vector(double angle) {
    return {std::cos(angle), std::sin(angle)};
}

// Wrap an angle to [0, 2*pi)
inline double wrap_angle(double a) {
    a = std::fmod(a, TWO_PI);
    if (a < 0.0)
        a += TWO_PI;
    if (a >= TWO_PI)
        a = 0.0;
    return a;
}
