#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <string>

namespace sociograph {

using NodeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;

struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(double s) const { return {x * s, y * s}; }
    constexpr Point operator/(double s) const { return {x / s, y / s}; }

    Point& operator+=(const Point& o) {
        x += o.x;
        y += o.y;
        return *this;
    }
    Point& operator-=(const Point& o) {
        x -= o.x;
        y -= o.y;
        return *this;
    }

    double length() const { return std::sqrt(x * x + y * y); }
    double distanceTo(const Point& o) const { return (*this - o).length(); }

    Point normalized() const {
        double len = length();
        return len > 0.0 ? *this / len : Point{0.0, 0.0};
    }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// 8-bit RGB display color
struct Color {
    uint8_t r = 0;
    uint8_t g = 217;
    uint8_t b = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}

    constexpr bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

/// Neutral color every node returns to after a graph mutation
constexpr Color DEFAULT_NODE_COLOR{0, 217, 255};

/// Identity of an undirected edge: endpoints stored in ascending order
struct EdgeKey {
    NodeId first = INVALID_NODE;
    NodeId second = INVALID_NODE;

    constexpr EdgeKey() = default;
    constexpr EdgeKey(NodeId a, NodeId b)
        : first(a < b ? a : b), second(a < b ? b : a) {}

    constexpr bool contains(NodeId id) const { return first == id || second == id; }

    constexpr bool operator==(const EdgeKey& o) const {
        return first == o.first && second == o.second;
    }
    constexpr bool operator!=(const EdgeKey& o) const { return !(*this == o); }
    constexpr bool operator<(const EdgeKey& o) const {
        return first != o.first ? first < o.first : second < o.second;
    }
};

struct EdgeKeyHash {
    std::size_t operator()(const EdgeKey& k) const {
        return std::hash<uint32_t>()(k.first) ^ (std::hash<uint32_t>()(k.second) << 16);
    }
};

}  // namespace sociograph
