#pragma once

#include <string>

namespace SandSim {

/**
 * Templated 2D vector. All operations are inline.
 * Grid positions use the Vector2i alias.
 */
template <typename T>
struct Vector2 {
    T x = T{};
    T y = T{};

    Vector2 add(const Vector2& other) const { return { x + other.x, y + other.y }; }

    Vector2 times(T scalar) const { return { x * scalar, y * scalar }; }

    std::string toString() const
    {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }

    // Chebyshev distance: number of king moves between two grid positions.
    T chebyshevDistance(const Vector2& other) const
    {
        T dx = x > other.x ? x - other.x : other.x - x;
        T dy = y > other.y ? y - other.y : other.y - y;
        return dx > dy ? dx : dy;
    }

    Vector2 operator+(const Vector2& other) const { return add(other); }

    Vector2 operator*(T scalar) const { return times(scalar); }

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }

    bool operator!=(const Vector2& other) const { return !(*this == other); }
};

using Vector2i = Vector2<int>;

} // namespace SandSim
