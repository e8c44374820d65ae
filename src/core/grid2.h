#pragma once

#include <array>
#include <cstdint>

// Core Grid subsystem
// Responsible for: defining deterministic 2D integer-grid primitives shared by factory simulation code.
// Should NOT do: simulation state ownership, item logic, or display formatting beyond direction glyphs.
namespace tinyfactory::core {

struct Cell2i {
    std::int32_t x = 0;
    std::int32_t y = 0;

    constexpr Cell2i() = default;
    constexpr Cell2i(std::int32_t xIn, std::int32_t yIn) : x(xIn), y(yIn) {}

    constexpr bool operator==(const Cell2i&) const = default;

    constexpr Cell2i operator+(const Cell2i& rhs) const {
        return Cell2i{x + rhs.x, y + rhs.y};
    }

    constexpr Cell2i operator-(const Cell2i& rhs) const {
        return Cell2i{x - rhs.x, y - rhs.y};
    }

    constexpr Cell2i operator*(std::int32_t scalar) const {
        return Cell2i{x * scalar, y * scalar};
    }

    constexpr Cell2i& operator+=(const Cell2i& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }
};

inline constexpr Cell2i operator*(std::int32_t scalar, const Cell2i& cell) {
    return cell * scalar;
}

// Screen-style axes: +x is Right, +y is Down.
enum class Direction : std::uint8_t {
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3
};

// Default routing order for items with no remembered source.
inline constexpr std::array<Direction, 4> kAllDirections = {
    Direction::Right,
    Direction::Down,
    Direction::Left,
    Direction::Up
};

inline constexpr Cell2i directionDelta(Direction dir) {
    switch (dir) {
    case Direction::Up: return Cell2i{0, -1};
    case Direction::Down: return Cell2i{0, 1};
    case Direction::Left: return Cell2i{-1, 0};
    case Direction::Right: return Cell2i{1, 0};
    }
    return Cell2i{0, 0};
}

inline constexpr Direction oppositeDirection(Direction dir) {
    switch (dir) {
    case Direction::Up: return Direction::Down;
    case Direction::Down: return Direction::Up;
    case Direction::Left: return Direction::Right;
    case Direction::Right: return Direction::Left;
    }
    return Direction::Up;
}

inline constexpr Direction rotateClockwise(Direction dir) {
    switch (dir) {
    case Direction::Right: return Direction::Down;
    case Direction::Down: return Direction::Left;
    case Direction::Left: return Direction::Up;
    case Direction::Up: return Direction::Right;
    }
    return Direction::Right;
}

inline constexpr bool isHorizontal(Direction dir) {
    return dir == Direction::Left || dir == Direction::Right;
}

inline constexpr char directionArrow(Direction dir) {
    switch (dir) {
    case Direction::Up: return '^';
    case Direction::Down: return 'v';
    case Direction::Left: return '<';
    case Direction::Right: return '>';
    }
    return '?';
}

inline constexpr Cell2i neighborCell(const Cell2i& cell, Direction dir) {
    return cell + directionDelta(dir);
}

// Direction of the step from `from` to the 4-neighbor `to`.
// Falls back to the dominant axis when the cells are not adjacent.
inline constexpr Direction directionToward(const Cell2i& from, const Cell2i& to) {
    const int dx = to.x - from.x;
    const int dy = to.y - from.y;
    const int adx = dx < 0 ? -dx : dx;
    const int ady = dy < 0 ? -dy : dy;
    if (adx >= ady && dx != 0) {
        return dx > 0 ? Direction::Right : Direction::Left;
    }
    return dy > 0 ? Direction::Down : Direction::Up;
}

} // namespace tinyfactory::core
