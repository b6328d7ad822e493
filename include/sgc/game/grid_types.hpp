#pragma once

/// @file grid_types.hpp
/// @brief Coordinates, directions and tile classification of the battle grid.

#include <compare>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string_view>

namespace sgc::game {

/// Integer grid coordinate.  Valid coordinates lie in [0, gridSize).
struct Position {
    int32_t x = 0;
    int32_t y = 0;

    constexpr Position() = default;
    constexpr Position(int32_t x, int32_t y) : x(x), y(y) {}

    constexpr Position operator+(const Position& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Position operator-(const Position& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }

    constexpr auto operator<=>(const Position&) const = default;
};

/// |dx| + |dy|.
[[nodiscard]] inline int32_t ManhattanDistance(Position a, Position b) noexcept {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

/// Cardinal facing / movement direction.  "up" decreases y.
enum class Direction : uint8_t {
    Up,
    Down,
    Left,
    Right
};

/// Unit offset of a direction.
[[nodiscard]] constexpr Position StepOffset(Direction dir) noexcept {
    switch (dir) {
        case Direction::Up:    return {0, -1};
        case Direction::Down:  return {0, 1};
        case Direction::Left:  return {-1, 0};
        case Direction::Right: return {1, 0};
    }
    return {0, 0};
}

constexpr std::string_view DirectionName(Direction dir) noexcept {
    switch (dir) {
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "unknown";
}

/// Static / semi-static terrain classification of a tile.
///
/// Independent of entity occupancy: entity positions are tracked on the
/// entities themselves.
enum class TileType : uint8_t {
    Empty,
    Obstacle,
    Water,
    Forest,
    Corpse,
    Item
};

/// True for tiles the player cannot step onto.
[[nodiscard]] constexpr bool BlocksMovement(TileType type) noexcept {
    return type == TileType::Obstacle || type == TileType::Corpse;
}

} // namespace sgc::game

template <>
struct std::hash<sgc::game::Position> {
    std::size_t operator()(const sgc::game::Position& p) const noexcept {
        auto h1 = std::hash<int32_t>{}(p.x);
        auto h2 = std::hash<int32_t>{}(p.y);
        return h1 ^ (h2 * 2654435761u);
    }
};
