#pragma once

/// @file spell_geometry.hpp
/// @brief Pure mapping from a spell shape and target to the tiles it covers.

#include <cstdint>
#include <unordered_set>

#include "sgc/game/grid_types.hpp"
#include "sgc/game/spell_types.hpp"

namespace sgc::game {

using TileSet = std::unordered_set<Position>;

/// Inputs of a geometry query.
struct SpellTargeting {
    SpellShape shape = SpellShape::Ball;
    Position target;
    Position caster;
    Direction facing = Direction::Up;
    int32_t gridSize = 0;
};

/// Tiles affected by a spell, clipped to the grid.
///
///   Ball, Summon, RaiseDead -> the target tile (if in bounds)
///   Self                    -> no tiles
///   Cone                    -> 4-tile arrow from the caster (see ConeDirection)
///   Wall                    -> 3x3 block centered on the target
[[nodiscard]] TileSet AffectedTiles(const SpellTargeting& targeting);

/// Direction a cone opens toward.
///
/// The caster's facing when the target is the caster's own tile; otherwise
/// the axis with the larger absolute delta, ties going to the vertical axis.
[[nodiscard]] Direction ConeDirection(Position caster, Position target, Direction facing) noexcept;

/// The arrow template: one tile ahead, then left/center/right two ahead.
[[nodiscard]] TileSet ConeTiles(Position caster, Direction direction, int32_t gridSize);

/// The 3x3 block around @p center.
[[nodiscard]] TileSet WallTiles(Position center, int32_t gridSize);

} // namespace sgc::game
