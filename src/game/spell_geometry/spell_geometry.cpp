/// @file spell_geometry.cpp
/// @brief Spell area-of-effect templates.

#include "sgc/game/spell_geometry.hpp"

#include <cstdlib>

namespace sgc::game {

namespace {

bool inBounds(Position pos, int32_t gridSize) noexcept {
    return pos.x >= 0 && pos.y >= 0 && pos.x < gridSize && pos.y < gridSize;
}

void addIfValid(TileSet& tiles, Position pos, int32_t gridSize) {
    if (inBounds(pos, gridSize)) {
        tiles.insert(pos);
    }
}

}  // namespace

Direction ConeDirection(Position caster, Position target, Direction facing) noexcept {
    const int32_t dx = target.x - caster.x;
    const int32_t dy = target.y - caster.y;
    if (dx == 0 && dy == 0) {
        return facing;
    }
    if (std::abs(dx) > std::abs(dy)) {
        return dx > 0 ? Direction::Right : Direction::Left;
    }
    return dy > 0 ? Direction::Down : Direction::Up;
}

TileSet ConeTiles(Position caster, Direction direction, int32_t gridSize) {
    const Position forward = StepOffset(direction);
    // Perpendicular of the forward axis.
    const Position side{forward.y, forward.x};

    const Position near = caster + forward;
    const Position farCenter = near + forward;

    TileSet tiles;
    addIfValid(tiles, near, gridSize);
    addIfValid(tiles, farCenter - side, gridSize);
    addIfValid(tiles, farCenter, gridSize);
    addIfValid(tiles, farCenter + side, gridSize);
    return tiles;
}

TileSet WallTiles(Position center, int32_t gridSize) {
    TileSet tiles;
    for (int32_t dx = -1; dx <= 1; ++dx) {
        for (int32_t dy = -1; dy <= 1; ++dy) {
            addIfValid(tiles, {center.x + dx, center.y + dy}, gridSize);
        }
    }
    return tiles;
}

TileSet AffectedTiles(const SpellTargeting& targeting) {
    switch (targeting.shape) {
        case SpellShape::Ball:
        case SpellShape::Summon:
        case SpellShape::RaiseDead: {
            TileSet tiles;
            addIfValid(tiles, targeting.target, targeting.gridSize);
            return tiles;
        }
        case SpellShape::Self:
            return {};
        case SpellShape::Cone:
            return ConeTiles(targeting.caster,
                             ConeDirection(targeting.caster, targeting.target, targeting.facing),
                             targeting.gridSize);
        case SpellShape::Wall:
            return WallTiles(targeting.target, targeting.gridSize);
    }
    return {};
}

}  // namespace sgc::game
