/// @file board_text.cpp
/// @brief Text rendering of a snapshot.

#include "sgc/game/board_text.hpp"

#include <sstream>

namespace sgc::game {

namespace {

char enemyGlyph(EnemyType type) {
    switch (type) {
        case EnemyType::Goblin: return 'g';
        case EnemyType::Archer: return 'a';
        case EnemyType::Ogre:   return 'o';
    }
    return '?';
}

char tileGlyph(TileType type) {
    switch (type) {
        case TileType::Empty:    return '.';
        case TileType::Obstacle: return '#';
        case TileType::Water:    return '~';
        case TileType::Forest:   return '^';
        case TileType::Corpse:   return 'x';
        case TileType::Item:     return '!';
    }
    return '?';
}

} // namespace

char BoardGlyph(const GameState& state, Position pos) {
    if (state.player.position == pos) {
        return '@';
    }
    if (const auto* enemy = state.EnemyAt(pos)) {
        return enemyGlyph(enemy->Type());
    }
    if (const auto* minion = state.MinionAt(pos)) {
        return minion->IsUndead() ? 'u' : 'm';
    }
    const TileType tile = state.grid.TileAt(pos);
    if (tile == TileType::Empty && state.grid.TerrainEffectAt(pos) != nullptr) {
        return '*';
    }
    return tileGlyph(tile);
}

std::string describeBoard(const GameState& state) {
    const int32_t size = state.grid.Size();
    std::string out;
    out.reserve(static_cast<std::size_t>(size) * static_cast<std::size_t>(size + 1));
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            out.push_back(BoardGlyph(state, {x, y}));
        }
        out.push_back('\n');
    }
    return out;
}

std::string describeStatus(const GameState& state) {
    const auto& p = state.player;
    std::ostringstream oss;
    oss << "status=" << GameStatusName(state.status) << " wave=" << state.wave
        << " turn=" << state.turn << " hp=" << p.health << '/' << p.maxHealth
        << " mana=" << p.mana << '/' << p.maxMana << " level=" << p.level << " xp=" << p.xp
        << '/' << p.xpToNextLevel << " pos=(" << p.position.x << ',' << p.position.y << ')'
        << " items=" << p.inventory.size() << " enemies=" << state.enemies.size()
        << " minions=" << state.minions.size();
    return oss.str();
}

}  // namespace sgc::game
