/// @file grid.cpp
/// @brief Grid storage and overlay bookkeeping.

#include "sgc/game/grid.hpp"

#include <algorithm>

namespace sgc::game {

Grid::Grid(int32_t size)
    : size_(std::max(size, 0)),
      tiles_(static_cast<std::size_t>(size_) * static_cast<std::size_t>(size_),
             TileType::Empty) {}

TileType Grid::TileAt(Position pos) const noexcept {
    if (!InBounds(pos)) {
        return TileType::Obstacle;
    }
    return tiles_[index(pos)];
}

bool Grid::SetTerrain(Position pos, TileType type) {
    if (!InBounds(pos) || type == TileType::Item || type == TileType::Corpse) {
        return false;
    }
    clearOverlay(pos);
    tiles_[index(pos)] = type;
    return true;
}

void Grid::clearOverlay(Position pos) {
    items_.erase(pos);
    corpses_.erase(pos);
}

// ── Items ───────────────────────────────────────────────────────────────

bool Grid::PlaceItem(Position pos, Item item) {
    if (!InBounds(pos)) {
        return false;
    }
    clearOverlay(pos);
    items_[pos] = item;
    tiles_[index(pos)] = TileType::Item;
    return true;
}

std::optional<Item> Grid::TakeItem(Position pos) {
    auto it = items_.find(pos);
    if (it == items_.end()) {
        return std::nullopt;
    }
    Item item = it->second;
    items_.erase(it);
    tiles_[index(pos)] = TileType::Empty;
    return item;
}

const Item* Grid::ItemAt(Position pos) const {
    auto it = items_.find(pos);
    return it == items_.end() ? nullptr : &it->second;
}

// ── Corpses ─────────────────────────────────────────────────────────────

bool Grid::PlaceCorpse(Corpse corpse) {
    if (!InBounds(corpse.position)) {
        return false;
    }
    clearOverlay(corpse.position);
    tiles_[index(corpse.position)] = TileType::Corpse;
    corpses_[corpse.position] = corpse;
    return true;
}

std::optional<Corpse> Grid::TakeCorpse(Position pos) {
    auto it = corpses_.find(pos);
    if (it == corpses_.end()) {
        return std::nullopt;
    }
    Corpse corpse = it->second;
    corpses_.erase(it);
    tiles_[index(pos)] = TileType::Empty;
    return corpse;
}

const Corpse* Grid::CorpseAt(Position pos) const {
    auto it = corpses_.find(pos);
    return it == corpses_.end() ? nullptr : &it->second;
}

// ── Terrain effects ─────────────────────────────────────────────────────

bool Grid::SetTerrainEffect(Position pos, TerrainEffect effect) {
    if (!InBounds(pos) || effect.remaining <= 0) {
        return false;
    }
    terrainEffects_[pos] = effect;
    return true;
}

const TerrainEffect* Grid::TerrainEffectAt(Position pos) const {
    auto it = terrainEffects_.find(pos);
    return it == terrainEffects_.end() ? nullptr : &it->second;
}

void Grid::TickTerrainEffects() {
    for (auto& [pos, effect] : terrainEffects_) {
        --effect.remaining;
    }
    std::erase_if(terrainEffects_, [](const auto& entry) {
        return entry.second.remaining <= 0;
    });
}

}  // namespace sgc::game
