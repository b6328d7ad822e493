#pragma once

/// @file grid.hpp
/// @brief Square tile-type matrix plus item / corpse / terrain-effect overlays.
///
/// The grid is pure storage with bounds checks.  It keeps one overlay
/// invariant itself: an item entry exists only where the tile type is
/// Item and a corpse entry only where it is Corpse.  Terrain effects are
/// unconstrained.

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "sgc/game/entities.hpp"
#include "sgc/game/grid_types.hpp"

namespace sgc::game {

/// Default edge length of the battle grid.
constexpr int32_t kDefaultGridSize = 20;

class Grid {
public:
    /// Create a size x size grid of Empty tiles.  Non-positive sizes yield
    /// an empty (0 x 0) grid.
    explicit Grid(int32_t size = kDefaultGridSize);

    [[nodiscard]] int32_t Size() const noexcept { return size_; }

    [[nodiscard]] bool InBounds(Position pos) const noexcept {
        return pos.x >= 0 && pos.y >= 0 && pos.x < size_ && pos.y < size_;
    }

    /// Tile type at @p pos.  Out-of-bounds coordinates read as Obstacle.
    [[nodiscard]] TileType TileAt(Position pos) const noexcept;

    /// Set a base terrain type (Empty, Obstacle, Water, Forest).
    ///
    /// Overlay-bearing types (Item, Corpse) are rejected; use PlaceItem /
    /// PlaceCorpse.  Overwriting an item or corpse tile drops its overlay.
    /// @return false if out of bounds or @p type is an overlay type.
    bool SetTerrain(Position pos, TileType type);

    // -- Items ----------------------------------------------------------

    /// Put an item on an in-bounds tile; the tile becomes Item.
    /// A corpse or item already there is replaced.
    bool PlaceItem(Position pos, Item item);

    /// Remove and return the item at @p pos; the tile becomes Empty.
    std::optional<Item> TakeItem(Position pos);

    [[nodiscard]] const Item* ItemAt(Position pos) const;

    [[nodiscard]] const std::unordered_map<Position, Item>& Items() const noexcept {
        return items_;
    }

    // -- Corpses --------------------------------------------------------

    /// Put a corpse on its tile; the tile becomes Corpse.  An item lying
    /// there is destroyed.
    bool PlaceCorpse(Corpse corpse);

    /// Remove and return the corpse at @p pos; the tile becomes Empty.
    std::optional<Corpse> TakeCorpse(Position pos);

    [[nodiscard]] const Corpse* CorpseAt(Position pos) const;

    [[nodiscard]] const std::unordered_map<Position, Corpse>& Corpses() const noexcept {
        return corpses_;
    }

    // -- Terrain effects ------------------------------------------------

    /// Set (or refresh) the terrain effect on an in-bounds tile.
    bool SetTerrainEffect(Position pos, TerrainEffect effect);

    [[nodiscard]] const TerrainEffect* TerrainEffectAt(Position pos) const;

    [[nodiscard]] const std::unordered_map<Position, TerrainEffect>& TerrainEffects() const noexcept {
        return terrainEffects_;
    }

    /// Decrement every terrain effect by one turn and drop those reaching zero.
    void TickTerrainEffects();

    bool operator==(const Grid&) const = default;

private:
    [[nodiscard]] std::size_t index(Position pos) const noexcept {
        return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(size_) +
               static_cast<std::size_t>(pos.x);
    }

    void clearOverlay(Position pos);

    int32_t size_;
    std::vector<TileType> tiles_;
    std::unordered_map<Position, Item> items_;
    std::unordered_map<Position, Corpse> corpses_;
    std::unordered_map<Position, TerrainEffect> terrainEffects_;
};

} // namespace sgc::game
