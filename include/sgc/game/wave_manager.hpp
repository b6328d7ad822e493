#pragma once

/// @file wave_manager.hpp
/// @brief Static wave rosters, the static board layout and wave transition.

#include <cstdint>
#include <span>

#include "sgc/game/entities.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/grid.hpp"
#include "sgc/game/rules_config.hpp"

namespace sgc::game {

/// One enemy of a wave roster.
struct SpawnSpec {
    EnemyType type = EnemyType::Goblin;
    Position position;
    ElementalAffinity affinity;
};

/// A tile of the static terrain layout.
struct TerrainSpec {
    Position position;
    TileType type = TileType::Empty;
};

/// An item placed on the board at wave start.
struct ItemSpec {
    Position position;
    ItemType type = ItemType::HealthPotion;
};

class WaveManager {
public:
    /// Roster of @p wave; empty when the wave is not defined.
    [[nodiscard]] static std::span<const SpawnSpec> RosterFor(int32_t wave) noexcept;

    [[nodiscard]] static bool HasWave(int32_t wave) noexcept { return !RosterFor(wave).empty(); }

    /// Number of defined waves.
    [[nodiscard]] static int32_t WaveCount() noexcept;

    [[nodiscard]] static std::span<const TerrainSpec> TerrainLayout() noexcept;
    [[nodiscard]] static std::span<const ItemSpec> DefaultItems() noexcept;

    /// Fresh grid with the static terrain and default items.  Item ids are
    /// drawn from @p state's serial counter.  Layout tiles outside the grid
    /// are skipped.
    [[nodiscard]] static Grid BuildStaticGrid(GameState& state, const RulesConfig& rules);

    /// Spawn the roster of @p wave into @p state.enemies (replacing it).
    static void SpawnWave(GameState& state, int32_t wave, const RulesConfig& rules);

    /// The start of a battle: wave 1, fresh player at the configured start.
    [[nodiscard]] static GameState InitialState(const RulesConfig& rules);

    /// Move to the next wave, or set Victory when none is defined.
    ///
    /// The player keeps its stats and inventory but returns to the start
    /// tile.  The grid is rebuilt, discarding corpses, terrain effects and
    /// items, and minions are dismissed.
    static void AdvanceWave(GameState& state, const RulesConfig& rules);
};

}  // namespace sgc::game
