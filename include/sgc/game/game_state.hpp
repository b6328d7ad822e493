#pragma once

/// @file game_state.hpp
/// @brief The authoritative snapshot of a battle.
///
/// A GameState is a plain value: actions never modify the caller's
/// snapshot, they produce a new one (see reducer.hpp).

#include <cstdint>
#include <vector>

#include "sgc/game/entities.hpp"
#include "sgc/game/entity_types.hpp"
#include "sgc/game/grid.hpp"

namespace sgc::game {

struct GameState {
    Grid grid;
    Player player;
    std::vector<Enemy> enemies;
    std::vector<Minion> minions;
    GameStatus status = GameStatus::Playing;
    int32_t wave = 1;
    int64_t turn = 0;          ///< Turns resolved since the last restart.
    uint64_t nextSerial = 1;   ///< Source of minion / item / enemy ids.

    [[nodiscard]] bool IsPlaying() const noexcept { return status == GameStatus::Playing; }

    [[nodiscard]] const Enemy* EnemyAt(Position pos) const;
    [[nodiscard]] const Minion* MinionAt(Position pos) const;

    /// True if the player, an enemy or a minion stands on @p pos.
    [[nodiscard]] bool IsOccupied(Position pos) const;

    /// Take the next id serial.
    uint64_t AllocateSerial() noexcept { return nextSerial++; }

    bool operator==(const GameState&) const = default;
};

} // namespace sgc::game
