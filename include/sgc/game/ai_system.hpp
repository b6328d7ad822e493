#pragma once

/// @file ai_system.hpp
/// @brief Minion and enemy turn phases: targeting, attacks and stepping.
///
/// Both phases process their roster in order.  Movement is one step per
/// turn along the longer axis toward the target (ties go horizontal) and
/// is blocked by non-walkable tiles and by tiles already claimed in the
/// phase's occupancy set.  A unit that moves releases its old tile and
/// claims the new one, so no two units end a phase on the same tile.

#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

#include "sgc/game/combat_resolver.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/grid_types.hpp"
#include "sgc/game/rules_config.hpp"

namespace sgc::game {

/// What an enemy decided to go after this turn.
struct EnemyTarget {
    enum class Kind : uint8_t { Player, Minion };

    Kind kind = Kind::Player;
    std::size_t minionIndex = 0;   ///< Valid when kind == Minion.
    Position position;
    int32_t distance = 0;
};

/// Tiles claimed during one movement phase.
class Occupancy {
public:
    void Claim(Position pos) { claimed_.insert(pos); }
    void Release(Position pos) { claimed_.erase(pos); }
    [[nodiscard]] bool IsClaimed(Position pos) const { return claimed_.contains(pos); }

    /// Move a claim; used after a successful step.
    void Transfer(Position from, Position to) {
        claimed_.erase(from);
        claimed_.insert(to);
    }

private:
    std::unordered_set<Position> claimed_;
};

class AISystem {
public:
    explicit AISystem(const RulesConfig& rules) : rules_(rules) {}

    /// One step from @p from toward @p to along the longer axis
    /// (|dx| >= |dy| moves horizontally).  Returns @p from when equal.
    [[nodiscard]] static Position StepToward(Position from, Position to) noexcept;

    /// True if a unit may stand on @p pos (in bounds, not Obstacle/Corpse).
    [[nodiscard]] static bool IsWalkable(const Grid& grid, Position pos) noexcept;

    /// Index of the living enemy nearest to @p from (first in roster order
    /// on ties), or nullopt if none.
    [[nodiscard]] static std::optional<std::size_t> NearestEnemy(const std::vector<Enemy>& enemies,
                                                                 Position from);

    /// The player, unless a living minion is strictly closer.
    [[nodiscard]] static EnemyTarget SelectEnemyTarget(const GameState& state, const Enemy& enemy);

    /// Minion phase.  Skipped when no enemies remain.  Enemies killed here
    /// are appended to @p defeated and removed from the roster.
    void RunMinionPhase(GameState& state, std::vector<DefeatedEnemy>& defeated);

    /// Enemy phase.  Frozen enemies hold position.  Minions reduced to zero
    /// health are removed without a corpse.
    void RunEnemyPhase(GameState& state);

    /// Number of attacks made by minions / enemies during the last phases.
    [[nodiscard]] uint32_t GetLastMinionAttackCount() const noexcept { return lastMinionAttacks_; }
    [[nodiscard]] uint32_t GetLastEnemyAttackCount() const noexcept { return lastEnemyAttacks_; }

private:
    void enemyAttack(GameState& state, const Enemy& enemy, const EnemyTarget& target,
                     Occupancy& occupancy);

    const RulesConfig& rules_;
    uint32_t lastMinionAttacks_ = 0;
    uint32_t lastEnemyAttacks_ = 0;
};

} // namespace sgc::game
