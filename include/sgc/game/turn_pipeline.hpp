#pragma once

/// @file turn_pipeline.hpp
/// @brief The ordered resolution of one turn.
///
/// Phases, strictly in order, on one working copy:
///   1. terrain    burning tiles damage the player and enemies on them
///   2. status     burn damage, durations tick, expired effects drop
///   3. minions    attack or step toward the nearest enemy
///   4. enemies    attack or step toward the chosen target
///   5. loot / xp  corpses, potion drops and experience for every kill
///   6. cleanup    game over check, mana regeneration, dash cooldown
/// followed by the wave check on the committed state.

#include <vector>

#include "sgc/foundation/random_source.hpp"
#include "sgc/game/ai_system.hpp"
#include "sgc/game/combat_resolver.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/rules_config.hpp"

namespace sgc::game {

/// Per-turn input carried from the action into the pipeline.
struct TurnContext {
    bool focused = false;                   ///< Turn came from focus / wait.
    std::vector<DefeatedEnemy> defeated;    ///< Kills made by the action itself.
};

class TurnPipeline {
public:
    TurnPipeline(const RulesConfig& rules, foundation::IRandomSource& rng);

    /// Run every phase on @p state, then the wave check.
    void Resolve(GameState& state, TurnContext context);

    void RunTerrainPhase(GameState& state, std::vector<DefeatedEnemy>& defeated) const;
    void RunStatusPhase(GameState& state, std::vector<DefeatedEnemy>& defeated) const;
    void RunMinionPhase(GameState& state, std::vector<DefeatedEnemy>& defeated);
    void RunEnemyPhase(GameState& state);

    /// Corpses and loot for each defeated enemy in order, then the summed XP.
    void RunLootPhase(GameState& state, const std::vector<DefeatedEnemy>& defeated);

    void RunCleanupPhase(GameState& state, bool focused) const;

    /// Advance the wave once the roster is empty and the battle goes on.
    void RunWaveCheck(GameState& state) const;

private:
    /// Drop a potion next to @p origin with the configured chance.
    void rollLoot(GameState& state, Position origin);

    const RulesConfig& rules_;
    foundation::IRandomSource& rng_;
    AISystem ai_;
};

}  // namespace sgc::game
