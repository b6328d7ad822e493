/// @file turn_pipeline.cpp
/// @brief TurnPipeline implementation.

#include "sgc/game/turn_pipeline.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "sgc/foundation/game_logger.hpp"
#include "sgc/game/progression.hpp"
#include "sgc/game/wave_manager.hpp"

namespace sgc::game {

using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

/// Move defeated enemies from the roster into @p defeated, keeping order.
void collectDefeated(GameState& state, std::vector<DefeatedEnemy>& defeated) {
    std::vector<Enemy> survivors;
    survivors.reserve(state.enemies.size());
    for (auto& enemy : state.enemies) {
        if (enemy.IsDefeated()) {
            defeated.push_back(DefeatedEnemy::From(enemy));
        } else {
            survivors.push_back(std::move(enemy));
        }
    }
    state.enemies = std::move(survivors);
}

constexpr std::array<Direction, 4> kNeighborOrder{Direction::Up, Direction::Down,
                                                  Direction::Left, Direction::Right};

} // namespace

TurnPipeline::TurnPipeline(const RulesConfig& rules, foundation::IRandomSource& rng)
    : rules_(rules), rng_(rng), ai_(rules) {}

void TurnPipeline::Resolve(GameState& state, TurnContext context) {
    auto& defeated = context.defeated;

    RunTerrainPhase(state, defeated);
    RunStatusPhase(state, defeated);
    RunMinionPhase(state, defeated);
    RunEnemyPhase(state);
    RunLootPhase(state, defeated);
    RunCleanupPhase(state, context.focused);
    RunWaveCheck(state);
}

// ── Phase 1: terrain ────────────────────────────────────────────────────

void TurnPipeline::RunTerrainPhase(GameState& state,
                                   std::vector<DefeatedEnemy>& defeated) const {
    const auto burningAt = [&state](Position pos) {
        const auto* effect = state.grid.TerrainEffectAt(pos);
        return effect != nullptr && effect->type == TerrainEffectType::Burning;
    };

    if (burningAt(state.player.position)) {
        state.player.health -= rules_.burningTerrainDamage;
    }
    for (auto& enemy : state.enemies) {
        if (burningAt(enemy.GetPosition())) {
            enemy = enemy.WithHealth(enemy.Health() - rules_.burningTerrainDamage);
        }
    }

    state.grid.TickTerrainEffects();
    collectDefeated(state, defeated);
}

// ── Phase 2: status effects ─────────────────────────────────────────────

void TurnPipeline::RunStatusPhase(GameState& state,
                                  std::vector<DefeatedEnemy>& defeated) const {
    for (auto& enemy : state.enemies) {
        if (enemy.StatusEffects().empty()) {
            continue;
        }

        int32_t damage = 0;
        std::vector<StatusEffect> remaining;
        for (auto effect : enemy.StatusEffects()) {
            if (effect.type == StatusEffectType::Burn) {
                damage += rules_.burnDamage;
            }
            if (--effect.remaining > 0) {
                remaining.push_back(effect);
            }
        }

        enemy = enemy.WithHealth(enemy.Health() - damage).WithStatusEffects(std::move(remaining));
    }

    collectDefeated(state, defeated);
}

// ── Phases 3 and 4: AI ──────────────────────────────────────────────────

void TurnPipeline::RunMinionPhase(GameState& state, std::vector<DefeatedEnemy>& defeated) {
    ai_.RunMinionPhase(state, defeated);
}

void TurnPipeline::RunEnemyPhase(GameState& state) {
    ai_.RunEnemyPhase(state);
}

// ── Phase 5: loot and experience ────────────────────────────────────────

void TurnPipeline::RunLootPhase(GameState& state, const std::vector<DefeatedEnemy>& defeated) {
    // Every corpse lands before any drop so a death tile is never a loot candidate.
    for (const auto& dead : defeated) {
        state.grid.PlaceCorpse(Corpse{dead.id, dead.position, dead.type});
    }

    int32_t xp = 0;
    for (const auto& dead : defeated) {
        rollLoot(state, dead.position);
        xp += dead.xpValue;

        LogContext ctx;
        ctx.entityId = dead.id.value();
        ctx.turn = state.turn;
        ctx.extra["type"] = std::string(EnemyTypeName(dead.type));
        GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Combat,
                                              "Enemy defeated", ctx);
    }

    if (xp > 0) {
        Progression::GrantExperience(state.player, xp, rules_);
    }
}

void TurnPipeline::rollLoot(GameState& state, Position origin) {
    if (!rng_.chance(rules_.lootDropChance)) {
        return;
    }
    const ItemType type =
        rng_.uniformInt(0, 1) == 0 ? ItemType::HealthPotion : ItemType::ManaPotion;

    std::vector<Position> candidates;
    for (auto dir : kNeighborOrder) {
        const Position pos = origin + StepOffset(dir);
        if (state.grid.InBounds(pos) && state.grid.TileAt(pos) == TileType::Empty &&
            !state.IsOccupied(pos)) {
            candidates.push_back(pos);
        }
    }
    if (candidates.empty()) {
        return;
    }

    foundation::shuffle(candidates, rng_);
    state.grid.PlaceItem(candidates.front(), Item{ItemId(state.AllocateSerial()), type});
}

// ── Phase 6: cleanup ────────────────────────────────────────────────────

void TurnPipeline::RunCleanupPhase(GameState& state, bool focused) const {
    auto& player = state.player;
    if (player.health <= 0) {
        state.status = GameStatus::GameOver;
        LogContext ctx;
        ctx.wave = state.wave;
        ctx.turn = state.turn;
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::World,
                                              "Player defeated, game over", ctx);
    }

    const int32_t regen = focused ? rules_.focusManaRegen : rules_.manaRegen;
    player.mana = std::min(player.mana + regen, player.maxMana);

    if (player.dashCooldown > 0) {
        --player.dashCooldown;
    }
    ++state.turn;
}

void TurnPipeline::RunWaveCheck(GameState& state) const {
    if (state.enemies.empty() && state.IsPlaying()) {
        WaveManager::AdvanceWave(state, rules_);
    }
}

}  // namespace sgc::game
