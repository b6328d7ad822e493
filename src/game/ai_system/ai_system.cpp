/// @file ai_system.cpp
/// @brief AISystem implementation.
///
/// Minions hunt the nearest enemy; enemies go for the player unless a
/// minion is strictly closer.  Deaths are marked during the phase and the
/// roster is rebuilt once at the end of it.

#include "sgc/game/ai_system.hpp"

#include <cstdlib>
#include <string>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::game {

using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

int32_t sign(int32_t v) noexcept {
    return (v > 0) - (v < 0);
}

void logAttack(std::string_view msg, uint64_t attackerId, int64_t turn, int32_t damage) {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::AI)) {
        return;
    }
    LogContext ctx;
    ctx.entityId = attackerId;
    ctx.turn = turn;
    ctx.extra["damage"] = std::to_string(damage);
    logger.logWithContext(LogLevel::Debug, LogCategory::AI, msg, ctx);
}

} // namespace

// ── Helpers ─────────────────────────────────────────────────────────────

Position AISystem::StepToward(Position from, Position to) noexcept {
    const int32_t dx = to.x - from.x;
    const int32_t dy = to.y - from.y;
    if (dx == 0 && dy == 0) {
        return from;
    }
    if (std::abs(dx) >= std::abs(dy)) {
        return {from.x + sign(dx), from.y};
    }
    return {from.x, from.y + sign(dy)};
}

bool AISystem::IsWalkable(const Grid& grid, Position pos) noexcept {
    return grid.InBounds(pos) && !BlocksMovement(grid.TileAt(pos));
}

std::optional<std::size_t> AISystem::NearestEnemy(const std::vector<Enemy>& enemies,
                                                  Position from) {
    std::optional<std::size_t> best;
    int32_t bestDistance = 0;
    for (std::size_t i = 0; i < enemies.size(); ++i) {
        if (enemies[i].IsDefeated()) {
            continue;
        }
        const int32_t d = ManhattanDistance(from, enemies[i].GetPosition());
        if (!best || d < bestDistance) {
            best = i;
            bestDistance = d;
        }
    }
    return best;
}

EnemyTarget AISystem::SelectEnemyTarget(const GameState& state, const Enemy& enemy) {
    EnemyTarget target;
    target.kind = EnemyTarget::Kind::Player;
    target.position = state.player.position;
    target.distance = ManhattanDistance(enemy.GetPosition(), state.player.position);

    for (std::size_t i = 0; i < state.minions.size(); ++i) {
        const auto& minion = state.minions[i];
        if (minion.Health() <= 0) {
            continue;
        }
        const int32_t d = ManhattanDistance(enemy.GetPosition(), minion.GetPosition());
        if (d < target.distance) {
            target.kind = EnemyTarget::Kind::Minion;
            target.minionIndex = i;
            target.position = minion.GetPosition();
            target.distance = d;
        }
    }
    return target;
}

// ── Minion phase ────────────────────────────────────────────────────────

void AISystem::RunMinionPhase(GameState& state, std::vector<DefeatedEnemy>& defeated) {
    lastMinionAttacks_ = 0;
    if (state.enemies.empty()) {
        return;
    }

    Occupancy occupancy;
    occupancy.Claim(state.player.position);
    for (const auto& enemy : state.enemies) {
        occupancy.Claim(enemy.GetPosition());
    }
    for (const auto& minion : state.minions) {
        occupancy.Claim(minion.GetPosition());
    }

    for (auto& minion : state.minions) {
        auto targetIndex = NearestEnemy(state.enemies, minion.GetPosition());
        if (!targetIndex) {
            break;
        }
        auto& target = state.enemies[*targetIndex];

        if (ManhattanDistance(minion.GetPosition(), target.GetPosition()) == 1) {
            target = target.WithHealth(target.Health() - rules_.minionAttackDamage);
            ++lastMinionAttacks_;
            logAttack("Minion attacked enemy", minion.Id().value(), state.turn,
                      rules_.minionAttackDamage);
            if (target.IsDefeated()) {
                defeated.push_back(DefeatedEnemy::From(target));
            }
            continue;
        }

        const Position step = StepToward(minion.GetPosition(), target.GetPosition());
        if (IsWalkable(state.grid, step) && !occupancy.IsClaimed(step)) {
            occupancy.Transfer(minion.GetPosition(), step);
            minion = minion.WithPosition(step);
        }
    }

    std::erase_if(state.enemies, [](const Enemy& e) { return e.IsDefeated(); });
}

// ── Enemy phase ─────────────────────────────────────────────────────────

void AISystem::RunEnemyPhase(GameState& state) {
    lastEnemyAttacks_ = 0;

    Occupancy occupancy;
    occupancy.Claim(state.player.position);
    for (const auto& minion : state.minions) {
        occupancy.Claim(minion.GetPosition());
    }
    for (const auto& enemy : state.enemies) {
        occupancy.Claim(enemy.GetPosition());
    }

    for (auto& enemy : state.enemies) {
        if (enemy.HasStatus(StatusEffectType::Frozen)) {
            continue;
        }

        const EnemyTarget target = SelectEnemyTarget(state, enemy);
        if (target.distance <= enemy.AttackRange()) {
            enemyAttack(state, enemy, target, occupancy);
            continue;
        }

        const Position step = StepToward(enemy.GetPosition(), target.position);
        if (IsWalkable(state.grid, step) && !occupancy.IsClaimed(step)) {
            occupancy.Transfer(enemy.GetPosition(), step);
            enemy = enemy.WithPosition(step);
        }
    }

    std::erase_if(state.minions, [](const Minion& m) { return m.Health() <= 0; });
}

void AISystem::enemyAttack(GameState& state, const Enemy& enemy, const EnemyTarget& target,
                           Occupancy& occupancy) {
    ++lastEnemyAttacks_;

    auto damageMinion = [&](Minion& minion, int32_t damage) {
        minion = minion.WithHealth(minion.Health() - damage);
        if (minion.Health() <= 0) {
            occupancy.Release(minion.GetPosition());
        }
    };

    if (enemy.Type() == EnemyType::Ogre && target.distance == 1) {
        const int32_t damage = rules_.ogreStompDamage;
        if (CombatResolver::InStompArea(enemy.GetPosition(), state.player.position)) {
            state.player.health -= damage;
        }
        for (auto& minion : state.minions) {
            if (minion.Health() > 0 &&
                CombatResolver::InStompArea(enemy.GetPosition(), minion.GetPosition())) {
                damageMinion(minion, damage);
            }
        }
        logAttack("Ogre stomped", enemy.Id().value(), state.turn, damage);
        return;
    }

    const int32_t nearbyGoblins =
        enemy.Type() == EnemyType::Goblin
            ? CombatResolver::CountNearbyGoblins(state.enemies, enemy, rules_.goblinSwarmRadius)
            : 0;
    const int32_t damage = CombatResolver::CalculateEnemyAttack(
        enemy.Type(), rules_, state.grid.TileAt(target.position), nearbyGoblins);

    if (target.kind == EnemyTarget::Kind::Player) {
        state.player.health -= damage;
        logAttack("Enemy attacked player", enemy.Id().value(), state.turn, damage);
    } else {
        damageMinion(state.minions[target.minionIndex], damage);
        logAttack("Enemy attacked minion", enemy.Id().value(), state.turn, damage);
    }
}

} // namespace sgc::game
