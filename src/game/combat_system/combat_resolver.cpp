/// @file combat_resolver.cpp
/// @brief CombatResolver implementation.
///
/// Spell damage, elemental statuses, air pushback and enemy attack
/// formulas.  Deaths are collected first and applied as one roster
/// rebuild so removal never happens mid-iteration.

#include "sgc/game/combat_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_set>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::game {

using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── Pure formulas ───────────────────────────────────────────────────────

int32_t CombatResolver::CalculateSpellDamage(const SpellDamageParams& params) {
    auto damage = static_cast<double>(params.baseDamage + params.spellPower);

    if (params.element == Element::Water && params.casterTile == TileType::Water) {
        damage *= SpellDamageParams::kCasterWaterBonus;
    }
    if (params.element == Element::Fire && params.targetTile == TileType::Water) {
        damage *= SpellDamageParams::kTargetWaterFirePenalty;
    }
    if (params.weakness && *params.weakness == params.element) {
        damage *= SpellDamageParams::kWeaknessMultiplier;
    }
    if (params.resistance && *params.resistance == params.element) {
        damage *= SpellDamageParams::kResistanceMultiplier;
    }

    return static_cast<int32_t>(std::lround(damage));
}

Enemy CombatResolver::ApplyElementalStatus(const Enemy& enemy, Element element,
                                           const RulesConfig& rules) {
    StatusEffectType type = StatusEffectType::Burn;
    int32_t duration = 0;
    switch (element) {
        case Element::Fire:
            type = StatusEffectType::Burn;
            duration = rules.burnDuration;
            break;
        case Element::Water:
            type = StatusEffectType::Frozen;
            duration = rules.frozenDuration;
            break;
        default:
            return enemy;
    }

    auto effects = enemy.StatusEffects();
    std::erase_if(effects, [type](const StatusEffect& s) { return s.type == type; });
    if (duration > 0) {
        effects.push_back({type, duration});
    }
    return enemy.WithStatusEffects(std::move(effects));
}

std::optional<Position> CombatResolver::PushbackDestination(Position caster,
                                                            Position target) noexcept {
    const int32_t dx = target.x - caster.x;
    const int32_t dy = target.y - caster.y;
    if (dx == 0 && dy == 0) {
        return std::nullopt;
    }
    if (std::abs(dx) > std::abs(dy)) {
        return Position{target.x + (dx > 0 ? 1 : -1), target.y};
    }
    return Position{target.x, target.y + (dy > 0 ? 1 : -1)};
}

int32_t CombatResolver::CountNearbyGoblins(const std::vector<Enemy>& enemies,
                                           const Enemy& attacker,
                                           int32_t radius) {
    return static_cast<int32_t>(std::count_if(
        enemies.begin(), enemies.end(), [&](const Enemy& other) {
            return other.Id() != attacker.Id() && other.Type() == EnemyType::Goblin &&
                   ManhattanDistance(other.GetPosition(), attacker.GetPosition()) <= radius;
        }));
}

int32_t CombatResolver::CalculateEnemyAttack(EnemyType type,
                                             const RulesConfig& rules,
                                             TileType targetTile,
                                             int32_t nearbyGoblins) {
    auto damage = static_cast<double>(rules.Archetype(type).attackDamage);
    if (type == EnemyType::Archer && targetTile == TileType::Forest) {
        damage /= 2.0;
    }
    if (type == EnemyType::Goblin) {
        damage += static_cast<double>(rules.goblinSwarmBonus * nearbyGoblins);
    }
    return static_cast<int32_t>(std::lround(damage));
}

bool CombatResolver::InStompArea(Position ogre, Position pos) noexcept {
    return std::abs(ogre.x - pos.x) <= 1 && std::abs(ogre.y - pos.y) <= 1;
}

// ── Elemental cast ──────────────────────────────────────────────────────

CastReport CombatResolver::ResolveElementalCast(GameState& state, const TileSet& tiles,
                                                const RulesConfig& rules) {
    CastReport report;
    const Player& caster = state.player;
    const Element element = caster.selectedElement;
    const TileType casterTile = state.grid.TileAt(caster.position);
    auto& logger = GameLogger::instance();

    std::vector<EnemyId> struck;
    for (auto& enemy : state.enemies) {
        if (!tiles.contains(enemy.GetPosition())) {
            continue;
        }

        SpellDamageParams params;
        params.element = element;
        params.baseDamage = rules.BaseDamage(element);
        params.spellPower = caster.spellPower;
        params.casterTile = casterTile;
        params.targetTile = state.grid.TileAt(enemy.GetPosition());
        params.weakness = enemy.Weakness();
        params.resistance = enemy.Resistance();

        const int32_t damage = CalculateSpellDamage(params);
        enemy = ApplyElementalStatus(enemy.WithHealth(enemy.Health() - damage), element, rules);

        struck.push_back(enemy.Id());
        ++report.enemiesHit;
        report.totalDamage += damage;

        if (logger.isEnabled(LogLevel::Debug, LogCategory::Combat)) {
            LogContext ctx;
            ctx.entityId = enemy.Id().value();
            ctx.turn = state.turn;
            ctx.extra["element"] = std::string(ElementName(element));
            ctx.extra["damage"] = std::to_string(damage);
            ctx.extra["health"] = std::to_string(enemy.Health());
            logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
                                  "Spell hit enemy", ctx);
        }
    }

    std::vector<Enemy> survivors;
    survivors.reserve(state.enemies.size());
    for (auto& enemy : state.enemies) {
        if (enemy.IsDefeated()) {
            report.defeated.push_back(DefeatedEnemy::From(enemy));
        } else {
            survivors.push_back(std::move(enemy));
        }
    }
    state.enemies = std::move(survivors);

    if (element == Element::Air) {
        applyPushback(state, struck);
    }

    if (element == Element::Fire && caster.selectedShape == SpellShape::Wall) {
        for (const auto& pos : tiles) {
            if (state.grid.TileAt(pos) != TileType::Obstacle) {
                state.grid.SetTerrainEffect(
                    pos, {TerrainEffectType::Burning, rules.burningTerrainDuration});
            }
        }
    }

    return report;
}

void CombatResolver::applyPushback(GameState& state, const std::vector<EnemyId>& struck) {
    std::unordered_set<Position> occupied;
    occupied.insert(state.player.position);
    for (const auto& minion : state.minions) {
        occupied.insert(minion.GetPosition());
    }
    for (const auto& enemy : state.enemies) {
        occupied.insert(enemy.GetPosition());
    }

    const Position caster = state.player.position;
    for (auto& enemy : state.enemies) {
        if (std::find(struck.begin(), struck.end(), enemy.Id()) == struck.end()) {
            continue;
        }
        auto destination = PushbackDestination(caster, enemy.GetPosition());
        if (!destination || !state.grid.InBounds(*destination) ||
            state.grid.TileAt(*destination) != TileType::Empty ||
            occupied.contains(*destination)) {
            continue;
        }
        occupied.erase(enemy.GetPosition());
        occupied.insert(*destination);
        enemy = enemy.WithPosition(*destination);
    }
}

}  // namespace sgc::game
