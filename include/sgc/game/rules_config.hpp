#pragma once

/// @file rules_config.hpp
/// @brief Balance constants of the combat rules and their YAML overlay.
///
/// Every number the turn pipeline uses lives here.  The defaults are the
/// shipped balance; loadRulesConfig() overlays whichever keys a YAML
/// document provides.

#include <array>
#include <cstdint>

#include "sgc/foundation/config_manager.hpp"
#include "sgc/foundation/game_result.hpp"
#include "sgc/game/entity_types.hpp"
#include "sgc/game/grid_types.hpp"
#include "sgc/game/spell_types.hpp"

namespace sgc::game {

/// Base stats of one enemy type.
struct EnemyArchetype {
    int32_t health = 50;
    int32_t attackRange = 1;
    int32_t attackDamage = 10;
    int32_t xpValue = 25;
};

inline constexpr std::size_t kEnemyTypeCount = 3;

struct RulesConfig {
    int32_t gridSize = 20;

    // Player
    Position playerStart{0, 0};
    int32_t playerHealth = 100;
    int32_t playerMana = 100;
    int32_t dashManaCost = 20;
    int32_t dashDistance = 3;
    int32_t dashCooldown = 3;
    int32_t manaRegen = 5;
    int32_t focusManaRegen = 15;

    // Items
    int32_t healthPotionAmount = 30;
    int32_t manaPotionAmount = 30;

    // Spells, indexed by SpellShape / Element
    std::array<int32_t, kSpellShapeCount> shapeManaCost{10, 15, 20, 15, 30, 25};
    std::array<int32_t, kElementCount> elementDamage{30, 25, 20, 15};
    int32_t selfHeal = 20;

    // Status and terrain effects
    int32_t burnDuration = 3;
    int32_t burnDamage = 5;
    int32_t frozenDuration = 2;
    int32_t burningTerrainDuration = 3;
    int32_t burningTerrainDamage = 5;

    // Minions
    int32_t minionHealth = 40;
    int32_t minionAttackDamage = 10;

    // Enemies, indexed by EnemyType
    std::array<EnemyArchetype, kEnemyTypeCount> enemies{
        EnemyArchetype{50, 1, 10, 25},   // goblin
        EnemyArchetype{30, 4, 8, 30},    // archer
        EnemyArchetype{100, 1, 20, 60}   // ogre
    };
    int32_t ogreStompDamage = 15;
    int32_t goblinSwarmBonus = 2;
    int32_t goblinSwarmRadius = 3;

    // Loot
    double lootDropChance = 0.25;

    // Progression
    int32_t baseXpToLevel = 100;
    double xpGrowth = 1.5;
    int32_t levelHealthGain = 10;
    int32_t levelManaGain = 5;
    int32_t levelSpellPowerGain = 2;

    [[nodiscard]] int32_t ManaCost(SpellShape shape) const noexcept {
        return shapeManaCost[static_cast<std::size_t>(shape)];
    }

    [[nodiscard]] int32_t BaseDamage(Element element) const noexcept {
        return elementDamage[static_cast<std::size_t>(element)];
    }

    [[nodiscard]] const EnemyArchetype& Archetype(EnemyType type) const noexcept {
        return enemies[static_cast<std::size_t>(type)];
    }

    bool operator==(const RulesConfig&) const = default;
};

/// Overlay the keys present in @p config onto the default RulesConfig.
///
/// Recognized keys (all optional):
///   grid.size, player.start_x, player.start_y, player.health, player.mana,
///   player.dash_mana_cost, player.dash_distance, player.dash_cooldown,
///   mana.regen, mana.focus_regen, items.health_potion, items.mana_potion,
///   spells.cost.<shape>, spells.damage.<element>, spells.self_heal,
///   status.burn_duration, status.burn_damage, status.frozen_duration,
///   terrain.burning_duration, terrain.burning_damage,
///   minion.health, minion.attack_damage,
///   enemies.<type>.{health,attack_range,attack_damage,xp},
///   enemies.ogre.stomp_damage, enemies.goblin.swarm_bonus,
///   enemies.goblin.swarm_radius, loot.drop_chance,
///   progression.base_xp, progression.growth, progression.health_gain,
///   progression.mana_gain, progression.spell_power_gain
///
/// @return The merged config, ConfigTypeMismatch for a key of the wrong
///         type, or InvalidConfigValue for an out-of-range value.
foundation::GameResult<RulesConfig> loadRulesConfig(const foundation::ConfigManager& config);

/// Check the invariants loadRulesConfig enforces on an already-built config.
foundation::GameResult<void> validateRulesConfig(const RulesConfig& rules);

} // namespace sgc::game
