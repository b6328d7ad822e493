/// @file rules_config.cpp
/// @brief YAML overlay and validation of RulesConfig.

#include "sgc/game/rules_config.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Reads present keys into their targets and remembers the first failure.
class KeyOverlay {
public:
    explicit KeyOverlay(const ConfigManager& config) : config_(config) {}

    template <typename T>
    KeyOverlay& Read(const std::string& key, T& target) {
        if (error_ || !config_.hasKey(key)) {
            return *this;
        }
        consumed_.insert(key);
        auto value = config_.get<T>(key);
        if (value.hasError()) {
            error_ = value.error();
            return *this;
        }
        target = value.value();
        ++applied_;
        return *this;
    }

    [[nodiscard]] const std::optional<GameError>& Error() const noexcept { return error_; }
    [[nodiscard]] std::size_t Applied() const noexcept { return applied_; }

    /// Keys present in the document that no Read() asked for.
    [[nodiscard]] std::vector<std::string> Ignored() const {
        std::vector<std::string> out;
        for (const auto& key : config_.keys()) {
            if (consumed_.count(key) == 0) {
                out.push_back(key);
            }
        }
        return out;
    }

private:
    const ConfigManager& config_;
    std::optional<GameError> error_;
    std::set<std::string> consumed_;
    std::size_t applied_ = 0;
};

GameResult<void> invalid(const std::string& what) {
    return GameResult<void>::err(GameError(ErrorCode::InvalidConfigValue, what));
}

}  // namespace

GameResult<RulesConfig> loadRulesConfig(const ConfigManager& config) {
    RulesConfig rules;
    KeyOverlay overlay(config);

    overlay.Read("grid.size", rules.gridSize)
        .Read("player.start_x", rules.playerStart.x)
        .Read("player.start_y", rules.playerStart.y)
        .Read("player.health", rules.playerHealth)
        .Read("player.mana", rules.playerMana)
        .Read("player.dash_mana_cost", rules.dashManaCost)
        .Read("player.dash_distance", rules.dashDistance)
        .Read("player.dash_cooldown", rules.dashCooldown)
        .Read("mana.regen", rules.manaRegen)
        .Read("mana.focus_regen", rules.focusManaRegen)
        .Read("items.health_potion", rules.healthPotionAmount)
        .Read("items.mana_potion", rules.manaPotionAmount)
        .Read("spells.self_heal", rules.selfHeal)
        .Read("status.burn_duration", rules.burnDuration)
        .Read("status.burn_damage", rules.burnDamage)
        .Read("status.frozen_duration", rules.frozenDuration)
        .Read("terrain.burning_duration", rules.burningTerrainDuration)
        .Read("terrain.burning_damage", rules.burningTerrainDamage)
        .Read("minion.health", rules.minionHealth)
        .Read("minion.attack_damage", rules.minionAttackDamage)
        .Read("enemies.ogre.stomp_damage", rules.ogreStompDamage)
        .Read("enemies.goblin.swarm_bonus", rules.goblinSwarmBonus)
        .Read("enemies.goblin.swarm_radius", rules.goblinSwarmRadius)
        .Read("loot.drop_chance", rules.lootDropChance)
        .Read("progression.base_xp", rules.baseXpToLevel)
        .Read("progression.growth", rules.xpGrowth)
        .Read("progression.health_gain", rules.levelHealthGain)
        .Read("progression.mana_gain", rules.levelManaGain)
        .Read("progression.spell_power_gain", rules.levelSpellPowerGain);

    for (std::size_t i = 0; i < kSpellShapeCount; ++i) {
        auto name = std::string(SpellShapeName(static_cast<SpellShape>(i)));
        overlay.Read("spells.cost." + name, rules.shapeManaCost[i]);
    }
    for (std::size_t i = 0; i < kElementCount; ++i) {
        auto name = std::string(ElementName(static_cast<Element>(i)));
        overlay.Read("spells.damage." + name, rules.elementDamage[i]);
    }
    for (std::size_t i = 0; i < kEnemyTypeCount; ++i) {
        auto prefix = "enemies." + std::string(EnemyTypeName(static_cast<EnemyType>(i))) + ".";
        auto& archetype = rules.enemies[i];
        overlay.Read(prefix + "health", archetype.health)
            .Read(prefix + "attack_range", archetype.attackRange)
            .Read(prefix + "attack_damage", archetype.attackDamage)
            .Read(prefix + "xp", archetype.xpValue);
    }

    if (overlay.Error()) {
        SGC_LOG_WARN(LogCategory::Config,
                     "Rules config rejected: " + std::string(overlay.Error()->message()));
        return GameResult<RulesConfig>::err(*overlay.Error());
    }

    auto valid = validateRulesConfig(rules);
    if (valid.hasError()) {
        SGC_LOG_WARN(LogCategory::Config,
                     "Rules config rejected: " + std::string(valid.error().message()));
        return GameResult<RulesConfig>::err(valid.error());
    }

    for (const auto& key : overlay.Ignored()) {
        SGC_LOG_WARN(LogCategory::Config, "Ignoring unknown rules key " + key);
    }
    SGC_LOG_INFO(LogCategory::Config,
                 "Rules config loaded (" + std::to_string(overlay.Applied()) + " overrides)");
    return GameResult<RulesConfig>::ok(rules);
}

GameResult<void> validateRulesConfig(const RulesConfig& rules) {
    if (rules.gridSize <= 0) {
        return invalid("grid.size must be positive");
    }
    if (rules.playerStart.x < 0 || rules.playerStart.y < 0 ||
        rules.playerStart.x >= rules.gridSize || rules.playerStart.y >= rules.gridSize) {
        return invalid("player start must lie on the grid");
    }
    if (rules.playerHealth <= 0 || rules.playerMana < 0) {
        return invalid("player health must be positive and mana non-negative");
    }
    if (rules.dashManaCost < 0 || rules.dashDistance < 0 || rules.dashCooldown < 0) {
        return invalid("dash values must be non-negative");
    }
    for (auto cost : rules.shapeManaCost) {
        if (cost < 0) {
            return invalid("spell costs must be non-negative");
        }
    }
    for (const auto& archetype : rules.enemies) {
        if (archetype.health <= 0 || archetype.attackRange < 1) {
            return invalid("enemy health must be positive and attack range at least 1");
        }
    }
    if (rules.burnDuration < 0 || rules.frozenDuration < 0 || rules.burningTerrainDuration < 0) {
        return invalid("effect durations must be non-negative");
    }
    if (rules.minionHealth <= 0) {
        return invalid("minion.health must be positive");
    }
    if (rules.lootDropChance < 0.0 || rules.lootDropChance > 1.0) {
        return invalid("loot.drop_chance must lie in [0, 1]");
    }
    if (rules.baseXpToLevel <= 0 || rules.xpGrowth < 1.0) {
        return invalid("progression.base_xp must be positive and growth at least 1");
    }
    return GameResult<void>::ok();
}

}  // namespace sgc::game
