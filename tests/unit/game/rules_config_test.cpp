#include <gtest/gtest.h>

#include <string>

#include "mock_logger.hpp"
#include "sgc/foundation/config_manager.hpp"
#include "sgc/game/rules_config.hpp"

using namespace sgc::game;
using sgc::foundation::ConfigManager;
using sgc::foundation::ErrorCode;

using RulesConfigLoadTest = sgc::test::MockLoggerTest;

namespace {

sgc::foundation::GameResult<RulesConfig> loadFrom(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadFromString(yaml);
    EXPECT_TRUE(loaded.hasValue());
    return loadRulesConfig(config);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════

TEST(RulesConfigTest, DefaultBalance) {
    RulesConfig rules;
    EXPECT_EQ(rules.gridSize, 20);
    EXPECT_EQ(rules.playerStart, (Position{0, 0}));
    EXPECT_EQ(rules.dashManaCost, 20);
    EXPECT_EQ(rules.dashDistance, 3);
    EXPECT_EQ(rules.dashCooldown, 3);
    EXPECT_EQ(rules.manaRegen, 5);
    EXPECT_EQ(rules.focusManaRegen, 15);
    EXPECT_EQ(rules.selfHeal, 20);
    EXPECT_DOUBLE_EQ(rules.lootDropChance, 0.25);
}

TEST(RulesConfigTest, SpellTables) {
    RulesConfig rules;
    EXPECT_EQ(rules.ManaCost(SpellShape::Ball), 10);
    EXPECT_EQ(rules.ManaCost(SpellShape::Cone), 15);
    EXPECT_EQ(rules.ManaCost(SpellShape::Wall), 20);
    EXPECT_EQ(rules.ManaCost(SpellShape::Self), 15);
    EXPECT_EQ(rules.ManaCost(SpellShape::Summon), 30);
    EXPECT_EQ(rules.ManaCost(SpellShape::RaiseDead), 25);

    EXPECT_EQ(rules.BaseDamage(Element::Fire), 30);
    EXPECT_EQ(rules.BaseDamage(Element::Water), 25);
    EXPECT_EQ(rules.BaseDamage(Element::Earth), 20);
    EXPECT_EQ(rules.BaseDamage(Element::Air), 15);
}

TEST(RulesConfigTest, EnemyArchetypes) {
    RulesConfig rules;
    EXPECT_EQ(rules.Archetype(EnemyType::Goblin).health, 50);
    EXPECT_EQ(rules.Archetype(EnemyType::Goblin).attackDamage, 10);
    EXPECT_EQ(rules.Archetype(EnemyType::Archer).attackRange, 4);
    EXPECT_EQ(rules.Archetype(EnemyType::Ogre).attackDamage, 20);
    EXPECT_LT(rules.Archetype(EnemyType::Goblin).attackDamage,
              rules.Archetype(EnemyType::Ogre).attackDamage);
    EXPECT_EQ(rules.ogreStompDamage, 15);
}

TEST(RulesConfigTest, DefaultsValidate) {
    EXPECT_TRUE(validateRulesConfig(RulesConfig{}).hasValue());
}

// ═══════════════════════════════════════════════════════════════════════════
// YAML overlay
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(RulesConfigLoadTest, EmptyDocumentKeepsDefaults) {
    auto rules = loadFrom("{}");
    ASSERT_TRUE(rules.hasValue());
    EXPECT_EQ(rules.value(), RulesConfig{});
}

TEST_F(RulesConfigLoadTest, OverlaysPresentKeys) {
    auto rules = loadFrom(R"(
grid:
  size: 12
player:
  start_x: 2
  start_y: 3
spells:
  cost:
    raiseDead: 40
  damage:
    air: 18
enemies:
  ogre:
    health: 140
    stomp_damage: 25
loot:
  drop_chance: 1.0
)");
    ASSERT_TRUE(rules.hasValue());
    const auto& r = rules.value();
    EXPECT_EQ(r.gridSize, 12);
    EXPECT_EQ(r.playerStart, (Position{2, 3}));
    EXPECT_EQ(r.ManaCost(SpellShape::RaiseDead), 40);
    EXPECT_EQ(r.BaseDamage(Element::Air), 18);
    EXPECT_EQ(r.Archetype(EnemyType::Ogre).health, 140);
    EXPECT_EQ(r.ogreStompDamage, 25);
    EXPECT_DOUBLE_EQ(r.lootDropChance, 1.0);
    // Untouched keys keep their defaults.
    EXPECT_EQ(r.Archetype(EnemyType::Goblin).health, 50);
    EXPECT_TRUE(mockLogger_->contains("Rules config loaded"));
}

TEST_F(RulesConfigLoadTest, ShippedRulesFileMatchesDefaults) {
    ConfigManager config;
    auto loaded = config.load(std::string(SGC_CONFIG_DIR) + "/rules.yaml");
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().describe();

    auto rules = loadRulesConfig(config);
    ASSERT_TRUE(rules.hasValue()) << rules.error().describe();
    EXPECT_EQ(rules.value(), RulesConfig{});
    EXPECT_FALSE(mockLogger_->contains("Ignoring unknown rules key"));
}

TEST_F(RulesConfigLoadTest, UnknownKeysWarnedButLoaded) {
    auto rules = loadFrom("grid: {size: 14}\nstatus: {burn_damge: 9}\n");
    ASSERT_TRUE(rules.hasValue());
    EXPECT_EQ(rules.value().gridSize, 14);
    EXPECT_EQ(rules.value().burnDamage, RulesConfig{}.burnDamage);
    EXPECT_TRUE(mockLogger_->contains("Ignoring unknown rules key status.burn_damge"));
    EXPECT_FALSE(mockLogger_->contains("Ignoring unknown rules key grid.size"));
}

TEST_F(RulesConfigLoadTest, WrongTypeIsMismatch) {
    auto rules = loadFrom("minion:\n  health: lots\n");
    ASSERT_TRUE(rules.hasError());
    EXPECT_EQ(rules.error().code(), ErrorCode::ConfigTypeMismatch);
    auto* key = rules.error().context<std::string>();
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(*key, "minion.health");
}

TEST_F(RulesConfigLoadTest, OutOfRangeValuesRejected) {
    EXPECT_EQ(loadFrom("grid: {size: 0}").error().code(), ErrorCode::InvalidConfigValue);
    EXPECT_EQ(loadFrom("loot: {drop_chance: 1.5}").error().code(),
              ErrorCode::InvalidConfigValue);
    EXPECT_EQ(loadFrom("spells: {cost: {ball: -1}}").error().code(),
              ErrorCode::InvalidConfigValue);
    EXPECT_EQ(loadFrom("player: {start_x: 25}").error().code(), ErrorCode::InvalidConfigValue);
    EXPECT_EQ(loadFrom("progression: {growth: 0.5}").error().code(),
              ErrorCode::InvalidConfigValue);
    EXPECT_TRUE(mockLogger_->contains("Rules config rejected"));
}
