/// @file progression.cpp
/// @brief Progression implementation.

#include "sgc/game/progression.hpp"

#include <array>
#include <cmath>
#include <string>
#include <type_traits>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::game {

using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::array<LevelUnlock, 8> kUnlockTable{{
    {2, Element::Water},
    {3, SpellShape::Cone},
    {4, Element::Earth},
    {5, SpellShape::Wall},
    {6, Element::Air},
    {7, SpellShape::Self},
    {8, SpellShape::Summon},
    {9, SpellShape::RaiseDead},
}};

std::string rewardName(const LevelUnlock& unlock) {
    if (const auto* element = std::get_if<Element>(&unlock.reward)) {
        return std::string(ElementName(*element));
    }
    return std::string(SpellShapeName(std::get<SpellShape>(unlock.reward)));
}

} // namespace

std::span<const LevelUnlock> UnlockTable() noexcept {
    return kUnlockTable;
}

std::optional<LevelUnlock> UnlockForLevel(int32_t level) noexcept {
    for (const auto& unlock : kUnlockTable) {
        if (unlock.level == level) {
            return unlock;
        }
    }
    return std::nullopt;
}

int32_t XpToNextLevel(int32_t level, const RulesConfig& rules) {
    const double scaled =
        static_cast<double>(rules.baseXpToLevel) * std::pow(rules.xpGrowth, level - 1);
    return static_cast<int32_t>(std::lround(scaled));
}

LevelUpReport Progression::GrantExperience(Player& player, int32_t xp,
                                           const RulesConfig& rules) {
    LevelUpReport report;
    if (xp <= 0) {
        return report;
    }
    player.xp += xp;
    while (player.xpToNextLevel > 0 && player.xp >= player.xpToNextLevel) {
        levelUp(player, rules, report);
    }
    return report;
}

void Progression::levelUp(Player& player, const RulesConfig& rules, LevelUpReport& report) {
    player.xp -= player.xpToNextLevel;
    player.level += 1;
    player.maxHealth += rules.levelHealthGain;
    player.maxMana += rules.levelManaGain;
    player.health = player.maxHealth;
    player.mana = player.maxMana;
    player.spellPower += rules.levelSpellPowerGain;

    LogContext ctx;
    ctx.extra["level"] = std::to_string(player.level);

    if (auto unlock = UnlockForLevel(player.level)) {
        std::visit(
            [&player](auto reward) {
                if constexpr (std::is_same_v<decltype(reward), Element>) {
                    player.unlockedElements.insert(reward);
                } else {
                    player.unlockedShapes.insert(reward);
                }
            },
            unlock->reward);
        ctx.extra["unlock"] = rewardName(*unlock);
        report.unlocks.push_back(*unlock);
    }

    player.xpToNextLevel = XpToNextLevel(player.level, rules);
    ++report.levelsGained;

    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Progression,
                                          "Player leveled up", ctx);
}

} // namespace sgc::game
