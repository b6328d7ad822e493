#pragma once

/// @file progression.hpp
/// @brief Experience, leveling and the spell unlock table.

#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "sgc/game/entities.hpp"
#include "sgc/game/rules_config.hpp"
#include "sgc/game/spell_types.hpp"

namespace sgc::game {

/// What reaching a level adds to the player's loadout.
struct LevelUnlock {
    int32_t level = 0;
    std::variant<Element, SpellShape> reward;

    bool operator==(const LevelUnlock&) const = default;
};

/// Static unlock table, ordered by level.
[[nodiscard]] std::span<const LevelUnlock> UnlockTable() noexcept;

/// The unlock granted on reaching @p level, if any.
[[nodiscard]] std::optional<LevelUnlock> UnlockForLevel(int32_t level) noexcept;

/// XP required to advance from @p level: base x growth^(level-1), rounded.
[[nodiscard]] int32_t XpToNextLevel(int32_t level, const RulesConfig& rules);

/// Summary of one GrantExperience call.
struct LevelUpReport {
    int32_t levelsGained = 0;
    std::vector<LevelUnlock> unlocks;
};

class Progression {
public:
    /// Add @p xp to the player and level up as many times as it covers.
    ///
    /// Each level-up carries the remainder over, raises the maximums,
    /// restores health and mana to full, adds spell power, applies the
    /// unlock for the new level and recomputes the threshold.
    static LevelUpReport GrantExperience(Player& player, int32_t xp, const RulesConfig& rules);

private:
    static void levelUp(Player& player, const RulesConfig& rules, LevelUpReport& report);
};

}  // namespace sgc::game
