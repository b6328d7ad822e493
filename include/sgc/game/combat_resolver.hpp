#pragma once

/// @file combat_resolver.hpp
/// @brief Damage formulas, status application and pushback.
///
/// Spell damage pipeline:
///   (element base damage + spell power)
///     x 1.25  caster on Water casting Water
///     x 0.75  target on Water hit by Fire
///     x 1.5   target weak to the element
///     x 0.5   target resistant to the element
///   rounded to the nearest integer.

#include <cstdint>
#include <optional>
#include <vector>

#include "sgc/game/entities.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/grid_types.hpp"
#include "sgc/game/rules_config.hpp"
#include "sgc/game/spell_geometry.hpp"
#include "sgc/game/spell_types.hpp"

namespace sgc::game {

/// Inputs of the spell damage formula.
struct SpellDamageParams {
    Element element = Element::Fire;
    int32_t baseDamage = 0;
    int32_t spellPower = 0;
    TileType casterTile = TileType::Empty;
    TileType targetTile = TileType::Empty;
    std::optional<Element> weakness;
    std::optional<Element> resistance;

    static constexpr double kCasterWaterBonus = 1.25;
    static constexpr double kTargetWaterFirePenalty = 0.75;
    static constexpr double kWeaknessMultiplier = 1.5;
    static constexpr double kResistanceMultiplier = 0.5;
};

/// An enemy removed from the roster during a turn, awaiting corpse/loot/XP.
struct DefeatedEnemy {
    EnemyId id;
    EnemyType type = EnemyType::Goblin;
    Position position;
    int32_t xpValue = 0;

    static DefeatedEnemy From(const Enemy& enemy) {
        return {enemy.Id(), enemy.Type(), enemy.GetPosition(), enemy.XpValue()};
    }

    bool operator==(const DefeatedEnemy&) const = default;
};

/// Outcome of an elemental area cast.
struct CastReport {
    std::vector<DefeatedEnemy> defeated;
    int32_t enemiesHit = 0;
    int32_t totalDamage = 0;
};

class CombatResolver {
public:
    /// Final spell damage against one target.  Pure.
    [[nodiscard]] static int32_t CalculateSpellDamage(const SpellDamageParams& params);

    /// Refresh (not stack) the status the element inflicts:
    /// Fire -> Burn, Water -> Frozen.  Other elements return @p enemy unchanged.
    [[nodiscard]] static Enemy ApplyElementalStatus(const Enemy& enemy, Element element,
                                                    const RulesConfig& rules);

    /// Destination one tile away from @p caster along the dominant axis
    /// (ties go vertical), or nullopt when the target is on the caster's tile.
    [[nodiscard]] static std::optional<Position> PushbackDestination(Position caster,
                                                                     Position target) noexcept;

    /// Number of goblins other than @p attacker within the swarm radius.
    [[nodiscard]] static int32_t CountNearbyGoblins(const std::vector<Enemy>& enemies,
                                                    const Enemy& attacker,
                                                    int32_t radius);

    /// Single-target enemy attack damage:
    /// base by type, halved for an archer shooting into Forest, plus the
    /// goblin swarm bonus; rounded.
    [[nodiscard]] static int32_t CalculateEnemyAttack(EnemyType type,
                                                      const RulesConfig& rules,
                                                      TileType targetTile,
                                                      int32_t nearbyGoblins);

    /// True if @p pos lies in the 3x3 neighborhood of @p ogre (own tile included).
    [[nodiscard]] static bool InStompArea(Position ogre, Position pos) noexcept;

    /// Resolve an elemental Ball / Cone / Wall cast on a working state.
    ///
    /// Order: damage every enemy on an affected tile, apply the element's
    /// status, remove the defeated from the roster, then (Air only) push
    /// surviving struck enemies back one at a time.  A Fire Wall also sets
    /// burning terrain on every affected non-obstacle tile.
    static CastReport ResolveElementalCast(GameState& state, const TileSet& tiles,
                                           const RulesConfig& rules);

private:
    static void applyPushback(GameState& state, const std::vector<EnemyId>& struck);
};

} // namespace sgc::game
