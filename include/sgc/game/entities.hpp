#pragma once

/// @file entities.hpp
/// @brief Value types for the player, enemies, minions, items and effects.
///
/// Enemies and minions expose their variable fields (position, health,
/// status list) only through With* update functions that return a copy;
/// identity-bearing fields (id, type, range, xp value, affinity) are fixed
/// at construction.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "sgc/foundation/types.hpp"
#include "sgc/game/entity_types.hpp"
#include "sgc/game/grid_types.hpp"
#include "sgc/game/spell_types.hpp"

namespace sgc::game {

using foundation::EnemyId;
using foundation::ItemId;
using foundation::MinionId;

// ── Effects ─────────────────────────────────────────────────────────────

/// Status effect on an enemy with its remaining duration in turns.
struct StatusEffect {
    StatusEffectType type = StatusEffectType::Burn;
    int32_t remaining = 0;

    bool operator==(const StatusEffect&) const = default;
};

/// Effect bound to a tile with its remaining duration in turns.
struct TerrainEffect {
    TerrainEffectType type = TerrainEffectType::Burning;
    int32_t remaining = 0;

    bool operator==(const TerrainEffect&) const = default;
};

// ── Item / Corpse ───────────────────────────────────────────────────────

/// An item lives either in the player's inventory or on the grid, never both.
struct Item {
    ItemId id;
    ItemType type = ItemType::HealthPotion;

    bool operator==(const Item&) const = default;
};

/// Remains of a defeated enemy.  Keeps the enemy's id.
struct Corpse {
    EnemyId id;
    Position position;
    EnemyType sourceType = EnemyType::Goblin;

    bool operator==(const Corpse&) const = default;
};

// ── Player ──────────────────────────────────────────────────────────────

struct Player {
    Position position;
    int32_t health = 100;
    int32_t maxHealth = 100;
    int32_t mana = 100;
    int32_t maxMana = 100;
    std::vector<Item> inventory;
    int32_t dashCooldown = 0;
    int32_t level = 1;
    int32_t xp = 0;
    int32_t xpToNextLevel = 100;
    std::set<Element> unlockedElements{Element::Fire};
    std::set<SpellShape> unlockedShapes{SpellShape::Ball};
    int32_t spellPower = 0;
    Direction facing = Direction::Up;
    Element selectedElement = Element::Fire;
    SpellShape selectedShape = SpellShape::Ball;

    /// Inventory slot of the item with @p id, or nullopt.
    [[nodiscard]] std::optional<std::size_t> FindItem(ItemId id) const {
        auto it = std::find_if(inventory.begin(), inventory.end(),
                               [id](const Item& item) { return item.id == id; });
        if (it == inventory.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - inventory.begin());
    }

    bool operator==(const Player&) const = default;
};

// ── Enemy ───────────────────────────────────────────────────────────────

/// Elemental weakness or resistance.  At most one is ever set.
class ElementalAffinity {
public:
    constexpr ElementalAffinity() = default;

    static constexpr ElementalAffinity None() noexcept { return {}; }

    static constexpr ElementalAffinity WeakTo(Element element) noexcept {
        return ElementalAffinity(element, std::nullopt);
    }

    static constexpr ElementalAffinity ResistantTo(Element element) noexcept {
        return ElementalAffinity(std::nullopt, element);
    }

    [[nodiscard]] constexpr std::optional<Element> Weakness() const noexcept { return weakness_; }
    [[nodiscard]] constexpr std::optional<Element> Resistance() const noexcept { return resistance_; }

    bool operator==(const ElementalAffinity&) const = default;

private:
    constexpr ElementalAffinity(std::optional<Element> weakness,
                                std::optional<Element> resistance) noexcept
        : weakness_(weakness), resistance_(resistance) {}

    std::optional<Element> weakness_;
    std::optional<Element> resistance_;
};

/// Fixed per-instance traits of an enemy.
struct EnemyTraits {
    EnemyType type = EnemyType::Goblin;
    int32_t attackRange = 1;
    int32_t xpValue = 25;
    ElementalAffinity affinity;

    bool operator==(const EnemyTraits&) const = default;
};

class Enemy {
public:
    Enemy(EnemyId id, EnemyTraits traits, Position position, int32_t health)
        : id_(id), traits_(traits), position_(position), health_(health) {}

    [[nodiscard]] EnemyId Id() const noexcept { return id_; }
    [[nodiscard]] EnemyType Type() const noexcept { return traits_.type; }
    [[nodiscard]] int32_t AttackRange() const noexcept { return traits_.attackRange; }
    [[nodiscard]] int32_t XpValue() const noexcept { return traits_.xpValue; }
    [[nodiscard]] std::optional<Element> Weakness() const noexcept {
        return traits_.affinity.Weakness();
    }
    [[nodiscard]] std::optional<Element> Resistance() const noexcept {
        return traits_.affinity.Resistance();
    }
    [[nodiscard]] const EnemyTraits& Traits() const noexcept { return traits_; }

    [[nodiscard]] Position GetPosition() const noexcept { return position_; }
    [[nodiscard]] int32_t Health() const noexcept { return health_; }
    [[nodiscard]] bool IsDefeated() const noexcept { return health_ <= 0; }
    [[nodiscard]] const std::vector<StatusEffect>& StatusEffects() const noexcept {
        return statusEffects_;
    }

    [[nodiscard]] bool HasStatus(StatusEffectType type) const {
        return std::any_of(statusEffects_.begin(), statusEffects_.end(),
                           [type](const StatusEffect& s) { return s.type == type; });
    }

    [[nodiscard]] Enemy WithPosition(Position position) const {
        Enemy copy = *this;
        copy.position_ = position;
        return copy;
    }

    [[nodiscard]] Enemy WithHealth(int32_t health) const {
        Enemy copy = *this;
        copy.health_ = health;
        return copy;
    }

    [[nodiscard]] Enemy WithStatusEffects(std::vector<StatusEffect> effects) const {
        Enemy copy = *this;
        copy.statusEffects_ = std::move(effects);
        return copy;
    }

    bool operator==(const Enemy&) const = default;

private:
    EnemyId id_;
    EnemyTraits traits_;
    Position position_;
    int32_t health_ = 0;
    std::vector<StatusEffect> statusEffects_;
};

// ── Minion ──────────────────────────────────────────────────────────────

/// Friendly unit.  A raised minion remembers the enemy type of its corpse;
/// a summoned one has no source type.
class Minion {
public:
    Minion(MinionId id, Position position, int32_t health,
           std::optional<EnemyType> undeadSource = std::nullopt)
        : id_(id), undeadSource_(undeadSource), position_(position), health_(health) {}

    [[nodiscard]] MinionId Id() const noexcept { return id_; }
    [[nodiscard]] std::optional<EnemyType> UndeadSource() const noexcept { return undeadSource_; }
    [[nodiscard]] bool IsUndead() const noexcept { return undeadSource_.has_value(); }
    [[nodiscard]] Position GetPosition() const noexcept { return position_; }
    [[nodiscard]] int32_t Health() const noexcept { return health_; }

    [[nodiscard]] Minion WithPosition(Position position) const {
        Minion copy = *this;
        copy.position_ = position;
        return copy;
    }

    [[nodiscard]] Minion WithHealth(int32_t health) const {
        Minion copy = *this;
        copy.health_ = health;
        return copy;
    }

    bool operator==(const Minion&) const = default;

private:
    MinionId id_;
    std::optional<EnemyType> undeadSource_;
    Position position_;
    int32_t health_ = 0;
};

} // namespace sgc::game
