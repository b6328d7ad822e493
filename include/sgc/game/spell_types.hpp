#pragma once

/// @file spell_types.hpp
/// @brief Spell elements and shapes.

#include <array>
#include <cstdint>
#include <string_view>

namespace sgc::game {

/// Damage element of a spell.  Base damage: fire > water > earth > air.
enum class Element : uint8_t {
    Fire,
    Water,
    Earth,
    Air
};

inline constexpr std::size_t kElementCount = 4;

/// Targeting shape of a spell.
enum class SpellShape : uint8_t {
    Ball,       ///< Single target tile.
    Cone,       ///< 4-tile arrow in front of the caster.
    Wall,       ///< 3x3 block centered on the target.
    Self,       ///< Heals the caster, no tile targeting.
    Summon,     ///< Creates a generic minion on an empty tile.
    RaiseDead   ///< Turns a corpse into an undead minion.
};

inline constexpr std::size_t kSpellShapeCount = 6;

constexpr std::string_view ElementName(Element element) noexcept {
    constexpr std::array<std::string_view, kElementCount> names = {
        "fire", "water", "earth", "air"
    };
    auto idx = static_cast<std::size_t>(element);
    return idx < kElementCount ? names[idx] : "unknown";
}

constexpr std::string_view SpellShapeName(SpellShape shape) noexcept {
    constexpr std::array<std::string_view, kSpellShapeCount> names = {
        "ball", "cone", "wall", "self", "summon", "raiseDead"
    };
    auto idx = static_cast<std::size_t>(shape);
    return idx < kSpellShapeCount ? names[idx] : "unknown";
}

/// True for shapes that deal elemental damage to the tiles they cover.
[[nodiscard]] constexpr bool IsElementalShape(SpellShape shape) noexcept {
    return shape == SpellShape::Ball || shape == SpellShape::Cone ||
           shape == SpellShape::Wall;
}

} // namespace sgc::game
