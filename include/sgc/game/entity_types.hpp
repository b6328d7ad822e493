#pragma once

/// @file entity_types.hpp
/// @brief Enumerations for entities, effects, items and game status.

#include <cstdint>
#include <string_view>

namespace sgc::game {

/// Enemy archetype.  Attack damage: goblin < ogre.
enum class EnemyType : uint8_t {
    Goblin,
    Archer,
    Ogre
};

/// Time-limited effect attached to an enemy.
enum class StatusEffectType : uint8_t {
    Burn,    ///< Damage every turn.
    Frozen   ///< Skips its enemy-phase turn.
};

/// Time-limited effect bound to a tile.
enum class TerrainEffectType : uint8_t {
    Burning
};

enum class ItemType : uint8_t {
    HealthPotion,
    ManaPotion
};

/// Overall game status.  Victory and GameOver are absorbing until restart.
enum class GameStatus : uint8_t {
    Playing,
    Victory,
    GameOver
};

constexpr std::string_view EnemyTypeName(EnemyType type) noexcept {
    switch (type) {
        case EnemyType::Goblin: return "goblin";
        case EnemyType::Archer: return "archer";
        case EnemyType::Ogre:   return "ogre";
    }
    return "unknown";
}

constexpr std::string_view ItemTypeName(ItemType type) noexcept {
    switch (type) {
        case ItemType::HealthPotion: return "healthPotion";
        case ItemType::ManaPotion:   return "manaPotion";
    }
    return "unknown";
}

constexpr std::string_view GameStatusName(GameStatus status) noexcept {
    switch (status) {
        case GameStatus::Playing:  return "playing";
        case GameStatus::Victory:  return "victory";
        case GameStatus::GameOver: return "gameOver";
    }
    return "unknown";
}

} // namespace sgc::game
