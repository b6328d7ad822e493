/// @file wave_manager.cpp
/// @brief WaveManager implementation and the static battle tables.

#include "sgc/game/wave_manager.hpp"

#include <array>
#include <string>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::game {

using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::array<SpawnSpec, 2> kWave1{{
    {EnemyType::Goblin, {5, 5}, ElementalAffinity::None()},
    {EnemyType::Goblin, {8, 2}, ElementalAffinity::None()},
}};

constexpr std::array<SpawnSpec, 3> kWave2{{
    {EnemyType::Goblin, {9, 9}, ElementalAffinity::None()},
    {EnemyType::Goblin, {10, 8}, ElementalAffinity::None()},
    {EnemyType::Archer, {14, 2}, ElementalAffinity::WeakTo(Element::Water)},
}};

constexpr std::array<SpawnSpec, 3> kWave3{{
    {EnemyType::Ogre, {10, 10}, ElementalAffinity::ResistantTo(Element::Fire)},
    {EnemyType::Goblin, {4, 8}, ElementalAffinity::None()},
    {EnemyType::Archer, {16, 6}, ElementalAffinity::WeakTo(Element::Earth)},
}};

constexpr std::array<std::span<const SpawnSpec>, 3> kWaves{kWave1, kWave2, kWave3};

constexpr std::array<TerrainSpec, 16> kTerrain{{
    {{3, 3}, TileType::Obstacle},
    {{4, 3}, TileType::Obstacle},
    {{5, 3}, TileType::Obstacle},
    {{15, 10}, TileType::Obstacle},
    {{15, 11}, TileType::Obstacle},
    {{15, 12}, TileType::Obstacle},
    {{6, 12}, TileType::Water},
    {{7, 12}, TileType::Water},
    {{6, 13}, TileType::Water},
    {{7, 13}, TileType::Water},
    {{12, 3}, TileType::Forest},
    {{13, 3}, TileType::Forest},
    {{14, 3}, TileType::Forest},
    {{12, 4}, TileType::Forest},
    {{13, 4}, TileType::Forest},
    {{14, 4}, TileType::Forest},
}};

constexpr std::array<ItemSpec, 2> kItems{{
    {{10, 10}, ItemType::HealthPotion},
    {{15, 5}, ItemType::ManaPotion},
}};

} // namespace

std::span<const SpawnSpec> WaveManager::RosterFor(int32_t wave) noexcept {
    if (wave < 1 || wave > static_cast<int32_t>(kWaves.size())) {
        return {};
    }
    return kWaves[static_cast<std::size_t>(wave - 1)];
}

int32_t WaveManager::WaveCount() noexcept {
    return static_cast<int32_t>(kWaves.size());
}

std::span<const TerrainSpec> WaveManager::TerrainLayout() noexcept {
    return kTerrain;
}

std::span<const ItemSpec> WaveManager::DefaultItems() noexcept {
    return kItems;
}

Grid WaveManager::BuildStaticGrid(GameState& state, const RulesConfig& rules) {
    Grid grid(rules.gridSize);
    for (const auto& tile : kTerrain) {
        grid.SetTerrain(tile.position, tile.type);
    }
    for (const auto& entry : kItems) {
        if (grid.InBounds(entry.position)) {
            grid.PlaceItem(entry.position, Item{ItemId(state.AllocateSerial()), entry.type});
        }
    }
    return grid;
}

void WaveManager::SpawnWave(GameState& state, int32_t wave, const RulesConfig& rules) {
    state.enemies.clear();
    for (const auto& entry : RosterFor(wave)) {
        if (!state.grid.InBounds(entry.position)) {
            SGC_LOG_WARN(LogCategory::World,
                         "Spawn outside the grid skipped: " + std::string(EnemyTypeName(entry.type)));
            continue;
        }
        const auto& archetype = rules.Archetype(entry.type);
        EnemyTraits traits{entry.type, archetype.attackRange, archetype.xpValue, entry.affinity};
        state.enemies.emplace_back(EnemyId(state.AllocateSerial()), traits, entry.position,
                                   archetype.health);
    }
}

GameState WaveManager::InitialState(const RulesConfig& rules) {
    GameState state;
    state.player.position = rules.playerStart;
    state.player.health = rules.playerHealth;
    state.player.maxHealth = rules.playerHealth;
    state.player.mana = rules.playerMana;
    state.player.maxMana = rules.playerMana;
    state.player.xpToNextLevel = rules.baseXpToLevel;
    state.grid = BuildStaticGrid(state, rules);
    SpawnWave(state, 1, rules);
    return state;
}

void WaveManager::AdvanceWave(GameState& state, const RulesConfig& rules) {
    const int32_t next = state.wave + 1;
    LogContext ctx;
    ctx.wave = next;
    ctx.turn = state.turn;

    if (!HasWave(next)) {
        state.status = GameStatus::Victory;
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::World,
                                              "All waves cleared, victory", ctx);
        return;
    }

    state.wave = next;
    state.player.position = rules.playerStart;
    state.minions.clear();
    state.grid = BuildStaticGrid(state, rules);
    SpawnWave(state, next, rules);

    ctx.extra["enemies"] = std::to_string(state.enemies.size());
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::World,
                                          "Wave started", ctx);
}

}  // namespace sgc::game
