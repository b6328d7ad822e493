#include <gtest/gtest.h>

#include "battle_builders.hpp"
#include "mock_logger.hpp"
#include "scripted_random.hpp"
#include "sgc/game/turn_engine.hpp"
#include "sgc/game/wave_manager.hpp"

using namespace sgc::game;
using sgc::test::EmptyBattle;
using sgc::test::MakeEnemy;
using sgc::test::MakeMinion;
using sgc::test::ScriptedRandom;

namespace {

/// Player at @p player with one distant goblin keeping the wave alive.
GameState quietBattle(Position player = {5, 5}) {
    auto state = EmptyBattle(player);
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {19, 19}));
    return state;
}

} // namespace

class TurnEngineTest : public ::testing::Test {
protected:
    TurnEngine engineWith(GameState state) {
        return TurnEngine(rules_, rng_, std::move(state));
    }

    RulesConfig rules_;
    ScriptedRandom rng_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, FreshEngineStartsAtWaveOne) {
    TurnEngine engine(rules_, rng_);

    const auto& state = engine.State();
    EXPECT_EQ(state, WaveManager::InitialState(rules_));
    EXPECT_EQ(state.wave, 1);
    EXPECT_EQ(state.enemies.size(), 2u);
    EXPECT_EQ(engine.Rules(), rules_);
}

// ═══════════════════════════════════════════════════════════════════════════
// Movement
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, MoveSetsPositionFacingAndResolvesTurn) {
    auto engine = engineWith(quietBattle());

    engine.Move(Direction::Right);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    EXPECT_EQ(engine.State().player.position, (Position{6, 5}));
    EXPECT_EQ(engine.State().player.facing, Direction::Right);
    EXPECT_EQ(engine.State().turn, 1);
    EXPECT_EQ(engine.State().enemies[0].GetPosition(), (Position{19, 18}));
}

TEST_F(TurnEngineTest, BlockedMoveStillResolvesTurn) {
    auto state = quietBattle();
    state.grid.SetTerrain({5, 4}, TileType::Obstacle);
    state.enemies.push_back(MakeEnemy(2, EnemyType::Goblin, {5, 8}));
    auto engine = engineWith(state);

    engine.Move(Direction::Up);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    EXPECT_EQ(engine.State().player.position, (Position{5, 5}));
    EXPECT_EQ(engine.State().player.facing, Direction::Up);
    EXPECT_EQ(engine.State().turn, 1);
    EXPECT_EQ(engine.State().player.mana, 100);
    // The enemy phase still ran: both goblins closed in by one tile.
    ASSERT_EQ(engine.State().enemies.size(), 2u);
    EXPECT_EQ(engine.State().enemies[0].GetPosition(), (Position{18, 19}));
    EXPECT_EQ(engine.State().enemies[1].GetPosition(), (Position{5, 7}));
    EXPECT_EQ(engine.State().player.health, 100);
}

TEST_F(TurnEngineTest, MoveOffTheGridIsBlocked) {
    auto engine = engineWith(quietBattle({0, 0}));

    engine.Move(Direction::Left);

    EXPECT_EQ(engine.State().player.position, (Position{0, 0}));
    EXPECT_EQ(engine.State().turn, 1);
}

TEST_F(TurnEngineTest, MoveIntoEnemyIsBlocked) {
    auto state = EmptyBattle({5, 5});
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {5, 4}));
    auto engine = engineWith(state);

    engine.Move(Direction::Up);

    EXPECT_EQ(engine.State().player.position, (Position{5, 5}));
    EXPECT_EQ(engine.State().player.health, 90);
}

TEST_F(TurnEngineTest, MoveOntoCorpseIsBlocked) {
    auto state = quietBattle();
    state.grid.PlaceCorpse({EnemyId(9), {6, 5}, EnemyType::Goblin});
    auto engine = engineWith(state);

    engine.Move(Direction::Right);

    EXPECT_EQ(engine.State().player.position, (Position{5, 5}));
}

TEST_F(TurnEngineTest, MovePicksUpItem) {
    auto state = quietBattle();
    state.grid.PlaceItem({6, 5}, {ItemId(40), ItemType::HealthPotion});
    auto engine = engineWith(state);

    engine.Move(Direction::Right);

    ASSERT_EQ(engine.State().player.inventory.size(), 1u);
    EXPECT_EQ(engine.State().player.inventory[0].id, ItemId(40));
    EXPECT_EQ(engine.State().grid.TileAt({6, 5}), TileType::Empty);
    EXPECT_TRUE(engine.State().grid.Items().empty());
}

TEST_F(TurnEngineTest, CallerSnapshotIsNotModified) {
    auto engine = engineWith(quietBattle());
    const GameState before = engine.State();

    auto outcome = reduce(before, MoveAction{Direction::Down}, rules_, rng_);

    EXPECT_EQ(outcome.state.player.position, (Position{5, 6}));
    EXPECT_EQ(before.player.position, (Position{5, 5}));
    EXPECT_EQ(engine.State(), before);
}

// ═══════════════════════════════════════════════════════════════════════════
// Dash
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, DashTravelsAndCosts) {
    auto engine = engineWith(quietBattle());

    engine.Dash(Direction::Right);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    EXPECT_EQ(engine.State().player.position, (Position{8, 5}));
    EXPECT_EQ(engine.State().player.mana, 85);        // 100 - 20 + 5
    EXPECT_EQ(engine.State().player.dashCooldown, 2);  // set to 3, cooled once
}

TEST_F(TurnEngineTest, DashStopsBeforeObstacle) {
    auto state = quietBattle();
    state.grid.SetTerrain({7, 5}, TileType::Obstacle);
    auto engine = engineWith(state);

    engine.Dash(Direction::Right);

    EXPECT_EQ(engine.State().player.position, (Position{6, 5}));
    EXPECT_EQ(engine.State().player.mana, 85);
}

TEST_F(TurnEngineTest, DashCollectsItemsOnTheWay) {
    auto state = quietBattle();
    state.grid.PlaceItem({6, 5}, {ItemId(40), ItemType::HealthPotion});
    state.grid.PlaceItem({7, 5}, {ItemId(41), ItemType::ManaPotion});
    auto engine = engineWith(state);

    engine.Dash(Direction::Right);

    EXPECT_EQ(engine.State().player.inventory.size(), 2u);
}

TEST_F(TurnEngineTest, DashOnCooldownLeavesStateUnchanged) {
    auto engine = engineWith(quietBattle());
    engine.Dash(Direction::Right);
    const GameState before = engine.State();

    engine.Dash(Direction::Left);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::DashOnCooldown);
    EXPECT_EQ(engine.State(), before);
}

TEST_F(TurnEngineTest, DashWithoutManaIsRejected) {
    auto state = quietBattle();
    state.player.mana = 19;
    auto engine = engineWith(state);

    engine.Dash(Direction::Right);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::InsufficientMana);
    EXPECT_EQ(engine.State(), state);
}

TEST_F(TurnEngineTest, DashCooldownExpiresAfterThreeTurns) {
    auto engine = engineWith(quietBattle());
    engine.Dash(Direction::Right);
    engine.Wait();
    engine.Wait();

    EXPECT_EQ(engine.State().player.dashCooldown, 0);
    engine.Dash(Direction::Left);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
}

// ═══════════════════════════════════════════════════════════════════════════
// Items, focus
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, UseHealthPotionIsClamped) {
    auto state = quietBattle();
    state.player.health = 85;
    state.player.inventory.push_back({ItemId(40), ItemType::HealthPotion});
    auto engine = engineWith(state);

    engine.UseItem(ItemId(40));

    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    EXPECT_EQ(engine.State().player.health, 100);
    EXPECT_TRUE(engine.State().player.inventory.empty());
}

TEST_F(TurnEngineTest, UseManaPotion) {
    auto state = quietBattle();
    state.player.mana = 40;
    state.player.inventory.push_back({ItemId(40), ItemType::ManaPotion});
    auto engine = engineWith(state);

    engine.UseItem(ItemId(40));

    EXPECT_EQ(engine.State().player.mana, 75);   // 40 + 30 + 5
}

TEST_F(TurnEngineTest, UnknownItemIsRejected) {
    auto state = quietBattle();
    auto engine = engineWith(state);

    engine.UseItem(ItemId(99));

    EXPECT_EQ(engine.LastStatus(), ActionStatus::ItemNotFound);
    EXPECT_EQ(engine.State(), state);
}

TEST_F(TurnEngineTest, FocusRegeneratesMore) {
    auto state = quietBattle();
    state.player.mana = 50;
    auto engine = engineWith(state);

    engine.Focus();
    EXPECT_EQ(engine.State().player.mana, 65);

    engine.Move(Direction::Down);
    EXPECT_EQ(engine.State().player.mana, 70);

    engine.Wait();
    EXPECT_EQ(engine.State().player.mana, 85);
}

// ═══════════════════════════════════════════════════════════════════════════
// Loadout selection
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, LockedSelectionIsRejected) {
    auto state = quietBattle();
    auto engine = engineWith(state);

    engine.SelectElement(Element::Water);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::Locked);
    engine.SelectSpellShape(SpellShape::Cone);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::Locked);
    EXPECT_EQ(engine.State(), state);
}

TEST_F(TurnEngineTest, UnlockedSelectionDoesNotUseATurn) {
    auto state = quietBattle();
    state.player.unlockedElements.insert(Element::Water);
    state.player.unlockedShapes.insert(SpellShape::Wall);
    auto engine = engineWith(state);

    engine.SelectElement(Element::Water);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::Applied);
    engine.SelectSpellShape(SpellShape::Wall);

    EXPECT_EQ(engine.State().player.selectedElement, Element::Water);
    EXPECT_EQ(engine.State().player.selectedShape, SpellShape::Wall);
    EXPECT_EQ(engine.State().turn, 0);
    EXPECT_EQ(engine.State().enemies, state.enemies);
}

TEST_F(TurnEngineTest, PreviewFollowsLoadout) {
    auto state = quietBattle();
    state.player.unlockedShapes.insert(SpellShape::Wall);
    auto engine = engineWith(state);

    EXPECT_EQ(engine.AffectedTiles(Position{9, 9}).size(), 1u);
    engine.SelectSpellShape(SpellShape::Wall);
    EXPECT_EQ(engine.AffectedTiles(Position{9, 9}).size(), 9u);
    EXPECT_TRUE(engine.AffectedTiles(Position{9, 9}).contains(Position{10, 10}));
    // Without a target there is nothing to preview, whatever the shape.
    EXPECT_TRUE(engine.AffectedTiles().empty());
    engine.SelectSpellShape(SpellShape::Ball);
    EXPECT_TRUE(engine.AffectedTiles(std::nullopt).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Casting
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, FireBallDamagesAndBurns) {
    auto state = EmptyBattle({0, 0});
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {9, 9}));
    auto engine = engineWith(state);

    engine.CastSpellAt(9, 9);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    const auto& goblin = engine.State().enemies[0];
    EXPECT_EQ(goblin.Health(), 15);   // 50 - 30, then one burn tick
    ASSERT_EQ(goblin.StatusEffects().size(), 1u);
    EXPECT_EQ(goblin.StatusEffects()[0].remaining, 2);
    EXPECT_EQ(engine.State().player.mana, 95);   // 100 - 10 + 5
}

TEST_F(TurnEngineTest, CastOutsideGridIsInvalid) {
    auto state = quietBattle();
    auto engine = engineWith(state);

    engine.CastSpellAt(-1, 3);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::InvalidTarget);
    EXPECT_EQ(engine.State(), state);
}

TEST_F(TurnEngineTest, CastWithoutManaIsRejected) {
    auto state = quietBattle();
    state.player.mana = 9;
    auto engine = engineWith(state);

    engine.CastSpellAt(3, 3);

    EXPECT_EQ(engine.LastStatus(), ActionStatus::InsufficientMana);
    EXPECT_EQ(engine.State(), state);
}

TEST_F(TurnEngineTest, FrozenEnemyHoldsDuringCastTurn) {
    auto state = EmptyBattle({0, 0});
    state.player.unlockedElements.insert(Element::Water);
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {0, 2}));
    auto engine = engineWith(state);
    engine.SelectElement(Element::Water);

    engine.CastSpellAt(0, 2);
    // Frozen 2 ticks to 1 in the status phase and the goblin holds.
    EXPECT_EQ(engine.State().enemies[0].GetPosition(), (Position{0, 2}));
    EXPECT_EQ(engine.State().enemies[0].Health(), 25);

    engine.Wait();
    // Effect expired in this turn's status phase, so the goblin steps.
    EXPECT_FALSE(engine.State().enemies[0].HasStatus(StatusEffectType::Frozen));
    EXPECT_EQ(engine.State().enemies[0].GetPosition(), (Position{0, 1}));
}

TEST_F(TurnEngineTest, SelfHealsThePlayer) {
    auto state = quietBattle();
    state.player.unlockedShapes.insert(SpellShape::Self);
    state.player.health = 50;
    auto engine = engineWith(state);
    engine.SelectSpellShape(SpellShape::Self);

    engine.CastSpellAt(0, 0);

    EXPECT_EQ(engine.State().player.health, 70);
    EXPECT_EQ(engine.State().player.mana, 75);   // 100 - 30 + 5
}

TEST_F(TurnEngineTest, SummonNeedsAFreeEmptyTile) {
    auto state = quietBattle();
    state.player.unlockedShapes.insert(SpellShape::Summon);
    state.grid.SetTerrain({7, 7}, TileType::Water);
    auto engine = engineWith(state);
    engine.SelectSpellShape(SpellShape::Summon);

    engine.CastSpellAt(7, 7);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::InvalidTarget);
    engine.CastSpellAt(5, 5);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::InvalidTarget);

    engine.CastSpellAt(6, 6);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    ASSERT_EQ(engine.State().minions.size(), 1u);
    EXPECT_FALSE(engine.State().minions[0].IsUndead());
    EXPECT_EQ(engine.State().minions[0].Health(), 40);
}

TEST_F(TurnEngineTest, RaiseDeadConsumesCorpse) {
    auto state = quietBattle();
    state.player.unlockedShapes.insert(SpellShape::RaiseDead);
    state.grid.PlaceCorpse({EnemyId(9), {8, 8}, EnemyType::Ogre});
    auto engine = engineWith(state);
    engine.SelectSpellShape(SpellShape::RaiseDead);

    engine.CastSpellAt(3, 3);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::InvalidTarget);

    engine.CastSpellAt(8, 8);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::Resolved);
    EXPECT_EQ(engine.State().grid.CorpseAt({8, 8}), nullptr);
    EXPECT_EQ(engine.State().grid.TileAt({8, 8}), TileType::Empty);
    ASSERT_EQ(engine.State().minions.size(), 1u);
    EXPECT_EQ(engine.State().minions[0].UndeadSource(), EnemyType::Ogre);
}

TEST_F(TurnEngineTest, MinionFinishesWoundedEnemy) {
    auto state = EmptyBattle({0, 0});
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {10, 10}).WithHealth(10));
    state.minions.push_back(MakeMinion(50, {10, 9}));
    auto engine = engineWith(state);

    engine.Wait();

    // Last enemy fell to the minion, so wave 2 begins.
    EXPECT_EQ(engine.State().wave, 2);
    EXPECT_EQ(engine.State().player.xp, 25);
    EXPECT_TRUE(engine.State().minions.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// End of battle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurnEngineTest, ClearingLastWaveIsVictory) {
    auto state = EmptyBattle({0, 0});
    state.wave = 3;
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {4, 4}).WithHealth(10));
    auto engine = engineWith(state);

    engine.CastSpellAt(4, 4);

    EXPECT_EQ(engine.State().status, GameStatus::Victory);
    engine.Move(Direction::Down);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::NotPlaying);
}

TEST_F(TurnEngineTest, DeathEndsTheBattle) {
    auto state = EmptyBattle({5, 5});
    state.player.health = 10;
    state.enemies.push_back(MakeEnemy(1, EnemyType::Goblin, {5, 6}));
    auto engine = engineWith(state);

    engine.Wait();

    EXPECT_EQ(engine.State().status, GameStatus::GameOver);
    const GameState over = engine.State();
    engine.CastSpellAt(5, 6);
    EXPECT_EQ(engine.LastStatus(), ActionStatus::NotPlaying);
    EXPECT_EQ(engine.State(), over);
}

TEST_F(TurnEngineTest, RestartReturnsToInitialState) {
    auto state = EmptyBattle({5, 5});
    state.status = GameStatus::GameOver;
    state.player.level = 4;
    auto engine = engineWith(state);

    engine.Restart();

    EXPECT_EQ(engine.LastStatus(), ActionStatus::Applied);
    EXPECT_EQ(engine.State(), WaveManager::InitialState(rules_));
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

class TurnEngineLogTest : public sgc::test::MockLoggerTest {
protected:
    RulesConfig rules_;
    ScriptedRandom rng_;
};

TEST_F(TurnEngineLogTest, RejectionsAreLogged) {
    TurnEngine engine(rules_, rng_, quietBattle());

    engine.UseItem(ItemId(99));

    EXPECT_TRUE(mockLogger_->contains("Action rejected"));
}

TEST(ActionNameTest, NamesEveryKind) {
    EXPECT_EQ(ActionName(MoveAction{}), "move");
    EXPECT_EQ(ActionName(CastSpellAction{}), "cast");
    EXPECT_EQ(ActionName(RestartAction{}), "restart");
    EXPECT_TRUE(IsRejected(ActionStatus::Locked));
    EXPECT_FALSE(IsRejected(ActionStatus::Applied));
}
