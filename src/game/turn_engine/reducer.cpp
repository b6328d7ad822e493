/// @file reducer.cpp
/// @brief Player action handlers and the reduce() entry point.
///
/// Each handler validates its preconditions against the input snapshot
/// first; only an accepted action copies the state and mutates the copy.

#include "sgc/game/reducer.hpp"

#include <algorithm>
#include <string>

#include "sgc/foundation/game_logger.hpp"
#include "sgc/game/combat_resolver.hpp"
#include "sgc/game/spell_geometry.hpp"
#include "sgc/game/turn_pipeline.hpp"
#include "sgc/game/wave_manager.hpp"

namespace sgc::game {

using foundation::GameLogger;
using foundation::IRandomSource;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::string_view ActionName(const Action& action) noexcept {
    struct Namer {
        std::string_view operator()(const MoveAction&) const { return "move"; }
        std::string_view operator()(const DashAction&) const { return "dash"; }
        std::string_view operator()(const UseItemAction&) const { return "useItem"; }
        std::string_view operator()(const FocusAction&) const { return "focus"; }
        std::string_view operator()(const CastSpellAction&) const { return "cast"; }
        std::string_view operator()(const SelectElementAction&) const { return "selectElement"; }
        std::string_view operator()(const SelectShapeAction&) const { return "selectShape"; }
        std::string_view operator()(const RestartAction&) const { return "restart"; }
    };
    return std::visit(Namer{}, action);
}

namespace {

/// True if the player may stand on @p pos.
bool canEnter(const GameState& state, Position pos) {
    return state.grid.InBounds(pos) && !BlocksMovement(state.grid.TileAt(pos)) &&
           state.EnemyAt(pos) == nullptr && state.MinionAt(pos) == nullptr;
}

/// Move an item lying on the player's tile into the inventory.
void pickUp(GameState& state) {
    if (auto item = state.grid.TakeItem(state.player.position)) {
        state.player.inventory.push_back(*item);
    }
}

class Reducer {
public:
    Reducer(const GameState& state, const RulesConfig& rules, IRandomSource& rng)
        : state_(state), rules_(rules), rng_(rng) {}

    TurnOutcome operator()(const MoveAction& action) const {
        GameState next = state_;
        next.player.facing = action.direction;
        const Position dest = next.player.position + StepOffset(action.direction);
        if (canEnter(next, dest)) {
            next.player.position = dest;
            pickUp(next);
        }
        return resolve(std::move(next), {});
    }

    TurnOutcome operator()(const DashAction& action) const {
        const auto& player = state_.player;
        if (player.mana < rules_.dashManaCost) {
            return reject(ActionStatus::InsufficientMana);
        }
        if (player.dashCooldown > 0) {
            return reject(ActionStatus::DashOnCooldown);
        }

        GameState next = state_;
        for (int32_t step = 0; step < rules_.dashDistance; ++step) {
            const Position dest = next.player.position + StepOffset(action.direction);
            if (!canEnter(next, dest)) {
                break;
            }
            next.player.position = dest;
            pickUp(next);
        }
        next.player.mana -= rules_.dashManaCost;
        next.player.dashCooldown = rules_.dashCooldown;
        return resolve(std::move(next), {});
    }

    TurnOutcome operator()(const UseItemAction& action) const {
        const auto slot = state_.player.FindItem(action.item);
        if (!slot) {
            return reject(ActionStatus::ItemNotFound);
        }

        GameState next = state_;
        auto& player = next.player;
        const Item item = player.inventory[*slot];
        player.inventory.erase(player.inventory.begin() + static_cast<std::ptrdiff_t>(*slot));
        switch (item.type) {
            case ItemType::HealthPotion:
                player.health = std::min(player.health + rules_.healthPotionAmount,
                                         player.maxHealth);
                break;
            case ItemType::ManaPotion:
                player.mana = std::min(player.mana + rules_.manaPotionAmount, player.maxMana);
                break;
        }
        return resolve(std::move(next), {});
    }

    TurnOutcome operator()(const FocusAction&) const {
        TurnContext context;
        context.focused = true;
        return resolve(state_, std::move(context));
    }

    TurnOutcome operator()(const CastSpellAction& action) const {
        const auto& player = state_.player;
        const SpellShape shape = player.selectedShape;
        const int32_t cost = rules_.ManaCost(shape);
        if (player.mana < cost) {
            return reject(ActionStatus::InsufficientMana);
        }

        switch (shape) {
            case SpellShape::Self:
                return castSelf(cost);
            case SpellShape::Summon:
                return castSummon(action.target, cost);
            case SpellShape::RaiseDead:
                return castRaiseDead(action.target, cost);
            case SpellShape::Ball:
            case SpellShape::Cone:
            case SpellShape::Wall:
                break;
        }
        return castElemental(action.target, cost);
    }

    TurnOutcome operator()(const SelectElementAction& action) const {
        if (!state_.player.unlockedElements.contains(action.element)) {
            return reject(ActionStatus::Locked);
        }
        GameState next = state_;
        next.player.selectedElement = action.element;
        return {std::move(next), ActionStatus::Applied};
    }

    TurnOutcome operator()(const SelectShapeAction& action) const {
        if (!state_.player.unlockedShapes.contains(action.shape)) {
            return reject(ActionStatus::Locked);
        }
        GameState next = state_;
        next.player.selectedShape = action.shape;
        return {std::move(next), ActionStatus::Applied};
    }

    TurnOutcome operator()(const RestartAction&) const {
        SGC_LOG_INFO(LogCategory::World, "Battle restarted");
        return {WaveManager::InitialState(rules_), ActionStatus::Applied};
    }

private:
    TurnOutcome castSelf(int32_t cost) const {
        GameState next = state_;
        auto& player = next.player;
        player.mana -= cost;
        player.health = std::min(player.health + rules_.selfHeal, player.maxHealth);
        return resolve(std::move(next), {});
    }

    TurnOutcome castSummon(Position target, int32_t cost) const {
        if (!state_.grid.InBounds(target) || state_.grid.TileAt(target) != TileType::Empty ||
            state_.IsOccupied(target)) {
            return reject(ActionStatus::InvalidTarget);
        }
        GameState next = state_;
        next.player.mana -= cost;
        next.minions.emplace_back(MinionId(next.AllocateSerial()), target, rules_.minionHealth);
        return resolve(std::move(next), {});
    }

    TurnOutcome castRaiseDead(Position target, int32_t cost) const {
        if (state_.grid.CorpseAt(target) == nullptr || state_.IsOccupied(target)) {
            return reject(ActionStatus::InvalidTarget);
        }
        GameState next = state_;
        const auto corpse = next.grid.TakeCorpse(target);
        next.player.mana -= cost;
        next.minions.emplace_back(MinionId(next.AllocateSerial()), target, rules_.minionHealth,
                                  corpse->sourceType);
        return resolve(std::move(next), {});
    }

    TurnOutcome castElemental(Position target, int32_t cost) const {
        if (!state_.grid.InBounds(target)) {
            return reject(ActionStatus::InvalidTarget);
        }
        GameState next = state_;
        const auto& player = next.player;
        const TileSet tiles = AffectedTiles({player.selectedShape, target, player.position,
                                             player.facing, next.grid.Size()});
        next.player.mana -= cost;

        TurnContext context;
        context.defeated = CombatResolver::ResolveElementalCast(next, tiles, rules_).defeated;
        return resolve(std::move(next), std::move(context));
    }

    TurnOutcome resolve(GameState next, TurnContext context) const {
        TurnPipeline pipeline(rules_, rng_);
        pipeline.Resolve(next, std::move(context));
        return {std::move(next), ActionStatus::Resolved};
    }

    TurnOutcome reject(ActionStatus status) const {
        return {state_, status};
    }

    const GameState& state_;
    const RulesConfig& rules_;
    IRandomSource& rng_;
};

} // namespace

TurnOutcome reduce(const GameState& state, const Action& action, const RulesConfig& rules,
                   IRandomSource& rng) {
    auto& logger = GameLogger::instance();

    if (!state.IsPlaying() && !std::holds_alternative<RestartAction>(action)) {
        SGC_LOG_DEBUG(LogCategory::Turn,
                      "Ignored " + std::string(ActionName(action)) + ": battle is over");
        return {state, ActionStatus::NotPlaying};
    }

    TurnOutcome outcome = std::visit(Reducer(state, rules, rng), action);

    if (logger.isEnabled(LogLevel::Debug, LogCategory::Turn)) {
        LogContext ctx;
        ctx.wave = outcome.state.wave;
        ctx.turn = outcome.state.turn;
        ctx.extra["action"] = std::string(ActionName(action));
        ctx.extra["status"] = std::string(ActionStatusName(outcome.status));
        logger.logWithContext(LogLevel::Debug, LogCategory::Turn,
                              IsRejected(outcome.status) ? "Action rejected" : "Action applied",
                              ctx);
    }
    return outcome;
}

}  // namespace sgc::game
