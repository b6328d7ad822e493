#pragma once

/// @file turn_engine.hpp
/// @brief TurnEngine: owner of the authoritative battle snapshot.
///
/// Every operation reduces the current snapshot with one action and
/// replaces it with the result.  Callers read the snapshot through
/// State() and never mutate it.
///
/// Thread safety: None.  One engine is driven by one caller.

#include <optional>

#include "sgc/foundation/random_source.hpp"
#include "sgc/game/actions.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/reducer.hpp"
#include "sgc/game/rules_config.hpp"
#include "sgc/game/spell_geometry.hpp"

namespace sgc::game {

class TurnEngine {
public:
    /// Start a battle at wave 1.  @p rng must outlive the engine.
    TurnEngine(RulesConfig rules, foundation::IRandomSource& rng);

    /// Resume from an existing snapshot.
    TurnEngine(RulesConfig rules, foundation::IRandomSource& rng, GameState initial);

    [[nodiscard]] const GameState& State() const noexcept { return state_; }
    [[nodiscard]] const RulesConfig& Rules() const noexcept { return rules_; }

    /// Status of the most recent request.
    [[nodiscard]] ActionStatus LastStatus() const noexcept { return lastStatus_; }

    const GameState& Apply(const Action& action);

    const GameState& Move(Direction direction) { return Apply(MoveAction{direction}); }
    const GameState& Dash(Direction direction) { return Apply(DashAction{direction}); }
    const GameState& UseItem(ItemId item) { return Apply(UseItemAction{item}); }
    const GameState& Focus() { return Apply(FocusAction{}); }
    const GameState& Wait() { return Focus(); }
    const GameState& CastSpellAt(int32_t x, int32_t y) { return Apply(CastSpellAction{{x, y}}); }
    const GameState& SelectElement(Element element) { return Apply(SelectElementAction{element}); }
    const GameState& SelectSpellShape(SpellShape shape) { return Apply(SelectShapeAction{shape}); }
    const GameState& Restart() { return Apply(RestartAction{}); }

    /// Tiles the current loadout would affect at @p target.  Read-only
    /// preview; empty when no target is given.
    [[nodiscard]] TileSet AffectedTiles(std::optional<Position> target = std::nullopt) const;

private:
    RulesConfig rules_;
    foundation::IRandomSource& rng_;
    GameState state_;
    ActionStatus lastStatus_ = ActionStatus::Applied;
};

}  // namespace sgc::game
