#pragma once

/// @file reducer.hpp
/// @brief Pure (state, action) -> state reduction.
///
/// reduce() never modifies its input.  A rejected request returns a copy
/// of the input snapshot and the reason in TurnOutcome::status.

#include "sgc/foundation/random_source.hpp"
#include "sgc/game/actions.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/rules_config.hpp"

namespace sgc::game {

struct TurnOutcome {
    GameState state;
    ActionStatus status = ActionStatus::Resolved;
};

/// Apply @p action to @p state.  Turn-consuming actions run the whole
/// resolution pipeline; random decisions are drawn from @p rng.
[[nodiscard]] TurnOutcome reduce(const GameState& state, const Action& action,
                                 const RulesConfig& rules, foundation::IRandomSource& rng);

}  // namespace sgc::game
