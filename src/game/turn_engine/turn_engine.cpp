/// @file turn_engine.cpp
/// @brief TurnEngine implementation.

#include "sgc/game/turn_engine.hpp"

#include <utility>

#include "sgc/game/wave_manager.hpp"

namespace sgc::game {

TurnEngine::TurnEngine(RulesConfig rules, foundation::IRandomSource& rng)
    : rules_(std::move(rules)), rng_(rng), state_(WaveManager::InitialState(rules_)) {}

TurnEngine::TurnEngine(RulesConfig rules, foundation::IRandomSource& rng, GameState initial)
    : rules_(std::move(rules)), rng_(rng), state_(std::move(initial)) {}

const GameState& TurnEngine::Apply(const Action& action) {
    TurnOutcome outcome = reduce(state_, action, rules_, rng_);
    lastStatus_ = outcome.status;
    if (!IsRejected(outcome.status)) {
        state_ = std::move(outcome.state);
    }
    return state_;
}

TileSet TurnEngine::AffectedTiles(std::optional<Position> target) const {
    if (!target) {
        return {};
    }
    const auto& player = state_.player;
    return game::AffectedTiles({player.selectedShape, *target,
                                player.position, player.facing, state_.grid.Size()});
}

}  // namespace sgc::game
