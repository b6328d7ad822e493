#include "sgc/game/game_state.hpp"

#include <algorithm>

namespace sgc::game {

const Enemy* GameState::EnemyAt(Position pos) const {
    auto it = std::find_if(enemies.begin(), enemies.end(),
                           [pos](const Enemy& e) { return e.GetPosition() == pos; });
    return it == enemies.end() ? nullptr : &*it;
}

const Minion* GameState::MinionAt(Position pos) const {
    auto it = std::find_if(minions.begin(), minions.end(),
                           [pos](const Minion& m) { return m.GetPosition() == pos; });
    return it == minions.end() ? nullptr : &*it;
}

bool GameState::IsOccupied(Position pos) const {
    return player.position == pos || EnemyAt(pos) != nullptr || MinionAt(pos) != nullptr;
}

}  // namespace sgc::game
