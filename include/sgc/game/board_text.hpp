#pragma once

/// @file board_text.hpp
/// @brief Plain-text dump of a snapshot for logs and the replay runner.
///
/// Glyphs, entities over overlays over terrain:
///   @ player   g/a/o goblin/archer/ogre   m minion   u raised minion
///   x corpse   ! item   * burning   # obstacle   ~ water   ^ forest   . empty

#include <string>

#include "sgc/game/game_state.hpp"

namespace sgc::game {

/// Glyph shown for tile @p pos.
[[nodiscard]] char BoardGlyph(const GameState& state, Position pos);

/// One line per grid row, top row first.
[[nodiscard]] std::string describeBoard(const GameState& state);

/// One-line summary: status, wave, turn, player stats and enemy count.
[[nodiscard]] std::string describeStatus(const GameState& state);

}  // namespace sgc::game
