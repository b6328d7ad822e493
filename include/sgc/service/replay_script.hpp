#pragma once

/// @file replay_script.hpp
/// @brief YAML action scripts and the headless replay runner.
///
/// A script is a YAML sequence of steps:
/// @code
///   - {action: select_element, element: fire}
///   - {action: move, dir: right}
///   - {action: cast, x: 5, y: 5}
///   - {action: use_item, type: health_potion}
/// @endcode
/// Recognized actions: move, dash (dir), use_item (id or type), focus,
/// wait, cast (x, y), select_element (element), select_shape (shape),
/// restart.  Names are matched case-insensitively, underscores ignored.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sgc/foundation/game_logger.hpp"
#include "sgc/foundation/game_result.hpp"
#include "sgc/game/actions.hpp"
#include "sgc/game/entity_types.hpp"
#include "sgc/game/game_state.hpp"
#include "sgc/game/turn_engine.hpp"

namespace sgc::service {

/// One parsed script line.
///
/// use_item by type is resolved against the inventory when the step runs,
/// since item ids are only known at that point.
struct ReplayStep {
    game::Action action;
    std::optional<game::ItemType> itemByType;
    std::size_t index = 0;   ///< Position in the script, for messages.
};

/// Parse script text.  ScriptParseFailed on malformed YAML or a bad field,
/// UnknownAction on an unrecognized action name.
[[nodiscard]] foundation::GameResult<std::vector<ReplayStep>>
parseReplayScript(std::string_view yaml);

/// Read and parse a script file.
[[nodiscard]] foundation::GameResult<std::vector<ReplayStep>>
loadReplayScript(const std::filesystem::path& path);

/// The concrete action of @p step against @p state.  A use_item by type
/// with no matching item becomes a request for an id that does not exist,
/// which the engine rejects.
[[nodiscard]] game::Action resolveStep(const ReplayStep& step, const game::GameState& state);

/// Counters of a finished replay.
struct ReplayReport {
    std::size_t stepsRun = 0;
    std::size_t rejected = 0;
};

/// Feed every step into @p engine, in order.
ReplayReport runReplay(game::TurnEngine& engine, const std::vector<ReplayStep>& steps);

/// Command line of sgc_replay.
struct ReplayOptions {
    std::filesystem::path script;
    std::filesystem::path rules;   ///< Empty: built-in defaults.
    uint64_t seed = 0;
    bool printBoard = false;
    std::optional<foundation::LogLevel> logLevel;   ///< Unset: category defaults.
};

/// Parse `--script <path> [--rules <path>] [--seed <n>] [--log-level <level>] [--board]`.
[[nodiscard]] foundation::GameResult<ReplayOptions> parseReplayArgs(int argc, char* argv[]);

}  // namespace sgc::service
