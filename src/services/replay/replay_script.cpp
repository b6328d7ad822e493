/// @file replay_script.cpp
/// @brief Replay script parsing and execution.

#include "sgc/service/replay_script.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

using StepsResult = GameResult<std::vector<ReplayStep>>;

/// Lowercase with underscores and dashes dropped: "raise_dead" -> "raisedead".
std::string normalize(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

/// Find the enum value whose display name matches @p name.
template <typename Enum, std::size_t N, typename NameFn>
std::optional<Enum> lookup(std::string_view name, const std::array<Enum, N>& values,
                           NameFn nameOf) {
    const std::string wanted = normalize(name);
    for (auto value : values) {
        if (normalize(nameOf(value)) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

constexpr std::array<game::Direction, 4> kDirections{
    game::Direction::Up, game::Direction::Down, game::Direction::Left, game::Direction::Right};

constexpr std::array<game::Element, 4> kElements{
    game::Element::Fire, game::Element::Water, game::Element::Earth, game::Element::Air};

constexpr std::array<game::SpellShape, 6> kShapes{
    game::SpellShape::Ball,   game::SpellShape::Cone,   game::SpellShape::Wall,
    game::SpellShape::Self,   game::SpellShape::Summon, game::SpellShape::RaiseDead};

constexpr std::array<game::ItemType, 2> kItemTypes{game::ItemType::HealthPotion,
                                                   game::ItemType::ManaPotion};

GameError stepError(ErrorCode code, std::size_t index, const std::string& what) {
    return GameError(code, "step " + std::to_string(index) + ": " + what, index);
}

/// Reads the fields of one step map, remembering the first failure.
class StepReader {
public:
    StepReader(const YAML::Node& node, std::size_t index) : node_(node), index_(index) {}

    [[nodiscard]] std::optional<std::string> Text(const char* key) {
        const auto field = node_[key];
        if (!field || !field.IsScalar()) {
            fail("missing field '" + std::string(key) + "'");
            return std::nullopt;
        }
        return field.as<std::string>();
    }

    [[nodiscard]] std::optional<int32_t> Int(const char* key) {
        const auto field = node_[key];
        if (!field || !field.IsScalar()) {
            fail("missing field '" + std::string(key) + "'");
            return std::nullopt;
        }
        try {
            return field.as<int32_t>();
        } catch (const YAML::BadConversion&) {
            fail("field '" + std::string(key) + "' is not an integer");
            return std::nullopt;
        }
    }

    [[nodiscard]] bool Has(const char* key) const { return static_cast<bool>(node_[key]); }

    template <typename Enum, std::size_t N, typename NameFn>
    [[nodiscard]] std::optional<Enum> Named(const char* key, const std::array<Enum, N>& values,
                                            NameFn nameOf) {
        auto text = Text(key);
        if (!text) {
            return std::nullopt;
        }
        auto value = lookup(*text, values, nameOf);
        if (!value) {
            fail("unknown " + std::string(key) + " '" + *text + "'");
        }
        return value;
    }

    void fail(const std::string& what) {
        if (!error_) {
            error_ = stepError(ErrorCode::ScriptParseFailed, index_, what);
        }
    }

    [[nodiscard]] const std::optional<GameError>& Error() const noexcept { return error_; }

private:
    const YAML::Node& node_;
    std::size_t index_;
    std::optional<GameError> error_;
};

GameResult<ReplayStep> parseStep(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        return GameResult<ReplayStep>::err(
            stepError(ErrorCode::ScriptParseFailed, index, "expected a map"));
    }

    StepReader reader(node, index);
    auto name = reader.Text("action");
    if (!name) {
        return GameResult<ReplayStep>::err(*reader.Error());
    }

    ReplayStep step;
    step.index = index;
    const std::string action = normalize(*name);

    if (action == "move" || action == "dash") {
        auto dir = reader.Named("dir", kDirections, game::DirectionName);
        if (dir) {
            step.action = action == "move" ? game::Action(game::MoveAction{*dir})
                                           : game::Action(game::DashAction{*dir});
        }
    } else if (action == "useitem") {
        if (reader.Has("id")) {
            if (auto id = reader.Int("id")) {
                step.action = game::UseItemAction{game::ItemId(static_cast<uint64_t>(*id))};
            }
        } else if (auto type = reader.Named("type", kItemTypes, game::ItemTypeName)) {
            step.action = game::UseItemAction{};
            step.itemByType = *type;
        }
    } else if (action == "focus" || action == "wait") {
        step.action = game::FocusAction{};
    } else if (action == "cast") {
        auto x = reader.Int("x");
        auto y = reader.Int("y");
        if (x && y) {
            step.action = game::CastSpellAction{{*x, *y}};
        }
    } else if (action == "selectelement") {
        if (auto element = reader.Named("element", kElements, game::ElementName)) {
            step.action = game::SelectElementAction{*element};
        }
    } else if (action == "selectshape") {
        if (auto shape = reader.Named("shape", kShapes, game::SpellShapeName)) {
            step.action = game::SelectShapeAction{*shape};
        }
    } else if (action == "restart") {
        step.action = game::RestartAction{};
    } else {
        return GameResult<ReplayStep>::err(
            stepError(ErrorCode::UnknownAction, index, "unknown action '" + *name + "'"));
    }

    if (reader.Error()) {
        return GameResult<ReplayStep>::err(*reader.Error());
    }
    return GameResult<ReplayStep>::ok(std::move(step));
}

} // namespace

StepsResult parseReplayScript(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return StepsResult::err(GameError(ErrorCode::ScriptParseFailed,
                                          std::string("malformed script: ") + e.what()));
    }

    std::vector<ReplayStep> steps;
    if (!root || root.IsNull()) {
        return StepsResult::ok(std::move(steps));
    }
    if (!root.IsSequence()) {
        return StepsResult::err(
            GameError(ErrorCode::ScriptParseFailed, "script must be a sequence of steps"));
    }

    steps.reserve(root.size());
    for (std::size_t i = 0; i < root.size(); ++i) {
        auto step = parseStep(root[i], i);
        if (!step) {
            return StepsResult::err(step.error());
        }
        steps.push_back(std::move(step).value());
    }
    return StepsResult::ok(std::move(steps));
}

StepsResult loadReplayScript(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return StepsResult::err(GameError(ErrorCode::ScriptParseFailed,
                                          "cannot open script: " + path.string(),
                                          path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseReplayScript(buffer.str());
}

game::Action resolveStep(const ReplayStep& step, const game::GameState& state) {
    if (!step.itemByType) {
        return step.action;
    }
    const auto& inventory = state.player.inventory;
    auto it = std::find_if(inventory.begin(), inventory.end(), [&](const game::Item& item) {
        return item.type == *step.itemByType;
    });
    return game::UseItemAction{it != inventory.end() ? it->id : game::ItemId()};
}

ReplayReport runReplay(game::TurnEngine& engine, const std::vector<ReplayStep>& steps) {
    ReplayReport report;
    for (const auto& step : steps) {
        engine.Apply(resolveStep(step, engine.State()));
        ++report.stepsRun;
        if (game::IsRejected(engine.LastStatus())) {
            ++report.rejected;
            SGC_LOG_DEBUG(LogCategory::Core,
                          "Step " + std::to_string(step.index) + " rejected: " +
                              std::string(game::ActionStatusName(engine.LastStatus())));
        }
    }
    return report;
}

GameResult<ReplayOptions> parseReplayArgs(int argc, char* argv[]) {
    ReplayOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const bool hasValue = i + 1 < argc;
        if (arg == "--board") {
            options.printBoard = true;
        } else if (arg == "--script" && hasValue) {
            options.script = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--rules" && hasValue) {
            options.rules = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--seed" && hasValue) {
            const std::string text(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            std::size_t used = 0;
            try {
                options.seed = std::stoull(text, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (used == 0 || used != text.size()) {
                return GameResult<ReplayOptions>::err(
                    GameError(ErrorCode::InvalidArgument, "invalid seed: " + text, text));
            }
        } else if (arg == "--log-level" && hasValue) {
            const std::string text(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            options.logLevel = foundation::parseLogLevel(text);
            if (!options.logLevel) {
                return GameResult<ReplayOptions>::err(
                    GameError(ErrorCode::InvalidArgument, "invalid log level: " + text, text));
            }
        } else {
            return GameResult<ReplayOptions>::err(GameError(
                ErrorCode::InvalidArgument, "unexpected argument: " + std::string(arg)));
        }
    }
    if (options.script.empty()) {
        return GameResult<ReplayOptions>::err(
            GameError(ErrorCode::InvalidArgument, "missing --script <path>"));
    }
    return GameResult<ReplayOptions>::ok(std::move(options));
}

}  // namespace sgc::service
