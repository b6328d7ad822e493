/// @file main.cpp
/// @brief Replay runner entry point.
///
/// Plays a YAML action script against a fresh battle and prints the
/// final snapshot.  Usage:
///   sgc_replay --script <path> [--rules <path>] [--seed <n>] [--log-level <level>] [--board]

#include <cstdlib>
#include <iostream>

#include "sgc/foundation/config_manager.hpp"
#include "sgc/foundation/game_logger.hpp"
#include "sgc/foundation/random_source.hpp"
#include "sgc/game/board_text.hpp"
#include "sgc/game/rules_config.hpp"
#include "sgc/game/turn_engine.hpp"
#include "sgc/service/replay_script.hpp"
#include "sgc/version.hpp"

namespace {

sgc::foundation::GameResult<sgc::game::RulesConfig>
loadRules(const std::filesystem::path& path) {
    if (path.empty()) {
        return sgc::foundation::GameResult<sgc::game::RulesConfig>::ok(sgc::game::RulesConfig{});
    }
    sgc::foundation::ConfigManager config;
    return config.load(path).andThen([&config] { return sgc::game::loadRulesConfig(config); });
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = sgc::service::parseReplayArgs(argc, argv);
    if (!options) {
        std::cerr << "sgc_replay " << SGC_VERSION_STRING << ": "
                  << options.error().describe() << "\n"
                  << "usage: sgc_replay --script <path> [--rules <path>] [--seed <n>]"
                     " [--log-level <level>] [--board]\n";
        return EXIT_FAILURE;
    }

    if (options.value().logLevel) {
        sgc::foundation::GameLogger::instance().setAllLevels(*options.value().logLevel);
    }

    auto rules = loadRules(options.value().rules);
    if (!rules) {
        std::cerr << "Failed to load rules: " << rules.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto steps = sgc::service::loadReplayScript(options.value().script);
    if (!steps) {
        std::cerr << "Failed to load script: " << steps.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    sgc::foundation::SeededRandomSource rng(options.value().seed);
    sgc::game::TurnEngine engine(rules.value(), rng);
    auto report = sgc::service::runReplay(engine, steps.value());

    std::cout << "steps=" << report.stepsRun << " rejected=" << report.rejected << "\n"
              << sgc::game::describeStatus(engine.State()) << "\n";
    for (const auto& enemy : engine.State().enemies) {
        std::cout << "  " << sgc::game::EnemyTypeName(enemy.Type()) << " #"
                  << enemy.Id().value() << " at (" << enemy.GetPosition().x << ','
                  << enemy.GetPosition().y << ") hp=" << enemy.Health() << "\n";
    }
    if (options.value().printBoard) {
        std::cout << sgc::game::describeBoard(engine.State());
    }
    return EXIT_SUCCESS;
}
