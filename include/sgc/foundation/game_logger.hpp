#pragma once

/// @file game_logger.hpp
/// @brief Category-filtered logging of turn resolution over the kcenon
///        logger registry.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sgc/foundation/game_result.hpp"

namespace sgc::foundation {

/// Severity, ordered.  Off silences a category entirely.
enum class LogLevel : uint8_t { Trace, Debug, Info, Warning, Error, Critical, Off };

/// One category per rules subsystem.
enum class LogCategory : uint8_t {
    Core,        ///< Engine lifecycle, restart
    Turn,        ///< Action dispatch, rejected requests
    Combat,      ///< Spell damage, burn and frozen, deaths
    AI,          ///< Minion strikes, enemy attacks and stomps
    World,       ///< Waves, spawns, victory and game over
    Progression, ///< Experience, level-ups, unlocks
    Config       ///< Rules file loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Turn", "Combat", "AI", "World", "Progression", "Config"};
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    constexpr std::array<std::string_view, 7> names = {
        "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL", "OFF"};
    auto idx = static_cast<std::size_t>(level);
    return idx < names.size() ? names[idx] : "UNKNOWN";
}

/// Case-insensitive level name ("debug", "WARN", "warning", "off").
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

/// Fields appended to a message as `{key=value, ...}`.
///
/// @code
///   LogContext ctx;
///   ctx.entityId = enemy.Id().value();
///   ctx.turn = state.turn;
///   ctx.extra["damage"] = "45";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat, "Spell damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<uint64_t> entityId;
    std::optional<int32_t> wave;
    std::optional<int64_t> turn;
    std::unordered_map<std::string, std::string> extra;
};

/// Writes "[Category] message" lines to the kcenon registry.
///
/// A category logs through the registry entry named "sgc.<Category>"
/// when one is registered, otherwise through the default logger.
/// Turn, Combat and AI start at Debug; the rest start at Info.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Apply one minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    /// Restore the per-category defaults.
    void resetLevels();

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    /// Shared instance behind the SGC_LOG macros and the rules modules.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgc::foundation

// ── SGC_LOG macros ─────────────────────────────────────────────────────
//
// Calls below SGC_MIN_LOG_LEVEL (0=Trace .. 6=Off) compile to nothing;
// the rest check the category level at runtime before building output.

#ifndef SGC_MIN_LOG_LEVEL
    #define SGC_MIN_LOG_LEVEL 0
#endif

#define SGC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= SGC_MIN_LOG_LEVEL &&                      \
            ::sgc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::sgc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define SGC_LOG_DEBUG(cat, msg) SGC_LOG(::sgc::foundation::LogLevel::Debug, (cat), (msg))
#define SGC_LOG_INFO(cat, msg) SGC_LOG(::sgc::foundation::LogLevel::Info, (cat), (msg))
#define SGC_LOG_WARN(cat, msg) SGC_LOG(::sgc::foundation::LogLevel::Warning, (cat), (msg))
#define SGC_LOG_ERROR(cat, msg) SGC_LOG(::sgc::foundation::LogLevel::Error, (cat), (msg))
