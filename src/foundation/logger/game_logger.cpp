/// @file game_logger.cpp
/// @brief GameLogger over the kcenon GlobalLoggerRegistry.

#include "sgc/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

namespace sgc::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

// Indexed by LogLevel.
constexpr std::array<kci::log_level, 7> kBackendLevels = {
    kci::log_level::trace, kci::log_level::debug,    kci::log_level::info,
    kci::log_level::warning, kci::log_level::error, kci::log_level::critical,
    kci::log_level::off};

// Indexed by LogCategory.
constexpr std::array<LogLevel, kLogCategoryCount> kDefaultLevels = {
    LogLevel::Info,  LogLevel::Debug, LogLevel::Debug, LogLevel::Debug,
    LogLevel::Info,  LogLevel::Info,  LogLevel::Info};

kci::log_level toBackend(LogLevel level) {
    auto idx = static_cast<std::size_t>(level);
    return idx < kBackendLevels.size() ? kBackendLevels[idx] : kci::log_level::info;
}

bool validCategory(LogCategory cat) {
    return static_cast<std::size_t>(cat) < kLogCategoryCount;
}

/// "[Category] message {entity_id=.., wave=.., turn=.., extra...}"
std::string composeLine(LogCategory cat, std::string_view msg, const LogContext* ctx) {
    std::string line;
    line.append("[").append(logCategoryName(cat)).append("] ").append(msg);
    if (ctx == nullptr) {
        return line;
    }

    std::string fields;
    auto field = [&fields](std::string_view key, const std::string& value) {
        fields.append(fields.empty() ? "" : ", ").append(key).append("=").append(value);
    };
    if (ctx->entityId) {
        field("entity_id", std::to_string(*ctx->entityId));
    }
    if (ctx->wave) {
        field("wave", std::to_string(*ctx->wave));
    }
    if (ctx->turn) {
        field("turn", std::to_string(*ctx->turn));
    }
    for (const auto& [key, value] : ctx->extra) {
        field(key, value);
    }
    if (!fields.empty()) {
        line.append(" {").append(fields).append("}");
    }
    return line;
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "warn") {
        return LogLevel::Warning;
    }
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        std::string name(logLevelName(level));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == lowered) {
            return level;
        }
    }
    return std::nullopt;
}

// ── Impl ────────────────────────────────────────────────────────────────

struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> minLevels;

    Impl() { restoreDefaults(); }

    void restoreDefaults() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            minLevels[i].store(kDefaultLevels[i], std::memory_order_relaxed);
        }
    }

    static std::shared_ptr<kci::ILogger> sinkFor(LogCategory cat) {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger("sgc." + std::string(logCategoryName(cat)));
        if (named == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return named;
    }

    static void emit(LogLevel level, LogCategory cat, const std::string& line) {
        // A failing sink never interrupts turn resolution.
        auto written = sinkFor(cat)->log(toBackend(level), line);
        static_cast<void>(written);
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        Impl::emit(level, cat, composeLine(cat, msg, nullptr));
    }
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        Impl::emit(level, cat, composeLine(cat, msg, &ctx));
    }
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (impl_ && validCategory(cat)) {
        impl_->minLevels[static_cast<std::size_t>(cat)].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    if (!impl_ || !validCategory(cat)) {
        return LogLevel::Off;
    }
    return impl_->minLevels[static_cast<std::size_t>(cat)].load(std::memory_order_acquire);
}

void GameLogger::setAllLevels(LogLevel minLevel) {
    if (!impl_) {
        return;
    }
    for (auto& level : impl_->minLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

void GameLogger::resetLevels() {
    if (impl_) {
        impl_->restoreDefaults();
    }
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto minLevel = getCategoryLevel(cat);
    return minLevel != LogLevel::Off && level >= minLevel;
}

GameResult<void> GameLogger::flush() {
    auto flushed = kci::GlobalLoggerRegistry::instance().get_default_logger()->flush();
    if (flushed.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "log sink refused to flush"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger shared;
    return shared;
}

} // namespace sgc::foundation
