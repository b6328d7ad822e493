#pragma once

/// @file error_code.hpp
/// @brief Error codes for the loading, logging and replay layers.

#include <cstdint>
#include <string_view>

namespace sgc::foundation {

/// The high byte names the subsystem, the low byte the failure.
enum class ErrorCode : uint16_t {
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Rules file access (ConfigManager)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Logging backend
    LoggerError = 0x0200,
    LoggerNotInitialized = 0x0201,
    LoggerFlushFailed = 0x0202,

    // Balance values that load but break a rules invariant
    RulesError = 0x0300,
    InvalidConfigValue = 0x0301,

    // Action scripts fed to the replay runner
    ScriptParseFailed = 0x0400,
    UnknownAction = 0x0401,
};

constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint16_t>(code) >> 8) {
        case 0x00: return "General";
        case 0x01: return "Config";
        case 0x02: return "Logger";
        case 0x03: return "Rules";
        case 0x04: return "Replay";
        default: return "Unknown";
    }
}

} // namespace sgc::foundation
