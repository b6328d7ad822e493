#pragma once

/// @file game_error.hpp
/// @brief Error value carried by GameResult.

#include <any>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "sgc/foundation/error_code.hpp"

namespace sgc::foundation {

/// A code, a message, and optionally the value that caused the failure
/// (the offending rules key, the script step index, a bad argument).
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message, std::any context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }
    [[nodiscard]] bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }

    /// nullptr when there is no context or it holds another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// "Replay 0x0401: unknown action 'jump'"
    [[nodiscard]] std::string describe() const {
        char code[8];
        std::snprintf(code, sizeof(code), "0x%04X", static_cast<unsigned>(code_));
        std::string out(subsystem());
        out.append(" ").append(code);
        if (!message_.empty()) {
            out.append(": ").append(message_);
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace sgc::foundation
