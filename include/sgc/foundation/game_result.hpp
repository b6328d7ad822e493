#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias for fallible foundation operations.

#include "sgc/core/result.hpp"
#include "sgc/foundation/game_error.hpp"

namespace sgc::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int32_t> readGridSize(const ConfigManager& cfg) {
///       auto size = cfg.get<int32_t>("grid.size");
///       if (size.hasError()) {
///           return size;
///       }
///       if (size.value() <= 0) {
///           return GameResult<int32_t>::err(
///               GameError(ErrorCode::InvalidConfigValue, "grid.size must be positive"));
///       }
///       return size;
///   }
/// @endcode
template <typename T>
using GameResult = sgc::Result<T, GameError>;

}  // namespace sgc::foundation
