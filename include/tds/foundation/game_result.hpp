#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for game-specific error handling.

#include "tds/core/result.hpp"
#include "tds/foundation/game_error.hpp"

namespace tds::foundation {

/// Result type specialized with GameError for simulation operations.
///
/// Every action and loader that can be rejected returns GameResult<T>
/// instead of throwing exceptions.
///
/// Example:
/// @code
///   GameResult<int> upgradeCost(int level) {
///       if (level < 1) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidArgument, "level must be >= 1"));
///       }
///       return GameResult<int>::ok(60 * level);
///   }
/// @endcode
template <typename T>
using GameResult = tds::Result<T, GameError>;

}  // namespace tds::foundation
