#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias binding Result to GameError.

#include "arc/core/result.hpp"
#include "arc/foundation/game_error.hpp"

namespace arc::foundation {

/// Result type for rules operations that may refuse a request.
///
/// Example:
/// @code
///   GameResult<int32_t> spend(int32_t points, int32_t available) {
///       if (points > available) {
///           return GameResult<int32_t>::err(
///               GameError(ErrorCode::InvalidAllocation, "not enough points"));
///       }
///       return GameResult<int32_t>::ok(available - points);
///   }
/// @endcode
template <typename T>
using GameResult = arc::Result<T, GameError>;

}  // namespace arc::foundation
