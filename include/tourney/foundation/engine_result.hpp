#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> alias for engine error handling.

#include "tourney/core/result.hpp"
#include "tourney/foundation/engine_error.hpp"

namespace tourney::foundation {

/// Result type specialized with EngineError.
///
/// Example:
/// @code
///   EngineResult<uint32_t> bracketSizeFor(std::size_t teams) {
///       if (teams == 0) {
///           return EngineResult<uint32_t>::err(
///               EngineError(ErrorCode::InvalidArgument, "no teams"));
///       }
///       return EngineResult<uint32_t>::ok(nextPowerOfTwo(teams));
///   }
/// @endcode
template <typename T>
using EngineResult = tourney::Result<T, EngineError>;

}  // namespace tourney::foundation
