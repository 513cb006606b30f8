#pragma once

/// @file engine_config.hpp
/// @brief Typed engine settings and their YAML binding.

#include <cstdint>
#include <map>
#include <vector>

#include "tourney/foundation/config_manager.hpp"
#include "tourney/foundation/engine_logger.hpp"
#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// Inputs of the estimated-duration calculation.
struct DurationConfig {
    uint32_t matchMinutes = 45;
    double shortFormFactor = 0.7;
    double selfReportFactor = 1.1;
    double manualCourtFactor = 1.2;
};

struct SwissConfig {
    uint32_t maxRounds = 15;

    /// Backtracking steps tried before a rematch is allowed.
    uint32_t pairingSearchLimit = 100000;
};

struct DoubleEliminationConfig {
    /// Play a second grand final when the losers-bracket champion wins the first.
    bool bracketReset = true;
};

/// Immutable settings shared by every engine operation.
struct EngineConfig {
    DurationConfig duration;
    SwissConfig swiss;
    DoubleEliminationConfig doubleElimination;

    /// Per-format replacements for the built-in tie-break chains.
    std::map<TournamentType, std::vector<TieBreakMethod>> tieBreakers;
};

/// Build an EngineConfig from "engine.*" keys; missing keys keep defaults.
///
/// Recognized keys:
/// - engine.estimated_match_minutes
/// - engine.short_form_factor / self_report_factor / manual_court_factor
/// - engine.swiss.max_rounds / engine.swiss.pairing_search_limit
/// - engine.double_elimination.bracket_reset
/// - engine.tie_breakers.<format> (sequence of method names)
///
/// @return ConfigTypeMismatch for a value of the wrong type or an unknown
///         format or tie-break name.
foundation::EngineResult<EngineConfig> buildEngineConfig(const foundation::ConfigManager& config);

/// Apply "logging.<category>: <level>" entries to the logger.
foundation::EngineResult<void> applyLoggingConfig(const foundation::ConfigManager& config,
                                                  foundation::EngineLogger& logger);

/// round(totalMatches * matchMinutes * factor), with the factor adjusted for
/// short-form play, self-reported scores and manual court assignment.
uint32_t estimateDurationMinutes(const DurationConfig& config,
                                 const Tournament& tournament,
                                 uint32_t totalMatches);

} // namespace tourney::tournament
