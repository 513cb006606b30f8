/// @file engine_config.cpp
/// @brief EngineConfig construction from ConfigManager.

#include "tourney/tournament/engine_config.hpp"

#include <cmath>
#include <string>

namespace tourney::tournament {

using foundation::ConfigManager;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

/// Read an optional key into target. A missing key is not an error.
template <typename T>
EngineResult<void> readOptional(const ConfigManager& config, std::string_view key, T& target) {
    if (!config.hasKey(key)) {
        return EngineResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return EngineResult<void>::err(value.error());
    }
    target = value.value();
    return EngineResult<void>::ok();
}

EngineError mismatch(const std::string& message) {
    return EngineError(ErrorCode::ConfigTypeMismatch, message);
}

} // namespace

EngineResult<EngineConfig> buildEngineConfig(const ConfigManager& config) {
    EngineConfig out;

    const std::pair<std::string_view, double*> factors[] = {
        {"engine.short_form_factor", &out.duration.shortFormFactor},
        {"engine.self_report_factor", &out.duration.selfReportFactor},
        {"engine.manual_court_factor", &out.duration.manualCourtFactor},
    };
    for (const auto& [key, target] : factors) {
        if (auto status = readOptional(config, key, *target); !status) {
            return EngineResult<EngineConfig>::err(status.error());
        }
    }

    const std::pair<std::string_view, uint32_t*> counts[] = {
        {"engine.estimated_match_minutes", &out.duration.matchMinutes},
        {"engine.swiss.max_rounds", &out.swiss.maxRounds},
        {"engine.swiss.pairing_search_limit", &out.swiss.pairingSearchLimit},
    };
    for (const auto& [key, target] : counts) {
        if (auto status = readOptional(config, key, *target); !status) {
            return EngineResult<EngineConfig>::err(status.error());
        }
    }

    if (auto status = readOptional(config, "engine.double_elimination.bracket_reset",
                                   out.doubleElimination.bracketReset);
        !status) {
        return EngineResult<EngineConfig>::err(status.error());
    }

    const std::string prefix = "engine.tie_breakers.";
    for (const auto& key : config.keysWithPrefix("engine.tie_breakers")) {
        auto formatName = key.substr(prefix.size());
        auto type = parseTournamentType(formatName);
        if (!type) {
            return EngineResult<EngineConfig>::err(
                mismatch("unknown tournament format in " + key + ": " + formatName));
        }
        auto names = config.get<std::vector<std::string>>(key);
        if (!names) {
            return EngineResult<EngineConfig>::err(names.error());
        }
        std::vector<TieBreakMethod> chain;
        for (const auto& name : names.value()) {
            auto method = parseTieBreakMethod(name);
            if (!method) {
                return EngineResult<EngineConfig>::err(
                    mismatch("unknown tie-break method in " + key + ": " + name));
            }
            chain.push_back(*method);
        }
        out.tieBreakers[*type] = std::move(chain);
    }

    TOURNEY_LOG_INFO(LogCategory::Config,
                     "Engine config loaded: match_minutes=" +
                         std::to_string(out.duration.matchMinutes) +
                         " bracket_reset=" + (out.doubleElimination.bracketReset ? "true" : "false"));
    return EngineResult<EngineConfig>::ok(std::move(out));
}

EngineResult<void> applyLoggingConfig(const ConfigManager& config,
                                      foundation::EngineLogger& logger) {
    const std::string prefix = "logging.";
    for (const auto& key : config.keysWithPrefix("logging")) {
        auto categoryName = key.substr(prefix.size());
        auto category = foundation::parseLogCategory(categoryName);
        if (!category) {
            return EngineResult<void>::err(mismatch("unknown log category: " + categoryName));
        }
        auto levelName = config.get<std::string>(key);
        if (!levelName) {
            return EngineResult<void>::err(levelName.error());
        }
        auto level = foundation::parseLogLevel(levelName.value());
        if (!level) {
            return EngineResult<void>::err(
                mismatch("unknown log level for " + key + ": " + levelName.value()));
        }
        logger.setCategoryLevel(*category, *level);
    }
    return EngineResult<void>::ok();
}

uint32_t estimateDurationMinutes(const DurationConfig& config,
                                 const Tournament& tournament,
                                 uint32_t totalMatches) {
    double factor = 1.0;
    if (tournament.shortForm) {
        factor *= config.shortFormFactor;
    }
    if (tournament.settings.scoringMode == ScoringMode::SelfReport) {
        factor *= config.selfReportFactor;
    }
    if (tournament.settings.courtAssignment == CourtAssignmentMode::Manual) {
        factor *= config.manualCourtFactor;
    }
    auto base = static_cast<double>(totalMatches) * static_cast<double>(config.matchMinutes);
    return static_cast<uint32_t>(std::lround(base * factor));
}

} // namespace tourney::tournament
