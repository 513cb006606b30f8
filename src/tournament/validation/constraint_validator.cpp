/// @file constraint_validator.cpp
/// @brief Team-set validation rules.

#include "tourney/tournament/constraint_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <string>

#include "tourney/foundation/engine_logger.hpp"

namespace tourney::tournament {

using foundation::LogCategory;

namespace {

std::string normalizedName(const std::string& name) {
    auto begin = std::find_if_not(name.begin(), name.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(name.rbegin(), name.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (begin < end) {
        out.assign(begin, end);
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view gameFormatName(GameFormat format) {
    switch (format) {
        case GameFormat::Singles: return "singles";
        case GameFormat::Doubles: return "doubles";
        case GameFormat::Triples: return "triples";
        case GameFormat::Open:    return "open";
    }
    return "unknown";
}

} // namespace

ValidatorResult ConstraintValidator::validate(const Tournament& tournament,
                                              const std::vector<Team>& teams,
                                              const FormatConstraints& constraints,
                                              std::string_view formatName) {
    ValidatorResult result;
    const auto count = static_cast<uint32_t>(teams.size());
    const std::string format(formatName);
    const std::string got = ", got " + std::to_string(count);

    bool boundViolated = false;
    if (count < constraints.minTeams) {
        result.errors.push_back(format + " requires at least " +
                                std::to_string(constraints.minTeams) + " teams" + got);
        boundViolated = true;
    }
    if (constraints.maxTeams && count > *constraints.maxTeams) {
        result.errors.push_back(format + " supports at most " +
                                std::to_string(*constraints.maxTeams) + " teams" + got);
        boundViolated = true;
    }
    if (tournament.maxTeams > 0 && count > tournament.maxTeams) {
        result.errors.push_back("tournament is limited to " +
                                std::to_string(tournament.maxTeams) + " teams" + got);
        boundViolated = true;
    }

    if (!boundViolated && !constraints.preferredTeamCounts.empty()) {
        const auto& preferred = constraints.preferredTeamCounts;
        if (std::find(preferred.begin(), preferred.end(), count) == preferred.end()) {
            result.warnings.push_back(std::to_string(count) + " teams is not optimal for " + format);
            result.suggestions.push_back("Consider " +
                                         std::to_string(nearestPreferredCount(constraints, count)) +
                                         " teams for better bracket balance");
        }
    }

    if (count % 2 != 0 && !constraints.supportsOddTeamCount) {
        if (constraints.supportsByes) {
            result.warnings.push_back("Odd team count (" + std::to_string(count) +
                                      ") will require bye assignments");
        } else {
            result.errors.push_back(format + " does not support odd team counts");
        }
    }

    std::set<TeamId> ids;
    for (const auto& team : teams) {
        ids.insert(team.id);
    }
    if (ids.size() != teams.size()) {
        result.errors.push_back("Duplicate teams detected in tournament");
    }

    std::set<std::string> names;
    for (const auto& team : teams) {
        auto key = normalizedName(team.name);
        if (!key.empty() && !names.insert(key).second) {
            result.warnings.push_back("Duplicate team name: " + team.name);
        }
    }

    if (auto required = requiredMembers(tournament.format); required > 0) {
        auto wrong = std::count_if(teams.begin(), teams.end(), [required](const Team& team) {
            return team.members.size() != required;
        });
        if (wrong > 0) {
            result.errors.push_back(std::to_string(wrong) +
                                    " teams have incorrect player count for " +
                                    std::string(gameFormatName(tournament.format)) + " format");
        }
    }

    result.isValid = result.errors.empty();
    if (!result.isValid) {
        TOURNEY_LOG_INFO(LogCategory::Validation,
                         "Rejected " + std::to_string(count) + " teams for " + format + ": " +
                             result.errors.front());
    }
    return result;
}

uint32_t ConstraintValidator::nearestPreferredCount(const FormatConstraints& constraints,
                                                    uint32_t teamCount) {
    if (constraints.preferredTeamCounts.empty()) {
        return teamCount;
    }
    auto distance = [teamCount](uint32_t candidate) {
        return candidate > teamCount ? candidate - teamCount : teamCount - candidate;
    };
    uint32_t best = constraints.preferredTeamCounts.front();
    for (auto candidate : constraints.preferredTeamCounts) {
        auto d = distance(candidate);
        auto bestD = distance(best);
        if (d < bestD || (d == bestD && candidate < best)) {
            best = candidate;
        }
    }
    return best;
}

} // namespace tourney::tournament
