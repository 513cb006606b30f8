#pragma once

/// @file format_types.hpp
/// @brief Values exchanged between the format engine and its callers.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tourney/tournament/bracket_structure.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// Legal team counts and structural capabilities of a format.
struct FormatConstraints {
    uint32_t minTeams = 2;
    std::optional<uint32_t> maxTeams;
    std::vector<uint32_t> preferredTeamCounts;
    bool supportsOddTeamCount = true;
    bool supportsByes = true;
    std::optional<uint32_t> maxRounds;
};

/// Outcome of constraint validation. Errors block generation, warnings do not.
struct ValidatorResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;
};

struct BracketMetadata {
    std::string format;
    uint32_t totalRounds = 0;
    uint32_t totalMatches = 0;
    uint32_t estimatedDurationMinutes = 0;
    uint32_t minTeams = 0;
    uint32_t maxTeams = 0;  ///< 0 when the format has no upper bound.
    bool supportsByes = false;
    bool supportsConsolation = false;
};

/// Everything produced by bracket generation.
struct BracketResult {
    std::vector<Match> matches;
    BracketStructure bracketStructure;
    BracketMetadata metadata;
    std::vector<Team> seededTeams;  ///< Seeds 1..N in seeding order.
    std::vector<Team> byeTeams;     ///< Teams that skip the first round.
};

/// A branch transition the caller must persist on a team.
struct TeamBranchUpdate {
    TeamId team;
    BracketBranch branch = BracketBranch::Winner;
};

// -- Standings ----------------------------------------------------------------

enum class StandingStatus : uint8_t { Active, Eliminated, Champion };

enum class RecentResult : uint8_t { None, Win, Loss };

inline constexpr std::size_t kRecentResultsWindow = 5;

/// Per-team standings row.
///
/// Invariants: wins + losses == matchesPlayed and
/// pointsDifferential == pointsFor - pointsAgainst.
struct Standing {
    TeamId team;
    uint32_t rank = 0;
    uint32_t matchesPlayed = 0;
    uint32_t wins = 0;
    uint32_t losses = 0;
    int32_t pointsFor = 0;
    int32_t pointsAgainst = 0;
    int32_t pointsDifferential = 0;

    /// Most recent result first; unused entries are RecentResult::None.
    std::array<RecentResult, kRecentResultsWindow> recentResults{};

    StandingStatus status = StandingStatus::Active;

    // Tie-break values, kept for display.
    uint32_t buchholz = 0;
    uint32_t sonnebornBerger = 0;
    double strengthOfSchedule = 0.0;
};

struct StandingsMetadata {
    uint32_t totalMatches = 0;
    uint32_t completedMatches = 0;
    uint32_t pendingMatches = 0;
};

struct Standings {
    std::vector<Standing> rankings;
    std::vector<TieBreakMethod> tieBreakers;
    StandingsMetadata metadata;

    [[nodiscard]] const Standing* find(TeamId team) const;
};

/// Format-specific ranking input for the standings resolver.
///
/// Higher placement ranks first; it outranks win counts so that, for
/// example, a single-elimination finalist stays above a semifinalist.
struct TeamPlacement {
    TeamId team;
    int32_t placement = 0;
    bool eliminated = false;
};

// -- Progression --------------------------------------------------------------

/// Everything produced by consuming one completed match.
struct ProgressionResult {
    std::vector<Match> affectedMatches;  ///< Includes the completed match itself.
    std::vector<Match> newMatches;
    BracketStructure updatedBracketStructure;
    std::vector<TeamBranchUpdate> teamUpdates;
    bool isComplete = false;
    std::optional<std::vector<Standing>> finalRankings;
};

/// Format-level output of generation, before the engine adds metadata.
struct GeneratedBracket {
    std::vector<Match> matches;
    std::vector<Team> byeTeams;
    uint32_t totalRounds = 0;
    uint32_t totalMatches = 0;  ///< Matches the whole event will need.
};

/// Inputs bracket generation needs besides the team list.
struct GenerationOptions {
    SeedingOptions seeding;
};

} // namespace tourney::tournament
