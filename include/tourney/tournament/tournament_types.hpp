#pragma once

/// @file tournament_types.hpp
/// @brief Core data model for the tournament format engine.
///
/// Defines tournaments, teams, matches and the participant slots that let
/// later-round matches reference the outcome of earlier ones.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tourney/foundation/types.hpp"

namespace tourney::tournament {

using foundation::MatchId;
using foundation::PlayerId;
using foundation::TeamId;
using foundation::TournamentId;

/// Supported tournament formats.
enum class TournamentType : uint8_t {
    SingleElimination,
    DoubleElimination,
    Swiss,
    RoundRobin,
    Barrage,      ///< Qualification playoff among teams tied at a boundary.
    Consolation   ///< Placement bracket for teams eliminated early.
};

enum class TournamentStatus : uint8_t { Setup, Active, Completed, Cancelled };

/// Players per team required by the tournament.
enum class GameFormat : uint8_t {
    Singles,  ///< One player per team.
    Doubles,  ///< Two players per team.
    Triples,  ///< Three players per team.
    Open      ///< No member-count requirement.
};

/// Lifecycle of a match.
///
/// Pending is the placeholder state: at least one slot still waits for the
/// outcome of another match. The match becomes Scheduled as soon as both
/// slots hold concrete teams.
enum class MatchStatus : uint8_t { Pending, Scheduled, Active, Completed, Cancelled };

/// Sub-bracket a match or a team belongs to.
enum class BracketBranch : uint8_t {
    Winner,
    Loser,
    GrandFinal,
    Consolation,
    Barrage
};

enum class ScoringMode : uint8_t { SelfReport, OfficialOnly };

enum class CourtAssignmentMode : uint8_t { Manual, Automatic };

/// Secondary ranking rules applied when win counts are equal.
enum class TieBreakMethod : uint8_t {
    HeadToHead,
    PointsDifferential,
    PointsAgainst,
    Buchholz,
    SonnebornBerger,
    StrengthOfSchedule
};

std::string_view tournamentTypeName(TournamentType type);
std::optional<TournamentType> parseTournamentType(std::string_view name);
std::string_view branchName(BracketBranch branch);
std::string_view matchStatusName(MatchStatus status);
std::string_view tieBreakMethodName(TieBreakMethod method);
std::optional<TieBreakMethod> parseTieBreakMethod(std::string_view name);

/// Members each team must field, or 0 when the format does not care.
constexpr std::size_t requiredMembers(GameFormat format) {
    switch (format) {
        case GameFormat::Singles: return 1;
        case GameFormat::Doubles: return 2;
        case GameFormat::Triples: return 3;
        case GameFormat::Open:    return 0;
    }
    return 0;
}

// -- Teams --------------------------------------------------------------------

/// A registered player on a team.
struct Member {
    PlayerId id;
    std::string name;
    std::optional<int32_t> ranking;  ///< Lower is better.
    std::string club;
    std::string region;
    double winPercentage = 0.0;
    double pointsDifferential = 0.0;
};

/// A competing team.
///
/// seed and branch are written only by the engine: seed by the Seeder,
/// branch by double-elimination progression (see TeamBranchUpdate).
struct Team {
    TeamId id;
    std::string name;
    std::vector<Member> members;
    std::string club;    ///< Overrides the members' club when set.
    std::string region;  ///< Overrides the derived region when set.
    std::optional<uint32_t> seed;
    BracketBranch branch = BracketBranch::Winner;
};

/// Ranking used for teams or members without one.
inline constexpr double kUnrankedValue = 9999.0;

/// Region reported for teams whose region cannot be derived.
inline constexpr std::string_view kUnknownRegion = "Unknown";

/// Mean member ranking (lower is better); unranked members count as 9999.
double compositeRanking(const Team& team);

double averageWinRate(const Team& team);

double averagePointsDifferential(const Team& team);

/// Team club override, else the most common member club, else "".
std::string teamClub(const Team& team);

/// Team region override, else the first member region, else a region
/// keyword found in the club name, else kUnknownRegion.
std::string teamRegion(const Team& team);

// -- Participant slots --------------------------------------------------------

struct TeamRef {
    TeamId team;
};

struct WinnerOf {
    MatchId match;
};

struct LoserOf {
    MatchId match;
};

struct ByeSlot {};

/// What currently occupies one side of a match.
using Participant = std::variant<TeamRef, WinnerOf, LoserOf, ByeSlot>;

enum class FeedKind : uint8_t { Winner, Loser };

/// Reference to the outcome of a match that fills a slot.
struct Feed {
    MatchId match;
    FeedKind kind = FeedKind::Winner;

    bool operator==(const Feed&) const = default;
};

/// One side of a match.
///
/// A WinnerOf/LoserOf participant is replaced by a TeamRef when the
/// referenced match completes; resolvedFrom keeps the reference so the
/// bracket tree survives resolution.
struct Slot {
    Participant participant = ByeSlot{};
    std::optional<Feed> resolvedFrom;

    static Slot team(TeamId id);
    static Slot winnerOf(MatchId id);
    static Slot loserOf(MatchId id);
    static Slot bye();

    [[nodiscard]] std::optional<TeamId> teamId() const;
    [[nodiscard]] bool isBye() const;

    /// True while the slot waits for another match.
    [[nodiscard]] bool isPending() const;

    /// The unresolved reference, if the slot is pending.
    [[nodiscard]] std::optional<Feed> pendingFeed() const;

    /// The reference feeding this slot, resolved or not.
    [[nodiscard]] std::optional<Feed> feed() const;
};

// -- Matches ------------------------------------------------------------------

struct MatchScore {
    int32_t team1 = 0;
    int32_t team2 = 0;
};

/// Final score plus the declared winner.
struct MatchResult {
    MatchScore score;
    TeamId winner;
};

struct Match {
    MatchId id;
    TournamentId tournamentId;
    uint32_t round = 1;
    std::string roundName;
    BracketBranch branch = BracketBranch::Winner;
    uint32_t position = 1;
    Slot slot1;
    Slot slot2;
    std::optional<MatchResult> result;
    MatchStatus status = MatchStatus::Scheduled;

    /// Caller-assigned completion order, used for recent-form windows.
    std::optional<uint64_t> completedSequence;

    [[nodiscard]] bool isBye() const { return slot1.isBye() || slot2.isBye(); }
    [[nodiscard]] bool isFinished() const {
        return status == MatchStatus::Completed || status == MatchStatus::Cancelled;
    }
    [[nodiscard]] bool involves(TeamId team) const;

    /// The team that did not win, when both sides are concrete teams.
    [[nodiscard]] std::optional<TeamId> loser() const;
};

// -- Tournament descriptor ----------------------------------------------------

struct TournamentSettings {
    CourtAssignmentMode courtAssignment = CourtAssignmentMode::Automatic;
    ScoringMode scoringMode = ScoringMode::OfficialOnly;

    /// Swiss round count; derived from the team count when unset.
    std::optional<uint32_t> swissRounds;

    /// Places that qualify out of a Swiss or round-robin stage.
    std::optional<uint32_t> qualificationSpots;

    /// Overrides the format's default tie-break chain when non-empty.
    std::vector<TieBreakMethod> tieBreakers;
};

struct Tournament {
    TournamentId id;
    std::string name;
    TournamentType type = TournamentType::SingleElimination;
    TournamentStatus status = TournamentStatus::Setup;
    GameFormat format = GameFormat::Open;
    int32_t maxPoints = 13;
    bool shortForm = false;
    uint32_t maxTeams = 0;  ///< 0 means no tournament-level cap.
    TournamentSettings settings;
};

// -- Seeding ------------------------------------------------------------------

enum class SeedingMethod : uint8_t { Ranked, Random, ClubBalanced, Geographic, SkillBalanced };

enum class SkillDistribution : uint8_t { Snake, Even, Random };

struct SeedingOptions {
    SeedingMethod method = SeedingMethod::Ranked;
    std::optional<uint32_t> randomSeed;  ///< Makes Random/SkillBalanced reproducible.
    SkillDistribution skillDistribution = SkillDistribution::Snake;
};

} // namespace tourney::tournament
