#pragma once

/// @file elimination_bracket.hpp
/// @brief Building blocks shared by every elimination tree.
///
/// Brackets are first planned with symbolic sources ("winner of planned
/// match 3"), then materialized: matches that face a bye are dropped and
/// their outcome is forwarded directly to the matches they fed, after which
/// the surviving matches receive dense ids.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/format_types.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament::elimination {

/// Smallest power of two >= teamCount, at least 2.
uint32_t bracketSize(std::size_t teamCount);

/// log2 of a power-of-two bracket size.
uint32_t roundCount(uint32_t bracketSize);

/// Seed numbers in bracket-line order: adjacent pairs meet in round one and
/// seeds 1 and 2 can only meet in the final.
/// For 8: {1, 8, 4, 5, 2, 7, 3, 6}.
std::vector<uint32_t> standardSeedOrder(uint32_t bracketSize);

/// "Final", "Semifinal", "Quarterfinal", "Round of 16", "Round of 32",
/// otherwise "Round r".
std::string roundLabel(uint32_t round, uint32_t totalRounds);

/// Symbolic slot source used while planning.
struct Source {
    enum class Kind : uint8_t { Team, Winner, Loser, Bye };

    Kind kind = Kind::Bye;
    TeamId team;
    std::size_t match = 0;  ///< Planned index for Winner/Loser.

    static Source ofTeam(TeamId id) { return {Kind::Team, id, 0}; }
    static Source winnerOf(std::size_t planned) { return {Kind::Winner, TeamId{}, planned}; }
    static Source loserOf(std::size_t planned) { return {Kind::Loser, TeamId{}, planned}; }
    static Source bye() { return {}; }
};

struct PlannedMatch {
    BracketBranch branch = BracketBranch::Winner;
    uint32_t round = 1;
    uint32_t position = 1;
    std::string label;
    Source first;
    Source second;
};

/// Ordered list of planned matches. A match may only reference matches
/// planned before it.
class BracketPlan {
public:
    std::size_t add(PlannedMatch match);

    [[nodiscard]] std::size_t size() const noexcept { return planned_.size(); }
    [[nodiscard]] const PlannedMatch& at(std::size_t index) const { return planned_.at(index); }

    /// Collapse byes and emit matches with ids firstId, firstId + 1, ...
    ///
    /// A match is Scheduled when both slots are concrete teams, Pending
    /// otherwise.
    [[nodiscard]] std::vector<Match> materialize(TournamentId tournament, uint64_t firstId) const;

private:
    std::vector<PlannedMatch> planned_;
};

/// Plan a standard-seeded single-elimination tree.
/// @return Planned indices grouped by round (index 0 is round one).
std::vector<std::vector<std::size_t>> planTree(BracketPlan& plan,
                                               const std::vector<Team>& seeded,
                                               BracketBranch branch,
                                               std::string_view labelPrefix);

/// Outcome of filling the references to a completed match.
struct Resolution {
    std::vector<Match> affected;      ///< Matches whose slots were filled.
    std::size_t resolved = 0;         ///< Pending references filled.
    std::size_t alreadyResolved = 0;  ///< References filled by an earlier advance.
};

/// Replace every WinnerOf/LoserOf slot naming `completed` with the concrete
/// team, in place, and promote Pending matches whose slots are now both
/// concrete to Scheduled.
Resolution resolveReferences(const Match& completed, std::vector<Match>& snapshot);

/// Turn a resolution without any filled reference into the matching
/// integrity error.
foundation::EngineError unresolvedError(const Match& completed, const Resolution& resolution);

/// Highest match id in the list plus one.
uint64_t nextMatchId(const std::vector<Match>& matches);

/// Single-elimination tree for one branch.
///
/// Used directly by the single-elimination format and, with its own branch
/// tag and label prefix, by barrage and consolation brackets.
class KnockoutBracket {
public:
    KnockoutBracket(BracketBranch branch, std::string labelPrefix);

    [[nodiscard]] BracketBranch branch() const noexcept { return branch_; }
    [[nodiscard]] bool owns(const Match& match) const { return match.branch == branch_; }

    [[nodiscard]] std::vector<Match> generate(const Tournament& tournament,
                                              const std::vector<Team>& seeded) const;

    /// Progression over a snapshot that already holds the completed match.
    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completed, std::vector<Match> snapshot) const;

    [[nodiscard]] bool isComplete(const std::vector<Match>& matches) const;

    /// Champion first, then teams still alive, then eliminated teams by the
    /// round they went out in.
    [[nodiscard]] std::vector<TeamPlacement> placements(const std::vector<Match>& matches) const;

private:
    [[nodiscard]] const Match* finalMatch(const std::vector<Match>& matches) const;

    BracketBranch branch_;
    std::string labelPrefix_;
};

/// Placement keys shared by the elimination formats.
inline constexpr int32_t kChampionPlacement = 2000;
inline constexpr int32_t kActivePlacement = 1000;

} // namespace tourney::tournament::elimination
