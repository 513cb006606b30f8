#pragma once

/// @file match_tally.hpp
/// @brief Per-team aggregates over completed matches.

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "tourney/tournament/format_types.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// Aggregates for one team.
struct TeamTally {
    TeamId team;
    uint32_t played = 0;
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t byes = 0;
    uint32_t finished = 0;  ///< Completed or cancelled matches, byes included.
    int32_t pointsFor = 0;
    int32_t pointsAgainst = 0;
    std::vector<TeamId> opponents;  ///< One entry per contested match.
    std::vector<TeamId> defeated;
    std::array<RecentResult, kRecentResultsWindow> recent{};
};

/// Tally of a match list.
///
/// Only completed matches with a declared winner count. A match against a
/// bye counts as a won match with its recorded score and no opponent.
/// Recent results follow completedSequence, then round, then match id.
class MatchTally {
public:
    static MatchTally build(const std::vector<Match>& matches);

    /// Every team seen in a concrete slot, in first-appearance order.
    [[nodiscard]] const std::vector<TeamId>& teams() const noexcept { return teams_; }

    [[nodiscard]] const TeamTally& of(TeamId team) const;

    /// Sum of the wins of every opponent faced.
    [[nodiscard]] uint32_t buchholz(TeamId team) const;

    /// Sum of the wins of every opponent defeated.
    [[nodiscard]] uint32_t sonnebornBerger(TeamId team) const;

    /// Mean win ratio of the opponents faced, 0 without opponents.
    [[nodiscard]] double strengthOfSchedule(TeamId team) const;

    /// Team with more wins in their meetings, if they met and one leads.
    [[nodiscard]] std::optional<TeamId> headToHeadWinner(TeamId a, TeamId b) const;

    [[nodiscard]] bool met(TeamId a, TeamId b) const;

private:
    std::vector<TeamId> teams_;
    std::map<TeamId, TeamTally> tallies_;
    TeamTally empty_;
};

} // namespace tourney::tournament
