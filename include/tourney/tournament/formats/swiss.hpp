#pragma once

/// @file swiss.hpp
/// @brief Swiss system with score-group pairing and rematch avoidance.

#include <string_view>
#include <utility>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/engine_config.hpp"
#include "tourney/tournament/format_types.hpp"

namespace tourney::tournament {

/// Swiss.
///
/// Only round one exists after generation. Each later round is created by
/// advance() once every match of the current round is completed or
/// cancelled. Teams are ordered by wins, Buchholz, then seed; pairs are
/// formed inside score groups first and never repeat an earlier pairing
/// unless the bounded search finds no alternative. With an odd field the
/// lowest-ordered team without a previous bye receives a bye match, which
/// is created completed and counts as a win.
class SwissFormat {
public:
    static constexpr TournamentType kType = TournamentType::Swiss;

    explicit SwissFormat(SwissConfig config = {});

    [[nodiscard]] std::string_view name() const { return "Swiss System"; }
    [[nodiscard]] FormatConstraints constraints() const;
    [[nodiscard]] BracketLayout layout() const { return BracketLayout::Rounds; }
    [[nodiscard]] bool supportsConsolation() const { return false; }
    [[nodiscard]] bool owns(const Match& match) const {
        return match.branch == BracketBranch::Winner;
    }

    [[nodiscard]] GeneratedBracket generate(const Tournament& tournament,
                                            const std::vector<Team>& seeded) const;

    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completed, const Tournament& tournament,
        std::vector<Match> snapshot) const;

    [[nodiscard]] bool isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const;

    /// No placement ordering; elimination is mathematical and needs
    /// qualificationSpots.
    [[nodiscard]] std::vector<TeamPlacement> placements(const Tournament& tournament,
                                                        const std::vector<Match>& matches) const;

    [[nodiscard]] std::vector<TieBreakMethod> defaultTieBreakers() const;

    /// Configured round count: the tournament override, else ceil(log2 N),
    /// clamped to [1, min(N - 1, maxRounds)].
    [[nodiscard]] uint32_t roundsFor(const Tournament& tournament, std::size_t teamCount) const;

    /// Pair an even-sized list ordered by standing.
    ///
    /// Each team is matched with the nearest team below it that it has not
    /// met yet, which keeps pairs inside score groups and lets an odd group
    /// borrow from the next one. Backtracks when a choice leaves the rest
    /// unpairable. Only when the search fails within pairingSearchLimit
    /// steps are rematches allowed.
    /// @return Pairs of indices into `ordered`, higher-placed team first.
    [[nodiscard]] std::vector<std::pair<std::size_t, std::size_t>> pair(
        const std::vector<TeamId>& ordered,
        const std::vector<std::pair<TeamId, TeamId>>& previous) const;

private:
    [[nodiscard]] std::vector<Match> pairNextRound(const Tournament& tournament,
                                                   const std::vector<Match>& snapshot,
                                                   uint32_t round) const;

    SwissConfig config_;
};

} // namespace tourney::tournament
