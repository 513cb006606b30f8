#pragma once

/// @file round_robin.hpp
/// @brief Single-group round-robin scheduled with the circle method.

#include <string_view>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/format_types.hpp"

namespace tourney::tournament {

/// Round-robin.
///
/// Every team meets every other team once: N(N - 1) / 2 matches over N - 1
/// rounds, or N rounds for odd N with exactly one team resting per round.
/// Resting teams are reported in the bracket structure, not as matches.
class RoundRobinFormat {
public:
    static constexpr TournamentType kType = TournamentType::RoundRobin;

    [[nodiscard]] std::string_view name() const { return "Round Robin"; }
    [[nodiscard]] FormatConstraints constraints() const;
    [[nodiscard]] BracketLayout layout() const { return BracketLayout::Rounds; }
    [[nodiscard]] bool supportsConsolation() const { return false; }
    [[nodiscard]] bool owns(const Match& match) const {
        return match.branch == BracketBranch::Winner;
    }

    [[nodiscard]] GeneratedBracket generate(const Tournament& tournament,
                                            const std::vector<Team>& seeded) const;

    /// All matches exist from generation, so advancing only reports
    /// completion.
    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completed, const Tournament& tournament,
        std::vector<Match> snapshot) const;

    [[nodiscard]] bool isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const;

    [[nodiscard]] std::vector<TeamPlacement> placements(const Tournament& tournament,
                                                        const std::vector<Match>& matches) const;

    [[nodiscard]] std::vector<TieBreakMethod> defaultTieBreakers() const;
};

} // namespace tourney::tournament
