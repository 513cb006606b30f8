#pragma once

/// @file double_elimination.hpp
/// @brief Winners and losers brackets with an optional grand-final reset.

#include <string_view>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/engine_config.hpp"
#include "tourney/tournament/format_types.hpp"

namespace tourney::tournament {

/// Double-elimination.
///
/// For a bracket of 2^k lines the winners bracket is a standard
/// single-elimination tree and the losers bracket has 2(k - 1) rounds:
/// odd losers rounds pair survivors, even ones take the losers dropping out
/// of the next winners round (in reversed order every other round to delay
/// rematches). The grand final puts the winners-bracket champion in slot 1.
///
/// Generation creates exactly 2N - 2 matches. When the losers-bracket
/// champion wins the grand final and bracket reset is enabled, advance()
/// returns the "Grand Final Reset" match as a new match.
class DoubleEliminationFormat {
public:
    static constexpr TournamentType kType = TournamentType::DoubleElimination;

    explicit DoubleEliminationFormat(DoubleEliminationConfig config = {});

    [[nodiscard]] std::string_view name() const { return "Double Elimination"; }
    [[nodiscard]] FormatConstraints constraints() const;
    [[nodiscard]] BracketLayout layout() const { return BracketLayout::Tree; }
    [[nodiscard]] bool supportsConsolation() const { return false; }
    [[nodiscard]] bool owns(const Match& match) const;

    [[nodiscard]] GeneratedBracket generate(const Tournament& tournament,
                                            const std::vector<Team>& seeded) const;

    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completed, const Tournament& tournament,
        std::vector<Match> snapshot) const;

    [[nodiscard]] bool isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const;

    /// A team is eliminated by its second loss, or by a grand-final loss
    /// once the event is decided.
    [[nodiscard]] std::vector<TeamPlacement> placements(const Tournament& tournament,
                                                        const std::vector<Match>& matches) const;

    [[nodiscard]] std::vector<TieBreakMethod> defaultTieBreakers() const;

private:
    DoubleEliminationConfig config_;
};

} // namespace tourney::tournament
