#pragma once

/// @file consolation.hpp
/// @brief Placement bracket for teams knocked out early.

#include <string_view>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/elimination_bracket.hpp"
#include "tourney/tournament/format_types.hpp"

namespace tourney::tournament {

/// Consolation.
///
/// A knockout over the teams the caller selects, usually those returned by
/// earlyEliminated() for the main bracket. Matches are tagged
/// BracketBranch::Consolation.
class ConsolationFormat {
public:
    static constexpr TournamentType kType = TournamentType::Consolation;

    ConsolationFormat();

    [[nodiscard]] std::string_view name() const { return "Consolation"; }
    [[nodiscard]] FormatConstraints constraints() const;
    [[nodiscard]] BracketLayout layout() const { return BracketLayout::Tree; }
    [[nodiscard]] bool supportsConsolation() const { return false; }
    [[nodiscard]] bool owns(const Match& match) const { return bracket_.owns(match); }

    [[nodiscard]] GeneratedBracket generate(const Tournament& tournament,
                                            const std::vector<Team>& seeded) const;

    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completed, const Tournament& tournament,
        std::vector<Match> snapshot) const;

    [[nodiscard]] bool isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const;

    [[nodiscard]] std::vector<TeamPlacement> placements(const Tournament& tournament,
                                                        const std::vector<Match>& matches) const;

    [[nodiscard]] std::vector<TieBreakMethod> defaultTieBreakers() const;

    /// Teams whose first completed winners-bracket match was a loss, in the
    /// order those matches were played.
    static std::vector<TeamId> earlyEliminated(const std::vector<Match>& matches);

private:
    elimination::KnockoutBracket bracket_;
};

} // namespace tourney::tournament
