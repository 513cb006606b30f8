#pragma once

/// @file single_elimination.hpp
/// @brief Knockout bracket with byes for non-power-of-two fields.

#include <string_view>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/elimination_bracket.hpp"
#include "tourney/tournament/format_types.hpp"

namespace tourney::tournament {

/// Single-elimination.
///
/// The bracket is sized to the next power of two; the top seeds receive
/// byes and enter in round two. N teams always produce exactly N - 1
/// matches, all created at generation with placeholder slots.
class SingleEliminationFormat {
public:
    static constexpr TournamentType kType = TournamentType::SingleElimination;

    SingleEliminationFormat();

    [[nodiscard]] std::string_view name() const { return "Single Elimination"; }
    [[nodiscard]] FormatConstraints constraints() const;
    [[nodiscard]] BracketLayout layout() const { return BracketLayout::Tree; }
    [[nodiscard]] bool supportsConsolation() const { return true; }
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

private:
    elimination::KnockoutBracket bracket_;
};

} // namespace tourney::tournament
