#pragma once

/// @file barrage.hpp
/// @brief Qualification playoff for teams tied at a qualification boundary.

#include <string_view>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/elimination_bracket.hpp"
#include "tourney/tournament/format_types.hpp"

namespace tourney::tournament {

/// Barrage.
///
/// A knockout over the teams the caller selects, typically the ones
/// boundaryTeams() reports after a Swiss or round-robin stage. Matches are
/// tagged BracketBranch::Barrage so they can live beside the main stage.
class BarrageFormat {
public:
    static constexpr TournamentType kType = TournamentType::Barrage;

    BarrageFormat();

    [[nodiscard]] std::string_view name() const { return "Barrage"; }
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

    /// Teams sharing the rank of the last qualifying place, when that rank
    /// extends past the qualification spots. Empty when the cut is clean.
    static std::vector<TeamId> boundaryTeams(const Standings& standings,
                                             uint32_t qualificationSpots);

private:
    elimination::KnockoutBracket bracket_;
};

} // namespace tourney::tournament
