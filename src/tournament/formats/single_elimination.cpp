/// @file single_elimination.cpp
/// @brief Single-elimination format.

#include "tourney/tournament/formats/single_elimination.hpp"

#include <utility>

#include "tourney/tournament/seeder.hpp"

namespace tourney::tournament {

SingleEliminationFormat::SingleEliminationFormat()
    : bracket_(BracketBranch::Winner, "") {}

FormatConstraints SingleEliminationFormat::constraints() const {
    return FormatConstraints{
        .minTeams = 2,
        .maxTeams = 1024,
        .preferredTeamCounts = {4, 8, 16, 32, 64, 128, 256},
        .supportsOddTeamCount = true,
        .supportsByes = true,
        .maxRounds = 10,
    };
}

GeneratedBracket SingleEliminationFormat::generate(const Tournament& tournament,
                                                   const std::vector<Team>& seeded) const {
    auto size = elimination::bracketSize(seeded.size());

    GeneratedBracket generated;
    generated.matches = bracket_.generate(tournament, seeded);
    generated.byeTeams = Seeder::assignByes(seeded, size).byes;
    generated.totalRounds = elimination::roundCount(size);
    generated.totalMatches = static_cast<uint32_t>(generated.matches.size());
    return generated;
}

foundation::EngineResult<ProgressionResult> SingleEliminationFormat::advance(
    const Match& completed, const Tournament&, std::vector<Match> snapshot) const {
    return bracket_.advance(completed, std::move(snapshot));
}

bool SingleEliminationFormat::isComplete(const Tournament&,
                                         const std::vector<Match>& matches) const {
    return bracket_.isComplete(matches);
}

std::vector<TeamPlacement> SingleEliminationFormat::placements(
    const Tournament&, const std::vector<Match>& matches) const {
    return bracket_.placements(matches);
}

std::vector<TieBreakMethod> SingleEliminationFormat::defaultTieBreakers() const {
    return {TieBreakMethod::PointsDifferential, TieBreakMethod::PointsAgainst};
}

} // namespace tourney::tournament
