/// @file barrage.cpp
/// @brief Barrage format.

#include "tourney/tournament/formats/barrage.hpp"

#include <utility>

#include "tourney/tournament/seeder.hpp"

namespace tourney::tournament {

BarrageFormat::BarrageFormat()
    : bracket_(BracketBranch::Barrage, "Barrage ") {}

FormatConstraints BarrageFormat::constraints() const {
    return FormatConstraints{
        .minTeams = 2,
        .maxTeams = 100,
        .preferredTeamCounts = {},
        .supportsOddTeamCount = true,
        .supportsByes = true,
        .maxRounds = 7,
    };
}

GeneratedBracket BarrageFormat::generate(const Tournament& tournament,
                                         const std::vector<Team>& seeded) const {
    auto size = elimination::bracketSize(seeded.size());

    GeneratedBracket generated;
    generated.matches = bracket_.generate(tournament, seeded);
    generated.byeTeams = Seeder::assignByes(seeded, size).byes;
    generated.totalRounds = elimination::roundCount(size);
    generated.totalMatches = static_cast<uint32_t>(generated.matches.size());
    return generated;
}

foundation::EngineResult<ProgressionResult> BarrageFormat::advance(
    const Match& completed, const Tournament&, std::vector<Match> snapshot) const {
    return bracket_.advance(completed, std::move(snapshot));
}

bool BarrageFormat::isComplete(const Tournament&, const std::vector<Match>& matches) const {
    return bracket_.isComplete(matches);
}

std::vector<TeamPlacement> BarrageFormat::placements(const Tournament&,
                                                     const std::vector<Match>& matches) const {
    return bracket_.placements(matches);
}

std::vector<TieBreakMethod> BarrageFormat::defaultTieBreakers() const {
    return {TieBreakMethod::PointsDifferential, TieBreakMethod::PointsAgainst};
}

std::vector<TeamId> BarrageFormat::boundaryTeams(const Standings& standings,
                                                 uint32_t qualificationSpots) {
    const auto& rows = standings.rankings;
    if (qualificationSpots == 0 || qualificationSpots >= rows.size()) {
        return {};
    }

    auto boundaryRank = rows[qualificationSpots - 1].rank;
    if (rows[qualificationSpots].rank != boundaryRank) {
        return {};
    }

    std::vector<TeamId> tied;
    for (const auto& row : rows) {
        if (row.rank == boundaryRank) {
            tied.push_back(row.team);
        }
    }
    return tied;
}

} // namespace tourney::tournament
