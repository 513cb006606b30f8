/// @file consolation.cpp
/// @brief Consolation format.

#include "tourney/tournament/formats/consolation.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

#include "tourney/tournament/seeder.hpp"

namespace tourney::tournament {

ConsolationFormat::ConsolationFormat()
    : bracket_(BracketBranch::Consolation, "Consolation ") {}

FormatConstraints ConsolationFormat::constraints() const {
    return FormatConstraints{
        .minTeams = 2,
        .maxTeams = 512,
        .preferredTeamCounts = {4, 8, 16, 32, 64},
        .supportsOddTeamCount = true,
        .supportsByes = true,
        .maxRounds = 9,
    };
}

GeneratedBracket ConsolationFormat::generate(const Tournament& tournament,
                                             const std::vector<Team>& seeded) const {
    auto size = elimination::bracketSize(seeded.size());

    GeneratedBracket generated;
    generated.matches = bracket_.generate(tournament, seeded);
    generated.byeTeams = Seeder::assignByes(seeded, size).byes;
    generated.totalRounds = elimination::roundCount(size);
    generated.totalMatches = static_cast<uint32_t>(generated.matches.size());
    return generated;
}

foundation::EngineResult<ProgressionResult> ConsolationFormat::advance(
    const Match& completed, const Tournament&, std::vector<Match> snapshot) const {
    return bracket_.advance(completed, std::move(snapshot));
}

bool ConsolationFormat::isComplete(const Tournament&, const std::vector<Match>& matches) const {
    return bracket_.isComplete(matches);
}

std::vector<TeamPlacement> ConsolationFormat::placements(
    const Tournament&, const std::vector<Match>& matches) const {
    return bracket_.placements(matches);
}

std::vector<TieBreakMethod> ConsolationFormat::defaultTieBreakers() const {
    return {TieBreakMethod::PointsDifferential, TieBreakMethod::PointsAgainst};
}

std::vector<TeamId> ConsolationFormat::earlyEliminated(const std::vector<Match>& matches) {
    std::vector<const Match*> played;
    for (const auto& match : matches) {
        if (match.branch == BracketBranch::Winner && match.status == MatchStatus::Completed &&
            match.loser()) {
            played.push_back(&match);
        }
    }
    std::sort(played.begin(), played.end(), [](const Match* a, const Match* b) {
        return std::make_tuple(a->round, a->id) < std::make_tuple(b->round, b->id);
    });

    std::set<TeamId> seen;
    std::vector<TeamId> out;
    for (const auto* match : played) {
        auto winner = match->result->winner;
        auto loser = *match->loser();
        if (seen.insert(loser).second) {
            out.push_back(loser);
        }
        seen.insert(winner);
    }
    return out;
}

} // namespace tourney::tournament
