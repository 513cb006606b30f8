/// @file round_robin.cpp
/// @brief Round-robin format.

#include "tourney/tournament/formats/round_robin.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "tourney/tournament/match_tally.hpp"

namespace tourney::tournament {

using foundation::EngineResult;

FormatConstraints RoundRobinFormat::constraints() const {
    return FormatConstraints{
        .minTeams = 3,
        .maxTeams = 20,
        .preferredTeamCounts = {},
        .supportsOddTeamCount = true,
        .supportsByes = false,
        .maxRounds = 20,
    };
}

GeneratedBracket RoundRobinFormat::generate(const Tournament& tournament,
                                            const std::vector<Team>& seeded) const {
    // Circle method: position 0 stays fixed, the rest rotate one step per
    // round. An empty entry stands in for the resting slot of an odd field.
    std::vector<std::optional<TeamId>> circle;
    for (const auto& team : seeded) {
        circle.emplace_back(team.id);
    }
    if (circle.size() % 2 == 1) {
        circle.emplace_back(std::nullopt);
    }

    const auto size = circle.size();
    const auto rounds = static_cast<uint32_t>(size - 1);

    GeneratedBracket generated;
    uint64_t nextId = 1;
    for (uint32_t round = 1; round <= rounds; ++round) {
        uint32_t position = 1;
        for (std::size_t i = 0; i < size / 2; ++i) {
            auto home = circle[i];
            auto away = circle[size - 1 - i];
            if (!home || !away) {
                if (round == 1) {
                    for (const auto& team : seeded) {
                        if (team.id == (home ? *home : *away)) {
                            generated.byeTeams.push_back(team);
                        }
                    }
                }
                continue;
            }
            // The fixed team alternates sides so it is not always slot 1.
            if (i == 0 && round % 2 == 0) {
                std::swap(home, away);
            }

            Match match;
            match.id = MatchId(nextId++);
            match.tournamentId = tournament.id;
            match.round = round;
            match.roundName = "Round " + std::to_string(round);
            match.branch = BracketBranch::Winner;
            match.position = position++;
            match.slot1 = Slot::team(*home);
            match.slot2 = Slot::team(*away);
            match.status = MatchStatus::Scheduled;
            generated.matches.push_back(std::move(match));
        }
        std::rotate(circle.begin() + 1, circle.end() - 1, circle.end());
    }

    generated.totalRounds = rounds;
    generated.totalMatches = static_cast<uint32_t>(generated.matches.size());
    return generated;
}

EngineResult<ProgressionResult> RoundRobinFormat::advance(const Match& completed,
                                                          const Tournament& tournament,
                                                          std::vector<Match> snapshot) const {
    ProgressionResult progression;
    progression.affectedMatches.push_back(completed);
    progression.isComplete = isComplete(tournament, snapshot);
    progression.updatedBracketStructure = BracketStructure::build(snapshot, BracketLayout::Rounds);
    return EngineResult<ProgressionResult>::ok(std::move(progression));
}

bool RoundRobinFormat::isComplete(const Tournament&, const std::vector<Match>& matches) const {
    bool any = false;
    for (const auto& match : matches) {
        if (!owns(match)) {
            continue;
        }
        any = true;
        if (!match.isFinished()) {
            return false;
        }
    }
    return any;
}

std::vector<TeamPlacement> RoundRobinFormat::placements(const Tournament& tournament,
                                                        const std::vector<Match>& matches) const {
    std::vector<Match> owned;
    std::copy_if(matches.begin(), matches.end(), std::back_inserter(owned),
                 [this](const Match& match) { return owns(match); });
    auto tally = MatchTally::build(owned);

    std::vector<TeamPlacement> out;
    for (auto team : tally.teams()) {
        TeamPlacement placement{team, 0, false};
        if (auto spots = tournament.settings.qualificationSpots; spots && *spots > 0) {
            auto remaining = std::count_if(owned.begin(), owned.end(), [team](const Match& match) {
                return match.involves(team) && !match.isFinished();
            });
            auto best = tally.of(team).wins + static_cast<uint32_t>(remaining);
            auto ahead = std::count_if(tally.teams().begin(), tally.teams().end(),
                                       [&](TeamId other) { return tally.of(other).wins > best; });
            placement.eliminated = static_cast<uint32_t>(ahead) >= *spots;
        }
        out.push_back(placement);
    }
    return out;
}

std::vector<TieBreakMethod> RoundRobinFormat::defaultTieBreakers() const {
    return {TieBreakMethod::HeadToHead, TieBreakMethod::PointsDifferential,
            TieBreakMethod::PointsAgainst};
}

} // namespace tourney::tournament
