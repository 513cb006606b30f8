/// @file standings_resolver.cpp
/// @brief StandingsResolver implementation.

#include "tourney/tournament/standings_resolver.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

#include "tourney/foundation/engine_logger.hpp"
#include "tourney/tournament/match_tally.hpp"

namespace tourney::tournament {

using foundation::LogCategory;

const Standing* Standings::find(TeamId team) const {
    auto it = std::find_if(rankings.begin(), rankings.end(),
                           [team](const Standing& row) { return row.team == team; });
    return it == rankings.end() ? nullptr : &*it;
}

namespace {

using Group = std::vector<TeamId>;

class TieBreaker {
public:
    TieBreaker(const MatchTally& tally, const std::vector<TieBreakMethod>& chain)
        : tally_(tally), chain_(chain) {}

    /// Split a tied group into ordered sub-groups, applying chain[step...].
    void resolve(Group group, std::size_t step, std::vector<Group>& out) const {
        if (group.size() <= 1 || step >= chain_.size()) {
            out.push_back(std::move(group));
            return;
        }

        auto method = chain_[step];
        if (method == TieBreakMethod::HeadToHead) {
            if (group.size() == 2 && tally_.met(group[0], group[1])) {
                if (auto winner = tally_.headToHeadWinner(group[0], group[1])) {
                    auto other = *winner == group[0] ? group[1] : group[0];
                    out.push_back({*winner});
                    out.push_back({other});
                    return;
                }
            }
            resolve(std::move(group), step + 1, out);
            return;
        }

        std::stable_sort(group.begin(), group.end(), [&](TeamId a, TeamId b) {
            return key(method, a) > key(method, b);
        });
        auto begin = group.begin();
        while (begin != group.end()) {
            auto value = key(method, *begin);
            auto end = std::find_if(begin, group.end(),
                                    [&](TeamId team) { return key(method, team) != value; });
            resolve(Group(begin, end), step + 1, out);
            begin = end;
        }
    }

private:
    /// Larger is better for every method.
    double key(TieBreakMethod method, TeamId team) const {
        const auto& entry = tally_.of(team);
        switch (method) {
            case TieBreakMethod::PointsDifferential:
                return static_cast<double>(entry.pointsFor - entry.pointsAgainst);
            case TieBreakMethod::PointsAgainst:
                return -static_cast<double>(entry.pointsAgainst);
            case TieBreakMethod::Buchholz:
                return static_cast<double>(tally_.buchholz(team));
            case TieBreakMethod::SonnebornBerger:
                return static_cast<double>(tally_.sonnebornBerger(team));
            case TieBreakMethod::StrengthOfSchedule:
                return tally_.strengthOfSchedule(team);
            case TieBreakMethod::HeadToHead:
                break;
        }
        return 0.0;
    }

    const MatchTally& tally_;
    const std::vector<TieBreakMethod>& chain_;
};

} // namespace

Standings StandingsResolver::compute(const std::vector<Match>& matches,
                                     const std::vector<TeamPlacement>& placements,
                                     const std::vector<TieBreakMethod>& chain,
                                     bool tournamentComplete) {
    auto tally = MatchTally::build(matches);

    std::map<TeamId, TeamPlacement> placementOf;
    for (const auto& placement : placements) {
        placementOf[placement.team] = placement;
    }

    Group teams = tally.teams();
    for (const auto& placement : placements) {
        if (std::find(teams.begin(), teams.end(), placement.team) == teams.end()) {
            teams.push_back(placement.team);
        }
    }
    std::sort(teams.begin(), teams.end());

    auto placementKey = [&](TeamId team) {
        auto it = placementOf.find(team);
        return it == placementOf.end() ? 0 : it->second.placement;
    };
    std::stable_sort(teams.begin(), teams.end(), [&](TeamId a, TeamId b) {
        auto placeA = placementKey(a);
        auto placeB = placementKey(b);
        if (placeA != placeB) {
            return placeA > placeB;
        }
        return tally.of(a).wins > tally.of(b).wins;
    });

    // Groups tied on placement and wins go through the tie-break chain.
    TieBreaker breaker(tally, chain);
    std::vector<Group> ordered;
    auto begin = teams.begin();
    while (begin != teams.end()) {
        auto end = std::find_if(begin, teams.end(), [&](TeamId team) {
            return placementKey(team) != placementKey(*begin) ||
                   tally.of(team).wins != tally.of(*begin).wins;
        });
        breaker.resolve(Group(begin, end), 0, ordered);
        begin = end;
    }

    Standings standings;
    standings.tieBreakers = chain;
    uint32_t position = 1;
    for (const auto& group : ordered) {
        for (auto team : group) {
            const auto& entry = tally.of(team);
            Standing row;
            row.team = team;
            row.rank = position;
            row.matchesPlayed = entry.played;
            row.wins = entry.wins;
            row.losses = entry.losses;
            row.pointsFor = entry.pointsFor;
            row.pointsAgainst = entry.pointsAgainst;
            row.pointsDifferential = entry.pointsFor - entry.pointsAgainst;
            row.recentResults = entry.recent;
            row.buchholz = tally.buchholz(team);
            row.sonnebornBerger = tally.sonnebornBerger(team);
            row.strengthOfSchedule = tally.strengthOfSchedule(team);

            auto it = placementOf.find(team);
            if (tournamentComplete && position == 1) {
                row.status = StandingStatus::Champion;
            } else if (it != placementOf.end() && it->second.eliminated) {
                row.status = StandingStatus::Eliminated;
            }
            standings.rankings.push_back(row);
        }
        position += static_cast<uint32_t>(group.size());
    }

    standings.metadata.totalMatches = static_cast<uint32_t>(matches.size());
    for (const auto& match : matches) {
        if (match.status == MatchStatus::Completed) {
            ++standings.metadata.completedMatches;
        } else if (!match.isFinished()) {
            ++standings.metadata.pendingMatches;
        }
    }

    TOURNEY_LOG_DEBUG(LogCategory::Standings,
                      "Computed standings for " + std::to_string(standings.rankings.size()) +
                          " teams over " + std::to_string(standings.metadata.completedMatches) +
                          " completed matches");
    return standings;
}

} // namespace tourney::tournament
