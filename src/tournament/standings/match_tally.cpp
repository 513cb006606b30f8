/// @file match_tally.cpp
/// @brief MatchTally aggregation.

#include "tourney/tournament/match_tally.hpp"

#include <algorithm>
#include <set>
#include <tuple>

namespace tourney::tournament {

namespace {

bool counts(const Match& match) {
    if (match.status != MatchStatus::Completed || !match.result) {
        return false;
    }
    auto winner = match.result->winner;
    return match.slot1.teamId() == winner || match.slot2.teamId() == winner;
}

} // namespace

MatchTally MatchTally::build(const std::vector<Match>& matches) {
    MatchTally tally;
    std::set<TeamId> seen;

    auto enroll = [&](TeamId team) -> TeamTally& {
        if (seen.insert(team).second) {
            tally.teams_.push_back(team);
        }
        auto& entry = tally.tallies_[team];
        entry.team = team;
        return entry;
    };

    for (const auto& match : matches) {
        for (const Slot* slot : {&match.slot1, &match.slot2}) {
            if (auto team = slot->teamId()) {
                auto& entry = enroll(*team);
                if (match.isFinished()) {
                    ++entry.finished;
                }
            }
        }
    }

    std::vector<const Match*> played;
    for (const auto& match : matches) {
        if (counts(match)) {
            played.push_back(&match);
        }
    }
    std::stable_sort(played.begin(), played.end(), [](const Match* a, const Match* b) {
        return std::make_tuple(a->completedSequence.value_or(0), a->round, a->id) <
               std::make_tuple(b->completedSequence.value_or(0), b->round, b->id);
    });

    // Results per team in play order, used for the recent window.
    std::map<TeamId, std::vector<RecentResult>> history;

    for (const auto* match : played) {
        const auto winner = match->result->winner;
        const auto first = match->slot1.teamId();
        const auto second = match->slot2.teamId();
        const auto& score = match->result->score;

        if (!first || !second) {
            // Bye: the present side is the winner.
            auto& entry = enroll(winner);
            ++entry.played;
            ++entry.wins;
            ++entry.byes;
            entry.pointsFor += first ? score.team1 : score.team2;
            entry.pointsAgainst += first ? score.team2 : score.team1;
            history[winner].push_back(RecentResult::Win);
            continue;
        }

        auto& a = enroll(*first);
        auto& b = enroll(*second);
        ++a.played;
        ++b.played;
        a.pointsFor += score.team1;
        a.pointsAgainst += score.team2;
        b.pointsFor += score.team2;
        b.pointsAgainst += score.team1;
        a.opponents.push_back(*second);
        b.opponents.push_back(*first);

        auto& won = winner == *first ? a : b;
        auto& lost = winner == *first ? b : a;
        ++won.wins;
        ++lost.losses;
        won.defeated.push_back(lost.team);
        history[won.team].push_back(RecentResult::Win);
        history[lost.team].push_back(RecentResult::Loss);
    }

    for (auto& [team, results] : history) {
        auto& recent = tally.tallies_[team].recent;
        std::size_t slot = 0;
        for (auto it = results.rbegin(); it != results.rend() && slot < recent.size(); ++it) {
            recent[slot++] = *it;
        }
    }
    return tally;
}

const TeamTally& MatchTally::of(TeamId team) const {
    auto it = tallies_.find(team);
    return it == tallies_.end() ? empty_ : it->second;
}

uint32_t MatchTally::buchholz(TeamId team) const {
    uint32_t total = 0;
    for (auto opponent : of(team).opponents) {
        total += of(opponent).wins;
    }
    return total;
}

uint32_t MatchTally::sonnebornBerger(TeamId team) const {
    uint32_t total = 0;
    for (auto opponent : of(team).defeated) {
        total += of(opponent).wins;
    }
    return total;
}

double MatchTally::strengthOfSchedule(TeamId team) const {
    const auto& opponents = of(team).opponents;
    if (opponents.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (auto opponent : opponents) {
        const auto& entry = of(opponent);
        if (entry.played > 0) {
            total += static_cast<double>(entry.wins) / static_cast<double>(entry.played);
        }
    }
    return total / static_cast<double>(opponents.size());
}

std::optional<TeamId> MatchTally::headToHeadWinner(TeamId a, TeamId b) const {
    const auto& defeatedByA = of(a).defeated;
    const auto& defeatedByB = of(b).defeated;
    auto winsA = std::count(defeatedByA.begin(), defeatedByA.end(), b);
    auto winsB = std::count(defeatedByB.begin(), defeatedByB.end(), a);
    if (winsA > winsB) {
        return a;
    }
    if (winsB > winsA) {
        return b;
    }
    return std::nullopt;
}

bool MatchTally::met(TeamId a, TeamId b) const {
    const auto& opponents = of(a).opponents;
    return std::find(opponents.begin(), opponents.end(), b) != opponents.end();
}

} // namespace tourney::tournament
