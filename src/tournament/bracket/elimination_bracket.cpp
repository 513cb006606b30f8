/// @file elimination_bracket.cpp
/// @brief Plan, collapse and progression logic for elimination trees.

#include "tourney/tournament/elimination_bracket.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace tourney::tournament::elimination {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

uint32_t bracketSize(std::size_t teamCount) {
    uint32_t size = 2;
    while (size < teamCount) {
        size *= 2;
    }
    return size;
}

uint32_t roundCount(uint32_t size) {
    uint32_t rounds = 0;
    while ((1u << rounds) < size) {
        ++rounds;
    }
    return rounds;
}

std::vector<uint32_t> standardSeedOrder(uint32_t size) {
    std::vector<uint32_t> order{1};
    while (order.size() < size) {
        auto width = static_cast<uint32_t>(order.size() * 2);
        std::vector<uint32_t> next;
        next.reserve(width);
        for (auto seed : order) {
            next.push_back(seed);
            next.push_back(width + 1 - seed);
        }
        order = std::move(next);
    }
    return order;
}

std::string roundLabel(uint32_t round, uint32_t totalRounds) {
    auto remaining = totalRounds - round;
    switch (remaining) {
        case 0: return "Final";
        case 1: return "Semifinal";
        case 2: return "Quarterfinal";
        case 3: return "Round of 16";
        case 4: return "Round of 32";
        default: return "Round " + std::to_string(round);
    }
}

// -- BracketPlan --------------------------------------------------------------

std::size_t BracketPlan::add(PlannedMatch match) {
    planned_.push_back(std::move(match));
    return planned_.size() - 1;
}

std::vector<Match> BracketPlan::materialize(TournamentId tournament, uint64_t firstId) const {
    // Where the winner and loser of a dropped match end up.
    struct Forward {
        Source winner;
        Source loser;
    };
    std::map<std::size_t, Forward> forwards;
    std::map<std::size_t, MatchId> ids;

    auto settle = [&](Source source) {
        // Follow forwards until the source is a team, a bye or a kept match.
        while (source.kind == Source::Kind::Winner || source.kind == Source::Kind::Loser) {
            auto it = forwards.find(source.match);
            if (it == forwards.end()) {
                break;
            }
            source = source.kind == Source::Kind::Winner ? it->second.winner : it->second.loser;
        }
        return source;
    };

    auto toSlot = [&](const Source& source) {
        switch (source.kind) {
            case Source::Kind::Team:   return Slot::team(source.team);
            case Source::Kind::Winner: return Slot::winnerOf(ids.at(source.match));
            case Source::Kind::Loser:  return Slot::loserOf(ids.at(source.match));
            case Source::Kind::Bye:    break;
        }
        return Slot::bye();
    };

    std::vector<Match> matches;
    uint64_t nextId = firstId;
    for (std::size_t i = 0; i < planned_.size(); ++i) {
        const auto& plan = planned_[i];
        auto first = settle(plan.first);
        auto second = settle(plan.second);

        bool firstBye = first.kind == Source::Kind::Bye;
        bool secondBye = second.kind == Source::Kind::Bye;
        if (firstBye || secondBye) {
            forwards[i] = Forward{firstBye ? second : first, Source::bye()};
            continue;
        }

        Match match;
        match.id = MatchId(nextId++);
        match.tournamentId = tournament;
        match.round = plan.round;
        match.roundName = plan.label;
        match.branch = plan.branch;
        match.position = plan.position;
        match.slot1 = toSlot(first);
        match.slot2 = toSlot(second);
        match.status = (match.slot1.teamId() && match.slot2.teamId()) ? MatchStatus::Scheduled
                                                                      : MatchStatus::Pending;
        ids[i] = match.id;
        matches.push_back(std::move(match));
    }
    return matches;
}

std::vector<std::vector<std::size_t>> planTree(BracketPlan& plan,
                                               const std::vector<Team>& seeded,
                                               BracketBranch branch,
                                               std::string_view labelPrefix) {
    const auto size = bracketSize(seeded.size());
    const auto rounds = roundCount(size);
    const auto order = standardSeedOrder(size);
    const std::string prefix(labelPrefix);

    auto seedSource = [&](uint32_t seed) {
        return seed <= seeded.size() ? Source::ofTeam(seeded[seed - 1].id) : Source::bye();
    };

    std::vector<std::vector<std::size_t>> byRound(rounds);
    for (uint32_t i = 0; i < size / 2; ++i) {
        byRound[0].push_back(plan.add(PlannedMatch{branch, 1, i + 1, prefix + roundLabel(1, rounds),
                                                   seedSource(order[2 * i]),
                                                   seedSource(order[2 * i + 1])}));
    }
    for (uint32_t r = 1; r < rounds; ++r) {
        const auto& previous = byRound[r - 1];
        for (uint32_t i = 0; i < previous.size() / 2; ++i) {
            byRound[r].push_back(plan.add(PlannedMatch{
                branch, r + 1, i + 1, prefix + roundLabel(r + 1, rounds),
                Source::winnerOf(previous[2 * i]), Source::winnerOf(previous[2 * i + 1])}));
        }
    }
    return byRound;
}

// -- Progression --------------------------------------------------------------

Resolution resolveReferences(const Match& completed, std::vector<Match>& snapshot) {
    Resolution resolution;
    auto winner = completed.result ? std::optional<TeamId>(completed.result->winner)
                                   : std::nullopt;
    auto loser = completed.loser();

    for (auto& match : snapshot) {
        if (match.id == completed.id) {
            continue;
        }
        bool touched = false;
        for (Slot* slot : {&match.slot1, &match.slot2}) {
            if (auto pending = slot->pendingFeed(); pending && pending->match == completed.id) {
                auto team = pending->kind == FeedKind::Winner ? winner : loser;
                if (!team) {
                    continue;
                }
                slot->participant = TeamRef{*team};
                slot->resolvedFrom = pending;
                ++resolution.resolved;
                touched = true;
            } else if (slot->resolvedFrom && slot->resolvedFrom->match == completed.id) {
                ++resolution.alreadyResolved;
            }
        }
        if (!touched) {
            continue;
        }
        if (match.status == MatchStatus::Pending && match.slot1.teamId() && match.slot2.teamId()) {
            match.status = MatchStatus::Scheduled;
        }
        resolution.affected.push_back(match);
    }
    return resolution;
}

EngineError unresolvedError(const Match& completed, const Resolution& resolution) {
    auto id = std::to_string(completed.id.value());
    if (resolution.alreadyResolved > 0) {
        return EngineError(ErrorCode::ReferenceAlreadyResolved,
                           "match " + id + " has already been advanced");
    }
    return EngineError(ErrorCode::MissingBracketReference,
                       "no bracket slot references match " + id);
}

uint64_t nextMatchId(const std::vector<Match>& matches) {
    uint64_t highest = 0;
    for (const auto& match : matches) {
        highest = std::max(highest, match.id.value());
    }
    return highest + 1;
}

// -- KnockoutBracket ----------------------------------------------------------

KnockoutBracket::KnockoutBracket(BracketBranch branch, std::string labelPrefix)
    : branch_(branch), labelPrefix_(std::move(labelPrefix)) {}

std::vector<Match> KnockoutBracket::generate(const Tournament& tournament,
                                             const std::vector<Team>& seeded) const {
    BracketPlan plan;
    planTree(plan, seeded, branch_, labelPrefix_);
    return plan.materialize(tournament.id, 1);
}

EngineResult<ProgressionResult> KnockoutBracket::advance(const Match& completed,
                                                         std::vector<Match> snapshot) const {
    auto resolution = resolveReferences(completed, snapshot);
    const auto* decider = finalMatch(snapshot);
    bool terminal = decider != nullptr && decider->id == completed.id;

    if (resolution.resolved == 0 && !terminal) {
        return EngineResult<ProgressionResult>::err(unresolvedError(completed, resolution));
    }

    ProgressionResult progression;
    progression.affectedMatches.push_back(completed);
    for (auto& match : resolution.affected) {
        progression.affectedMatches.push_back(std::move(match));
    }
    progression.isComplete = isComplete(snapshot);
    progression.updatedBracketStructure = BracketStructure::build(snapshot, BracketLayout::Tree);
    return EngineResult<ProgressionResult>::ok(std::move(progression));
}

bool KnockoutBracket::isComplete(const std::vector<Match>& matches) const {
    const auto* decider = finalMatch(matches);
    return decider != nullptr && decider->status == MatchStatus::Completed && decider->result;
}

std::vector<TeamPlacement> KnockoutBracket::placements(const std::vector<Match>& matches) const {
    std::map<TeamId, TeamPlacement> byTeam;
    for (const auto& match : matches) {
        if (!owns(match)) {
            continue;
        }
        for (const Slot* slot : {&match.slot1, &match.slot2}) {
            if (auto team = slot->teamId()) {
                byTeam.emplace(*team, TeamPlacement{*team, kActivePlacement, false});
            }
        }
    }

    for (const auto& match : matches) {
        if (!owns(match) || match.status != MatchStatus::Completed) {
            continue;
        }
        if (auto loser = match.loser()) {
            auto& entry = byTeam[*loser];
            entry.team = *loser;
            entry.eliminated = true;
            entry.placement = static_cast<int32_t>(match.round);
        }
    }

    if (isComplete(matches)) {
        auto champion = finalMatch(matches)->result->winner;
        byTeam[champion].placement = kChampionPlacement;
    }

    std::vector<TeamPlacement> out;
    out.reserve(byTeam.size());
    for (const auto& [team, placement] : byTeam) {
        out.push_back(placement);
    }
    return out;
}

const Match* KnockoutBracket::finalMatch(const std::vector<Match>& matches) const {
    const Match* decider = nullptr;
    for (const auto& match : matches) {
        if (owns(match) && (decider == nullptr || match.round > decider->round)) {
            decider = &match;
        }
    }
    return decider;
}

} // namespace tourney::tournament::elimination
