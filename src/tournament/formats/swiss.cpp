/// @file swiss.cpp
/// @brief Swiss format.

#include "tourney/tournament/formats/swiss.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "tourney/foundation/engine_logger.hpp"
#include "tourney/tournament/elimination_bracket.hpp"
#include "tourney/tournament/match_tally.hpp"

namespace tourney::tournament {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

std::string roundName(uint32_t round) {
    return "Swiss Round " + std::to_string(round);
}

Match pairing(const Tournament& tournament, MatchId id, uint32_t round, uint32_t position,
              TeamId first, TeamId second) {
    Match match;
    match.id = id;
    match.tournamentId = tournament.id;
    match.round = round;
    match.roundName = roundName(round);
    match.branch = BracketBranch::Winner;
    match.position = position;
    match.slot1 = Slot::team(first);
    match.slot2 = Slot::team(second);
    match.status = MatchStatus::Scheduled;
    return match;
}

/// Bye matches are created already completed with a maxPoints:0 win.
Match byeMatch(const Tournament& tournament, MatchId id, uint32_t round, uint32_t position,
               TeamId team) {
    Match match;
    match.id = id;
    match.tournamentId = tournament.id;
    match.round = round;
    match.roundName = roundName(round);
    match.branch = BracketBranch::Winner;
    match.position = position;
    match.slot1 = Slot::team(team);
    match.slot2 = Slot::bye();
    match.result = MatchResult{MatchScore{tournament.maxPoints, 0}, team};
    match.status = MatchStatus::Completed;
    return match;
}

/// Round-one order of appearance, which is the seed order for a folded
/// first round: every slot 1, then every slot 2, then the bye holder.
std::vector<TeamId> seedOrder(const std::vector<Match>& matches) {
    std::vector<const Match*> opening;
    for (const auto& match : matches) {
        if (match.branch == BracketBranch::Winner && match.round == 1) {
            opening.push_back(&match);
        }
    }
    std::sort(opening.begin(), opening.end(),
              [](const Match* a, const Match* b) { return a->position < b->position; });

    std::vector<TeamId> order;
    std::vector<TeamId> lower;
    std::vector<TeamId> byes;
    for (const auto* match : opening) {
        auto first = match->slot1.teamId();
        auto second = match->slot2.teamId();
        if (first && second) {
            order.push_back(*first);
            lower.push_back(*second);
        } else if (first) {
            byes.push_back(*first);
        } else if (second) {
            byes.push_back(*second);
        }
    }
    order.insert(order.end(), lower.begin(), lower.end());
    order.insert(order.end(), byes.begin(), byes.end());
    return order;
}

} // namespace

SwissFormat::SwissFormat(SwissConfig config)
    : config_(config) {}

FormatConstraints SwissFormat::constraints() const {
    return FormatConstraints{
        .minTeams = 4,
        .maxTeams = 200,
        .preferredTeamCounts = {},
        .supportsOddTeamCount = true,
        .supportsByes = true,
        .maxRounds = config_.maxRounds,
    };
}

uint32_t SwissFormat::roundsFor(const Tournament& tournament, std::size_t teamCount) const {
    uint32_t rounds = 0;
    if (tournament.settings.swissRounds) {
        rounds = *tournament.settings.swissRounds;
    } else {
        while ((std::size_t{1} << rounds) < teamCount) {
            ++rounds;
        }
    }
    auto ceiling = std::min<uint32_t>(teamCount > 1 ? static_cast<uint32_t>(teamCount - 1) : 1,
                                      config_.maxRounds);
    return std::clamp<uint32_t>(rounds, 1, std::max<uint32_t>(ceiling, 1));
}

GeneratedBracket SwissFormat::generate(const Tournament& tournament,
                                       const std::vector<Team>& seeded) const {
    const auto count = seeded.size();
    const auto half = count / 2;

    GeneratedBracket generated;
    uint64_t nextId = 1;
    for (std::size_t i = 0; i < half; ++i) {
        generated.matches.push_back(pairing(tournament, MatchId(nextId++), 1,
                                            static_cast<uint32_t>(i + 1), seeded[i].id,
                                            seeded[i + half].id));
    }
    if (count % 2 == 1) {
        generated.matches.push_back(byeMatch(tournament, MatchId(nextId++), 1,
                                             static_cast<uint32_t>(half + 1), seeded.back().id));
        generated.byeTeams.push_back(seeded.back());
    }

    generated.totalRounds = roundsFor(tournament, count);
    generated.totalMatches = generated.totalRounds * static_cast<uint32_t>(half);
    return generated;
}

EngineResult<ProgressionResult> SwissFormat::advance(const Match& completed,
                                                     const Tournament& tournament,
                                                     std::vector<Match> snapshot) const {
    const auto round = completed.round;
    bool roundDone = true;
    for (const auto& match : snapshot) {
        if (!owns(match)) {
            continue;
        }
        if (match.round > round) {
            return EngineResult<ProgressionResult>::err(
                EngineError(ErrorCode::ReferenceAlreadyResolved,
                            "round " + std::to_string(round + 1) +
                                " has already been paired; match " +
                                std::to_string(completed.id.value()) + " was advanced before"));
        }
        if (match.round == round && !match.isFinished()) {
            roundDone = false;
        }
    }

    ProgressionResult progression;
    progression.affectedMatches.push_back(completed);

    const auto teamCount = seedOrder(snapshot).size();
    const auto totalRounds = roundsFor(tournament, teamCount);
    if (roundDone && round < totalRounds) {
        progression.newMatches = pairNextRound(tournament, snapshot, round + 1);
        snapshot.insert(snapshot.end(), progression.newMatches.begin(),
                        progression.newMatches.end());

        LogContext ctx;
        ctx.tournamentId = tournament.id;
        ctx.matchId = completed.id;
        ctx.extra["round"] = std::to_string(round + 1);
        ctx.extra["matches"] = std::to_string(progression.newMatches.size());
        foundation::EngineLogger::instance().logWithContext(
            LogLevel::Info, LogCategory::Bracket, "Swiss round paired", ctx);
    }

    progression.isComplete = isComplete(tournament, snapshot);
    progression.updatedBracketStructure = BracketStructure::build(snapshot, BracketLayout::Rounds);
    return EngineResult<ProgressionResult>::ok(std::move(progression));
}

bool SwissFormat::isComplete(const Tournament& tournament,
                             const std::vector<Match>& matches) const {
    uint32_t lastRound = 0;
    for (const auto& match : matches) {
        if (owns(match)) {
            lastRound = std::max(lastRound, match.round);
        }
    }
    if (lastRound == 0 || lastRound < roundsFor(tournament, seedOrder(matches).size())) {
        return false;
    }
    return std::all_of(matches.begin(), matches.end(), [&](const Match& match) {
        return !owns(match) || match.round != lastRound || match.isFinished();
    });
}

std::vector<TeamPlacement> SwissFormat::placements(const Tournament& tournament,
                                                   const std::vector<Match>& matches) const {
    std::vector<Match> owned;
    std::copy_if(matches.begin(), matches.end(), std::back_inserter(owned),
                 [this](const Match& match) { return owns(match); });
    auto tally = MatchTally::build(owned);
    const auto totalRounds = roundsFor(tournament, seedOrder(owned).size());

    std::vector<TeamPlacement> out;
    for (auto team : tally.teams()) {
        TeamPlacement placement{team, 0, false};
        if (auto spots = tournament.settings.qualificationSpots; spots && *spots > 0) {
            const auto& entry = tally.of(team);
            auto remaining = totalRounds > entry.finished ? totalRounds - entry.finished : 0;
            auto best = entry.wins + remaining;
            auto ahead = std::count_if(tally.teams().begin(), tally.teams().end(),
                                       [&](TeamId other) { return tally.of(other).wins > best; });
            placement.eliminated = static_cast<uint32_t>(ahead) >= *spots;
        }
        out.push_back(placement);
    }
    return out;
}

std::vector<TieBreakMethod> SwissFormat::defaultTieBreakers() const {
    return {TieBreakMethod::Buchholz, TieBreakMethod::SonnebornBerger,
            TieBreakMethod::PointsDifferential};
}

std::vector<std::pair<std::size_t, std::size_t>> SwissFormat::pair(
    const std::vector<TeamId>& ordered,
    const std::vector<std::pair<TeamId, TeamId>>& previous) const {
    std::set<std::pair<TeamId, TeamId>> played;
    for (const auto& [a, b] : previous) {
        played.insert({std::min(a, b), std::max(a, b)});
    }
    auto rematch = [&](std::size_t i, std::size_t j) {
        auto a = ordered[i];
        auto b = ordered[j];
        return played.count({std::min(a, b), std::max(a, b)}) > 0;
    };

    const auto count = ordered.size();
    std::vector<bool> used(count, false);
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    uint64_t steps = 0;

    std::function<bool(bool)> search = [&](bool allowRematch) -> bool {
        auto first = std::find(used.begin(), used.end(), false);
        if (first == used.end()) {
            return true;
        }
        auto i = static_cast<std::size_t>(first - used.begin());
        used[i] = true;

        // Fresh opponents first; rematches only as a last resort.
        std::vector<std::size_t> candidates;
        std::vector<std::size_t> repeats;
        for (auto j = i + 1; j < count; ++j) {
            if (used[j]) {
                continue;
            }
            if (rematch(i, j)) {
                repeats.push_back(j);
            } else {
                candidates.push_back(j);
            }
        }
        if (allowRematch) {
            candidates.insert(candidates.end(), repeats.begin(), repeats.end());
        }

        for (auto j : candidates) {
            if (!allowRematch && ++steps > config_.pairingSearchLimit) {
                break;
            }
            used[j] = true;
            pairs.emplace_back(i, j);
            if (search(allowRematch)) {
                return true;
            }
            pairs.pop_back();
            used[j] = false;
        }
        used[i] = false;
        return false;
    };

    if (search(false)) {
        return pairs;
    }

    TOURNEY_LOG_WARN(LogCategory::Bracket,
                     "No rematch-free Swiss pairing found, allowing rematches");
    std::fill(used.begin(), used.end(), false);
    pairs.clear();
    search(true);
    return pairs;
}

std::vector<Match> SwissFormat::pairNextRound(const Tournament& tournament,
                                              const std::vector<Match>& snapshot,
                                              uint32_t round) const {
    std::vector<Match> owned;
    std::copy_if(snapshot.begin(), snapshot.end(), std::back_inserter(owned),
                 [this](const Match& match) { return owns(match); });
    auto tally = MatchTally::build(owned);

    auto ordered = seedOrder(owned);
    std::map<TeamId, std::size_t> seedOf;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        seedOf[ordered[i]] = i;
    }
    std::stable_sort(ordered.begin(), ordered.end(), [&](TeamId a, TeamId b) {
        const auto winsA = tally.of(a).wins;
        const auto winsB = tally.of(b).wins;
        if (winsA != winsB) {
            return winsA > winsB;
        }
        const auto buchA = tally.buchholz(a);
        const auto buchB = tally.buchholz(b);
        if (buchA != buchB) {
            return buchA > buchB;
        }
        return seedOf[a] < seedOf[b];
    });

    std::optional<TeamId> byeTeam;
    if (ordered.size() % 2 == 1) {
        auto it = std::find_if(ordered.rbegin(), ordered.rend(),
                               [&](TeamId team) { return tally.of(team).byes == 0; });
        auto chosen = it != ordered.rend() ? *it : ordered.back();
        byeTeam = chosen;
        ordered.erase(std::find(ordered.begin(), ordered.end(), chosen));
    }

    std::vector<std::pair<TeamId, TeamId>> previous;
    for (const auto& match : owned) {
        auto a = match.slot1.teamId();
        auto b = match.slot2.teamId();
        if (a && b) {
            previous.emplace_back(*a, *b);
        }
    }

    std::vector<Match> created;
    auto nextId = elimination::nextMatchId(snapshot);
    uint32_t position = 1;
    for (const auto& [i, j] : pair(ordered, previous)) {
        created.push_back(pairing(tournament, MatchId(nextId++), round, position++,
                                  ordered[i], ordered[j]));
    }
    if (byeTeam) {
        created.push_back(byeMatch(tournament, MatchId(nextId++), round, position, *byeTeam));
    }
    return created;
}

} // namespace tourney::tournament
