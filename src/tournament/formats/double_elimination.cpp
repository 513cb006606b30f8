/// @file double_elimination.cpp
/// @brief Double-elimination format.

#include "tourney/tournament/formats/double_elimination.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

#include "tourney/foundation/engine_logger.hpp"
#include "tourney/tournament/elimination_bracket.hpp"
#include "tourney/tournament/seeder.hpp"

namespace tourney::tournament {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using elimination::BracketPlan;
using elimination::PlannedMatch;
using elimination::Source;

namespace {

constexpr std::string_view kGrandFinalLabel = "Grand Final";
constexpr std::string_view kResetLabel = "Grand Final Reset";

struct GrandFinals {
    const Match* first = nullptr;
    const Match* reset = nullptr;
};

GrandFinals findGrandFinals(const std::vector<Match>& matches) {
    GrandFinals finals;
    for (const auto& match : matches) {
        if (match.branch != BracketBranch::GrandFinal) {
            continue;
        }
        if (match.round == 1) {
            finals.first = &match;
        } else {
            finals.reset = &match;
        }
    }
    return finals;
}

bool decided(const Match* match) {
    return match != nullptr && match->status == MatchStatus::Completed && match->result;
}

Match makeReset(const Match& grandFinal, TeamId winnersChampion, TeamId losersChampion,
                MatchId id) {
    Match reset;
    reset.id = id;
    reset.tournamentId = grandFinal.tournamentId;
    reset.round = grandFinal.round + 1;
    reset.roundName = std::string(kResetLabel);
    reset.branch = BracketBranch::GrandFinal;
    reset.position = 1;
    reset.slot1 = Slot{TeamRef{winnersChampion}, Feed{grandFinal.id, FeedKind::Loser}};
    reset.slot2 = Slot{TeamRef{losersChampion}, Feed{grandFinal.id, FeedKind::Winner}};
    reset.status = MatchStatus::Scheduled;
    return reset;
}

} // namespace

DoubleEliminationFormat::DoubleEliminationFormat(DoubleEliminationConfig config)
    : config_(config) {}

FormatConstraints DoubleEliminationFormat::constraints() const {
    return FormatConstraints{
        .minTeams = 4,
        .maxTeams = 256,
        .preferredTeamCounts = {4, 8, 16, 32, 64, 128},
        .supportsOddTeamCount = true,
        .supportsByes = true,
        .maxRounds = 16,
    };
}

bool DoubleEliminationFormat::owns(const Match& match) const {
    return match.branch == BracketBranch::Winner || match.branch == BracketBranch::Loser ||
           match.branch == BracketBranch::GrandFinal;
}

GeneratedBracket DoubleEliminationFormat::generate(const Tournament& tournament,
                                                   const std::vector<Team>& seeded) const {
    BracketPlan plan;
    auto winners = elimination::planTree(plan, seeded, BracketBranch::Winner, "Winners ");
    const auto k = static_cast<uint32_t>(winners.size());

    std::vector<std::vector<std::size_t>> losers;
    if (k >= 2) {
        const uint32_t lastRound = 2 * (k - 1);
        auto label = [lastRound](uint32_t round) {
            return round == lastRound ? std::string("Losers Final")
                                      : "Losers Round " + std::to_string(round);
        };
        auto add = [&](uint32_t round, uint32_t position, Source first, Source second) {
            return plan.add(PlannedMatch{BracketBranch::Loser, round, position, label(round),
                                         first, second});
        };

        std::vector<std::size_t> entry;
        const auto& opening = winners[0];
        for (uint32_t i = 0; i < opening.size() / 2; ++i) {
            entry.push_back(add(1, i + 1, Source::loserOf(opening[2 * i]),
                                Source::loserOf(opening[2 * i + 1])));
        }
        losers.push_back(entry);

        for (uint32_t r = 1; r < k; ++r) {
            // Drop-in round: survivors meet losers of winners round r + 1.
            auto survivors = losers.back();
            const auto& dropping = winners[r];
            std::vector<std::size_t> dropRound;
            for (uint32_t i = 0; i < survivors.size(); ++i) {
                auto j = (r % 2 == 1) ? dropping.size() - 1 - i : i;
                dropRound.push_back(add(2 * r, i + 1, Source::winnerOf(survivors[i]),
                                        Source::loserOf(dropping[j])));
            }
            losers.push_back(dropRound);

            if (r + 1 < k) {
                std::vector<std::size_t> merged;
                for (uint32_t i = 0; i < dropRound.size() / 2; ++i) {
                    merged.push_back(add(2 * r + 1, i + 1, Source::winnerOf(dropRound[2 * i]),
                                         Source::winnerOf(dropRound[2 * i + 1])));
                }
                losers.push_back(merged);
            }
        }
    }

    const auto winnersFinal = winners.back().front();
    auto challenger = losers.empty() ? Source::loserOf(winnersFinal)
                                     : Source::winnerOf(losers.back().front());
    plan.add(PlannedMatch{BracketBranch::GrandFinal, 1, 1, std::string(kGrandFinalLabel),
                          Source::winnerOf(winnersFinal), challenger});

    GeneratedBracket generated;
    generated.matches = plan.materialize(tournament.id, 1);
    generated.byeTeams = Seeder::assignByes(seeded, elimination::bracketSize(seeded.size())).byes;
    generated.totalRounds = 2 * k;
    generated.totalMatches = static_cast<uint32_t>(generated.matches.size());
    return generated;
}

EngineResult<ProgressionResult> DoubleEliminationFormat::advance(
    const Match& completed, const Tournament& tournament, std::vector<Match> snapshot) const {
    auto resolution = elimination::resolveReferences(completed, snapshot);

    ProgressionResult progression;
    progression.affectedMatches.push_back(completed);

    switch (completed.branch) {
        case BracketBranch::Winner:
        case BracketBranch::Loser:
            if (resolution.resolved == 0) {
                return EngineResult<ProgressionResult>::err(
                    elimination::unresolvedError(completed, resolution));
            }
            if (completed.branch == BracketBranch::Winner) {
                if (auto loser = completed.loser()) {
                    progression.teamUpdates.push_back(TeamBranchUpdate{*loser, BracketBranch::Loser});
                }
            }
            break;

        case BracketBranch::GrandFinal: {
            if (completed.round != 1) {
                break;
            }
            if (resolution.alreadyResolved > 0) {
                return EngineResult<ProgressionResult>::err(
                    elimination::unresolvedError(completed, resolution));
            }
            auto winnersChampion = completed.slot1.teamId();
            auto losersChampion = completed.slot2.teamId();
            if (!config_.bracketReset || !winnersChampion || !losersChampion ||
                completed.result->winner == *winnersChampion) {
                break;
            }

            auto reset = makeReset(completed, *winnersChampion, *losersChampion,
                                   MatchId(elimination::nextMatchId(snapshot)));
            progression.teamUpdates.push_back(
                TeamBranchUpdate{*winnersChampion, BracketBranch::Loser});
            snapshot.push_back(reset);
            progression.newMatches.push_back(std::move(reset));

            LogContext ctx;
            ctx.tournamentId = tournament.id;
            ctx.matchId = completed.id;
            ctx.teamId = *losersChampion;
            foundation::EngineLogger::instance().logWithContext(
                LogLevel::Info, LogCategory::Progression,
                "Losers-bracket champion won the grand final, bracket reset created", ctx);
            break;
        }

        default:
            return EngineResult<ProgressionResult>::err(
                EngineError(ErrorCode::BracketError, "match is not part of a double-elimination bracket"));
    }

    for (auto& match : resolution.affected) {
        progression.affectedMatches.push_back(std::move(match));
    }
    progression.isComplete = isComplete(tournament, snapshot);
    progression.updatedBracketStructure = BracketStructure::build(snapshot, BracketLayout::Tree);
    return EngineResult<ProgressionResult>::ok(std::move(progression));
}

bool DoubleEliminationFormat::isComplete(const Tournament&,
                                         const std::vector<Match>& matches) const {
    auto finals = findGrandFinals(matches);
    if (!decided(finals.first)) {
        return false;
    }
    if (finals.reset != nullptr) {
        return decided(finals.reset);
    }
    auto winnersChampion = finals.first->slot1.teamId();
    return !config_.bracketReset ||
           (winnersChampion && finals.first->result->winner == *winnersChampion);
}

std::vector<TeamPlacement> DoubleEliminationFormat::placements(
    const Tournament& tournament, const std::vector<Match>& matches) const {
    uint32_t losersRounds = 0;
    for (const auto& match : matches) {
        if (match.branch == BracketBranch::Loser) {
            losersRounds = std::max(losersRounds, match.round);
        }
    }
    const bool complete = isComplete(tournament, matches);

    struct Record {
        uint32_t losses = 0;
        bool lostGrandFinal = false;
        int32_t lastStage = 0;
    };
    std::map<TeamId, Record> records;

    for (const auto& match : matches) {
        if (!owns(match)) {
            continue;
        }
        for (const Slot* slot : {&match.slot1, &match.slot2}) {
            if (auto team = slot->teamId()) {
                records[*team];
            }
        }
        if (match.status != MatchStatus::Completed) {
            continue;
        }
        auto loser = match.loser();
        if (!loser) {
            continue;
        }
        auto& record = records[*loser];
        ++record.losses;
        if (match.branch == BracketBranch::Loser) {
            record.lastStage = std::max(record.lastStage, static_cast<int32_t>(match.round));
        } else if (match.branch == BracketBranch::GrandFinal) {
            record.lostGrandFinal = true;
            record.lastStage = std::max(record.lastStage,
                                        static_cast<int32_t>(losersRounds + match.round));
        }
    }

    std::optional<TeamId> champion;
    if (complete) {
        auto finals = findGrandFinals(matches);
        champion = finals.reset != nullptr ? finals.reset->result->winner
                                           : finals.first->result->winner;
    }

    std::vector<TeamPlacement> out;
    out.reserve(records.size());
    for (const auto& [team, record] : records) {
        TeamPlacement placement{team, elimination::kActivePlacement, false};
        if (champion && *champion == team) {
            // The winners-bracket champion may carry one loss from the first grand final.
            placement.placement = elimination::kChampionPlacement;
        } else if (record.losses >= 2 || (complete && record.lostGrandFinal)) {
            placement.eliminated = true;
            placement.placement = record.lastStage;
        }
        out.push_back(placement);
    }
    return out;
}

std::vector<TieBreakMethod> DoubleEliminationFormat::defaultTieBreakers() const {
    return {TieBreakMethod::PointsDifferential, TieBreakMethod::PointsAgainst};
}

} // namespace tourney::tournament
