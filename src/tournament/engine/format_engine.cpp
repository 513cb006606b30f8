/// @file format_engine.cpp
/// @brief Variant dispatch and the checks shared by every format.

#include "tourney/tournament/format_engine.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

#include "tourney/foundation/engine_logger.hpp"
#include "tourney/tournament/constraint_validator.hpp"
#include "tourney/tournament/seeder.hpp"
#include "tourney/tournament/standings_resolver.hpp"

namespace tourney::tournament {

using foundation::EngineError;
using foundation::EngineLogger;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

EngineResult<ProgressionResult> rejected(const Match& match, const Tournament& tournament,
                                         ErrorCode code, const std::string& message) {
    LogContext ctx;
    ctx.tournamentId = tournament.id;
    ctx.matchId = match.id;
    ctx.extra["code"] = std::string(foundation::errorSubsystem(code));
    EngineLogger::instance().logWithContext(LogLevel::Error, LogCategory::Progression,
                                            "Advance rejected: " + message, ctx);
    return EngineResult<ProgressionResult>::err(EngineError(code, message));
}

} // namespace

std::vector<Match> applyProgression(std::vector<Match> matches,
                                    const ProgressionResult& progression) {
    auto upsert = [&matches](const Match& update) {
        auto it = std::find_if(matches.begin(), matches.end(),
                               [&](const Match& match) { return match.id == update.id; });
        if (it == matches.end()) {
            matches.push_back(update);
        } else {
            *it = update;
        }
    };
    for (const auto& match : progression.affectedMatches) {
        upsert(match);
    }
    for (const auto& match : progression.newMatches) {
        upsert(match);
    }
    return matches;
}

FormatEngine FormatEngine::create(TournamentType type, const EngineConfig& config) {
    switch (type) {
        case TournamentType::SingleElimination:
            return FormatEngine(SingleEliminationFormat{}, config);
        case TournamentType::DoubleElimination:
            return FormatEngine(DoubleEliminationFormat{config.doubleElimination}, config);
        case TournamentType::Swiss:
            return FormatEngine(SwissFormat{config.swiss}, config);
        case TournamentType::RoundRobin:
            return FormatEngine(RoundRobinFormat{}, config);
        case TournamentType::Barrage:
            return FormatEngine(BarrageFormat{}, config);
        case TournamentType::Consolation:
            return FormatEngine(ConsolationFormat{}, config);
    }
    return FormatEngine(SingleEliminationFormat{}, config);
}

FormatEngine::FormatEngine(FormatVariant format, EngineConfig config)
    : format_(std::move(format)), config_(std::move(config)) {}

TournamentType FormatEngine::type() const {
    return std::visit([](const auto& f) { return std::decay_t<decltype(f)>::kType; }, format_);
}

std::string_view FormatEngine::name() const {
    return std::visit([](const auto& f) { return f.name(); }, format_);
}

FormatConstraints FormatEngine::constraints() const {
    return std::visit([](const auto& f) { return f.constraints(); }, format_);
}

ValidatorResult FormatEngine::validate(const Tournament& tournament,
                                       const std::vector<Team>& teams) const {
    return ConstraintValidator::validate(tournament, teams, constraints(), name());
}

EngineResult<BracketResult> FormatEngine::generate(const Tournament& tournament,
                                                   const std::vector<Team>& teams,
                                                   const GenerationOptions& options) const {
    LogContext ctx;
    ctx.tournamentId = tournament.id;
    ctx.extra["format"] = std::string(name());
    ctx.extra["teams"] = std::to_string(teams.size());

    auto validation = validate(tournament, teams);
    if (!validation.isValid) {
        EngineLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Validation,
                                                "Bracket generation blocked", ctx);
        auto message = "team set rejected for " + std::string(name()) + ": " +
                       validation.errors.front();
        return EngineResult<BracketResult>::err(
            EngineError(ErrorCode::ValidationFailed, std::move(message), std::move(validation)));
    }

    auto seeded = Seeder::seed(teams, options.seeding);
    if (!seeded) {
        return EngineResult<BracketResult>::err(seeded.error());
    }

    auto generated = std::visit(
        [&](const auto& f) { return f.generate(tournament, seeded.value()); }, format_);
    auto limits = constraints();
    auto layout = std::visit([](const auto& f) { return f.layout(); }, format_);

    BracketResult result;
    result.bracketStructure = BracketStructure::build(generated.matches, layout);
    result.metadata = BracketMetadata{
        .format = std::string(name()),
        .totalRounds = generated.totalRounds,
        .totalMatches = generated.totalMatches,
        .estimatedDurationMinutes =
            estimateDurationMinutes(config_.duration, tournament, generated.totalMatches),
        .minTeams = limits.minTeams,
        .maxTeams = limits.maxTeams.value_or(0),
        .supportsByes = limits.supportsByes,
        .supportsConsolation =
            std::visit([](const auto& f) { return f.supportsConsolation(); }, format_),
    };
    result.matches = std::move(generated.matches);
    result.seededTeams = std::move(seeded.value());
    result.byeTeams = std::move(generated.byeTeams);

    ctx.extra["matches"] = std::to_string(result.matches.size());
    ctx.extra["rounds"] = std::to_string(result.metadata.totalRounds);
    EngineLogger::instance().logWithContext(LogLevel::Info, LogCategory::Bracket,
                                            "Bracket generated", ctx);
    return EngineResult<BracketResult>::ok(std::move(result));
}

EngineResult<ProgressionResult> FormatEngine::advance(const Match& completedMatch,
                                                      const Tournament& tournament,
                                                      const std::vector<Match>& allMatches) const {
    const auto id = std::to_string(completedMatch.id.value());

    if (completedMatch.status != MatchStatus::Completed) {
        return rejected(completedMatch, tournament, ErrorCode::MatchNotCompleted,
                        "match " + id + " is " +
                            std::string(matchStatusName(completedMatch.status)) +
                            ", not completed");
    }

    auto position = std::find_if(allMatches.begin(), allMatches.end(), [&](const Match& match) {
        return match.id == completedMatch.id;
    });
    if (position == allMatches.end()) {
        return rejected(completedMatch, tournament, ErrorCode::MatchNotFound,
                        "match " + id + " is not part of this tournament");
    }

    bool owned = std::visit([&](const auto& f) { return f.owns(completedMatch); }, format_);
    if (!owned) {
        return rejected(completedMatch, tournament, ErrorCode::BracketError,
                        "match " + id + " belongs to the " +
                            std::string(branchName(completedMatch.branch)) +
                            " branch, which " + std::string(name()) + " does not manage");
    }

    const auto first = completedMatch.slot1.teamId();
    const auto second = completedMatch.slot2.teamId();
    const bool winnerPlayed = completedMatch.result &&
                              (first == completedMatch.result->winner ||
                               second == completedMatch.result->winner);
    if (!winnerPlayed) {
        return rejected(completedMatch, tournament, ErrorCode::InvalidMatchResult,
                        "match " + id + " has no winner among its participants");
    }

    // The stored copy is the last applied state.
    if (position->status == MatchStatus::Completed) {
        return rejected(completedMatch, tournament, ErrorCode::ReferenceAlreadyResolved,
                        "match " + id + " has already been advanced");
    }

    std::vector<Match> snapshot = allMatches;
    snapshot[static_cast<std::size_t>(position - allMatches.begin())] = completedMatch;

    auto progression = std::visit(
        [&](const auto& f) { return f.advance(completedMatch, tournament, snapshot); }, format_);
    if (!progression) {
        return rejected(completedMatch, tournament, progression.error().code(),
                        std::string(progression.error().message()));
    }

    auto& value = progression.value();
    if (value.isComplete) {
        auto merged = applyProgression(snapshot, value);
        value.finalRankings = computeStandings(tournament, merged).rankings;

        LogContext ctx;
        ctx.tournamentId = tournament.id;
        ctx.matchId = completedMatch.id;
        EngineLogger::instance().logWithContext(LogLevel::Info, LogCategory::Progression,
                                                "Tournament complete", ctx);
    }
    return progression;
}

bool FormatEngine::isComplete(const Tournament& tournament,
                              const std::vector<Match>& matches) const {
    auto mine = owned(matches);
    return std::visit([&](const auto& f) { return f.isComplete(tournament, mine); }, format_);
}

Standings FormatEngine::computeStandings(const Tournament& tournament,
                                         const std::vector<Match>& matches) const {
    auto mine = owned(matches);
    auto placements =
        std::visit([&](const auto& f) { return f.placements(tournament, mine); }, format_);
    auto complete =
        std::visit([&](const auto& f) { return f.isComplete(tournament, mine); }, format_);
    return StandingsResolver::compute(mine, placements, tieBreakChain(tournament), complete);
}

std::vector<TieBreakMethod> FormatEngine::tieBreakChain(const Tournament& tournament) const {
    if (!tournament.settings.tieBreakers.empty()) {
        return tournament.settings.tieBreakers;
    }
    if (auto it = config_.tieBreakers.find(type()); it != config_.tieBreakers.end()) {
        return it->second;
    }
    return std::visit([](const auto& f) { return f.defaultTieBreakers(); }, format_);
}

std::vector<Match> FormatEngine::owned(const std::vector<Match>& matches) const {
    std::vector<Match> out;
    std::visit(
        [&](const auto& f) {
            for (const auto& match : matches) {
                if (f.owns(match)) {
                    out.push_back(match);
                }
            }
        },
        format_);
    return out;
}

} // namespace tourney::tournament
