/// @file tournament_engine.cpp
/// @brief TournamentEngine implementation.

#include "tourney/tournament/tournament_engine.hpp"

#include <utility>

#include "tourney/tournament/format_engine.hpp"

namespace tourney::tournament {

using foundation::EngineResult;

TournamentEngine::TournamentEngine(EngineConfig config)
    : config_(std::move(config)) {}

ValidatorResult TournamentEngine::validate(const Tournament& tournament,
                                           const std::vector<Team>& teams) const {
    return FormatEngine::create(tournament.type, config_).validate(tournament, teams);
}

EngineResult<BracketResult> TournamentEngine::generate(const Tournament& tournament,
                                                       const std::vector<Team>& teams,
                                                       const GenerationOptions& options) const {
    return FormatEngine::create(tournament.type, config_).generate(tournament, teams, options);
}

EngineResult<ProgressionResult> TournamentEngine::advance(
    const Match& completedMatch, const Tournament& tournament,
    const std::vector<Match>& allMatches) const {
    return FormatEngine::create(tournament.type, config_)
        .advance(completedMatch, tournament, allMatches);
}

Standings TournamentEngine::computeStandings(const Tournament& tournament,
                                             const std::vector<Match>& matches) const {
    return FormatEngine::create(tournament.type, config_).computeStandings(tournament, matches);
}

bool TournamentEngine::isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const {
    return FormatEngine::create(tournament.type, config_).isComplete(tournament, matches);
}

std::vector<Match> TournamentEngine::applyProgression(std::vector<Match> matches,
                                                      const ProgressionResult& progression) {
    return tournament::applyProgression(std::move(matches), progression);
}

} // namespace tourney::tournament
