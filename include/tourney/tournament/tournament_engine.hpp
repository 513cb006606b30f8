#pragma once

/// @file tournament_engine.hpp
/// @brief Entry point of the tournament engine.
///
/// The engine is stateless between calls: every operation takes the
/// tournament, its teams or its matches as an immutable snapshot and
/// returns a value. Serializing writes per tournament is the caller's job.
///
/// Example:
/// @code
///   TournamentEngine engine(buildEngineConfig(config).value());
///   auto bracket = engine.generate(tournament, teams);
///   // ... persist bracket.value().matches, play a match ...
///   auto step = engine.advance(played, tournament, matches);
///   matches = TournamentEngine::applyProgression(std::move(matches), step.value());
///   auto table = engine.computeStandings(tournament, matches);
/// @endcode

#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/engine_config.hpp"
#include "tourney/tournament/format_types.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

class TournamentEngine {
public:
    TournamentEngine() = default;
    explicit TournamentEngine(EngineConfig config);

    /// Check a team set against the tournament's format.
    [[nodiscard]] ValidatorResult validate(const Tournament& tournament,
                                           const std::vector<Team>& teams) const;

    /// Validate, seed and build the initial matches.
    [[nodiscard]] foundation::EngineResult<BracketResult> generate(
        const Tournament& tournament, const std::vector<Team>& teams,
        const GenerationOptions& options = {}) const;

    /// Consume one completed match and report what changed.
    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completedMatch, const Tournament& tournament,
        const std::vector<Match>& allMatches) const;

    /// Recompute standings from the full match list.
    [[nodiscard]] Standings computeStandings(const Tournament& tournament,
                                             const std::vector<Match>& matches) const;

    [[nodiscard]] bool isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const;

    /// Fold an advance result into the stored match list.
    static std::vector<Match> applyProgression(std::vector<Match> matches,
                                               const ProgressionResult& progression);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

} // namespace tourney::tournament
