#pragma once

/// @file seeder.hpp
/// @brief Team ordering strategies and bye assignment.

#include <cstddef>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/seeded_random.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// Split of a seeded list into bye holders and first-round players.
struct ByeAssignment {
    std::vector<Team> byes;
    std::vector<Team> playing;
};

/// Orders teams for bracket placement.
///
/// Every strategy returns a permutation of its input with Team::seed set to
/// 1..N in output order. Random strategies draw from a SeededRandom built
/// from SeedingOptions::randomSeed, or from entropy when no seed is given;
/// callers that need full control can pass their own generator.
class Seeder {
public:
    static foundation::EngineResult<std::vector<Team>> seed(
        const std::vector<Team>& teams, const SeedingOptions& options);

    static foundation::EngineResult<std::vector<Team>> seed(
        const std::vector<Team>& teams, const SeedingOptions& options,
        SeededRandom& rng);

    /// The first max(0, targetBracketSize - N) teams receive byes.
    static ByeAssignment assignByes(const std::vector<Team>& orderedTeams,
                                    std::size_t targetBracketSize);

    /// Stable ranking order: composite ranking, then win rate (desc), then
    /// points differential (desc).
    static std::vector<Team> ranked(std::vector<Team> teams);

    /// Fisher-Yates shuffle from the last index down.
    static void shuffle(std::vector<Team>& teams, SeededRandom& rng);

private:
    static std::vector<Team> groupBalanced(const std::vector<Team>& teams, bool byRegion);
    static std::vector<Team> skillBalanced(const std::vector<Team>& teams,
                                           SkillDistribution distribution,
                                           SeededRandom& rng);
};

} // namespace tourney::tournament
