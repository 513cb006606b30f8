#pragma once

/// @file standings_resolver.hpp
/// @brief Rankings with a configurable tie-break chain.

#include <vector>

#include "tourney/tournament/format_types.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// Computes standings from scratch on every call.
///
/// Teams are ordered by format placement, then wins. Each group still tied
/// is split by the tie-break chain, left to right; head-to-head applies
/// only to a pair of teams that met. Teams the chain cannot separate share
/// a rank (1, 1, 3) and are listed by team id.
///
/// Once the tournament is complete every team at rank 1 is `Champion`,
/// ahead of any elimination flag, so a Swiss or round-robin stage the
/// chain cannot split ends with shared champions.
class StandingsResolver {
public:
    static Standings compute(const std::vector<Match>& matches,
                             const std::vector<TeamPlacement>& placements,
                             const std::vector<TieBreakMethod>& chain,
                             bool tournamentComplete);
};

} // namespace tourney::tournament
