#pragma once

/// @file constraint_validator.hpp
/// @brief Legality checks for a team set against a format.

#include <string_view>
#include <vector>

#include "tourney/tournament/format_types.hpp"
#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// Runs before generation.
///
/// Errors make the team set unusable for the format; warnings and
/// suggestions describe a legal but sub-optimal set.
class ConstraintValidator {
public:
    static ValidatorResult validate(const Tournament& tournament,
                                    const std::vector<Team>& teams,
                                    const FormatConstraints& constraints,
                                    std::string_view formatName);

    /// Preferred count closest to teamCount (the smaller one on a tie), or
    /// teamCount itself when the format has no preference.
    static uint32_t nearestPreferredCount(const FormatConstraints& constraints,
                                          uint32_t teamCount);
};

} // namespace tourney::tournament
