#pragma once

/// @file format_engine.hpp
/// @brief Closed set of tournament formats behind one interface.

#include <string_view>
#include <variant>
#include <vector>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/tournament/engine_config.hpp"
#include "tourney/tournament/format_types.hpp"
#include "tourney/tournament/formats/barrage.hpp"
#include "tourney/tournament/formats/consolation.hpp"
#include "tourney/tournament/formats/double_elimination.hpp"
#include "tourney/tournament/formats/round_robin.hpp"
#include "tourney/tournament/formats/single_elimination.hpp"
#include "tourney/tournament/formats/swiss.hpp"

namespace tourney::tournament {

/// One alternative per TournamentType.
///
/// Every operation below is a std::visit over this variant, so a format
/// that lacks an operation fails to compile instead of falling through.
using FormatVariant = std::variant<SingleEliminationFormat,
                                   DoubleEliminationFormat,
                                   SwissFormat,
                                   RoundRobinFormat,
                                   BarrageFormat,
                                   ConsolationFormat>;

/// Merge an advance result into a match list: affected matches replace the
/// entries with the same id, new matches are appended.
std::vector<Match> applyProgression(std::vector<Match> matches,
                                    const ProgressionResult& progression);

/// Format-generic operations over a single format.
class FormatEngine {
public:
    /// The format for a tournament type, configured from `config`.
    static FormatEngine create(TournamentType type, const EngineConfig& config);

    FormatEngine(FormatVariant format, EngineConfig config);

    [[nodiscard]] TournamentType type() const;
    [[nodiscard]] std::string_view name() const;
    [[nodiscard]] FormatConstraints constraints() const;

    /// Validate the team set against the format and the tournament.
    [[nodiscard]] ValidatorResult validate(const Tournament& tournament,
                                           const std::vector<Team>& teams) const;

    /// Validate, seed and generate.
    /// @return ValidationFailed (with the ValidatorResult as context) or the bracket.
    [[nodiscard]] foundation::EngineResult<BracketResult> generate(
        const Tournament& tournament, const std::vector<Team>& teams,
        const GenerationOptions& options) const;

    /// Consume one completed match.
    ///
    /// Rejects a match that is not completed, not in allMatches, not owned
    /// by this format or whose winner is not one of its two teams. A match
    /// already completed in allMatches fails with ReferenceAlreadyResolved.
    /// On completion the result carries the final rankings.
    [[nodiscard]] foundation::EngineResult<ProgressionResult> advance(
        const Match& completedMatch, const Tournament& tournament,
        const std::vector<Match>& allMatches) const;

    [[nodiscard]] bool isComplete(const Tournament& tournament,
                                  const std::vector<Match>& matches) const;

    /// Standings over the matches this format owns.
    [[nodiscard]] Standings computeStandings(const Tournament& tournament,
                                             const std::vector<Match>& matches) const;

    /// Tournament override, else configured override, else format default.
    [[nodiscard]] std::vector<TieBreakMethod> tieBreakChain(const Tournament& tournament) const;

    [[nodiscard]] const FormatVariant& format() const noexcept { return format_; }

private:
    [[nodiscard]] std::vector<Match> owned(const std::vector<Match>& matches) const;

    FormatVariant format_;
    EngineConfig config_;
};

} // namespace tourney::tournament
