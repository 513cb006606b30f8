#include <gtest/gtest.h>

#include <vector>

#include "tourney/foundation/config_manager.hpp"
#include "tourney/tournament/engine_config.hpp"
#include "tourney/tournament/tournament_types.hpp"

using namespace tourney::tournament;
using tourney::foundation::ConfigManager;
using tourney::foundation::ErrorCode;

namespace {

constexpr const char* kEngineYaml = R"(
engine:
  estimated_match_minutes: 30
  short_form_factor: 0.5
  swiss:
    max_rounds: 9
  double_elimination:
    bracket_reset: false
  tie_breakers:
    swiss: [buchholz, points-differential]
    Round-Robin: [points-against]
)";

EngineConfig buildFrom(const char* document) {
    ConfigManager config;
    auto loaded = config.loadFromString(document);
    EXPECT_TRUE(loaded.hasValue());
    auto built = buildEngineConfig(config);
    EXPECT_TRUE(built.hasValue()) << (built.hasError() ? built.error().message() : "");
    return built.hasValue() ? built.value() : EngineConfig{};
}

tourney::foundation::EngineResult<EngineConfig> tryBuild(const char* document) {
    ConfigManager config;
    auto loaded = config.loadFromString(document);
    EXPECT_TRUE(loaded.hasValue());
    return buildEngineConfig(config);
}

} // namespace

// ===========================================================================
// buildEngineConfig
// ===========================================================================

TEST(EngineConfigTest, EmptyDocumentKeepsDefaults) {
    ConfigManager config;
    auto built = buildEngineConfig(config);
    ASSERT_TRUE(built.hasValue());

    const auto& value = built.value();
    EXPECT_EQ(value.duration.matchMinutes, 45u);
    EXPECT_DOUBLE_EQ(value.duration.shortFormFactor, 0.7);
    EXPECT_DOUBLE_EQ(value.duration.selfReportFactor, 1.1);
    EXPECT_DOUBLE_EQ(value.duration.manualCourtFactor, 1.2);
    EXPECT_EQ(value.swiss.maxRounds, 15u);
    EXPECT_EQ(value.swiss.pairingSearchLimit, 100000u);
    EXPECT_TRUE(value.doubleElimination.bracketReset);
    EXPECT_TRUE(value.tieBreakers.empty());
}

TEST(EngineConfigTest, OverridesFromYaml) {
    auto config = buildFrom(kEngineYaml);
    EXPECT_EQ(config.duration.matchMinutes, 30u);
    EXPECT_DOUBLE_EQ(config.duration.shortFormFactor, 0.5);
    EXPECT_DOUBLE_EQ(config.duration.selfReportFactor, 1.1);
    EXPECT_EQ(config.swiss.maxRounds, 9u);
    EXPECT_FALSE(config.doubleElimination.bracketReset);

    ASSERT_EQ(config.tieBreakers.size(), 2u);
    EXPECT_EQ(config.tieBreakers.at(TournamentType::Swiss),
              (std::vector<TieBreakMethod>{TieBreakMethod::Buchholz,
                                           TieBreakMethod::PointsDifferential}));
    EXPECT_EQ(config.tieBreakers.at(TournamentType::RoundRobin),
              (std::vector<TieBreakMethod>{TieBreakMethod::PointsAgainst}));
}

TEST(EngineConfigTest, WrongValueType) {
    auto built = tryBuild("engine:\n  estimated_match_minutes: forever\n");
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(EngineConfigTest, UnknownFormat) {
    auto built = tryBuild("engine:\n  tie_breakers:\n    ladder: [buchholz]\n");
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(built.error().message(),
              "unknown tournament format in engine.tie_breakers.ladder: ladder");
}

TEST(EngineConfigTest, UnknownTieBreakMethod) {
    auto built = tryBuild("engine:\n  tie_breakers:\n    swiss: [buchholz, coin-toss]\n");
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(built.error().message(),
              "unknown tie-break method in engine.tie_breakers.swiss: coin-toss");
}

TEST(EngineConfigTest, TieBreakChainMustBeASequence) {
    auto built = tryBuild("engine:\n  tie_breakers:\n    swiss: buchholz\n");
    ASSERT_TRUE(built.hasError());
    EXPECT_EQ(built.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ===========================================================================
// Duration estimate
// ===========================================================================

TEST(DurationEstimateTest, BaseAndFactors) {
    DurationConfig config;
    Tournament tournament;
    EXPECT_EQ(estimateDurationMinutes(config, tournament, 10), 450u);
    EXPECT_EQ(estimateDurationMinutes(config, tournament, 0), 0u);

    tournament.shortForm = true;
    EXPECT_EQ(estimateDurationMinutes(config, tournament, 10), 315u);

    tournament.shortForm = false;
    tournament.settings.scoringMode = ScoringMode::SelfReport;
    tournament.settings.courtAssignment = CourtAssignmentMode::Manual;
    EXPECT_EQ(estimateDurationMinutes(config, tournament, 10), 594u);
}

TEST(DurationEstimateTest, ConfiguredMatchLength) {
    DurationConfig config;
    config.matchMinutes = 20;
    EXPECT_EQ(estimateDurationMinutes(config, Tournament{}, 7), 140u);
}

// ===========================================================================
// Name tables
// ===========================================================================

TEST(TournamentNamesTest, TypesRoundTripCaseInsensitively) {
    EXPECT_EQ(tournamentTypeName(TournamentType::DoubleElimination), "double-elimination");
    EXPECT_EQ(parseTournamentType("Double-Elimination"), TournamentType::DoubleElimination);
    EXPECT_EQ(parseTournamentType("swiss"), TournamentType::Swiss);
    EXPECT_FALSE(parseTournamentType("ladder").has_value());
}

TEST(TournamentNamesTest, TieBreakMethods) {
    EXPECT_EQ(tieBreakMethodName(TieBreakMethod::SonnebornBerger), "sonneborn-berger");
    EXPECT_EQ(parseTieBreakMethod("Strength-Of-Schedule"), TieBreakMethod::StrengthOfSchedule);
    EXPECT_FALSE(parseTieBreakMethod("coin-toss").has_value());
}

TEST(TournamentNamesTest, StatusAndBranch) {
    EXPECT_EQ(matchStatusName(MatchStatus::Pending), "pending");
    EXPECT_EQ(branchName(BracketBranch::GrandFinal), "grand-final");
}
