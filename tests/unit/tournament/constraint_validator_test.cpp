#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "tourney/tournament/constraint_validator.hpp"
#include "tourney/tournament/format_engine.hpp"
#include "tournament_test_support.hpp"

using namespace tourney::tournament;
using namespace tourney::tournament::test_support;

namespace {

bool contains(const std::vector<std::string>& messages, const std::string& text) {
    return std::find(messages.begin(), messages.end(), text) != messages.end();
}

ValidatorResult validateFor(TournamentType type, const std::vector<Team>& teams,
                            Tournament tournament) {
    tournament.type = type;
    return FormatEngine::create(type, EngineConfig{}).validate(tournament, teams);
}

ValidatorResult validateFor(TournamentType type, const std::vector<Team>& teams) {
    return validateFor(type, teams, makeTournament(type));
}

} // namespace

// ===========================================================================
// Team count bounds
// ===========================================================================

TEST(ConstraintValidatorTest, PowerOfTwoIsClean) {
    auto result = validateFor(TournamentType::SingleElimination, makeTeams(8));
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.suggestions.empty());
}

TEST(ConstraintValidatorTest, TooFewTeams) {
    auto result = validateFor(TournamentType::SingleElimination, makeTeams(1));
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "Single Elimination requires at least 2 teams, got 1"));
    // No balance advice for an illegal count.
    EXPECT_TRUE(result.suggestions.empty());
}

TEST(ConstraintValidatorTest, TooManyTeams) {
    auto result = validateFor(TournamentType::RoundRobin, makeTeams(21));
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "Round Robin supports at most 20 teams, got 21"));
}

TEST(ConstraintValidatorTest, DoubleEliminationNeedsFourTeams) {
    auto result = validateFor(TournamentType::DoubleElimination, makeTeams(3));
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "Double Elimination requires at least 4 teams, got 3"));
}

TEST(ConstraintValidatorTest, TournamentCapApplies) {
    auto tournament = makeTournament(TournamentType::Swiss);
    tournament.maxTeams = 8;
    auto result = validateFor(TournamentType::Swiss, makeTeams(10), tournament);
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "tournament is limited to 8 teams, got 10"));
}

// ===========================================================================
// Warnings and suggestions
// ===========================================================================

TEST(ConstraintValidatorTest, NonPreferredCountWarnsAndSuggests) {
    auto result = validateFor(TournamentType::SingleElimination, makeTeams(6));
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(contains(result.warnings, "6 teams is not optimal for Single Elimination"));
    EXPECT_TRUE(contains(result.suggestions, "Consider 4 teams for better bracket balance"));
}

TEST(ConstraintValidatorTest, NearestPreferredCount) {
    FormatConstraints constraints;
    constraints.preferredTeamCounts = {4, 8, 16, 32};
    EXPECT_EQ(ConstraintValidator::nearestPreferredCount(constraints, 5), 4u);
    EXPECT_EQ(ConstraintValidator::nearestPreferredCount(constraints, 7), 8u);
    EXPECT_EQ(ConstraintValidator::nearestPreferredCount(constraints, 12), 8u);
    EXPECT_EQ(ConstraintValidator::nearestPreferredCount(constraints, 100), 32u);

    FormatConstraints open;
    EXPECT_EQ(ConstraintValidator::nearestPreferredCount(open, 13), 13u);
}

TEST(ConstraintValidatorTest, OddCountWithoutOddSupport) {
    FormatConstraints withByes;
    withByes.supportsOddTeamCount = false;
    withByes.supportsByes = true;
    auto tournament = makeTournament(TournamentType::SingleElimination);

    auto warned = ConstraintValidator::validate(tournament, makeTeams(5), withByes, "Custom");
    EXPECT_TRUE(warned.isValid);
    EXPECT_TRUE(contains(warned.warnings, "Odd team count (5) will require bye assignments"));

    FormatConstraints withoutByes = withByes;
    withoutByes.supportsByes = false;
    auto rejected = ConstraintValidator::validate(tournament, makeTeams(5), withoutByes, "Custom");
    EXPECT_FALSE(rejected.isValid);
    EXPECT_TRUE(contains(rejected.errors, "Custom does not support odd team counts"));
}

// ===========================================================================
// Team set integrity
// ===========================================================================

TEST(ConstraintValidatorTest, DuplicateTeamIds) {
    auto teams = makeTeams(4);
    teams.push_back(makeTeam(2));
    auto result = validateFor(TournamentType::Swiss, teams);
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "Duplicate teams detected in tournament"));
}

TEST(ConstraintValidatorTest, DuplicateNamesOnlyWarn) {
    auto teams = makeTeams(4);
    teams[3].name = "  team 1 ";
    auto result = validateFor(TournamentType::SingleElimination, teams);
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(contains(result.warnings, "Duplicate team name:   team 1 "));
}

TEST(ConstraintValidatorTest, DoublesRequireTwoMembers) {
    auto tournament = makeTournament(TournamentType::SingleElimination);
    tournament.format = GameFormat::Doubles;

    auto teams = makeTeams(4);
    teams[0].members.push_back(Member{});
    auto result = validateFor(TournamentType::SingleElimination, teams, tournament);
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(contains(result.errors, "3 teams have incorrect player count for doubles format"));
}

TEST(ConstraintValidatorTest, OpenFormatIgnoresMemberCount) {
    auto teams = makeTeams(4);
    teams[0].members.clear();
    auto result = validateFor(TournamentType::SingleElimination, teams);
    EXPECT_TRUE(result.isValid);
}
