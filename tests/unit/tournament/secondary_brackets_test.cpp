#include <gtest/gtest.h>

#include <vector>

#include "tourney/tournament/formats/barrage.hpp"
#include "tourney/tournament/formats/consolation.hpp"
#include "tourney/tournament/tournament_engine.hpp"
#include "tournament_test_support.hpp"

using namespace tourney::tournament;
using namespace tourney::tournament::test_support;

namespace {

Standings table(const std::vector<std::pair<uint64_t, uint32_t>>& rows) {
    Standings standings;
    for (const auto& [team, rank] : rows) {
        Standing row;
        row.team = TeamId(team);
        row.rank = rank;
        standings.rankings.push_back(row);
    }
    return standings;
}

std::vector<Team> teamsWithIds(const std::vector<uint64_t>& ids) {
    std::vector<Team> teams;
    for (auto id : ids) {
        teams.push_back(makeTeam(id));
    }
    return teams;
}

} // namespace

// ===========================================================================
// Barrage
// ===========================================================================

TEST(BarrageTest, BoundaryTeamsShareTheCutoffRank) {
    auto standings = table({{10, 1}, {11, 2}, {12, 2}, {13, 2}, {14, 5}});
    EXPECT_EQ(BarrageFormat::boundaryTeams(standings, 2),
              (std::vector<TeamId>{TeamId(11), TeamId(12), TeamId(13)}));
    EXPECT_EQ(BarrageFormat::boundaryTeams(standings, 3),
              (std::vector<TeamId>{TeamId(11), TeamId(12), TeamId(13)}));
}

TEST(BarrageTest, NoBarrageWithoutTieAtTheCutoff) {
    auto standings = table({{10, 1}, {11, 2}, {12, 2}, {13, 4}});
    EXPECT_TRUE(BarrageFormat::boundaryTeams(standings, 1).empty());
    EXPECT_TRUE(BarrageFormat::boundaryTeams(standings, 3).empty());
    EXPECT_TRUE(BarrageFormat::boundaryTeams(standings, 0).empty());
    EXPECT_TRUE(BarrageFormat::boundaryTeams(standings, 4).empty());
}

TEST(BarrageTest, PlayoffAmongTiedTeams) {
    TournamentEngine engine;
    auto tournament = makeTournament(TournamentType::Barrage);

    auto result = engine.generate(tournament, teamsWithIds({11, 12, 13}));
    ASSERT_TRUE(result.hasValue());
    const auto& bracket = result.value();

    EXPECT_EQ(bracket.metadata.format, "Barrage");
    EXPECT_EQ(bracket.metadata.minTeams, 2u);
    EXPECT_FALSE(bracket.metadata.supportsConsolation);
    EXPECT_EQ(bracket.metadata.totalRounds, 2u);

    ASSERT_EQ(bracket.matches.size(), 2u);
    for (const auto& match : bracket.matches) {
        EXPECT_EQ(match.branch, BracketBranch::Barrage);
    }
    EXPECT_EQ(bracket.matches[0].roundName, "Barrage Semifinal");
    EXPECT_EQ(bracket.matches[1].roundName, "Barrage Final");
    ASSERT_EQ(bracket.byeTeams.size(), 1u);
    EXPECT_EQ(bracket.byeTeams[0].id, TeamId(11));

    auto matches = bracket.matches;
    auto last = playAll(engine, tournament, matches);
    EXPECT_TRUE(last.isComplete);
    ASSERT_TRUE(last.finalRankings.has_value());
    EXPECT_EQ(last.finalRankings->front().team, TeamId(11));
}

TEST(BarrageTest, TwoTeamPlayoffIsASingleMatch) {
    TournamentEngine engine;
    auto tournament = makeTournament(TournamentType::Barrage);
    auto result = engine.generate(tournament, teamsWithIds({4, 9}));
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().matches.size(), 1u);
    EXPECT_EQ(result.value().matches[0].roundName, "Barrage Final");
}

// ===========================================================================
// Consolation
// ===========================================================================

TEST(ConsolationTest, EarlyEliminatedAreFirstMatchLosers) {
    TournamentEngine engine;
    auto main = makeTournament(TournamentType::SingleElimination);
    auto result = engine.generate(main, makeTeams(8));
    ASSERT_TRUE(result.hasValue());
    auto matches = result.value().matches;

    for (uint64_t id = 1; id <= 4; ++id) {
        const auto* match = findMatch(matches, id);
        play(engine, main, matches, *match, favourite(*match));
    }
    auto afterOpeners = ConsolationFormat::earlyEliminated(matches);
    EXPECT_EQ(afterOpeners, (std::vector<TeamId>{TeamId(8), TeamId(5), TeamId(7), TeamId(6)}));

    // Semifinal losers already won a match and do not qualify.
    playAll(engine, main, matches);
    EXPECT_EQ(ConsolationFormat::earlyEliminated(matches), afterOpeners);
}

TEST(ConsolationTest, BracketForEliminatedTeams) {
    TournamentEngine engine;
    auto tournament = makeTournament(TournamentType::Consolation);

    auto result = engine.generate(tournament, teamsWithIds({8, 5, 7, 6}));
    ASSERT_TRUE(result.hasValue());
    const auto& bracket = result.value();
    EXPECT_EQ(bracket.metadata.format, "Consolation");
    ASSERT_EQ(bracket.matches.size(), 3u);

    const auto& opener = bracket.matches[0];
    EXPECT_EQ(opener.branch, BracketBranch::Consolation);
    EXPECT_EQ(opener.roundName, "Consolation Semifinal");
    EXPECT_EQ(opener.slot1.teamId(), TeamId(5));
    EXPECT_EQ(opener.slot2.teamId(), TeamId(8));
    EXPECT_EQ(bracket.matches[2].roundName, "Consolation Final");

    auto matches = bracket.matches;
    auto last = playAll(engine, tournament, matches);
    EXPECT_TRUE(last.isComplete);
    EXPECT_EQ(last.finalRankings->front().team, TeamId(5));
}

TEST(ConsolationTest, ForeignBranchMatchesAreIgnored) {
    TournamentEngine engine;
    auto tournament = makeTournament(TournamentType::Consolation);
    auto result = engine.generate(tournament, teamsWithIds({5, 6, 7, 8}));
    ASSERT_TRUE(result.hasValue());
    auto matches = result.value().matches;

    Match foreign;
    foreign.id = MatchId(50);
    foreign.branch = BracketBranch::Winner;
    foreign.slot1 = Slot::team(TeamId(1));
    foreign.slot2 = Slot::team(TeamId(2));
    matches.push_back(foreign);

    auto standings = engine.computeStandings(tournament, matches);
    EXPECT_EQ(standings.rankings.size(), 4u);
    EXPECT_EQ(standings.find(TeamId(1)), nullptr);

    auto rejected = engine.advance(decided(foreign, TeamId(1)), tournament, matches);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), tourney::foundation::ErrorCode::BracketError);
}
