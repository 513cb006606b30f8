#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "tourney/tournament/elimination_bracket.hpp"
#include "tourney/tournament/tournament_engine.hpp"
#include "tournament_test_support.hpp"

using namespace tourney::tournament;
using namespace tourney::tournament::test_support;
using tourney::foundation::ErrorCode;

class SingleEliminationTest : public ::testing::Test {
protected:
    BracketResult generate(std::size_t teamCount) {
        auto result = engine_.generate(tournament_, makeTeams(teamCount));
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : BracketResult{};
    }

    TournamentEngine engine_;
    Tournament tournament_ = makeTournament(TournamentType::SingleElimination);
};

// ===========================================================================
// Bracket arithmetic
// ===========================================================================

TEST(EliminationBracketTest, StandardSeedOrder) {
    EXPECT_EQ(elimination::standardSeedOrder(2), (std::vector<uint32_t>{1, 2}));
    EXPECT_EQ(elimination::standardSeedOrder(4), (std::vector<uint32_t>{1, 4, 2, 3}));
    EXPECT_EQ(elimination::standardSeedOrder(8),
              (std::vector<uint32_t>{1, 8, 4, 5, 2, 7, 3, 6}));
}

TEST(EliminationBracketTest, SizesAndLabels) {
    EXPECT_EQ(elimination::bracketSize(1), 2u);
    EXPECT_EQ(elimination::bracketSize(5), 8u);
    EXPECT_EQ(elimination::bracketSize(16), 16u);
    EXPECT_EQ(elimination::roundCount(16), 4u);

    EXPECT_EQ(elimination::roundLabel(3, 3), "Final");
    EXPECT_EQ(elimination::roundLabel(2, 3), "Semifinal");
    EXPECT_EQ(elimination::roundLabel(1, 3), "Quarterfinal");
    EXPECT_EQ(elimination::roundLabel(1, 5), "Round of 32");
    EXPECT_EQ(elimination::roundLabel(1, 6), "Round 1");
}

// ===========================================================================
// Generation
// ===========================================================================

TEST_F(SingleEliminationTest, MatchAndRoundCounts) {
    for (std::size_t n = 2; n <= 20; ++n) {
        auto bracket = generate(n);
        EXPECT_EQ(bracket.matches.size(), n - 1) << n << " teams";
        EXPECT_EQ(bracket.metadata.totalMatches, n - 1);
        EXPECT_EQ(bracket.metadata.totalRounds,
                  elimination::roundCount(elimination::bracketSize(n)));
        EXPECT_EQ(bracket.bracketStructure.terminalMatches().size(), 1u);
    }
}

TEST_F(SingleEliminationTest, FirstRoundFollowsSeedOrder) {
    auto bracket = generate(8);
    std::vector<std::pair<uint64_t, uint64_t>> pairs;
    std::set<uint64_t> seen;
    for (const auto& match : bracket.matches) {
        if (match.round != 1) {
            continue;
        }
        pairs.emplace_back(match.slot1.teamId()->value(), match.slot2.teamId()->value());
        seen.insert(match.slot1.teamId()->value());
        seen.insert(match.slot2.teamId()->value());
        EXPECT_EQ(match.roundName, "Quarterfinal");
        EXPECT_EQ(match.status, MatchStatus::Scheduled);
    }
    EXPECT_EQ(pairs, (std::vector<std::pair<uint64_t, uint64_t>>{{1, 8}, {4, 5}, {2, 7}, {3, 6}}));
    EXPECT_EQ(seen.size(), 8u);
}

TEST_F(SingleEliminationTest, FiveTeamsCollapseByes) {
    auto bracket = generate(5);
    ASSERT_EQ(bracket.matches.size(), 4u);

    const auto* opener = findMatch(bracket.matches, 1);
    ASSERT_NE(opener, nullptr);
    EXPECT_EQ(opener->round, 1u);
    EXPECT_EQ(opener->slot1.teamId(), TeamId(4));
    EXPECT_EQ(opener->slot2.teamId(), TeamId(5));

    const auto* topSemi = findMatch(bracket.matches, 2);
    ASSERT_NE(topSemi, nullptr);
    EXPECT_EQ(topSemi->round, 2u);
    EXPECT_EQ(topSemi->roundName, "Semifinal");
    EXPECT_EQ(topSemi->slot1.teamId(), TeamId(1));
    ASSERT_TRUE(topSemi->slot2.pendingFeed().has_value());
    EXPECT_EQ(topSemi->slot2.pendingFeed()->match, MatchId(1));
    EXPECT_EQ(topSemi->status, MatchStatus::Pending);

    const auto* bottomSemi = findMatch(bracket.matches, 3);
    ASSERT_NE(bottomSemi, nullptr);
    EXPECT_EQ(bottomSemi->slot1.teamId(), TeamId(2));
    EXPECT_EQ(bottomSemi->slot2.teamId(), TeamId(3));
    EXPECT_EQ(bottomSemi->status, MatchStatus::Scheduled);

    const auto* final = findMatch(bracket.matches, 4);
    ASSERT_NE(final, nullptr);
    EXPECT_EQ(final->roundName, "Final");

    ASSERT_EQ(bracket.byeTeams.size(), 3u);
    EXPECT_EQ(bracket.byeTeams[0].id, TeamId(1));
    EXPECT_EQ(bracket.byeTeams[2].id, TeamId(3));
}

TEST_F(SingleEliminationTest, MetadataAndStructure) {
    auto bracket = generate(5);
    EXPECT_EQ(bracket.metadata.format, "Single Elimination");
    EXPECT_EQ(bracket.metadata.totalRounds, 3u);
    EXPECT_EQ(bracket.metadata.estimatedDurationMinutes, 4u * 45u);
    EXPECT_EQ(bracket.metadata.minTeams, 2u);
    EXPECT_EQ(bracket.metadata.maxTeams, 1024u);
    EXPECT_TRUE(bracket.metadata.supportsByes);
    EXPECT_TRUE(bracket.metadata.supportsConsolation);

    const auto* node = bracket.bracketStructure.findNode(MatchId(1));
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->winnerTo, MatchId(2));

    const auto* finalNode = bracket.bracketStructure.findNode(MatchId(4));
    ASSERT_NE(finalNode, nullptr);
    EXPECT_EQ(finalNode->feeders, (std::vector<MatchId>{MatchId(2), MatchId(3)}));
    EXPECT_FALSE(finalNode->winnerTo.has_value());
}

TEST_F(SingleEliminationTest, SeedsAreWrittenOnTeams) {
    auto bracket = generate(6);
    ASSERT_EQ(bracket.seededTeams.size(), 6u);
    for (std::size_t i = 0; i < bracket.seededTeams.size(); ++i) {
        ASSERT_TRUE(bracket.seededTeams[i].seed.has_value());
        EXPECT_EQ(*bracket.seededTeams[i].seed, i + 1);
    }
}

TEST_F(SingleEliminationTest, ValidationFailureCarriesReport) {
    auto result = engine_.generate(tournament_, makeTeams(1));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ValidationFailed);
    const auto* report = result.error().context<ValidatorResult>();
    ASSERT_NE(report, nullptr);
    EXPECT_FALSE(report->isValid);
    EXPECT_FALSE(report->errors.empty());
}

// ===========================================================================
// Progression
// ===========================================================================

TEST_F(SingleEliminationTest, AdvanceFillsWinnerSlot) {
    auto matches = generate(5).matches;
    auto step = play(engine_, tournament_, matches, *findMatch(matches, 1), TeamId(4));

    EXPECT_FALSE(step.isComplete);
    ASSERT_EQ(step.affectedMatches.size(), 2u);
    EXPECT_EQ(step.affectedMatches[0].id, MatchId(1));
    EXPECT_TRUE(step.newMatches.empty());

    const auto* semi = findMatch(matches, 2);
    EXPECT_EQ(semi->slot2.teamId(), TeamId(4));
    ASSERT_TRUE(semi->slot2.resolvedFrom.has_value());
    EXPECT_EQ(semi->slot2.resolvedFrom->match, MatchId(1));
    EXPECT_EQ(semi->status, MatchStatus::Scheduled);
}

TEST_F(SingleEliminationTest, AdvancingTwiceIsRejected) {
    auto matches = generate(5).matches;
    auto played = decided(*findMatch(matches, 1), TeamId(4));
    play(engine_, tournament_, matches, *findMatch(matches, 1), TeamId(4));

    auto again = engine_.advance(played, tournament_, matches);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::ReferenceAlreadyResolved);
}

TEST_F(SingleEliminationTest, FinalCannotBeAdvancedTwice) {
    for (std::size_t n = 2; n <= 8; ++n) {
        auto matches = generate(n).matches;
        auto last = playAll(engine_, tournament_, matches);
        ASSERT_TRUE(last.isComplete) << n << " teams";

        const auto* decider = findMatch(matches, n - 1);
        ASSERT_NE(decider, nullptr);
        ASSERT_EQ(decider->roundName, "Final");
        auto again = engine_.advance(*decider, tournament_, matches);
        ASSERT_TRUE(again.hasError()) << n << " teams";
        EXPECT_EQ(again.error().code(), ErrorCode::ReferenceAlreadyResolved);
    }
}

TEST_F(SingleEliminationTest, IncompleteMatchIsRejected) {
    auto matches = generate(5).matches;
    auto result = engine_.advance(*findMatch(matches, 3), tournament_, matches);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MatchNotCompleted);
}

TEST_F(SingleEliminationTest, UnknownMatchIsRejected) {
    auto matches = generate(5).matches;
    auto stray = decided(*findMatch(matches, 3), TeamId(2));
    stray.id = MatchId(99);
    auto result = engine_.advance(stray, tournament_, matches);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MatchNotFound);
}

TEST_F(SingleEliminationTest, WinnerMustBeAParticipant) {
    auto matches = generate(5).matches;

    auto outsider = decided(*findMatch(matches, 3), TeamId(2));
    outsider.result->winner = TeamId(5);
    auto result = engine_.advance(outsider, tournament_, matches);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMatchResult);

    // The final still waits for both semifinals.
    auto premature = *findMatch(matches, 4);
    premature.status = MatchStatus::Completed;
    premature.result = MatchResult{MatchScore{13, 0}, TeamId(1)};
    auto early = engine_.advance(premature, tournament_, matches);
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::InvalidMatchResult);
}

TEST_F(SingleEliminationTest, UnreferencedMatchIsRejected) {
    auto matches = generate(4).matches;
    ASSERT_EQ(matches.size(), 3u);
    matches.pop_back();  // drop the final

    auto result = engine_.advance(decided(*findMatch(matches, 2), TeamId(2)), tournament_,
                                  matches);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingBracketReference);
}

TEST_F(SingleEliminationTest, FullTournamentRanksByElimination) {
    auto matches = generate(8).matches;
    auto last = playAll(engine_, tournament_, matches);

    EXPECT_TRUE(last.isComplete);
    EXPECT_TRUE(engine_.isComplete(tournament_, matches));
    ASSERT_TRUE(last.finalRankings.has_value());
    ASSERT_EQ(last.finalRankings->size(), 8u);

    const auto& rows = *last.finalRankings;
    EXPECT_EQ(rows[0].team, TeamId(1));
    EXPECT_EQ(rows[0].status, StandingStatus::Champion);
    EXPECT_EQ(rows[1].team, TeamId(2));
    EXPECT_EQ(rows[1].rank, 2u);
    EXPECT_EQ(rows[1].status, StandingStatus::Eliminated);

    // Semifinal losers cannot be separated and share third place.
    EXPECT_EQ(rows[2].rank, 3u);
    EXPECT_EQ(rows[3].rank, 3u);
    EXPECT_EQ(rows[2].team, TeamId(3));
    EXPECT_EQ(rows[3].team, TeamId(4));
    for (std::size_t i = 4; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].rank, 5u);
    }
}

TEST_F(SingleEliminationTest, UpsetChampion) {
    auto matches = generate(4).matches;
    auto last = playAll(engine_, tournament_, matches, [](const Match& match) {
        return std::max(*match.slot1.teamId(), *match.slot2.teamId());
    });

    ASSERT_TRUE(last.isComplete);
    auto standings = engine_.computeStandings(tournament_, matches);
    EXPECT_EQ(standings.rankings.front().team, TeamId(4));
    EXPECT_EQ(standings.rankings.front().wins, 2u);
    EXPECT_EQ(standings.metadata.completedMatches, 3u);
    EXPECT_EQ(standings.metadata.pendingMatches, 0u);
}
