#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

#include "tourney/tournament/seeded_random.hpp"
#include "tourney/tournament/seeder.hpp"
#include "tournament_test_support.hpp"

using namespace tourney::tournament;
using namespace tourney::tournament::test_support;
using tourney::foundation::ErrorCode;

namespace {

std::vector<uint64_t> idsOf(const std::vector<Team>& teams) {
    std::vector<uint64_t> ids;
    for (const auto& team : teams) {
        ids.push_back(team.id.value());
    }
    return ids;
}

std::vector<Team> seedWith(const std::vector<Team>& teams, SeedingOptions options) {
    auto result = Seeder::seed(teams, options);
    EXPECT_TRUE(result.hasValue());
    return result.hasValue() ? result.value() : std::vector<Team>{};
}

} // namespace

// ===========================================================================
// SeededRandom
// ===========================================================================

TEST(SeededRandomTest, ParkMillerSequence) {
    SeededRandom rng(1);
    rng.next();
    EXPECT_EQ(rng.state(), 16807u);
    rng.next();
    EXPECT_EQ(rng.state(), 282475249u);
    rng.next();
    EXPECT_EQ(rng.state(), 1622650073u);
    rng.next();
    EXPECT_EQ(rng.state(), 984943658u);
}

TEST(SeededRandomTest, ZeroSeedIsReplaced) {
    EXPECT_EQ(SeededRandom(0).state(), 1u);
    EXPECT_EQ(SeededRandom(SeededRandom::kModulus).state(), 1u);
}

TEST(SeededRandomTest, ValuesStayInUnitInterval) {
    SeededRandom rng(42);
    for (int i = 0; i < 1000; ++i) {
        auto value = rng.next();
        EXPECT_GE(value, 0.0);
        EXPECT_LT(value, 1.0);
    }
}

// ===========================================================================
// Strategies
// ===========================================================================

TEST(SeederTest, EmptyListIsRejected) {
    auto result = Seeder::seed({}, SeedingOptions{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::EmptyTeamList);
}

TEST(SeederTest, RankedOrdersByCompositeRanking) {
    std::vector<Team> teams{makeTeam(3), makeTeam(1), makeTeam(4), makeTeam(2)};
    auto seeded = seedWith(teams, SeedingOptions{});

    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{1, 2, 3, 4}));
    for (std::size_t i = 0; i < seeded.size(); ++i) {
        ASSERT_TRUE(seeded[i].seed.has_value());
        EXPECT_EQ(*seeded[i].seed, i + 1);
    }
}

TEST(SeederTest, RankedBreaksTiesByWinRateThenDifferential) {
    auto a = makeTeam(1);
    auto b = makeTeam(2);
    auto c = makeTeam(3);
    for (auto* team : {&a, &b, &c}) {
        team->members[0].ranking = 10;
    }
    a.members[0].winPercentage = 0.4;
    b.members[0].winPercentage = 0.6;
    c.members[0].winPercentage = 0.6;
    c.members[0].pointsDifferential = 25.0;

    auto seeded = seedWith({a, b, c}, SeedingOptions{});
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{3, 2, 1}));
}

TEST(SeederTest, UnrankedTeamsSortLast) {
    auto unranked = makeTeam(1);
    unranked.members[0].ranking.reset();
    auto seeded = seedWith({unranked, makeTeam(50)}, SeedingOptions{});
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{50, 1}));
}

TEST(SeederTest, RandomWithSeedIsReproducible) {
    auto teams = makeTeams(16);
    SeedingOptions options{SeedingMethod::Random, 42u, SkillDistribution::Snake};

    auto first = seedWith(teams, options);
    auto second = seedWith(teams, options);
    EXPECT_EQ(idsOf(first), idsOf(second));

    auto sorted = idsOf(first);
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(sorted, idsOf(teams));
}

TEST(SeederTest, RandomShuffleFollowsGenerator) {
    // Seed 1 draws j = 0 for i = 2, then j = 0 for i = 1.
    SeedingOptions options{SeedingMethod::Random, 1u, SkillDistribution::Snake};
    auto seeded = seedWith(makeTeams(3), options);
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{2, 3, 1}));
}

TEST(SeederTest, ClubBalancedInterleavesClubs) {
    std::vector<Team> teams{makeTeam(1, "Riverside"), makeTeam(2, "Riverside"),
                            makeTeam(3, "Riverside"), makeTeam(4, "Hilltop"),
                            makeTeam(5, "Hilltop"),   makeTeam(6)};
    auto seeded = seedWith(teams, SeedingOptions{SeedingMethod::ClubBalanced});
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{1, 4, 2, 5, 3, 6}));
}

TEST(SeederTest, GeographicInterleavesRegions) {
    std::vector<Team> teams{makeTeam(1, "", "North"), makeTeam(2, "", "North"),
                            makeTeam(3, "", "South"), makeTeam(4),
                            makeTeam(5, "", "South")};
    auto seeded = seedWith(teams, SeedingOptions{SeedingMethod::Geographic});
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{1, 3, 2, 5, 4}));
}

TEST(SeederTest, SkillBalancedSnake) {
    SeedingOptions options{SeedingMethod::SkillBalanced, std::nullopt, SkillDistribution::Snake};
    auto seeded = seedWith(makeTeams(8), options);
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{1, 4, 5, 8, 2, 3, 6, 7}));
}

TEST(SeederTest, SkillBalancedEven) {
    SeedingOptions options{SeedingMethod::SkillBalanced, std::nullopt, SkillDistribution::Even};
    auto seeded = seedWith(makeTeams(8), options);
    EXPECT_EQ(idsOf(seeded), (std::vector<uint64_t>{1, 3, 5, 7, 2, 4, 6, 8}));
}

TEST(SeederTest, SkillBalancedRandomKeepsTiers) {
    SeedingOptions options{SeedingMethod::SkillBalanced, 7u, SkillDistribution::Random};
    auto seeded = seedWith(makeTeams(8), options);
    ASSERT_EQ(seeded.size(), 8u);

    auto ids = idsOf(seeded);
    for (std::size_t tier = 0; tier < 4; ++tier) {
        std::set<uint64_t> members{ids[2 * tier], ids[2 * tier + 1]};
        EXPECT_EQ(members, (std::set<uint64_t>{2 * tier + 1, 2 * tier + 2}));
    }
}

TEST(SeederTest, EveryStrategyReturnsAPermutation) {
    auto teams = makeTeams(11);
    for (auto method : {SeedingMethod::Ranked, SeedingMethod::Random, SeedingMethod::ClubBalanced,
                        SeedingMethod::Geographic, SeedingMethod::SkillBalanced}) {
        auto seeded = seedWith(teams, SeedingOptions{method, 3u, SkillDistribution::Snake});
        auto ids = idsOf(seeded);
        std::sort(ids.begin(), ids.end());
        EXPECT_EQ(ids, idsOf(teams));
    }
}

// ===========================================================================
// Bye assignment
// ===========================================================================

TEST(SeederTest, AssignByesGivesTopSeedsTheByes) {
    auto teams = makeTeams(5);
    auto assignment = Seeder::assignByes(teams, 8);
    EXPECT_EQ(idsOf(assignment.byes), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(idsOf(assignment.playing), (std::vector<uint64_t>{4, 5}));
}

TEST(SeederTest, AssignByesWithFullBracket) {
    auto assignment = Seeder::assignByes(makeTeams(8), 8);
    EXPECT_TRUE(assignment.byes.empty());
    EXPECT_EQ(assignment.playing.size(), 8u);

    auto oversized = Seeder::assignByes(makeTeams(9), 8);
    EXPECT_TRUE(oversized.byes.empty());
}

// ===========================================================================
// Derived team values
// ===========================================================================

TEST(TeamValuesTest, CompositeRankingAveragesMembers) {
    Team team = makeTeam(1);
    team.members[0].ranking = 10;
    Member second;
    second.ranking = 30;
    team.members.push_back(second);
    EXPECT_DOUBLE_EQ(compositeRanking(team), 20.0);

    team.members[1].ranking.reset();
    EXPECT_DOUBLE_EQ(compositeRanking(team), (10.0 + kUnrankedValue) / 2.0);

    EXPECT_DOUBLE_EQ(compositeRanking(Team{}), kUnrankedValue);
}

TEST(TeamValuesTest, RegionFallsBackToClubKeyword) {
    EXPECT_EQ(teamRegion(makeTeam(1, "Northern Boules")), "North");
    EXPECT_EQ(teamRegion(makeTeam(2, "City Centre Club")), "Other");
    EXPECT_EQ(teamRegion(makeTeam(3, "", "Coast")), "Coast");
    EXPECT_EQ(teamRegion(makeTeam(4)), kUnknownRegion);
}
