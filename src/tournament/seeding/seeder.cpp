/// @file seeder.cpp
/// @brief Seeding strategies.

#include "tourney/tournament/seeder.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tourney/foundation/engine_logger.hpp"

namespace tourney::tournament {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::string_view methodName(SeedingMethod method) {
    switch (method) {
        case SeedingMethod::Ranked:        return "ranked";
        case SeedingMethod::Random:        return "random";
        case SeedingMethod::ClubBalanced:  return "club-balanced";
        case SeedingMethod::Geographic:    return "geographic";
        case SeedingMethod::SkillBalanced: return "skill-balanced";
    }
    return "unknown";
}

} // namespace

EngineResult<std::vector<Team>> Seeder::seed(const std::vector<Team>& teams,
                                             const SeedingOptions& options) {
    auto rng = options.randomSeed ? SeededRandom(*options.randomSeed)
                                  : SeededRandom::fromEntropy();
    return seed(teams, options, rng);
}

EngineResult<std::vector<Team>> Seeder::seed(const std::vector<Team>& teams,
                                             const SeedingOptions& options,
                                             SeededRandom& rng) {
    if (teams.empty()) {
        return EngineResult<std::vector<Team>>::err(
            EngineError(ErrorCode::EmptyTeamList, "cannot seed an empty team list"));
    }

    std::vector<Team> ordered;
    switch (options.method) {
        case SeedingMethod::Ranked:
            ordered = ranked(teams);
            break;
        case SeedingMethod::Random:
            ordered = teams;
            shuffle(ordered, rng);
            break;
        case SeedingMethod::ClubBalanced:
            ordered = groupBalanced(teams, false);
            break;
        case SeedingMethod::Geographic:
            ordered = groupBalanced(teams, true);
            break;
        case SeedingMethod::SkillBalanced:
            ordered = skillBalanced(teams, options.skillDistribution, rng);
            break;
    }

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        ordered[i].seed = static_cast<uint32_t>(i + 1);
    }

    TOURNEY_LOG_DEBUG(LogCategory::Seeding,
                      "Seeded " + std::to_string(ordered.size()) + " teams using " +
                          std::string(methodName(options.method)));
    return EngineResult<std::vector<Team>>::ok(std::move(ordered));
}

ByeAssignment Seeder::assignByes(const std::vector<Team>& orderedTeams,
                                 std::size_t targetBracketSize) {
    ByeAssignment assignment;
    std::size_t byeCount = targetBracketSize > orderedTeams.size()
                               ? targetBracketSize - orderedTeams.size()
                               : 0;
    byeCount = std::min(byeCount, orderedTeams.size());

    auto split = orderedTeams.begin() + static_cast<std::ptrdiff_t>(byeCount);
    assignment.byes.assign(orderedTeams.begin(), split);
    assignment.playing.assign(split, orderedTeams.end());
    return assignment;
}

std::vector<Team> Seeder::ranked(std::vector<Team> teams) {
    std::stable_sort(teams.begin(), teams.end(), [](const Team& a, const Team& b) {
        auto rankA = compositeRanking(a);
        auto rankB = compositeRanking(b);
        if (rankA != rankB) {
            return rankA < rankB;
        }
        auto winA = averageWinRate(a);
        auto winB = averageWinRate(b);
        if (winA != winB) {
            return winA > winB;
        }
        return averagePointsDifferential(a) > averagePointsDifferential(b);
    });
    return teams;
}

void Seeder::shuffle(std::vector<Team>& teams, SeededRandom& rng) {
    if (teams.size() < 2) {
        return;
    }
    for (std::size_t i = teams.size() - 1; i > 0; --i) {
        auto j = rng.nextIndex(i + 1);
        std::swap(teams[i], teams[j]);
    }
}

std::vector<Team> Seeder::groupBalanced(const std::vector<Team>& teams, bool byRegion) {
    // Groups keep first-appearance order so the interleave is deterministic.
    std::vector<std::pair<std::string, std::vector<Team>>> groups;
    std::vector<Team> ungrouped;

    for (const auto& team : teams) {
        auto key = byRegion ? teamRegion(team) : teamClub(team);
        if (key.empty() || (byRegion && key == kUnknownRegion)) {
            ungrouped.push_back(team);
            continue;
        }
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& group) { return group.first == key; });
        if (it == groups.end()) {
            groups.emplace_back(key, std::vector<Team>{team});
        } else {
            it->second.push_back(team);
        }
    }

    std::size_t longest = 0;
    for (auto& [key, members] : groups) {
        members = ranked(std::move(members));
        longest = std::max(longest, members.size());
    }

    std::vector<Team> ordered;
    ordered.reserve(teams.size());
    for (std::size_t pass = 0; pass < longest; ++pass) {
        for (const auto& [key, members] : groups) {
            if (pass < members.size()) {
                ordered.push_back(members[pass]);
            }
        }
    }
    for (auto& team : ranked(std::move(ungrouped))) {
        ordered.push_back(std::move(team));
    }
    return ordered;
}

std::vector<Team> Seeder::skillBalanced(const std::vector<Team>& teams,
                                        SkillDistribution distribution,
                                        SeededRandom& rng) {
    auto sorted = ranked(teams);
    const std::size_t width = (sorted.size() + 3) / 4;

    if (distribution == SkillDistribution::Random) {
        // Shuffle inside each tier; tiers keep their relative order.
        for (std::size_t start = 0; start < sorted.size(); start += width) {
            auto end = std::min(start + width, sorted.size());
            std::vector<Team> tier(sorted.begin() + static_cast<std::ptrdiff_t>(start),
                                   sorted.begin() + static_cast<std::ptrdiff_t>(end));
            shuffle(tier, rng);
            std::move(tier.begin(), tier.end(),
                      sorted.begin() + static_cast<std::ptrdiff_t>(start));
        }
        return sorted;
    }

    std::vector<std::vector<Team>> groups(width);
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        std::size_t group = i % width;
        if (distribution == SkillDistribution::Snake && (i / width) % 2 == 1) {
            group = width - 1 - group;
        }
        groups[group].push_back(sorted[i]);
    }

    std::vector<Team> ordered;
    ordered.reserve(sorted.size());
    for (auto& group : groups) {
        for (auto& team : group) {
            ordered.push_back(std::move(team));
        }
    }
    return ordered;
}

} // namespace tourney::tournament
