/// @file tournament_types.cpp
/// @brief Name tables and derived team values.

#include "tourney/tournament/tournament_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <utility>

namespace tourney::tournament {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::pair<TournamentType, std::string_view>, 6> kTypeNames = {{
    {TournamentType::SingleElimination, "single-elimination"},
    {TournamentType::DoubleElimination, "double-elimination"},
    {TournamentType::Swiss, "swiss"},
    {TournamentType::RoundRobin, "round-robin"},
    {TournamentType::Barrage, "barrage"},
    {TournamentType::Consolation, "consolation"},
}};

constexpr std::array<std::pair<TieBreakMethod, std::string_view>, 6> kTieBreakNames = {{
    {TieBreakMethod::HeadToHead, "head-to-head"},
    {TieBreakMethod::PointsDifferential, "points-differential"},
    {TieBreakMethod::PointsAgainst, "points-against"},
    {TieBreakMethod::Buchholz, "buchholz"},
    {TieBreakMethod::SonnebornBerger, "sonneborn-berger"},
    {TieBreakMethod::StrengthOfSchedule, "strength-of-schedule"},
}};

// Keyword table used when a region has to be inferred from a club name.
constexpr std::array<std::pair<std::string_view, std::string_view>, 10> kRegionKeywords = {{
    {"northern", "North"}, {"north", "North"},
    {"southern", "South"}, {"south", "South"},
    {"eastern", "East"},   {"east", "East"},
    {"western", "West"},   {"west", "West"},
    {"central", "Central"}, {"center", "Central"},
}};

} // namespace

std::string_view tournamentTypeName(TournamentType type) {
    for (const auto& [value, name] : kTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<TournamentType> parseTournamentType(std::string_view name) {
    auto key = lowercase(name);
    for (const auto& [value, text] : kTypeNames) {
        if (text == key) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view branchName(BracketBranch branch) {
    switch (branch) {
        case BracketBranch::Winner:      return "winner";
        case BracketBranch::Loser:       return "loser";
        case BracketBranch::GrandFinal:  return "grand-final";
        case BracketBranch::Consolation: return "consolation";
        case BracketBranch::Barrage:     return "barrage";
    }
    return "unknown";
}

std::string_view matchStatusName(MatchStatus status) {
    switch (status) {
        case MatchStatus::Pending:   return "pending";
        case MatchStatus::Scheduled: return "scheduled";
        case MatchStatus::Active:    return "active";
        case MatchStatus::Completed: return "completed";
        case MatchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view tieBreakMethodName(TieBreakMethod method) {
    for (const auto& [value, name] : kTieBreakNames) {
        if (value == method) {
            return name;
        }
    }
    return "unknown";
}

std::optional<TieBreakMethod> parseTieBreakMethod(std::string_view name) {
    auto key = lowercase(name);
    for (const auto& [value, text] : kTieBreakNames) {
        if (text == key) {
            return value;
        }
    }
    return std::nullopt;
}

// -- Derived team values ------------------------------------------------------

double compositeRanking(const Team& team) {
    if (team.members.empty()) {
        return kUnrankedValue;
    }
    double total = 0.0;
    for (const auto& member : team.members) {
        total += member.ranking ? static_cast<double>(*member.ranking) : kUnrankedValue;
    }
    return total / static_cast<double>(team.members.size());
}

double averageWinRate(const Team& team) {
    if (team.members.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& member : team.members) {
        total += member.winPercentage;
    }
    return total / static_cast<double>(team.members.size());
}

double averagePointsDifferential(const Team& team) {
    if (team.members.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& member : team.members) {
        total += member.pointsDifferential;
    }
    return total / static_cast<double>(team.members.size());
}

std::string teamClub(const Team& team) {
    if (!team.club.empty()) {
        return team.club;
    }

    // Most frequent member club; the first one seen wins a count tie.
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& member : team.members) {
        if (member.club.empty()) {
            continue;
        }
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& entry) { return entry.first == member.club; });
        if (it == counts.end()) {
            counts.emplace_back(member.club, 1);
        } else {
            ++it->second;
        }
    }

    std::string best;
    int bestCount = 0;
    for (const auto& [club, count] : counts) {
        if (count > bestCount) {
            best = club;
            bestCount = count;
        }
    }
    return best;
}

std::string teamRegion(const Team& team) {
    if (!team.region.empty()) {
        return team.region;
    }
    for (const auto& member : team.members) {
        if (!member.region.empty()) {
            return member.region;
        }
    }

    auto club = lowercase(teamClub(team));
    if (club.empty()) {
        return std::string(kUnknownRegion);
    }
    for (const auto& [keyword, region] : kRegionKeywords) {
        if (club.find(keyword) != std::string::npos) {
            return std::string(region);
        }
    }
    return "Other";
}

// -- Slot ---------------------------------------------------------------------

Slot Slot::team(TeamId id) {
    return Slot{TeamRef{id}, std::nullopt};
}

Slot Slot::winnerOf(MatchId id) {
    return Slot{WinnerOf{id}, std::nullopt};
}

Slot Slot::loserOf(MatchId id) {
    return Slot{LoserOf{id}, std::nullopt};
}

Slot Slot::bye() {
    return Slot{ByeSlot{}, std::nullopt};
}

std::optional<TeamId> Slot::teamId() const {
    if (const auto* ref = std::get_if<TeamRef>(&participant)) {
        return ref->team;
    }
    return std::nullopt;
}

bool Slot::isBye() const {
    return std::holds_alternative<ByeSlot>(participant);
}

bool Slot::isPending() const {
    return std::holds_alternative<WinnerOf>(participant) ||
           std::holds_alternative<LoserOf>(participant);
}

std::optional<Feed> Slot::pendingFeed() const {
    if (const auto* w = std::get_if<WinnerOf>(&participant)) {
        return Feed{w->match, FeedKind::Winner};
    }
    if (const auto* l = std::get_if<LoserOf>(&participant)) {
        return Feed{l->match, FeedKind::Loser};
    }
    return std::nullopt;
}

std::optional<Feed> Slot::feed() const {
    if (auto pending = pendingFeed()) {
        return pending;
    }
    return resolvedFrom;
}

// -- Match --------------------------------------------------------------------

bool Match::involves(TeamId team) const {
    return slot1.teamId() == team || slot2.teamId() == team;
}

std::optional<TeamId> Match::loser() const {
    if (!result) {
        return std::nullopt;
    }
    auto a = slot1.teamId();
    auto b = slot2.teamId();
    if (!a || !b) {
        return std::nullopt;
    }
    if (result->winner == *a) {
        return b;
    }
    if (result->winner == *b) {
        return a;
    }
    return std::nullopt;
}

} // namespace tourney::tournament
