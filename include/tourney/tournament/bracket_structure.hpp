#pragma once

/// @file bracket_structure.hpp
/// @brief Advancement relationships between matches.
///
/// Elimination formats expose a tree: every node knows the matches feeding
/// it and where its winner and loser go. Swiss and round-robin expose a flat
/// round list. Both views are derived from the match list alone, so the
/// structure is rebuilt after every generate and advance instead of being
/// patched.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tourney/tournament/tournament_types.hpp"

namespace tourney::tournament {

/// One match placed in the bracket.
struct BracketNode {
    MatchId match;
    BracketBranch branch = BracketBranch::Winner;
    uint32_t round = 1;
    uint32_t position = 1;
    std::vector<MatchId> feeders;     ///< Matches whose outcome fills this one.
    std::optional<MatchId> winnerTo;  ///< Match the winner advances to.
    std::optional<MatchId> loserTo;   ///< Match the loser drops to.
};

/// All matches of one round of one branch.
struct BracketRound {
    BracketBranch branch = BracketBranch::Winner;
    uint32_t round = 1;
    std::string label;
    std::vector<MatchId> matches;
    std::vector<TeamId> byeTeams;  ///< Teams that sit this round out.
};

enum class BracketLayout : uint8_t { Tree, Rounds };

class BracketStructure {
public:
    BracketStructure() = default;

    /// Derive the structure from a match list.
    ///
    /// In the Rounds layout a round's bye teams are the branch participants
    /// absent from that round plus teams placed against an explicit bye.
    static BracketStructure build(const std::vector<Match>& matches, BracketLayout layout);

    [[nodiscard]] BracketLayout layout() const noexcept { return layout_; }
    [[nodiscard]] const std::vector<BracketNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] const std::vector<BracketRound>& rounds() const noexcept { return rounds_; }

    [[nodiscard]] const BracketNode* findNode(MatchId match) const;

    /// Rounds of one branch, in round order.
    [[nodiscard]] std::vector<BracketRound> roundsOf(BracketBranch branch) const;

    /// Nodes whose winner does not advance anywhere (finals).
    [[nodiscard]] std::vector<MatchId> terminalMatches() const;

private:
    BracketLayout layout_ = BracketLayout::Tree;
    std::vector<BracketNode> nodes_;
    std::vector<BracketRound> rounds_;
};

} // namespace tourney::tournament
