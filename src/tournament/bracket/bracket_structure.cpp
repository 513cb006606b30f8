/// @file bracket_structure.cpp
/// @brief BracketStructure derivation from a match list.

#include "tourney/tournament/bracket_structure.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>

namespace tourney::tournament {

BracketStructure BracketStructure::build(const std::vector<Match>& matches,
                                         BracketLayout layout) {
    BracketStructure structure;
    structure.layout_ = layout;

    std::vector<const Match*> ordered;
    ordered.reserve(matches.size());
    for (const auto& match : matches) {
        ordered.push_back(&match);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Match* a, const Match* b) {
        return std::tie(a->branch, a->round, a->position) <
               std::tie(b->branch, b->round, b->position);
    });

    std::unordered_map<MatchId, std::size_t> index;
    for (const auto* match : ordered) {
        index[match->id] = structure.nodes_.size();
        structure.nodes_.push_back(BracketNode{match->id, match->branch, match->round,
                                               match->position, {}, std::nullopt, std::nullopt});
    }

    // Wire feeders and destinations from every slot that names a source match.
    for (const auto* match : ordered) {
        auto& node = structure.nodes_[index[match->id]];
        for (const Slot* slot : {&match->slot1, &match->slot2}) {
            auto feed = slot->feed();
            if (!feed) {
                continue;
            }
            auto source = index.find(feed->match);
            if (source == index.end()) {
                continue;
            }
            node.feeders.push_back(feed->match);
            auto& sourceNode = structure.nodes_[source->second];
            if (feed->kind == FeedKind::Winner) {
                sourceNode.winnerTo = match->id;
            } else {
                sourceNode.loserTo = match->id;
            }
        }
    }

    // Group into rounds.
    std::map<std::pair<BracketBranch, uint32_t>, BracketRound> rounds;
    std::map<BracketBranch, std::set<TeamId>> branchTeams;
    for (const auto* match : ordered) {
        auto key = std::make_pair(match->branch, match->round);
        auto& round = rounds[key];
        round.branch = match->branch;
        round.round = match->round;
        if (round.label.empty()) {
            round.label = match->roundName;
        }
        round.matches.push_back(match->id);

        for (const Slot* slot : {&match->slot1, &match->slot2}) {
            if (auto team = slot->teamId()) {
                branchTeams[match->branch].insert(*team);
            }
        }
        if (match->isBye()) {
            auto holder = match->slot1.isBye() ? match->slot2.teamId() : match->slot1.teamId();
            if (holder) {
                round.byeTeams.push_back(*holder);
            }
        }
    }

    if (layout == BracketLayout::Rounds) {
        for (auto& [key, round] : rounds) {
            std::set<TeamId> present;
            for (auto id : round.matches) {
                const auto* match = ordered[index[id]];
                for (const Slot* slot : {&match->slot1, &match->slot2}) {
                    if (auto team = slot->teamId()) {
                        present.insert(*team);
                    }
                }
            }
            for (auto team : branchTeams[key.first]) {
                if (present.count(team) == 0) {
                    round.byeTeams.push_back(team);
                }
            }
        }
    }

    for (auto& [key, round] : rounds) {
        structure.rounds_.push_back(std::move(round));
    }
    return structure;
}

const BracketNode* BracketStructure::findNode(MatchId match) const {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [match](const BracketNode& node) { return node.match == match; });
    return it == nodes_.end() ? nullptr : &*it;
}

std::vector<BracketRound> BracketStructure::roundsOf(BracketBranch branch) const {
    std::vector<BracketRound> out;
    for (const auto& round : rounds_) {
        if (round.branch == branch) {
            out.push_back(round);
        }
    }
    return out;
}

std::vector<MatchId> BracketStructure::terminalMatches() const {
    std::vector<MatchId> out;
    for (const auto& node : nodes_) {
        if (!node.winnerTo) {
            out.push_back(node.match);
        }
    }
    return out;
}

} // namespace tourney::tournament
