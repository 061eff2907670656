//
// Created by Malik T on 02/09/2025.
//

#ifndef FLIP7_SEARCHTREE_HPP
#define FLIP7_SEARCHTREE_HPP

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "../core/Actions.hpp"

namespace flip7::mcts
{
    using NodeIdx = uint32_t;
    inline constexpr NodeIdx NoNode = std::numeric_limits<NodeIdx>::max();

    struct Node
    {
        NodeIdx parent{NoNode};
        std::optional<core::Action> action{};   // edge taken from parent
        std::array<NodeIdx, core::AllActions.size()> children{NoNode, NoNode};
        std::vector<core::Action> untried;       // expanded front to back
        uint32_t visits{0};
        double total_reward{0.0};

        auto Mean() const noexcept -> double
        {
            return visits == 0 ? 0.0 : total_reward / visits;
        }
    };

    // Arena of nodes addressed by index. Every node but the root has exactly one parent,
    // and children are only ever appended, so the tree cannot form a cycle.
    class SearchTree
    {
    public:
        // Drops the previous tree and creates a root with the given untried actions
        auto Reset(std::vector<core::Action> root_untried) -> NodeIdx;

        static constexpr auto Root() noexcept -> NodeIdx { return 0; }
        auto At(NodeIdx idx) const -> Node const& { return nodes_.at(idx); }
        auto Size() const noexcept -> size_t { return nodes_.size(); }

        auto Child(NodeIdx idx, core::Action a) const -> NodeIdx;
        auto HasChildren(NodeIdx idx) const -> bool;

        // Removes and returns the first untried action of idx
        auto PopUntried(NodeIdx idx) -> core::Action;
        auto SetUntried(NodeIdx idx, std::vector<core::Action> untried) -> void;
        auto AddChild(NodeIdx parent, core::Action a, std::vector<core::Action> untried) -> NodeIdx;

        // Child of idx with the highest UCB1; unvisited children come first
        auto SelectUcb1(NodeIdx idx, double c) const -> NodeIdx;
        static auto Ucb1(Node const& child, uint32_t parent_visits, double c) noexcept -> double;

        // Adds one visit and reward to idx and every ancestor up to the root
        auto Backpropagate(NodeIdx idx, double reward) -> void;

    private:
        std::vector<Node> nodes_;
    };
}

#endif //FLIP7_SEARCHTREE_HPP
