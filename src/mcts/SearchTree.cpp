//
// Created by Malik T on 02/09/2025.
//
#include "SearchTree.hpp"

#include <cmath>
#include <utility>

#include "../core/Exception.hpp"

namespace flip7::mcts
{
    using core::Action;

    auto SearchTree::Reset(std::vector<Action> root_untried) -> NodeIdx
    {
        nodes_.clear();
        nodes_.push_back(Node{.untried = std::move(root_untried)});
        return Root();
    }

    auto SearchTree::Child(NodeIdx const idx, Action const a) const -> NodeIdx
    {
        return nodes_.at(idx).children[static_cast<size_t>(a)];
    }

    auto SearchTree::HasChildren(NodeIdx const idx) const -> bool
    {
        for (NodeIdx const c : nodes_.at(idx).children)
        {
            if (c != NoNode) return true;
        }
        return false;
    }

    auto SearchTree::PopUntried(NodeIdx const idx) -> Action
    {
        std::vector<Action>& untried = nodes_.at(idx).untried;
        F7_ASSERT(!untried.empty(), "PopUntried on a fully expanded node");
        Action const a = untried.front();
        untried.erase(untried.begin());
        return a;
    }

    auto SearchTree::SetUntried(NodeIdx const idx, std::vector<Action> untried) -> void
    {
        nodes_.at(idx).untried = std::move(untried);
    }

    auto SearchTree::AddChild(NodeIdx const parent, Action const a, std::vector<Action> untried) -> NodeIdx
    {
        F7_ASSERT(Child(parent, a) == NoNode, "Action already expanded at this node");
        auto const idx = static_cast<NodeIdx>(nodes_.size());
        nodes_.push_back(Node{.parent = parent, .action = a, .untried = std::move(untried)});
        nodes_[parent].children[static_cast<size_t>(a)] = idx;
        return idx;
    }

    auto SearchTree::Ucb1(Node const& child, uint32_t const parent_visits, double const c) noexcept -> double
    {
        if (child.visits == 0) return std::numeric_limits<double>::infinity();
        double const explore = std::sqrt(std::log(static_cast<double>(parent_visits)) / child.visits);
        return child.Mean() + c * explore;
    }

    auto SearchTree::SelectUcb1(NodeIdx const idx, double const c) const -> NodeIdx
    {
        Node const& node = nodes_.at(idx);
        NodeIdx best = NoNode;
        double best_score = -std::numeric_limits<double>::infinity();
        for (NodeIdx const ci : node.children)
        {
            if (ci == NoNode) continue;
            double const score = Ucb1(nodes_[ci], node.visits, c);
            // strict compare keeps the first child in action order on ties
            if (best == NoNode || score > best_score)
            {
                best = ci;
                best_score = score;
            }
        }
        F7_ASSERT(best != NoNode, "UCB1 selection on a node without children");
        return best;
    }

    auto SearchTree::Backpropagate(NodeIdx idx, double const reward) -> void
    {
        while (idx != NoNode)
        {
            Node& n = nodes_.at(idx);
            ++n.visits;
            n.total_reward += reward;
            idx = n.parent;
        }
    }
}
