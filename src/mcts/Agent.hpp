//
// Created by Malik T on 02/09/2025.
//

#ifndef FLIP7_AGENT_HPP
#define FLIP7_AGENT_HPP

#include <cstdint>

#include "../core/Actions.hpp"
#include "../core/Policy.hpp"
#include "../core/State.hpp"
#include "../core/StandardRules.hpp"
#include "../core/Types.hpp"
#include "SearchTree.hpp"

namespace flip7::mcts
{
    struct SearchConfig
    {
        int64_t simulation_budget{1000};
        // added to the reward of any simulated turn that reaches seven numbers; may be negative
        double flip7_weight{50.0};
        double exploration{1.4};
    };

    // Determinized UCT over the acting seat's current turn.
    // Each iteration samples a deck order consistent with what the seat has seen,
    // walks the tree, rolls the turn out and backs the marginal score up.
    class Agent
    {
    public:
        // Throws ConfigError for a non-positive budget or non-finite parameters.
        explicit Agent(SearchConfig const& cfg);

        // Throws InvalidActionError if the acting seat has nothing legal to do.
        auto Decide(core::GameState const& state, core::Policy& rollout_policy, core::Rng& rng) -> core::Action;

        // Copy of state whose deck is a fresh shuffle of every card the acting seat has not seen
        static auto Determinize(core::GameState const& state, core::Rng& rng) -> core::GameState;

        auto Tree() const noexcept -> SearchTree const& { return tree_; }
        auto Config() const noexcept -> SearchConfig const& { return cfg_; }

    private:
        auto Iterate(core::GameState const& real, core::Policy& rollout_policy, core::Rng& rng) -> void;
        // Applies a to the simulated line; a failed draw banks what is already there
        auto Step(core::GameState& sim, core::Action a, core::Rng& rng, bool& flip7) -> void;
        auto BestRootAction() const -> core::Action;

    private:
        SearchConfig cfg_;
        SearchTree tree_;
        core::StandardRules rules_;
    };

    auto Decide(core::GameState const& state,
                int64_t simulation_budget,
                double flip7_weight,
                core::Policy& rollout_policy,
                core::Rng& rng) -> core::Action;
}

#endif //FLIP7_AGENT_HPP
