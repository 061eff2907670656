//
// Created by Malik T on 18/08/2025.
//

#include "RandomAi.hpp"
#include <random>
#include <utility>

#include "Engine.hpp"

namespace flip7::core
{
    auto RandomPolicy::Decide(GameState const& state, Rng& rng) -> Action
    {
        std::vector<Action> const legal = engine::LegalActions(state);
        if (legal.empty()) return Action::Stay;
        return legal[std::uniform_int_distribution<size_t>{0, legal.size() - 1}(rng)];
    }

    ThresholdPolicy::ThresholdPolicy(uint32_t const threshold):
        threshold_(threshold) {}

    auto ThresholdPolicy::Decide(GameState const& state, Rng& rng) -> Action
    {
        (void)rng;
        return state.LineScore() >= threshold_ ? Action::Stay : Action::Hit;
    }
}
