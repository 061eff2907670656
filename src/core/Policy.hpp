//
// Created by Malik T on 14/08/2025.
//

#ifndef FLIP7_POLICY_HPP
#define FLIP7_POLICY_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace flip7::core
{
    class Policy
    {
    public:
        virtual ~Policy() = default;

        // Called for the acting seat of state, by the match loop or by a search rollout.
        // Any randomness must come from rng so that runs replay from a seed.
        virtual auto Decide(GameState const& state, Rng& rng) -> Action = 0;
    };
}
#endif //FLIP7_POLICY_HPP
