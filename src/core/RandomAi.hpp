//
// Created by Malik T on 18/08/2025.
//

#ifndef FLIP7_RANDOMAI_HPP
#define FLIP7_RANDOMAI_HPP

#include "Policy.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace flip7::core
{
    // Uniform over the legal actions
    class RandomPolicy final : public Policy
    {
    public:
        auto Decide(GameState const& state, Rng& rng) -> Action override;
    };

    // Stays once the line is worth at least threshold points, hits otherwise
    class ThresholdPolicy final : public Policy
    {
    public:
        explicit ThresholdPolicy(uint32_t threshold = DefaultThreshold);

        auto Decide(GameState const& state, Rng& rng) -> Action override;

        static constexpr uint32_t DefaultThreshold = 15;

    private:
        uint32_t threshold_;
    };
}

#endif //FLIP7_RANDOMAI_HPP
