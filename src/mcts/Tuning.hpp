//
// Created by Malik T on 06/09/2025.
//

#ifndef FLIP7_TUNING_HPP
#define FLIP7_TUNING_HPP

#include <cstdint>

#include "../core/Policy.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace flip7::mcts
{
    struct HitStayStats
    {
        int64_t samples{0};
        double hit_bust_rate{0.0};
        double stay_bust_rate{0.0};
        double hit_avg_points{0.0};
        double stay_avg_points{0.0};
    };

    // Plays the acting seat's turn out from state twice per sample, once opening with Hit
    // and once with Stay, each on its own determinized deck. Points are the banked
    // marginal score plus flip7_weight when the line reached seven numbers.
    // A sample counts only if both openings could be played out; the rates and
    // averages are over HitStayStats::samples, which may fall short of samples.
    // Throws ConfigError for samples <= 0 and InvalidActionError if the seat cannot act.
    auto CompareHitStay(core::GameState const& state,
                        int64_t samples,
                        double flip7_weight,
                        core::Policy& rollout_policy,
                        core::Rng& rng) -> HitStayStats;
}

#endif //FLIP7_TUNING_HPP
