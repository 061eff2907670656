//
// Created by Malik T on 04/09/2025.
//

#ifndef FLIP7_MCTSPOLICY_HPP
#define FLIP7_MCTSPOLICY_HPP

#include <memory>
#include <string_view>

#include "../core/Policy.hpp"
#include "Agent.hpp"

namespace flip7::mcts
{
    // Seats the search in a match. Rollouts use the wrapped policy.
    class MctsPolicy final : public core::Policy
    {
    public:
        MctsPolicy(SearchConfig const& cfg, std::unique_ptr<core::Policy> rollout_policy);

        auto Decide(core::GameState const& state, core::Rng& rng) -> core::Action override;

        auto GetAgent() const noexcept -> Agent const& { return agent_; }

    private:
        Agent agent_;
        std::unique_ptr<core::Policy> rollout_;
    };

    // "random", "heuristic" or "mcts" (random rollouts). Throws ConfigError for anything else.
    auto MakePolicy(std::string_view name, SearchConfig const& cfg = {}) -> std::unique_ptr<core::Policy>;
}

#endif //FLIP7_MCTSPOLICY_HPP
