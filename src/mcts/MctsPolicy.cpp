//
// Created by Malik T on 04/09/2025.
//
#include "MctsPolicy.hpp"

#include <format>
#include <utility>

#include "../core/Engine.hpp"
#include "../core/Exception.hpp"
#include "../core/RandomAi.hpp"

namespace flip7::mcts
{
    MctsPolicy::MctsPolicy(SearchConfig const& cfg, std::unique_ptr<core::Policy> rollout_policy) :
        agent_(cfg),
        rollout_(std::move(rollout_policy))
    {
        if (!rollout_)
            F7_THROW(core::error::Code::Config, "MCTS policy needs a rollout policy");
    }

    auto MctsPolicy::Decide(core::GameState const& state, core::Rng& rng) -> core::Action
    {
        if (core::engine::LegalActions(state).empty()) return core::Action::Stay;
        return agent_.Decide(state, *rollout_, rng);
    }

    auto MakePolicy(std::string_view const name, SearchConfig const& cfg) -> std::unique_ptr<core::Policy>
    {
        if (name == "random") return std::make_unique<core::RandomPolicy>();
        if (name == "heuristic") return std::make_unique<core::ThresholdPolicy>();
        if (name == "mcts") return std::make_unique<MctsPolicy>(cfg, std::make_unique<core::RandomPolicy>());
        F7_THROW(core::error::Code::Config, std::format("Unknown policy '{}'", name));
    }
}
