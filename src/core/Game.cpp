//
// Created by Malik T on 15/08/2025.
//
#include "Game.hpp"
#include <algorithm>
#include <ranges>

#include "Engine.hpp"
#include "Exception.hpp"
#include <format>
#include <print>
#include <utility>

namespace flip7::core
{
    static auto SeatNames(size_t const n) -> std::vector<std::string>
    {
        std::vector<std::string> names;
        names.reserve(n);
        for (size_t i{}; i < n; ++i)
        {
            names.push_back(std::format("P{}", i));
        }
        return names;
    }

    Match::Match(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Policy>> policies) :
        cfg_(config),
        rules_(std::move(rules)),
        policies_(std::move(policies)),
        rng_{cfg_.seed}
    {
        F7_ASSERT(rules_ != nullptr, "Null rules while initalising match");
        F7_ASSERT(!std::ranges::any_of(policies_,
                                       [](std::unique_ptr<Policy> const& p) { return !p; }), "Invalid policy in match");
        if (policies_.size() != cfg_.n_players)
            F7_THROW(error::Code::Config, std::format("Config asks for {} players but {} policies were seated",
                                                      cfg_.n_players, policies_.size()));
        state_ = engine::NewGame(SeatNames(policies_.size()), rng_);
    }

    auto Match::Step() -> MoveOutcome
    {
        if (state_.Terminal()) return MoveOutcome::GameEnded;

        PlyrIdxT const actor = state_.Current();
        Action const action = policies_[actor]->Decide(state_, rng_);
        last_action_ = action;

        if (auto const ok = rules_->Validate(state_, actor, action); !ok.has_value())
        {
            std::print("{}\n", error::describe(ok.error()));
            return MoveOutcome::Invalid;
        }
        last_effect_ = rules_->Apply(state_, action, rng_);
        return rules_->Advance(state_, last_effect_);
    }

    auto Match::PlayOut(size_t const max_steps) -> std::optional<PlyrIdxT>
    {
        for (size_t i{}; i < max_steps && !state_.Terminal(); ++i)
        {
            (void)Step();
        }
        return state_.Winner();
    }
}
