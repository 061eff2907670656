//
// Created by Malik T on 06/09/2025.
//
#include "Tuning.hpp"

#include <format>

#include "../core/Engine.hpp"
#include "../core/Exception.hpp"
#include "../core/StandardRules.hpp"
#include "Agent.hpp"

namespace flip7::mcts
{
    namespace
    {
        struct Sample
        {
            bool busted{false};
            double points{0.0};
        };

        // nullopt when the deck could not cover the opening action
        auto PlayLine(core::GameState const& real, core::Action const opening, double const flip7_weight,
                      core::Policy& rollout_policy, core::Rng& rng) -> std::optional<Sample>
        {
            core::StandardRules rules{};
            core::PlyrIdxT const actor = real.Current();
            core::GameState sim = Agent::Determinize(real, rng);

            Sample out{};
            bool flip7 = false;
            try
            {
                core::TurnEffect const first = rules.Apply(sim, opening, rng);
                out.busted = first.busted;
                flip7 = first.flip7;
            }
            catch (core::error::EmptyDeckError const&)
            {
                return std::nullopt;
            }

            while (sim.Turn().status == core::TurnStatus::Active)
            {
                core::Action a = rollout_policy.Decide(sim, rng);
                try
                {
                    core::TurnEffect const e = rules.Apply(sim, a, rng);
                    flip7 = flip7 || e.flip7;
                }
                catch (core::error::EmptyDeckError const&)
                {
                    (void)rules.Apply(sim, core::Action::Stay, rng);
                }
            }

            out.points = static_cast<double>(sim.Total(actor)) - static_cast<double>(real.Total(actor))
                         + (flip7 ? flip7_weight : 0.0);
            return out;
        }
    }

    auto CompareHitStay(core::GameState const& state,
                        int64_t const samples,
                        double const flip7_weight,
                        core::Policy& rollout_policy,
                        core::Rng& rng) -> HitStayStats
    {
        if (samples <= 0)
            F7_THROW(core::error::Code::Config, std::format("Sample count must be positive, got {}", samples));
        if (core::engine::LegalActions(state).empty())
            F7_THROW(core::error::Code::InvalidAction, "Acting seat has no turn to compare");

        HitStayStats stats{};
        int64_t hit_busts{}, stay_busts{};
        double hit_points{}, stay_points{};

        for (int64_t i{}; i < samples; ++i)
        {
            auto const hit = PlayLine(state, core::Action::Hit, flip7_weight, rollout_policy, rng);
            if (!hit) continue;
            auto const stay = PlayLine(state, core::Action::Stay, flip7_weight, rollout_policy, rng);
            if (!stay) continue;

            ++stats.samples;
            hit_busts += hit->busted ? 1 : 0;
            hit_points += hit->points;
            stay_busts += stay->busted ? 1 : 0;
            stay_points += stay->points;
        }
        if (stats.samples == 0)
            return stats;

        auto const n = static_cast<double>(stats.samples);
        stats.hit_bust_rate = static_cast<double>(hit_busts) / n;
        stats.stay_bust_rate = static_cast<double>(stay_busts) / n;
        stats.hit_avg_points = hit_points / n;
        stats.stay_avg_points = stay_points / n;
        return stats;
    }
}
