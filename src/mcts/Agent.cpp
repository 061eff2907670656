//
// Created by Malik T on 02/09/2025.
//
#include "Agent.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

#include "../core/Engine.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"

namespace flip7::mcts
{
    using core::Action;
    using core::GameState;
    using core::TurnStatus;
    namespace error = core::error;

    static auto LineLive(GameState const& sim) -> bool
    {
        return sim.Turn().status == TurnStatus::Active;
    }

    Agent::Agent(SearchConfig const& cfg) :
        cfg_(cfg)
    {
        if (cfg_.simulation_budget <= 0)
            F7_THROW(error::Code::Config, std::format("Simulation budget must be positive, got {}",
                                                      cfg_.simulation_budget));
        if (!std::isfinite(cfg_.flip7_weight))
            F7_THROW(error::Code::Config, "Flip7 weight must be finite");
        if (!std::isfinite(cfg_.exploration) || cfg_.exploration < 0.0)
            F7_THROW(error::Code::Config, std::format("Exploration constant must be >= 0, got {}",
                                                      cfg_.exploration));
    }

    auto Agent::Determinize(GameState const& state, core::Rng& rng) -> GameState
    {
        core::util::CardCounts unseen{};
        core::util::CountCards(core::Deck::Composition(), unseen);

        core::util::CardCounts seen{};
        core::util::CountCards(state.Discard(), seen);
        for (core::SeatState const& s : state.seats_)
        {
            core::util::CountCards(s.turn.held, seen);
        }

        std::vector<core::Card> cards;
        cards.reserve(state.GetDeck().Remaining());
        for (size_t uid{}; uid < unseen.size(); ++uid)
        {
            F7_ASSERT(seen[uid] <= unseen[uid], "Observed more copies of a card than the deck holds");
            for (uint8_t k = seen[uid]; k < unseen[uid]; ++k)
            {
                cards.push_back(core::util::UIDToCard(uid));
            }
        }
        F7_ASSERT(cards.size() == state.GetDeck().Remaining(), "Unseen cards do not match the deck size");

        GameState sim = state;
        sim.deck_ = core::Deck{std::move(cards)}.Shuffled(rng);
        return sim;
    }

    auto Agent::Step(GameState& sim, Action const a, core::Rng& rng, bool& flip7) -> void
    {
        try
        {
            core::TurnEffect const effect = rules_.Apply(sim, a, rng);
            flip7 = flip7 || effect.flip7;
            return;
        }
        catch (error::EmptyDeckError const&)
        {
        }
        catch (error::InvalidActionError const&)
        {
        }
        // the line is unchanged by the failed resolution; bank it as it stands
        if (LineLive(sim))
        {
            (void)rules_.Apply(sim, Action::Stay, rng);
        }
    }

    auto Agent::Iterate(GameState const& real, core::Policy& rollout_policy, core::Rng& rng) -> void
    {
        core::PlyrIdxT const actor = real.Current();
        uint32_t const start_total = real.Total(actor);

        GameState sim = Determinize(real, rng);
        bool flip7 = false;

        // selection
        NodeIdx node = SearchTree::Root();
        while (tree_.At(node).untried.empty() && tree_.HasChildren(node) && LineLive(sim))
        {
            node = tree_.SelectUcb1(node, cfg_.exploration);
            Step(sim, *tree_.At(node).action, rng, flip7);
        }

        // a leaf first reached on a finished line may be live on this sample
        if (LineLive(sim) && tree_.At(node).untried.empty() && !tree_.HasChildren(node))
        {
            tree_.SetUntried(node, core::engine::LegalActions(sim));
        }

        // expansion
        if (LineLive(sim) && !tree_.At(node).untried.empty())
        {
            Action const a = tree_.PopUntried(node);
            Step(sim, a, rng, flip7);
            node = tree_.AddChild(node, a, core::engine::LegalActions(sim));
        }

        // rollout
        while (LineLive(sim))
        {
            Step(sim, rollout_policy.Decide(sim, rng), rng, flip7);
        }

        double const reward = static_cast<double>(sim.Total(actor)) - static_cast<double>(start_total)
                              + (flip7 ? cfg_.flip7_weight : 0.0);
        tree_.Backpropagate(node, reward);
    }

    auto Agent::BestRootAction() const -> Action
    {
        std::optional<Action> best{};
        Node const* best_node = nullptr;
        for (Action const a : core::AllActions)
        {
            NodeIdx const ci = tree_.Child(SearchTree::Root(), a);
            if (ci == NoNode) continue;
            Node const& n = tree_.At(ci);
            bool const better = !best_node
                                || n.visits > best_node->visits
                                || (n.visits == best_node->visits && n.Mean() > best_node->Mean());
            if (better)
            {
                best = a;
                best_node = &n;
            }
        }
        F7_ASSERT(best.has_value(), "Search finished without expanding the root");
        return *best;
    }

    auto Agent::Decide(GameState const& state, core::Policy& rollout_policy, core::Rng& rng) -> Action
    {
        std::vector<Action> legal = core::engine::LegalActions(state);
        if (legal.empty())
            F7_THROW(error::Code::InvalidAction, "No legal action to search from");

        tree_.Reset(std::move(legal));
        for (int64_t i{}; i < cfg_.simulation_budget; ++i)
        {
            Iterate(state, rollout_policy, rng);
        }
        return BestRootAction();
    }

    auto Decide(GameState const& state,
                int64_t const simulation_budget,
                double const flip7_weight,
                core::Policy& rollout_policy,
                core::Rng& rng) -> Action
    {
        Agent agent{SearchConfig{.simulation_budget = simulation_budget, .flip7_weight = flip7_weight}};
        return agent.Decide(state, rollout_policy, rng);
    }
}
