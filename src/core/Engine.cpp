//
// Created by Malik T on 17/08/2025.
//
#include "Engine.hpp"

#include <utility>

#include "Exception.hpp"
#include "StandardRules.hpp"

namespace flip7::core::engine
{
    auto NewGame(std::vector<std::string> player_ids, Rng& rng) -> GameState
    {
        return GameState{std::move(player_ids), Deck::NewDeck().Shuffled(rng)};
    }

    auto LegalActions(GameState const& state) -> std::vector<Action>
    {
        if (state.Terminal() || state.Turn().status != TurnStatus::Active)
            return {};
        return {AllActions.begin(), AllActions.end()};
    }

    auto Apply(GameState const& state, Action const a, Rng& rng) -> GameState
    {
        StandardRules rules{};
        if (auto const ok = rules.Validate(state, state.Current(), a); !ok.has_value())
        {
            F7_THROW(error::Code::InvalidAction, error::describe(ok.error()));
        }
        GameState next = state;
        TurnEffect const effect = rules.Apply(next, a, rng);
        (void)rules.Advance(next, effect);
        return next;
    }

    auto IsTerminal(GameState const& state) noexcept -> bool
    {
        return state.Terminal();
    }
}
