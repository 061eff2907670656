//
// Created by Malik T on 17/08/2025.
//

#ifndef FLIP7_ENGINE_HPP
#define FLIP7_ENGINE_HPP

#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"

// Value-in/value-out facade over StandardRules for callers that do not run a Match.
namespace flip7::core::engine
{
    // Fresh shuffled deck, zeroed scores, seat 0 to act. Throws ConfigError on a bad seat count.
    auto NewGame(std::vector<std::string> player_ids, Rng& rng) -> GameState;

    // {Hit, Stay} while the acting seat is live, empty otherwise
    auto LegalActions(GameState const& state) -> std::vector<Action>;

    // Commits one real action for the acting seat. Throws InvalidActionError if it is not legal.
    auto Apply(GameState const& state, Action a, Rng& rng) -> GameState;

    auto IsTerminal(GameState const& state) noexcept -> bool;
}

#endif //FLIP7_ENGINE_HPP
