//
// Created by Malik T on 15/08/2025.
//

#ifndef FLIP7_RULES_HPP
#define FLIP7_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace flip7::core
{
    //forward declaration
    class GameState;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& game, PlyrIdxT actor, Action a) const -> CheckResult = 0;

        // Resolves the action against the acting seat's line and banks the line when the turn ends.
        // A throw leaves the acting line as it was.
        virtual auto Apply(GameState& game, Action a, Rng& rng) -> TurnEffect = 0;

        // Turn and round boundaries: discard, rotate seats, decide the game.
        virtual auto Advance(GameState& game, TurnEffect const& effect) -> MoveOutcome = 0;
    };
}

#endif //FLIP7_RULES_HPP
