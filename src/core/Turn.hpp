//
// Created by Malik T on 16/08/2025.
//

#ifndef FLIP7_TURN_HPP
#define FLIP7_TURN_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "Deck.hpp"
#include "Util.hpp"

namespace flip7::core
{
    // One seat's line for the current turn
    struct TurnState
    {
        util::NumberSet numbers{};
        uint32_t modifier_sum{0};
        bool multiplier{false};
        bool second_chance{false};
        TurnStatus status{TurnStatus::Active};
        // every card drawn this turn; goes to the discard pile when the turn ends
        std::vector<Card> held;

        auto Flip7() const noexcept -> bool { return numbers.Size() == constants::Flip7Count; }
    };

    struct TurnResult
    {
        TurnState state;
        TurnEffect effect;
    };
}

namespace flip7::core::turn
{
    // Score of the line as if it were banked now. Busted lines score 0.
    auto Score(TurnState const& ts) noexcept -> uint32_t;

    // Resolves one drawn card against the line. Cards for FlipThree come from deck.
    auto ApplyCard(TurnState& ts, Card const& card, Deck& deck, TurnEffect& effect) -> void;

    // Hit draws from deck, Stay banks. Throws InvalidActionError once the turn is over
    // and EmptyDeckError if the deck runs dry mid-resolution.
    auto Resolve(TurnState ts, Action a, Deck& deck) -> TurnResult;
}

#endif //FLIP7_TURN_HPP
