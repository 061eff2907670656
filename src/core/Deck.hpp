//
// Created by Malik T on 15/08/2025.
//

#ifndef FLIP7_DECK_HPP
#define FLIP7_DECK_HPP

#include <span>
#include <vector>
#include "Types.hpp"
#include "Util.hpp"

namespace flip7::core
{
    // Ordered cards consumed from the front. Copies are independent.
    class Deck
    {
    public:
        Deck() = default;
        explicit Deck(std::vector<Card> cards);

        // Fixed 94-card composition in a deterministic order
        static auto NewDeck() -> Deck;
        static auto Composition() -> std::vector<Card>;

        [[nodiscard]]
        auto Shuffled(Rng& rng) const -> Deck;

        // Throws EmptyDeckError when nothing remains.
        auto Draw() -> Card;

        // Adds cards to the back (used when the discard pile is recycled)
        auto Append(std::span<Card const> cards) -> void;

        auto Remaining() const noexcept -> size_t { return cards_.size() - next_; }
        auto Empty() const noexcept -> bool { return Remaining() == 0; }
        auto Cards() const noexcept -> std::span<Card const>
        {
            return std::span<Card const>{cards_}.subspan(next_);
        }
        auto CountByUid() const -> util::CardCounts;

    private:
        std::vector<Card> cards_;
        size_t next_{0};
    };
}

#endif //FLIP7_DECK_HPP
