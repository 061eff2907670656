//
// Created by Malik T on 15/08/2025.
//
#include "Deck.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

#include "Exception.hpp"

namespace flip7::core
{
    Deck::Deck(std::vector<Card> cards) :
        cards_(std::move(cards))
    {
    }

    auto Deck::Composition() -> std::vector<Card>
    {
        std::vector<Card> cards;
        cards.reserve(constants::DeckSize);

        // 0 and 1 appear once, every other value n appears n times
        cards.emplace_back(NumberCard{0});
        for (uint8_t n = 1; n < constants::NumberValues; ++n)
        {
            for (uint8_t k{}; k < n; ++k)
            {
                cards.emplace_back(NumberCard{n});
            }
        }
        for (uint8_t m = constants::MinModifier; m <= constants::MaxModifier; ++m)
        {
            cards.emplace_back(ModifierCard{m});
        }
        cards.emplace_back(ActionCard{ActionKind::Freeze});
        cards.emplace_back(ActionCard{ActionKind::Freeze});
        cards.emplace_back(ActionCard{ActionKind::FlipThree});
        cards.emplace_back(ActionCard{ActionKind::FlipThree});
        cards.emplace_back(ActionCard{ActionKind::SecondChance});
        cards.emplace_back(MultiplierCard{});

        F7_ASSERT(cards.size() == constants::DeckSize, "Deck composition size mismatch");
        return cards;
    }

    auto Deck::NewDeck() -> Deck
    {
        return Deck{Composition()};
    }

    auto Deck::Shuffled(Rng& rng) const -> Deck
    {
        std::vector<Card> cards(cards_.begin() + static_cast<std::ptrdiff_t>(next_), cards_.end());
        std::ranges::shuffle(cards, rng);
        return Deck{std::move(cards)};
    }

    auto Deck::Draw() -> Card
    {
        if (Empty())
            F7_THROW(error::Code::EmptyDeck, "Drawing from empty deck");
        return cards_[next_++];
    }

    auto Deck::Append(std::span<Card const> cards) -> void
    {
        // drop the consumed prefix first so the buffer does not grow without bound
        cards_.erase(cards_.begin(), cards_.begin() + static_cast<std::ptrdiff_t>(next_));
        next_ = 0;
        cards_.insert(cards_.end(), cards.begin(), cards.end());
    }

    auto Deck::CountByUid() const -> util::CardCounts
    {
        util::CardCounts counts{};
        util::CountCards(Cards(), counts);
        return counts;
    }
}
