//
// Created by Malik T on 16/08/2025.
//
#include "Turn.hpp"

#include <utility>

#include "Exception.hpp"

namespace flip7::core::turn
{
    auto Score(TurnState const& ts) noexcept -> uint32_t
    {
        if (ts.status == TurnStatus::Busted) return 0;
        uint32_t score = ts.numbers.Sum() * (ts.multiplier ? 2u : 1u);
        score += ts.modifier_sum;
        if (ts.Flip7()) score += constants::Flip7Bonus;
        return score;
    }

    static auto Finish(TurnState& ts, TurnStatus const status, TurnEffect& effect) -> void
    {
        ts.status = status;
        effect.turn_over = true;
        effect.busted = (status == TurnStatus::Busted);
        effect.banked = Score(ts);
    }

    auto ApplyCard(TurnState& ts, Card const& card, Deck& deck, TurnEffect& effect) -> void
    {
        F7_ASSERT(ts.status == TurnStatus::Active, "Card applied to a finished turn");
        ts.held.push_back(card);
        effect.drawn.push_back(card);

        std::visit([&]<typename T0>(T0 const& c)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, NumberCard>)
            {
                if (ts.numbers.Contains(c.value))
                {
                    if (ts.second_chance)
                    {
                        ts.second_chance = false;
                        effect.second_chance_used = true;
                        return;
                    }
                    Finish(ts, TurnStatus::Busted, effect);
                    return;
                }
                ts.numbers.Insert(c.value);
                if (ts.Flip7())
                {
                    effect.flip7 = true;
                    Finish(ts, TurnStatus::Stayed, effect);
                }
            }
            else if constexpr (std::is_same_v<T, ModifierCard>)
            {
                ts.modifier_sum += c.value;
            }
            else if constexpr (std::is_same_v<T, MultiplierCard>)
            {
                ts.multiplier = true;
            }
            else if constexpr (std::is_same_v<T, ActionCard>)
            {
                switch (c.kind)
                {
                case ActionKind::Freeze:
                    Finish(ts, TurnStatus::Frozen, effect);
                    break;
                case ActionKind::FlipThree:
                    for (size_t i{}; i < constants::FlipThreeDraws && ts.status == TurnStatus::Active; ++i)
                    {
                        ApplyCard(ts, deck.Draw(), deck, effect);
                    }
                    break;
                case ActionKind::SecondChance:
                    // a second copy while one is held is simply discarded
                    ts.second_chance = true;
                    break;
                }
            }
        }, card);
    }

    auto Resolve(TurnState ts, Action const a, Deck& deck) -> TurnResult
    {
        if (ts.status != TurnStatus::Active)
            F7_THROW(error::Code::InvalidAction, "Action on a finished turn");

        TurnEffect effect{};
        if (a == Action::Stay)
        {
            Finish(ts, TurnStatus::Stayed, effect);
        }
        else
        {
            ApplyCard(ts, deck.Draw(), deck, effect);
        }
        return TurnResult{std::move(ts), std::move(effect)};
    }
}
