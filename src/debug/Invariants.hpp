//
// Created by Malik T on 19/08/2025.
//

#ifndef FLIP7_INVARIANTS_HPP
#define FLIP7_INVARIANTS_HPP

#include "../core/Deck.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <vector>

namespace flip7::core::debug
{
    // A second layer of checks over a whole GameState; throws AssertionError on the first breach.
    inline auto CheckInvariants(GameState const& g) -> void
    {
#if F7_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Lines: no duplicate numbers, at most seven, every collected value was actually drawn
    for (TurnState const& line : s.lines)
    {
        F7_ASSERT(line.numbers.Size() <= constants::Flip7Count, "More than seven numbers in a line");
        util::CardCounts held{};
        util::CountCards(line.held, held);
        for (uint8_t const v : line.numbers.Values())
        {
            F7_ASSERT(held[v] >= 1, "Collected number was never drawn");
        }
        if (line.status == TurnStatus::Active)
        {
            F7_ASSERT(!line.Flip7(), "Seven numbers on a line that is still active");
        }
    }

    // 2) Only the acting seat can be holding cards
    for (size_t i{}; i < s.lines.size(); ++i)
    {
        if (i == s.current) continue;
        F7_ASSERT(s.lines[i].held.empty(), "Idle seat still holds cards");
        F7_ASSERT(s.lines[i].status == TurnStatus::Active, "Idle seat has a finished line");
    }

    // 3) Terminal games have a winner with a winning total, decided at a round boundary
    if (s.terminal)
    {
        F7_ASSERT(s.winner.has_value(), "Terminal game without a winner");
        F7_ASSERT(s.totals.at(*s.winner) >= constants::WinningScore, "Winner below winning score");
        F7_ASSERT(*s.winner == static_cast<PlyrIdxT>(std::ranges::max_element(s.totals) - s.totals.begin()),
                  "Winner does not hold the highest total");
        F7_ASSERT(s.current == 0, "Game ended away from a round boundary");
    }

    // 4) Deep: deck + discard + every line's held cards is exactly the full composition
    {
        util::CardCounts expected{};
        util::CountCards(Deck::Composition(), expected);

        util::CardCounts actual{};
        util::CountCards(s.deck, actual);
        util::CountCards(s.discard, actual);
        for (TurnState const& line : s.lines) util::CountCards(line.held, actual);

        F7_ASSERT(actual == expected, "Materialized cards != deck composition");
    }
#endif // F7_ENABLE_TEST_HOOKS == true
    }
}
#endif //FLIP7_INVARIANTS_HPP
