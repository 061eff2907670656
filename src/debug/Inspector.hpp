//
// Created by Malik T on 19/08/2025.
//

#ifndef FLIP7_INSPECTOR_HPP
#define FLIP7_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../core/Types.hpp"
#include "../core/State.hpp"

namespace flip7::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Card> deck;
            std::vector<Card> discard;
            std::vector<TurnState> lines;
            std::vector<uint32_t> totals;
            PlyrIdxT current{};
            uint32_t round{};
            bool terminal{};
            std::optional<PlyrIdxT> winner{};
        };

        static inline auto Gather(GameState const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.current = g.current_;
            ret.round = g.round_;
            ret.terminal = g.terminal_;
            ret.winner = g.winner_;

            auto const remaining = g.deck_.Cards();
            ret.deck.assign(remaining.begin(), remaining.end());
            ret.discard = g.discard_;

            ret.lines.reserve(g.seats_.size());
            ret.totals.reserve(g.seats_.size());
            for (SeatState const& s : g.seats_)
            {
                ret.lines.push_back(s.turn);
                ret.totals.push_back(s.total);
            }
            return ret;
        }

        // Test-only: replace the remaining deck with an exact card sequence
        static inline auto StackDeck(GameState& g, std::vector<Card> cards) -> void
        {
            g.deck_ = Deck{std::move(cards)};
        }

        static inline auto StackDiscard(GameState& g, std::vector<Card> cards) -> void
        {
            g.discard_ = std::move(cards);
        }

        static inline auto SetTotal(GameState& g, PlyrIdxT const seat, uint32_t const total) -> void
        {
            g.seats_.at(seat).total = total;
        }
    };
}

#endif //FLIP7_INSPECTOR_HPP
