//
// Created by Malik T on 14/08/2025.
//

#ifndef FLIP7_STATE_HPP
#define FLIP7_STATE_HPP

#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Deck.hpp"
#include "Turn.hpp"

namespace flip7::core::debug {struct Inspector;}
namespace flip7::mcts {class Agent;}
namespace flip7::core
{
    struct SeatState
    {
        std::string name;
        TurnState turn{};
        uint32_t total{0};
    };

    // Whole-game state. Value type: copying it is how hypothetical futures branch off.
    class GameState
    {
    public:
        GameState() = default;
        GameState(std::vector<std::string> player_ids, Deck deck);

        auto Current() const noexcept -> PlyrIdxT { return current_; }
        auto PlayerCount() const noexcept -> size_t { return seats_.size(); }
        auto Seat(PlyrIdxT const seat) const -> SeatState const& { return seats_.at(seat); }
        auto Turn() const -> TurnState const& { return seats_.at(current_).turn; }
        auto Total(PlyrIdxT const seat) const -> uint32_t { return seats_.at(seat).total; }
        auto Round() const noexcept -> uint32_t { return round_; }
        auto GetDeck() const noexcept -> Deck const& { return deck_; }
        auto Discard() const noexcept -> std::vector<Card> const& { return discard_; }
        auto Terminal() const noexcept -> bool { return terminal_; }
        auto Winner() const noexcept -> std::optional<PlyrIdxT> { return winner_; }

        // Score the acting seat would bank by staying now
        auto LineScore() const -> uint32_t;

        //allows class to directly access private data on an instance
        friend class StandardRules;
        friend class flip7::mcts::Agent;
        friend struct debug::Inspector;

    private:
        auto TurnMut() -> TurnState& { return seats_.at(current_).turn; }
        auto NextSeat(PlyrIdxT const idx) const -> PlyrIdxT
        {
            return static_cast<PlyrIdxT>((idx + 1) % seats_.size());
        }
        // Shuffles the discard pile back under the deck
        auto RecycleDiscard(Rng& rng) -> void;

    private:
        std::vector<SeatState> seats_;
        Deck deck_;
        std::vector<Card> discard_;
        PlyrIdxT current_{0};
        uint32_t round_{0};
        bool terminal_{false};
        std::optional<PlyrIdxT> winner_{};
    };
} // namespace flip7::core

#endif //FLIP7_STATE_HPP
