//
// Created by Malik T on 16/08/2025.
//
#include "State.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "Exception.hpp"

namespace flip7::core
{
    GameState::GameState(std::vector<std::string> player_ids, Deck deck) :
        deck_(std::move(deck))
    {
        if (player_ids.size() < constants::MinPlayers || player_ids.size() > constants::MaxPlayers)
            F7_THROW(error::Code::Config, std::format("Player count {} outside [{}, {}]", player_ids.size(),
                                                      constants::MinPlayers, constants::MaxPlayers));
        seats_.reserve(player_ids.size());
        for (std::string& id : player_ids)
        {
            seats_.push_back(SeatState{.name = std::move(id)});
        }
    }

    auto GameState::LineScore() const -> uint32_t
    {
        return turn::Score(Turn());
    }

    auto GameState::RecycleDiscard(Rng& rng) -> void
    {
        if (discard_.empty()) return;
        std::ranges::shuffle(discard_, rng);
        deck_.Append(discard_);
        discard_.clear();
    }
}
