//
// Created by Malik T on 14/08/2025.
//

#ifndef FLIP7_ACTIONS_HPP
#define FLIP7_ACTIONS_HPP

#include "Types.hpp"

namespace flip7::core
{
    // Order matters: search ties resolve towards the lower value
    enum class Action : uint8_t
    {
        Hit = 0,
        Stay
    };

    inline constexpr std::array<Action, 2> AllActions{Action::Hit, Action::Stay};

    enum class TurnStatus : uint8_t
    {
        Active = 0,
        Frozen,
        Busted,
        Stayed
    };

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TurnEnded,
        GameEnded
    };

    // What a single Hit/Stay did to the acting seat
    struct TurnEffect
    {
        std::vector<Card> drawn;
        bool busted{false};
        bool flip7{false};
        bool second_chance_used{false};
        bool turn_over{false};
        uint32_t banked{0};
    };

    inline constexpr auto IsTerminal(TurnStatus const s) noexcept -> bool
    {
        return s != TurnStatus::Active;
    }
} // namespace flip7::core

#endif //FLIP7_ACTIONS_HPP
