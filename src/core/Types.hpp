//
// Created by Malik T on 14/08/2025.
//

#ifndef FLIP7_TYPES_HPP
#define FLIP7_TYPES_HPP

#define F7_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <string>
#include <variant>

namespace flip7::core::constants
{
    inline constexpr size_t DeckSize = 94;
    inline constexpr size_t NumberValues = 13;          // 0..12
    inline constexpr size_t Flip7Count = 7;
    inline constexpr uint32_t Flip7Bonus = 15;
    inline constexpr uint32_t WinningScore = 200;
    inline constexpr uint8_t MinModifier = 2;
    inline constexpr uint8_t MaxModifier = 10;
    inline constexpr size_t FlipThreeDraws = 3;
    // One hit plus two chained FlipThree resolutions
    inline constexpr size_t MaxCardsPerHit = 1 + 2 * FlipThreeDraws;
    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 8;
    // Numbers 0..12, modifiers +2..+10, three action kinds, the multiplier
    inline constexpr size_t CardUidCount = NumberValues + (MaxModifier - MinModifier + 1) + 3 + 1;
}
namespace flip7::core
{
    enum class ActionKind : uint8_t
    {
        Freeze = 0,
        FlipThree,
        SecondChance
    };

    struct NumberCard
    {
        uint8_t value{};
        auto operator==(NumberCard const&) const -> bool = default;
    };
    struct ModifierCard
    {
        uint8_t value{};
        auto operator==(ModifierCard const&) const -> bool = default;
    };
    struct ActionCard
    {
        ActionKind kind{};
        auto operator==(ActionCard const&) const -> bool = default;
    };
    struct MultiplierCard
    {
        auto operator==(MultiplierCard const&) const -> bool = default;
    };

    using Card = std::variant<NumberCard, ModifierCard, ActionCard, MultiplierCard>;

    using Rng = std::mt19937_64;
    using PlyrIdxT = uint8_t;

    struct Config
    {
        uint32_t n_players{2};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //FLIP7_TYPES_HPP
