//
// Created by Malik T on 14/08/2025.
//

#ifndef FLIP7_UTIL_HPP
#define FLIP7_UTIL_HPP

#include <algorithm>
#include <bit>
#include <format>
#include <span>
#include <string>
#include "Types.hpp"
#include "Exception.hpp"

namespace flip7::core::util
{
    // Layout: numbers [0,13), modifiers [13,22), Freeze, FlipThree, SecondChance, Multiplier
    inline auto CardToUID(Card const& c) -> size_t
    {
        constexpr size_t mod_base = constants::NumberValues;
        constexpr size_t act_base = mod_base + (constants::MaxModifier - constants::MinModifier + 1);
        constexpr size_t mult_uid = act_base + 3;
        return std::visit([&]<typename T0>(T0 const& card) -> size_t
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, NumberCard>)
                return card.value;
            else if constexpr (std::is_same_v<T, ModifierCard>)
                return mod_base + (card.value - constants::MinModifier);
            else if constexpr (std::is_same_v<T, ActionCard>)
                return act_base + static_cast<size_t>(card.kind);
            else
                return mult_uid;
        }, c);
    }

    inline auto UIDToCard(size_t const uid) -> Card
    {
        constexpr size_t mod_base = constants::NumberValues;
        constexpr size_t act_base = mod_base + (constants::MaxModifier - constants::MinModifier + 1);
        F7_ASSERT(uid < constants::CardUidCount, "Card uid out of range");
        if (uid < mod_base) return NumberCard{static_cast<uint8_t>(uid)};
        if (uid < act_base) return ModifierCard{static_cast<uint8_t>(uid - mod_base + constants::MinModifier)};
        if (uid < act_base + 3) return ActionCard{static_cast<ActionKind>(uid - act_base)};
        return MultiplierCard{};
    }

    using CardCounts = std::array<uint8_t, constants::CardUidCount>;

    inline auto CountCards(std::span<Card const> cards, CardCounts& counts) -> void
    {
        for (Card const& c : cards) ++counts[CardToUID(c)];
    }

    inline auto CardName(Card const& c) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& card) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, NumberCard>)
                return std::format("N{}", card.value);
            else if constexpr (std::is_same_v<T, ModifierCard>)
                return std::format("+{}", card.value);
            else if constexpr (std::is_same_v<T, ActionCard>)
            {
                switch (card.kind)
                {
                case ActionKind::Freeze: return "Freeze";
                case ActionKind::FlipThree: return "FlipThree";
                case ActionKind::SecondChance: return "SecondChance";
                }
                return "Action?";
            }
            else
                return "x2";
        }, c);
    }

    // Collected number values of one turn; a bit per value 0..12
    class NumberSet
    {
    public:
        NumberSet() : bits_(0) {}

        [[nodiscard]]
        auto Contains(uint8_t const n) const noexcept -> bool
        {
            return (bits_ >> n) & 1u;
        }
        auto Insert(uint8_t const n) noexcept -> void
        {
            bits_ |= static_cast<uint16_t>(1u << n);
        }
        [[nodiscard]]
        auto Size() const noexcept -> size_t
        {
            return static_cast<size_t>(std::popcount(bits_));
        }
        [[nodiscard]]
        auto Sum() const noexcept -> uint32_t
        {
            uint32_t sum{};
            for (uint16_t mm = bits_; mm; mm &= (mm - 1))
                sum += static_cast<uint32_t>(std::countr_zero(mm));
            return sum;
        }
        [[nodiscard]]
        auto Values() const -> std::vector<uint8_t>
        {
            std::vector<uint8_t> out;
            for (uint16_t mm = bits_; mm; mm &= (mm - 1))
                out.push_back(static_cast<uint8_t>(std::countr_zero(mm)));
            return out;
        }
        auto operator==(NumberSet const&) const -> bool = default;

    private:
        uint16_t bits_;
    };
}

#endif //FLIP7_UTIL_HPP
