//
// Created by Malik T on 22/08/2025.
//

#ifndef FLIP7_CODEC_HPP
#define FLIP7_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <vector>
#include <string>
#include <optional>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/flip7_net_generated.h"

namespace flip7::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // What a player action decodes into
    struct DecodedAction
    {
        PlyrIdxT actor{};
        Action action{};
        std::uint64_t msg_id{};
    };

    // Client-side copy of a snapshot, detached from the buffer
    struct SeatSnapshot
    {
        std::uint64_t msg_id{};
        PlyrIdxT seat{};
        PlyrIdxT n_players{};
        PlyrIdxT current{};
        std::uint32_t round{};
        std::vector<std::uint8_t> numbers;
        std::uint32_t modifier_sum{};
        bool multiplier{};
        bool second_chance{};
        TurnStatus status{};
        std::uint32_t line_score{};
        std::vector<std::uint32_t> totals;
        std::uint32_t deck_remaining{};
        std::vector<Card> discard;
        bool terminal{};
        std::optional<PlyrIdxT> winner{};
    };

    auto ToFbStatus(TurnStatus s) noexcept -> flip7::gen::net::TurnStatus;
    auto FromFbStatus(flip7::gen::net::TurnStatus s) noexcept -> TurnStatus;
    auto ToFbMove(Action a) noexcept -> flip7::gen::net::Move;
    auto FromFbMove(flip7::gen::net::Move m) noexcept -> Action;

    // --- Outbound builders (server → client) ---

    auto BuildSnapshot(GameState const& g,
                       PlyrIdxT seat,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Outbound builder (client → server) ---

    auto BuildAction(PlyrIdxT actor,
                     Action a,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>;

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<SeatSnapshot, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace flip7::core::net

#endif //FLIP7_CODEC_HPP
