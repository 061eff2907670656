//
// Created by Malik T on 22/08/2025.
//
#include "codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "../core/Turn.hpp"

namespace fbn = flip7::gen::net;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(flip7::core::TurnStatus::Busted) == static_cast<int>(fbn::TurnStatus::Busted));
    static_assert(static_cast<int>(flip7::core::Action::Stay) == static_cast<int>(fbn::Move::Stay));
    static_assert(static_cast<int>(flip7::core::ActionKind::SecondChance) ==
                  static_cast<int>(fbn::ActionCardKind::SecondChance));

    auto ToFbCard(flatbuffers::FlatBufferBuilder& fbb, flip7::core::Card const& c)
        -> flatbuffers::Offset<fbn::Card>
    {
        using namespace flip7::core;
        return std::visit([&]<typename T0>(T0 const& card) -> flatbuffers::Offset<fbn::Card>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, NumberCard>)
                return fbn::CreateCard(fbb, fbn::CardKind::Number, card.value);
            else if constexpr (std::is_same_v<T, ModifierCard>)
                return fbn::CreateCard(fbb, fbn::CardKind::Modifier, card.value);
            else if constexpr (std::is_same_v<T, ActionCard>)
                return fbn::CreateCard(fbb, fbn::CardKind::Action, static_cast<uint8_t>(card.kind));
            else
                return fbn::CreateCard(fbb, fbn::CardKind::Multiplier, 0);
        }, c);
    }

    auto FromFbCard(fbn::Card const* c) -> std::optional<flip7::core::Card>
    {
        using namespace flip7::core;
        if (!c) return std::nullopt;
        uint8_t const v = c->value();
        switch (c->kind())
        {
        case fbn::CardKind::Number:
            if (v >= constants::NumberValues) return std::nullopt;
            return NumberCard{v};
        case fbn::CardKind::Modifier:
            if (v < constants::MinModifier || v > constants::MaxModifier) return std::nullopt;
            return ModifierCard{v};
        case fbn::CardKind::Action:
            if (v > static_cast<uint8_t>(ActionKind::SecondChance)) return std::nullopt;
            return ActionCard{static_cast<ActionKind>(v)};
        case fbn::CardKind::Multiplier:
            return MultiplierCard{};
        }
        return std::nullopt;
    }

    // Verifies the buffer and hands back its root, or why it was refused
    auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fbn::Envelope const*, flip7::core::net::ParseError>
    {
        using flip7::core::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = fbn::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }
} // anonymous

namespace flip7::core::net
{
    auto ToFbStatus(TurnStatus s) noexcept -> fbn::TurnStatus
    {
        switch (s)
        {
        case TurnStatus::Active: return fbn::TurnStatus::Active;
        case TurnStatus::Frozen: return fbn::TurnStatus::Frozen;
        case TurnStatus::Busted: return fbn::TurnStatus::Busted;
        case TurnStatus::Stayed: return fbn::TurnStatus::Stayed;
        }
        return fbn::TurnStatus::Active;
    }

    auto FromFbStatus(fbn::TurnStatus s) noexcept -> TurnStatus
    {
        switch (s)
        {
        case fbn::TurnStatus::Active: return TurnStatus::Active;
        case fbn::TurnStatus::Frozen: return TurnStatus::Frozen;
        case fbn::TurnStatus::Busted: return TurnStatus::Busted;
        case fbn::TurnStatus::Stayed: return TurnStatus::Stayed;
        }
        return TurnStatus::Active;
    }

    auto ToFbMove(Action a) noexcept -> fbn::Move
    {
        return a == Action::Hit ? fbn::Move::Hit : fbn::Move::Stay;
    }

    auto FromFbMove(fbn::Move m) noexcept -> Action
    {
        return m == fbn::Move::Hit ? Action::Hit : Action::Stay;
    }

    // ---------- Snapshot (server → client) ----------

    auto BuildSnapshot(GameState const& g,
                       PlyrIdxT seat,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        if (seat >= g.PlayerCount())
            F7_THROW(error::Code::Serialization, std::format("Snapshot for seat {} of {}", seat, g.PlayerCount()));

        flatbuffers::FlatBufferBuilder fbb;
        TurnState const& line = g.Turn();

        auto const nums_vec = fbb.CreateVector(line.numbers.Values());

        std::vector<uint32_t> totals;
        totals.reserve(g.PlayerCount());
        for (PlyrIdxT i = 0; i < g.PlayerCount(); ++i) totals.push_back(g.Total(i));
        auto const totals_vec = fbb.CreateVector(totals);

        std::vector<flatbuffers::Offset<fbn::Card>> disc;
        disc.reserve(g.Discard().size());
        for (Card const& c : g.Discard()) disc.push_back(ToFbCard(fbb, c));
        auto const disc_vec = fbb.CreateVector(disc);

        fbn::SeatViewBuilder vb(fbb);
        vb.add_schema_version(1);
        vb.add_seat(seat);
        vb.add_n_players(static_cast<uint8_t>(g.PlayerCount()));
        vb.add_current(g.Current());
        vb.add_round(g.Round());
        vb.add_numbers(nums_vec);
        vb.add_modifier_sum(line.modifier_sum);
        vb.add_multiplier(line.multiplier);
        vb.add_second_chance(line.second_chance);
        vb.add_status(ToFbStatus(line.status));
        vb.add_line_score(turn::Score(line));
        vb.add_totals(totals_vec);
        vb.add_deck_remaining(static_cast<uint32_t>(g.GetDeck().Remaining()));
        vb.add_discard(disc_vec);
        vb.add_terminal(g.Terminal());
        vb.add_winner(g.Winner() ? static_cast<int16_t>(*g.Winner()) : int16_t{-1});
        auto const view = vb.Finish();

        auto const sm = fbn::CreateSnapshotMsg(fbb, msg_id, view);
        auto const env = fbn::CreateEnvelope(fbb, fbn::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation (server → client) ----------

    auto BuildViolation(error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fbn::CreateViolation(fbb, msg_id, static_cast<int16_t>(v.code), txt);
        auto const env = fbn::CreateEnvelope(fbb, fbn::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Action (client → server) ----------

    auto BuildAction(PlyrIdxT actor,
                     Action a,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fbn::CreatePlayerActionMsg(fbb, msg_id, actor, ToFbMove(a));
        auto const e = fbn::CreateEnvelope(fbb, fbn::Message::PlayerActionMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env.has_value()) return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::PlayerActionMsg)
            return std::unexpected(ParseError{"not a PlayerActionMsg"});

        auto const* pam = (*env)->message_as_PlayerActionMsg();
        if (pam->choice() != fbn::Move::Hit && pam->choice() != fbn::Move::Stay)
            return std::unexpected(ParseError{"unknown move"});

        DecodedAction out{};
        out.actor = static_cast<PlyrIdxT>(pam->actor());
        out.action = FromFbMove(pam->choice());
        out.msg_id = pam->msg_id();
        return out;
    }

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<SeatSnapshot, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env.has_value()) return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::SnapshotMsg)
            return std::unexpected(ParseError{"not a SnapshotMsg"});

        auto const* sm = (*env)->message_as_SnapshotMsg();
        auto const* v = sm->view();
        if (!v)
            return std::unexpected(ParseError{"snapshot without a view"});

        SeatSnapshot out{};
        out.msg_id = sm->msg_id();
        out.seat = v->seat();
        out.n_players = v->n_players();
        out.current = v->current();
        out.round = v->round();
        if (auto const* n = v->numbers()) out.numbers.assign(n->begin(), n->end());
        out.modifier_sum = v->modifier_sum();
        out.multiplier = v->multiplier();
        out.second_chance = v->second_chance();
        out.status = FromFbStatus(v->status());
        out.line_score = v->line_score();
        if (auto const* t = v->totals()) out.totals.assign(t->begin(), t->end());
        out.deck_remaining = v->deck_remaining();
        if (auto const* d = v->discard())
        {
            out.discard.reserve(d->size());
            for (auto const* fb_c : *d)
            {
                auto const c = FromFbCard(fb_c);
                if (!c) return std::unexpected(ParseError{"bad card in discard"});
                out.discard.push_back(*c);
            }
        }
        out.terminal = v->terminal();
        if (v->winner() >= 0) out.winner = static_cast<PlyrIdxT>(v->winner());
        return out;
    }
} // namespace flip7::core::net
