#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace flip7::core;

namespace
{

auto s_action(Action const a) -> std::string_view
{
    return a == Action::Hit ? "Hit" : "Stay";
}

auto s_cards(std::vector<Card> const& cards) -> std::string
{
    std::string body;
    for (size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += util::CardName(cards[i]);
    }
    return body;
}

auto serialize_line(TurnState const& t) -> std::string
{
    std::string nums;
    bool first = true;
    for (uint8_t const v : t.numbers.Values())
    {
        nums += (first ? "" : ",");
        first = false;
        nums += std::format("{}", v);
    }

    return std::format(
        "nums=[{}] mod=+{} x2={} sc={} line={}",
        nums,
        t.modifier_sum,
        (t.multiplier ? 1 : 0),
        (t.second_chance ? 1 : 0),
        turn::Score(t)
    );
}

} // anonymous namespace

namespace flip7::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& game, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", static_cast<int>(game.PlayerCount()));
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        out_ << std::format("Seat {}={}\n", static_cast<int>(i), game.Seat(i).name);
    }
    out_.flush();
}

auto AuditLogger::turn(GameState const& before,
                       PlyrIdxT actor,
                       Action a,
                       TurnEffect const& effect) -> void
{
    out_ << std::format(
        "Turn round={} actor=P{} deck={} {}\n",
        before.Round(),
        static_cast<int>(actor),
        before.GetDeck().Remaining(),
        serialize_line(before.Seat(actor).turn)
    );

    out_ << std::format("Action: {} drew=[{}]", s_action(a), s_cards(effect.drawn));
    if (effect.second_chance_used) out_ << " second-chance";
    if (effect.busted) out_ << " BUST";
    if (effect.flip7) out_ << " FLIP7";
    if (effect.turn_over) out_ << std::format(" banked={}", effect.banked);
    out_ << "\n";
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied   ? "Applied" :
        (m == MoveOutcome::TurnEnded ? "TurnEnded" :
        (m == MoveOutcome::GameEnded ? "GameEnded" : "Invalid")));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::totals(GameState const& game) -> void
{
    std::string body;

    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        body += std::format(
            "{}{}:{}",
            (i ? "," : ""),
            static_cast<int>(i),
            game.Total(i)
        );
    }

    out_ << std::format("Totals: [{}] discard={}\n", body, game.Discard().size());
}

auto AuditLogger::end(GameState const& game) -> void
{
    int const winner = game.Winner() ? static_cast<int>(*game.Winner()) : -1;
    out_ << std::format("Rounds={}\n", game.Round());
    out_ << std::format("Winner={}\n", winner);
    out_.flush();
}

} // namespace flip7::core::debug
