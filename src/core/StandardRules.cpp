//
// Created by Malik T on 15/08/2025.
//

#include "StandardRules.hpp"

#include "State.hpp"
#include "Turn.hpp"
#include <ranges>
#include <algorithm>
#include <iterator>
#include <utility>
namespace
{
    inline auto Viol(flip7::core::error::RuleViolationCode code) -> flip7::core::error::RuleViolation
    {
        return flip7::core::error::RuleViolation{ .code = code };
    }
}

namespace flip7::core
{
    auto StandardRules::Validate(GameState const& game, PlyrIdxT const actor, Action const a) const -> CheckResult
    {
        using RVC = ::flip7::core::error::RuleViolationCode;

        if (game.terminal_)
            return std::unexpected(Viol(RVC::Game_AlreadyOver).with_action(a).with_actor(actor));

        if (actor != game.current_)
            return std::unexpected(Viol(RVC::WrongActor)
                                   .with_action(a).with_actor(actor).with_current(game.current_));

        TurnStatus const status = game.Turn().status;
        if (status != TurnStatus::Active)
            return std::unexpected(Viol(a == Action::Hit ? RVC::Hit_TurnOver : RVC::Stay_TurnOver)
                                   .with_action(a).with_actor(actor).with_status(status));
        return {};
    }

    auto StandardRules::Apply(GameState& game, Action const a, Rng& rng) -> TurnEffect
    {
        if (a == Action::Hit && game.deck_.Remaining() < constants::MaxCardsPerHit)
        {
            game.RecycleDiscard(rng);
        }

        // resolve against a scratch deck so a throw leaves the line and the deck as they were
        Deck deck = game.deck_;
        TurnResult res = turn::Resolve(game.Turn(), a, deck);

        game.deck_ = std::move(deck);
        game.TurnMut() = std::move(res.state);
        if (res.effect.turn_over)
        {
            game.seats_[game.current_].total += res.effect.banked;
        }
        return std::move(res.effect);
    }

    auto StandardRules::Advance(GameState& game, TurnEffect const& effect) -> MoveOutcome
    {
        F7_ASSERT(effect.turn_over == IsTerminal(game.Turn().status), "Turn effect disagrees with turn status");
        if (!effect.turn_over)
            return MoveOutcome::Applied;

        TurnState& line = game.TurnMut();
        std::ranges::move(line.held, std::back_inserter(game.discard_));
        line = TurnState{};

        PlyrIdxT const next = game.NextSeat(game.current_);
        game.current_ = next;
        if (next != 0)
            return MoveOutcome::TurnEnded;

        // every seat has had its turn this round
        ++game.round_;
        auto const best = std::ranges::max_element(game.seats_, std::ranges::less{},
                                                   [](SeatState const& s) { return s.total; });
        if (best->total < constants::WinningScore)
            return MoveOutcome::TurnEnded;

        game.terminal_ = true;
        game.winner_ = static_cast<PlyrIdxT>(std::distance(game.seats_.begin(), best));
        return MoveOutcome::GameEnded;
    }

} // flip7
