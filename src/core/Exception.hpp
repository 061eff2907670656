//
// Created by Malik T on 14/08/2025.
//

#ifndef FLIP7_EXCEPTION_HPP
#define FLIP7_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace flip7::core::error
{
    enum class Code : unsigned
    {
        State, // state engine misuse (not user invalid move)
        InvalidAction, // action is not legal for the current state
        EmptyDeck, // draw requested with nothing left to draw
        Config, // misconfiguration caught before any work starts
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct EmptyDeckError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::State: throw StateError(std::move(msg), c);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c);
        case Code::EmptyDeck: throw EmptyDeckError(std::move(msg), c);
        case Code::Config: throw ConfigError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define F7_THROW(code_enum, msg) ::flip7::core::error::fail((code_enum), (msg))
#define F7_ASSERT(cond, msg) do { if(!(cond)) ::flip7::core::error::fail(::flip7::core::error::Code::Assertion, (msg)); } while(0)

    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        Game_AlreadyOver,
        WrongActor,

        // Hit
        Hit_TurnOver,

        // Stay
        Stay_TurnOver
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Action> action{};
        std::optional<PlyrIdxT> actor{};
        std::optional<PlyrIdxT> current{};
        std::optional<TurnStatus> status{};

        auto with_action(Action a) -> RuleViolation&
        {
            action = a;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_current(PlyrIdxT s) -> RuleViolation&
        {
            current = s;
            return *this;
        }

        auto with_status(TurnStatus s) -> RuleViolation&
        {
            status = s;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Game_AlreadyOver: return "Game is already over";
        case E::WrongActor: return "Wrong actor (not this seat's turn)";
        case E::Hit_TurnOver: return "Hit: turn already finished";
        case E::Stay_TurnOver: return "Stay: turn already finished";
        }
        return "Unknown";
    }

    inline auto to_string(TurnStatus s) -> std::string_view
    {
        switch (s)
        {
        case TurnStatus::Active: return "Active";
        case TurnStatus::Frozen: return "Frozen";
        case TurnStatus::Busted: return "Busted";
        case TurnStatus::Stayed: return "Stayed";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.action) s += std::format(" | action={}", *v.action == Action::Hit ? "Hit" : "Stay");
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.current) s += std::format(" | current=P{}", static_cast<int>(*v.current));
        if (v.status) s += std::format(" | status={}", to_string(*v.status));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //FLIP7_EXCEPTION_HPP
