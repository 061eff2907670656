//
// Created by Malik T on 20/08/2025.
//

#ifndef FLIP7_AUDITLOGGER_HPP
#define FLIP7_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace flip7::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player count, seat names)
        auto start(GameState const& game, std::uint64_t seed) -> void;

        // Per step: line before the action, actor seat, chosen action, what the draw did
        auto turn(GameState const& before,
                  PlyrIdxT actor,
                  Action a,
                  TurnEffect const& effect) -> void;

        // Per step outcome (after Apply/Advance)
        auto outcome(MoveOutcome m) -> void;

        // After a turn boundary, log all totals by seat
        auto totals(GameState const& game) -> void;

        // Game end footer (winner seat; -1 if none)
        auto end(GameState const& game) -> void;

    private:
        std::ofstream out_;
    };
}

#endif //FLIP7_AUDITLOGGER_HPP
