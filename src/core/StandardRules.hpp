//
// Created by Malik T on 15/08/2025.
//

#ifndef FLIP7_STANDARDRULES_HPP
#define FLIP7_STANDARDRULES_HPP
#include "Rules.hpp"

namespace flip7::core
{
    class StandardRules final : public Rules
    {
    public:
        auto Validate(GameState const& game, PlyrIdxT actor, Action a) const -> CheckResult override;
        auto Apply(GameState& game, Action a, Rng& rng) -> TurnEffect override;
        auto Advance(GameState& game, TurnEffect const& effect) -> MoveOutcome override;
    };
}

#endif //FLIP7_STANDARDRULES_HPP
