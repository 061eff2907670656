//
// Created by Malik T on 15/08/2025.
//

#ifndef FLIP7_GAME_HPP
#define FLIP7_GAME_HPP

#include <memory>
#include <random>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Policy.hpp"

namespace flip7::core
{
    // Owns one authoritative game and the policies seated in it
    class Match
    {
    public:
        Match() = delete;
        Match(Config const& config,
              std::unique_ptr<Rules> rules,
              std::vector<std::unique_ptr<Policy>> policies);

        // One state-machine step: ask current actor for an action, validate/apply/advance.
        auto Step() -> MoveOutcome;
        // Steps until the game ends or max_steps is reached; returns the winner if there is one.
        auto PlayOut(size_t max_steps = 1'000'000) -> std::optional<PlyrIdxT>;

        auto State() const noexcept -> GameState const& { return state_; }
        auto Current() const noexcept -> PlyrIdxT { return state_.Current(); }
        auto PlayerCount() const noexcept -> size_t { return policies_.size(); }
        auto Seed() const noexcept -> uint64_t { return cfg_.seed; }
        auto PolicyAt(PlyrIdxT seat) -> Policy* { return policies_.at(seat).get(); }

        auto LastAction() const noexcept -> std::optional<Action> { return last_action_; }
        auto LastEffect() const noexcept -> TurnEffect const& { return last_effect_; }

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Policy>> policies_;
        Rng rng_;
        GameState state_;

        std::optional<Action> last_action_{};
        TurnEffect last_effect_{};
    };
}
#endif //FLIP7_GAME_HPP
