//
// Created by malikt on 8/20/25.
//

#ifndef FLIP7_RECORDINGPOLICY_HPP
#define FLIP7_RECORDINGPOLICY_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Policy.hpp"

namespace flip7::core::debug
{
    class RecordingPolicy final : public Policy
    {
    public:
        explicit RecordingPolicy(std::unique_ptr<Policy> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Decide(GameState const& s, Rng& rng) -> Action override
        {
            last_action_ = inner_->Decide(s, rng);
            has_last_ = true;
            ++decisions_;
            return last_action_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> Action
        {
            return last_action_;
        }

        auto Decisions() const -> size_t
        {
            return decisions_;
        }

    private:
        std::unique_ptr<Policy> inner_;
        Action last_action_{Action::Stay}; // harmless default
        bool has_last_{false};
        size_t decisions_{0};
    };

    // Helper to wrap a vector<unique_ptr<Policy>>
    inline auto WrapRecording(std::vector<std::unique_ptr<Policy>>& policies)
        -> std::vector<std::unique_ptr<Policy>>
    {
        std::vector<std::unique_ptr<Policy>> out;
        out.reserve(policies.size());

        for (auto& p : policies)
        {
            out.emplace_back(std::make_unique<RecordingPolicy>(std::move(p)));
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Policy* p) -> RecordingPolicy*
    {
        return dynamic_cast<RecordingPolicy*>(p);
    }
} // namespace flip7::core::debug

#endif //FLIP7_RECORDINGPOLICY_HPP
