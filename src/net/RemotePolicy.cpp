//
// RemotePolicy.cpp
//

#include "net/RemotePolicy.hpp"

#include <print>
#include <span>

#include "net/codec.hpp"

namespace flip7::net
{
    RemotePolicy::RemotePolicy(flip7::core::PlyrIdxT seat,
                               std::shared_ptr<SeatChannel> chan,
                               std::chrono::milliseconds timeout)
        : seat_{seat}
          , chan_{std::move(chan)}
          , timeout_{timeout}
    {
        if (!chan_)
            F7_THROW(flip7::core::error::Code::Config, "Remote seat without a channel");
        chan_->remote = true;
    }

    auto RemotePolicy::Decide(flip7::core::GameState const& /*state*/, flip7::core::Rng& /*rng*/)
        -> flip7::core::Action
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout_;

        std::vector<uint8_t> frame;
        if (!chan_->WaitPopUntil(frame, deadline))
        {
            std::print("[flip7d] seat {} timed out, staying\n", seat_);
            return flip7::core::Action::Stay;
        }

        std::span<const std::byte> bytes{
            reinterpret_cast<const std::byte*>(frame.data()), frame.size()
        };

        auto const parsed = flip7::core::net::DecodePlayerAction(bytes);
        if (!parsed.has_value())
        {
            std::print("[flip7d] seat {} sent a bad frame ({}), staying\n", seat_, parsed.error().message);
            return flip7::core::Action::Stay;
        }

        // Seat spoofing guard
        if (parsed->actor != seat_)
        {
            return flip7::core::Action::Stay;
        }

        return parsed->action;
    }
}
