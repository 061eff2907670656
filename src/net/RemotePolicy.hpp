//
// RemotePolicy.hpp - server-side network seat using WebSocket++
//

#ifndef FLIP7_REMOTEPOLICY_HPP
#define FLIP7_REMOTEPOLICY_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>
#include <chrono>
#include <span>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Policy.hpp"
#include "core/Types.hpp"
#include "core/State.hpp"
#include "core/Actions.hpp"

namespace flip7::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct SeatChannel
    {
        std::weak_ptr<WsServer>          ep;
        Hdl                              hdl;

        std::mutex                       mtx;
        std::condition_variable          cv;
        std::deque<std::vector<uint8_t>> inbox;
        std::atomic<bool>                connected{false};
        // Set once a RemotePolicy owns the seat; frames for any other seat are dropped
        std::atomic<bool>                remote{false};

        bool Enqueue(std::vector<uint8_t> bytes)
        {
            if (!remote)
            {
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(mtx);
                inbox.emplace_back(std::move(bytes));
            }
            cv.notify_all();
            return true;
        }

        std::size_t Pending()
        {
            std::lock_guard<std::mutex> lock(mtx);
            return inbox.size();
        }

        bool WaitPopUntil(std::vector<uint8_t>& out,
                          std::chrono::steady_clock::time_point deadline)
        {
            std::unique_lock<std::mutex> lk(mtx);
            cv.wait_until(lk, deadline, [&]{ return !inbox.empty(); });
            if (inbox.empty())
            {
                return false;
            }
            out = std::move(inbox.front());
            inbox.pop_front();
            return true;
        }

        bool SendBinary(std::span<const std::byte> bytes)
        {
            auto ep_sp = ep.lock();
            if (!ep_sp || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(hdl,
                        reinterpret_cast<const void*>(bytes.data()),
                        bytes.size(),
                        websocketpp::frame::opcode::binary,
                        ec);
            return !ec;
        }
    };

    // A seat whose decisions arrive as PlayerActionMsg frames. Anything late,
    // malformed or sent for another seat banks the line with Stay.
    class RemotePolicy final : public flip7::core::Policy
    {
    public:
        RemotePolicy(flip7::core::PlyrIdxT seat,
                     std::shared_ptr<SeatChannel> chan,
                     std::chrono::milliseconds timeout);

        auto Decide(flip7::core::GameState const& state, flip7::core::Rng& rng)
            -> flip7::core::Action override;

        flip7::core::PlyrIdxT Seat() const noexcept
        {
            return seat_;
        }

    private:
        flip7::core::PlyrIdxT           seat_{};
        std::shared_ptr<SeatChannel>    chan_;
        std::chrono::milliseconds       timeout_;
    };
}

#endif // FLIP7_REMOTEPOLICY_HPP
