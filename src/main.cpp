//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp - Authoritative match server using WebSocket++
//

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Args.hpp"
#include "core/Game.hpp"
#include "core/StandardRules.hpp"
#include "core/Exception.hpp"
#include "mcts/MctsPolicy.hpp"
#include "net/RemotePolicy.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint32_t n_players{2};
        std::uint64_t seed{123456789ULL};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(15)};
        std::string bot{"heuristic"};
        flip7::mcts::SearchConfig search{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string const arg = argv[i];

            auto value = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                    F7_THROW(flip7::core::error::Code::Config, std::format("Missing value for {}", arg));
                return argv[++i];
            };

            using flip7::core::ParseNumber;
            if (arg == "--port") cfg.port = ParseNumber<std::uint16_t>(arg, value());
            else if (arg == "--players") cfg.n_players = ParseNumber<std::uint32_t>(arg, value());
            else if (arg == "--seed") cfg.seed = ParseNumber<std::uint64_t>(arg, value());
            else if (arg == "--timeout_ms")
                cfg.turn_timeout = std::chrono::milliseconds(ParseNumber<std::uint32_t>(arg, value()));
            else if (arg == "--sims") cfg.search.simulation_budget = ParseNumber<std::int64_t>(arg, value());
            else if (arg == "--weight") cfg.search.flip7_weight = ParseNumber<double>(arg, value());
            else if (arg == "--bot") cfg.bot = value();
            else
                F7_THROW(flip7::core::error::Code::Config, std::format("Unknown flag {}", arg));
        }

        if (cfg.n_players < flip7::core::constants::MinPlayers || cfg.n_players > flip7::core::constants::MaxPlayers)
            F7_THROW(flip7::core::error::Code::Config, std::format("--players must be in [{}, {}]",
                                                                  flip7::core::constants::MinPlayers,
                                                                  flip7::core::constants::MaxPlayers));
        // Builds one bot up front so a bad --bot/--sims/--weight fails before listening
        (void)flip7::mcts::MakePolicy(cfg.bot, cfg.search);
        return cfg;
    }

    void BroadcastSnapshots(flip7::core::GameState const& game,
                            std::vector<std::shared_ptr<flip7::net::SeatChannel>> const& chans,
                            std::uint64_t msg_id)
    {
        for (flip7::core::PlyrIdxT seat = 0; seat < chans.size(); ++seat)
        {
            if (chans[seat] && chans[seat]->connected)
            {
                auto const buf = flip7::core::net::BuildSnapshot(game, seat, msg_id);
                chans[seat]->SendBinary(flip7::core::net::AsBytes(buf));
            }
        }
    }

    // Gives clients one turn timeout to take their seats
    void WaitForSeats(std::vector<std::shared_ptr<flip7::net::SeatChannel>> const& chans,
                      std::chrono::milliseconds window)
    {
        auto const deadline = std::chrono::steady_clock::now() + window;
        while (std::chrono::steady_clock::now() < deadline)
        {
            bool all = true;
            for (auto const& c : chans) all = all && c->connected;
            if (all) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

int main(int argc, char** argv)
{
    using namespace flip7;
    using namespace flip7::core;

    ServerConfig sc{};
    try
    {
        sc = ParseArgs(argc, argv);
    }
    catch (error::ConfigError const& e)
    {
        std::print("[flip7d] {}\n", e.what());
        return 2;
    }

    std::print("[flip7d] starting on port {} with {} player(s), bots play '{}'\n",
               sc.port, sc.n_players, sc.bot);

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    std::vector<std::shared_ptr<net::SeatChannel>> chans(sc.n_players);
    for (std::size_t i = 0; i < sc.n_players; ++i)
    {
        chans[i] = std::make_shared<net::SeatChannel>();
        chans[i]->ep = ep;
    }
    std::unordered_map<void*, std::size_t> hdl_to_seat;

    // Guards seat assignment against the switch from lobby to match
    std::mutex seat_mtx;
    bool started = false;

    ep->set_open_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::lock_guard<std::mutex> lock(seat_mtx);

        // Once the match runs only remote seats can be (re)taken; the rest are bots
        std::size_t seat = static_cast<std::size_t>(-1);
        for (std::size_t i = 0; i < chans.size(); ++i)
        {
            if (!chans[i]->connected && (!started || chans[i]->remote))
            {
                seat = i;
                break;
            }
        }
        if (seat == static_cast<std::size_t>(-1))
        {
            ep->close(hdl, websocketpp::close::status::try_again_later, "All seats occupied");
            return;
        }

        hdl_to_seat[key] = seat;
        chans[seat]->hdl = hdl;
        chans[seat]->connected = true;

        std::print("[flip7d] client connected -> seat {}\n", seat);

        std::string hello = "SeatAssigned " + std::to_string(seat) +
                            " / " + std::to_string(chans.size());
        websocketpp::lib::error_code ec;
        ep->send(hdl, hello, websocketpp::frame::opcode::text, ec);
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        auto it = hdl_to_seat.find(key);
        if (it != hdl_to_seat.end())
        {
            std::size_t seat = it->second;
            hdl_to_seat.erase(it);

            if (seat < chans.size())
            {
                chans[seat]->connected = false;
                std::print("[flip7d] seat {} disconnected\n", seat);
            }
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        auto it = hdl_to_seat.find(key);
        if (it == hdl_to_seat.end())
        {
            return;
        }
        std::size_t const seat = it->second;

        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        auto const& payload = msg->get_payload();
        std::vector<uint8_t> bytes(payload.begin(), payload.end());

        if (seat < chans.size() && chans[seat])
        {
            // frames for a bot seat are dropped
            (void)chans[seat]->Enqueue(std::move(bytes));
        }
    });

    ep->listen(sc.port);
    ep->start_accept();
    std::thread net_thr([ep]
    {
        ep->run();
    });

    WaitForSeats(chans, sc.turn_timeout);

    Config cfg;
    cfg.n_players = sc.n_players;
    cfg.seed      = sc.seed;

    // Connected seats are remote; the rest are filled with bots.
    std::vector<std::unique_ptr<Policy>> policies;
    policies.reserve(sc.n_players);
    std::unique_lock<std::mutex> seat_lock(seat_mtx);
    started = true;
    for (std::size_t i = 0; i < sc.n_players; ++i)
    {
        if (chans[i] && chans[i]->connected)
        {
            policies.emplace_back(std::make_unique<net::RemotePolicy>(static_cast<PlyrIdxT>(i), chans[i],
                                                                      sc.turn_timeout));
        }
        else
        {
            policies.emplace_back(mcts::MakePolicy(sc.bot, sc.search));
        }
    }
    seat_lock.unlock();

    int rc = 0;
    try
    {
        Match match(cfg, std::make_unique<StandardRules>(), std::move(policies));

        std::uint64_t msg_counter{1};
        BroadcastSnapshots(match.State(), chans, msg_counter++);

        MoveOutcome outcome = MoveOutcome::Applied;
        while (outcome != MoveOutcome::GameEnded)
        {
            outcome = match.Step();
            BroadcastSnapshots(match.State(), chans, msg_counter++);
        }

        std::print("[flip7d] game over after {} round(s), winner seat {}\n",
                   match.State().Round(), *match.State().Winner());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        rc = 1;
    }

    ep->stop_listening();
    ep->stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return rc;
}
