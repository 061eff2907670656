//
// Created by Malik T on 07/09/2025.
//

//
// ExperimentsMain.cpp - MCTS against baseline opponents, results to CSV
//

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <print>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "core/Args.hpp"
#include "core/Engine.hpp"
#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "core/RandomAi.hpp"
#include "core/StandardRules.hpp"
#include "debug/AuditLogger.hpp"
#include "mcts/MctsPolicy.hpp"
#include "mcts/Tuning.hpp"

namespace
{
    using namespace flip7;
    using namespace flip7::core;

    struct ExperimentConfig
    {
        std::vector<std::int64_t> sims{10, 100, 1000};
        std::vector<double> weights{0, 10, 25, 50, 100};
        std::vector<std::string> opponents{"random", "heuristic"};
        std::uint32_t games{2};
        std::uint64_t seed{0};
        std::string out{"experiment_results.csv"};
        std::string audit_dir{};
        bool tune{false};
        std::string tune_out{"flip7_weight_tuning.csv"};
    };

    auto Split(std::string_view s) -> std::vector<std::string_view>
    {
        std::vector<std::string_view> parts;
        while (!s.empty())
        {
            size_t const comma = s.find(',');
            parts.push_back(s.substr(0, comma));
            if (comma == std::string_view::npos) break;
            s.remove_prefix(comma + 1);
        }
        return parts;
    }

    auto ParseArgs(int argc, char** argv) -> ExperimentConfig
    {
        ExperimentConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string const arg = argv[i];

            auto value = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                    F7_THROW(error::Code::Config, std::format("Missing value for {}", arg));
                return argv[++i];
            };

            if (arg == "--sims")
            {
                cfg.sims.clear();
                for (std::string_view p : Split(value())) cfg.sims.push_back(ParseNumber<std::int64_t>(arg, p));
            }
            else if (arg == "--weights")
            {
                cfg.weights.clear();
                for (std::string_view p : Split(value())) cfg.weights.push_back(ParseNumber<double>(arg, p));
            }
            else if (arg == "--opponents")
            {
                cfg.opponents.clear();
                for (std::string_view p : Split(value())) cfg.opponents.emplace_back(p);
            }
            else if (arg == "--games") cfg.games = ParseNumber<std::uint32_t>(arg, value());
            else if (arg == "--seed") cfg.seed = ParseNumber<std::uint64_t>(arg, value());
            else if (arg == "--out") cfg.out = value();
            else if (arg == "--audit-dir") cfg.audit_dir = value();
            else if (arg == "--tune") cfg.tune = true;
            else if (arg == "--tune-out") cfg.tune_out = value();
            else
                F7_THROW(error::Code::Config, std::format("Unknown flag {}", arg));
        }

        if (cfg.sims.empty() || cfg.weights.empty() || (!cfg.tune && cfg.opponents.empty()))
            F7_THROW(error::Code::Config, "Empty experiment grid");
        if (cfg.games == 0)
            F7_THROW(error::Code::Config, "--games must be positive");

        // Every setting is checked before the first game is played
        for (std::int64_t const s : cfg.sims)
        {
            for (double const w : cfg.weights)
            {
                (void)mcts::Agent(mcts::SearchConfig{.simulation_budget = s, .flip7_weight = w});
            }
        }
        if (!cfg.tune)
        {
            for (std::string const& o : cfg.opponents)
            {
                if (o != "random" && o != "heuristic")
                    F7_THROW(error::Code::Config, std::format("Unknown opponent '{}'", o));
            }
        }
        return cfg;
    }

    // Seat 0 is the search, seat 1 the opponent. Returns the winner seat.
    auto PlayGame(mcts::SearchConfig const& search, std::string const& opponent, std::uint64_t seed,
                  debug::AuditLogger* log) -> std::optional<PlyrIdxT>
    {
        std::vector<std::unique_ptr<Policy>> policies;
        policies.emplace_back(mcts::MakePolicy("mcts", search));
        policies.emplace_back(mcts::MakePolicy(opponent));

        Match match(Config{.n_players = 2, .seed = seed}, std::make_unique<StandardRules>(), std::move(policies));
        if (!log)
            return match.PlayOut();

        log->start(match.State(), match.Seed());
        for (;;)
        {
            GameState const before = match.State();
            MoveOutcome const out = match.Step();
            if (auto const a = match.LastAction())
                log->turn(before, before.Current(), *a, match.LastEffect());
            log->outcome(out);
            if (out == MoveOutcome::Invalid)
                F7_THROW(error::Code::State, "Policy chose an illegal action");
            if (out == MoveOutcome::TurnEnded) log->totals(match.State());
            if (out == MoveOutcome::GameEnded) break;
        }
        log->totals(match.State());
        log->end(match.State());
        return match.State().Winner();
    }

    auto RunExperiment(ExperimentConfig const& cfg) -> void
    {
        std::ofstream csv(cfg.out, std::ios::out | std::ios::trunc);
        if (!csv)
            F7_THROW(error::Code::Config, std::format("Cannot open {}", cfg.out));
        if (!cfg.audit_dir.empty())
            std::filesystem::create_directories(cfg.audit_dir);

        Rng seeder{cfg.seed};
        std::uniform_int_distribution<std::uint64_t> game_seed{0, 999'999};

        csv << "mcts_sims,flip7_weight,opponent,games,mcts_wins,opponent_wins\n";
        for (std::int64_t const sims : cfg.sims)
        {
            for (double const w : cfg.weights)
            {
                for (std::string const& opp : cfg.opponents)
                {
                    std::uint32_t mcts_wins{}, opp_wins{};
                    for (std::uint32_t g{}; g < cfg.games; ++g)
                    {
                        std::uint64_t const seed = game_seed(seeder);
                        std::unique_ptr<debug::AuditLogger> log;
                        if (!cfg.audit_dir.empty())
                        {
                            log = std::make_unique<debug::AuditLogger>(std::format(
                                "{}/game_s{}_w{}_{}_{}.log", cfg.audit_dir, sims, w, opp, seed));
                        }

                        auto const winner = PlayGame({.simulation_budget = sims, .flip7_weight = w}, opp, seed,
                                                     log.get());
                        if (winner == PlyrIdxT{0}) ++mcts_wins;
                        else if (winner == PlyrIdxT{1}) ++opp_wins;
                    }
                    csv << std::format("{},{},{},{},{},{}\n", sims, w, opp, cfg.games, mcts_wins, opp_wins);
                    csv.flush();
                    std::print("sims={} weight={} vs={} -> mcts_wins={} / {}\n", sims, w, opp, mcts_wins, cfg.games);
                }
            }
        }
        std::print("Results saved to {}\n", cfg.out);
    }

    auto RunTuning(ExperimentConfig const& cfg) -> void
    {
        std::ofstream csv(cfg.tune_out, std::ios::out | std::ios::trunc);
        if (!csv)
            F7_THROW(error::Code::Config, std::format("Cannot open {}", cfg.tune_out));

        Rng rng{cfg.seed};
        GameState const start = engine::NewGame({"P0", "P1"}, rng);
        RandomPolicy rollout{};

        csv << "weight,sims,hit_bust_rate,stay_bust_rate,hit_avg_points,stay_avg_points\n";
        for (double const w : cfg.weights)
        {
            std::print("Running tuning for weight={}\n", w);
            for (std::int64_t const sims : cfg.sims)
            {
                mcts::HitStayStats const st = mcts::CompareHitStay(start, sims, w, rollout, rng);
                csv << std::format("{},{},{},{},{},{}\n", w, sims, st.hit_bust_rate, st.stay_bust_rate,
                                   st.hit_avg_points, st.stay_avg_points);
            }
        }
        std::print("Tuning results saved to {}\n", cfg.tune_out);
    }
}

int main(int argc, char** argv)
{
    using namespace flip7::core;

    try
    {
        ExperimentConfig const cfg = ParseArgs(argc, argv);
        if (cfg.tune)
            RunTuning(cfg);
        else
            RunExperiment(cfg);
    }
    catch (error::ConfigError const& e)
    {
        std::print("[flip7] {}\n", e.what());
        return 2;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        return 1;
    }
    return 0;
}
