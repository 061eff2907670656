//
// Created by Malik T on 05/09/2025.
//
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

#include "../core/Engine.hpp"
#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/RandomAi.hpp"
#include "../core/StandardRules.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "../mcts/Agent.hpp"
#include "../mcts/MctsPolicy.hpp"
#include "../mcts/SearchTree.hpp"
#include "../mcts/Tuning.hpp"
#include "Scenario.hpp"

using namespace flip7::core;
using namespace flip7::test;
using namespace flip7::mcts;

namespace
{
    // Some mid-game state with the acting seat still live
    auto MidGame(uint64_t seed) -> GameState
    {
        Rng rng{seed};
        GameState g = engine::NewGame(SeatIds(3), rng);
        RandomPolicy p{};
        for (int i = 0; i < 25 || engine::LegalActions(g).empty(); ++i)
        {
            g = engine::Apply(g, p.Decide(g, rng), rng);
        }
        return g;
    }

    auto TerminalGame() -> GameState
    {
        Rng rng{1};
        GameState g = StackedGame({});
        debug::Inspector::SetTotal(g, 0, 250);
        g = engine::Apply(g, Action::Stay, rng);
        g = engine::Apply(g, Action::Stay, rng);
        return g;
    }

    // Seat 0 holds 1..6 and the only unseen card is a 7, so a Hit always makes Flip7 (43)
    // and a Stay always banks 21.
    auto OneShortOfFlip7() -> GameState
    {
        Rng rng{1};
        std::vector<Card> const line{N(1), N(2), N(3), N(4), N(5), N(6)};
        GameState g = StackedGame(line);
        for (size_t i = 0; i < line.size(); ++i) g = engine::Apply(g, Action::Hit, rng);

        std::vector<Card> played = StackedDeck({N(1), N(2), N(3), N(4), N(5), N(6), N(7)});
        played.erase(played.begin(), played.begin() + 7);
        debug::Inspector::StackDeck(g, std::vector<Card>{N(7)});
        debug::Inspector::StackDiscard(g, std::move(played));
        debug::CheckInvariants(g);
        return g;
    }

    auto Wins(std::string_view seat0, SearchConfig const& cfg, uint64_t first_seed, int games) -> int
    {
        int wins{};
        for (int i = 0; i < games; ++i)
        {
            std::vector<std::unique_ptr<Policy>> ps;
            ps.emplace_back(MakePolicy(seat0, cfg));
            ps.emplace_back(MakePolicy("random"));
            Match m(Config{.n_players = 2, .seed = first_seed + static_cast<uint64_t>(i)},
                    std::make_unique<StandardRules>(), std::move(ps));
            if (m.PlayOut() == PlyrIdxT{0}) ++wins;
        }
        return wins;
    }
}

TEST(SearchTree, Ucb1_Unvisited_Is_Infinite)
{
    Node n{};
    EXPECT_EQ(SearchTree::Ucb1(n, 10, 1.4), std::numeric_limits<double>::infinity());

    n.visits = 4;
    n.total_reward = 8.0;
    EXPECT_NEAR(SearchTree::Ucb1(n, 16, 1.0), 2.0 + std::sqrt(std::log(16.0) / 4.0), 1e-12);
}

TEST(SearchTree, Select_Prefers_Unvisited_Child)
{
    SearchTree t;
    NodeIdx const root = t.Reset({});
    NodeIdx const hit = t.AddChild(root, Action::Hit, {});
    NodeIdx const stay = t.AddChild(root, Action::Stay, {});
    for (int i = 0; i < 5; ++i) t.Backpropagate(hit, 100.0);

    EXPECT_EQ(t.SelectUcb1(root, 1.4), stay);
    t.Backpropagate(stay, 0.0);
    EXPECT_EQ(t.SelectUcb1(root, 1.4), hit);
    EXPECT_EQ(t.At(root).visits, 6u);
    EXPECT_DOUBLE_EQ(t.At(root).total_reward, 500.0);
}

TEST(SearchTree, Expansion_Is_Single_Parent)
{
    SearchTree t;
    NodeIdx const root = t.Reset({Action::Hit, Action::Stay});
    EXPECT_EQ(t.PopUntried(root), Action::Hit);
    NodeIdx const c = t.AddChild(root, Action::Hit, {Action::Hit, Action::Stay});
    EXPECT_EQ(t.At(c).parent, root);
    EXPECT_EQ(t.Child(root, Action::Hit), c);
    EXPECT_EQ(t.Child(root, Action::Stay), NoNode);
    EXPECT_THROW((void)t.AddChild(root, Action::Hit, {}), error::AssertionError);
}

TEST(Mcts, Rejects_Bad_Config_Before_Searching)
{
    EXPECT_THROW((void)Agent(SearchConfig{.simulation_budget = 0}), error::ConfigError);
    EXPECT_THROW((void)Agent(SearchConfig{.simulation_budget = -5}), error::ConfigError);
    EXPECT_THROW((void)Agent(SearchConfig{.flip7_weight = std::numeric_limits<double>::quiet_NaN()}), error::ConfigError);
    EXPECT_THROW((void)Agent(SearchConfig{.exploration = -1.0}), error::ConfigError);
    EXPECT_NO_THROW((void)Agent(SearchConfig{.flip7_weight = -20.0}));

    Rng rng{1};
    RandomPolicy rollout{};
    GameState const g = MidGame(3);
    EXPECT_THROW((void)Decide(g, 0, 50.0, rollout, rng), error::ConfigError);
}

TEST(Mcts, No_Legal_Action_Throws)
{
    Rng rng{2};
    RandomPolicy rollout{};
    GameState const g = TerminalGame();
    ASSERT_TRUE(engine::IsTerminal(g));
    EXPECT_THROW((void)Decide(g, 100, 50.0, rollout, rng), error::InvalidActionError);
}

TEST(Mcts, Same_Seed_Same_Decision)
{
    GameState const g = MidGame(11);
    RandomPolicy rollout{};

    Agent a{SearchConfig{.simulation_budget = 300}};
    Agent b{SearchConfig{.simulation_budget = 300}};
    Rng r1{99}, r2{99};
    EXPECT_EQ(a.Decide(g, rollout, r1), b.Decide(g, rollout, r2));

    ASSERT_EQ(a.Tree().Size(), b.Tree().Size());
    for (NodeIdx i = 0; i < a.Tree().Size(); ++i)
    {
        EXPECT_EQ(a.Tree().At(i).visits, b.Tree().At(i).visits);
        EXPECT_DOUBLE_EQ(a.Tree().At(i).total_reward, b.Tree().At(i).total_reward);
    }
}

TEST(Mcts, Root_Visits_Equal_Budget_And_Real_State_Untouched)
{
    GameState const g = MidGame(12);
    debug::Inspector::SnapshotAll const before = debug::Inspector::Gather(g);

    RandomPolicy rollout{};
    Agent a{SearchConfig{.simulation_budget = 250}};
    Rng rng{5};
    (void)a.Decide(g, rollout, rng);

    EXPECT_EQ(a.Tree().At(SearchTree::Root()).visits, 250u);
    debug::Inspector::SnapshotAll const after = debug::Inspector::Gather(g);
    EXPECT_EQ(before.deck, after.deck);
    EXPECT_EQ(before.totals, after.totals);
}

TEST(Mcts, Determinize_Keeps_The_Unseen_Multiset)
{
    GameState const g = MidGame(21);
    Rng rng{4};
    GameState const sim = Agent::Determinize(g, rng);

    EXPECT_EQ(sim.GetDeck().CountByUid(), g.GetDeck().CountByUid());
    EXPECT_EQ(sim.Discard().size(), g.Discard().size());
    debug::CheckInvariants(sim);
}

TEST(Mcts, Empty_Line_Hits)
{
    Rng rng{6};
    GameState const g = StackedGame({});
    RandomPolicy rollout{};
    EXPECT_EQ(Decide(g, 400, 0.0, rollout, rng), Action::Hit);
}

TEST(Mcts, Long_Risky_Line_Stays)
{
    Rng rng{7};
    GameState g = StackedGame({N(7), N(8), N(9), N(10), N(11), N(12)});
    for (int i = 0; i < 6; ++i) g = engine::Apply(g, Action::Hit, rng);
    ASSERT_EQ(g.LineScore(), 57u);

    RandomPolicy rollout{};
    EXPECT_EQ(Decide(g, 1000, 0.0, rollout, rng), Action::Stay);
}

TEST(Mcts, Flip7_Weight_Steers_The_Decision)
{
    GameState const g = OneShortOfFlip7();
    ASSERT_EQ(g.LineScore(), 21u);

    RandomPolicy rollout{};
    Rng r1{11}, r2{11}, r3{11};
    EXPECT_EQ(Decide(g, 100, 0.0, rollout, r1), Action::Hit);
    EXPECT_EQ(Decide(g, 100, -15.0, rollout, r2), Action::Hit);
    EXPECT_EQ(Decide(g, 100, -100.0, rollout, r3), Action::Stay);
}

TEST(Mcts, Policy_Keeps_Its_Search_Settings)
{
    MctsPolicy p{SearchConfig{.simulation_budget = 60, .flip7_weight = -40.0}, std::make_unique<RandomPolicy>()};
    EXPECT_EQ(p.GetAgent().Config().simulation_budget, 60);
    EXPECT_DOUBLE_EQ(p.GetAgent().Config().flip7_weight, -40.0);

    Rng rng{12};
    EXPECT_EQ(p.Decide(OneShortOfFlip7(), rng), Action::Stay);
    EXPECT_EQ(p.GetAgent().Tree().At(SearchTree::Root()).visits, 60u);
}

TEST(Mcts, Policy_Factory)
{
    EXPECT_NE(MakePolicy("random"), nullptr);
    EXPECT_NE(MakePolicy("heuristic"), nullptr);
    EXPECT_NE(MakePolicy("mcts", SearchConfig{.simulation_budget = 10}), nullptr);
    EXPECT_THROW((void)MakePolicy("oracle"), error::ConfigError);
    EXPECT_THROW((void)MctsPolicy(SearchConfig{}, nullptr), error::ConfigError);
    EXPECT_THROW((void)MakePolicy("mcts", SearchConfig{.simulation_budget = 0}), error::ConfigError);
}

TEST(Mcts, Beats_Random_More_Often_Than_Random_Does)
{
    SearchConfig const cfg{.simulation_budget = 200, .flip7_weight = 50.0};
    int const games = 20;
    int const mcts_wins = Wins("mcts", cfg, 1000, games);
    int const random_wins = Wins("random", cfg, 1000, games);
    EXPECT_GT(mcts_wins, random_wins);
}

TEST(Tuning, Stay_Never_Busts_From_An_Empty_Line)
{
    Rng rng{8};
    GameState const g = StackedGame({});
    RandomPolicy rollout{};
    HitStayStats const s = CompareHitStay(g, 200, 0.0, rollout, rng);

    EXPECT_EQ(s.samples, 200);
    EXPECT_DOUBLE_EQ(s.stay_bust_rate, 0.0);
    EXPECT_DOUBLE_EQ(s.stay_avg_points, 0.0);
    EXPECT_GT(s.hit_avg_points, 0.0);
    EXPECT_LE(s.hit_bust_rate, 1.0);
}

TEST(Tuning, Flip7_Weight_Is_Added_To_Every_Flip7_Line)
{
    GameState const g = OneShortOfFlip7();
    RandomPolicy rollout{};

    Rng r0{10}, r1{10}, r2{10};
    HitStayStats const base = CompareHitStay(g, 50, 0.0, rollout, r0);
    HitStayStats const bonus = CompareHitStay(g, 50, 30.0, rollout, r1);
    HitStayStats const penalty = CompareHitStay(g, 50, -30.0, rollout, r2);

    EXPECT_EQ(base.samples, 50);
    EXPECT_DOUBLE_EQ(base.hit_bust_rate, 0.0);
    EXPECT_DOUBLE_EQ(base.hit_avg_points, 43.0);
    EXPECT_DOUBLE_EQ(base.stay_avg_points, 21.0);

    EXPECT_DOUBLE_EQ(bonus.hit_avg_points, base.hit_avg_points + 30.0);
    EXPECT_DOUBLE_EQ(penalty.hit_avg_points, base.hit_avg_points - 30.0);
    EXPECT_DOUBLE_EQ(bonus.stay_avg_points, base.stay_avg_points);
    EXPECT_DOUBLE_EQ(penalty.stay_avg_points, base.stay_avg_points);
}

TEST(Tuning, Rejects_Bad_Input)
{
    Rng rng{9};
    RandomPolicy rollout{};
    EXPECT_THROW((void)CompareHitStay(StackedGame({}), 0, 0.0, rollout, rng), error::ConfigError);
    EXPECT_THROW((void)CompareHitStay(TerminalGame(), 10, 0.0, rollout, rng), error::InvalidActionError);
}
