//
// Created by Malik T on 28/08/2025.
//
#include <gtest/gtest.h>

#include "../core/Engine.hpp"
#include "../core/Exception.hpp"
#include "../core/StandardRules.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "Scenario.hpp"

using namespace flip7::core;
using namespace flip7::test;
using flip7::core::debug::Inspector;

namespace
{
    auto Play(GameState g, std::initializer_list<Action> actions, Rng& rng) -> GameState
    {
        for (Action const a : actions)
        {
            g = engine::Apply(g, a, rng);
            debug::CheckInvariants(g);
        }
        return g;
    }
}

TEST(Engine, NewGame_Rejects_Bad_Seat_Counts)
{
    Rng rng{1};
    EXPECT_THROW((void)engine::NewGame(SeatIds(1), rng), error::ConfigError);
    EXPECT_THROW((void)engine::NewGame(SeatIds(constants::MaxPlayers + 1), rng), error::ConfigError);
    EXPECT_NO_THROW((void)engine::NewGame(SeatIds(constants::MaxPlayers), rng));
}

TEST(Engine, NewGame_Starts_Clean)
{
    Rng rng{2};
    GameState const g = engine::NewGame(SeatIds(3), rng);
    EXPECT_EQ(g.PlayerCount(), 3u);
    EXPECT_EQ(g.Current(), 0);
    EXPECT_EQ(g.Round(), 0u);
    EXPECT_EQ(g.GetDeck().Remaining(), constants::DeckSize);
    EXPECT_TRUE(g.Discard().empty());
    EXPECT_FALSE(engine::IsTerminal(g));
    for (PlyrIdxT i = 0; i < 3; ++i) EXPECT_EQ(g.Total(i), 0u);
    debug::CheckInvariants(g);
}

TEST(Engine, LegalActions_Only_While_Line_Is_Active)
{
    GameState g = StackedGame({N(3), N(3)});
    EXPECT_EQ(engine::LegalActions(g), (std::vector<Action>{Action::Hit, Action::Stay}));

    StandardRules rules{};
    Rng rng{3};
    (void)rules.Apply(g, Action::Hit, rng);
    TurnEffect const e = rules.Apply(g, Action::Hit, rng);
    ASSERT_TRUE(e.busted);
    EXPECT_TRUE(engine::LegalActions(g).empty());

    auto const v = rules.Validate(g, 0, Action::Hit);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, error::RuleViolationCode::Hit_TurnOver);
}

TEST(Engine, Bust_Forfeits_And_Rotates)
{
    Rng rng{4};
    GameState const g = Play(StackedGame({N(3), N(5), N(3)}), {Action::Hit, Action::Hit, Action::Hit}, rng);

    EXPECT_EQ(g.Total(0), 0u);
    EXPECT_EQ(g.Current(), 1);
    EXPECT_EQ(g.Discard().size(), 3u);
    EXPECT_EQ(g.Turn().status, TurnStatus::Active);
    EXPECT_TRUE(g.Turn().held.empty());
}

TEST(Engine, Stay_Banks_And_Rotates)
{
    Rng rng{5};
    GameState const g = Play(StackedGame({N(7), Mod(4), N(2)}, 3),
                             {Action::Hit, Action::Hit, Action::Stay, Action::Hit}, rng);

    EXPECT_EQ(g.Total(0), 11u);
    EXPECT_EQ(g.Current(), 1);
    EXPECT_EQ(g.Turn().numbers.Sum(), 2u);
    EXPECT_EQ(g.LineScore(), 2u);
}

TEST(Engine, Flip7_Banks_Bonus_And_Rotates)
{
    Rng rng{6};
    GameState const g = Play(StackedGame({N(0), N(1), N(2), N(3), N(4), N(5), N(6)}),
                             {Action::Hit, Action::Hit, Action::Hit, Action::Hit, Action::Hit, Action::Hit,
                              Action::Hit}, rng);
    EXPECT_EQ(g.Total(0), 36u);
    EXPECT_EQ(g.Current(), 1);
}

TEST(Engine, Wrong_Actor_Is_A_Violation)
{
    GameState const g = StackedGame({});
    StandardRules rules{};
    auto const v = rules.Validate(g, 1, Action::Stay);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, error::RuleViolationCode::WrongActor);
    EXPECT_FALSE(error::describe(v.error()).empty());
}

TEST(Engine, Game_Ends_Only_At_Round_Boundary)
{
    Rng rng{7};
    GameState g = StackedGame({N(10)});
    Inspector::SetTotal(g, 0, 195);

    g = Play(g, {Action::Hit, Action::Stay}, rng);
    EXPECT_EQ(g.Total(0), 205u);
    EXPECT_FALSE(engine::IsTerminal(g)) << "seat 1 still has its turn this round";
    EXPECT_FALSE(engine::LegalActions(g).empty());

    g = Play(g, {Action::Stay}, rng);
    EXPECT_TRUE(engine::IsTerminal(g));
    EXPECT_EQ(g.Round(), 1u);
    ASSERT_TRUE(g.Winner().has_value());
    EXPECT_EQ(*g.Winner(), 0);
    EXPECT_TRUE(engine::LegalActions(g).empty());
    EXPECT_THROW((void)engine::Apply(g, Action::Stay, rng), error::InvalidActionError);
}

TEST(Engine, Highest_Total_Wins_Ties_To_Lowest_Seat)
{
    Rng rng{8};
    {
        GameState g = StackedGame({});
        Inspector::SetTotal(g, 0, 200);
        Inspector::SetTotal(g, 1, 250);
        g = Play(g, {Action::Stay, Action::Stay}, rng);
        ASSERT_TRUE(g.Winner().has_value());
        EXPECT_EQ(*g.Winner(), 1);
    }
    {
        GameState g = StackedGame({}, 3);
        Inspector::SetTotal(g, 1, 210);
        Inspector::SetTotal(g, 2, 210);
        g = Play(g, {Action::Stay, Action::Stay, Action::Stay}, rng);
        ASSERT_TRUE(g.Winner().has_value());
        EXPECT_EQ(*g.Winner(), 1);
    }
}

TEST(Engine, Below_Winning_Score_Keeps_Playing)
{
    Rng rng{9};
    GameState g = StackedGame({});
    Inspector::SetTotal(g, 1, constants::WinningScore - 1);
    g = Play(g, {Action::Stay, Action::Stay}, rng);
    EXPECT_FALSE(engine::IsTerminal(g));
    EXPECT_EQ(g.Round(), 1u);
    EXPECT_EQ(g.Current(), 0);
}

TEST(Engine, Short_Deck_Recycles_Discard_Before_Hit)
{
    std::vector<Card> all = StackedDeck({N(12)});
    std::vector<Card> const discard(all.begin() + 1, all.end());

    GameState g{SeatIds(2), Deck{std::vector<Card>{N(12)}}};
    Inspector::StackDiscard(g, discard);
    debug::CheckInvariants(g);

    Rng rng{10};
    g = Play(g, {Action::Hit}, rng);
    EXPECT_TRUE(g.Discard().empty());
    EXPECT_EQ(g.GetDeck().Remaining(), constants::DeckSize - 1);
    EXPECT_EQ(g.Turn().numbers.Sum(), 12u);
}

TEST(Engine, Illegal_Action_Leaves_State_Untouched)
{
    Rng rng{11};
    GameState g = StackedGame({});
    Inspector::SetTotal(g, 0, 300);
    g = Play(g, {Action::Stay, Action::Stay}, rng);
    ASSERT_TRUE(engine::IsTerminal(g));

    Inspector::SnapshotAll const before = Inspector::Gather(g);
    EXPECT_THROW((void)engine::Apply(g, Action::Hit, rng), error::InvalidActionError);
    Inspector::SnapshotAll const after = Inspector::Gather(g);
    EXPECT_EQ(before.totals, after.totals);
    EXPECT_EQ(before.deck.size(), after.deck.size());
}
