#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <vector>

#include "../core/Game.hpp"
#include "../core/MindRules.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"

using namespace mind::core;
using mind::core::debug::Inspector;
using RVC = mind::core::error::RuleViolationCode;

namespace
{
auto make_game(std::uint32_t players, std::uint64_t seed = 7) -> GameImpl
{
    GameImpl game(Config{.n_players = players, .start_level = 1, .seed = seed}, std::make_unique<MindRules>());
    game.SetupLevel();
    return game;
}
} // anonymous namespace

TEST(TheMindRules, LivesAndStarsFollowPlayerCount)
{
    for (std::uint32_t n : {2u, 3u, 4u})
    {
        auto game = make_game(n);
        EXPECT_EQ(game.Lives(), n);
        EXPECT_EQ(game.MaxLives(), n);
        EXPECT_EQ(game.Stars(), 1);
        EXPECT_EQ(game.MaxStars(), 1);
        EXPECT_EQ(game.Level(), 1);
        EXPECT_EQ(game.Status(), GameStatus::InProgress);
    }
}

TEST(TheMindRules, RejectsInvalidPlayerCount)
{
    for (std::uint32_t n : {0u, 1u, 5u})
    {
        EXPECT_THROW(GameImpl(Config{.n_players = n}, std::make_unique<MindRules>()), error::InvalidActionError);
    }
}

TEST(TheMindRules, SetupDealsLevelCardsEach)
{
    for (std::uint32_t n : {2u, 3u, 4u})
    {
        for (std::uint8_t level = 1; level <= constants::MaxLevel; ++level)
        {
            GameImpl game(Config{.n_players = n, .start_level = level, .seed = 1000u + level},
                          std::make_unique<MindRules>());
            game.SetupLevel();

            std::set<CardT> seen;
            for (PlyrIdxT s = 0; s < n; ++s)
            {
                HandT const& hand = game.HandOf(s);
                ASSERT_EQ(hand.size(), level);
                EXPECT_TRUE(std::ranges::is_sorted(hand));
                for (CardT c : hand)
                {
                    EXPECT_TRUE(ValidCard(c));
                    EXPECT_TRUE(seen.insert(c).second) << "duplicate card " << int(c);
                }
            }
            EXPECT_TRUE(game.Pile().empty());
            EXPECT_NO_THROW(debug::CheckInvariants(game));
        }
    }
}

TEST(TheMindRules, SameSeedSameDeal)
{
    auto a = make_game(3, 99);
    auto b = make_game(3, 99);
    for (PlyrIdxT s = 0; s < 3; ++s)
    {
        EXPECT_EQ(a.HandOf(s), b.HandOf(s));
    }
}

TEST(TheMindRules, InOrderPlaysClearLevel)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{50}, {10}});

    auto r1 = game.PlayCard(1, 10);
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1->outcome, MoveOutcome::Applied);
    EXPECT_EQ(r1->effect.kind, EffectKind::Played);
    EXPECT_EQ(r1->effect.message, "Card 10 played successfully!");
    EXPECT_EQ(game.Pile(), (std::vector<CardT>{10}));

    auto r2 = game.PlayCard(0, 50);
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2->outcome, MoveOutcome::LevelCleared);
    EXPECT_EQ(game.Pile(), (std::vector<CardT>{10, 50}));
    EXPECT_EQ(game.Status(), GameStatus::LevelClear);
    EXPECT_EQ(game.Lives(), 2);
    EXPECT_NE(r2->effect.message.find("Level 1 complete!"), std::string::npos);
}

TEST(TheMindRules, OutOfOrderDiscardsSkippedCardsAndCostsOneLife)
{
    auto game = make_game(3);
    Inspector::Rig(game, {{12, 40, 70}, {15, 35, 80}, {30, 45}}, {5});

    auto r = game.PlayCard(2, 45);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::Mistake);
    EXPECT_EQ(r->effect.kind, EffectKind::Mistake);
    EXPECT_EQ(r->effect.lives_lost, 1);
    EXPECT_EQ(game.Lives(), 2);

    // exactly the cards in (5, 45) from any hand
    std::vector<CardT> voided;
    for (SeatCard const& sc : r->effect.discarded) voided.push_back(sc.card);
    std::ranges::sort(voided);
    EXPECT_EQ(voided, (std::vector<CardT>{12, 15, 30, 35, 40}));
    EXPECT_EQ(game.Discarded(), (std::vector<CardT>{12, 15, 30, 35, 40}));

    EXPECT_EQ(game.HandOf(0), (HandT{70}));
    EXPECT_EQ(game.HandOf(1), (HandT{80}));
    EXPECT_TRUE(game.HandOf(2).empty());
    EXPECT_EQ(game.Pile(), (std::vector<CardT>{5, 45}));
    EXPECT_EQ(r->effect.message, "Card 45 played out of order! Lost a life.");
    EXPECT_NO_THROW(debug::CheckInvariants(game));
}

TEST(TheMindRules, MistakeThatEmptiesHandsClearsLevel)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{20}, {10}});

    auto r = game.PlayCard(0, 20);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::LevelCleared);
    EXPECT_EQ(r->effect.lives_lost, 1);
    EXPECT_EQ(game.Lives(), 1);
    EXPECT_EQ(game.Status(), GameStatus::LevelClear);
}

TEST(TheMindRules, PileStaysIncreasing)
{
    auto game = make_game(2, 5);
    Inspector::Rig(game, {{3, 9, 60}, {4, 20, 21}});

    for (auto [seat, card] : std::vector<std::pair<PlyrIdxT, CardT>>{{0, 3}, {1, 20}, {1, 21}, {0, 60}})
    {
        auto r = game.PlayCard(seat, card);
        ASSERT_TRUE(r.has_value()) << error::describe(r.error());
        EXPECT_TRUE(std::ranges::is_sorted(game.Pile()));
        EXPECT_EQ(std::ranges::adjacent_find(game.Pile()), game.Pile().end());
    }
}

TEST(TheMindRules, LastLifeLostEndsGame)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{10, 60}, {30, 90}});
    Inspector::SetLives(game, 1);

    auto r = game.PlayCard(0, 60);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::GameLost);
    EXPECT_EQ(game.Status(), GameStatus::Lost);
    EXPECT_EQ(game.Lives(), 0);
    EXPECT_NE(r->effect.message.find("Game over"), std::string::npos);

    auto p = game.PlayCard(1, 90);
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, RVC::Terminal_GameLost);
    EXPECT_EQ(p.error().kind(), error::ErrorKind::TerminalState);

    auto s = game.UseThrowingStar(1);
    ASSERT_FALSE(s.has_value());
    EXPECT_EQ(s.error().kind(), error::ErrorKind::TerminalState);

    auto a = game.AdvanceLevel(0);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().kind(), error::ErrorKind::TerminalState);

    EXPECT_THROW(game.SetupLevel(), error::StateError);
}

TEST(TheMindRules, ThrowingStarDiscardsEachLowest)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{30, 5}, {20}});

    auto r = game.UseThrowingStar(0);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->effect.kind, EffectKind::StarThrown);
    ASSERT_EQ(r->effect.discarded.size(), 2u);
    EXPECT_EQ(r->effect.discarded[0].seat, 0);
    EXPECT_EQ(r->effect.discarded[0].card, 5);
    EXPECT_EQ(r->effect.discarded[1].seat, 1);
    EXPECT_EQ(r->effect.discarded[1].card, 20);

    EXPECT_EQ(game.Pile(), (std::vector<CardT>{5, 20}));
    EXPECT_EQ(game.Stars(), 0);
    EXPECT_EQ(game.Lives(), 2);
    EXPECT_EQ(game.HandOf(0), (HandT{30}));
    EXPECT_TRUE(game.HandOf(1).empty());
    EXPECT_EQ(r->outcome, MoveOutcome::Applied);
    EXPECT_EQ(r->effect.message, "Throwing star used! Discarded [P0:5, P1:20].");

    auto again = game.UseThrowingStar(1);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, RVC::Star_NoneLeft);
}

TEST(TheMindRules, StarThatEmptiesHandsClearsLevel)
{
    auto game = make_game(3);
    Inspector::Rig(game, {{8}, {}, {2}});

    auto r = game.UseThrowingStar(1);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::LevelCleared);
    EXPECT_EQ(game.Pile(), (std::vector<CardT>{2, 8}));
    EXPECT_EQ(game.Status(), GameStatus::LevelClear);
}

TEST(TheMindRules, PlayValidation)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{10, 20}, {30}});

    auto not_held = game.PlayCard(1, 10);
    ASSERT_FALSE(not_held.has_value());
    EXPECT_EQ(not_held.error().code, RVC::Play_CardNotInHand);
    EXPECT_EQ(not_held.error().kind(), error::ErrorKind::Validation);

    auto out_of_range = game.PlayCard(0, 101);
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, RVC::Play_CardOutOfRange);

    auto zero = game.PlayCard(0, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, RVC::Play_CardOutOfRange);

    auto bad_seat = game.PlayCard(5, 10);
    ASSERT_FALSE(bad_seat.has_value());
    EXPECT_EQ(bad_seat.error().code, RVC::Seat_NotFound);
    EXPECT_EQ(bad_seat.error().kind(), error::ErrorKind::NotFound);

    auto early = game.AdvanceLevel(0);
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, RVC::WrongStatus_LevelClearRequired);

    // nothing above changed the state
    EXPECT_EQ(game.HandOf(0), (HandT{10, 20}));
    EXPECT_EQ(game.Lives(), 2);
    EXPECT_TRUE(game.Pile().empty());
}

TEST(TheMindRules, PlayRejectedWhileLevelClear)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{}, {}});
    ASSERT_EQ(game.Status(), GameStatus::LevelClear);

    auto r = game.UseThrowingStar(0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::WrongStatus_InProgressRequired);
}

TEST(TheMindRules, AdvanceDealsNextLevel)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{50}, {10}});
    ASSERT_TRUE(game.PlayCard(1, 10).has_value());
    ASSERT_TRUE(game.PlayCard(0, 50).has_value());

    auto r = game.AdvanceLevel(1);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::LevelStarted);
    EXPECT_EQ(r->effect.message, "Level 2 started!");
    EXPECT_EQ(game.Level(), 2);
    EXPECT_EQ(game.Status(), GameStatus::InProgress);
    EXPECT_EQ(game.HandOf(0).size(), 2u);
    EXPECT_EQ(game.HandOf(1).size(), 2u);
    EXPECT_TRUE(game.Pile().empty());
    EXPECT_TRUE(game.Discarded().empty());
    // lives and stars carry across levels
    EXPECT_EQ(game.Lives(), 2);
    EXPECT_EQ(game.Stars(), 1);
}

TEST(TheMindRules, AdvancingPastLastLevelWins)
{
    auto game = make_game(2);
    Inspector::SetLevel(game, constants::MaxLevel);
    Inspector::Rig(game, {{}, {}});

    auto r = game.AdvanceLevel(0);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::GameWon);
    EXPECT_EQ(r->effect.kind, EffectKind::GameWon);
    EXPECT_EQ(game.Status(), GameStatus::Won);
    EXPECT_EQ(game.Level(), constants::MaxLevel);

    auto after = game.PlayCard(0, 1);
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, RVC::Terminal_GameWon);
}

TEST(TheMindRules, SnapshotRedactsOtherHands)
{
    auto game = make_game(3);
    Inspector::Rig(game, {{11, 22}, {33}, {44, 55, 66}});

    auto const snap = game.SnapshotFor(PlyrIdxT{1});
    ASSERT_TRUE(snap->viewer.has_value());
    EXPECT_EQ(*snap->viewer, 1);
    EXPECT_EQ(snap->my_hand, (HandT{33}));
    EXPECT_EQ(snap->hand_counts, (std::vector<uint8_t>{2, 1, 3}));
    EXPECT_EQ(snap->cards_in_play, 6);

    auto const spectator = game.SnapshotFor(std::nullopt);
    EXPECT_FALSE(spectator->viewer.has_value());
    EXPECT_TRUE(spectator->my_hand.empty());
}

TEST(TheMindRules, SnapshotIsImmutableCopy)
{
    auto game = make_game(2);
    Inspector::Rig(game, {{10}, {70}});

    auto const before = game.SnapshotFor(PlyrIdxT{0});
    ASSERT_TRUE(game.PlayCard(0, 10).has_value());

    EXPECT_EQ(before->my_hand, (HandT{10}));
    EXPECT_TRUE(before->pile.empty());
}

TEST(TheMindRules, EngineErrorsThrowTheirTypedException)
{
    EXPECT_THROW(MND_THROW(error::Code::Rules, "rules"), error::RulesError);
    EXPECT_THROW(MND_THROW(error::Code::State, "state"), error::StateError);
    EXPECT_THROW(MND_THROW(error::Code::InvalidAction, "action"), error::InvalidActionError);
    EXPECT_THROW(MND_THROW(error::Code::Unknown, "unknown"), error::UnknownError);
    EXPECT_THROW(MND_ASSERT(1 + 1 == 3, "arithmetic"), error::AssertionError);

    try
    {
        MND_THROW(error::Code::State, "carries its code");
    }
    catch (OmegaException<error::Code> const& e)
    {
        EXPECT_EQ(e.data(), error::Code::State);
    }
}
