//
// Game.hpp
//

#ifndef MINDGAME_GAME_HPP
#define MINDGAME_GAME_HPP

#include <algorithm>
#include <expected>
#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Exception.hpp"

namespace mind::core::debug {struct Inspector;}
namespace mind::core
{
    using SubmitResult = std::expected<MoveResult, error::RuleViolation>;

    // One room's game of The Mind. Not thread safe: the owner serializes access.
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // Throws InvalidActionError unless 2 <= n_players <= 4.
        GameImpl(Config const& config, std::unique_ptr<Rules> rules);

        GameImpl(GameImpl const&) = delete;
        auto operator=(GameImpl const&) -> GameImpl& = delete;
        GameImpl(GameImpl&&) noexcept = default;
        auto operator=(GameImpl&&) noexcept -> GameImpl& = default;

        // Clears the pile and deals `level` cards to every seat. Level is set by the caller.
        auto SetupLevel() -> void;

        // Validate / apply / advance. Rule violations come back as unexpected, state untouched.
        auto Submit(PlyrIdxT seat, PlayerAction const& action) -> SubmitResult;

        auto PlayCard(PlyrIdxT seat, CardT card) -> SubmitResult { return Submit(seat, PlayCardAction{card}); }
        auto UseThrowingStar(PlyrIdxT seat = 0) -> SubmitResult { return Submit(seat, ThrowStarAction{}); }
        auto AdvanceLevel(PlyrIdxT seat = 0) -> SubmitResult { return Submit(seat, AdvanceLevelAction{}); }

        // Per-viewer view; nullopt gives a spectator view without any hand contents.
        auto SnapshotFor(std::optional<PlyrIdxT> seat) const -> std::shared_ptr<GameSnapshot const>;

        auto Status() const noexcept      -> GameStatus { return status_; }
        auto Level() const noexcept       -> uint8_t { return level_; }
        auto Lives() const noexcept       -> uint8_t { return lives_; }
        auto Stars() const noexcept       -> uint8_t { return stars_; }
        auto MaxLives() const noexcept    -> uint8_t { return max_lives_; }
        auto MaxStars() const noexcept    -> uint8_t { return max_stars_; }
        auto PlayerCount() const noexcept -> size_t { return hands_.size(); }
        auto Seed() const noexcept        -> uint64_t { return cfg_.seed; }

        auto Pile() const noexcept -> std::vector<CardT> const& { return pile_; }
        auto Discarded() const noexcept -> std::vector<CardT> const& { return discarded_; }
        auto HandOf(PlyrIdxT seat) const -> HandT const& { return hands_.at(seat); }

        auto CardsInPlay() const noexcept -> size_t;
        auto AllHandsEmpty() const noexcept -> bool { return CardsInPlay() == 0; }

        // Globally lowest card held by any seat; nullopt once every hand is empty.
        auto LowestInPlay() const noexcept -> std::optional<CardT>;
        auto PileTop() const noexcept -> std::optional<CardT>;
        auto HandHolds(PlyrIdxT seat, CardT card) const noexcept -> bool;

        //allows class to directly access private data on an instance
        friend class MindRules;
        friend struct debug::Inspector;

    private:
        //Produces a shuffled deck
        auto BuildDeck() -> void;
        auto DealHands() -> void;

        // Removes `card` from `seat`, throws if it is not there.
        auto TakeFromHand(PlyrIdxT seat, CardT card) -> void;
        // Keeps the pile ordered ascending
        auto PushPile(CardT card) -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::mt19937_64 rng_;

        // Authoritative state
        std::vector<HandT> hands_;            // [seat] sorted ascending
        std::vector<CardT> deck_;             // undealt cards of this level
        std::vector<CardT> pile_;             // played + star discards, strictly increasing
        std::vector<CardT> discarded_;        // voided by mistakes this level

        GameStatus status_{GameStatus::Setup};
        uint8_t level_{1};
        uint8_t lives_{};
        uint8_t stars_{};
        uint8_t max_lives_{};
        uint8_t max_stars_{};
    };
}
#endif //MINDGAME_GAME_HPP
