//
// Game.cpp
//
#include "Game.hpp"
#include <format>
#include <iterator>
#include <numeric>
#include <ranges>
#include <utility>

namespace mind::core
{
    GameImpl::GameImpl(Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(std::move(rules)),
        rng_{cfg_.seed}
    {
        if (!ValidPlayerCount(cfg_.n_players))
        {
            MND_THROW(error::Code::InvalidAction,
                      std::format("Invalid number of players. Must be 2-4, got {}", cfg_.n_players));
        }
        MND_ASSERT(rules_ != nullptr, "Null rules while initialising core");
        MND_ASSERT(cfg_.start_level >= 1 && cfg_.start_level <= constants::MaxLevel, "Start level outside 1..12");

        hands_.resize(cfg_.n_players);
        max_lives_ = LimitsByPlayers[cfg_.n_players].lives;
        max_stars_ = LimitsByPlayers[cfg_.n_players].stars;
        lives_ = max_lives_;
        stars_ = max_stars_;
        level_ = cfg_.start_level;
    }

    auto GameImpl::BuildDeck() -> void
    {
        deck_.resize(constants::DeckSize);
        std::iota(deck_.begin(), deck_.end(), constants::CardMin);
        // a uniform permutation makes every dealt combination equally likely
        std::ranges::shuffle(deck_, rng_);
    }

    auto GameImpl::DealHands() -> void
    {
        size_t const target = level_;
        MND_ASSERT(target * hands_.size() <= deck_.size(), "Less cards in deck than required to deal hands");
        for (auto& hand : hands_)
        {
            hand.clear();
            while (hand.size() < target)
            {
                hand.push_back(deck_.back());
                deck_.pop_back();
            }
            std::ranges::sort(hand);
        }
    }

    auto GameImpl::SetupLevel() -> void
    {
        if (IsTerminal(status_))
        {
            MND_THROW(error::Code::State, "SetupLevel called on a finished game");
        }
        pile_.clear();
        discarded_.clear();
        status_ = GameStatus::Setup;
        BuildDeck();
        DealHands();
        status_ = GameStatus::InProgress;
    }

    auto GameImpl::Submit(PlyrIdxT const seat, PlayerAction const& action) -> SubmitResult
    {
        if (auto const ok = rules_->Validate(*this, seat, action); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }
        MoveResult res{};
        res.effect = rules_->Apply(*this, seat, action);
        res.outcome = rules_->Advance(*this, res.effect);
        if (res.outcome == MoveOutcome::LevelCleared)
        {
            res.effect.message += std::format(" Level {} complete!", level_);
        }
        else if (res.outcome == MoveOutcome::GameLost)
        {
            res.effect.message += " No lives left. Game over.";
        }
        return res;
    }

    auto GameImpl::SnapshotFor(std::optional<PlyrIdxT> seat) const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->status = status_;
        snap->n_players = static_cast<uint8_t>(hands_.size());
        snap->level = level_;
        snap->lives = lives_;
        snap->max_lives = max_lives_;
        snap->stars = stars_;
        snap->max_stars = max_stars_;
        snap->pile = pile_;
        snap->discarded = discarded_;

        if (seat.has_value() && *seat < hands_.size())
        {
            snap->viewer = seat;
            snap->my_hand = hands_[*seat];
        }

        snap->hand_counts.reserve(hands_.size());
        for (auto const& hand : hands_)
        {
            snap->hand_counts.push_back(static_cast<uint8_t>(hand.size()));
        }
        snap->cards_in_play = static_cast<uint16_t>(CardsInPlay());

        return snap;
    }

    auto GameImpl::CardsInPlay() const noexcept -> size_t
    {
        size_t n{};
        for (auto const& hand : hands_) n += hand.size();
        return n;
    }

    auto GameImpl::LowestInPlay() const noexcept -> std::optional<CardT>
    {
        std::optional<CardT> low{};
        for (auto const& hand : hands_)
        {
            // hands are kept sorted, front is the hand minimum
            if (!hand.empty() && (!low || hand.front() < *low)) low = hand.front();
        }
        return low;
    }

    auto GameImpl::PileTop() const noexcept -> std::optional<CardT>
    {
        if (pile_.empty()) return std::nullopt;
        return pile_.back();
    }

    auto GameImpl::HandHolds(PlyrIdxT const seat, CardT const card) const noexcept -> bool
    {
        if (seat >= hands_.size()) return false;
        return std::ranges::binary_search(hands_[seat], card);
    }

    auto GameImpl::TakeFromHand(PlyrIdxT const seat, CardT const card) -> void
    {
        auto& hand = hands_.at(seat);
        auto const it = std::ranges::lower_bound(hand, card);
        MND_ASSERT(it != hand.end() && *it == card, std::format("Card {} not in hand of P{}", card, seat));
        hand.erase(it);
    }

    auto GameImpl::PushPile(CardT const card) -> void
    {
        auto const it = std::ranges::upper_bound(pile_, card);
        MND_ASSERT(it == pile_.begin() || *std::prev(it) != card, "Duplicate card on pile");
        pile_.insert(it, card);
    }
}
