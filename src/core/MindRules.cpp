//
// MindRules.cpp
//

#include "MindRules.hpp"

#include "Game.hpp"
#include <algorithm>
#include <format>
#include <ranges>

namespace mind::core
{
    using error::Viol;

    static auto TerminalViolation(GameImpl const& game) -> std::optional<error::RuleViolation>
    {
        using RVC = ::mind::core::error::RuleViolationCode;
        if (game.Status() == GameStatus::Won)
            return Viol(RVC::Terminal_GameWon).with_status(game.Status()).with_level(game.Level());
        if (game.Status() == GameStatus::Lost)
            return Viol(RVC::Terminal_GameLost).with_status(game.Status()).with_level(game.Level());
        return std::nullopt;
    }

auto MindRules::Validate(GameImpl const& game, PlyrIdxT const actor, PlayerAction const& a) const -> CheckResult
{
    using RVC = ::mind::core::error::RuleViolationCode;

    if (auto term = TerminalViolation(game))
        return std::unexpected(std::move(*term));

    if (actor >= game.PlayerCount())
        return std::unexpected(Viol(RVC::Seat_NotFound).with_actor(actor));

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, PlayCardAction>)
        {
            if (game.status_ != GameStatus::InProgress)
                return std::unexpected(Viol(RVC::WrongStatus_InProgressRequired)
                                       .with_status(game.status_).with_actor(actor));

            if (!ValidCard(act.card))
                return std::unexpected(Viol(RVC::Play_CardOutOfRange)
                                       .with_actor(actor).with_card(act.card));

            if (!game.HandHolds(actor, act.card))
                return std::unexpected(Viol(RVC::Play_CardNotInHand)
                                       .with_actor(actor).with_card(act.card));
            return {};
        }
        else if constexpr (std::is_same_v<T, ThrowStarAction>)
        {
            if (game.status_ != GameStatus::InProgress)
                return std::unexpected(Viol(RVC::WrongStatus_InProgressRequired)
                                       .with_status(game.status_).with_actor(actor));

            if (game.stars_ == 0)
                return std::unexpected(Viol(RVC::Star_NoneLeft).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, AdvanceLevelAction>)
        {
            if (game.status_ != GameStatus::LevelClear)
                return std::unexpected(Viol(RVC::WrongStatus_LevelClearRequired)
                                       .with_status(game.status_).with_level(game.level_));
            return {};
        }

        MND_THROW(::mind::core::error::Code::Unknown, "Unreachable variant in Validate");
    }, a);
}

    auto MindRules::Apply(GameImpl& game, PlyrIdxT const actor, PlayerAction const& a) -> MoveEffect
    {
        MoveEffect eff{};
        eff.actor = actor;

        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                if constexpr(std::is_same_v<T, PlayCardAction>)
                {
                    std::optional<CardT> const low = game.LowestInPlay();
                    MND_ASSERT(low.has_value(), "Play accepted with every hand empty");
                    eff.card = act.card;

                    if (act.card == *low)
                    {
                        game.TakeFromHand(actor, act.card);
                        game.PushPile(act.card);
                        eff.kind = EffectKind::Played;
                        eff.message = std::format("Card {} played successfully!", act.card);
                        return;
                    }

                    // Every card skipped over is void, whoever holds it.
                    CardT const floor = game.PileTop().value_or(0);
                    for (PlyrIdxT seat{}; seat < game.hands_.size(); ++seat)
                    {
                        HandT& hand = game.hands_[seat];
                        auto const first = std::ranges::upper_bound(hand, floor);
                        auto const last = std::ranges::lower_bound(hand, act.card);
                        if (first >= last) continue;
                        for (auto it = first; it != last; ++it)
                        {
                            eff.discarded.push_back(SeatCard{seat, *it});
                            game.discarded_.push_back(*it);
                        }
                        hand.erase(first, last);
                    }
                    std::ranges::sort(game.discarded_);

                    game.TakeFromHand(actor, act.card);
                    game.PushPile(act.card);
                    MND_ASSERT(game.lives_ > 0, "Mistake applied with no lives left");
                    --game.lives_;
                    eff.lives_lost = 1;
                    eff.kind = EffectKind::Mistake;
                    eff.message = std::format("Card {} played out of order! Lost a life.", act.card);
                }
                else if constexpr(std::is_same_v<T, ThrowStarAction>)
                {
                    for (PlyrIdxT seat{}; seat < game.hands_.size(); ++seat)
                    {
                        HandT& hand = game.hands_[seat];
                        if (hand.empty()) continue;
                        eff.discarded.push_back(SeatCard{seat, hand.front()});
                        hand.erase(hand.begin());
                    }
                    // ascending by value, seat order on ties
                    std::ranges::stable_sort(eff.discarded, {}, &SeatCard::card);
                    for (SeatCard const& sc : eff.discarded)
                    {
                        game.PushPile(sc.card);
                    }
                    --game.stars_;
                    eff.kind = EffectKind::StarThrown;

                    std::string body;
                    for (SeatCard const& sc : eff.discarded)
                    {
                        body += std::format("{}P{}:{}", body.empty() ? "" : ", ", sc.seat, sc.card);
                    }
                    eff.message = std::format("Throwing star used! Discarded [{}].", body);
                }
                else if constexpr (std::is_same_v<T, AdvanceLevelAction>)
                {
                    if (game.level_ >= constants::MaxLevel)
                    {
                        game.status_ = GameStatus::Won;
                        eff.kind = EffectKind::GameWon;
                        eff.message = std::format("All {} levels complete! You win!", constants::MaxLevel);
                        return;
                    }
                    ++game.level_;
                    game.SetupLevel();
                    eff.kind = EffectKind::LevelStarted;
                    eff.message = std::format("Level {} started!", game.level_);
                }
            }, a);

        return eff;
    }

    auto MindRules::Advance(GameImpl& game, MoveEffect const& effect) -> MoveOutcome
    {
        switch (effect.kind)
        {
        case EffectKind::LevelStarted: return MoveOutcome::LevelStarted;
        case EffectKind::GameWon: return MoveOutcome::GameWon;
        case EffectKind::None: MND_THROW(error::Code::Rules, "Advance called without an applied effect");
        default: break;
        }

        if (game.lives_ == 0)
        {
            game.status_ = GameStatus::Lost;
            return MoveOutcome::GameLost;
        }

        if (game.AllHandsEmpty())
        {
            game.status_ = GameStatus::LevelClear;
            return MoveOutcome::LevelCleared;
        }

        return effect.kind == EffectKind::Mistake ? MoveOutcome::Mistake : MoveOutcome::Applied;
    }
}
