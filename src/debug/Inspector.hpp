//
// Inspector.hpp
//

#ifndef MINDGAME_INSPECTOR_HPP
#define MINDGAME_INSPECTOR_HPP

#include <algorithm>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace mind::core::debug
{
    // White-box access for tests and invariant checks.
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<CardT> deck;
            std::vector<CardT> pile;
            std::vector<CardT> discarded;
            std::vector<HandT> hands;
            GameStatus status{};
            uint8_t n_players{};
            uint8_t level{};
            uint8_t lives{};
            uint8_t stars{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.deck = g.deck_;
            ret.pile = g.pile_;
            ret.discarded = g.discarded_;
            ret.hands = g.hands_;
            ret.status = g.status_;
            ret.n_players = static_cast<uint8_t>(g.hands_.size());
            ret.level = g.level_;
            ret.lives = g.lives_;
            ret.stars = g.stars_;
            return ret;
        }

        // Replace the dealt hands with a fixed layout so tests can script exact scenarios.
        // The deck is rebuilt as the complement so the 100-card accounting still holds.
        static inline auto Rig(GameImpl& g, std::vector<HandT> hands, std::vector<CardT> pile = {}) -> void
        {
            MND_ASSERT(hands.size() == g.hands_.size(), "Rig: seat count mismatch");
            for (auto& h : hands) std::ranges::sort(h);
            std::ranges::sort(pile);

            std::vector<bool> used(constants::CardMax + 1, false);
            for (auto const& h : hands) for (CardT c : h) used[c] = true;
            for (CardT c : pile) used[c] = true;

            g.deck_.clear();
            for (int c = constants::CardMin; c <= constants::CardMax; ++c)
            {
                if (!used[c]) g.deck_.push_back(static_cast<CardT>(c));
            }
            g.hands_ = std::move(hands);
            g.pile_ = std::move(pile);
            g.discarded_.clear();
            g.status_ = g.AllHandsEmpty() ? GameStatus::LevelClear : GameStatus::InProgress;
        }

        static inline auto SetLevel(GameImpl& g, uint8_t level) -> void { g.level_ = level; }
        static inline auto SetLives(GameImpl& g, uint8_t lives) -> void { g.lives_ = lives; }
        static inline auto SetStars(GameImpl& g, uint8_t stars) -> void { g.stars_ = stars; }
    };
}

#endif //MINDGAME_INSPECTOR_HPP
