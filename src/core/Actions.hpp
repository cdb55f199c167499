//
// Actions.hpp
//

#ifndef MINDGAME_ACTIONS_HPP
#define MINDGAME_ACTIONS_HPP

#include "Types.hpp"

namespace mind::core
{
    // There is no turn order; every action names only what the actor wants to do.
    struct PlayCardAction     { CardT card{}; };
    struct ThrowStarAction    {};
    struct AdvanceLevelAction {};

    using PlayerAction = std::variant<
      PlayCardAction, ThrowStarAction, AdvanceLevelAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,      // in-order play, or a star that left cards in hand
        Mistake,      // out-of-order play, life lost, game continues
        LevelCleared, // every hand is empty
        LevelStarted, // advance dealt a new level
        GameWon,
        GameLost
    };

    enum class GameStatus : uint8_t
    {
        Setup,
        InProgress,
        LevelClear,
        Won,
        Lost
    };

    inline auto IsTerminal(GameStatus s) noexcept -> bool
    {
        return s == GameStatus::Won || s == GameStatus::Lost;
    }
} // namespace mind::core

#endif //MINDGAME_ACTIONS_HPP
