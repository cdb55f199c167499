//
// State.hpp
//

#ifndef MINDGAME_STATE_HPP
#define MINDGAME_STATE_HPP

#include <string>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace mind::core
{
    enum class EffectKind : uint8_t
    {
        None,
        Played,
        Mistake,
        StarThrown,
        LevelStarted,
        GameWon
    };

    struct SeatCard
    {
        PlyrIdxT seat{};
        CardT card{};
    };

    // What the last accepted action did, for broadcast and transcripts
    struct MoveEffect
    {
        EffectKind kind{EffectKind::None};
        std::optional<PlyrIdxT> actor{};
        std::optional<CardT> card{};

        // mistake: cards voided from any hand; star: each seat's lowest card
        std::vector<SeatCard> discarded;

        uint8_t lives_lost{};
        std::string message;
    };

    struct MoveResult
    {
        MoveOutcome outcome{MoveOutcome::Invalid};
        MoveEffect effect{};
    };

    // Immutable snapshot exposed to UI/network
    struct GameSnapshot
    {
        GameStatus status{GameStatus::Setup};
        uint8_t n_players{};
        uint8_t level{};
        uint8_t lives{};
        uint8_t max_lives{};
        uint8_t stars{};
        uint8_t max_stars{};

        std::vector<CardT> pile;
        std::vector<CardT> discarded;

        // for UI: reveal my hand, counts for everyone
        std::optional<PlyrIdxT> viewer{};
        HandT my_hand;
        std::vector<uint8_t> hand_counts;
        uint16_t cards_in_play{};
    };

} // namespace mind::core

#endif //MINDGAME_STATE_HPP
