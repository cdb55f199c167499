//
// Exception.hpp
//

#ifndef MINDGAME_EXCEPTION_HPP
#define MINDGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace mind::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        InvalidAction, // caller passed something the engine cannot be built/driven with
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define MND_THROW(code_enum, msg) ::mind::core::error::fail((code_enum), (msg))
#define MND_ASSERT(cond, msg) do { if(!(cond)) ::mind::core::error::fail(::mind::core::error::Code::Assertion, (msg)); } while(0)

    // What the client is told, coarse grained
    enum class ErrorKind : std::uint8_t
    {
        Validation,
        TerminalState,
        NotFound
    };

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongStatus_InProgressRequired,
        WrongStatus_LevelClearRequired,
        Terminal_GameWon,
        Terminal_GameLost,

        // Play
        Play_CardOutOfRange,
        Play_CardNotInHand,

        // Star
        Star_NoneLeft,

        // Rooms / roster
        Room_NotFound,
        Room_Full,
        Room_InvalidCapacity,
        Room_NameRequired,
        Room_NotStarted,
        Room_NotJoined,
        Room_AlreadyJoined,
        Seat_NotFound,
        Seat_NameTaken,

        // Wire
        Msg_Malformed,
        Msg_UnknownType,

        // Safety net
        Internal_Unreachable
    };

    inline auto KindOf(RuleViolationCode c) noexcept -> ErrorKind
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Terminal_GameWon:
        case E::Terminal_GameLost:
            return ErrorKind::TerminalState;
        case E::Room_NotFound:
        case E::Seat_NotFound:
            return ErrorKind::NotFound;
        default:
            return ErrorKind::Validation;
        }
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<GameStatus> status{};
        std::optional<PlyrIdxT> actor{};
        std::optional<int> card{};
        std::optional<std::uint8_t> level{};
        std::optional<std::uint8_t> capacity{};
        std::optional<std::string> room_id{};

        auto with_status(GameStatus s) -> RuleViolation&
        {
            status = s;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_card(int c) -> RuleViolation&
        {
            card = c;
            return *this;
        }

        auto with_level(std::uint8_t l) -> RuleViolation&
        {
            level = l;
            return *this;
        }

        auto with_capacity(std::uint8_t c) -> RuleViolation&
        {
            capacity = c;
            return *this;
        }

        auto with_room(std::string id) -> RuleViolation&
        {
            room_id = std::move(id);
            return *this;
        }

        [[nodiscard]]
        auto kind() const noexcept -> ErrorKind { return KindOf(code); }
    };

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    inline auto to_string(GameStatus s) -> std::string_view
    {
        switch (s)
        {
        case GameStatus::Setup: return "setup";
        case GameStatus::InProgress: return "in_progress";
        case GameStatus::LevelClear: return "level_clear";
        case GameStatus::Won: return "won";
        case GameStatus::Lost: return "lost";
        }
        return "unknown";
    }

    inline auto to_string(ErrorKind k) -> std::string_view
    {
        switch (k)
        {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::TerminalState: return "terminal_state";
        case ErrorKind::NotFound: return "not_found";
        }
        return "unknown";
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongStatus_InProgressRequired: return "Level is not in progress";
        case E::WrongStatus_LevelClearRequired: return "Level is not clear yet";
        case E::Terminal_GameWon: return "Game already won";
        case E::Terminal_GameLost: return "Game already lost";

        case E::Play_CardOutOfRange: return "Play: card outside 1..100";
        case E::Play_CardNotInHand: return "Play: card not in player's hand";

        case E::Star_NoneLeft: return "Star: no throwing stars left";

        case E::Room_NotFound: return "Room not found";
        case E::Room_Full: return "Room is full";
        case E::Room_InvalidCapacity: return "Room capacity must be 2-4";
        case E::Room_NameRequired: return "Room name is required";
        case E::Room_NotStarted: return "Game not started";
        case E::Room_NotJoined: return "Not in a room";
        case E::Room_AlreadyJoined: return "Connection already joined a room";
        case E::Seat_NotFound: return "Player not found";
        case E::Seat_NameTaken: return "Player name already in use";

        case E::Msg_Malformed: return "Malformed message";
        case E::Msg_UnknownType: return "Unknown message type";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    // Short machine-readable token sent on the wire next to the message
    inline auto to_token(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Room_Full: return "room_full";
        case E::Room_NotFound: return "room_not_found";
        case E::Seat_NotFound: return "player_not_found";
        case E::Play_CardNotInHand:
        case E::Play_CardOutOfRange: return "invalid_move";
        case E::Terminal_GameWon:
        case E::Terminal_GameLost: return "game_over";
        case E::Msg_Malformed:
        case E::Msg_UnknownType: return "malformed";
        default: return to_string(KindOf(c));
        }
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.room_id) s += std::format(" | room={}", *v.room_id);
        if (v.status) s += std::format(" | status={}", to_string(*v.status));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.card) s += std::format(" | card={}", *v.card);
        if (v.level) s += std::format(" | level={}", static_cast<int>(*v.level));
        if (v.capacity) s += std::format(" | capacity={}", static_cast<int>(*v.capacity));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //MINDGAME_EXCEPTION_HPP
