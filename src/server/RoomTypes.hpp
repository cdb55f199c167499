//
// RoomTypes.hpp
//

#ifndef MINDGAME_ROOMTYPES_HPP
#define MINDGAME_ROOMTYPES_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "core/State.hpp"

namespace mind::server
{
    using ConnId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    // What a connection remembers about where it sits; never a pointer into the room.
    struct Attachment
    {
        std::string room_id;
        core::PlyrIdxT seat{};
    };

    struct SeatInfo
    {
        core::PlyrIdxT seat{};
        std::string name;
        bool connected{false};
    };

    struct RoomSummary
    {
        std::string room_id;
        std::string name;
        uint8_t occupancy{};
        uint8_t capacity{};
        uint8_t attached{};
        core::GameStatus status{core::GameStatus::Setup};
        bool started{false};
        // when the last connection detached; nullopt while anyone is attached
        std::optional<Clock::time_point> idle_since{};
    };

    struct JoinTicket
    {
        std::string room_id;
        core::PlyrIdxT seat{};
        uint8_t capacity{};
        bool reconnected{false};
    };

    enum class RosterEvent : uint8_t
    {
        Joined,
        Left,
        Reconnected,
        Closed
    };

    struct Delivery
    {
        ConnId conn{};
        core::PlyrIdxT seat{};
        std::shared_ptr<core::GameSnapshot const> snapshot; // null before the game starts
    };

    // One room-level change, addressed to every connection that should see it.
    struct RoomUpdate
    {
        enum class Kind : uint8_t
        {
            State,
            Roster
        };

        Kind kind{Kind::State};
        std::string room_id;
        uint8_t capacity{};
        std::vector<SeatInfo> roster;

        std::optional<core::MoveEffect> effect{};
        std::optional<RosterEvent> event{};
        std::optional<core::PlyrIdxT> subject{};

        std::vector<Delivery> deliveries;
    };

    // Implemented by the transport side. Both calls are made while the room's lock is
    // held, so they observe rooms in commit order and must not call back into the coordinator.
    class Outbox
    {
    public:
        virtual ~Outbox() = default;

        // A connection got a seat (fresh or reattached); runs before any broadcast about it.
        virtual auto Seated(ConnId conn, JoinTicket const& ticket) -> void = 0;

        virtual auto Deliver(RoomUpdate const& update) -> void = 0;
    };
}

#endif //MINDGAME_ROOMTYPES_HPP
