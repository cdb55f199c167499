//
// RoomCoordinator.hpp
//

#ifndef MINDGAME_ROOMCOORDINATOR_HPP
#define MINDGAME_ROOMCOORDINATOR_HPP

#include <atomic>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Game.hpp"
#include "core/Exception.hpp"
#include "server/Eviction.hpp"
#include "server/Room.hpp"
#include "server/RoomTypes.hpp"

namespace mind::server
{
    struct CoordinatorOptions
    {
        // 0 draws a fresh seed per room
        uint64_t seed{0};
        std::optional<std::filesystem::path> audit_dir{};
    };

    // Owns every room. The map lock is only held to look a room up; all game work
    // happens under that room's own mutex.
    class RoomCoordinator
    {
    public:
        using Violation = core::error::RuleViolation;

        explicit RoomCoordinator(Outbox& outbox, CoordinatorOptions opts = {});

        RoomCoordinator(RoomCoordinator const&) = delete;
        auto operator=(RoomCoordinator const&) -> RoomCoordinator& = delete;

        auto CreateRoom(std::string const& name, int capacity) -> std::expected<RoomSummary, Violation>;

        auto JoinRoom(std::string const& room_id, std::string const& player_name, ConnId conn)
            -> std::expected<JoinTicket, Violation>;

        auto Submit(std::string const& room_id, core::PlyrIdxT seat, core::PlayerAction const& action)
            -> core::SubmitResult;

        // Never takes a room lock; counts may trail in-flight joins.
        [[nodiscard]]
        auto ListRooms() const -> std::vector<RoomSummary>;

        // Marks the seat disconnected if conn still owns it. False when it did not.
        auto Detach(std::string const& room_id, core::PlyrIdxT seat, ConnId conn) -> bool;

        auto CloseRoom(std::string const& room_id) -> bool;

        // Closes every room the policy selects and returns their ids.
        auto CollectIdle(EvictionPolicy const& policy, Clock::time_point now) -> std::vector<std::string>;

        [[nodiscard]]
        auto RoomCount() const -> size_t;

#if MND_ENABLE_TEST_HOOKS == true
        // Runs fn under the room lock with the live engine; false if the room or game is missing.
        auto DebugWithGame(std::string const& room_id, std::function<void(core::GameImpl&)> const& fn) -> bool;
#endif

    private:
        auto Find(std::string const& room_id) const -> std::shared_ptr<Room>;
        auto SeedFor(uint64_t room_number) const -> uint64_t;

    private:
        Outbox& outbox_;
        CoordinatorOptions opts_;

        mutable std::shared_mutex map_mtx_;
        std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
        std::atomic<uint64_t> next_id_{0};
    };
}

#endif //MINDGAME_ROOMCOORDINATOR_HPP
