//
// Room.hpp
//

#ifndef MINDGAME_ROOM_HPP
#define MINDGAME_ROOM_HPP

#include <atomic>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Game.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "server/RoomTypes.hpp"

namespace mind::server
{
    struct JoinOutcome
    {
        JoinTicket ticket;
        bool started_now{false};
    };

    // One isolated session. Everything except Summary() and the immutable accessors
    // requires Lock() to be held by the caller.
    class Room
    {
    public:
        Room(std::string id, std::string name, uint8_t capacity, uint64_t seed,
             std::optional<std::filesystem::path> audit_path = std::nullopt);

        Room(Room const&) = delete;
        auto operator=(Room const&) -> Room& = delete;

        auto Id() const noexcept -> std::string const& { return id_; }
        auto Name() const noexcept -> std::string const& { return name_; }
        auto Capacity() const noexcept -> uint8_t { return capacity_; }

        // Reads only atomics; safe without the lock and possibly a step behind.
        auto Summary() const -> RoomSummary;

        [[nodiscard]]
        auto Lock() -> std::unique_lock<std::mutex> { return std::unique_lock<std::mutex>{mtx_}; }

        auto Join(std::string const& player_name, ConnId conn) -> std::expected<JoinOutcome, core::error::RuleViolation>;
        auto Detach(core::PlyrIdxT seat, ConnId conn) -> bool;
        auto Submit(core::PlyrIdxT seat, core::PlayerAction const& action) -> core::SubmitResult;

        auto Started() const noexcept -> bool { return game_ != nullptr; }
        auto Closed() const noexcept -> bool { return closed_; }
        auto MarkClosed() -> void { closed_ = true; }
        auto Game() -> core::GameImpl* { return game_.get(); }
        auto Game() const -> core::GameImpl const* { return game_.get(); }

        auto Roster() const -> std::vector<SeatInfo>;
        auto Snapshot(core::PlyrIdxT seat) const -> std::shared_ptr<core::GameSnapshot const>;

        // Broadcast payloads for every attached connection
        auto StateUpdate(std::optional<core::MoveEffect> effect) const -> RoomUpdate;
        auto RosterUpdate(RosterEvent event, std::optional<core::PlyrIdxT> subject) const -> RoomUpdate;
        // Full state for one connection only (reconnect resend)
        auto StateFor(core::PlyrIdxT seat, ConnId conn) const -> RoomUpdate;

    private:
        struct Seat
        {
            std::string name;
            std::optional<ConnId> conn{};
        };

        auto StartGame() -> void;
        auto RefreshCounters() -> void;

    private:
        std::string const id_;
        std::string const name_;
        uint8_t const capacity_;
        uint64_t const seed_;

        std::mutex mtx_;
        std::unique_ptr<core::GameImpl> game_;
        std::vector<Seat> seats_;
        std::unique_ptr<core::debug::AuditLogger> audit_;
        std::optional<std::filesystem::path> audit_path_;
        bool closed_{false};

        // mirrored for lock-free listing
        std::atomic<uint8_t> occupancy_{0};
        std::atomic<uint8_t> attached_{0};
        std::atomic<core::GameStatus> status_{core::GameStatus::Setup};
        std::atomic<bool> started_{false};
        std::atomic<Clock::rep> idle_since_;
    };
}

#endif //MINDGAME_ROOM_HPP
