//
// RoomCoordinator.cpp
//

#include "server/RoomCoordinator.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <print>
#include <random>

namespace mind::server
{
    using RVC = core::error::RuleViolationCode;

    RoomCoordinator::RoomCoordinator(Outbox& outbox, CoordinatorOptions opts)
        : outbox_{outbox}
          , opts_{std::move(opts)}
    {
    }

    auto RoomCoordinator::Find(std::string const& room_id) const -> std::shared_ptr<Room>
    {
        std::shared_lock lock{map_mtx_};
        auto const it = rooms_.find(room_id);
        return it == rooms_.end() ? nullptr : it->second;
    }

    auto RoomCoordinator::SeedFor(uint64_t const room_number) const -> uint64_t
    {
        if (opts_.seed == 0)
        {
            std::random_device rd;
            return (static_cast<uint64_t>(rd()) << 32) ^ rd();
        }
        // fixed base seed: room n always deals the same way
        return opts_.seed + room_number;
    }

    auto RoomCoordinator::CreateRoom(std::string const& name, int const capacity)
        -> std::expected<RoomSummary, Violation>
    {
        if (name.empty())
            return std::unexpected(core::error::Viol(RVC::Room_NameRequired));
        if (capacity < core::constants::MinPlayers || capacity > core::constants::MaxPlayers)
            return std::unexpected(core::error::Viol(RVC::Room_InvalidCapacity)
                                   .with_capacity(static_cast<uint8_t>(std::clamp(capacity, 0, 255))));

        uint64_t const n = ++next_id_;
        std::string id = std::format("room-{}", n);

        std::optional<std::filesystem::path> audit{};
        if (opts_.audit_dir)
        {
            audit = *opts_.audit_dir / std::format("{}.log", id);
        }

        auto room = std::make_shared<Room>(id, name, static_cast<uint8_t>(capacity), SeedFor(n), std::move(audit));
        RoomSummary summary = room->Summary();
        {
            std::unique_lock lock{map_mtx_};
            rooms_.emplace(std::move(id), std::move(room));
        }
        std::print("[Server] Created {} '{}' for {} players\n", summary.room_id, summary.name, capacity);
        return summary;
    }

    auto RoomCoordinator::JoinRoom(std::string const& room_id, std::string const& player_name, ConnId const conn)
        -> std::expected<JoinTicket, Violation>
    {
        std::shared_ptr<Room> const room = Find(room_id);
        if (!room)
            return std::unexpected(core::error::Viol(RVC::Room_NotFound).with_room(room_id));

        std::unique_lock<std::mutex> const lock = room->Lock();

        auto joined = room->Join(player_name, conn);
        if (!joined.has_value())
            return std::unexpected(std::move(joined.error()));

        JoinTicket const& ticket = joined->ticket;
        outbox_.Seated(conn, ticket);

        if (ticket.reconnected)
        {
            std::print("[Room {}] Seat {} reconnected\n", room_id, ticket.seat);
            outbox_.Deliver(room->RosterUpdate(RosterEvent::Reconnected, ticket.seat));
            outbox_.Deliver(room->StateFor(ticket.seat, conn));
            return ticket;
        }

        std::print("[Room {}] Seat {} joined\n", room_id, ticket.seat);
        outbox_.Deliver(room->RosterUpdate(RosterEvent::Joined, ticket.seat));

        if (joined->started_now)
        {
            core::MoveEffect eff{};
            eff.kind = core::EffectKind::LevelStarted;
            eff.message = std::format("Level {} started!", room->Game()->Level());
            std::print("[Room {}] Roster full, game started\n", room_id);
            outbox_.Deliver(room->StateUpdate(std::move(eff)));
        }
        return ticket;
    }

    auto RoomCoordinator::Submit(std::string const& room_id, core::PlyrIdxT const seat,
                                 core::PlayerAction const& action) -> core::SubmitResult
    {
        std::shared_ptr<Room> const room = Find(room_id);
        if (!room)
            return std::unexpected(core::error::Viol(RVC::Room_NotFound).with_room(room_id));

        std::unique_lock<std::mutex> const lock = room->Lock();

        core::SubmitResult res = room->Submit(seat, action);
        if (res.has_value())
        {
            outbox_.Deliver(room->StateUpdate(res->effect));
            if (core::IsTerminal(room->Game()->Status()))
            {
                std::print("[Room {}] Game over: {}\n", room_id,
                           core::error::to_string(room->Game()->Status()));
            }
        }
        return res;
    }

    auto RoomCoordinator::ListRooms() const -> std::vector<RoomSummary>
    {
        std::vector<RoomSummary> out;
        {
            std::shared_lock lock{map_mtx_};
            out.reserve(rooms_.size());
            for (auto const& [id, room] : rooms_)
            {
                out.push_back(room->Summary());
            }
        }
        // "room-9" before "room-10"
        std::ranges::sort(out, [](RoomSummary const& a, RoomSummary const& b)
        {
            if (a.room_id.size() != b.room_id.size()) return a.room_id.size() < b.room_id.size();
            return a.room_id < b.room_id;
        });
        return out;
    }

    auto RoomCoordinator::Detach(std::string const& room_id, core::PlyrIdxT const seat, ConnId const conn) -> bool
    {
        std::shared_ptr<Room> const room = Find(room_id);
        if (!room) return false;

        std::unique_lock<std::mutex> const lock = room->Lock();
        if (!room->Detach(seat, conn))
        {
            return false;
        }
        std::print("[Room {}] Seat {} disconnected\n", room_id, seat);
        outbox_.Deliver(room->RosterUpdate(RosterEvent::Left, seat));
        return true;
    }

    auto RoomCoordinator::CloseRoom(std::string const& room_id) -> bool
    {
        std::shared_ptr<Room> room;
        {
            std::unique_lock lock{map_mtx_};
            auto const it = rooms_.find(room_id);
            if (it == rooms_.end()) return false;
            room = std::move(it->second);
            rooms_.erase(it);
        }

        std::unique_lock<std::mutex> const lock = room->Lock();
        room->MarkClosed();
        outbox_.Deliver(room->RosterUpdate(RosterEvent::Closed, std::nullopt));
        std::print("[Room {}] Closed\n", room_id);
        return true;
    }

    auto RoomCoordinator::CollectIdle(EvictionPolicy const& policy, Clock::time_point const now)
        -> std::vector<std::string>
    {
        auto const idle_for = [now](RoomSummary const& s) -> Clock::duration
        {
            return s.idle_since ? now - *s.idle_since : Clock::duration::zero();
        };

        std::vector<std::shared_ptr<Room>> candidates;
        {
            std::shared_lock lock{map_mtx_};
            for (auto const& [id, room] : rooms_)
            {
                RoomSummary const s = room->Summary();
                if (policy.ShouldEvict(s, idle_for(s)))
                {
                    candidates.push_back(room);
                }
            }
        }

        std::vector<std::string> evicted;
        for (std::shared_ptr<Room> const& room : candidates)
        {
            std::unique_lock<std::mutex> const lock = room->Lock();
            // someone may have reattached since the scan
            RoomSummary const s = room->Summary();
            if (room->Closed() || !policy.ShouldEvict(s, idle_for(s)))
            {
                continue;
            }
            room->MarkClosed();
            evicted.push_back(room->Id());
        }

        if (!evicted.empty())
        {
            std::unique_lock lock{map_mtx_};
            for (std::string const& id : evicted)
            {
                rooms_.erase(id);
            }
        }
        return evicted;
    }

    auto RoomCoordinator::RoomCount() const -> size_t
    {
        std::shared_lock lock{map_mtx_};
        return rooms_.size();
    }

#if MND_ENABLE_TEST_HOOKS == true
    auto RoomCoordinator::DebugWithGame(std::string const& room_id,
                                        std::function<void(core::GameImpl&)> const& fn) -> bool
    {
        std::shared_ptr<Room> const room = Find(room_id);
        if (!room) return false;

        std::unique_lock<std::mutex> const lock = room->Lock();
        core::GameImpl* game = room->Game();
        if (!game) return false;
        fn(*game);
        return true;
    }
#endif
}
