//
// Room.cpp
//

#include "server/Room.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <print>

#include "core/MindRules.hpp"

namespace mind::server
{
    namespace
    {
        constexpr Clock::rep NotIdle = std::numeric_limits<Clock::rep>::min();
    }

    Room::Room(std::string id, std::string name, uint8_t const capacity, uint64_t const seed,
               std::optional<std::filesystem::path> audit_path)
        : id_{std::move(id)}
          , name_{std::move(name)}
          , capacity_{capacity}
          , seed_{seed}
          , audit_path_{std::move(audit_path)}
          , idle_since_{Clock::now().time_since_epoch().count()}
    {
        MND_ASSERT(core::ValidPlayerCount(capacity_), "Room built with invalid capacity");
        seats_.reserve(capacity_);
    }

    auto Room::Summary() const -> RoomSummary
    {
        RoomSummary s{};
        s.room_id = id_;
        s.name = name_;
        s.capacity = capacity_;
        s.occupancy = occupancy_.load();
        s.attached = attached_.load();
        s.status = status_.load();
        s.started = started_.load();
        if (Clock::rep const idle = idle_since_.load(); idle != NotIdle)
        {
            s.idle_since = Clock::time_point{Clock::duration{idle}};
        }
        return s;
    }

    auto Room::Join(std::string const& player_name, ConnId const conn)
        -> std::expected<JoinOutcome, core::error::RuleViolation>
    {
        using RVC = core::error::RuleViolationCode;

        if (closed_)
            return std::unexpected(core::error::Viol(RVC::Room_NotFound).with_room(id_));

        auto const taken = [&](std::string const& n)
        {
            return std::ranges::any_of(seats_, [&](Seat const& s) { return s.name == n; });
        };

        // A generated name never matches an existing seat, so an anonymous join always takes a new one
        bool const anonymous = player_name.empty();
        std::string name = player_name;
        for (std::size_t n = seats_.size() + 1; anonymous && (name.empty() || taken(name)); ++n)
        {
            name = std::format("Player {}", n);
        }

        JoinOutcome out{};
        out.ticket.room_id = id_;
        out.ticket.capacity = capacity_;

        auto const same_name = anonymous
                                   ? seats_.end()
                                   : std::ranges::find_if(seats_, [&](Seat const& s) { return s.name == name; });
        if (same_name != seats_.end())
        {
            if (same_name->conn.has_value())
                return std::unexpected(core::error::Viol(RVC::Seat_NameTaken).with_room(id_));

            // same identity coming back: the seat, hand and counters are untouched
            same_name->conn = conn;
            out.ticket.seat = static_cast<core::PlyrIdxT>(same_name - seats_.begin());
            out.ticket.reconnected = true;
            RefreshCounters();
            return out;
        }

        if (seats_.size() >= capacity_)
            return std::unexpected(core::error::Viol(RVC::Room_Full)
                                   .with_room(id_).with_capacity(capacity_));

        seats_.push_back(Seat{name, conn});
        out.ticket.seat = static_cast<core::PlyrIdxT>(seats_.size() - 1);

        if (seats_.size() == capacity_ && !game_)
        {
            StartGame();
            out.started_now = true;
        }
        RefreshCounters();
        return out;
    }

    auto Room::StartGame() -> void
    {
        core::Config cfg{};
        cfg.n_players = capacity_;
        cfg.seed = seed_;

        game_ = std::make_unique<core::GameImpl>(cfg, std::make_unique<core::MindRules>());
        game_->SetupLevel();

        if (audit_path_)
        {
            audit_ = std::make_unique<core::debug::AuditLogger>(audit_path_->string());
            if (!audit_->is_open())
            {
                std::print("[Room {}] Could not open audit log {}\n", id_, audit_path_->string());
                audit_.reset();
            }
            else
            {
                audit_->start(*game_);
                audit_->level(*game_);
            }
        }
    }

    auto Room::Detach(core::PlyrIdxT const seat, ConnId const conn) -> bool
    {
        if (seat >= seats_.size() || seats_[seat].conn != conn)
        {
            return false;
        }
        seats_[seat].conn.reset();
        RefreshCounters();
        return true;
    }

    auto Room::Submit(core::PlyrIdxT const seat, core::PlayerAction const& action) -> core::SubmitResult
    {
        using RVC = core::error::RuleViolationCode;

        if (closed_)
            return std::unexpected(core::error::Viol(RVC::Room_NotFound).with_room(id_));
        if (!game_)
            return std::unexpected(core::error::Viol(RVC::Room_NotStarted).with_room(id_));
        if (seat >= seats_.size())
            return std::unexpected(core::error::Viol(RVC::Seat_NotFound).with_room(id_).with_actor(seat));

        if (audit_) audit_->action(seat, action);

        core::SubmitResult res = game_->Submit(seat, action);

        if (audit_)
        {
            if (res.has_value())
            {
                audit_->outcome(*res, *game_);
                if (core::IsTerminal(game_->Status())) audit_->end(*game_);
            }
            else
            {
                audit_->rejected(res.error());
            }
        }

        if (!res.has_value())
        {
            res.error().with_room(id_);
        }
        RefreshCounters();
        return res;
    }

    auto Room::RefreshCounters() -> void
    {
        auto const attached = static_cast<uint8_t>(
            std::ranges::count_if(seats_, [](Seat const& s) { return s.conn.has_value(); }));

        occupancy_.store(static_cast<uint8_t>(seats_.size()));
        status_.store(game_ ? game_->Status() : core::GameStatus::Setup);
        started_.store(game_ != nullptr);

        uint8_t const before = attached_.exchange(attached);
        if (attached > 0)
        {
            idle_since_.store(NotIdle);
        }
        else if (before > 0 || idle_since_.load() == NotIdle)
        {
            idle_since_.store(Clock::now().time_since_epoch().count());
        }
    }

    auto Room::Roster() const -> std::vector<SeatInfo>
    {
        std::vector<SeatInfo> out;
        out.reserve(seats_.size());
        for (size_t i{}; i < seats_.size(); ++i)
        {
            out.push_back(SeatInfo{static_cast<core::PlyrIdxT>(i), seats_[i].name, seats_[i].conn.has_value()});
        }
        return out;
    }

    auto Room::Snapshot(core::PlyrIdxT const seat) const -> std::shared_ptr<core::GameSnapshot const>
    {
        if (!game_) return nullptr;
        return game_->SnapshotFor(seat);
    }

    auto Room::StateUpdate(std::optional<core::MoveEffect> effect) const -> RoomUpdate
    {
        RoomUpdate up{};
        up.kind = RoomUpdate::Kind::State;
        up.room_id = id_;
        up.capacity = capacity_;
        up.roster = Roster();
        up.effect = std::move(effect);

        for (size_t i{}; i < seats_.size(); ++i)
        {
            if (!seats_[i].conn) continue;
            auto const seat = static_cast<core::PlyrIdxT>(i);
            up.deliveries.push_back(Delivery{*seats_[i].conn, seat, Snapshot(seat)});
        }
        return up;
    }

    auto Room::RosterUpdate(RosterEvent const event, std::optional<core::PlyrIdxT> const subject) const -> RoomUpdate
    {
        RoomUpdate up{};
        up.kind = RoomUpdate::Kind::Roster;
        up.room_id = id_;
        up.capacity = capacity_;
        up.roster = Roster();
        up.event = event;
        up.subject = subject;

        for (size_t i{}; i < seats_.size(); ++i)
        {
            if (!seats_[i].conn) continue;
            up.deliveries.push_back(Delivery{*seats_[i].conn, static_cast<core::PlyrIdxT>(i), nullptr});
        }
        return up;
    }

    auto Room::StateFor(core::PlyrIdxT const seat, ConnId const conn) const -> RoomUpdate
    {
        RoomUpdate up{};
        up.kind = RoomUpdate::Kind::State;
        up.room_id = id_;
        up.capacity = capacity_;
        up.roster = Roster();
        up.deliveries.push_back(Delivery{conn, seat, Snapshot(seat)});
        return up;
    }
}
