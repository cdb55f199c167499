//
// SessionMultiplexer.cpp
//

#include "net/SessionMultiplexer.hpp"

#include <print>
#include <type_traits>
#include <variant>

namespace mind::net
{
    using RVC = core::error::RuleViolationCode;

    SessionMultiplexer::SessionMultiplexer(Transport& transport)
        : transport_{transport}
    {
    }

    auto SessionMultiplexer::Bind(server::RoomCoordinator& coord, server::LifecycleManager& lifecycle) -> void
    {
        coord_ = &coord;
        lifecycle_ = &lifecycle;
    }

    auto SessionMultiplexer::OnOpen(ConnId const conn) -> void
    {
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            conns_.emplace(conn, std::nullopt);
        }
        if (lifecycle_) lifecycle_->Touch(conn);
    }

    auto SessionMultiplexer::OnClose(ConnId const conn) -> void
    {
        std::optional<server::Attachment> where;
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            auto const it = conns_.find(conn);
            if (it == conns_.end()) return;
            where = std::move(it->second);
            conns_.erase(it);
        }
        if (lifecycle_) lifecycle_->OnDisconnect(conn, where);
    }

    auto SessionMultiplexer::OnMessage(ConnId const conn, std::span<std::byte const> bytes) -> void
    {
        MND_ASSERT(coord_ != nullptr && lifecycle_ != nullptr, "SessionMultiplexer used before Bind()");
        lifecycle_->Touch(conn);

        std::expected<Inbound, ParseError> parsed = DecodeClientMessage(bytes);
        if (!parsed.has_value())
        {
            std::print("[Server] conn {} parse error: {}\n", conn, parsed.error().message);
            SendError(conn, parsed.error().violation);
            return;
        }

        // A broken invariant fails this message only; the room and the process carry on.
        try
        {
            Dispatch(conn, *parsed);
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print("[Server] conn {} internal error: {}\n{}", conn, e, e.to_str());
            SendBuffer(conn, BuildInternalError(e.what(), NextMsgId()));
        }
    }

    auto SessionMultiplexer::Dispatch(ConnId const conn, Inbound const& in) -> void
    {
        std::optional<server::Attachment> const attached = AttachmentOf(conn);

        std::visit(
            [&]<typename T0>(T0 const& cmd)
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, CreateRoomCmd>)
                {
                    auto created = coord_->CreateRoom(cmd.name, cmd.capacity);
                    if (!created.has_value())
                    {
                        SendError(conn, created.error());
                        return;
                    }
                    SendBuffer(conn, BuildRoomCreated(*created, NextMsgId()));
                }
                else if constexpr (std::is_same_v<T, JoinRoomCmd>)
                {
                    if (attached.has_value())
                    {
                        SendError(conn, core::error::Viol(RVC::Room_AlreadyJoined).with_room(attached->room_id));
                        return;
                    }
                    auto joined = coord_->JoinRoom(cmd.room_id, cmd.player_name, conn);
                    if (!joined.has_value())
                    {
                        SendError(conn, joined.error());
                        return;
                    }
                    // closed while the join was in flight: give the seat back
                    if (!IsOpen(conn))
                    {
                        coord_->Detach(joined->room_id, joined->seat, conn);
                    }
                }
                else if constexpr (std::is_same_v<T, ListRoomsCmd>)
                {
                    std::vector<server::RoomSummary> const rooms = coord_->ListRooms();
                    SendBuffer(conn, BuildRoomList(rooms, NextMsgId()));
                }
                else
                {
                    if (!attached.has_value())
                    {
                        SendError(conn, core::error::Viol(RVC::Room_NotJoined));
                        return;
                    }
                    // Accepted actions are broadcast by Deliver(); only rejections are answered here
                    core::SubmitResult const res = coord_->Submit(attached->room_id, attached->seat, cmd.action);
                    if (!res.has_value())
                    {
                        SendError(conn, res.error());
                    }
                }
            },
            in.cmd
        );
    }

    auto SessionMultiplexer::Seated(ConnId const conn, server::JoinTicket const& ticket) -> void
    {
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            auto const it = conns_.find(conn);
            if (it == conns_.end())
            {
                return;
            }
            it->second = server::Attachment{ticket.room_id, ticket.seat};
        }
        SendBuffer(conn, BuildJoined(ticket, NextMsgId()));
    }

    auto SessionMultiplexer::Deliver(server::RoomUpdate const& update) -> void
    {
        if (update.kind == server::RoomUpdate::Kind::Roster)
        {
            flatbuffers::DetachedBuffer const buf = BuildRoster(update, NextMsgId());
            for (server::Delivery const& d : update.deliveries)
            {
                SendBuffer(d.conn, buf);
            }

            if (update.event == server::RosterEvent::Closed)
            {
                std::lock_guard<std::mutex> const lock{mtx_};
                for (server::Delivery const& d : update.deliveries)
                {
                    auto const it = conns_.find(d.conn);
                    if (it != conns_.end() && it->second && it->second->room_id == update.room_id)
                    {
                        it->second.reset();
                    }
                }
            }
            return;
        }

        for (server::Delivery const& d : update.deliveries)
        {
            SendBuffer(d.conn, BuildStateUpdate(update, d, NextMsgId()));
        }
    }

    auto SessionMultiplexer::AttachmentOf(ConnId const conn) const -> std::optional<server::Attachment>
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        auto const it = conns_.find(conn);
        if (it == conns_.end()) return std::nullopt;
        return it->second;
    }

    auto SessionMultiplexer::ConnectionCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        return conns_.size();
    }

    auto SessionMultiplexer::IsOpen(ConnId const conn) const -> bool
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        return conns_.contains(conn);
    }

    auto SessionMultiplexer::SendBuffer(ConnId const conn, flatbuffers::DetachedBuffer const& buf) -> void
    {
        if (!transport_.Send(conn, std::span<std::uint8_t const>{buf.data(), buf.size()}))
        {
            std::print("[Server] send to conn {} dropped ({} bytes)\n", conn, buf.size());
        }
    }

    auto SessionMultiplexer::SendError(ConnId const conn, core::error::RuleViolation const& v) -> void
    {
        SendBuffer(conn, BuildError(v, NextMsgId()));
    }
}
