//
// SessionMultiplexer.hpp
//

#ifndef MINDGAME_SESSIONMULTIPLEXER_HPP
#define MINDGAME_SESSIONMULTIPLEXER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>

#include <flatbuffers/flatbuffers.h>

#include "core/Exception.hpp"
#include "net/Transport.hpp"
#include "net/codec.hpp"
#include "server/Lifecycle.hpp"
#include "server/RoomCoordinator.hpp"
#include "server/RoomTypes.hpp"

namespace mind::net
{
    // Maps connections onto rooms. Turns inbound frames into coordinator calls and
    // fans the coordinator's room updates back out, redacted per viewer.
    class SessionMultiplexer final : public server::Outbox
    {
    public:
        explicit SessionMultiplexer(Transport& transport);

        SessionMultiplexer(SessionMultiplexer const&) = delete;
        auto operator=(SessionMultiplexer const&) -> SessionMultiplexer& = delete;

        // Must be called once before the first OnMessage
        auto Bind(server::RoomCoordinator& coord, server::LifecycleManager& lifecycle) -> void;

        auto OnOpen(ConnId conn) -> void;
        auto OnMessage(ConnId conn, std::span<std::byte const> bytes) -> void;
        auto OnClose(ConnId conn) -> void;

        [[nodiscard]]
        auto AttachmentOf(ConnId conn) const -> std::optional<server::Attachment>;

        [[nodiscard]]
        auto ConnectionCount() const -> std::size_t;

        // server::Outbox
        auto Seated(ConnId conn, server::JoinTicket const& ticket) -> void override;
        auto Deliver(server::RoomUpdate const& update) -> void override;

    private:
        auto Dispatch(ConnId conn, Inbound const& in) -> void;
        auto IsOpen(ConnId conn) const -> bool;

        auto SendBuffer(ConnId conn, flatbuffers::DetachedBuffer const& buf) -> void;
        auto SendError(ConnId conn, core::error::RuleViolation const& v) -> void;
        auto NextMsgId() -> std::uint64_t { return next_msg_id_.fetch_add(1); }

    private:
        Transport& transport_;
        server::RoomCoordinator* coord_{nullptr};
        server::LifecycleManager* lifecycle_{nullptr};

        // Never held while calling into the coordinator
        mutable std::mutex mtx_;
        std::unordered_map<ConnId, std::optional<server::Attachment>> conns_;

        std::atomic<std::uint64_t> next_msg_id_{1};
    };
}

#endif //MINDGAME_SESSIONMULTIPLEXER_HPP
