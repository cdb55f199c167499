//
// codec.hpp
//

#ifndef MINDGAME_CODEC_HPP
#define MINDGAME_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <flatbuffers/flatbuffers.h>

#include "core/Types.hpp"
#include "core/Actions.hpp"
#include "core/State.hpp"
#include "core/Exception.hpp"
#include "server/RoomTypes.hpp"

#include "generated/flatbuffers/mind_net_generated.h"

namespace mind::net
{
    // Why a frame could not be turned into a command
    struct ParseError
    {
        core::error::RuleViolation violation;
        std::string message;
    };

    struct CreateRoomCmd
    {
        std::string name;
        int capacity{};
    };

    struct JoinRoomCmd
    {
        std::string room_id;
        std::string player_name;
    };

    struct ListRoomsCmd {};

    // Game actions carry no seat; the connection's attachment decides it
    struct ActionCmd
    {
        core::PlayerAction action;
    };

    using ClientCommand = std::variant<CreateRoomCmd, JoinRoomCmd, ListRoomsCmd, ActionCmd>;

    struct Inbound
    {
        std::uint64_t msg_id{};
        ClientCommand cmd;
    };

    auto ToFbStatus(core::GameStatus s) noexcept -> gen::net::GameStatus;
    auto FromFbStatus(gen::net::GameStatus s) noexcept -> core::GameStatus;
    auto ToFbEffect(core::EffectKind k) noexcept -> gen::net::EffectKind;
    auto ToFbRoster(server::RosterEvent e) noexcept -> gen::net::RosterEvent;

    // --- Inbound decode (verified envelope -> command) ---

    auto DecodeClientMessage(std::span<std::byte const> bytes) -> std::expected<Inbound, ParseError>;

    // --- Outbound builders (server -> client) ---

    auto BuildRoomCreated(server::RoomSummary const& room, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildJoined(server::JoinTicket const& ticket, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildRoomList(std::span<server::RoomSummary const> rooms, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // One viewer's copy of a state change: only that viewer's own hand carries card values.
    auto BuildStateUpdate(server::RoomUpdate const& update,
                          server::Delivery const& to,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildRoster(server::RoomUpdate const& update, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildError(core::error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildInternalError(std::string_view message, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Builders (client -> server) ---

    auto BuildCreateRoom(std::string_view name, std::uint8_t capacity, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildJoinRoom(std::string_view room_id, std::string_view player_name, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildListRooms(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildPlayCard(std::uint16_t card, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildUseStar(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildAdvanceLevel(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Client-side helper: verify and return the root, or nullptr
    auto ReadEnvelope(std::span<std::uint8_t const> bytes) -> gen::net::Envelope const*;
} // namespace mind::net

#endif //MINDGAME_CODEC_HPP
