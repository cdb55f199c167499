//
// codec.cpp
//
#include "net/codec.hpp"

#include <format>
#include <utility>
#include <vector>

namespace fb = mind::gen::net;

namespace mind::net
{
    auto ToFbStatus(core::GameStatus s) noexcept -> fb::GameStatus
    {
        switch (s)
        {
        case core::GameStatus::Setup: return fb::GameStatus::Setup;
        case core::GameStatus::InProgress: return fb::GameStatus::InProgress;
        case core::GameStatus::LevelClear: return fb::GameStatus::LevelClear;
        case core::GameStatus::Won: return fb::GameStatus::Won;
        case core::GameStatus::Lost: return fb::GameStatus::Lost;
        }
        return fb::GameStatus::Setup;
    }

    auto FromFbStatus(fb::GameStatus s) noexcept -> core::GameStatus
    {
        switch (s)
        {
        case fb::GameStatus::Setup: return core::GameStatus::Setup;
        case fb::GameStatus::InProgress: return core::GameStatus::InProgress;
        case fb::GameStatus::LevelClear: return core::GameStatus::LevelClear;
        case fb::GameStatus::Won: return core::GameStatus::Won;
        case fb::GameStatus::Lost: return core::GameStatus::Lost;
        }
        return core::GameStatus::Setup;
    }

    auto ToFbEffect(core::EffectKind k) noexcept -> fb::EffectKind
    {
        switch (k)
        {
        case core::EffectKind::None: return fb::EffectKind::NoEffect;
        case core::EffectKind::Played: return fb::EffectKind::Played;
        case core::EffectKind::Mistake: return fb::EffectKind::Mistake;
        case core::EffectKind::StarThrown: return fb::EffectKind::StarThrown;
        case core::EffectKind::LevelStarted: return fb::EffectKind::LevelStarted;
        case core::EffectKind::GameWon: return fb::EffectKind::GameWon;
        }
        return fb::EffectKind::NoEffect;
    }

    auto ToFbRoster(server::RosterEvent e) noexcept -> fb::RosterEvent
    {
        switch (e)
        {
        case server::RosterEvent::Joined: return fb::RosterEvent::Joined;
        case server::RosterEvent::Left: return fb::RosterEvent::Left;
        case server::RosterEvent::Reconnected: return fb::RosterEvent::Reconnected;
        case server::RosterEvent::Closed: return fb::RosterEvent::Closed;
        }
        return fb::RosterEvent::Joined;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(mind::core::GameStatus::LevelClear) == static_cast<int>(fb::GameStatus::LevelClear));
    static_assert(static_cast<int>(mind::core::EffectKind::StarThrown) == static_cast<int>(fb::EffectKind::StarThrown));
    static_assert(static_cast<int>(mind::core::error::ErrorKind::NotFound) == static_cast<int>(fb::ErrorKind::NotFound));

    auto ToFbKind(mind::core::error::ErrorKind k) noexcept -> fb::ErrorKind
    {
        switch (k)
        {
        case mind::core::error::ErrorKind::Validation: return fb::ErrorKind::Validation;
        case mind::core::error::ErrorKind::TerminalState: return fb::ErrorKind::TerminalState;
        case mind::core::error::ErrorKind::NotFound: return fb::ErrorKind::NotFound;
        }
        return fb::ErrorKind::Internal;
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t msg_id,
                fb::Message type, flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, msg_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    auto Malformed(std::string message) -> mind::net::ParseError
    {
        return mind::net::ParseError{
            mind::core::error::Viol(mind::core::error::RuleViolationCode::Msg_Malformed),
            std::move(message)
        };
    }

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto PlayerSlots(flatbuffers::FlatBufferBuilder& fbb, std::vector<mind::server::SeatInfo> const& roster)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::PlayerSlot>>>
    {
        std::vector<flatbuffers::Offset<fb::PlayerSlot>> slots;
        slots.reserve(roster.size());
        for (mind::server::SeatInfo const& s : roster)
        {
            slots.push_back(fb::CreatePlayerSlot(fbb, s.seat, fbb.CreateString(s.name), s.connected));
        }
        return fbb.CreateVector(slots);
    }
} // anonymous

namespace mind::net
{
    // ---------- Decode (server <- inbound wire) ----------

    auto DecodeClientMessage(std::span<std::byte const> bytes) -> std::expected<Inbound, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(Malformed("buffer too small"));

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier{data, bytes.size()};
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(Malformed("envelope failed verification"));

        auto const* env = fb::GetEnvelope(data);

        Inbound out{};
        out.msg_id = env->msg_id();

        switch (env->message_type())
        {
        case fb::Message::CreateRoomMsg:
        {
            auto const* m = env->message_as_CreateRoomMsg();
            out.cmd = CreateRoomCmd{Str(m->name()), static_cast<int>(m->capacity())};
            return out;
        }

        case fb::Message::JoinRoomMsg:
        {
            auto const* m = env->message_as_JoinRoomMsg();
            if (!m->room_id() || m->room_id()->size() == 0)
                return std::unexpected(Malformed("join_room without room_id"));
            out.cmd = JoinRoomCmd{Str(m->room_id()), Str(m->player_name())};
            return out;
        }

        case fb::Message::ListRoomsMsg:
            out.cmd = ListRoomsCmd{};
            return out;

        case fb::Message::PlayCardMsg:
        {
            std::uint16_t const card = env->message_as_PlayCardMsg()->card();
            if (!core::ValidCard(card))
            {
                return std::unexpected(ParseError{
                    core::error::Viol(core::error::RuleViolationCode::Play_CardOutOfRange).with_card(card),
                    std::format("card {} outside {}..{}", card, core::constants::CardMin, core::constants::CardMax)
                });
            }
            out.cmd = ActionCmd{core::PlayCardAction{static_cast<core::CardT>(card)}};
            return out;
        }

        case fb::Message::UseStarMsg:
            out.cmd = ActionCmd{core::ThrowStarAction{}};
            return out;

        case fb::Message::AdvanceLevelMsg:
            out.cmd = ActionCmd{core::AdvanceLevelAction{}};
            return out;

        default:
            return std::unexpected(ParseError{
                core::error::Viol(core::error::RuleViolationCode::Msg_UnknownType),
                std::format("unexpected message type {}", static_cast<int>(env->message_type()))
            });
        }
    }

    // ---------- Builders (server -> client) ----------

    auto BuildRoomCreated(server::RoomSummary const& room, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(room.room_id);
        auto const name = fbb.CreateString(room.name);
        auto const m = fb::CreateRoomCreatedMsg(fbb, id, name, room.capacity);
        return Finish(fbb, msg_id, fb::Message::RoomCreatedMsg, m.Union());
    }

    auto BuildJoined(server::JoinTicket const& ticket, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(ticket.room_id);
        auto const m = fb::CreateJoinedMsg(fbb, id, ticket.seat, ticket.capacity, ticket.reconnected);
        return Finish(fbb, msg_id, fb::Message::JoinedMsg, m.Union());
    }

    auto BuildRoomList(std::span<server::RoomSummary const> rooms, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::RoomInfo>> infos;
        infos.reserve(rooms.size());
        for (server::RoomSummary const& r : rooms)
        {
            auto const id = fbb.CreateString(r.room_id);
            auto const name = fbb.CreateString(r.name);
            infos.push_back(fb::CreateRoomInfo(fbb, id, name, r.occupancy, r.capacity,
                                               ToFbStatus(r.status), r.started));
        }

        auto const m = fb::CreateRoomListMsg(fbb, fbb.CreateVector(infos));
        return Finish(fbb, msg_id, fb::Message::RoomListMsg, m.Union());
    }

    auto BuildStateUpdate(server::RoomUpdate const& update,
                          server::Delivery const& to,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        core::GameSnapshot const* snap = to.snapshot.get();

        // Hands: names from the roster, counts from the snapshot, values for the viewer only
        std::vector<flatbuffers::Offset<fb::HandView>> hands;
        hands.reserve(update.roster.size());
        for (server::SeatInfo const& s : update.roster)
        {
            uint8_t count{};
            if (snap && s.seat < snap->hand_counts.size())
            {
                count = snap->hand_counts[s.seat];
            }

            flatbuffers::Offset<flatbuffers::Vector<uint8_t>> cards{};
            if (snap && s.seat == to.seat)
            {
                cards = fbb.CreateVector(snap->my_hand);
            }

            auto const name = fbb.CreateString(s.name);
            hands.push_back(fb::CreateHandView(fbb, s.seat, name, s.connected, count, cards));
        }
        auto const hands_vec = fbb.CreateVector(hands);

        flatbuffers::Offset<fb::Effect> effect{};
        if (update.effect)
        {
            core::MoveEffect const& e = *update.effect;

            std::vector<fb::SeatCard> discarded;
            discarded.reserve(e.discarded.size());
            for (core::SeatCard const& sc : e.discarded)
            {
                discarded.emplace_back(sc.seat, sc.card);
            }

            auto const disc = fbb.CreateVectorOfStructs(discarded);
            auto const msg = fbb.CreateString(e.message);
            effect = fb::CreateEffect(fbb,
                                      ToFbEffect(e.kind),
                                      /*actor*/ e.actor ? static_cast<int16_t>(*e.actor) : int16_t{-1},
                                      /*card*/ e.card.value_or(0),
                                      disc,
                                      e.lives_lost,
                                      msg);
        }

        auto const room_id = fbb.CreateString(update.room_id);
        auto const pile = snap ? fbb.CreateVector(snap->pile) : fbb.CreateVector(std::vector<uint8_t>{});
        auto const discarded = snap ? fbb.CreateVector(snap->discarded) : fbb.CreateVector(std::vector<uint8_t>{});

        fb::StateUpdateMsgBuilder b{fbb};
        b.add_room_id(room_id);
        b.add_viewer(to.seat);
        b.add_pile(pile);
        b.add_discarded(discarded);
        b.add_hands(hands_vec);
        if (snap)
        {
            b.add_status(ToFbStatus(snap->status));
            b.add_level(snap->level);
            b.add_lives(snap->lives);
            b.add_max_lives(snap->max_lives);
            b.add_stars(snap->stars);
            b.add_max_stars(snap->max_stars);
            b.add_cards_in_play(snap->cards_in_play);
        }
        if (!effect.IsNull())
        {
            b.add_last_effect(effect);
        }
        auto const m = b.Finish();

        return Finish(fbb, msg_id, fb::Message::StateUpdateMsg, m.Union());
    }

    auto BuildRoster(server::RoomUpdate const& update, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const id = fbb.CreateString(update.room_id);
        auto const players = PlayerSlots(fbb, update.roster);
        auto const m = fb::CreateRosterMsg(
            fbb,
            id,
            ToFbRoster(update.event.value_or(server::RosterEvent::Joined)),
            /*subject*/ update.subject ? static_cast<int16_t>(*update.subject) : int16_t{-1},
            players,
            /*occupancy*/ static_cast<uint8_t>(update.roster.size()),
            update.capacity);

        return Finish(fbb, msg_id, fb::Message::RosterMsg, m.Union());
    }

    auto BuildError(core::error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const token = fbb.CreateString(core::error::to_token(v.code));
        auto const txt = fbb.CreateString(core::error::describe(v));
        auto const m = fb::CreateErrorMsg(fbb, ToFbKind(v.kind()), static_cast<uint16_t>(v.code), token, txt);
        return Finish(fbb, msg_id, fb::Message::ErrorMsg, m.Union());
    }

    auto BuildInternalError(std::string_view message, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const token = fbb.CreateString("internal");
        auto const txt = fbb.CreateString(message.data(), message.size());
        auto const m = fb::CreateErrorMsg(
            fbb, fb::ErrorKind::Internal,
            static_cast<uint16_t>(core::error::RuleViolationCode::Internal_Unreachable), token, txt);
        return Finish(fbb, msg_id, fb::Message::ErrorMsg, m.Union());
    }

    // ---------- Builders (client -> server) ----------

    auto BuildCreateRoom(std::string_view name, std::uint8_t capacity, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const n = fbb.CreateString(name.data(), name.size());
        auto const m = fb::CreateCreateRoomMsg(fbb, n, capacity);
        return Finish(fbb, msg_id, fb::Message::CreateRoomMsg, m.Union());
    }

    auto BuildJoinRoom(std::string_view room_id, std::string_view player_name, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(room_id.data(), room_id.size());
        auto const name = fbb.CreateString(player_name.data(), player_name.size());
        auto const m = fb::CreateJoinRoomMsg(fbb, id, name);
        return Finish(fbb, msg_id, fb::Message::JoinRoomMsg, m.Union());
    }

    auto BuildListRooms(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateListRoomsMsg(fbb);
        return Finish(fbb, msg_id, fb::Message::ListRoomsMsg, m.Union());
    }

    auto BuildPlayCard(std::uint16_t card, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreatePlayCardMsg(fbb, card);
        return Finish(fbb, msg_id, fb::Message::PlayCardMsg, m.Union());
    }

    auto BuildUseStar(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateUseStarMsg(fbb);
        return Finish(fbb, msg_id, fb::Message::UseStarMsg, m.Union());
    }

    auto BuildAdvanceLevel(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateAdvanceLevelMsg(fbb);
        return Finish(fbb, msg_id, fb::Message::AdvanceLevelMsg, m.Union());
    }

    auto ReadEnvelope(std::span<std::uint8_t const> bytes) -> fb::Envelope const*
    {
        flatbuffers::Verifier verifier{bytes.data(), bytes.size()};
        if (!fb::VerifyEnvelopeBuffer(verifier))
        {
            return nullptr;
        }
        return fb::GetEnvelope(bytes.data());
    }
} // namespace mind::net
