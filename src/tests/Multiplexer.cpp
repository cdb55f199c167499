#include <gtest/gtest.h>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/Game.hpp"
#include "../debug/Inspector.hpp"
#include "../net/SessionMultiplexer.hpp"
#include "../net/Transport.hpp"
#include "../net/codec.hpp"
#include "../server/Eviction.hpp"
#include "../server/Lifecycle.hpp"
#include "../server/RoomCoordinator.hpp"

using namespace mind;
using mind::server::ConnId;
namespace fb = mind::gen::net;

namespace
{
class RecordingTransport final : public net::Transport
{
public:
    auto Send(ConnId conn, std::span<std::uint8_t const> bytes) -> bool override
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        frames_[conn].emplace_back(bytes.begin(), bytes.end());
        return true;
    }

    auto Frames(ConnId conn) const -> std::vector<std::vector<std::uint8_t>>
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        auto const it = frames_.find(conn);
        return it == frames_.end() ? std::vector<std::vector<std::uint8_t>>{} : it->second;
    }

    auto Clear() -> void
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        frames_.clear();
    }

private:
    mutable std::mutex mtx_;
    std::map<ConnId, std::vector<std::vector<std::uint8_t>>> frames_;
};

struct Harness
{
    RecordingTransport transport;
    net::SessionMultiplexer mux{transport};
    server::RoomCoordinator coord{mux, server::CoordinatorOptions{.seed = 5}};
    server::LifecycleManager life;

    explicit Harness(std::optional<server::Clock::duration> liveness = std::nullopt)
        : life{coord, std::make_unique<server::NeverEvict>(), liveness}
    {
        mux.Bind(coord, life);
        // a real transport reports the close back through the multiplexer
        life.OnStale([this](ConnId conn) { mux.OnClose(conn); });
    }

    auto Send(ConnId conn, flatbuffers::DetachedBuffer const& buf) -> void
    {
        mux.OnMessage(conn, std::as_bytes(std::span<std::uint8_t const>{buf.data(), buf.size()}));
    }

    auto Types(ConnId conn) const -> std::vector<fb::Message>
    {
        std::vector<fb::Message> out;
        for (auto const& f : transport.Frames(conn))
        {
            auto const* env = net::ReadEnvelope(f);
            out.push_back(env ? env->message_type() : fb::Message::NONE);
        }
        return out;
    }

    // Two connections seated in a started 2-player room
    auto Pair(ConnId a, ConnId b) -> std::string
    {
        mux.OnOpen(a);
        mux.OnOpen(b);
        auto created = coord.CreateRoom("pair", 2);
        EXPECT_TRUE(created.has_value());
        Send(a, net::BuildJoinRoom(created->room_id, "ann", 1));
        Send(b, net::BuildJoinRoom(created->room_id, "ben", 2));
        return created->room_id;
    }
};

struct ErrorView
{
    fb::ErrorKind kind{};
    std::string token;
};

auto LastError(std::vector<std::vector<std::uint8_t>> const& frames) -> std::optional<ErrorView>
{
    if (frames.empty()) return std::nullopt;
    auto const* env = net::ReadEnvelope(frames.back());
    if (!env || env->message_type() != fb::Message::ErrorMsg) return std::nullopt;
    auto const* e = env->message_as_ErrorMsg();
    return ErrorView{e->kind(), e->token() ? e->token()->str() : std::string{}};
}

// Copies the last StateUpdate's hands out of the frame: seat -> (count, cards)
struct HandsView
{
    std::vector<std::uint8_t> counts;
    std::vector<std::vector<std::uint8_t>> cards;
    std::vector<bool> has_cards;
    std::string message;
    std::uint8_t lives{};
};

auto LastState(std::vector<std::vector<std::uint8_t>> const& frames) -> std::optional<HandsView>
{
    for (auto it = frames.rbegin(); it != frames.rend(); ++it)
    {
        auto const* env = net::ReadEnvelope(*it);
        if (!env || env->message_type() != fb::Message::StateUpdateMsg) continue;

        auto const* su = env->message_as_StateUpdateMsg();
        HandsView v{};
        v.lives = su->lives();
        if (su->last_effect() && su->last_effect()->message())
        {
            v.message = su->last_effect()->message()->str();
        }
        for (auto const* h : *su->hands())
        {
            v.counts.push_back(h->count());
            v.has_cards.push_back(h->cards() != nullptr);
            v.cards.emplace_back();
            if (h->cards())
            {
                v.cards.back().assign(h->cards()->begin(), h->cards()->end());
            }
        }
        return v;
    }
    return std::nullopt;
}
} // anonymous namespace

TEST(Multiplexer, MalformedFrameAnswersSenderOnly)
{
    Harness h;
    h.mux.OnOpen(1);
    h.mux.OnOpen(2);

    std::vector<std::byte> junk(16, std::byte{0x7f});
    h.mux.OnMessage(1, junk);

    auto const err = LastError(h.transport.Frames(1));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->token, "malformed");
    EXPECT_TRUE(h.transport.Frames(2).empty());

    std::vector<std::byte> tiny(2, std::byte{0});
    h.mux.OnMessage(2, tiny);
    ASSERT_TRUE(LastError(h.transport.Frames(2)).has_value());
}

TEST(Multiplexer, ServerOnlyMessageIsRejected)
{
    Harness h;
    h.mux.OnOpen(1);
    h.Send(1, net::BuildInternalError("not from a client", 1));

    auto const err = LastError(h.transport.Frames(1));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->token, "malformed");
}

TEST(Multiplexer, CreateAndListRooms)
{
    Harness h;
    h.mux.OnOpen(1);

    h.Send(1, net::BuildCreateRoom("friday", 3, 1));
    h.Send(1, net::BuildCreateRoom("", 3, 2));
    h.Send(1, net::BuildListRooms(3));

    auto const frames = h.transport.Frames(1);
    ASSERT_EQ(frames.size(), 3u);

    auto const* created = net::ReadEnvelope(frames[0]);
    ASSERT_NE(created, nullptr);
    ASSERT_EQ(created->message_type(), fb::Message::RoomCreatedMsg);
    std::string const id = created->message_as_RoomCreatedMsg()->room_id()->str();
    EXPECT_EQ(created->message_as_RoomCreatedMsg()->capacity(), 3);

    auto const* rejected = net::ReadEnvelope(frames[1]);
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->message_type(), fb::Message::ErrorMsg);

    auto const* list = net::ReadEnvelope(frames[2]);
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->message_type(), fb::Message::RoomListMsg);
    auto const* rooms = list->message_as_RoomListMsg()->rooms();
    ASSERT_EQ(rooms->size(), 1u);
    EXPECT_EQ(rooms->Get(0)->room_id()->str(), id);
    EXPECT_EQ(rooms->Get(0)->name()->str(), "friday");
    EXPECT_EQ(rooms->Get(0)->occupancy(), 0);
    EXPECT_EQ(rooms->Get(0)->status(), fb::GameStatus::Setup);

    // creating does not seat the creator
    EXPECT_FALSE(h.mux.AttachmentOf(1).has_value());
}

TEST(Multiplexer, JoinErrorsUseWireTokens)
{
    Harness h;
    std::string const id = h.Pair(1, 2);
    h.mux.OnOpen(3);

    h.Send(3, net::BuildJoinRoom("room-999", "zed", 1));
    auto err = LastError(h.transport.Frames(3));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->token, "room_not_found");
    EXPECT_EQ(err->kind, fb::ErrorKind::NotFound);

    h.Send(3, net::BuildJoinRoom(id, "zed", 2));
    err = LastError(h.transport.Frames(3));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->token, "room_full");

    h.Send(3, net::BuildPlayCard(10, 3));
    err = LastError(h.transport.Frames(3));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, fb::ErrorKind::Validation);
}

TEST(Multiplexer, StateUpdateIsRedactedPerViewer)
{
    Harness h;
    h.Pair(1, 2);
    h.mux.OnOpen(3);

    ASSERT_TRUE(h.mux.AttachmentOf(1).has_value());
    EXPECT_EQ(h.mux.AttachmentOf(1)->seat, 0);
    EXPECT_EQ(h.mux.AttachmentOf(2)->seat, 1);

    // Joined comes before any broadcast about the join
    auto const types = h.Types(2);
    ASSERT_GE(types.size(), 3u);
    EXPECT_EQ(types[0], fb::Message::JoinedMsg);
    EXPECT_EQ(types[1], fb::Message::RosterMsg);
    EXPECT_EQ(types[2], fb::Message::StateUpdateMsg);

    for (ConnId conn : {ConnId{1}, ConnId{2}})
    {
        auto const v = LastState(h.transport.Frames(conn));
        ASSERT_TRUE(v.has_value());
        ASSERT_EQ(v->counts.size(), 2u);
        EXPECT_EQ(v->counts[0], 1);
        EXPECT_EQ(v->counts[1], 1);

        std::size_t const own = conn - 1;
        std::size_t const other = 1 - own;
        EXPECT_TRUE(v->has_cards[own]);
        EXPECT_EQ(v->cards[own].size(), 1u);
        EXPECT_FALSE(v->has_cards[other]);
    }

    // a bystander never hears about the room
    EXPECT_TRUE(h.transport.Frames(3).empty());
}

TEST(Multiplexer, RejectedMoveGoesToOriginatorOnly)
{
    Harness h;
    std::string const id = h.Pair(1, 2);
    ASSERT_TRUE(h.coord.DebugWithGame(id, [](core::GameImpl& g) { core::debug::Inspector::Rig(g, {{10}, {50}}); }));
    h.transport.Clear();

    h.Send(2, net::BuildPlayCard(10, 7));
    auto const err = LastError(h.transport.Frames(2));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->token, "invalid_move");
    EXPECT_TRUE(h.transport.Frames(1).empty());

    h.Send(2, net::BuildPlayCard(0, 8));
    ASSERT_TRUE(LastError(h.transport.Frames(2)).has_value());
    EXPECT_EQ(LastError(h.transport.Frames(2))->token, "invalid_move");
    EXPECT_TRUE(h.transport.Frames(1).empty());
}

TEST(Multiplexer, AcceptedMoveIsBroadcast)
{
    Harness h;
    std::string const id = h.Pair(1, 2);
    ASSERT_TRUE(h.coord.DebugWithGame(id, [](core::GameImpl& g) { core::debug::Inspector::Rig(g, {{10, 60}, {50}}); }));
    h.transport.Clear();

    h.Send(1, net::BuildPlayCard(10, 9));

    for (ConnId conn : {ConnId{1}, ConnId{2}})
    {
        auto const frames = h.transport.Frames(conn);
        ASSERT_EQ(frames.size(), 1u);
        auto const v = LastState(frames);
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(v->message, "Card 10 played successfully!");
        EXPECT_EQ(v->counts[0], 1);
    }

    auto const own = LastState(h.transport.Frames(1));
    EXPECT_EQ(own->cards[0], (std::vector<std::uint8_t>{60}));
}

TEST(Multiplexer, TerminalGameAnswersGameOver)
{
    Harness h;
    std::string const id = h.Pair(1, 2);
    ASSERT_TRUE(h.coord.DebugWithGame(id, [](core::GameImpl& g)
    {
        core::debug::Inspector::Rig(g, {{10}, {50}});
        core::debug::Inspector::SetLives(g, 1);
    }));

    h.Send(2, net::BuildPlayCard(50, 1));
    auto const lost = LastState(h.transport.Frames(1));
    ASSERT_TRUE(lost.has_value());
    EXPECT_EQ(lost->lives, 0);

    h.Send(1, net::BuildUseStar(2));
    auto const err = LastError(h.transport.Frames(1));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->token, "game_over");
    EXPECT_EQ(err->kind, fb::ErrorKind::TerminalState);
}

TEST(Multiplexer, DisconnectThenReconnectResendsState)
{
    Harness h;
    std::string const id = h.Pair(1, 2);
    ASSERT_TRUE(h.coord.DebugWithGame(id, [](core::GameImpl& g) { core::debug::Inspector::Rig(g, {{10, 20}, {50}}); }));
    h.transport.Clear();

    h.mux.OnClose(1);
    EXPECT_EQ(h.mux.ConnectionCount(), 1u);
    auto types = h.Types(2);
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], fb::Message::RosterMsg);

    h.transport.Clear();
    h.mux.OnOpen(4);
    h.Send(4, net::BuildJoinRoom(id, "ann", 3));

    auto const frames = h.transport.Frames(4);
    ASSERT_EQ(frames.size(), 3u);
    auto const* joined = net::ReadEnvelope(frames[0]);
    ASSERT_NE(joined, nullptr);
    ASSERT_EQ(joined->message_type(), fb::Message::JoinedMsg);
    EXPECT_TRUE(joined->message_as_JoinedMsg()->reconnected());
    EXPECT_EQ(joined->message_as_JoinedMsg()->seat(), 0);

    auto const v = LastState(frames);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->cards[0], (std::vector<std::uint8_t>{10, 20}));
    EXPECT_EQ(v->lives, 2);

    // the other player is told about the return but gets no state resend
    types = h.Types(2);
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], fb::Message::RosterMsg);

    // the new connection now acts for seat 0
    h.transport.Clear();
    h.Send(4, net::BuildPlayCard(10, 4));
    EXPECT_TRUE(LastState(h.transport.Frames(2)).has_value());
}

TEST(Multiplexer, SecondJoinFromSameConnectionIsRejected)
{
    Harness h;
    std::string const id = h.Pair(1, 2);
    auto other = h.coord.CreateRoom("other", 2);
    ASSERT_TRUE(other.has_value());

    h.Send(1, net::BuildJoinRoom(other->room_id, "ann", 5));
    auto const err = LastError(h.transport.Frames(1));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, fb::ErrorKind::Validation);
    EXPECT_EQ(h.mux.AttachmentOf(1)->room_id, id);
}

TEST(Multiplexer, SilentConnectionIsReapedSoItsPlayerCanRejoin)
{
    Harness h{std::chrono::seconds(30)};
    std::string const id = h.Pair(1, 2);

    auto const t0 = server::Clock::now();
    h.life.Touch(2, t0 + std::chrono::seconds(45));
    h.transport.Clear();

    // no close event ever arrives for conn 1; only the sweep notices
    h.mux.OnOpen(3);
    h.Send(3, net::BuildJoinRoom(id, "ann", 1));
    auto const taken = LastError(h.transport.Frames(3));
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->kind, fb::ErrorKind::Validation);

    h.transport.Clear();
    h.life.Touch(3, t0 + std::chrono::seconds(45));
    h.life.Sweep(t0 + std::chrono::seconds(60));

    EXPECT_FALSE(h.mux.AttachmentOf(1).has_value());
    EXPECT_EQ(h.mux.ConnectionCount(), 2u);
    auto const types = h.Types(2);
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], fb::Message::RosterMsg);

    h.Send(3, net::BuildJoinRoom(id, "ann", 2));
    auto const frames = h.transport.Frames(3);
    ASSERT_FALSE(frames.empty());
    auto const* joined = net::ReadEnvelope(frames.front());
    ASSERT_NE(joined, nullptr);
    ASSERT_EQ(joined->message_type(), fb::Message::JoinedMsg);
    EXPECT_TRUE(joined->message_as_JoinedMsg()->reconnected());
    EXPECT_EQ(joined->message_as_JoinedMsg()->seat(), 0);
    EXPECT_TRUE(LastState(frames).has_value());
}
