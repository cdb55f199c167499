//
// main.cpp: authoritative room server on WebSocket++
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "net/SessionMultiplexer.hpp"
#include "net/Transport.hpp"
#include "server/Eviction.hpp"
#include "server/Lifecycle.hpp"
#include "server/RoomCoordinator.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;
    using mind::server::ConnId;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint32_t threads{2};
        std::uint64_t seed{0};
        std::chrono::milliseconds grace{std::chrono::minutes(5)};
        std::chrono::milliseconds sweep{std::chrono::seconds(5)};
        // 0 turns silent-connection reaping off
        std::chrono::milliseconds liveness{std::chrono::seconds(60)};
        std::optional<std::filesystem::path> audit_dir{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                if (res.ec != std::errc{})
                {
                    std::print("[mindd] ignoring bad value '{}' for {}\n", s, arg);
                    return false;
                }
                return true;
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--threads")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { cfg.threads = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--grace-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.grace = std::chrono::milliseconds(v); }
            }
            else if (arg == "--sweep-ms")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { cfg.sweep = std::chrono::milliseconds(v); }
            }
            else if (arg == "--liveness-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.liveness = std::chrono::milliseconds(v); }
            }
            else if (arg == "--audit-dir")
            {
                if (i + 1 < argc) { cfg.audit_dir = std::filesystem::path{argv[++i]}; }
            }
            else
            {
                std::print("[mindd] unknown argument {}\n", arg);
            }
        }
        return cfg;
    }

    // Connection ids are handed out here; websocketpp handles never leave this file.
    class WsTransport final : public mind::net::Transport
    {
    public:
        explicit WsTransport(WsServer& ep) : ep_{ep} {}

        auto Register(Hdl hdl) -> ConnId
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            ConnId const id = next_id_++;
            by_hdl_[hdl] = id;
            by_id_[id] = hdl;
            return id;
        }

        auto Lookup(Hdl hdl) const -> std::optional<ConnId>
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            auto const it = by_hdl_.find(hdl);
            if (it == by_hdl_.end()) return std::nullopt;
            return it->second;
        }

        auto Unregister(Hdl hdl) -> std::optional<ConnId>
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            auto const it = by_hdl_.find(hdl);
            if (it == by_hdl_.end()) return std::nullopt;
            ConnId const id = it->second;
            by_id_.erase(id);
            by_hdl_.erase(it);
            return id;
        }

        auto Handles() const -> std::vector<Hdl>
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            std::vector<Hdl> out;
            out.reserve(by_id_.size());
            for (auto const& [id, hdl] : by_id_)
            {
                out.push_back(hdl);
            }
            return out;
        }

        // Starts the close handshake; the close handler fires once it completes or times out
        auto Close(ConnId conn, std::string const& reason) -> void
        {
            std::optional<Hdl> const hdl = HandleOf(conn);
            if (!hdl) return;

            websocketpp::lib::error_code ec;
            ep_.close(*hdl, websocketpp::close::status::policy_violation, reason, ec);
            if (ec)
            {
                std::print("[mindd] close() on conn {} failed: {}\n", conn, ec.message());
            }
        }

        // Keepalive; a pong counts as activity
        auto PingAll() -> void
        {
            for (Hdl const& hdl : Handles())
            {
                websocketpp::lib::error_code ec;
                ep_.ping(hdl, std::string{}, ec);
            }
        }

        auto Send(ConnId conn, std::span<std::uint8_t const> bytes) -> bool override
        {
            Hdl hdl;
            {
                std::lock_guard<std::mutex> const lock{mtx_};
                auto const it = by_id_.find(conn);
                if (it == by_id_.end()) return false;
                hdl = it->second;
            }

            websocketpp::lib::error_code ec;
            ep_.send(hdl, bytes.data(), bytes.size(), websocketpp::frame::opcode::binary, ec);
            if (ec)
            {
                std::print("[mindd] send() to conn {} failed: {}\n", conn, ec.message());
                return false;
            }
            return true;
        }

    private:
        auto HandleOf(ConnId conn) const -> std::optional<Hdl>
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            auto const it = by_id_.find(conn);
            if (it == by_id_.end()) return std::nullopt;
            return it->second;
        }

        WsServer& ep_;
        mutable std::mutex mtx_;
        std::map<Hdl, ConnId, std::owner_less<Hdl>> by_hdl_;
        std::unordered_map<ConnId, Hdl> by_id_;
        ConnId next_id_{1};
    };
}

int main(int argc, char** argv)
{
    using namespace mind;

    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[mindd] starting on port {} with {} thread(s), grace {} ms, liveness {} ms\n",
               sc.port, sc.threads, sc.grace.count(), sc.liveness.count());

    if (sc.audit_dir)
    {
        std::error_code ec;
        std::filesystem::create_directories(*sc.audit_dir, ec);
        if (ec)
        {
            std::print("[mindd] cannot create audit dir {}: {}\n", sc.audit_dir->string(), ec.message());
            return 1;
        }
    }

    WsServer ep;
    ep.clear_access_channels(websocketpp::log::alevel::all);
    ep.set_access_channels(websocketpp::log::alevel::connect |
                           websocketpp::log::alevel::disconnect);
    ep.clear_error_channels(websocketpp::log::elevel::all);

    ep.init_asio();
    ep.set_reuse_addr(true);

    WsTransport transport{ep};
    net::SessionMultiplexer mux{transport};
    server::RoomCoordinator coord{mux, server::CoordinatorOptions{sc.seed, sc.audit_dir}};
    std::optional<server::Clock::duration> liveness{};
    if (sc.liveness.count() > 0) liveness = sc.liveness;
    server::LifecycleManager lifecycle{coord, std::make_unique<server::GracePeriodEviction>(sc.grace), liveness};
    lifecycle.OnStale([&transport](ConnId conn)
    {
        transport.Close(conn, "Connection silent");
    });
    mux.Bind(coord, lifecycle);

    ep.set_open_handler([&](Hdl hdl)
    {
        ConnId const id = transport.Register(hdl);
        mux.OnOpen(id);
    });

    ep.set_close_handler([&](Hdl hdl)
    {
        if (std::optional<ConnId> const id = transport.Unregister(hdl))
        {
            mux.OnClose(*id);
        }
    });

    ep.set_pong_handler([&](Hdl hdl, std::string)
    {
        if (std::optional<ConnId> const id = transport.Lookup(hdl))
        {
            lifecycle.Touch(*id);
        }
    });

    ep.set_pong_timeout_handler([&](Hdl hdl, std::string)
    {
        if (std::optional<ConnId> const id = transport.Lookup(hdl))
        {
            transport.Close(*id, "Pong timeout");
        }
    });

    ep.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        // Text frames go through too; they fail verification and get error{malformed}
        std::optional<ConnId> const id = transport.Lookup(hdl);
        if (!id)
        {
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };
        mux.OnMessage(*id, bytes);
    });

    std::mutex stop_mx;
    std::condition_variable stop_cv;
    bool stopping{false};

    asio::signal_set signals{ep.get_io_service(), SIGINT, SIGTERM};
    signals.async_wait([&](std::error_code const&, int sig)
    {
        std::print("[mindd] signal {} -> shutting down\n", sig);
        {
            std::lock_guard<std::mutex> const lock{stop_mx};
            stopping = true;
        }
        stop_cv.notify_all();

        websocketpp::lib::error_code ec;
        ep.stop_listening(ec);
        for (Hdl const& hdl : transport.Handles())
        {
            ep.close(hdl, websocketpp::close::status::going_away, "Server shutting down", ec);
        }
    });

    websocketpp::lib::error_code listen_ec;
    ep.listen(sc.port, listen_ec);
    if (listen_ec)
    {
        std::print("[mindd] listen on {} failed: {}\n", sc.port, listen_ec.message());
        return 1;
    }
    ep.start_accept();

    std::thread sweeper([&]
    {
        std::unique_lock<std::mutex> lock{stop_mx};
        while (!stop_cv.wait_for(lock, sc.sweep, [&] { return stopping; }))
        {
            lock.unlock();
            if (liveness) transport.PingAll();
            lifecycle.Sweep();
            lock.lock();
        }
    });

    std::vector<std::thread> net_threads;
    net_threads.reserve(sc.threads);
    for (std::uint32_t i = 0; i < sc.threads; ++i)
    {
        net_threads.emplace_back([&ep]
        {
            ep.run();
        });
    }

    for (std::thread& t : net_threads)
    {
        if (t.joinable()) t.join();
    }

    {
        std::lock_guard<std::mutex> const lock{stop_mx};
        stopping = true;
    }
    stop_cv.notify_all();
    if (sweeper.joinable())
    {
        sweeper.join();
    }

    std::print("[mindd] stopped with {} room(s) open\n", coord.RoomCount());
    return 0;
}
