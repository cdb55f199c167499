//
// Lifecycle.cpp
//

#include "server/Lifecycle.hpp"

#include <chrono>
#include <print>

#include "core/Exception.hpp"

namespace mind::server
{
    LifecycleManager::LifecycleManager(RoomCoordinator& coord,
                                       std::unique_ptr<EvictionPolicy> policy,
                                       std::optional<Clock::duration> const liveness)
        : coord_{coord}
          , policy_{std::move(policy)}
          , liveness_{liveness}
    {
        MND_ASSERT(policy_ != nullptr, "LifecycleManager requires an eviction policy");
    }

    auto LifecycleManager::OnStale(Closer closer) -> void
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        closer_ = std::move(closer);
    }

    auto LifecycleManager::Touch(ConnId const conn, Clock::time_point const now) -> void
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        last_seen_[conn] = now;
    }

    auto LifecycleManager::LastSeen(ConnId const conn) const -> std::optional<Clock::time_point>
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        auto const it = last_seen_.find(conn);
        if (it == last_seen_.end()) return std::nullopt;
        return it->second;
    }

    auto LifecycleManager::OnDisconnect(ConnId const conn, std::optional<Attachment> const& where) -> void
    {
        Forget(conn);
        if (!where) return;

        // false means a reconnect already took the seat over
        if (!coord_.Detach(where->room_id, where->seat, conn))
        {
            std::print("[Lifecycle] conn {} no longer owned seat {} in {}\n", conn, where->seat, where->room_id);
        }
    }

    auto LifecycleManager::Forget(ConnId const conn) -> void
    {
        std::lock_guard<std::mutex> const lock{mtx_};
        last_seen_.erase(conn);
    }

    auto LifecycleManager::ReapSilent(Clock::time_point const now) -> std::vector<ConnId>
    {
        std::vector<ConnId> silent;
        Closer closer;
        {
            std::lock_guard<std::mutex> const lock{mtx_};
            if (!liveness_ || !closer_) return silent;

            for (auto const& [conn, seen] : last_seen_)
            {
                if (now - seen > *liveness_) silent.push_back(conn);
            }
            // dropped here so a slow close handshake is not retried every pass
            for (ConnId const conn : silent)
            {
                last_seen_.erase(conn);
            }
            closer = closer_;
        }

        // the close path re-enters OnDisconnect, so no lock is held here
        for (ConnId const conn : silent)
        {
            std::print("[Lifecycle] conn {} silent for over {} ms, closing\n", conn,
                       std::chrono::duration_cast<std::chrono::milliseconds>(*liveness_).count());
            closer(conn);
        }
        return silent;
    }

    auto LifecycleManager::Sweep(Clock::time_point const now) -> std::vector<std::string>
    {
        ReapSilent(now);

        std::vector<std::string> closed = coord_.CollectIdle(*policy_, now);
        for (std::string const& id : closed)
        {
            std::print("[Lifecycle] Evicted idle room {}\n", id);
        }
        return closed;
    }
}
