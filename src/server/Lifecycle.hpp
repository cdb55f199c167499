//
// Lifecycle.hpp
//

#ifndef MINDGAME_LIFECYCLE_HPP
#define MINDGAME_LIFECYCLE_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "server/Eviction.hpp"
#include "server/RoomCoordinator.hpp"
#include "server/RoomTypes.hpp"

namespace mind::server
{
    // Tracks connection liveness and retires rooms nobody has come back to.
    class LifecycleManager
    {
    public:
        using Closer = std::function<void(ConnId)>;

        // liveness: how long a connection may stay silent before Sweep closes it; nullopt never does
        LifecycleManager(RoomCoordinator& coord,
                         std::unique_ptr<EvictionPolicy> policy,
                         std::optional<Clock::duration> liveness = std::nullopt);

        // How Sweep closes a silent connection. The transport's close event must end in OnDisconnect.
        auto OnStale(Closer closer) -> void;

        // Any inbound frame counts as activity
        auto Touch(ConnId conn, Clock::time_point now = Clock::now()) -> void;

        [[nodiscard]]
        auto LastSeen(ConnId conn) const -> std::optional<Clock::time_point>;

        // Transport dropped: release the seat but keep it reserved for a reconnect
        auto OnDisconnect(ConnId conn, std::optional<Attachment> const& where) -> void;

        auto Forget(ConnId conn) -> void;

        // Closes connections silent for longer than the liveness limit; each one is closed once
        auto ReapSilent(Clock::time_point now = Clock::now()) -> std::vector<ConnId>;

        // Periodic: reaps silent connections, then returns the ids of rooms closed by this pass
        auto Sweep(Clock::time_point now = Clock::now()) -> std::vector<std::string>;

        auto Policy() const -> EvictionPolicy const& { return *policy_; }

    private:
        RoomCoordinator& coord_;
        std::unique_ptr<EvictionPolicy> policy_;
        std::optional<Clock::duration> liveness_;

        mutable std::mutex mtx_;
        Closer closer_;
        std::unordered_map<ConnId, Clock::time_point> last_seen_;
    };
}

#endif //MINDGAME_LIFECYCLE_HPP
