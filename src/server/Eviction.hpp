//
// Eviction.hpp
//

#ifndef MINDGAME_EVICTION_HPP
#define MINDGAME_EVICTION_HPP

#include <chrono>

#include "server/RoomTypes.hpp"

namespace mind::server
{
    class EvictionPolicy
    {
    public:
        virtual ~EvictionPolicy() = default;

        // idle_for is zero while any connection is still attached
        [[nodiscard]]
        virtual auto ShouldEvict(RoomSummary const& room, Clock::duration idle_for) const -> bool = 0;
    };

    // Evicts a room once nobody has been attached to it for longer than the grace period.
    class GracePeriodEviction final : public EvictionPolicy
    {
    public:
        explicit GracePeriodEviction(Clock::duration grace) : grace_{grace} {}

        [[nodiscard]]
        auto ShouldEvict(RoomSummary const& room, Clock::duration const idle_for) const -> bool override
        {
            return room.attached == 0 && room.idle_since.has_value() && idle_for > grace_;
        }

        auto Grace() const noexcept -> Clock::duration { return grace_; }

    private:
        Clock::duration grace_;
    };

    class NeverEvict final : public EvictionPolicy
    {
    public:
        [[nodiscard]]
        auto ShouldEvict(RoomSummary const&, Clock::duration) const -> bool override { return false; }
    };
}

#endif //MINDGAME_EVICTION_HPP
