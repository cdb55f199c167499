//
// Transport.hpp
//

#ifndef MINDGAME_TRANSPORT_HPP
#define MINDGAME_TRANSPORT_HPP

#include <cstdint>
#include <span>

#include "server/RoomTypes.hpp"

namespace mind::net
{
    using server::ConnId;

    // Outbound byte pipe for one process. The WebSocket server implements it in
    // production; tests record the frames instead.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        // False if the connection is gone; the caller treats that as already closed.
        virtual auto Send(ConnId conn, std::span<std::uint8_t const> bytes) -> bool = 0;
    };
}

#endif //MINDGAME_TRANSPORT_HPP
