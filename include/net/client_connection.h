///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file client_connection.h
 * @brief Transport-owned handle to one connected viewer
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace FlightBridge {

using ConnectionId = std::uint64_t;

class ClientConnection {
public:
    virtual ~ClientConnection() = default;

    virtual ConnectionId Id() const = 0;

    /**
     * @brief Queue one text message for delivery.
     *
     * Must not block on the peer. Throws SendError when the connection is
     * closed or its outbound buffer is full.
     */
    virtual void Send(const std::string& text) = 0;

    /// Initiate close; further Send() calls fail
    virtual void Close() = 0;

    virtual std::string RemoteAddress() const = 0;
};

using ConnectionPtr = std::shared_ptr<ClientConnection>;

} // namespace FlightBridge
