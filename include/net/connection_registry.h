///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file connection_registry.h
 * @brief Thread-safe set of open client connections with isolated fan-out
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "net/client_connection.h"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlightBridge {

class ConnectionRegistry {
public:
    /// @return false after CloseAll(); the caller should close the connection
    bool Add(const ConnectionPtr& connection);

    /// @return true if the connection was registered
    bool Remove(ConnectionId id);

    ConnectionPtr Find(ConnectionId id) const;

    /**
     * @brief Send to a single connection; removes it on failure.
     * @return true on success
     */
    bool SendTo(const ConnectionPtr& connection, const std::string& text);

    /**
     * @brief Send to every registered connection.
     *
     * The connection list is copied under the lock and sends happen outside
     * it. A connection whose Send() throws is closed and removed; the others
     * still receive the message.
     *
     * @return number of successful deliveries
     */
    size_t Broadcast(const std::string& text);

    /**
     * @brief Stop accepting and close every connection.
     *
     * Uses the same lock as Add(), so no connection can be added once this
     * has started.
     */
    void CloseAll();

    /// Accept connections again after CloseAll()
    void Reopen();

    size_t Count() const;
    bool IsAccepting() const;

private:
    void Drop(const ConnectionPtr& connection, const char* reason);

    mutable std::mutex mutex_;
    std::unordered_map<ConnectionId, ConnectionPtr> connections_;
    bool accepting_ = true;
};

} // namespace FlightBridge
