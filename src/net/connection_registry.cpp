///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file connection_registry.cpp
 * @brief ConnectionRegistry implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/connection_registry.h"
#include "logging/logger.h"

#include <exception>

namespace FlightBridge {

bool ConnectionRegistry::Add(const ConnectionPtr& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
        return false;
    }
    connections_[connection->Id()] = connection;
    return true;
}

bool ConnectionRegistry::Remove(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.erase(id) > 0;
}

ConnectionPtr ConnectionRegistry::Find(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it != connections_.end() ? it->second : nullptr;
}

bool ConnectionRegistry::SendTo(const ConnectionPtr& connection, const std::string& text) {
    try {
        connection->Send(text);
        return true;
    } catch (const std::exception& ex) {
        LOG_WARN("Send to client {} ({}) failed: {}", connection->Id(), connection->RemoteAddress(), ex.what());
        Drop(connection, "send failure");
        return false;
    }
}

size_t ConnectionRegistry::Broadcast(const std::string& text) {
    std::vector<ConnectionPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(connections_.size());
        for (const auto& entry : connections_) {
            snapshot.push_back(entry.second);
        }
    }

    size_t delivered = 0;
    std::vector<ConnectionPtr> to_remove;
    for (const auto& connection : snapshot) {
        try {
            connection->Send(text);
            ++delivered;
        } catch (const std::exception& ex) {
            LOG_WARN("Broadcast to client {} ({}) failed: {}", connection->Id(), connection->RemoteAddress(), ex.what());
            to_remove.push_back(connection);
        }
    }

    for (const auto& dead : to_remove) {
        Drop(dead, "broadcast failure");
    }
    return delivered;
}

void ConnectionRegistry::CloseAll() {
    std::unordered_map<ConnectionId, ConnectionPtr> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        closing.swap(connections_);
    }

    for (const auto& entry : closing) {
        entry.second->Close();
    }
    if (!closing.empty()) {
        LOG_INFO("Closed {} client connection(s)", closing.size());
    }
}

void ConnectionRegistry::Reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = true;
}

size_t ConnectionRegistry::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool ConnectionRegistry::IsAccepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

void ConnectionRegistry::Drop(const ConnectionPtr& connection, const char* reason) {
    if (Remove(connection->Id())) {
        LOG_INFO("Client {} removed ({}), {} remaining", connection->Id(), reason, Count());
    }
    connection->Close();
}

} // namespace FlightBridge
