///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file websocket_server.h
 * @brief Native WebSocket server over POSIX sockets
 *
 * One thread runs a poll() loop that accepts clients, completes the HTTP
 * upgrade without blocking, reads and reassembles frames, and flushes each
 * connection's outbound buffer when the socket becomes writable.
 *
 * Send() on a connection never waits for the peer: it appends to that
 * connection's bounded buffer and wakes the loop. A connection whose buffer
 * would overflow fails with SendError and is closed; other connections are
 * unaffected.
 *
 * Handlers run on the server thread and must not block.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "net/client_connection.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

namespace FlightBridge {

class WebSocketConnection;
struct WakeSignal;

struct WebSocketServerOptions {
    std::uint16_t port = 8500;                  ///< 0 picks an ephemeral port, see Port()
    std::string bind_address = "0.0.0.0";
    size_t max_send_buffer = 1024 * 1024;       ///< per connection, bytes
    size_t max_message_size = 1024 * 1024;      ///< reassembled inbound message, bytes
    std::chrono::milliseconds handshake_timeout{2000};
};

class WebSocketServer {
public:
    using OpenHandler = std::function<void(const ConnectionPtr&)>;
    using MessageHandler = std::function<void(const ConnectionPtr&, const std::string&)>;
    using CloseHandler = std::function<void(ConnectionId)>;

    explicit WebSocketServer(WebSocketServerOptions options = WebSocketServerOptions{});
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Must be called before Start()
    void SetHandlers(OpenHandler on_open, MessageHandler on_message, CloseHandler on_close);

    /**
     * @brief Bind, listen and start the server thread.
     * @return false if the socket cannot be created, bound or listened on
     */
    bool Start();

    /**
     * @brief Stop the loop, join the thread and close every socket.
     *
     * The close handler is called for each connection that was open.
     * Safe to call more than once; Start() may be called again afterwards.
     */
    void Stop();

    bool IsRunning() const { return running_; }

    /// Bound port (resolved after Start() when 0 was requested)
    std::uint16_t Port() const { return bound_port_; }

    /// Connections that completed the handshake and are not closed yet
    size_t ConnectionCount() const { return open_count_; }

private:
    void ServerLoop();
    void Wake();
    void AcceptClients();
    void ReadFrom(const std::shared_ptr<WebSocketConnection>& connection);
    void HandleHandshake(const std::shared_ptr<WebSocketConnection>& connection);
    void HandleFrames(const std::shared_ptr<WebSocketConnection>& connection);
    void Flush(const std::shared_ptr<WebSocketConnection>& connection);
    void Deliver(const std::shared_ptr<WebSocketConnection>& connection, const std::string& message);
    void Drop(const std::shared_ptr<WebSocketConnection>& connection, const std::string& reason);
    void ReapConnections();
    void ReleaseSockets();

    WebSocketServerOptions options_;

    OpenHandler on_open_;
    MessageHandler on_message_;
    CloseHandler on_close_;

    int listen_fd_ = -1;
    int wake_read_fd_ = -1;
    std::shared_ptr<WakeSignal> wake_signal_;
    std::uint16_t bound_port_ = 0;

    std::atomic<bool> running_{false};
    std::thread server_thread_;
    std::atomic<ConnectionId> next_id_{1};

    // Owned by the server thread while running
    std::unordered_map<int, std::shared_ptr<WebSocketConnection>> connections_;
    std::atomic<size_t> open_count_{0};
};

} // namespace FlightBridge
