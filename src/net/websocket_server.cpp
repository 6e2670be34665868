///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file websocket_server.cpp
 * @brief poll()-based WebSocket server and its per-client connection
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/websocket_server.h"
#include "common/errors.h"
#include "logging/logger.h"
#include "net/ws_util.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

namespace FlightBridge {

namespace {

constexpr size_t MAX_HANDSHAKE_BYTES = 8192;
constexpr int POLL_TIMEOUT_MS = 200;

constexpr std::uint16_t CLOSE_NORMAL = 1000;
constexpr std::uint16_t CLOSE_PROTOCOL_ERROR = 1002;
constexpr std::uint16_t CLOSE_TOO_BIG = 1009;

std::string ClosePayload(std::uint16_t code) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    return payload;
}

std::string ErrnoText() {
    return std::strerror(errno);
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// WAKE SIGNAL
///////////////////////////////////////////////////////////////////////////////////////////////////

/**
 * Write end of the loop's self-pipe. Connections hold it by shared_ptr so a
 * Send() racing with Stop() never writes to a recycled descriptor.
 */
struct WakeSignal {
    explicit WakeSignal(int fd) : write_fd(fd) {}

    void Notify() {
        std::lock_guard<std::mutex> lock(mutex);
        if (write_fd < 0) return;
        const char byte = 1;
        // A full pipe already guarantees a wakeup
        if (::write(write_fd, &byte, 1) < 0 && errno != EAGAIN) {
            LOG_DEBUG("Wake pipe write failed: {}", ErrnoText());
        }
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mutex);
        if (write_fd >= 0) {
            ::close(write_fd);
            write_fd = -1;
        }
    }

    std::mutex mutex;
    int write_fd;
};

///////////////////////////////////////////////////////////////////////////////////////////////////
// CONNECTION
///////////////////////////////////////////////////////////////////////////////////////////////////

class WebSocketConnection : public ClientConnection {
public:
    enum class State { Handshaking, Open, Closing, Broken, Closed };

    WebSocketConnection(ConnectionId id, int fd, std::string remote_address, size_t max_send_buffer,
                        std::shared_ptr<WakeSignal> wake, std::chrono::steady_clock::time_point deadline)
        : handshake_deadline(deadline),
          id_(id),
          fd_(fd),
          remote_address_(std::move(remote_address)),
          max_send_buffer_(max_send_buffer),
          wake_(std::move(wake)) {}

    ConnectionId Id() const override { return id_; }
    std::string RemoteAddress() const override { return remote_address_; }

    void Send(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Open) {
                throw SendError("connection " + std::to_string(id_) + " is not open");
            }

            const std::string frame = ws::EncodeFrame(text);
            if (outbox_.size() + frame.size() > max_send_buffer_) {
                state_ = State::Broken;
                wake_->Notify();
                throw SendError("send buffer full for connection " + std::to_string(id_) + " (" +
                                std::to_string(outbox_.size()) + " bytes pending)");
            }
            outbox_.append(frame);

            if (!FlushLocked()) {
                state_ = State::Broken;
                wake_->Notify();
                throw SendError("write to connection " + std::to_string(id_) + " failed: " + ErrnoText());
            }
            if (outbox_.empty()) {
                return;
            }
        }
        wake_->Notify();
    }

    void Close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == State::Open) {
                outbox_.append(ws::EncodeFrame(ClosePayload(CLOSE_NORMAL), ws::OP_CLOSE));
                state_ = State::Closing;
            } else if (state_ == State::Handshaking) {
                state_ = State::Closing;
            } else {
                return;
            }
        }
        wake_->Notify();
    }

    // === SERVER THREAD ONLY ===

    int Fd() const { return fd_; }

    State GetState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    /// Queue the 101 response and move to Open in one step, so frames sent
    /// from the open handler always follow it.
    void AcceptHandshake(const std::string& response) {
        std::lock_guard<std::mutex> lock(mutex_);
        outbox_.append(response);
        if (state_ == State::Handshaking) {
            state_ = State::Open;
            opened = true;
        }
    }

    /// Queue raw bytes and start closing (handshake rejection, close echo)
    void QueueAndClose(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Broken || state_ == State::Closed) return;
        outbox_.append(bytes);
        state_ = State::Closing;
    }

    /// Control frames bypass the buffer limit
    void QueueControl(const std::string& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Open) {
            outbox_.append(frame);
        }
    }

    bool WantsWrite() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !outbox_.empty();
    }

    /// @return false on a socket error
    bool Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        return FlushLocked();
    }

    void Shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        outbox_.clear();
        state_ = State::Closed;
    }

    // Inbound state, touched only by the server thread
    std::string inbox;
    std::string fragment;
    std::uint8_t fragment_opcode = ws::OP_TEXT;
    bool fragment_active = false;
    bool opened = false;
    std::chrono::steady_clock::time_point handshake_deadline;

private:
    bool FlushLocked() {
        while (!outbox_.empty() && fd_ >= 0) {
            const ssize_t sent = ::send(fd_, outbox_.data(), outbox_.size(), MSG_NOSIGNAL);
            if (sent > 0) {
                outbox_.erase(0, static_cast<size_t>(sent));
                continue;
            }
            if (sent < 0 && errno == EINTR) {
                continue;
            }
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return true;
            }
            return false;
        }
        return true;
    }

    const ConnectionId id_;
    int fd_;
    const std::string remote_address_;
    const size_t max_send_buffer_;
    std::shared_ptr<WakeSignal> wake_;

    mutable std::mutex mutex_;
    State state_ = State::Handshaking;
    std::string outbox_;
};

///////////////////////////////////////////////////////////////////////////////////////////////////
// SERVER
///////////////////////////////////////////////////////////////////////////////////////////////////

WebSocketServer::WebSocketServer(WebSocketServerOptions options)
    : options_(std::move(options)) {}

WebSocketServer::~WebSocketServer() {
    Stop();
}

void WebSocketServer::SetHandlers(OpenHandler on_open, MessageHandler on_message, CloseHandler on_close) {
    on_open_ = std::move(on_open);
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
}

bool WebSocketServer::Start() {
    if (running_) {
        return true;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        LOG_ERROR("WebSocket server: socket() failed: {}", ErrnoText());
        return false;
    }

    int yes = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (::inet_pton(AF_INET, options_.bind_address.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("WebSocket server: invalid bind address '{}'", options_.bind_address);
        ReleaseSockets();
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("WebSocket server: bind to {}:{} failed: {}", options_.bind_address, options_.port, ErrnoText());
        ReleaseSockets();
        return false;
    }
    if (::listen(listen_fd_, SOMAXCONN) < 0) {
        LOG_ERROR("WebSocket server: listen() failed: {}", ErrnoText());
        ReleaseSockets();
        return false;
    }

    const int flags = ::fcntl(listen_fd_, F_GETFL, 0);
    ::fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = options_.port;
    }

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_NONBLOCK | O_CLOEXEC) < 0) {
        LOG_ERROR("WebSocket server: pipe2() failed: {}", ErrnoText());
        ReleaseSockets();
        return false;
    }
    wake_read_fd_ = pipe_fds[0];
    wake_signal_ = std::make_shared<WakeSignal>(pipe_fds[1]);

    running_ = true;
    server_thread_ = std::thread(&WebSocketServer::ServerLoop, this);

    LOG_INFO("WebSocket server listening on {}:{}", options_.bind_address, bound_port_);
    return true;
}

void WebSocketServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    Wake();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    // Best effort: push out whatever is already queued (close frames included)
    std::vector<std::shared_ptr<WebSocketConnection>> remaining;
    remaining.reserve(connections_.size());
    for (const auto& entry : connections_) {
        remaining.push_back(entry.second);
    }
    for (const auto& connection : remaining) {
        connection->Flush();
        Drop(connection, "server stopping");
    }
    connections_.clear();

    ReleaseSockets();
    LOG_INFO("WebSocket server stopped");
}

void WebSocketServer::Wake() {
    if (wake_signal_) {
        wake_signal_->Notify();
    }
}

void WebSocketServer::ReleaseSockets() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (wake_read_fd_ >= 0) {
        ::close(wake_read_fd_);
        wake_read_fd_ = -1;
    }
    if (wake_signal_) {
        wake_signal_->Close();
        wake_signal_.reset();
    }
}

void WebSocketServer::ServerLoop() {
    std::vector<pollfd> fds;
    std::vector<std::shared_ptr<WebSocketConnection>> polled;

    while (running_) {
        fds.clear();
        polled.clear();

        fds.push_back(pollfd{wake_read_fd_, POLLIN, 0});
        fds.push_back(pollfd{listen_fd_, POLLIN, 0});
        for (const auto& entry : connections_) {
            short events = POLLIN;
            if (entry.second->WantsWrite()) {
                events |= POLLOUT;
            }
            fds.push_back(pollfd{entry.first, events, 0});
            polled.push_back(entry.second);
        }

        const int ready = ::poll(fds.data(), fds.size(), POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("WebSocket server: poll() failed: {}", ErrnoText());
            break;
        }
        if (!running_) break;

        if (fds[0].revents & POLLIN) {
            char drain[64];
            while (::read(wake_read_fd_, drain, sizeof(drain)) > 0) {
            }
        }
        if (fds[1].revents & POLLIN) {
            AcceptClients();
        }

        for (size_t i = 0; i < polled.size(); ++i) {
            const auto& connection = polled[i];
            const short revents = fds[i + 2].revents;
            if (connection->GetState() == WebSocketConnection::State::Closed) {
                continue;
            }

            if (revents & POLLIN) {
                ReadFrom(connection);
            } else if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
                Drop(connection, "socket error");
                continue;
            }

            if (connection->GetState() != WebSocketConnection::State::Closed && connection->WantsWrite()) {
                Flush(connection);
            }
        }

        ReapConnections();
    }
}

void WebSocketServer::AcceptClients() {
    for (;;) {
        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        const int client = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len,
                                     SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("WebSocket server: accept() failed: {}", ErrnoText());
            }
            return;
        }

        // Low latency for small telemetry frames
        int yes = 1;
        ::setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
        ::setsockopt(client, SOL_SOCKET, SO_KEEPALIVE, &yes, sizeof(yes));

        char host[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, host, sizeof(host));
        const std::string remote = std::string(host) + ":" + std::to_string(ntohs(peer.sin_port));

        auto connection = std::make_shared<WebSocketConnection>(
            next_id_++, client, remote, options_.max_send_buffer, wake_signal_,
            std::chrono::steady_clock::now() + options_.handshake_timeout);
        connections_[client] = connection;

        LOG_DEBUG("Accepted TCP client {} from {}", connection->Id(), remote);
    }
}

void WebSocketServer::ReadFrom(const std::shared_ptr<WebSocketConnection>& connection) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::recv(connection->Fd(), buf, sizeof(buf), 0);
        if (n > 0) {
            connection->inbox.append(buf, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buf)) break;
            continue;
        }
        if (n == 0) {
            Drop(connection, "peer closed");
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        Drop(connection, ErrnoText());
        return;
    }

    switch (connection->GetState()) {
        case WebSocketConnection::State::Handshaking:
            HandleHandshake(connection);
            break;
        case WebSocketConnection::State::Open:
            HandleFrames(connection);
            break;
        default:
            // Closing: the peer's remaining data is irrelevant
            connection->inbox.clear();
            break;
    }
}

void WebSocketServer::HandleHandshake(const std::shared_ptr<WebSocketConnection>& connection) {
    const size_t header_end = connection->inbox.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        if (connection->inbox.size() > MAX_HANDSHAKE_BYTES) {
            Drop(connection, "handshake too large");
        }
        return;
    }

    auto request = ws::ParseHandshakeRequest(connection->inbox);
    if (!request) {
        LOG_WARN("Rejecting invalid WebSocket upgrade from {}", connection->RemoteAddress());
        connection->inbox.clear();
        connection->QueueAndClose(ws::BuildHandshakeRejection());
        return;
    }

    connection->inbox.erase(0, header_end + 4);
    connection->AcceptHandshake(ws::BuildHandshakeResponse(ws::ComputeAcceptKey(request->key)));
    ++open_count_;

    LOG_DEBUG("WebSocket handshake complete for client {} (path '{}')", connection->Id(), request->path);

    if (on_open_) {
        try {
            on_open_(connection);
        } catch (const std::exception& ex) {
            LOG_ERROR("Open handler failed for client {}: {}", connection->Id(), ex.what());
        }
    }

    if (!connection->inbox.empty()) {
        HandleFrames(connection);
    }
}

void WebSocketServer::HandleFrames(const std::shared_ptr<WebSocketConnection>& connection) {
    for (;;) {
        if (connection->GetState() != WebSocketConnection::State::Open) {
            return;
        }

        ws::Frame frame;
        const ws::DecodeStatus status = ws::DecodeFrame(connection->inbox, frame, options_.max_message_size);
        if (status == ws::DecodeStatus::Incomplete) {
            return;
        }
        if (status == ws::DecodeStatus::TooLarge) {
            LOG_WARN("Client {} sent an oversized frame", connection->Id());
            connection->QueueAndClose(ws::EncodeFrame(ClosePayload(CLOSE_TOO_BIG), ws::OP_CLOSE));
            return;
        }
        if (status == ws::DecodeStatus::Unmasked) {
            LOG_WARN("Client {} sent an unmasked frame", connection->Id());
            connection->QueueAndClose(ws::EncodeFrame(ClosePayload(CLOSE_PROTOCOL_ERROR), ws::OP_CLOSE));
            return;
        }

        switch (frame.opcode) {
            case ws::OP_TEXT:
            case ws::OP_BINARY:
                if (connection->fragment_active) {
                    connection->QueueAndClose(ws::EncodeFrame(ClosePayload(CLOSE_PROTOCOL_ERROR), ws::OP_CLOSE));
                    return;
                }
                if (frame.fin) {
                    if (frame.opcode == ws::OP_TEXT) {
                        Deliver(connection, frame.payload);
                    }
                } else {
                    connection->fragment_active = true;
                    connection->fragment_opcode = frame.opcode;
                    connection->fragment = std::move(frame.payload);
                }
                break;

            case ws::OP_CONTINUATION:
                if (!connection->fragment_active) {
                    connection->QueueAndClose(ws::EncodeFrame(ClosePayload(CLOSE_PROTOCOL_ERROR), ws::OP_CLOSE));
                    return;
                }
                if (connection->fragment.size() + frame.payload.size() > options_.max_message_size) {
                    connection->QueueAndClose(ws::EncodeFrame(ClosePayload(CLOSE_TOO_BIG), ws::OP_CLOSE));
                    return;
                }
                connection->fragment.append(frame.payload);
                if (frame.fin) {
                    connection->fragment_active = false;
                    std::string message;
                    message.swap(connection->fragment);
                    if (connection->fragment_opcode == ws::OP_TEXT) {
                        Deliver(connection, message);
                    }
                }
                break;

            case ws::OP_CLOSE:
                // Echo the status code, then close once it is flushed
                connection->QueueAndClose(ws::EncodeFrame(frame.payload.substr(0, 2), ws::OP_CLOSE));
                return;

            case ws::OP_PING:
                connection->QueueControl(ws::EncodeFrame(frame.payload, ws::OP_PONG));
                break;

            case ws::OP_PONG:
                break;

            default:
                connection->QueueAndClose(ws::EncodeFrame(ClosePayload(CLOSE_PROTOCOL_ERROR), ws::OP_CLOSE));
                return;
        }
    }
}

void WebSocketServer::Deliver(const std::shared_ptr<WebSocketConnection>& connection, const std::string& message) {
    if (!on_message_) {
        return;
    }
    try {
        on_message_(connection, message);
    } catch (const std::exception& ex) {
        LOG_ERROR("Message handler failed for client {}: {}", connection->Id(), ex.what());
    }
}

void WebSocketServer::Flush(const std::shared_ptr<WebSocketConnection>& connection) {
    if (!connection->Flush()) {
        Drop(connection, "write failed: " + ErrnoText());
    }
}

void WebSocketServer::ReapConnections() {
    const auto now = std::chrono::steady_clock::now();

    std::vector<std::pair<std::shared_ptr<WebSocketConnection>, const char*>> doomed;
    for (const auto& entry : connections_) {
        const auto& connection = entry.second;
        switch (connection->GetState()) {
            case WebSocketConnection::State::Handshaking:
                if (now > connection->handshake_deadline) {
                    doomed.emplace_back(connection, "handshake timeout");
                }
                break;
            case WebSocketConnection::State::Closing:
                if (!connection->WantsWrite()) {
                    doomed.emplace_back(connection, "closed");
                }
                break;
            case WebSocketConnection::State::Broken:
                doomed.emplace_back(connection, "send failed");
                break;
            default:
                break;
        }
    }

    for (const auto& item : doomed) {
        Drop(item.first, item.second);
    }
}

void WebSocketServer::Drop(const std::shared_ptr<WebSocketConnection>& connection, const std::string& reason) {
    const int fd = connection->Fd();
    if (fd < 0) {
        return;
    }

    connection->Shutdown();
    connections_.erase(fd);

    if (!connection->opened) {
        LOG_DEBUG("TCP client {} dropped before handshake: {}", connection->Id(), reason);
        return;
    }

    --open_count_;
    LOG_DEBUG("WebSocket client {} closed: {}", connection->Id(), reason);
    if (on_close_) {
        try {
            on_close_(connection->Id());
        } catch (const std::exception& ex) {
            LOG_ERROR("Close handler failed for client {}: {}", connection->Id(), ex.what());
        }
    }
}

} // namespace FlightBridge
