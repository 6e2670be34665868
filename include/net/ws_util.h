///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file ws_util.h
 * @brief RFC 6455 building blocks: handshake key, frame encoding and decoding
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace FlightBridge {
namespace ws {

enum Opcode : std::uint8_t {
    OP_CONTINUATION = 0x0,
    OP_TEXT         = 0x1,
    OP_BINARY       = 0x2,
    OP_CLOSE        = 0x8,
    OP_PING         = 0x9,
    OP_PONG         = 0xA
};

/// Incremental SHA-1, only used for Sec-WebSocket-Accept
class Sha1 {
public:
    Sha1();
    void Update(const std::uint8_t* data, size_t len);
    void Update(const std::string& data);
    std::array<std::uint8_t, 20> Final();

private:
    void Transform(const std::uint8_t block[64]);

    std::uint32_t state_[5];
    std::uint64_t bit_count_;
    std::uint8_t buffer_[64];
};

std::string Base64Encode(const std::uint8_t* data, size_t len);

/// Base64(SHA1(key + RFC 6455 GUID))
std::string ComputeAcceptKey(const std::string& client_key);

/**
 * @brief Parsed HTTP upgrade request.
 *
 * Header names are matched case-insensitively.
 */
struct HandshakeRequest {
    std::string key;
    std::string path;
};

/// nullopt when the request is not a valid WebSocket upgrade
std::optional<HandshakeRequest> ParseHandshakeRequest(const std::string& request);

std::string BuildHandshakeResponse(const std::string& accept_key);
std::string BuildHandshakeRejection();

/// Server-to-client frame (never masked)
std::string EncodeFrame(const std::string& payload, Opcode opcode = OP_TEXT, bool fin = true);

struct Frame {
    bool fin = true;
    std::uint8_t opcode = OP_TEXT;
    std::string payload;    ///< unmasked
};

enum class DecodeStatus {
    Complete,       ///< one frame consumed from the buffer
    Incomplete,     ///< need more bytes
    TooLarge,       ///< declared payload exceeds the limit
    Unmasked        ///< client frames must be masked
};

/**
 * @brief Decode one frame from the front of `buffer`.
 *
 * On Complete the frame bytes are erased from `buffer`.
 */
DecodeStatus DecodeFrame(std::string& buffer, Frame& frame, size_t max_payload);

} // namespace ws
} // namespace FlightBridge
