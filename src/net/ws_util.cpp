///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file ws_util.cpp
 * @brief SHA-1/Base64 handshake helpers and RFC 6455 frame codec
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/ws_util.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace FlightBridge {
namespace ws {

namespace {

const char* const WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline std::uint32_t Rol(std::uint32_t value, std::uint32_t bits) {
    return (value << bits) | (value >> (32 - bits));
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string TrimHeaderValue(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && (value[begin] == ' ' || value[begin] == '\t')) ++begin;
    while (end > begin && (value[end - 1] == ' ' || value[end - 1] == '\t' || value[end - 1] == '\r')) --end;
    return value.substr(begin, end - begin);
}

bool ContainsToken(const std::string& header_value, const std::string& token) {
    // Connection may carry a list, e.g. "keep-alive, Upgrade"
    std::stringstream stream(ToLower(header_value));
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (TrimHeaderValue(item) == token) {
            return true;
        }
    }
    return false;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// SHA-1
///////////////////////////////////////////////////////////////////////////////////////////////////

Sha1::Sha1()
    : state_{0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0},
      bit_count_(0),
      buffer_{} {}

void Sha1::Transform(const std::uint8_t block[64]) {
    std::uint32_t w[80];
    for (int i = 0; i < 16; ++i) {
        w[i] = (std::uint32_t(block[i * 4]) << 24) | (std::uint32_t(block[i * 4 + 1]) << 16) |
               (std::uint32_t(block[i * 4 + 2]) << 8) | std::uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 80; ++i) {
        w[i] = Rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    std::uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3], e = state_[4];
    for (int i = 0; i < 80; ++i) {
        std::uint32_t f, k;
        if (i < 20)      { f = (b & c) | (~b & d);           k = 0x5A827999; }
        else if (i < 40) { f = b ^ c ^ d;                    k = 0x6ED9EBA1; }
        else if (i < 60) { f = (b & c) | (b & d) | (c & d);  k = 0x8F1BBCDC; }
        else             { f = b ^ c ^ d;                    k = 0xCA62C1D6; }

        const std::uint32_t t = Rol(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = Rol(b, 30);
        b = a;
        a = t;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

void Sha1::Update(const std::uint8_t* data, size_t len) {
    size_t offset = static_cast<size_t>((bit_count_ >> 3) % 64);
    bit_count_ += static_cast<std::uint64_t>(len) << 3;

    size_t i = 0;
    const size_t space = 64 - offset;
    if (len >= space) {
        std::memcpy(&buffer_[offset], data, space);
        Transform(buffer_);
        for (i = space; i + 63 < len; i += 64) {
            Transform(&data[i]);
        }
        offset = 0;
    }
    std::memcpy(&buffer_[offset], &data[i], len - i);
}

void Sha1::Update(const std::string& data) {
    Update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::array<std::uint8_t, 20> Sha1::Final() {
    std::uint8_t length[8];
    for (int i = 0; i < 8; ++i) {
        length[i] = static_cast<std::uint8_t>((bit_count_ >> ((7 - i) * 8)) & 0xFF);
    }

    const std::uint8_t pad_start = 0x80;
    const std::uint8_t zero = 0x00;
    Update(&pad_start, 1);
    while ((bit_count_ & 0x1FF) != 448) {
        Update(&zero, 1);
    }
    Update(length, 8);

    std::array<std::uint8_t, 20> digest{};
    for (int i = 0; i < 20; ++i) {
        digest[i] = static_cast<std::uint8_t>((state_[i >> 2] >> ((3 - (i & 3)) * 8)) & 0xFF);
    }
    return digest;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Handshake
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string Base64Encode(const std::uint8_t* data, size_t len) {
    static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        const std::uint32_t n = (std::uint32_t(data[i]) << 16) |
                                (i + 1 < len ? std::uint32_t(data[i + 1]) << 8 : 0) |
                                (i + 2 < len ? std::uint32_t(data[i + 2]) : 0);
        out.push_back(table[(n >> 18) & 63]);
        out.push_back(table[(n >> 12) & 63]);
        out.push_back(i + 1 < len ? table[(n >> 6) & 63] : '=');
        out.push_back(i + 2 < len ? table[n & 63] : '=');
    }
    return out;
}

std::string ComputeAcceptKey(const std::string& client_key) {
    Sha1 sha;
    sha.Update(client_key);
    sha.Update(std::string(WEBSOCKET_GUID));
    const auto digest = sha.Final();
    return Base64Encode(digest.data(), digest.size());
}

std::optional<HandshakeRequest> ParseHandshakeRequest(const std::string& request) {
    const size_t header_end = request.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream lines(request.substr(0, header_end));
    std::string request_line;
    if (!std::getline(lines, request_line)) {
        return std::nullopt;
    }

    std::istringstream request_parts(request_line);
    std::string method;
    HandshakeRequest result;
    request_parts >> method >> result.path;
    if (method != "GET") {
        return std::nullopt;
    }

    bool upgrade_websocket = false;
    bool connection_upgrade = false;

    std::string line;
    while (std::getline(lines, line)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string name = ToLower(TrimHeaderValue(line.substr(0, colon)));
        const std::string value = TrimHeaderValue(line.substr(colon + 1));

        if (name == "upgrade") {
            upgrade_websocket = ToLower(value) == "websocket";
        } else if (name == "connection") {
            connection_upgrade = ContainsToken(value, "upgrade");
        } else if (name == "sec-websocket-key") {
            result.key = value;
        }
    }

    if (!upgrade_websocket || !connection_upgrade || result.key.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string BuildHandshakeResponse(const std::string& accept_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << accept_key << "\r\n\r\n";
    return response.str();
}

std::string BuildHandshakeRejection() {
    return "HTTP/1.1 400 Bad Request\r\nConnection: close\r\nContent-Length: 0\r\n\r\n";
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Frames
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string EncodeFrame(const std::string& payload, Opcode opcode, bool fin) {
    const std::uint64_t len = payload.size();

    std::string frame;
    frame.reserve(10 + payload.size());
    frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    if (len <= 125) {
        frame.push_back(static_cast<char>(len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(127));
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
        }
    }

    frame.append(payload);
    return frame;
}

DecodeStatus DecodeFrame(std::string& buffer, Frame& frame, size_t max_payload) {
    if (buffer.size() < 2) {
        return DecodeStatus::Incomplete;
    }

    const auto* p = reinterpret_cast<const std::uint8_t*>(buffer.data());
    const bool fin = (p[0] & 0x80) != 0;
    const std::uint8_t opcode = p[0] & 0x0F;
    const bool masked = (p[1] & 0x80) != 0;
    std::uint64_t len = p[1] & 0x7F;
    size_t pos = 2;

    if (len == 126) {
        if (buffer.size() < pos + 2) return DecodeStatus::Incomplete;
        len = (std::uint64_t(p[pos]) << 8) | p[pos + 1];
        pos += 2;
    } else if (len == 127) {
        if (buffer.size() < pos + 8) return DecodeStatus::Incomplete;
        len = 0;
        for (int i = 0; i < 8; ++i) {
            len = (len << 8) | p[pos + i];
        }
        pos += 8;
    }

    if (len > max_payload) {
        return DecodeStatus::TooLarge;
    }
    if (!masked) {
        return DecodeStatus::Unmasked;
    }

    if (buffer.size() < pos + 4) return DecodeStatus::Incomplete;
    const std::uint8_t mask[4] = {p[pos], p[pos + 1], p[pos + 2], p[pos + 3]};
    pos += 4;

    if (buffer.size() < pos + len) return DecodeStatus::Incomplete;

    frame.fin = fin;
    frame.opcode = opcode;
    frame.payload.resize(static_cast<size_t>(len));
    for (size_t i = 0; i < static_cast<size_t>(len); ++i) {
        frame.payload[i] = static_cast<char>(p[pos + i] ^ mask[i % 4]);
    }

    buffer.erase(0, pos + static_cast<size_t>(len));
    return DecodeStatus::Complete;
}

} // namespace ws
} // namespace FlightBridge
