///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_ws_util.cpp
 * @brief Unit tests for the WebSocket handshake and frame codec
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "net/ws_util.h"

using namespace FlightBridge;
using namespace TestHelpers;

namespace {

std::string ToHex(const std::array<std::uint8_t, 20>& digest) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    for (auto byte : digest) {
        out.push_back(HEX[byte >> 4]);
        out.push_back(HEX[byte & 0x0F]);
    }
    return out;
}

/// Client-side (masked) frame
std::string MaskedFrame(const std::string& payload, std::uint8_t opcode, bool fin = true) {
    std::string frame;
    frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | opcode));
    frame.push_back(static_cast<char>(0x80 | payload.size()));
    const char mask[4] = {0x01, 0x02, 0x03, 0x04};
    frame.append(mask, 4);
    for (size_t i = 0; i < payload.size(); ++i) {
        frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
    }
    return frame;
}

} // namespace

TEST_CASE("Handshake key", "[unit][websocket]") {
    SECTION("SHA-1 of a known input") {
        ws::Sha1 sha;
        sha.Update(std::string("abc"));
        REQUIRE(ToHex(sha.Final()) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    }

    SECTION("Accept key from the RFC 6455 example") {
        REQUIRE(ws::ComputeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    }

    SECTION("Base64 padding") {
        const std::uint8_t data[] = {'f', 'o', 'o', 'b'};
        REQUIRE(ws::Base64Encode(data, 4) == "Zm9vYg==");
        REQUIRE(ws::Base64Encode(data, 3) == "Zm9v");
    }
}

TEST_CASE("Handshake request parsing", "[unit][websocket]") {
    SECTION("Valid upgrade, header names in any case") {
        auto request = ws::ParseHandshakeRequest(
            "GET /telemetry HTTP/1.1\r\n"
            "host: localhost:8500\r\n"
            "UPGRADE: WebSocket\r\n"
            "connection: keep-alive, Upgrade\r\n"
            "sec-websocket-key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
            "Sec-WebSocket-Version: 13\r\n\r\n");
        REQUIRE(request.has_value());
        REQUIRE(request->path == "/telemetry");
        REQUIRE(request->key == "dGhlIHNhbXBsZSBub25jZQ==");
    }

    SECTION("Plain HTTP requests are rejected") {
        REQUIRE_FALSE(ws::ParseHandshakeRequest("GET / HTTP/1.1\r\nHost: x\r\n\r\n").has_value());
    }

    SECTION("Missing key or wrong method") {
        REQUIRE_FALSE(ws::ParseHandshakeRequest(
            "GET / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n").has_value());
        REQUIRE_FALSE(ws::ParseHandshakeRequest(
            "POST / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\nSec-WebSocket-Key: abc\r\n\r\n").has_value());
    }

    SECTION("Incomplete header block") {
        REQUIRE_FALSE(ws::ParseHandshakeRequest("GET / HTTP/1.1\r\nUpgrade: websocket\r\n").has_value());
    }

    SECTION("Response carries the accept key") {
        const std::string response = ws::BuildHandshakeResponse("s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
        REQUIRE(StringContains(response, "101 Switching Protocols"));
        REQUIRE(StringContains(response, "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"));
        REQUIRE(StringContains(ws::BuildHandshakeRejection(), "400"));
    }
}

TEST_CASE("Frame encoding", "[unit][websocket]") {
    SECTION("Short text frame") {
        const std::string frame = ws::EncodeFrame("hi");
        REQUIRE(frame.size() == 4);
        REQUIRE(static_cast<std::uint8_t>(frame[0]) == 0x81);
        REQUIRE(static_cast<std::uint8_t>(frame[1]) == 2);
        REQUIRE(frame.substr(2) == "hi");
    }

    SECTION("16-bit length") {
        const std::string frame = ws::EncodeFrame(std::string(126, 'x'));
        REQUIRE(static_cast<std::uint8_t>(frame[1]) == 126);
        REQUIRE(static_cast<std::uint8_t>(frame[2]) == 0);
        REQUIRE(static_cast<std::uint8_t>(frame[3]) == 126);
        REQUIRE(frame.size() == 4 + 126);
    }

    SECTION("64-bit length") {
        const std::string frame = ws::EncodeFrame(std::string(70000, 'x'));
        REQUIRE(static_cast<std::uint8_t>(frame[1]) == 127);
        REQUIRE(frame.size() == 10 + 70000);
    }

    SECTION("Control frame opcode") {
        const std::string frame = ws::EncodeFrame("", ws::OP_PONG);
        REQUIRE(static_cast<std::uint8_t>(frame[0]) == 0x8A);
    }
}

TEST_CASE("Frame decoding", "[unit][websocket]") {
    ws::Frame frame;

    SECTION("Masked frame is unmasked and consumed") {
        std::string buffer = MaskedFrame("hello", ws::OP_TEXT) + "trailing";
        REQUIRE(ws::DecodeFrame(buffer, frame, 1024) == ws::DecodeStatus::Complete);
        REQUIRE(frame.payload == "hello");
        REQUIRE(frame.opcode == ws::OP_TEXT);
        REQUIRE(frame.fin);
        REQUIRE(buffer == "trailing");
    }

    SECTION("Fragment flag is reported") {
        std::string buffer = MaskedFrame("part", ws::OP_TEXT, false);
        REQUIRE(ws::DecodeFrame(buffer, frame, 1024) == ws::DecodeStatus::Complete);
        REQUIRE_FALSE(frame.fin);
    }

    SECTION("Partial frame needs more bytes") {
        const std::string full = MaskedFrame("hello", ws::OP_TEXT);
        std::string buffer = full.substr(0, full.size() - 1);
        REQUIRE(ws::DecodeFrame(buffer, frame, 1024) == ws::DecodeStatus::Incomplete);
        REQUIRE(buffer.size() == full.size() - 1);

        buffer.push_back(full.back());
        REQUIRE(ws::DecodeFrame(buffer, frame, 1024) == ws::DecodeStatus::Complete);
        REQUIRE(frame.payload == "hello");
    }

    SECTION("Unmasked client frame is a protocol error") {
        std::string buffer = ws::EncodeFrame("hello");
        REQUIRE(ws::DecodeFrame(buffer, frame, 1024) == ws::DecodeStatus::Unmasked);
    }

    SECTION("Oversized payload is refused before it arrives") {
        std::string buffer = MaskedFrame("0123456789", ws::OP_TEXT);
        REQUIRE(ws::DecodeFrame(buffer, frame, 4) == ws::DecodeStatus::TooLarge);
    }
}
