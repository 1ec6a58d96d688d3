#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace jugsync::net {

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

struct WsFrame {
    bool fin{true};
    bool masked{false};
    WsOpcode opcode{WsOpcode::Text};
    std::string payload;
};

enum class WsDecodeStatus {
    Ok,
    NeedMore,
    Error,
};

constexpr std::size_t kMaxFramePayload = 16U * 1024U * 1024U;

// Raw 20-byte digest.
std::string sha1Digest(const std::string& data);
std::string base64Encode(const std::string& data);

// Sec-WebSocket-Accept value for a client key (RFC 6455 section 4.2.2).
std::string computeAcceptKey(const std::string& client_key);

std::string encodeFrame(WsOpcode opcode, const std::string& payload, bool fin, bool mask, uint32_t mask_key);

// Decodes the first frame in buffer. On Ok, consumed is the frame's wire size
// and the payload is unmasked.
WsDecodeStatus decodeFrame(const std::string& buffer, WsFrame& out, std::size_t& consumed, std::string& error);

bool isControlOpcode(WsOpcode opcode);

}  // namespace jugsync::net
