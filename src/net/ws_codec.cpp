#include "net/ws_codec.hpp"

#include <array>

namespace jugsync::net {

namespace {

constexpr char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

uint32_t rotl(uint32_t v, int bits) {
    return (v << bits) | (v >> (32 - bits));
}

void sha1Block(const unsigned char* block, std::array<uint32_t, 5>& h) {
    uint32_t w[80];
    for (int i = 0; i < 16; ++i) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<uint32_t>(block[i * 4 + 3]);
    }
    for (int i = 16; i < 80; ++i) {
        w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h[0];
    uint32_t b = h[1];
    uint32_t c = h[2];
    uint32_t d = h[3];
    uint32_t e = h[4];
    for (int i = 0; i < 80; ++i) {
        uint32_t f = 0;
        uint32_t k = 0;
        if (i < 20) {
            f = (b & c) | ((~b) & d);
            k = 0x5A827999U;
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1U;
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDCU;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6U;
        }
        const uint32_t temp = rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = temp;
    }
    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

}  // namespace

std::string sha1Digest(const std::string& data) {
    std::array<uint32_t, 5> h{0x67452301U, 0xEFCDAB89U, 0x98BADCFEU, 0x10325476U, 0xC3D2E1F0U};

    std::string msg = data;
    const uint64_t bit_len = static_cast<uint64_t>(data.size()) * 8U;
    msg.push_back(static_cast<char>(0x80));
    while ((msg.size() % 64U) != 56U) {
        msg.push_back('\0');
    }
    for (int i = 7; i >= 0; --i) {
        msg.push_back(static_cast<char>((bit_len >> (i * 8)) & 0xFFU));
    }

    for (std::size_t off = 0; off < msg.size(); off += 64U) {
        sha1Block(reinterpret_cast<const unsigned char*>(msg.data() + off), h);
    }

    std::string out;
    out.reserve(20);
    for (uint32_t v : h) {
        out.push_back(static_cast<char>((v >> 24) & 0xFFU));
        out.push_back(static_cast<char>((v >> 16) & 0xFFU));
        out.push_back(static_cast<char>((v >> 8) & 0xFFU));
        out.push_back(static_cast<char>(v & 0xFFU));
    }
    return out;
}

std::string base64Encode(const std::string& data) {
    static const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2U) / 3U) * 4U);
    std::size_t i = 0;
    while (i + 3U <= data.size()) {
        const uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16) |
                           (static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8) |
                           static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
        i += 3U;
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1U) {
        const uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2U) {
        const uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16) |
                           (static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string computeAcceptKey(const std::string& client_key) {
    return base64Encode(sha1Digest(client_key + kWebSocketGuid));
}

bool isControlOpcode(WsOpcode opcode) {
    return (static_cast<uint8_t>(opcode) & 0x8U) != 0;
}

std::string encodeFrame(WsOpcode opcode, const std::string& payload, bool fin, bool mask, uint32_t mask_key) {
    std::string out;
    out.reserve(payload.size() + 14U);
    out.push_back(static_cast<char>((fin ? 0x80U : 0x00U) | static_cast<uint8_t>(opcode)));

    const uint8_t mask_bit = mask ? 0x80U : 0x00U;
    const uint64_t len = payload.size();
    if (len < 126U) {
        out.push_back(static_cast<char>(mask_bit | static_cast<uint8_t>(len)));
    } else if (len <= 0xFFFFU) {
        out.push_back(static_cast<char>(mask_bit | 126U));
        out.push_back(static_cast<char>((len >> 8) & 0xFFU));
        out.push_back(static_cast<char>(len & 0xFFU));
    } else {
        out.push_back(static_cast<char>(mask_bit | 127U));
        for (int i = 7; i >= 0; --i) {
            out.push_back(static_cast<char>((len >> (i * 8)) & 0xFFU));
        }
    }

    if (!mask) {
        out += payload;
        return out;
    }

    const unsigned char key[4] = {
        static_cast<unsigned char>((mask_key >> 24) & 0xFFU),
        static_cast<unsigned char>((mask_key >> 16) & 0xFFU),
        static_cast<unsigned char>((mask_key >> 8) & 0xFFU),
        static_cast<unsigned char>(mask_key & 0xFFU),
    };
    out.append(reinterpret_cast<const char*>(key), 4);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(static_cast<unsigned char>(payload[i]) ^ key[i % 4U]));
    }
    return out;
}

WsDecodeStatus decodeFrame(const std::string& buffer, WsFrame& out, std::size_t& consumed, std::string& error) {
    consumed = 0;
    if (buffer.size() < 2U) {
        return WsDecodeStatus::NeedMore;
    }

    const auto b0 = static_cast<uint8_t>(buffer[0]);
    const auto b1 = static_cast<uint8_t>(buffer[1]);
    if ((b0 & 0x70U) != 0) {
        error = "reserved bits set without negotiated extension";
        return WsDecodeStatus::Error;
    }

    const auto opcode = static_cast<WsOpcode>(b0 & 0x0FU);
    switch (opcode) {
        case WsOpcode::Continuation:
        case WsOpcode::Text:
        case WsOpcode::Binary:
        case WsOpcode::Close:
        case WsOpcode::Ping:
        case WsOpcode::Pong:
            break;
        default:
            error = "unknown opcode " + std::to_string(b0 & 0x0FU);
            return WsDecodeStatus::Error;
    }

    const bool fin = (b0 & 0x80U) != 0;
    const bool masked = (b1 & 0x80U) != 0;
    uint64_t len = b1 & 0x7FU;
    std::size_t pos = 2;

    if (len == 126U) {
        if (buffer.size() < pos + 2U) {
            return WsDecodeStatus::NeedMore;
        }
        len = (static_cast<uint64_t>(static_cast<uint8_t>(buffer[pos])) << 8) |
              static_cast<uint64_t>(static_cast<uint8_t>(buffer[pos + 1]));
        pos += 2U;
    } else if (len == 127U) {
        if (buffer.size() < pos + 8U) {
            return WsDecodeStatus::NeedMore;
        }
        len = 0;
        for (int i = 0; i < 8; ++i) {
            len = (len << 8) | static_cast<uint64_t>(static_cast<uint8_t>(buffer[pos + i]));
        }
        pos += 8U;
    }

    if (isControlOpcode(opcode) && (len > 125U || !fin)) {
        error = "control frame must be unfragmented with payload <= 125 bytes";
        return WsDecodeStatus::Error;
    }
    if (len > kMaxFramePayload) {
        error = "frame payload too large: " + std::to_string(len);
        return WsDecodeStatus::Error;
    }

    unsigned char key[4] = {0, 0, 0, 0};
    if (masked) {
        if (buffer.size() < pos + 4U) {
            return WsDecodeStatus::NeedMore;
        }
        for (int i = 0; i < 4; ++i) {
            key[i] = static_cast<unsigned char>(buffer[pos + i]);
        }
        pos += 4U;
    }

    if (buffer.size() < pos + len) {
        return WsDecodeStatus::NeedMore;
    }

    out.fin = fin;
    out.masked = masked;
    out.opcode = opcode;
    out.payload.assign(buffer, pos, static_cast<std::size_t>(len));
    if (masked) {
        for (std::size_t i = 0; i < out.payload.size(); ++i) {
            out.payload[i] = static_cast<char>(static_cast<unsigned char>(out.payload[i]) ^ key[i % 4U]);
        }
    }
    consumed = pos + static_cast<std::size_t>(len);
    return WsDecodeStatus::Ok;
}

}  // namespace jugsync::net
