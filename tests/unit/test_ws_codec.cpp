#include "net/ws_codec.hpp"

#include <iostream>
#include <string>

namespace {

std::string hex(const std::string& bytes) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    for (unsigned char c : bytes) {
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0F]);
    }
    return out;
}

}  // namespace

int main() {
    using namespace jugsync::net;

    if (hex(sha1Digest("abc")) != "a9993e364706816aba3e25717850c26c9cd0d89d") {
        std::cerr << "sha1(abc) mismatch\n";
        return 1;
    }
    if (hex(sha1Digest("")) != "da39a3ee5e6b4b0d3255bfef95601890afd80709") {
        std::cerr << "sha1(empty) mismatch\n";
        return 1;
    }
    if (base64Encode("f") != "Zg==" || base64Encode("fo") != "Zm8=" || base64Encode("foo") != "Zm9v") {
        std::cerr << "base64 padding mismatch\n";
        return 1;
    }

    // RFC 6455 section 1.3 example
    if (computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") != "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") {
        std::cerr << "Sec-WebSocket-Accept mismatch\n";
        return 1;
    }

    // RFC 6455 section 5.7: unmasked "Hello"
    const std::string hello = encodeFrame(WsOpcode::Text, "Hello", true, false, 0);
    if (hello != std::string("\x81\x05Hello", 7)) {
        std::cerr << "unmasked text frame encoding mismatch\n";
        return 1;
    }
    // masked "Hello" with key 37 fa 21 3d
    const std::string masked = encodeFrame(WsOpcode::Text, "Hello", true, true, 0x37fa213dU);
    if (masked != std::string("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11)) {
        std::cerr << "masked text frame encoding mismatch\n";
        return 1;
    }

    WsFrame frame;
    std::size_t consumed = 0;
    std::string error;
    if (decodeFrame(masked, frame, consumed, error) != WsDecodeStatus::Ok || consumed != masked.size() ||
        frame.payload != "Hello" || !frame.masked || !frame.fin || frame.opcode != WsOpcode::Text) {
        std::cerr << "masked frame decode mismatch\n";
        return 1;
    }

    // Partial buffers ask for more bytes.
    for (std::size_t n = 0; n < hello.size(); ++n) {
        if (decodeFrame(hello.substr(0, n), frame, consumed, error) != WsDecodeStatus::NeedMore) {
            std::cerr << "truncated frame should need more bytes (n=" << n << ")\n";
            return 1;
        }
    }

    // 16-bit and 64-bit length forms.
    const std::string medium(300, 'm');
    const std::string medium_frame = encodeFrame(WsOpcode::Binary, medium, true, false, 0);
    if (static_cast<unsigned char>(medium_frame[1]) != 126U ||
        decodeFrame(medium_frame, frame, consumed, error) != WsDecodeStatus::Ok || frame.payload != medium) {
        std::cerr << "16-bit length frame mismatch\n";
        return 1;
    }
    const std::string large(70000, 'L');
    const std::string large_frame = encodeFrame(WsOpcode::Binary, large, true, true, 0x01020304U);
    if ((static_cast<unsigned char>(large_frame[1]) & 0x7FU) != 127U ||
        decodeFrame(large_frame, frame, consumed, error) != WsDecodeStatus::Ok || frame.payload != large) {
        std::cerr << "64-bit length frame mismatch\n";
        return 1;
    }

    // Two frames back to back decode one at a time.
    const std::string first = encodeFrame(WsOpcode::Text, "a", false, false, 0);
    const std::string second = encodeFrame(WsOpcode::Continuation, "b", true, false, 0);
    const std::string stream = first + second;
    if (decodeFrame(stream, frame, consumed, error) != WsDecodeStatus::Ok || frame.fin || consumed != first.size()) {
        std::cerr << "first of two frames mismatch\n";
        return 1;
    }
    if (decodeFrame(stream.substr(consumed), frame, consumed, error) != WsDecodeStatus::Ok ||
        frame.opcode != WsOpcode::Continuation || frame.payload != "b") {
        std::cerr << "continuation frame mismatch\n";
        return 1;
    }

    // Protocol violations.
    const std::string long_ping = encodeFrame(WsOpcode::Ping, std::string(126, 'p'), true, false, 0);
    if (decodeFrame(long_ping, frame, consumed, error) != WsDecodeStatus::Error) {
        std::cerr << "control frame > 125 bytes must be rejected\n";
        return 1;
    }
    if (decodeFrame(std::string("\x83\x00", 2), frame, consumed, error) != WsDecodeStatus::Error) {
        std::cerr << "reserved opcode must be rejected\n";
        return 1;
    }
    if (decodeFrame(std::string("\xC1\x00", 2), frame, consumed, error) != WsDecodeStatus::Error) {
        std::cerr << "RSV bits must be rejected\n";
        return 1;
    }
    if (!isControlOpcode(WsOpcode::Close) || isControlOpcode(WsOpcode::Binary)) {
        std::cerr << "isControlOpcode mismatch\n";
        return 1;
    }
    return 0;
}
