#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "net/message_transport.hpp"
#include "net/ws_codec.hpp"

namespace jugsync::net {

// Minimal RFC 6455 client: no extensions, no subprotocols, ws:// only.
class WebSocketClient : public IMessageTransport {
public:
    WebSocketClient();
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    bool connect(const std::string& host, uint16_t port, const std::string& path, int timeout_ms,
                 std::string& error) override;
    ReceiveStatus receive(std::string& out, int timeout_ms, std::string& error) override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    bool sendText(const std::string& payload, std::string& error);

    static std::string makeClientKey(std::mt19937& rng);

private:
    bool sendFrame(WsOpcode opcode, const std::string& payload, std::string& error);
    bool sendAll(const std::string& data, std::string& error);
    // Appends available bytes to rx_. Returns false on error or peer close.
    bool readSome(int timeout_ms, bool& timed_out, bool& peer_closed, std::string& error);
    bool handshake(const std::string& host, uint16_t port, const std::string& path, int timeout_ms,
                   std::string& error);
    void closeSocket();

    int fd_{-1};
    std::string rx_;
    std::string partial_;
    bool in_fragment_{false};
    bool close_sent_{false};
    std::mt19937 rng_;
};

}  // namespace jugsync::net
