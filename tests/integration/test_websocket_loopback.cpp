#include "net/websocket_client.hpp"

#include <functional>
#include <iostream>
#include <string>
#include <thread>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

bool readUntil(int fd, std::string& buffer, const std::string& marker) {
    char buf[1024];
    while (buffer.find(marker) == std::string::npos) {
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 2000) <= 0) {
            return false;
        }
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            return false;
        }
        buffer.append(buf, static_cast<std::size_t>(n));
    }
    return true;
}

bool readFrame(int fd, std::string& buffer, jugsync::net::WsFrame& frame) {
    char buf[1024];
    for (;;) {
        std::size_t consumed = 0;
        std::string error;
        const auto st = jugsync::net::decodeFrame(buffer, frame, consumed, error);
        if (st == jugsync::net::WsDecodeStatus::Ok) {
            buffer.erase(0, consumed);
            return true;
        }
        if (st == jugsync::net::WsDecodeStatus::Error) {
            return false;
        }
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 2000) <= 0) {
            return false;
        }
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            return false;
        }
        buffer.append(buf, static_cast<std::size_t>(n));
    }
}

void sendRaw(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        off += static_cast<std::size_t>(n);
    }
}

// One-connection device stand-in: completes the upgrade, sends a message split
// across two frames with a ping in between, then closes.
void serveOnce(int listen_fd, std::string& server_error, bool& pong_ok, bool& close_echoed) {
    using namespace jugsync::net;

    const int fd = accept(listen_fd, nullptr, nullptr);
    if (fd < 0) {
        server_error = "accept failed";
        return;
    }

    std::string rx;
    if (!readUntil(fd, rx, "\r\n\r\n")) {
        server_error = "no upgrade request";
        ::close(fd);
        return;
    }
    const std::string key_header = "Sec-WebSocket-Key: ";
    const auto key_pos = rx.find(key_header);
    if (rx.rfind("GET /imu HTTP/1.1", 0) != 0 || key_pos == std::string::npos) {
        server_error = "malformed upgrade request";
        ::close(fd);
        return;
    }
    const auto key_end = rx.find("\r\n", key_pos);
    const std::string key = rx.substr(key_pos + key_header.size(), key_end - key_pos - key_header.size());
    rx.erase(0, rx.find("\r\n\r\n") + 4U);

    sendRaw(fd, "HTTP/1.1 101 Switching Protocols\r\n"
                "Upgrade: websocket\r\n"
                "Connection: Upgrade\r\n"
                "Sec-WebSocket-Accept: " + computeAcceptKey(key) + "\r\n\r\n");

    sendRaw(fd, encodeFrame(WsOpcode::Text, "{\"type\":\"accel\",", false, false, 0) +
                    encodeFrame(WsOpcode::Ping, "hb", true, false, 0) +
                    encodeFrame(WsOpcode::Continuation, "\"x\":1,\"y\":2,\"z\":3}", true, false, 0));

    WsFrame frame;
    pong_ok = readFrame(fd, rx, frame) && frame.opcode == WsOpcode::Pong && frame.masked && frame.payload == "hb";

    sendRaw(fd, encodeFrame(WsOpcode::Close, std::string("\x03\xE8", 2), true, false, 0));
    close_echoed = readFrame(fd, rx, frame) && frame.opcode == WsOpcode::Close && frame.masked;
    ::close(fd);
}

}  // namespace

int main() {
    const int listen_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd < 0) {
        std::cerr << "socket failed\n";
        return 1;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || listen(listen_fd, 1) != 0 ||
        getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        std::cerr << "cannot listen on loopback\n";
        ::close(listen_fd);
        return 1;
    }
    const uint16_t port = ntohs(addr.sin_port);

    std::string server_error;
    bool pong_ok = false;
    bool close_echoed = false;
    std::thread server(serveOnce, listen_fd, std::ref(server_error), std::ref(pong_ok), std::ref(close_echoed));

    jugsync::net::WebSocketClient client;
    std::string error;
    int rc = 0;
    if (!client.connect("127.0.0.1", port, "/imu", 2000, error)) {
        std::cerr << "connect failed: " << error << "\n";
        rc = 1;
    }

    std::string message;
    if (rc == 0) {
        const auto st = client.receive(message, 2000, error);
        if (st != jugsync::net::ReceiveStatus::Message || message != "{\"type\":\"accel\",\"x\":1,\"y\":2,\"z\":3}") {
            std::cerr << "fragmented message not reassembled (" << jugsync::net::receiveStatusName(st) << ": "
                      << error << ")\n";
            rc = 1;
        }
    }
    if (rc == 0) {
        const auto st = client.receive(message, 2000, error);
        if (st != jugsync::net::ReceiveStatus::Closed || client.isOpen()) {
            std::cerr << "server close should end the connection, got "
                      << jugsync::net::receiveStatusName(st) << "\n";
            rc = 1;
        }
    }
    client.close();

    server.join();
    ::close(listen_fd);

    if (!server_error.empty()) {
        std::cerr << "server: " << server_error << "\n";
        return 1;
    }
    if (rc == 0 && !pong_ok) {
        std::cerr << "ping was not answered with a masked pong\n";
        return 1;
    }
    if (rc == 0 && !close_echoed) {
        std::cerr << "close frame was not echoed\n";
        return 1;
    }

    // Nothing listens on the released port any more.
    jugsync::net::WebSocketClient refused;
    if (refused.connect("127.0.0.1", port, "/imu", 500, error) || error.empty()) {
        std::cerr << "connect to a closed port should fail with an error\n";
        return 1;
    }
    return rc;
}

#else

int main() {
    return 0;
}

#endif
