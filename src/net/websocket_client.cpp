#include "net/websocket_client.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <map>
#include <sstream>

#ifdef __linux__
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace jugsync::net {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 16U * 1024U;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return static_cast<int>(std::max<int64_t>(0, left.count()));
}

}  // namespace

const char* receiveStatusName(ReceiveStatus status) {
    switch (status) {
        case ReceiveStatus::Message:
            return "message";
        case ReceiveStatus::Timeout:
            return "timeout";
        case ReceiveStatus::Closed:
            return "closed";
        case ReceiveStatus::Error:
            return "error";
    }
    return "unknown";
}

WebSocketClient::WebSocketClient()
    : rng_(std::random_device{}()) {}

WebSocketClient::~WebSocketClient() {
    close();
}

std::string WebSocketClient::makeClientKey(std::mt19937& rng) {
    std::string nonce(16, '\0');
    for (auto& c : nonce) {
        c = static_cast<char>(rng() & 0xFFU);
    }
    return base64Encode(nonce);
}

#ifdef __linux__

bool WebSocketClient::connect(const std::string& host, uint16_t port, const std::string& path, int timeout_ms,
                              std::string& error) {
    closeSocket();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        error = "cannot resolve " + host + ": " + gai_strerror(rc);
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address for " + host;
    for (addrinfo* ai = results; ai != nullptr && fd_ < 0; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket: ") + std::strerror(errno);
            continue;
        }
        const int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        bool ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!ok && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            const int prc = poll(&pfd, 1, remainingMs(deadline));
            if (prc > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                ok = so_error == 0;
                if (!ok) {
                    last_error = std::string("connect: ") + std::strerror(so_error);
                }
            } else {
                last_error = "connect timed out";
            }
        } else if (!ok) {
            last_error = std::string("connect: ") + std::strerror(errno);
        }

        if (!ok) {
            ::close(fd);
            continue;
        }
        fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
        int yes = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
        fd_ = fd;
    }
    freeaddrinfo(results);

    if (fd_ < 0) {
        error = last_error;
        return false;
    }
    if (!handshake(host, port, path, remainingMs(deadline), error)) {
        closeSocket();
        return false;
    }
    return true;
}

bool WebSocketClient::handshake(const std::string& host, uint16_t port, const std::string& path, int timeout_ms,
                                std::string& error) {
    const std::string key = makeClientKey(rng_);
    std::ostringstream req;
    req << "GET " << path << " HTTP/1.1\r\n"
        << "Host: " << host << ":" << port << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n\r\n";
    if (!sendAll(req.str(), error)) {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t header_end = std::string::npos;
    while ((header_end = rx_.find("\r\n\r\n")) == std::string::npos) {
        if (rx_.size() > kMaxHandshakeBytes) {
            error = "handshake response too large";
            return false;
        }
        const int left = remainingMs(deadline);
        if (left <= 0) {
            error = "handshake timed out";
            return false;
        }
        bool timed_out = false;
        bool peer_closed = false;
        if (!readSome(left, timed_out, peer_closed, error)) {
            if (peer_closed) {
                error = "connection closed during handshake";
            }
            return false;
        }
    }

    const std::string head = rx_.substr(0, header_end);
    rx_.erase(0, header_end + 4U);

    std::istringstream lines(head);
    std::string status_line;
    std::getline(lines, status_line);
    status_line = trim(status_line);
    if (status_line.rfind("HTTP/1.1 101", 0) != 0) {
        error = "upgrade rejected: " + status_line;
        return false;
    }

    std::map<std::string, std::string> headers;
    std::string line;
    while (std::getline(lines, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    if (toLower(headers["upgrade"]) != "websocket") {
        error = "missing 'Upgrade: websocket' in handshake response";
        return false;
    }
    if (headers["sec-websocket-accept"] != computeAcceptKey(key)) {
        error = "Sec-WebSocket-Accept mismatch";
        return false;
    }
    return true;
}

bool WebSocketClient::readSome(int timeout_ms, bool& timed_out, bool& peer_closed, std::string& error) {
    timed_out = false;
    peer_closed = false;

    pollfd pfd{fd_, POLLIN, 0};
    const int prc = poll(&pfd, 1, timeout_ms);
    if (prc == 0) {
        timed_out = true;
        return true;
    }
    if (prc < 0) {
        if (errno == EINTR) {
            timed_out = true;
            return true;
        }
        error = std::string("poll: ") + std::strerror(errno);
        return false;
    }

    char buf[4096];
    const ssize_t n = recv(fd_, buf, sizeof(buf), 0);
    if (n == 0) {
        peer_closed = true;
        error = "connection closed by peer";
        return false;
    }
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            timed_out = true;
            return true;
        }
        error = std::string("recv: ") + std::strerror(errno);
        return false;
    }
    rx_.append(buf, static_cast<std::size_t>(n));
    return true;
}

bool WebSocketClient::sendAll(const std::string& data, std::string& error) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("send: ") + std::strerror(errno);
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

void WebSocketClient::closeSocket() {
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
    rx_.clear();
    partial_.clear();
    in_fragment_ = false;
    close_sent_ = false;
}

#else

bool WebSocketClient::connect(const std::string&, uint16_t, const std::string&, int, std::string& error) {
    error = "websocket client requires POSIX sockets";
    return false;
}

bool WebSocketClient::handshake(const std::string&, uint16_t, const std::string&, int, std::string& error) {
    error = "websocket client requires POSIX sockets";
    return false;
}

bool WebSocketClient::readSome(int, bool& timed_out, bool& peer_closed, std::string& error) {
    timed_out = false;
    peer_closed = true;
    error = "websocket client requires POSIX sockets";
    return false;
}

bool WebSocketClient::sendAll(const std::string&, std::string& error) {
    error = "websocket client requires POSIX sockets";
    return false;
}

void WebSocketClient::closeSocket() {
    fd_ = -1;
    rx_.clear();
    partial_.clear();
    in_fragment_ = false;
    close_sent_ = false;
}

#endif

bool WebSocketClient::sendFrame(WsOpcode opcode, const std::string& payload, std::string& error) {
    if (fd_ < 0) {
        error = "not connected";
        return false;
    }
    // Client-to-server frames are always masked.
    return sendAll(encodeFrame(opcode, payload, true, true, static_cast<uint32_t>(rng_())), error);
}

bool WebSocketClient::sendText(const std::string& payload, std::string& error) {
    return sendFrame(WsOpcode::Text, payload, error);
}

ReceiveStatus WebSocketClient::receive(std::string& out, int timeout_ms, std::string& error) {
    if (fd_ < 0) {
        error = "not connected";
        return ReceiveStatus::Closed;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        WsFrame frame;
        std::size_t consumed = 0;
        const WsDecodeStatus st = decodeFrame(rx_, frame, consumed, error);
        if (st == WsDecodeStatus::Error) {
            closeSocket();
            return ReceiveStatus::Error;
        }

        if (st == WsDecodeStatus::Ok) {
            rx_.erase(0, consumed);
            if (frame.masked) {
                error = "server frames must not be masked";
                closeSocket();
                return ReceiveStatus::Error;
            }

            switch (frame.opcode) {
                case WsOpcode::Ping:
                    if (!sendFrame(WsOpcode::Pong, frame.payload, error)) {
                        closeSocket();
                        return ReceiveStatus::Error;
                    }
                    continue;
                case WsOpcode::Pong:
                    continue;
                case WsOpcode::Close: {
                    if (!close_sent_) {
                        std::string echo_error;
                        if (!sendFrame(WsOpcode::Close, frame.payload.substr(0, 2), echo_error)) {
                            std::cerr << "websocket: close echo not sent: " << echo_error << "\n";
                        }
                    }
                    error = "closed by peer";
                    closeSocket();
                    return ReceiveStatus::Closed;
                }
                case WsOpcode::Text:
                case WsOpcode::Binary:
                    if (in_fragment_) {
                        error = "new data frame inside a fragmented message";
                        closeSocket();
                        return ReceiveStatus::Error;
                    }
                    if (frame.fin) {
                        out = std::move(frame.payload);
                        return ReceiveStatus::Message;
                    }
                    partial_ = std::move(frame.payload);
                    in_fragment_ = true;
                    continue;
                case WsOpcode::Continuation:
                    if (!in_fragment_) {
                        error = "continuation frame without a started message";
                        closeSocket();
                        return ReceiveStatus::Error;
                    }
                    partial_ += frame.payload;
                    if (partial_.size() > kMaxFramePayload) {
                        error = "fragmented message too large";
                        closeSocket();
                        return ReceiveStatus::Error;
                    }
                    if (frame.fin) {
                        out = std::move(partial_);
                        partial_.clear();
                        in_fragment_ = false;
                        return ReceiveStatus::Message;
                    }
                    continue;
            }
        }

        const int left = remainingMs(deadline);
        if (left <= 0) {
            return ReceiveStatus::Timeout;
        }
        bool timed_out = false;
        bool peer_closed = false;
        if (!readSome(left, timed_out, peer_closed, error)) {
            closeSocket();
            return peer_closed ? ReceiveStatus::Closed : ReceiveStatus::Error;
        }
    }
}

void WebSocketClient::close() {
    if (fd_ >= 0 && !close_sent_) {
        std::string error;
        // 1000: normal closure
        if (!sendFrame(WsOpcode::Close, std::string("\x03\xE8", 2), error)) {
            std::cerr << "websocket: close frame not sent: " << error << "\n";
        }
        close_sent_ = true;
    }
    closeSocket();
}

}  // namespace jugsync::net
