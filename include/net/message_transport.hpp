#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace jugsync::net {

enum class ReceiveStatus {
    Message,
    Timeout,
    Closed,
    Error,
};

const char* receiveStatusName(ReceiveStatus status);

// Message-oriented connection to one device. Used from a single thread.
class IMessageTransport {
public:
    virtual ~IMessageTransport() = default;

    virtual bool connect(const std::string& host, uint16_t port, const std::string& path, int timeout_ms,
                         std::string& error) = 0;
    // Waits at most timeout_ms for one complete message.
    virtual ReceiveStatus receive(std::string& out, int timeout_ms, std::string& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

using TransportPtr = std::unique_ptr<IMessageTransport>;

}  // namespace jugsync::net
