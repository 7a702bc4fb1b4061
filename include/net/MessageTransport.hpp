#pragma once

#include <chrono>
#include <string>

namespace net {

enum class ReceiveStatus {
    Message,  // a complete text message was received
    Timeout,  // nothing arrived within the timeout
    Closed    // peer closed, protocol violation or socket error
};

/**
 * Message-oriented duplex channel used by a ConnectionSession.
 * receive() is called from one thread; send() and close() may be called
 * from any thread.
 */
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    virtual ReceiveStatus receive(std::string& message, std::chrono::milliseconds timeout) = 0;
    virtual bool send(const std::string& text) = 0;

    // Idempotent. Unblocks a pending receive().
    virtual void close() = 0;

    [[nodiscard]] virtual std::string peer() const = 0;
};

} // namespace net
