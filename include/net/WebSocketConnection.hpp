#pragma once

#include "net/MessageTransport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net {

enum class WsOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// RFC 6455 close codes used by the server
enum class CloseCode : uint16_t {
    Normal = 1000,
    GoingAway = 1001,
    ProtocolError = 1002,
    TooBig = 1009,
    InternalError = 1011
};

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers; // lower-case names
};

/**
 * Parse the request line and headers of an HTTP/1.1 request.
 * Returns nullopt if the head is incomplete or malformed.
 */
std::optional<HttpRequest> parseHttpRequest(const std::string& raw);

// Sec-WebSocket-Accept for a client key: base64(SHA-1(key + GUID))
std::string computeAcceptKey(const std::string& clientKey);

// Single unmasked frame with FIN set (server → client)
std::vector<uint8_t> encodeFrame(WsOpcode opcode, std::string_view payload);

/**
 * Server side of one WebSocket connection over a connected TCP socket.
 * Owns the file descriptor. Sends are serialized internally; ping/pong and
 * close frames are handled inside receive().
 */
class WebSocketConnection : public MessageTransport {
public:
    WebSocketConnection(int fd, std::string peer, size_t maxMessageBytes);
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    /**
     * Read the upgrade request and answer 101, or 400 on a bad request.
     * @return false if the client did not complete a valid handshake
     */
    bool handshake(std::chrono::milliseconds timeout);

    ReceiveStatus receive(std::string& message, std::chrono::milliseconds timeout) override;
    bool send(const std::string& text) override;
    void close() override;
    [[nodiscard]] std::string peer() const override { return peer_; }

    // Send close with a status code, then shut the socket down
    void close(CloseCode code, std::string_view reason);

private:
    int fd_;
    std::string peer_;
    size_t maxMessageBytes_;
    std::string pending_; // bytes read past the handshake head

    std::mutex sendMutex_;
    std::atomic<bool> closed_{false};

    bool sendFrame(WsOpcode opcode, std::string_view payload);
    bool sendRaw(const void* data, size_t len);
    bool recvExact(void* buf, size_t len);
    bool waitReadable(std::chrono::milliseconds timeout);
};

} // namespace net
