#include "net/WebSocketConnection.hpp"
#include "core/Base64.hpp"
#include "core/Logger.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace net {

namespace {

constexpr const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t MAX_HANDSHAKE_BYTES = 16 * 1024;
constexpr size_t MAX_CONTROL_PAYLOAD = 125;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

// Comma-separated header value contains token (case-insensitive)
bool headerHasToken(const std::string& value, const std::string& token) {
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (toLower(trim(item)) == token) return true;
    }
    return false;
}

} // namespace

std::optional<HttpRequest> parseHttpRequest(const std::string& raw) {
    const size_t headEnd = raw.find("\r\n\r\n");
    if (headEnd == std::string::npos) return std::nullopt;

    std::istringstream in(raw.substr(0, headEnd + 2));
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequest req;
    std::string version;
    std::istringstream requestLine(line);
    if (!(requestLine >> req.method >> req.path >> version)) return std::nullopt;
    if (version.rfind("HTTP/", 0) != 0) return std::nullopt;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return std::nullopt;
        req.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return req;
}

std::string computeAcceptKey(const std::string& clientKey) {
    const std::string input = clientKey + WS_GUID;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("SHA-1 digest failed");
    }
    return core::base64Encode(digest, digestLen);
}

std::vector<uint8_t> encodeFrame(WsOpcode opcode, std::string_view payload) {
    std::vector<uint8_t> frame;
    const size_t len = payload.size();
    frame.reserve(len + 10);

    // First byte: FIN + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    // Length encoding
    if (len <= 125) {
        frame.push_back(static_cast<uint8_t>(len));
    } else if (len <= 65535) {
        frame.push_back(126);
        frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
        }
    }

    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

WebSocketConnection::WebSocketConnection(int fd, std::string peer, size_t maxMessageBytes)
    : fd_(fd), peer_(std::move(peer)), maxMessageBytes_(maxMessageBytes) {
}

WebSocketConnection::~WebSocketConnection() {
    if (!closed_.exchange(true)) {
        ::shutdown(fd_, SHUT_RDWR);
    }
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool WebSocketConnection::waitReadable(std::chrono::milliseconds timeout) {
    if (!pending_.empty()) return true;

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
    }
    return rc > 0;
}

bool WebSocketConnection::recvExact(void* buf, size_t len) {
    auto* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;

    if (!pending_.empty()) {
        const size_t n = std::min(remaining, pending_.size());
        std::memcpy(ptr, pending_.data(), n);
        pending_.erase(0, n);
        ptr += n;
        remaining -= n;
    }

    while (remaining > 0) {
        ssize_t n = ::recv(fd_, ptr, remaining, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketConnection::sendRaw(const void* data, size_t len) {
    const auto* ptr = static_cast<const uint8_t*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketConnection::sendFrame(WsOpcode opcode, std::string_view payload) {
    const auto frame = encodeFrame(opcode, payload);
    std::lock_guard<std::mutex> lock(sendMutex_);
    return sendRaw(frame.data(), frame.size());
}

bool WebSocketConnection::handshake(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string data;
    char buf[1024];

    while (data.find("\r\n\r\n") == std::string::npos) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0 || data.size() > MAX_HANDSHAKE_BYTES) return false;
        if (!waitReadable(left)) return false;

        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data.append(buf, static_cast<size_t>(n));
    }

    // Anything after the request head already belongs to the frame stream
    const size_t headEnd = data.find("\r\n\r\n") + 4;
    pending_ = data.substr(headEnd);

    auto req = parseHttpRequest(data);
    auto header = [&req](const char* name) -> std::string {
        auto it = req->headers.find(name);
        return it == req->headers.end() ? std::string() : it->second;
    };

    const bool valid = req && req->method == "GET" &&
                       headerHasToken(header("upgrade"), "websocket") &&
                       headerHasToken(header("connection"), "upgrade") &&
                       !header("sec-websocket-key").empty() &&
                       header("sec-websocket-version") == "13";

    if (!valid) {
        const std::string response =
            "HTTP/1.1 400 Bad Request\r\n"
            "Content-Length: 0\r\n"
            "Connection: close\r\n\r\n";
        std::lock_guard<std::mutex> lock(sendMutex_);
        if (!sendRaw(response.data(), response.size())) {
            core::Logger::debug("WebSocket: 400 response to ", peer_, " not delivered");
        }
        core::Logger::warn("WebSocket: rejected handshake from ", peer_);
        return false;
    }

    const std::string response =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: " + computeAcceptKey(header("sec-websocket-key")) + "\r\n\r\n";

    std::lock_guard<std::mutex> lock(sendMutex_);
    return sendRaw(response.data(), response.size());
}

ReceiveStatus WebSocketConnection::receive(std::string& message, std::chrono::milliseconds timeout) {
    if (closed_) return ReceiveStatus::Closed;
    if (!waitReadable(timeout)) return ReceiveStatus::Timeout;

    std::string assembled;
    bool inFragment = false;

    while (true) {
        uint8_t header[2];
        if (!recvExact(header, 2)) {
            closed_ = true;
            return ReceiveStatus::Closed;
        }

        const bool fin = (header[0] & 0x80) != 0;
        const bool rsv = (header[0] & 0x70) != 0;
        const auto opcode = static_cast<WsOpcode>(header[0] & 0x0F);
        const bool masked = (header[1] & 0x80) != 0;
        uint64_t payloadLen = header[1] & 0x7F;

        // Extended payload length
        if (payloadLen == 126) {
            uint8_t ext[2];
            if (!recvExact(ext, 2)) { closed_ = true; return ReceiveStatus::Closed; }
            payloadLen = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
        } else if (payloadLen == 127) {
            uint8_t ext[8];
            if (!recvExact(ext, 8)) { closed_ = true; return ReceiveStatus::Closed; }
            payloadLen = 0;
            for (int i = 0; i < 8; ++i) {
                payloadLen = (payloadLen << 8) | ext[i];
            }
        }

        const bool control = (static_cast<uint8_t>(opcode) & 0x08) != 0;
        if (rsv || !masked || (control && (!fin || payloadLen > MAX_CONTROL_PAYLOAD))) {
            close(CloseCode::ProtocolError, "protocol error");
            return ReceiveStatus::Closed;
        }
        if (payloadLen > maxMessageBytes_ || assembled.size() + payloadLen > maxMessageBytes_) {
            core::Logger::warn("WebSocket: message from ", peer_, " exceeds ", maxMessageBytes_, " bytes");
            close(CloseCode::TooBig, "message too big");
            return ReceiveStatus::Closed;
        }

        uint8_t mask[4];
        if (!recvExact(mask, 4)) { closed_ = true; return ReceiveStatus::Closed; }

        std::string payload(static_cast<size_t>(payloadLen), '\0');
        if (payloadLen > 0 && !recvExact(payload.data(), payload.size())) {
            closed_ = true;
            return ReceiveStatus::Closed;
        }
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
        }

        switch (opcode) {
            case WsOpcode::PING:
                if (!sendFrame(WsOpcode::PONG, payload)) {
                    closed_ = true;
                    return ReceiveStatus::Closed;
                }
                if (!inFragment) return ReceiveStatus::Timeout;
                continue;

            case WsOpcode::PONG:
                if (!inFragment) return ReceiveStatus::Timeout;
                continue;

            case WsOpcode::CLOSE:
                close(CloseCode::Normal, "");
                return ReceiveStatus::Closed;

            case WsOpcode::TEXT:
            case WsOpcode::BINARY:
                if (inFragment) {
                    close(CloseCode::ProtocolError, "expected continuation");
                    return ReceiveStatus::Closed;
                }
                if (fin) {
                    message = std::move(payload);
                    return ReceiveStatus::Message;
                }
                assembled = std::move(payload);
                inFragment = true;
                continue;

            case WsOpcode::CONTINUATION:
                if (!inFragment) {
                    close(CloseCode::ProtocolError, "unexpected continuation");
                    return ReceiveStatus::Closed;
                }
                assembled += payload;
                if (fin) {
                    message = std::move(assembled);
                    return ReceiveStatus::Message;
                }
                continue;

            default:
                close(CloseCode::ProtocolError, "unknown opcode");
                return ReceiveStatus::Closed;
        }
    }
}

bool WebSocketConnection::send(const std::string& text) {
    if (closed_) return false;
    if (!sendFrame(WsOpcode::TEXT, text)) {
        core::Logger::debug("WebSocket: send to ", peer_, " failed");
        return false;
    }
    return true;
}

void WebSocketConnection::close() {
    close(CloseCode::GoingAway, "server closing");
}

void WebSocketConnection::close(CloseCode code, std::string_view reason) {
    if (closed_.exchange(true)) return;

    std::string payload;
    const auto value = static_cast<uint16_t>(code);
    payload.push_back(static_cast<char>((value >> 8) & 0xFF));
    payload.push_back(static_cast<char>(value & 0xFF));
    payload.append(reason.substr(0, MAX_CONTROL_PAYLOAD - 2));

    if (!sendFrame(WsOpcode::CLOSE, payload)) {
        core::Logger::debug("WebSocket: close frame to ", peer_, " not delivered");
    }
    ::shutdown(fd_, SHUT_RDWR);
}

} // namespace net
