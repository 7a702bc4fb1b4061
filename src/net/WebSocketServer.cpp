#include "net/WebSocketServer.hpp"
#include "core/Logger.hpp"
#include "net/Protocol.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace net {

namespace {

constexpr int ACCEPT_POLL_MS = 200;
constexpr int LISTEN_BACKLOG = 16;

} // namespace

WebSocketServer::WebSocketServer(const Config& config,
                                 inference::DetectorFactory detectorFactory,
                                 std::shared_ptr<core::SessionSummarySink> sink)
    : _config(config),
      _detectorFactory(std::move(detectorFactory)),
      _sink(std::move(sink)),
      _running(false) {
    if (!_detectorFactory) {
        throw std::invalid_argument("WebSocketServer requires a detector factory");
    }
}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    if (_running) return;

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(_config.port));
    if (inet_pton(AF_INET, _config.host.c_str(), &address.sin_addr) != 1) {
        throw std::runtime_error("WebSocketServer: invalid listen address " + _config.host);
    }

    _serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (_serverSocket < 0) {
        throw std::runtime_error(std::string("WebSocketServer: failed to create socket: ") + std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(_serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        core::Logger::warn("WebSocketServer: SO_REUSEADDR failed: ", std::strerror(errno));
    }

    if (bind(_serverSocket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        const std::string reason = std::strerror(errno);
        close(_serverSocket);
        _serverSocket = -1;
        throw std::runtime_error("WebSocketServer: failed to bind " + _config.host + ":" +
                                 std::to_string(_config.port) + ": " + reason);
    }

    if (listen(_serverSocket, LISTEN_BACKLOG) < 0) {
        const std::string reason = std::strerror(errno);
        close(_serverSocket);
        _serverSocket = -1;
        throw std::runtime_error("WebSocketServer: failed to listen: " + reason);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(_serverSocket, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        _boundPort = ntohs(bound.sin_port);
    } else {
        _boundPort = _config.port;
    }

    _acceptFailed = false;
    _running = true;
    _serverThread = std::thread(&WebSocketServer::serverLoop, this);
    core::Logger::info("WebSocketServer listening on ws://", _config.host, ":", _boundPort);
}

void WebSocketServer::stop() {
    if (!_running.exchange(false)) return;

    if (_serverThread.joinable()) {
        _serverThread.join();
    }
    if (_serverSocket >= 0) {
        close(_serverSocket);
        _serverSocket = -1;
    }

    // Client threads take the lock on their way out, so join without holding it
    std::vector<std::shared_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        clients.swap(_clients);
        for (auto& client : clients) {
            if (client->session) {
                client->session->stop();
            } else if (client->connection) {
                client->connection->close(CloseCode::GoingAway, "server shutting down");
            }
        }
    }

    for (auto& client : clients) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }

    core::Logger::info("WebSocketServer stopped.");
}

size_t WebSocketServer::activeConnections() {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    size_t count = 0;
    for (const auto& client : _clients) {
        if (client->active) ++count;
    }
    return count;
}

void WebSocketServer::serverLoop() {
    while (_running) {
        pollfd pfd{};
        pfd.fd = _serverSocket;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            core::Logger::error("WebSocketServer: poll failed: ", std::strerror(errno));
            _acceptFailed = true;
            break;
        }

        cleanClients();
        if (rc == 0) continue;

        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept(_serverSocket, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);

        if (clientSocket < 0) {
            if (_running) {
                core::Logger::warn("WebSocketServer: Accept failed: ", std::strerror(errno));
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ip, sizeof(ip));
        std::string peer = std::string(ip) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        if (activeConnections() >= static_cast<size_t>(_config.maxConnections)) {
            core::Logger::warn("WebSocketServer: rejecting ", peer, ", ", _config.maxConnections,
                               " connections already open");
            rejectClient(clientSocket);
            continue;
        }

        auto client = std::make_shared<Client>();
        client->id = "client_" + std::to_string(++_nextClientId);
        core::Logger::debug("WebSocketServer: New client ", client->id, " from ", peer);

        std::lock_guard<std::mutex> lock(_clientsMutex);
        _clients.push_back(client);
        client->thread = std::thread(&WebSocketServer::handleClient, this, client, clientSocket, std::move(peer));
    }
}

void WebSocketServer::rejectClient(int clientSocket) {
    static const std::string response =
        "HTTP/1.1 503 Service Unavailable\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n\r\n";
    if (send(clientSocket, response.data(), response.size(), MSG_NOSIGNAL) < 0) {
        core::Logger::debug("WebSocketServer: 503 not delivered: ", std::strerror(errno));
    }
    close(clientSocket);
}

void WebSocketServer::handleClient(std::shared_ptr<Client> client, int clientSocket, std::string peer) {
    auto connection = std::make_unique<WebSocketConnection>(clientSocket, peer, _config.maxMessageBytes);
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        client->connection = connection.get();
    }

    bool upgraded = false;
    try {
        upgraded = _running && connection->handshake(_config.handshakeTimeout);
    } catch (const std::exception& e) {
        core::Logger::warn("WebSocketServer: handshake with ", peer, " failed: ", e.what());
    }

    std::unique_ptr<inference::LandmarkDetector> detector;
    if (upgraded) {
        try {
            detector = _detectorFactory();
        } catch (const std::exception& e) {
            core::Logger::error("WebSocketServer: detector for ", client->id, " unavailable: ", e.what());
            if (!connection->send(errorMessage("landmark detector unavailable", core::ErrorKind::Detector).dump())) {
                core::Logger::debug("WebSocketServer: error to ", peer, " not delivered");
            }
            connection->close(CloseCode::InternalError, "detector unavailable");
        }
    }

    std::shared_ptr<ConnectionSession> session;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        client->connection = nullptr;
        if (upgraded && detector) {
            client->session = std::make_shared<ConnectionSession>(
                client->id, std::move(connection), std::move(detector), _config.session, _sink);
            session = client->session;
        }
    }

    if (session) {
        if (!_running) session->stop();
        session->run();

        std::lock_guard<std::mutex> lock(_clientsMutex);
        client->session.reset();
    } else if (!upgraded) {
        core::Logger::info("WebSocketServer: ", peer, " did not complete the WebSocket handshake");
    }

    session.reset();
    connection.reset();
    client->active = false;
}

void WebSocketServer::cleanClients() {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    auto it = _clients.begin();
    while (it != _clients.end()) {
        if (!(*it)->active) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = _clients.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace net
