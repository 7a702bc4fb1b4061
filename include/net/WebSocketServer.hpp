#pragma once

#include "core/Config.hpp"
#include "core/SessionSummarySink.hpp"
#include "inference/DetectorFactory.hpp"
#include "net/ConnectionSession.hpp"
#include "net/WebSocketConnection.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace net {

/**
 * WebSocket endpoint: accepts TCP clients, performs the upgrade and runs a
 * ConnectionSession per client on its own thread.
 */
class WebSocketServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8000;             // 0 picks a free port
        int maxConnections = 10;
        size_t maxMessageBytes = 8 * 1024 * 1024;
        std::chrono::milliseconds handshakeTimeout{5000};
        ConnectionSession::Config session;
    };

    WebSocketServer(const Config& config,
                    inference::DetectorFactory detectorFactory,
                    std::shared_ptr<core::SessionSummarySink> sink);
    ~WebSocketServer();

    /**
     * Bind and start accepting.
     * @throws std::runtime_error if the socket cannot be bound or listened on
     */
    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return _running && !_acceptFailed; }
    [[nodiscard]] int port() const { return _boundPort; }
    [[nodiscard]] size_t activeConnections();

private:
    struct Client {
        std::string id;
        std::thread thread;
        std::atomic<bool> active{true};
        WebSocketConnection* connection = nullptr; // set during the handshake only
        std::shared_ptr<ConnectionSession> session;
    };

    void serverLoop();
    void handleClient(std::shared_ptr<Client> client, int clientSocket, std::string peer);
    void cleanClients();
    void rejectClient(int clientSocket);

    Config _config;
    inference::DetectorFactory _detectorFactory;
    std::shared_ptr<core::SessionSummarySink> _sink;

    int _serverSocket = -1;
    int _boundPort = 0;
    std::atomic<bool> _running;
    std::atomic<bool> _acceptFailed{false};
    std::thread _serverThread;
    uint64_t _nextClientId = 0;

    std::vector<std::shared_ptr<Client>> _clients;
    std::mutex _clientsMutex;
};

} // namespace net
