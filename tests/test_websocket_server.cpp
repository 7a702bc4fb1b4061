/**
 * @file test_websocket_server.cpp
 * @brief WebSocketServer over loopback TCP
 */

#include <gtest/gtest.h>
#include "inference/NullDetector.hpp"
#include "net/WebSocketServer.hpp"
#include "WsTestClient.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

using namespace net;
using namespace wstest;
using nlohmann::json;

namespace {

int connectTo(int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    timeval tv{};
    tv.tv_sec = 3;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool sendAll(int fd, const std::string& text) {
    return ::send(fd, text.data(), text.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(text.size());
}

bool sendFrame(int fd, const std::string& payload) {
    const auto frame = clientFrame(0x1, payload);
    return ::send(fd, frame.data(), frame.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(frame.size());
}

// Next text message as JSON, an empty object if none arrives
json nextMessage(int fd) {
    ServerFrame frame;
    if (!readFrame(fd, frame) || frame.opcode != 0x1) return json::object();
    return json::parse(frame.payload);
}

} // namespace

class WebSocketServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.host = "127.0.0.1";
        config_.port = 0;
        config_.maxConnections = 2;
        config_.session.receivePoll = std::chrono::milliseconds(10);
    }

    void TearDown() override {
        for (int fd : clients_) ::close(fd);
        if (server_) server_->stop();
    }

    void startServer() {
        server_ = std::make_unique<WebSocketServer>(
            config_, [] { return std::make_unique<inference::NullDetector>(); }, nullptr);
        server_->start();
        ASSERT_TRUE(server_->isRunning());
        ASSERT_GT(server_->port(), 0);
    }

    int openClient() {
        int fd = connectTo(server_->port());
        if (fd >= 0) clients_.push_back(fd);
        return fd;
    }

    // Connect, upgrade and consume connection_established
    int openSession() {
        int fd = openClient();
        if (fd < 0 || !sendAll(fd, kUpgradeRequest)) return -1;
        if (readHttpHead(fd).rfind("HTTP/1.1 101", 0) != 0) return -1;
        if (nextMessage(fd).value("type", "") != "connection_established") return -1;
        return fd;
    }

    WebSocketServer::Config config_;
    std::unique_ptr<WebSocketServer> server_;
    std::vector<int> clients_;
};

TEST_F(WebSocketServerTest, UpgradesAndAnswersPing) {
    startServer();
    int fd = openSession();
    ASSERT_GE(fd, 0);

    ASSERT_TRUE(sendFrame(fd, R"({"type":"ping","timestamp":"abc"})"));
    const json pong = nextMessage(fd);
    EXPECT_EQ(pong["type"], "pong");
    EXPECT_EQ(pong["timestamp"], "abc");
}

TEST_F(WebSocketServerTest, RejectsPlainHttp) {
    startServer();
    int fd = openClient();
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(sendAll(fd, "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"));
    EXPECT_EQ(readHttpHead(fd).rfind("HTTP/1.1 400", 0), 0u);
}

TEST_F(WebSocketServerTest, RejectsConnectionsOverLimit) {
    startServer();
    ASSERT_GE(openSession(), 0);
    ASSERT_GE(openSession(), 0);

    int third = openClient();
    ASSERT_GE(third, 0);
    EXPECT_EQ(readHttpHead(third).rfind("HTTP/1.1 503", 0), 0u);
}

TEST_F(WebSocketServerTest, SlotIsFreedAfterDisconnect) {
    config_.maxConnections = 1;
    startServer();

    int first = openSession();
    ASSERT_GE(first, 0);
    ::close(first);
    clients_.clear();

    // The accept loop reaps finished clients on its next pass
    int second = -1;
    for (int attempt = 0; attempt < 20 && second < 0; ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        second = openSession();
    }
    EXPECT_GE(second, 0);
}

TEST_F(WebSocketServerTest, StopClosesSessions) {
    startServer();
    int fd = openSession();
    ASSERT_GE(fd, 0);

    server_->stop();
    EXPECT_FALSE(server_->isRunning());

    ServerFrame frame;
    ASSERT_TRUE(readFrame(fd, frame));
    EXPECT_EQ(frame.opcode, 0x8);
}

TEST(WebSocketServerConfigTest, InvalidHostThrows) {
    WebSocketServer::Config config;
    config.host = "not-an-address";
    config.port = 0;
    WebSocketServer server(config, [] { return std::make_unique<inference::NullDetector>(); }, nullptr);
    EXPECT_THROW(server.start(), std::runtime_error);
}
