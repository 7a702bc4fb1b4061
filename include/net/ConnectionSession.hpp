#pragma once

#include "core/Config.hpp"
#include "core/Frame.hpp"
#include "core/FrameProcessor.hpp"
#include "core/PracticeSessionManager.hpp"
#include "core/SessionSummarySink.hpp"
#include "core/SpscQueue.hpp"
#include "core/Types.hpp"
#include "inference/LandmarkDetector.hpp"
#include "net/MessageTransport.hpp"
#include "net/Protocol.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace net {

/**
 * One client connection.
 *
 * Threads:
 * - reader (the thread calling run()): receives messages, answers pings at
 *   once, queues frames and session messages, sends keepalives when idle
 * - worker: drains the queues, runs the FrameProcessor and the
 *   PracticeSessionManager, sends the responses
 *
 * At most FRAME_QUEUE_DEPTH frames wait; a frame arriving at a full queue
 * is answered immediately with a failed processed_frame.
 */
class ConnectionSession {
public:
    struct Config {
        core::VideoConfig video;
        core::GestureConfig gesture;
        std::chrono::milliseconds idleTimeout{60000};
        std::chrono::milliseconds receivePoll{250};
    };

    ConnectionSession(std::string clientId,
                      std::unique_ptr<MessageTransport> transport,
                      std::unique_ptr<inference::LandmarkDetector> detector,
                      const Config& config,
                      std::shared_ptr<core::SessionSummarySink> sink);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    /**
     * Serve the connection until the peer goes away or stop() is called.
     * Blocks the calling thread; the worker thread is joined before return.
     */
    void run();

    // Thread-safe; makes run() return soon
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] const std::string& clientId() const { return clientId_; }

private:
    using FrameQueue = core::SpscQueue<core::FrameSample, core::FRAME_QUEUE_DEPTH>;
    using SessionQueue = core::SpscQueue<InboundMessage, core::CONTROL_QUEUE_DEPTH>;

    std::string clientId_;
    std::unique_ptr<MessageTransport> transport_;
    Config config_;

    // Worker-owned
    core::FrameProcessor processor_;
    core::PracticeSessionManager practice_;

    FrameQueue frames_;
    SessionQueue sessionMessages_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex sendMutex_;

    std::chrono::steady_clock::time_point startedAt_;
    uint64_t nextSequence_ = 0;
    std::atomic<uint64_t> framesReceived_{0};
    std::atomic<uint64_t> framesDropped_{0};
    std::atomic<uint64_t> controlMessages_{0};
    std::atomic<uint64_t> protocolErrors_{0};

    void readerLoop();
    void workerLoop();

    void route(const std::string& text);
    void handleSessionMessage(const InboundMessage& message);

    bool send(const nlohmann::json& message);
    [[nodiscard]] ConnectionStats connectionStats() const;
};

} // namespace net
