#include "net/ConnectionSession.hpp"
#include "core/Logger.hpp"

namespace net {

ConnectionSession::ConnectionSession(std::string clientId,
                                     std::unique_ptr<MessageTransport> transport,
                                     std::unique_ptr<inference::LandmarkDetector> detector,
                                     const Config& config,
                                     std::shared_ptr<core::SessionSummarySink> sink)
    : clientId_(std::move(clientId)),
      transport_(std::move(transport)),
      config_(config),
      processor_(config.video, config.gesture, std::move(detector)),
      practice_(std::move(sink)) {
    if (!transport_) {
        throw std::invalid_argument("ConnectionSession requires a transport");
    }
}

ConnectionSession::~ConnectionSession() {
    stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ConnectionSession::run() {
    startedAt_ = std::chrono::steady_clock::now();
    running_ = true;
    core::Logger::info("Client ", clientId_, " connected (", transport_->peer(), ")");

    worker_ = std::thread(&ConnectionSession::workerLoop, this);

    try {
        readerLoop();
    } catch (const std::exception& e) {
        core::Logger::error("Client ", clientId_, ": reader failed: ", e.what());
        send(errorMessage("internal server error", core::ErrorKind::Internal));
    } catch (...) {
        core::Logger::error("Client ", clientId_, ": reader failed with an unknown exception");
        send(errorMessage("internal server error", core::ErrorKind::Internal));
    }

    running_ = false;
    transport_->close();
    if (worker_.joinable()) {
        worker_.join();
    }

    const auto stats = connectionStats();
    core::Logger::info("Client ", clientId_, " disconnected after ", static_cast<long long>(stats.uptimeS),
                       " s (", stats.framesReceived, " frames, ", stats.framesDropped, " dropped)");
}

void ConnectionSession::stop() {
    running_ = false;
    transport_->close();
}

void ConnectionSession::readerLoop() {
    ServerInfo info;
    info.detector = processor_.detector().name();
    info.maxFrameRate = config_.video.fps;
    if (!send(connectionEstablishedMessage(clientId_, info))) {
        return;
    }

    auto lastInbound = std::chrono::steady_clock::now();
    auto lastKeepalive = lastInbound;

    while (running_) {
        std::string text;
        const ReceiveStatus status = transport_->receive(text, config_.receivePoll);
        if (status == ReceiveStatus::Closed) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (status == ReceiveStatus::Timeout) {
            if (now - lastInbound >= config_.idleTimeout && now - lastKeepalive >= config_.idleTimeout) {
                if (!send(keepaliveMessage())) break;
                lastKeepalive = now;
            }
            continue;
        }

        lastInbound = now;
        route(text);
    }
}

void ConnectionSession::route(const std::string& text) {
    auto parsed = parseMessage(text);
    if (!parsed) {
        ++protocolErrors_;
        core::Logger::debug("Client ", clientId_, ": ", parsed.error().message);
        send(errorMessage(parsed.error().message, parsed.error().kind));
        return;
    }
    InboundMessage message = std::move(parsed).value();

    switch (message.type) {
        case MessageType::Ping:
            send(pongMessage(message.pingTimestamp));
            return;

        case MessageType::RawFrame: {
            ++framesReceived_;
            core::FrameSample frame;
            frame.encoded = std::move(message.frameData);
            frame.clientFrameNumber = message.frameNumber;
            frame.captureTimestamp = std::move(message.captureTimestamp);
            frame.sequence = ++nextSequence_;
            frame.receivedAt = core::Clock::now();

            // Queue full: drop the newest frame but still answer it
            if (!frames_.try_push(frame)) {
                ++framesDropped_;
                core::Logger::debug("Client ", clientId_, ": dropped frame ", frame.clientFrameNumber);
                send(processedFrameMessage(droppedFrameResult(frame.clientFrameNumber)));
            }
            return;
        }

        case MessageType::Control:
        case MessageType::PracticeSessionStart:
        case MessageType::GetStats:
            ++controlMessages_;
            if (!sessionMessages_.try_push(message)) {
                core::Logger::warn("Client ", clientId_, ": session queue full");
                send(errorMessage("server busy, message dropped", core::ErrorKind::Protocol));
            }
            return;
    }
}

void ConnectionSession::workerLoop() {
    try {
        while (running_) {
            bool busy = false;

            while (auto message = sessionMessages_.try_pop()) {
                handleSessionMessage(*message);
                busy = true;
            }

            if (auto frame = frames_.try_pop()) {
                const auto result = processor_.process(*frame, &practice_);
                send(processedFrameMessage(result));
                busy = true;
            }

            if (!busy) {
                processor_.poll(core::Clock::now(), &practice_);
                std::this_thread::sleep_for(std::chrono::microseconds(500));
            }
        }
    } catch (const std::exception& e) {
        core::Logger::error("Client ", clientId_, ": worker failed: ", e.what());
        send(errorMessage("internal server error", core::ErrorKind::Internal));
        running_ = false;
        transport_->close();
    } catch (...) {
        core::Logger::error("Client ", clientId_, ": worker failed with an unknown exception");
        send(errorMessage("internal server error", core::ErrorKind::Internal));
        running_ = false;
        transport_->close();
    }

    const size_t pending = frames_.clear() + sessionMessages_.clear();
    if (pending > 0) {
        core::Logger::debug("Client ", clientId_, ": discarded ", pending, " queued messages");
    }
    practice_.end("connection_closed");
}

void ConnectionSession::handleSessionMessage(const InboundMessage& message) {
    switch (message.type) {
        case MessageType::Control: {
            const auto result = practice_.control(message.action, message.payload);
            if (result.success && (message.action == core::actions::TRY_AGAIN ||
                                   message.action == core::actions::NEXT_SENTENCE)) {
                processor_.resetGesture();
            }
            if (message.action == core::actions::START_SESSION) {
                send(practiceSessionResponseMessage(result));
            } else {
                send(controlResponseMessage(result));
            }
            return;
        }

        case MessageType::PracticeSessionStart: {
            const auto result = practice_.start(message.payload.storySentences.value_or(std::vector<std::string>{}),
                                                message.payload.sessionId);
            send(practiceSessionResponseMessage(result));
            return;
        }

        case MessageType::GetStats:
            send(statsMessage(clientId_, connectionStats(), processor_.stats(),
                              processor_.gesture().state(), practice_.snapshot()));
            return;

        case MessageType::RawFrame:
        case MessageType::Ping:
            core::Logger::warn("Client ", clientId_, ": unexpected message on session queue");
            return;
    }
}

bool ConnectionSession::send(const nlohmann::json& message) {
    const std::string text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!transport_->send(text)) {
        core::Logger::debug("Client ", clientId_, ": send failed");
        return false;
    }
    return true;
}

ConnectionStats ConnectionSession::connectionStats() const {
    ConnectionStats stats;
    stats.framesReceived = framesReceived_;
    stats.framesDropped = framesDropped_;
    stats.controlMessages = controlMessages_;
    stats.protocolErrors = protocolErrors_;
    stats.uptimeS = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt_).count();
    return stats;
}

} // namespace net
