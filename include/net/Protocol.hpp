#pragma once

#include "core/Errors.hpp"
#include "core/FrameProcessor.hpp"
#include "core/PracticeSessionManager.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace net {

enum class MessageType {
    RawFrame,
    Control,
    PracticeSessionStart,
    Ping,
    GetStats
};

/**
 * A validated inbound message. Only the fields of its type are set.
 */
struct InboundMessage {
    MessageType type = MessageType::Ping;

    // raw_frame
    std::string frameData;
    int64_t frameNumber = 0;
    std::string captureTimestamp;

    // control / practice_session_start
    std::string action;
    core::ControlPayload payload;

    // ping
    std::string pingTimestamp;
};

// Per-connection counters reported by get_stats
struct ConnectionStats {
    uint64_t framesReceived = 0;
    uint64_t framesDropped = 0;
    uint64_t controlMessages = 0;
    uint64_t protocolErrors = 0;
    double uptimeS = 0.0;
};

struct ServerInfo {
    std::string detector;
    int maxFrameRate = 30;
};

/**
 * Parse one text message. Failures are ProtocolErrors whose message is
 * sent back to the client as-is.
 */
[[nodiscard]] core::Result<InboundMessage> parseMessage(const std::string& text);

// ISO 8601 UTC with milliseconds, e.g. 2024-01-01T12:00:00.123Z
std::string isoTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

nlohmann::json processedFrameMessage(const core::ProcessingResult& result);
nlohmann::json controlResponseMessage(const core::ControlResult& result);
nlohmann::json practiceSessionResponseMessage(const core::ControlResult& result);
nlohmann::json pongMessage(const std::string& echoedTimestamp);
nlohmann::json errorMessage(const std::string& message, core::ErrorKind kind = core::ErrorKind::Protocol);
nlohmann::json connectionEstablishedMessage(const std::string& clientId, const ServerInfo& info);
nlohmann::json keepaliveMessage();
nlohmann::json statsMessage(const std::string& clientId,
                            const ConnectionStats& connection,
                            const core::ProcessingStats& processing,
                            core::GestureState gestureState,
                            const std::optional<core::PracticeSnapshot>& practice);

// Failed processed_frame for a frame that was never queued
core::ProcessingResult droppedFrameResult(int64_t clientFrameNumber);

} // namespace net
