#include "net/Protocol.hpp"
#include "core/Types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace net {

using nlohmann::json;

namespace {

core::Result<InboundMessage> protocolError(std::string message) {
    return core::Result<InboundMessage>::err(core::ErrorKind::Protocol, std::move(message));
}

// Reads story_sentences / session_id from obj into payload. Empty string on success.
std::string readSessionFields(const json& obj, core::ControlPayload& payload) {
    if (!obj.is_object()) return {};

    auto sentences = obj.find("story_sentences");
    if (sentences != obj.end() && !sentences->is_null()) {
        if (!sentences->is_array()) return "story_sentences must be an array of strings";

        std::vector<std::string> list;
        list.reserve(sentences->size());
        for (const auto& s : *sentences) {
            if (!s.is_string()) return "story_sentences must be an array of strings";
            list.push_back(s.get<std::string>());
        }
        payload.storySentences = std::move(list);
    }

    auto id = obj.find("session_id");
    if (id != obj.end() && !id->is_null()) {
        if (!id->is_string()) return "session_id must be a string";
        payload.sessionId = id->get<std::string>();
    }
    return {};
}

json analysisJson(const core::AttemptAnalysis& a) {
    return {
        {"total_frames", a.totalFrames},
        {"gesture_duration_ms", a.gestureDurationMs},
        {"landmark_detection", {
            {"hands_consistency", a.handsConsistency},
            {"face_consistency", a.faceConsistency},
            {"pose_consistency", a.poseConsistency},
        }},
        {"mean_hand_velocity", a.meanHandVelocity},
        {"gesture_quality", a.gestureQuality},
    };
}

json snapshotJson(const core::PracticeSnapshot& s) {
    json j = {
        {"session_id", s.sessionId},
        {"practice_mode", core::practiceModeName(s.mode)},
        {"current_sentence_index", s.currentSentenceIndex},
        {"total_sentences", s.totalSentences},
        {"current_sentence", s.currentSentence},
        {"attempts_on_current_sentence", s.attemptsOnCurrentSentence},
        {"total_attempts", s.totalAttempts},
    };
    if (s.lastAttempt) {
        j["last_attempt"] = analysisJson(*s.lastAttempt);
    }
    return j;
}

json controlResultJson(const core::ControlResult& r) {
    json j = {
        {"success", r.success},
        {"action", r.action},
    };
    if (!r.success) {
        j["error"] = r.error;
        j["error_kind"] = core::errorKindName(r.errorKind.value_or(core::ErrorKind::SessionState));
    }
    j["is_active"] = r.isActive;
    if (!r.sessionId.empty()) {
        j["session_id"] = r.sessionId;
        j["current_sentence"] = r.currentSentence;
        j["current_sentence_index"] = r.currentSentenceIndex;
        j["total_sentences"] = r.totalSentences;
        j["practice_mode"] = core::practiceModeName(r.practiceMode);
    }
    return j;
}

} // namespace

core::Result<InboundMessage> parseMessage(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error&) {
        return protocolError("Invalid JSON format");
    }

    if (!j.is_object()) {
        return protocolError("Message must be a JSON object");
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        return protocolError("Missing message type");
    }
    const std::string type = typeIt->get<std::string>();

    InboundMessage msg;

    if (type == "raw_frame") {
        auto data = j.find("frame_data");
        if (data == j.end() || !data->is_string()) {
            return protocolError("raw_frame requires a frame_data string");
        }
        msg.type = MessageType::RawFrame;
        msg.frameData = data->get<std::string>();

        auto meta = j.find("metadata");
        if (meta != j.end() && meta->is_object()) {
            auto number = meta->find("frame_number");
            if (number != meta->end() && number->is_number_integer()) {
                msg.frameNumber = number->get<int64_t>();
            }
            auto ts = meta->find("timestamp");
            if (ts != meta->end() && ts->is_string()) {
                msg.captureTimestamp = ts->get<std::string>();
            }
        }
        return msg;
    }

    if (type == "control") {
        auto action = j.find("action");
        if (action == j.end() || !action->is_string()) {
            return protocolError("control requires an action string");
        }
        msg.type = MessageType::Control;
        msg.action = action->get<std::string>();

        auto data = j.find("data");
        if (data != j.end()) {
            const std::string problem = readSessionFields(*data, msg.payload);
            if (!problem.empty()) return protocolError(problem);
        }
        return msg;
    }

    if (type == "practice_session_start") {
        msg.type = MessageType::PracticeSessionStart;
        msg.action = core::actions::START_SESSION;

        // Fields may sit at the top level or inside "data"
        std::string problem = readSessionFields(j, msg.payload);
        if (problem.empty() && !msg.payload.storySentences) {
            auto data = j.find("data");
            if (data != j.end()) problem = readSessionFields(*data, msg.payload);
        }
        if (!problem.empty()) return protocolError(problem);
        return msg;
    }

    if (type == "ping") {
        msg.type = MessageType::Ping;
        auto ts = j.find("timestamp");
        if (ts != j.end() && ts->is_string()) {
            msg.pingTimestamp = ts->get<std::string>();
        }
        return msg;
    }

    if (type == "get_stats") {
        msg.type = MessageType::GetStats;
        return msg;
    }

    return protocolError("Unknown message type: " + type);
}

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

json processedFrameMessage(const core::ProcessingResult& r) {
    json meta = {
        {"server_frame_number", r.serverFrameNumber},
        {"client_frame_number", r.clientFrameNumber},
        {"processing_time_ms", r.timings.detectMs},
        {"total_pipeline_time_ms", r.timings.totalMs},
        {"landmarks_detected", {
            {"hands", r.landmarks.hands},
            {"face", r.landmarks.face},
            {"pose", r.landmarks.pose},
        }},
        {"quality_metrics", {
            {"landmark_confidence", r.quality.landmarkConfidence},
            {"processing_efficiency", r.quality.processingEfficiency},
        }},
        {"success", r.success},
        {"gesture_state", core::gestureStateName(r.gestureState)},
    };

    if (r.encoding) {
        const auto& e = *r.encoding;
        meta["encoding_metadata"] = {
            {"encoding_time_ms", e.encodeTimeMs},
            {"compressed_size_bytes", e.compressedBytes},
            {"original_size_bytes", e.originalBytes},
            {"compression_ratio", e.compressionRatio},
            {"quality", e.quality},
            {"format", e.format},
            {"attempts", e.attempts},
            {"width", e.width},
            {"height", e.height},
            {"ceiling_met", e.ceilingMet},
        };
    }

    if (r.error) {
        meta["error"] = r.error->message;
        meta["error_kind"] = core::errorKindName(r.error->kind);
    }

    if (r.gestureEvent) {
        meta["gesture"] = {
            {"state", core::gestureStateName(r.gestureEvent->state)},
            {"duration_ms", r.gestureEvent->durationMs},
            {"sample_count", r.gestureEvent->sampleCount},
            {"analysis", analysisJson(r.gestureEvent->analysis)},
        };
    }

    if (r.practice) {
        meta["practice_session"] = snapshotJson(*r.practice);
    }

    json msg = {
        {"type", "processed_frame"},
        {"timestamp", isoTimestamp()},
        {"metadata", std::move(meta)},
    };
    if (r.success) {
        msg["frame_data"] = r.frameData;
    }
    return msg;
}

json controlResponseMessage(const core::ControlResult& result) {
    return {
        {"type", "control_response"},
        {"action", result.action},
        {"timestamp", isoTimestamp()},
        {"result", controlResultJson(result)},
    };
}

json practiceSessionResponseMessage(const core::ControlResult& result) {
    return {
        {"type", "practice_session_response"},
        {"action", result.success ? "session_started" : "session_start_failed"},
        {"timestamp", isoTimestamp()},
        {"result", controlResultJson(result)},
    };
}

json pongMessage(const std::string& echoedTimestamp) {
    const std::string now = isoTimestamp();
    return {
        {"type", "pong"},
        {"timestamp", echoedTimestamp.empty() ? now : echoedTimestamp},
        {"server_timestamp", now},
    };
}

json errorMessage(const std::string& message, core::ErrorKind kind) {
    return {
        {"type", "error"},
        {"message", message},
        {"error_kind", core::errorKindName(kind)},
        {"timestamp", isoTimestamp()},
    };
}

json connectionEstablishedMessage(const std::string& clientId, const ServerInfo& info) {
    return {
        {"type", "connection_established"},
        {"client_id", clientId},
        {"timestamp", isoTimestamp()},
        {"server_info", {
            {"name", core::SERVER_NAME},
            {"version", core::SERVER_VERSION},
            {"detector", info.detector},
            {"features", {"frame_processing", "gesture_detection", "practice_sessions"}},
            {"max_frame_rate", info.maxFrameRate},
        }},
    };
}

json keepaliveMessage() {
    return {
        {"type", "keepalive"},
        {"timestamp", isoTimestamp()},
    };
}

json statsMessage(const std::string& clientId,
                  const ConnectionStats& connection,
                  const core::ProcessingStats& processing,
                  core::GestureState gestureState,
                  const std::optional<core::PracticeSnapshot>& practice) {
    return {
        {"type", "stats"},
        {"client_id", clientId},
        {"timestamp", isoTimestamp()},
        {"uptime_s", connection.uptimeS},
        {"processing_stats", {
            {"frames_received", connection.framesReceived},
            {"frames_processed", processing.framesProcessed},
            {"frames_failed", processing.framesFailed},
            {"frames_timed_out", processing.framesTimedOut},
            {"frames_dropped", connection.framesDropped},
            {"gesture_events", processing.gestureEvents},
            {"average_pipeline_ms", processing.averagePipelineMs},
            {"last_pipeline_ms", processing.lastPipelineMs},
        }},
        {"control_messages", connection.controlMessages},
        {"protocol_errors", connection.protocolErrors},
        {"gesture_state", core::gestureStateName(gestureState)},
        {"practice_session", practice ? snapshotJson(*practice) : json(nullptr)},
    };
}

core::ProcessingResult droppedFrameResult(int64_t clientFrameNumber) {
    core::ProcessingResult r;
    r.success = false;
    r.clientFrameNumber = clientFrameNumber;
    r.error = core::PipelineError{core::ErrorKind::Timeout, "frame dropped: pipeline busy"};
    return r;
}

} // namespace net
