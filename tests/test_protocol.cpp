/**
 * @file test_protocol.cpp
 * @brief Unit tests for the JSON message layer
 */

#include <gtest/gtest.h>
#include "net/Protocol.hpp"

using namespace net;
using nlohmann::json;

TEST(ParseMessageTest, RawFrameWithMetadata) {
    auto parsed = parseMessage(R"({"type":"raw_frame","timestamp":"2024-01-01T00:00:00Z",
        "frame_data":"data:image/jpeg;base64,AAAA",
        "metadata":{"frame_number":17,"timestamp":"2024-01-01T00:00:00.100Z"}})");
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& msg = parsed.value();
    EXPECT_EQ(msg.type, MessageType::RawFrame);
    EXPECT_EQ(msg.frameData, "data:image/jpeg;base64,AAAA");
    EXPECT_EQ(msg.frameNumber, 17);
    EXPECT_EQ(msg.captureTimestamp, "2024-01-01T00:00:00.100Z");
}

TEST(ParseMessageTest, RawFrameWithoutMetadataDefaultsFrameNumber) {
    auto parsed = parseMessage(R"({"type":"raw_frame","frame_data":"abc"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().frameNumber, 0);
}

TEST(ParseMessageTest, RawFrameRequiresFrameData) {
    for (const char* text : {R"({"type":"raw_frame"})", R"({"type":"raw_frame","frame_data":12})"}) {
        auto parsed = parseMessage(text);
        ASSERT_FALSE(parsed) << text;
        EXPECT_EQ(parsed.error().kind, core::ErrorKind::Protocol);
        EXPECT_EQ(parsed.error().message, "raw_frame requires a frame_data string");
    }
}

TEST(ParseMessageTest, ControlWithStory) {
    auto parsed = parseMessage(R"({"type":"control","action":"start_session",
        "data":{"story_sentences":["A.","B."],"session_id":"s-1"}})");
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& msg = parsed.value();
    EXPECT_EQ(msg.type, MessageType::Control);
    EXPECT_EQ(msg.action, "start_session");
    ASSERT_TRUE(msg.payload.storySentences);
    EXPECT_EQ(msg.payload.storySentences->size(), 2u);
    EXPECT_EQ(msg.payload.sessionId, "s-1");
}

TEST(ParseMessageTest, ControlWithoutData) {
    auto parsed = parseMessage(R"({"type":"control","action":"next_sentence"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().action, "next_sentence");
    EXPECT_FALSE(parsed.value().payload.storySentences);
}

TEST(ParseMessageTest, ControlRejectsBadSentences) {
    auto parsed = parseMessage(R"({"type":"control","action":"start_session","data":{"story_sentences":[1,2]}})");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().message, "story_sentences must be an array of strings");

    auto missing = parseMessage(R"({"type":"control"})");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().message, "control requires an action string");
}

TEST(ParseMessageTest, PracticeSessionStartAcceptsBothLayouts) {
    auto top = parseMessage(R"({"type":"practice_session_start","story_sentences":["A."],"session_id":"x"})");
    ASSERT_TRUE(top);
    EXPECT_EQ(top.value().type, MessageType::PracticeSessionStart);
    ASSERT_TRUE(top.value().payload.storySentences);
    EXPECT_EQ(top.value().payload.sessionId, "x");

    auto nested = parseMessage(R"({"type":"practice_session_start","data":{"story_sentences":["A.","B."]}})");
    ASSERT_TRUE(nested);
    ASSERT_TRUE(nested.value().payload.storySentences);
    EXPECT_EQ(nested.value().payload.storySentences->size(), 2u);
}

TEST(ParseMessageTest, PingCarriesTimestamp) {
    auto parsed = parseMessage(R"({"type":"ping","timestamp":"t-1"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().type, MessageType::Ping);
    EXPECT_EQ(parsed.value().pingTimestamp, "t-1");
}

TEST(ParseMessageTest, EnvelopeErrors) {
    struct Case { const char* text; const char* message; };
    const Case cases[] = {
        {"{not json", "Invalid JSON format"},
        {"[1,2,3]", "Message must be a JSON object"},
        {R"({"frame_data":"x"})", "Missing message type"},
        {R"({"type":7})", "Missing message type"},
        {R"({"type":"teleport"})", "Unknown message type: teleport"},
    };
    for (const auto& c : cases) {
        auto parsed = parseMessage(c.text);
        ASSERT_FALSE(parsed) << c.text;
        EXPECT_EQ(parsed.error().kind, core::ErrorKind::Protocol);
        EXPECT_EQ(parsed.error().message, c.message);
    }
}

TEST(IsoTimestampTest, FormatsUtcWithMilliseconds) {
    const auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1704110400123LL));
    EXPECT_EQ(isoTimestamp(tp), "2024-01-01T12:00:00.123Z");
}

TEST(ProcessedFrameMessageTest, SuccessCarriesFrameAndMetadata) {
    core::ProcessingResult r;
    r.success = true;
    r.clientFrameNumber = 41;
    r.serverFrameNumber = 9;
    r.frameData = "data:image/jpeg;base64,AAAA";
    r.landmarks.hands = true;
    r.quality.landmarkConfidence = 1.0 / 3.0;
    r.quality.processingEfficiency = 1.0;
    r.timings.detectMs = 4.5;
    r.timings.totalMs = 9.0;
    r.encoding = core::EncodeMetrics{};
    r.encoding->quality = 50;

    const json msg = processedFrameMessage(r);
    EXPECT_EQ(msg["type"], "processed_frame");
    EXPECT_EQ(msg["frame_data"], "data:image/jpeg;base64,AAAA");
    ASSERT_TRUE(msg.contains("timestamp"));

    const json& meta = msg["metadata"];
    EXPECT_EQ(meta["client_frame_number"], 41);
    EXPECT_EQ(meta["server_frame_number"], 9);
    EXPECT_EQ(meta["success"], true);
    EXPECT_EQ(meta["landmarks_detected"]["hands"], true);
    EXPECT_EQ(meta["landmarks_detected"]["face"], false);
    EXPECT_DOUBLE_EQ(meta["processing_time_ms"].get<double>(), 4.5);
    EXPECT_DOUBLE_EQ(meta["total_pipeline_time_ms"].get<double>(), 9.0);
    EXPECT_EQ(meta["encoding_metadata"]["quality"], 50);
    EXPECT_EQ(meta["encoding_metadata"]["format"], "JPEG");
    EXPECT_EQ(meta["gesture_state"], "idle");
    EXPECT_FALSE(meta.contains("error"));
    EXPECT_FALSE(meta.contains("practice_session"));
}

TEST(ProcessedFrameMessageTest, FailureOmitsFrameData) {
    core::ProcessingResult r;
    r.clientFrameNumber = 5;
    r.error = core::PipelineError{core::ErrorKind::Decode, "invalid base64 payload"};

    const json msg = processedFrameMessage(r);
    EXPECT_FALSE(msg.contains("frame_data"));
    EXPECT_EQ(msg["metadata"]["success"], false);
    EXPECT_EQ(msg["metadata"]["error"], "invalid base64 payload");
    EXPECT_EQ(msg["metadata"]["error_kind"], "decode_error");
    EXPECT_EQ(msg["metadata"]["client_frame_number"], 5);
    EXPECT_EQ(msg["metadata"]["landmarks_detected"],
              json({{"hands", false}, {"face", false}, {"pose", false}}));
}

TEST(ProcessedFrameMessageTest, GestureAndPracticeBlocks) {
    core::ProcessingResult r;
    r.success = true;
    r.gestureState = core::GestureState::Ended;
    core::GestureEvent event;
    event.durationMs = 1200.0;
    event.sampleCount = 36;
    event.analysis.totalFrames = 36;
    r.gestureEvent = event;

    core::PracticeSnapshot snap;
    snap.sessionId = "s";
    snap.mode = core::PracticeMode::Feedback;
    snap.totalSentences = 2;
    snap.currentSentence = "Hi.";
    r.practice = snap;

    const json meta = processedFrameMessage(r)["metadata"];
    EXPECT_EQ(meta["gesture_state"], "ended");
    EXPECT_EQ(meta["gesture"]["sample_count"], 36);
    EXPECT_EQ(meta["gesture"]["analysis"]["total_frames"], 36);
    EXPECT_EQ(meta["practice_session"]["practice_mode"], "feedback");
    EXPECT_EQ(meta["practice_session"]["current_sentence"], "Hi.");
}

TEST(ControlResponseTest, SuccessAndFailureShapes) {
    core::ControlResult ok;
    ok.success = true;
    ok.action = "next_sentence";
    ok.sessionId = "s";
    ok.currentSentence = "B.";
    ok.currentSentenceIndex = 1;
    ok.totalSentences = 3;
    ok.isActive = true;

    const json good = controlResponseMessage(ok);
    EXPECT_EQ(good["type"], "control_response");
    EXPECT_EQ(good["action"], "next_sentence");
    EXPECT_EQ(good["result"]["success"], true);
    EXPECT_EQ(good["result"]["current_sentence_index"], 1);
    EXPECT_EQ(good["result"]["practice_mode"], "listening");

    core::ControlResult bad;
    bad.action = "bogus";
    bad.error = "unknown action: bogus";
    bad.errorKind = core::ErrorKind::Protocol;

    const json failed = controlResponseMessage(bad);
    EXPECT_EQ(failed["result"]["success"], false);
    EXPECT_EQ(failed["result"]["error"], "unknown action: bogus");
    EXPECT_EQ(failed["result"]["error_kind"], "protocol_error");
}

TEST(ControlResponseTest, FailureCarriesSessionState) {
    core::ControlResult bad;
    bad.action = "bogus";
    bad.error = "unknown action: bogus";
    bad.errorKind = core::ErrorKind::Protocol;
    bad.sessionId = "s";
    bad.currentSentence = "C.";
    bad.currentSentenceIndex = 2;
    bad.totalSentences = 3;
    bad.practiceMode = core::PracticeMode::Feedback;
    bad.isActive = true;

    const json result = controlResponseMessage(bad)["result"];
    EXPECT_EQ(result["success"], false);
    EXPECT_EQ(result["error_kind"], "protocol_error");
    EXPECT_EQ(result["session_id"], "s");
    EXPECT_EQ(result["current_sentence"], "C.");
    EXPECT_EQ(result["current_sentence_index"], 2);
    EXPECT_EQ(result["practice_mode"], "feedback");
    EXPECT_EQ(result["is_active"], true);

    core::ControlResult noSession;
    noSession.action = "try_again";
    noSession.error = "no active session";
    const json bare = controlResponseMessage(noSession)["result"];
    EXPECT_EQ(bare["is_active"], false);
    EXPECT_FALSE(bare.contains("current_sentence_index"));
}

TEST(PracticeSessionResponseTest, ActionReflectsOutcome) {
    core::ControlResult ok;
    ok.success = true;
    ok.action = "start_session";
    EXPECT_EQ(practiceSessionResponseMessage(ok)["action"], "session_started");

    core::ControlResult bad;
    bad.action = "start_session";
    bad.error = "no sentences provided";
    EXPECT_EQ(practiceSessionResponseMessage(bad)["action"], "session_start_failed");
    EXPECT_EQ(practiceSessionResponseMessage(bad)["result"]["error_kind"], "session_state_error");
}

TEST(SimpleMessagesTest, PongEchoesTimestamp) {
    const json pong = pongMessage("client-ts");
    EXPECT_EQ(pong["type"], "pong");
    EXPECT_EQ(pong["timestamp"], "client-ts");
    EXPECT_TRUE(pong.contains("server_timestamp"));

    EXPECT_FALSE(pongMessage("")["timestamp"].get<std::string>().empty());
}

TEST(SimpleMessagesTest, ErrorAndConnectionMessages) {
    const json err = errorMessage("Invalid JSON format");
    EXPECT_EQ(err["type"], "error");
    EXPECT_EQ(err["message"], "Invalid JSON format");
    EXPECT_EQ(err["error_kind"], "protocol_error");

    ServerInfo info;
    info.detector = "null";
    const json hello = connectionEstablishedMessage("client_1", info);
    EXPECT_EQ(hello["type"], "connection_established");
    EXPECT_EQ(hello["client_id"], "client_1");
    EXPECT_EQ(hello["server_info"]["detector"], "null");
    EXPECT_EQ(hello["server_info"]["name"], core::SERVER_NAME);

    EXPECT_EQ(keepaliveMessage()["type"], "keepalive");
}

TEST(SimpleMessagesTest, DroppedFrameIsTimeoutFailure) {
    const auto r = droppedFrameResult(77);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.clientFrameNumber, 77);
    ASSERT_TRUE(r.error);
    EXPECT_EQ(r.error->kind, core::ErrorKind::Timeout);

    const json msg = processedFrameMessage(r);
    EXPECT_EQ(msg["metadata"]["error_kind"], "timeout");
    EXPECT_EQ(msg["metadata"]["client_frame_number"], 77);
}

TEST(SimpleMessagesTest, StatsMessageShape) {
    ConnectionStats conn;
    conn.framesReceived = 10;
    conn.framesDropped = 2;
    core::ProcessingStats proc;
    proc.framesProcessed = 8;

    const json stats = statsMessage("client_2", conn, proc, core::GestureState::Active, std::nullopt);
    EXPECT_EQ(stats["type"], "stats");
    EXPECT_EQ(stats["processing_stats"]["frames_received"], 10);
    EXPECT_EQ(stats["processing_stats"]["frames_dropped"], 2);
    EXPECT_EQ(stats["processing_stats"]["frames_processed"], 8);
    EXPECT_EQ(stats["gesture_state"], "active");
    EXPECT_TRUE(stats["practice_session"].is_null());
}
