#pragma once

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Frame.hpp"
#include "core/FrameCodec.hpp"
#include "core/GestureDetector.hpp"
#include "core/PracticeSessionManager.hpp"
#include "core/Types.hpp"
#include "inference/LandmarkDetector.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

namespace core {

struct StageTimings {
    double decodeMs = 0.0;
    double detectMs = 0.0;
    double encodeMs = 0.0;
    double totalMs = 0.0;
};

/**
 * Outcome of one pipeline pass. Produced for every frame, also on failure:
 * then frameData is empty, landmarks are all false and quality is zero.
 */
struct ProcessingResult {
    bool success = false;
    std::optional<PipelineError> error;

    int64_t clientFrameNumber = 0;
    uint64_t serverFrameNumber = 0;

    std::string frameData;
    LandmarkPresence landmarks;
    QualityMetrics quality;
    StageTimings timings;
    std::optional<EncodeMetrics> encoding;

    GestureState gestureState = GestureState::Idle;
    std::optional<GestureEvent> gestureEvent;
    std::optional<PracticeSnapshot> practice;
};

struct ProcessingStats {
    uint64_t framesProcessed = 0;
    uint64_t framesFailed = 0;
    uint64_t framesTimedOut = 0;
    uint64_t gestureEvents = 0;
    double lastPipelineMs = 0.0;
    double averagePipelineMs = 0.0;
};

/**
 * Per-connection frame pipeline:
 * decode → detect → gesture update → practice update → overlay → encode
 *
 * Stage failures and deadline overruns become failed results; process()
 * never throws. Single-threaded: a connection runs one frame at a time.
 */
class FrameProcessor {
public:
    FrameProcessor(const VideoConfig& video,
                   const GestureConfig& gesture,
                   std::unique_ptr<inference::LandmarkDetector> detector);

    /**
     * @param practice session to drive, or nullptr to skip practice integration
     */
    ProcessingResult process(const FrameSample& frame, PracticeSessionManager* practice);

    /**
     * Time-based gesture end while no frames arrive. A resulting event is
     * applied to the session now and reported with the next processed frame.
     */
    void poll(TimePoint now, PracticeSessionManager* practice);

    // Forget the current attempt, e.g. when the practice sentence changes
    void resetGesture();

    [[nodiscard]] const ProcessingStats& stats() const { return stats_; }
    [[nodiscard]] const GestureDetector& gesture() const { return gesture_; }
    [[nodiscard]] const inference::LandmarkDetector& detector() const { return *detector_; }

    // 1.0 at or under the budget, linear falloff to twice the budget, 0.1 beyond
    [[nodiscard]] static double processingEfficiency(double detectorMs, double budgetMs);
    [[nodiscard]] static double landmarkConfidence(const LandmarkPresence& presence);

private:
    VideoConfig video_;
    EncodeConfig encode_;
    std::unique_ptr<inference::LandmarkDetector> detector_;
    GestureDetector gesture_;

    uint64_t serverFrameNumber_ = 0;
    std::optional<GestureEvent> pendingEvent_;
    ProcessingStats stats_;

    ProcessingResult runStages(const FrameSample& frame, PracticeSessionManager* practice,
                               ProcessingResult result, TimePoint start);
    ProcessingResult fail(ProcessingResult result, ErrorKind kind, std::string message, TimePoint start);
    [[nodiscard]] bool pastDeadline(TimePoint start) const;
    void applyGesture(const GestureEvent& event, PracticeSessionManager* practice);
    void record(const ProcessingResult& result);

    void drawOverlay(cv::Mat& frame,
                     const LandmarkSet& landmarks,
                     const LandmarkPresence& presence,
                     const std::optional<PracticeSnapshot>& practice) const;
};

} // namespace core
