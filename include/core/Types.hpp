#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace core {

// ============================================================
// Constants
// ============================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// 60 FPS per-frame budget used for the efficiency metric
constexpr double FRAME_BUDGET_MS = 16.67;

// hands, face, pose
constexpr int LANDMARK_GROUPS = 3;

// Blank frame size when nothing decodable is available
constexpr int FALLBACK_FRAME_WIDTH = 640;
constexpr int FALLBACK_FRAME_HEIGHT = 480;

// Per-connection queue sizing (usable slots)
constexpr size_t FRAME_QUEUE_DEPTH = 2;
constexpr size_t CONTROL_QUEUE_DEPTH = 32;

constexpr const char* SERVER_NAME = "SignStream";
constexpr const char* SERVER_VERSION = "1.0.0";

// ============================================================
// Data Structures
// ============================================================

struct LandmarkPresence {
    bool hands = false;
    bool face = false;
    bool pose = false;

    [[nodiscard]] int count() const {
        return static_cast<int>(hands) + static_cast<int>(face) + static_cast<int>(pose);
    }

    bool operator==(const LandmarkPresence&) const = default;
};

struct NormalizedPoint {
    float x = 0.0f; // [0,1] of frame width
    float y = 0.0f; // [0,1] of frame height
    float z = 0.0f; // relative depth
};

/**
 * Keypoints per landmark group, as reported by a detector.
 * Only lives for one pipeline pass.
 */
struct LandmarkSet {
    std::vector<NormalizedPoint> leftHand;
    std::vector<NormalizedPoint> rightHand;
    std::vector<NormalizedPoint> face;
    std::vector<NormalizedPoint> pose;

    [[nodiscard]] bool empty() const {
        return leftHand.empty() && rightHand.empty() && face.empty() && pose.empty();
    }

    // Mean of all hand keypoints (both hands), nullopt when no hand points
    [[nodiscard]] std::optional<NormalizedPoint> handCentroid() const {
        const size_t n = leftHand.size() + rightHand.size();
        if (n == 0) return std::nullopt;

        NormalizedPoint c;
        for (const auto* hand : {&leftHand, &rightHand}) {
            for (const auto& p : *hand) {
                c.x += p.x;
                c.y += p.y;
                c.z += p.z;
            }
        }
        c.x /= static_cast<float>(n);
        c.y /= static_cast<float>(n);
        c.z /= static_cast<float>(n);
        return c;
    }
};

enum class GestureState {
    Idle = 0,   // waiting for hands
    Active = 1, // hands in motion, attempt in progress
    Ended = 2   // attempt finished, event emitted
};

[[nodiscard]] inline const char* gestureStateName(GestureState state) {
    switch (state) {
        case GestureState::Idle:   return "idle";
        case GestureState::Active: return "active";
        case GestureState::Ended:  return "ended";
    }
    return "idle";
}

// One entry per processed frame in the gesture buffer
struct GestureSample {
    bool hasHands = false;
    TimePoint timestamp;
    std::optional<NormalizedPoint> handCentroid;
    LandmarkPresence presence;
};

// Landmark summary over the samples of a single attempt
struct AttemptAnalysis {
    int totalFrames = 0;
    double gestureDurationMs = 0.0;
    double handsConsistency = 0.0;
    double faceConsistency = 0.0;
    double poseConsistency = 0.0;
    double meanHandVelocity = 0.0;
    double gestureQuality = 0.0;
};

struct GestureEvent {
    GestureState state = GestureState::Ended;
    TimePoint startedAt;
    TimePoint endedAt;
    double durationMs = 0.0;
    int sampleCount = 0;
    AttemptAnalysis analysis;
};

enum class PracticeMode {
    Listening,
    Feedback,
    Completed
};

[[nodiscard]] inline const char* practiceModeName(PracticeMode mode) {
    switch (mode) {
        case PracticeMode::Listening: return "listening";
        case PracticeMode::Feedback:  return "feedback";
        case PracticeMode::Completed: return "completed";
    }
    return "listening";
}

struct QualityMetrics {
    double landmarkConfidence = 0.0;
    double processingEfficiency = 0.0;
};

[[nodiscard]] inline double elapsedMs(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace core
