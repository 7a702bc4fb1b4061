#include "core/GestureDetector.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace core {

namespace {

double distance2D(const NormalizedPoint& a, const NormalizedPoint& b) {
    const double dx = static_cast<double>(a.x) - b.x;
    const double dy = static_cast<double>(a.y) - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

GestureDetector::GestureDetector(const GestureConfig& config)
    : config_(config),
      buffer_(static_cast<size_t>(std::max(1, config.bufferCapacity))) {
    reset();
}

void GestureDetector::reset() {
    buffer_.clear();
    state_ = GestureState::Idle;
    startedAt_ = TimePoint{};
    lastMotionAt_ = TimePoint{};
    velocity_ = 0.0;
}

std::optional<GestureEvent> GestureDetector::update(const GestureSample& sample) {
    buffer_.push(sample);
    velocity_ = smoothedVelocity();

    if (!config_.enabled) {
        return std::nullopt;
    }

    const bool moving = velocity_ >= config_.velocityThreshold;

    switch (state_) {
        case GestureState::Idle:
            if (sample.hasHands) {
                startedAt_ = sample.timestamp;
                lastMotionAt_ = sample.timestamp;
                transitionTo(GestureState::Active);
            }
            return std::nullopt;

        case GestureState::Active:
            if (!sample.hasHands) {
                return finishAttempt(sample.timestamp);
            }
            if (moving) {
                lastMotionAt_ = sample.timestamp;
            }
            if (pauseElapsed(sample.timestamp)) {
                return finishAttempt(sample.timestamp);
            }
            return std::nullopt;

        case GestureState::Ended:
            if (!sample.hasHands) {
                transitionTo(GestureState::Idle);
            } else if (moving) {
                startedAt_ = sample.timestamp;
                lastMotionAt_ = sample.timestamp;
                transitionTo(GestureState::Active);
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<GestureEvent> GestureDetector::poll(TimePoint now) {
    if (!config_.enabled || state_ != GestureState::Active) {
        return std::nullopt;
    }
    if (pauseElapsed(now)) {
        return finishAttempt(now);
    }
    return std::nullopt;
}

bool GestureDetector::pauseElapsed(TimePoint now) const {
    return elapsedMs(lastMotionAt_, now) >= static_cast<double>(config_.pauseDurationMs);
}

std::optional<GestureEvent> GestureDetector::finishAttempt(TimePoint endedAt) {
    const double durationMs = elapsedMs(startedAt_, endedAt);

    if (durationMs < static_cast<double>(config_.minGestureDurationMs)) {
        Logger::debug("GestureDetector: discarded ", durationMs, " ms attempt (below ",
                      config_.minGestureDurationMs, " ms)");
        transitionTo(GestureState::Idle);
        return std::nullopt;
    }

    GestureEvent event;
    event.state = GestureState::Ended;
    event.startedAt = startedAt_;
    event.endedAt = endedAt;
    event.durationMs = durationMs;
    event.analysis = analyze(startedAt_, endedAt);
    event.sampleCount = event.analysis.totalFrames;

    transitionTo(GestureState::Ended);
    return event;
}

double GestureDetector::smoothedVelocity() const {
    // Walk back over the newest samples that carry a hand centroid
    const size_t window = static_cast<size_t>(std::max(2, config_.smoothingWindow));
    double total = 0.0;
    int pairs = 0;
    size_t used = 1;

    for (size_t i = buffer_.size(); i >= 2 && used < window; --i) {
        const GestureSample& newer = buffer_[i - 1];
        const GestureSample& older = buffer_[i - 2];
        if (!newer.hasHands || !older.hasHands || !newer.handCentroid || !older.handCentroid) {
            break;
        }

        // A gap this long means the stream stalled; older samples are stale
        const double gapMs = elapsedMs(older.timestamp, newer.timestamp);
        if (gapMs > static_cast<double>(config_.pauseDurationMs)) {
            break;
        }

        const double dt = gapMs / 1000.0;
        if (dt > 0.0) {
            total += distance2D(*newer.handCentroid, *older.handCentroid) / dt;
            ++pairs;
        }
        ++used;
    }

    return pairs > 0 ? total / pairs : 0.0;
}

AttemptAnalysis GestureDetector::analyze(TimePoint from, TimePoint to) const {
    AttemptAnalysis a;
    a.gestureDurationMs = elapsedMs(from, to);

    int hands = 0;
    int face = 0;
    int pose = 0;
    double speedSum = 0.0;
    int speedPairs = 0;
    const GestureSample* previous = nullptr;

    for (size_t i = 0; i < buffer_.size(); ++i) {
        const GestureSample& s = buffer_[i];
        if (s.timestamp < from || s.timestamp > to) continue;

        ++a.totalFrames;
        hands += s.presence.hands ? 1 : 0;
        face += s.presence.face ? 1 : 0;
        pose += s.presence.pose ? 1 : 0;

        if (previous && previous->handCentroid && s.handCentroid) {
            const double dt = elapsedMs(previous->timestamp, s.timestamp) / 1000.0;
            if (dt > 0.0) {
                speedSum += distance2D(*s.handCentroid, *previous->handCentroid) / dt;
                ++speedPairs;
            }
        }
        previous = &s;
    }

    if (a.totalFrames > 0) {
        const double n = static_cast<double>(a.totalFrames);
        a.handsConsistency = hands / n;
        a.faceConsistency = face / n;
        a.poseConsistency = pose / n;
    }
    a.meanHandVelocity = speedPairs > 0 ? speedSum / speedPairs : 0.0;
    a.gestureQuality = (a.handsConsistency + a.faceConsistency + a.poseConsistency) / 3.0;
    return a;
}

void GestureDetector::transitionTo(GestureState newState) {
    GestureState oldState = state_;
    state_ = newState;

    Logger::debug("GestureDetector: ", gestureStateName(oldState), " → ", gestureStateName(newState));

    if (transitionCallback_) {
        transitionCallback_(oldState, newState);
    }
}

} // namespace core
