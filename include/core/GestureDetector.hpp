#pragma once

#include "core/Config.hpp"
#include "core/RingBuffer.hpp"
#include "core/Types.hpp"

#include <functional>
#include <optional>

namespace core {

/**
 * Segments a stream of per-frame hand samples into discrete sign attempts.
 *
 * States: Idle → Active → Ended
 *
 * - Idle → Active when hands appear
 * - Active → Ended after pauseDurationMs without motion above
 *   velocityThreshold, or when the hands leave the frame
 * - Attempts shorter than minGestureDurationMs are dropped (back to Idle)
 * - Ended → Active only on fresh motion, Ended → Idle when the hands leave
 *
 * Exactly one GestureEvent is returned per Active → Ended transition.
 * Owned by one connection; not thread-safe.
 */
class GestureDetector {
public:
    using TransitionCallback = std::function<void(GestureState from, GestureState to)>;

    explicit GestureDetector(const GestureConfig& config);

    /**
     * Record one processed frame and advance the state machine.
     * @return the finished attempt if this sample ended one
     */
    std::optional<GestureEvent> update(const GestureSample& sample);

    /**
     * Advance on time alone (no new frame). Ends an attempt whose pause
     * has elapsed. Calling it again after Ended returns nothing.
     */
    std::optional<GestureEvent> poll(TimePoint now);

    [[nodiscard]] GestureState state() const { return state_; }
    [[nodiscard]] bool isActive() const { return state_ == GestureState::Active; }

    // Smoothed hand velocity of the latest update (normalized units / s)
    [[nodiscard]] double velocity() const { return velocity_; }

    [[nodiscard]] size_t bufferedSamples() const { return buffer_.size(); }
    [[nodiscard]] const GestureConfig& config() const { return config_; }

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

    void reset();

private:
    GestureConfig config_;
    RingBuffer<GestureSample> buffer_;

    GestureState state_ = GestureState::Idle;
    TimePoint startedAt_;
    TimePoint lastMotionAt_;
    double velocity_ = 0.0;

    TransitionCallback transitionCallback_;

    [[nodiscard]] double smoothedVelocity() const;
    [[nodiscard]] AttemptAnalysis analyze(TimePoint from, TimePoint to) const;
    [[nodiscard]] bool pauseElapsed(TimePoint now) const;

    std::optional<GestureEvent> finishAttempt(TimePoint endedAt);
    void transitionTo(GestureState newState);
};

} // namespace core
