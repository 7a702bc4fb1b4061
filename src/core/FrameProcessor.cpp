#include "core/FrameProcessor.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cstdio>
#include <opencv2/imgproc.hpp>

namespace core {

FrameProcessor::FrameProcessor(const VideoConfig& video,
                               const GestureConfig& gesture,
                               std::unique_ptr<inference::LandmarkDetector> detector)
    : video_(video),
      detector_(std::move(detector)),
      gesture_(gesture) {
    if (!detector_) {
        throw std::invalid_argument("FrameProcessor requires a landmark detector");
    }

    encode_.quality = video_.quality;
    encode_.minQuality = std::min(video_.minQuality, video_.quality);
    encode_.qualityStep = video_.qualityStep;
    encode_.maxBytes = video_.maxEncodedBytes;
    encode_.downscaleFactor = video_.downscaleFactor;
    encode_.maxAttempts = video_.maxEncodeAttempts;
}

double FrameProcessor::processingEfficiency(double detectorMs, double budgetMs) {
    if (budgetMs <= 0.0) return 1.0;
    if (detectorMs <= budgetMs) return 1.0;
    if (detectorMs <= 2.0 * budgetMs) {
        return std::clamp(1.0 - (detectorMs - budgetMs) / budgetMs, 0.1, 1.0);
    }
    return 0.1;
}

double FrameProcessor::landmarkConfidence(const LandmarkPresence& presence) {
    return static_cast<double>(presence.count()) / LANDMARK_GROUPS;
}

bool FrameProcessor::pastDeadline(TimePoint start) const {
    return elapsedMs(start, Clock::now()) > video_.frameDeadlineMs;
}

ProcessingResult FrameProcessor::process(const FrameSample& frame, PracticeSessionManager* practice) {
    const auto start = Clock::now();
    const uint64_t serverFrameNumber = ++serverFrameNumber_;

    auto header = [&] {
        ProcessingResult result;
        result.clientFrameNumber = frame.clientFrameNumber;
        result.serverFrameNumber = serverFrameNumber;
        result.gestureState = gesture_.state();
        return result;
    };

    try {
        return runStages(frame, practice, header(), start);
    } catch (const std::exception& e) {
        return fail(header(), ErrorKind::Internal, std::string("internal error: ") + e.what(), start);
    } catch (...) {
        return fail(header(), ErrorKind::Internal, "internal error: unknown exception", start);
    }
}

ProcessingResult FrameProcessor::runStages(const FrameSample& frame, PracticeSessionManager* practice,
                                           ProcessingResult result, TimePoint start) {
    // 1. Decode
    auto decoded = FrameCodec::decode(frame.encoded);
    result.timings.decodeMs = elapsedMs(start, Clock::now());
    if (!decoded) {
        return fail(std::move(result), decoded.error().kind, decoded.error().message, start);
    }
    cv::Mat image = std::move(decoded).value();

    if (pastDeadline(start)) {
        return fail(std::move(result), ErrorKind::Timeout, "deadline exceeded after decode", start);
    }

    // 2. Detect
    inference::DetectionResult detection;
    const auto detectStart = Clock::now();
    try {
        detection = detector_->detect(image);
    } catch (const inference::DetectorError& e) {
        return fail(std::move(result), ErrorKind::Detector, e.what(), start);
    } catch (const cv::Exception& e) {
        return fail(std::move(result), ErrorKind::Detector, std::string("detector: ") + e.what(), start);
    } catch (const std::exception& e) {
        return fail(std::move(result), ErrorKind::Detector, std::string("detector: ") + e.what(), start);
    }
    // Anything else a detector throws is left to process() and reported as internal
    result.timings.detectMs = elapsedMs(detectStart, Clock::now());

    if (pastDeadline(start)) {
        return fail(std::move(result), ErrorKind::Timeout, "deadline exceeded after detection", start);
    }

    // 3. Gesture + practice. From here on the frame is committed: no more
    // deadline checks, so a frame that fed the gesture detector is always sent back
    GestureSample sample;
    sample.hasHands = detection.presence.hands;
    sample.timestamp = frame.receivedAt;
    sample.handCentroid = detection.landmarks.handCentroid();
    sample.presence = detection.presence;

    if (auto event = gesture_.update(sample)) {
        applyGesture(*event, practice);
    }
    result.gestureEvent = std::move(pendingEvent_);
    pendingEvent_.reset();
    result.gestureState = gesture_.state();

    if (practice != nullptr) {
        result.practice = practice->snapshot();
    }

    // 4. Overlay (cosmetic, a failure here only loses the drawing)
    try {
        drawOverlay(image, detection.landmarks, detection.presence, result.practice);
    } catch (const cv::Exception& e) {
        Logger::warn("FrameProcessor: overlay failed: ", e.what());
    }

    // 5. Encode
    auto encoded = FrameCodec::encode(image, encode_);
    if (!encoded) {
        return fail(std::move(result), encoded.error().kind, encoded.error().message, start);
    }
    EncodedFrame out = std::move(encoded).value();

    result.success = true;
    result.frameData = std::move(out.dataUri);
    result.encoding = out.metrics;
    result.timings.encodeMs = out.metrics.encodeTimeMs;
    result.landmarks = detection.presence;
    result.quality.landmarkConfidence = landmarkConfidence(detection.presence);
    result.quality.processingEfficiency = processingEfficiency(result.timings.detectMs, video_.frameBudgetMs);
    result.timings.totalMs = elapsedMs(start, Clock::now());

    if (!out.metrics.ceilingMet) {
        Logger::debug("FrameProcessor: frame ", result.serverFrameNumber, " above size ceiling (",
                      out.metrics.compressedBytes, " bytes)");
    }

    record(result);
    return result;
}

void FrameProcessor::poll(TimePoint now, PracticeSessionManager* practice) {
    if (auto event = gesture_.poll(now)) {
        applyGesture(*event, practice);
    }
}

void FrameProcessor::resetGesture() {
    gesture_.reset();
    pendingEvent_.reset();
}

void FrameProcessor::applyGesture(const GestureEvent& event, PracticeSessionManager* practice) {
    ++stats_.gestureEvents;
    pendingEvent_ = event;
    Logger::debug("FrameProcessor: gesture ended after ", static_cast<int>(event.durationMs),
                  " ms (", event.sampleCount, " frames)");
    if (practice != nullptr) {
        practice->onGesture(event);
    }
}

ProcessingResult FrameProcessor::fail(ProcessingResult result, ErrorKind kind, std::string message,
                                      TimePoint start) {
    result.success = false;
    result.error = PipelineError{kind, std::move(message)};
    result.frameData.clear();
    result.landmarks = LandmarkPresence{};
    result.quality = QualityMetrics{};
    result.encoding.reset();
    result.timings.totalMs = elapsedMs(start, Clock::now());

    if (kind == ErrorKind::Timeout) {
        Logger::warn("FrameProcessor: frame ", result.serverFrameNumber, " ", result.error->message,
                     " (", result.timings.totalMs, " ms)");
    } else {
        Logger::warn("FrameProcessor: frame ", result.serverFrameNumber, " failed [",
                     errorKindName(kind), "]: ", result.error->message);
    }

    record(result);
    return result;
}

void FrameProcessor::record(const ProcessingResult& result) {
    ++stats_.framesProcessed;
    if (!result.success) {
        ++stats_.framesFailed;
        if (result.error && result.error->kind == ErrorKind::Timeout) {
            ++stats_.framesTimedOut;
        }
    }
    stats_.lastPipelineMs = result.timings.totalMs;
    const double n = static_cast<double>(stats_.framesProcessed);
    stats_.averagePipelineMs += (result.timings.totalMs - stats_.averagePipelineMs) / n;
}

void FrameProcessor::drawOverlay(cv::Mat& frame,
                                 const LandmarkSet& landmarks,
                                 const LandmarkPresence& presence,
                                 const std::optional<PracticeSnapshot>& practice) const {
    if (frame.empty()) return;

    const int w = frame.cols;
    const int h = frame.rows;

    auto toPixel = [w, h](const NormalizedPoint& p) {
        return cv::Point(static_cast<int>(p.x * w), static_cast<int>(p.y * h));
    };

    auto drawTransparentRect = [&](cv::Rect rect, cv::Scalar color, double alpha) {
        rect &= cv::Rect(0, 0, w, h);
        if (rect.empty()) return;
        cv::Mat roi = frame(rect);
        cv::Mat fill(roi.size(), roi.type(), color);
        cv::addWeighted(fill, alpha, roi, 1.0 - alpha, 0, roi);
    };

    auto drawGroup = [&](const std::vector<NormalizedPoint>& points, cv::Scalar color, bool closed) {
        if (points.empty()) return;
        std::vector<cv::Point> px;
        px.reserve(points.size());
        for (const auto& p : points) {
            px.push_back(toPixel(p));
            cv::circle(frame, px.back(), 3, color, -1);
        }
        if (px.size() > 1) {
            cv::polylines(frame, px, closed, color, 1);
        }
    };

    // Landmarks
    drawGroup(landmarks.leftHand, cv::Scalar(0, 255, 0), true);    // Green
    drawGroup(landmarks.rightHand, cv::Scalar(0, 200, 0), true);
    drawGroup(landmarks.face, cv::Scalar(0, 255, 255), false);     // Yellow
    drawGroup(landmarks.pose, cv::Scalar(255, 128, 0), false);     // Blue

    // === TOP LEFT: detection status ===
    drawTransparentRect(cv::Rect(5, 5, 190, 70), cv::Scalar(0, 0, 0), 0.6);

    auto statusColor = [](bool on) { return on ? cv::Scalar(0, 255, 0) : cv::Scalar(0, 0, 255); };
    cv::putText(frame, "Hands", cv::Point(10, 22), cv::FONT_HERSHEY_SIMPLEX, 0.45, statusColor(presence.hands), 1);
    cv::putText(frame, "Face", cv::Point(70, 22), cv::FONT_HERSHEY_SIMPLEX, 0.45, statusColor(presence.face), 1);
    cv::putText(frame, "Pose", cv::Point(120, 22), cv::FONT_HERSHEY_SIMPLEX, 0.45, statusColor(presence.pose), 1);

    char gestureStr[64];
    snprintf(gestureStr, sizeof(gestureStr), "Gesture: %s", gestureStateName(gesture_.state()));
    const cv::Scalar gestureColor = gesture_.isActive() ? cv::Scalar(0, 165, 255) : cv::Scalar(255, 255, 255);
    cv::putText(frame, gestureStr, cv::Point(10, 44), cv::FONT_HERSHEY_SIMPLEX, 0.45, gestureColor, 1);

    char velocityStr[64];
    snprintf(velocityStr, sizeof(velocityStr), "Motion: %.3f", gesture_.velocity());
    cv::putText(frame, velocityStr, cv::Point(10, 64), cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(200, 200, 255), 1);

    // === BOTTOM: practice banner ===
    if (practice) {
        const int bannerHeight = 44;
        drawTransparentRect(cv::Rect(0, h - bannerHeight, w, bannerHeight), cv::Scalar(0, 0, 0), 0.6);

        char header[64];
        snprintf(header, sizeof(header), "Sentence %d/%d  [%s]", practice->currentSentenceIndex + 1,
                 practice->totalSentences, practiceModeName(practice->mode));
        cv::putText(frame, header, cv::Point(10, h - bannerHeight + 16), cv::FONT_HERSHEY_SIMPLEX, 0.45,
                    cv::Scalar(255, 255, 255), 1);

        std::string sentence = practice->currentSentence;
        const size_t maxChars = static_cast<size_t>(std::max(10, w / 9));
        if (sentence.size() > maxChars) {
            sentence = sentence.substr(0, maxChars - 3) + "...";
        }
        cv::putText(frame, sentence, cv::Point(10, h - 8), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                    cv::Scalar(0, 255, 255), 1);
    }
}

} // namespace core
