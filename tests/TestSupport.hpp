#pragma once

#include "core/Base64.hpp"
#include "core/FrameCodec.hpp"
#include "core/Types.hpp"
#include "inference/LandmarkDetector.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace testsupport {

// Gradient test card with a few shapes, so JPEG has something to compress
inline cv::Mat testImage(int width = 320, int height = 240) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 255 / width),
                                                   static_cast<uchar>(y * 255 / height),
                                                   static_cast<uchar>((x + y) % 256));
        }
    }
    cv::circle(image, cv::Point(width / 3, height / 2), height / 5, cv::Scalar(255, 255, 255), -1);
    cv::rectangle(image, cv::Rect(width / 2, height / 4, width / 4, height / 3), cv::Scalar(0, 0, 0), 3);
    return image;
}

inline std::string jpegBase64(const cv::Mat& image, int quality = 90) {
    std::vector<uchar> bytes;
    cv::imencode(".jpg", image, bytes, {cv::IMWRITE_JPEG_QUALITY, quality});
    return core::base64Encode(bytes.data(), bytes.size());
}

inline std::string jpegDataUri(const cv::Mat& image, int quality = 90) {
    return std::string(core::FrameCodec::JPEG_PREFIX) + jpegBase64(image, quality);
}

// One hand of a few points around (x, y)
inline inference::DetectionResult handAt(float x, float y, bool face = true) {
    inference::DetectionResult r;
    r.presence.hands = true;
    r.presence.face = face;
    r.landmarks.rightHand = {{x, y, 0.0f}, {x + 0.01f, y, 0.0f}, {x, y + 0.01f, 0.0f}};
    if (face) {
        r.landmarks.face = {{0.5f, 0.2f, 0.0f}};
    }
    return r;
}

/**
 * Detector driven by a callback per call, with an optional fixed delay.
 */
class ScriptedDetector : public inference::LandmarkDetector {
public:
    using Script = std::function<inference::DetectionResult(int call)>;

    explicit ScriptedDetector(Script script, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : script_(std::move(script)), delay_(delay) {}

    inference::DetectionResult detect(const cv::Mat&) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return script_(calls_++);
    }

    [[nodiscard]] std::string name() const override { return "scripted"; }

    [[nodiscard]] int calls() const { return calls_; }

private:
    Script script_;
    std::chrono::milliseconds delay_;
    int calls_ = 0;
};

class ThrowingDetector : public inference::LandmarkDetector {
public:
    inference::DetectionResult detect(const cv::Mat&) override {
        throw inference::DetectorError("model not loaded");
    }
    [[nodiscard]] std::string name() const override { return "throwing"; }
};

} // namespace testsupport
