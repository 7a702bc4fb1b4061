#pragma once

#include "core/Config.hpp"
#include "inference/LandmarkDetector.hpp"

#include <vector>
#include <opencv2/objdetect.hpp>

namespace inference {

/**
 * Model-light detector built from classic OpenCV components:
 * - Face: Haar cascade (path from config)
 * - Pose: default HOG people detector
 * - Hands: skin-colour segmentation with face regions masked out
 *
 * Landmarks are outline points of the detected regions, normalized to the
 * input frame. Left/right hand is the image side, not handedness.
 */
class OpenCvDetector : public LandmarkDetector {
public:
    /**
     * @throws DetectorError if the face cascade cannot be loaded
     */
    explicit OpenCvDetector(const core::DetectorConfig& config);

    DetectionResult detect(const cv::Mat& bgr) override;
    [[nodiscard]] std::string name() const override { return "opencv"; }

private:
    // Working resolution (longest side) for all detection passes
    static constexpr int WORK_WIDTH = 320;
    static constexpr int HAND_POINTS = 21;

    core::DetectorConfig config_;
    cv::CascadeClassifier faceCascade_;
    cv::HOGDescriptor hog_;

    [[nodiscard]] std::vector<cv::Rect> detectFaces(const cv::Mat& gray);
    [[nodiscard]] std::vector<cv::Rect> detectPeople(const cv::Mat& bgr);
    [[nodiscard]] std::vector<std::vector<cv::Point>> detectHands(const cv::Mat& bgr,
                                                                  const std::vector<cv::Rect>& faces) const;
};

} // namespace inference
