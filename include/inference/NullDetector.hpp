#pragma once

#include "inference/LandmarkDetector.hpp"

namespace inference {

/**
 * Reports nothing detected. Used when no model is configured.
 */
class NullDetector : public LandmarkDetector {
public:
    DetectionResult detect(const cv::Mat& bgr) override;
    [[nodiscard]] std::string name() const override { return "null"; }
};

} // namespace inference
