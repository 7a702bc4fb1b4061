#include "inference/NullDetector.hpp"

namespace inference {

DetectionResult NullDetector::detect(const cv::Mat& bgr) {
    if (bgr.empty()) {
        throw DetectorError("empty input image");
    }
    return {};
}

} // namespace inference
