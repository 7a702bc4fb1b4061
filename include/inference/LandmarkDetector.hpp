#pragma once

#include <stdexcept>
#include <string>
#include <opencv2/core.hpp>

#include "core/Types.hpp"

namespace inference {

struct DetectionResult {
    core::LandmarkPresence presence;
    core::LandmarkSet landmarks;
};

/**
 * Raised by detectors for failures inside the model.
 */
class DetectorError : public std::runtime_error {
public:
    explicit DetectorError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Landmark detector interface.
 *
 * One instance per connection: implementations may keep tracking state
 * between frames and do not need to be thread-safe.
 * detect() may throw DetectorError or cv::Exception.
 */
class LandmarkDetector {
public:
    virtual ~LandmarkDetector() = default;

    /**
     * @param bgr 8-bit 3-channel image
     */
    virtual DetectionResult detect(const cv::Mat& bgr) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace inference
