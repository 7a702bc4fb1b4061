#pragma once

#include <cstddef>
#include <string>
#include <opencv2/core.hpp>

#include "core/Errors.hpp"

namespace core {

/**
 * Adaptive JPEG encode settings.
 * Quality drops by qualityStep until minQuality, then the image is scaled by
 * downscaleFactor, until the output fits maxBytes or maxAttempts is used up.
 */
struct EncodeConfig {
    int quality = 50;
    int minQuality = 30;
    int qualityStep = 10;
    size_t maxBytes = 0; // 0 = no ceiling
    double downscaleFactor = 0.75;
    int maxAttempts = 6;
};

struct EncodeMetrics {
    double encodeTimeMs = 0.0;
    size_t compressedBytes = 0;
    size_t originalBytes = 0;  // rows * cols * channels of the input
    double compressionRatio = 0.0;
    int quality = 0;
    std::string format = "JPEG";
    int attempts = 0;
    int width = 0;
    int height = 0;
    bool ceilingMet = true;
};

struct EncodedFrame {
    std::string dataUri; // data:image/jpeg;base64,...
    EncodeMetrics metrics;
};

/**
 * Conversion between client data URIs and OpenCV images. Never throws.
 */
class FrameCodec {
public:
    static constexpr const char* JPEG_PREFIX = "data:image/jpeg;base64,";

    /**
     * Accepts "data:image/<type>;base64,<payload>" or a bare base64 payload.
     * Decode errors: empty input, malformed prefix, invalid base64,
     * bytes that are not a decodable image.
     */
    [[nodiscard]] static Result<cv::Mat> decode(const std::string& encoded);

    [[nodiscard]] static Result<EncodedFrame> encode(const cv::Mat& image, const EncodeConfig& config);
};

} // namespace core
