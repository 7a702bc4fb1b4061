#include "core/FrameCodec.hpp"
#include "core/Base64.hpp"
#include "core/Types.hpp"

#include <algorithm>
#include <optional>
#include <string_view>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace core {

namespace {

constexpr int MIN_SCALED_SIDE = 16;

// Returns the payload part of the string, or nullopt for a malformed data URI
std::optional<std::string_view> stripDataUri(std::string_view encoded) {
    constexpr std::string_view scheme = "data:";
    if (encoded.substr(0, scheme.size()) != scheme) {
        return encoded;
    }

    const size_t comma = encoded.find(',');
    if (comma == std::string_view::npos) return std::nullopt;

    const std::string_view header = encoded.substr(scheme.size(), comma - scheme.size());
    constexpr std::string_view image = "image/";
    constexpr std::string_view b64 = ";base64";
    if (header.substr(0, image.size()) != image) return std::nullopt;
    if (header.size() < b64.size() || header.substr(header.size() - b64.size()) != b64) {
        return std::nullopt;
    }
    return encoded.substr(comma + 1);
}

} // namespace

Result<cv::Mat> FrameCodec::decode(const std::string& encoded) {
    if (encoded.empty()) {
        return Result<cv::Mat>::err(ErrorKind::Decode, "empty frame data");
    }

    auto payload = stripDataUri(encoded);
    if (!payload) {
        return Result<cv::Mat>::err(ErrorKind::Decode, "malformed data URI prefix");
    }

    auto bytes = base64Decode(*payload);
    if (!bytes || bytes->empty()) {
        return Result<cv::Mat>::err(ErrorKind::Decode, "invalid base64 payload");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(*bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        return Result<cv::Mat>::err(ErrorKind::Decode, std::string("image decode failed: ") + e.what());
    }

    if (image.empty()) {
        return Result<cv::Mat>::err(ErrorKind::Decode, "payload is not a decodable image");
    }
    return image;
}

Result<EncodedFrame> FrameCodec::encode(const cv::Mat& image, const EncodeConfig& config) {
    if (image.empty()) {
        return Result<EncodedFrame>::err(ErrorKind::Encode, "cannot encode an empty image");
    }

    const auto start = Clock::now();
    const int minQuality = std::clamp(config.minQuality, 1, 100);
    const int step = std::max(1, config.qualityStep);
    const int maxAttempts = std::max(1, config.maxAttempts);

    int quality = std::clamp(config.quality, minQuality, 100);
    cv::Mat current = image;

    std::vector<uchar> best;
    EncodeMetrics bestMetrics;
    bool fits = false;
    int attempt = 0;

    try {
        while (attempt < maxAttempts) {
            ++attempt;

            std::vector<uchar> buf;
            const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality,
                                             cv::IMWRITE_JPEG_OPTIMIZE, 0,
                                             cv::IMWRITE_JPEG_PROGRESSIVE, 0};
            if (!cv::imencode(".jpg", current, buf, params) || buf.empty()) {
                return Result<EncodedFrame>::err(ErrorKind::Encode, "JPEG encoder rejected the image");
            }

            if (best.empty() || buf.size() < best.size()) {
                bestMetrics.quality = quality;
                bestMetrics.width = current.cols;
                bestMetrics.height = current.rows;
                best = std::move(buf);
            }

            if (config.maxBytes == 0 || best.size() <= config.maxBytes) {
                fits = true;
                break;
            }

            if (quality > minQuality) {
                quality = std::max(minQuality, quality - step);
                continue;
            }

            const int w = static_cast<int>(current.cols * config.downscaleFactor);
            const int h = static_cast<int>(current.rows * config.downscaleFactor);
            if (w < MIN_SCALED_SIDE || h < MIN_SCALED_SIDE) break;

            cv::Mat scaled;
            cv::resize(current, scaled, cv::Size(w, h), 0, 0, cv::INTER_AREA);
            current = scaled;
        }
    } catch (const cv::Exception& e) {
        return Result<EncodedFrame>::err(ErrorKind::Encode, std::string("JPEG encode failed: ") + e.what());
    }

    EncodedFrame out;
    out.metrics = bestMetrics;
    out.metrics.attempts = attempt;
    out.metrics.ceilingMet = fits;
    out.metrics.compressedBytes = best.size();
    out.metrics.originalBytes = image.total() * image.elemSize();
    out.metrics.compressionRatio = static_cast<double>(out.metrics.originalBytes) /
                                   static_cast<double>(best.size());
    out.dataUri = std::string(JPEG_PREFIX) + base64Encode(best.data(), best.size());
    out.metrics.encodeTimeMs = elapsedMs(start, Clock::now());
    return out;
}

} // namespace core
