/**
 * @file test_frame_codec.cpp
 * @brief Unit tests for FrameCodec and the base64 helpers
 */

#include <gtest/gtest.h>
#include "core/Base64.hpp"
#include "core/FrameCodec.hpp"
#include "TestSupport.hpp"

using namespace core;

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(base64Encode(std::string("")), "");
    EXPECT_EQ(base64Encode(std::string("f")), "Zg==");
    EXPECT_EQ(base64Encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(std::string("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodeStripsPadding) {
    auto one = base64Decode("Zg==");
    ASSERT_TRUE(one);
    EXPECT_EQ(std::string(one->begin(), one->end()), "f");

    auto two = base64Decode("Zm8=");
    ASSERT_TRUE(two);
    EXPECT_EQ(std::string(two->begin(), two->end()), "fo");
}

TEST(Base64Test, DecodeRejectsMalformedInput) {
    EXPECT_FALSE(base64Decode(""));
    EXPECT_FALSE(base64Decode("Zm9"));        // length not a multiple of 4
    EXPECT_FALSE(base64Decode("Zm9v!!!!"));   // outside the alphabet
    EXPECT_FALSE(base64Decode("Z==="));       // too much padding
    EXPECT_FALSE(base64Decode("Zm=v"));       // padding in the middle
}

TEST(FrameCodecTest, DecodesDataUri) {
    const cv::Mat source = testsupport::testImage(160, 120);
    auto decoded = FrameCodec::decode(testsupport::jpegDataUri(source));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().cols, 160);
    EXPECT_EQ(decoded.value().rows, 120);
    EXPECT_EQ(decoded.value().channels(), 3);
}

TEST(FrameCodecTest, DecodesBareBase64) {
    const cv::Mat source = testsupport::testImage(64, 48);
    auto decoded = FrameCodec::decode(testsupport::jpegBase64(source));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().size(), cv::Size(64, 48));
}

TEST(FrameCodecTest, AcceptsOtherImageTypesInPrefix) {
    const cv::Mat source = testsupport::testImage(64, 48);
    auto decoded = FrameCodec::decode("data:image/png;base64," + testsupport::jpegBase64(source));
    EXPECT_TRUE(decoded);
}

TEST(FrameCodecTest, DecodeFailuresAreDecodeErrors) {
    const std::vector<std::string> inputs = {
        "",
        "data:image/jpeg;base64",                 // no comma
        "data:text/plain;base64,Zm9v",            // not an image
        "data:image/jpeg,Zm9v",                   // not base64
        "data:image/jpeg;base64,@@@@",            // bad alphabet
        "data:image/jpeg;base64,Zm9vYmFy",        // valid base64, not an image
        "not base64 at all",
    };
    for (const auto& input : inputs) {
        auto decoded = FrameCodec::decode(input);
        ASSERT_FALSE(decoded) << "accepted: " << input;
        EXPECT_EQ(decoded.error().kind, ErrorKind::Decode) << input;
        EXPECT_FALSE(decoded.error().message.empty());
    }
}

TEST(FrameCodecTest, EncodeProducesJpegDataUri) {
    const cv::Mat source = testsupport::testImage(320, 240);
    EncodeConfig config;
    auto encoded = FrameCodec::encode(source, config);
    ASSERT_TRUE(encoded) << encoded.error().message;

    const EncodedFrame& frame = encoded.value();
    EXPECT_EQ(frame.dataUri.rfind(FrameCodec::JPEG_PREFIX, 0), 0u);
    EXPECT_EQ(frame.metrics.format, "JPEG");
    EXPECT_EQ(frame.metrics.quality, 50);
    EXPECT_EQ(frame.metrics.attempts, 1);
    EXPECT_TRUE(frame.metrics.ceilingMet);
    EXPECT_EQ(frame.metrics.originalBytes, 320u * 240u * 3u);
    EXPECT_GT(frame.metrics.compressedBytes, 0u);
    EXPECT_GT(frame.metrics.compressionRatio, 1.0);
    EXPECT_GE(frame.metrics.encodeTimeMs, 0.0);

    // The output decodes back to an image of the same size
    auto decoded = FrameCodec::decode(frame.dataUri);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().size(), source.size());
}

TEST(FrameCodecTest, EncodeLowersQualityToMeetCeiling) {
    const cv::Mat source = testsupport::testImage(320, 240);

    EncodeConfig unconstrained;
    unconstrained.quality = 90;
    auto reference = FrameCodec::encode(source, unconstrained);
    ASSERT_TRUE(reference);

    EncodeConfig config;
    config.quality = 90;
    config.minQuality = 30;
    config.qualityStep = 20;
    config.maxAttempts = 10;
    config.maxBytes = reference.value().metrics.compressedBytes - 1;

    auto encoded = FrameCodec::encode(source, config);
    ASSERT_TRUE(encoded);
    EXPECT_GT(encoded.value().metrics.attempts, 1);
    EXPECT_LT(encoded.value().metrics.quality, 90);
    EXPECT_LE(encoded.value().metrics.compressedBytes, config.maxBytes);
    EXPECT_TRUE(encoded.value().metrics.ceilingMet);
}

TEST(FrameCodecTest, EncodeDownscalesBelowMinimumQuality) {
    const cv::Mat source = testsupport::testImage(320, 240);

    EncodeConfig floor;
    floor.quality = 30;
    floor.minQuality = 30;
    auto reference = FrameCodec::encode(source, floor);
    ASSERT_TRUE(reference);

    EncodeConfig config;
    config.quality = 30;
    config.minQuality = 30;
    config.maxBytes = reference.value().metrics.compressedBytes - 1;
    config.downscaleFactor = 0.5;
    config.maxAttempts = 6;

    auto encoded = FrameCodec::encode(source, config);
    ASSERT_TRUE(encoded);
    const auto& m = encoded.value().metrics;
    EXPECT_EQ(m.quality, 30);
    EXPECT_LT(m.width, 320);
    EXPECT_LT(m.height, 240);
}

TEST(FrameCodecTest, EncodeReportsUnmetCeiling) {
    const cv::Mat source = testsupport::testImage(320, 240);
    EncodeConfig config;
    config.maxBytes = 1;  // unreachable
    config.maxAttempts = 3;

    auto encoded = FrameCodec::encode(source, config);
    ASSERT_TRUE(encoded);
    EXPECT_FALSE(encoded.value().metrics.ceilingMet);
    EXPECT_EQ(encoded.value().metrics.attempts, 3);
    EXPECT_FALSE(encoded.value().dataUri.empty());
}

TEST(FrameCodecTest, EncodeRejectsEmptyImage) {
    auto encoded = FrameCodec::encode(cv::Mat(), EncodeConfig{});
    ASSERT_FALSE(encoded);
    EXPECT_EQ(encoded.error().kind, ErrorKind::Encode);
}
