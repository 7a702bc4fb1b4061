/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading (YAML + environment)
 */

#include <gtest/gtest.h>
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <cstdio>
#include <fstream>
#include <map>
#include <string>

using namespace core;

namespace {

// Environment stand-in backed by a map
EnvLookup envFrom(const std::map<std::string, std::string>& values) {
    return [values](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    AppConfig cfg;
    EXPECT_NO_THROW(validate(cfg));
    EXPECT_EQ(cfg.server.port, 8000);
    EXPECT_EQ(cfg.video.quality, 50);
    EXPECT_EQ(cfg.gesture.pauseDurationMs, 1000);
    EXPECT_EQ(cfg.gesture.minGestureDurationMs, 500);
    EXPECT_EQ(cfg.detector.backend, "null");
}

TEST(ConfigTest, YamlOverridesDefaults) {
    AppConfig cfg;
    applyYaml(cfg, R"(
server:
  host: 127.0.0.1
  port: 9100
  log_level: debug
video:
  quality: 70
  fps: 15
gesture_detection:
  velocity_threshold: 0.05
  pause_duration_ms: 1500
  landmark_buffer_size: 60
  enabled: false
detector:
  backend: opencv
  face_cascade: /tmp/face.xml
)");

    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 9100);
    EXPECT_EQ(cfg.server.logLevel, "debug");
    EXPECT_EQ(cfg.video.quality, 70);
    EXPECT_EQ(cfg.video.fps, 15);
    EXPECT_DOUBLE_EQ(cfg.gesture.velocityThreshold, 0.05);
    EXPECT_EQ(cfg.gesture.pauseDurationMs, 1500);
    EXPECT_EQ(cfg.gesture.bufferCapacity, 60);
    EXPECT_FALSE(cfg.gesture.enabled);
    EXPECT_EQ(cfg.detector.backend, "opencv");
    EXPECT_EQ(cfg.detector.faceCascadePath, "/tmp/face.xml");

    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.video.width, 640);
    EXPECT_EQ(cfg.gesture.smoothingWindow, 5);
}

TEST(ConfigTest, EmptyYamlChangesNothing) {
    AppConfig cfg;
    applyYaml(cfg, "");
    EXPECT_EQ(cfg.server.port, 8000);
}

TEST(ConfigTest, MalformedYamlThrows) {
    AppConfig cfg;
    EXPECT_THROW(applyYaml(cfg, "server: [unclosed"), ConfigError);
    EXPECT_THROW(applyYaml(cfg, "- just\n- a list\n"), ConfigError);
    EXPECT_THROW(applyYaml(cfg, "server:\n  port: eighty\n"), ConfigError);
    EXPECT_THROW(applyYaml(cfg, "server:\n  port: [1, 2]\n"), ConfigError);
}

TEST(ConfigTest, EnvironmentOverridesYaml) {
    AppConfig cfg;
    applyYaml(cfg, "server:\n  port: 9100\n");
    applyEnvironment(cfg, envFrom({
        {"SIGNSTREAM_SERVER__PORT", "9200"},
        {"SIGNSTREAM_GESTURE_DETECTION__MIN_GESTURE_DURATION_MS", "300"},
        {"SIGNSTREAM_DETECTOR__DETECT_POSE", "off"},
    }));
    EXPECT_EQ(cfg.server.port, 9200);
    EXPECT_EQ(cfg.gesture.minGestureDurationMs, 300);
    EXPECT_FALSE(cfg.detector.detectPose);
}

TEST(ConfigTest, BadEnvironmentValueNamesVariable) {
    AppConfig cfg;
    try {
        applyEnvironment(cfg, envFrom({{"SIGNSTREAM_VIDEO__QUALITY", "high"}}));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("SIGNSTREAM_VIDEO__QUALITY"), std::string::npos);
    }
}

TEST(ConfigTest, ValidationRejectsOutOfRange) {
    struct Case { const char* name; void (*mutate)(AppConfig&); };
    const Case cases[] = {
        {"port", [](AppConfig& c) { c.server.port = 80; }},
        {"quality", [](AppConfig& c) { c.video.quality = 20; }},
        {"fps", [](AppConfig& c) { c.video.fps = 120; }},
        {"pause", [](AppConfig& c) { c.gesture.pauseDurationMs = 100; }},
        {"min duration", [](AppConfig& c) { c.gesture.minGestureDurationMs = 5000; }},
        {"buffer", [](AppConfig& c) { c.gesture.bufferCapacity = 10; }},
        {"smoothing", [](AppConfig& c) { c.gesture.smoothingWindow = 1; }},
        {"velocity", [](AppConfig& c) { c.gesture.velocityThreshold = 0.5; }},
        {"backend", [](AppConfig& c) { c.detector.backend = "tensorrt"; }},
        {"format", [](AppConfig& c) { c.video.format = "H264"; }},
        {"log level", [](AppConfig& c) { c.server.logLevel = "chatty"; }},
    };
    for (const auto& c : cases) {
        AppConfig cfg;
        c.mutate(cfg);
        EXPECT_THROW(validate(cfg), ConfigError) << c.name;
    }
}

TEST(ConfigTest, ErrorMessageNamesKey) {
    AppConfig cfg;
    cfg.gesture.pauseDurationMs = 100;
    try {
        validate(cfg);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("gesture_detection.pause_duration_ms"), std::string::npos);
    }
}

TEST(ConfigTest, MinGestureMayNotExceedPause) {
    AppConfig cfg;
    cfg.gesture.pauseDurationMs = 500;
    cfg.gesture.minGestureDurationMs = 2000;
    try {
        validate(cfg);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("gesture_detection.min_gesture_duration_ms"), std::string::npos);
    }

    cfg.gesture.minGestureDurationMs = 500;
    EXPECT_NO_THROW(validate(cfg));
}

TEST(ConfigTest, LoadConfigLayersFileAndEnvironment) {
    const std::string path = ::testing::TempDir() + "signstream_config_test.yaml";
    {
        std::ofstream out(path);
        out << "server:\n  port: 9300\nvideo:\n  quality: 80\n";
    }

    const AppConfig cfg = loadConfig(path, envFrom({{"SIGNSTREAM_VIDEO__QUALITY", "60"}}));
    EXPECT_EQ(cfg.server.port, 9300);
    EXPECT_EQ(cfg.video.quality, 60);
    std::remove(path.c_str());
}

TEST(ConfigTest, LoadConfigWithoutFileUsesDefaults) {
    const AppConfig cfg = loadConfig("", envFrom({}));
    EXPECT_EQ(cfg.server.port, 8000);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig("/nonexistent/signstream.yaml", envFrom({})), ConfigError);
}

TEST(ConfigTest, LoadConfigValidates) {
    EXPECT_THROW(loadConfig("", envFrom({{"SIGNSTREAM_SERVER__PORT", "22"}})), ConfigError);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_FALSE(Logger::parseLevel("chatty"));
}
