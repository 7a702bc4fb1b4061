#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace core {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string logLevel = "info";
    int maxConnections = 10;
    size_t maxMessageBytes = 8 * 1024 * 1024;
    int idleTimeoutS = 60; // keepalive after this much inbound silence
};

struct VideoConfig {
    int width = 640;
    int height = 480;
    int fps = 30;
    std::string format = "MJPG";

    // Adaptive JPEG encode
    int quality = 50;
    int minQuality = 30;
    int qualityStep = 10;
    size_t maxEncodedBytes = 0;    // 0 disables the size ceiling
    double downscaleFactor = 0.75;
    int maxEncodeAttempts = 6;

    // Per-frame timing
    double frameDeadlineMs = 100.0;
    double frameBudgetMs = 16.67;
};

struct GestureConfig {
    double velocityThreshold = 0.02;  // normalized units per second
    int pauseDurationMs = 1000;
    int minGestureDurationMs = 500;
    int bufferCapacity = 100;
    int smoothingWindow = 5;
    bool enabled = true;
};

struct DetectorConfig {
    std::string backend = "null";     // "null" | "opencv"
    std::string faceCascadePath;      // required by the opencv backend
    bool detectPose = true;
    double minHandAreaFraction = 0.01;
    double minDetectionConfidence = 0.3;
};

struct AppConfig {
    ServerConfig server;
    VideoConfig video;
    GestureConfig gesture;
    DetectorConfig detector;
};

// Returns the value of an environment variable or nullptr
using EnvLookup = std::function<const char*(const char*)>;

/**
 * Build the configuration: defaults, then the YAML file (if path is not
 * empty), then SIGNSTREAM_<SECTION>__<KEY> environment overrides, then
 * validation. Throws ConfigError.
 */
AppConfig loadConfig(const std::string& path, const EnvLookup& env);

// Merge a YAML document (string form) into cfg. Throws ConfigError.
void applyYaml(AppConfig& cfg, const std::string& yamlText);

void applyYamlFile(AppConfig& cfg, const std::string& path);

void applyEnvironment(AppConfig& cfg, const EnvLookup& env);

// Range checks. Throws ConfigError naming the offending key.
void validate(const AppConfig& cfg);

} // namespace core
