#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace core {

namespace {

int parseInt(const std::string& key, const std::string& v) {
    try {
        size_t pos = 0;
        int out = std::stoi(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw ConfigError(key + ": expected an integer, got '" + v + "'");
    }
}

double parseDouble(const std::string& key, const std::string& v) {
    try {
        size_t pos = 0;
        double out = std::stod(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw ConfigError(key + ": expected a number, got '" + v + "'");
    }
}

bool parseBool(const std::string& key, const std::string& v) {
    std::string lower = v;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    throw ConfigError(key + ": expected a boolean, got '" + v + "'");
}

struct Field {
    const char* section;
    const char* key;
    std::function<void(AppConfig&, const std::string& name, const std::string& value)> set;
};

// Every configurable key, shared by the YAML and environment layers
const std::vector<Field>& fields() {
    static const std::vector<Field> table = {
        {"server", "host", [](AppConfig& c, const std::string&, const std::string& v) { c.server.host = v; }},
        {"server", "port", [](AppConfig& c, const std::string& n, const std::string& v) { c.server.port = parseInt(n, v); }},
        {"server", "log_level", [](AppConfig& c, const std::string&, const std::string& v) { c.server.logLevel = v; }},
        {"server", "max_connections", [](AppConfig& c, const std::string& n, const std::string& v) { c.server.maxConnections = parseInt(n, v); }},
        {"server", "max_message_bytes", [](AppConfig& c, const std::string& n, const std::string& v) { c.server.maxMessageBytes = static_cast<size_t>(parseInt(n, v)); }},
        {"server", "idle_timeout_s", [](AppConfig& c, const std::string& n, const std::string& v) { c.server.idleTimeoutS = parseInt(n, v); }},

        {"video", "width", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.width = parseInt(n, v); }},
        {"video", "height", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.height = parseInt(n, v); }},
        {"video", "fps", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.fps = parseInt(n, v); }},
        {"video", "format", [](AppConfig& c, const std::string&, const std::string& v) { c.video.format = v; }},
        {"video", "quality", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.quality = parseInt(n, v); }},
        {"video", "min_quality", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.minQuality = parseInt(n, v); }},
        {"video", "quality_step", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.qualityStep = parseInt(n, v); }},
        {"video", "max_encoded_bytes", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.maxEncodedBytes = static_cast<size_t>(parseInt(n, v)); }},
        {"video", "downscale_factor", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.downscaleFactor = parseDouble(n, v); }},
        {"video", "max_encode_attempts", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.maxEncodeAttempts = parseInt(n, v); }},
        {"video", "frame_deadline_ms", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.frameDeadlineMs = parseDouble(n, v); }},
        {"video", "frame_budget_ms", [](AppConfig& c, const std::string& n, const std::string& v) { c.video.frameBudgetMs = parseDouble(n, v); }},

        {"gesture_detection", "velocity_threshold", [](AppConfig& c, const std::string& n, const std::string& v) { c.gesture.velocityThreshold = parseDouble(n, v); }},
        {"gesture_detection", "pause_duration_ms", [](AppConfig& c, const std::string& n, const std::string& v) { c.gesture.pauseDurationMs = parseInt(n, v); }},
        {"gesture_detection", "min_gesture_duration_ms", [](AppConfig& c, const std::string& n, const std::string& v) { c.gesture.minGestureDurationMs = parseInt(n, v); }},
        {"gesture_detection", "landmark_buffer_size", [](AppConfig& c, const std::string& n, const std::string& v) { c.gesture.bufferCapacity = parseInt(n, v); }},
        {"gesture_detection", "smoothing_window", [](AppConfig& c, const std::string& n, const std::string& v) { c.gesture.smoothingWindow = parseInt(n, v); }},
        {"gesture_detection", "enabled", [](AppConfig& c, const std::string& n, const std::string& v) { c.gesture.enabled = parseBool(n, v); }},

        {"detector", "backend", [](AppConfig& c, const std::string&, const std::string& v) { c.detector.backend = v; }},
        {"detector", "face_cascade", [](AppConfig& c, const std::string&, const std::string& v) { c.detector.faceCascadePath = v; }},
        {"detector", "detect_pose", [](AppConfig& c, const std::string& n, const std::string& v) { c.detector.detectPose = parseBool(n, v); }},
        {"detector", "min_hand_area_fraction", [](AppConfig& c, const std::string& n, const std::string& v) { c.detector.minHandAreaFraction = parseDouble(n, v); }},
        {"detector", "min_detection_confidence", [](AppConfig& c, const std::string& n, const std::string& v) { c.detector.minDetectionConfidence = parseDouble(n, v); }},
    };
    return table;
}

std::string envName(const Field& f) {
    std::string name = std::string("SIGNSTREAM_") + f.section + "__" + f.key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

template<typename T>
void checkRange(const char* key, T value, T lo, T hi) {
    if (value < lo || value > hi) {
        std::ostringstream ss;
        ss << key << " = " << value << " is outside [" << lo << ", " << hi << "]";
        throw ConfigError(ss.str());
    }
}

} // namespace

void applyYaml(AppConfig& cfg, const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }

    if (!root || root.IsNull()) return;
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    for (const auto& field : fields()) {
        const YAML::Node section = root[field.section];
        if (!section || !section.IsMap()) continue;

        const YAML::Node node = section[field.key];
        if (!node) continue;
        if (!node.IsScalar()) {
            throw ConfigError(std::string(field.section) + "." + field.key + ": expected a scalar");
        }
        field.set(cfg, std::string(field.section) + "." + field.key, node.as<std::string>());
    }
}

void applyYamlFile(AppConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    applyYaml(cfg, buffer.str());
    Logger::info("Loaded configuration from ", path);
}

void applyEnvironment(AppConfig& cfg, const EnvLookup& env) {
    if (!env) return;
    for (const auto& field : fields()) {
        const std::string name = envName(field);
        const char* value = env(name.c_str());
        if (value == nullptr) continue;
        field.set(cfg, name, value);
        Logger::debug("Config override from ", name);
    }
}

void validate(const AppConfig& cfg) {
    checkRange("server.port", cfg.server.port, 1024, 65535);
    checkRange("server.max_connections", cfg.server.maxConnections, 1, 100);
    checkRange("server.idle_timeout_s", cfg.server.idleTimeoutS, 1, 3600);
    checkRange<size_t>("server.max_message_bytes", cfg.server.maxMessageBytes, 1024, 256u * 1024u * 1024u);
    if (!Logger::parseLevel(cfg.server.logLevel)) {
        throw ConfigError("server.log_level: unknown level '" + cfg.server.logLevel + "'");
    }

    checkRange("video.width", cfg.video.width, 320, 1920);
    checkRange("video.height", cfg.video.height, 240, 1080);
    checkRange("video.fps", cfg.video.fps, 10, 60);
    checkRange("video.quality", cfg.video.quality, 30, 100);
    checkRange("video.min_quality", cfg.video.minQuality, 1, cfg.video.quality);
    checkRange("video.quality_step", cfg.video.qualityStep, 1, 50);
    checkRange("video.downscale_factor", cfg.video.downscaleFactor, 0.1, 0.95);
    checkRange("video.max_encode_attempts", cfg.video.maxEncodeAttempts, 1, 20);
    checkRange("video.frame_deadline_ms", cfg.video.frameDeadlineMs, 1.0, 10000.0);
    checkRange("video.frame_budget_ms", cfg.video.frameBudgetMs, 1.0, 1000.0);
    if (cfg.video.format != "MJPG" && cfg.video.format != "YUYV") {
        throw ConfigError("video.format must be MJPG or YUYV, got '" + cfg.video.format + "'");
    }

    checkRange("gesture_detection.velocity_threshold", cfg.gesture.velocityThreshold, 0.001, 0.1);
    checkRange("gesture_detection.pause_duration_ms", cfg.gesture.pauseDurationMs, 500, 3000);
    checkRange("gesture_detection.min_gesture_duration_ms", cfg.gesture.minGestureDurationMs, 200, 2000);
    checkRange("gesture_detection.landmark_buffer_size", cfg.gesture.bufferCapacity, 30, 300);
    checkRange("gesture_detection.smoothing_window", cfg.gesture.smoothingWindow, 3, 15);
    // A pause shorter than the minimum attempt would discard every pause-ended attempt
    if (cfg.gesture.minGestureDurationMs > cfg.gesture.pauseDurationMs) {
        throw ConfigError("gesture_detection.min_gesture_duration_ms (" +
                          std::to_string(cfg.gesture.minGestureDurationMs) +
                          ") must not exceed gesture_detection.pause_duration_ms (" +
                          std::to_string(cfg.gesture.pauseDurationMs) + ")");
    }

    if (cfg.detector.backend != "null" && cfg.detector.backend != "opencv") {
        throw ConfigError("detector.backend: unknown backend '" + cfg.detector.backend + "'");
    }
    checkRange("detector.min_hand_area_fraction", cfg.detector.minHandAreaFraction, 0.0, 1.0);
    checkRange("detector.min_detection_confidence", cfg.detector.minDetectionConfidence, 0.0, 1.0);
}

AppConfig loadConfig(const std::string& path, const EnvLookup& env) {
    AppConfig cfg;
    if (!path.empty()) {
        applyYamlFile(cfg, path);
    }
    applyEnvironment(cfg, env);
    validate(cfg);
    return cfg;
}

} // namespace core
