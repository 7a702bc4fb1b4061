#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/SessionSummarySink.hpp"
#include "core/Types.hpp"
#include "inference/DetectorFactory.hpp"
#include "net/WebSocketServer.hpp"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <thread>
#include <chrono>
#include <string>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

// --config <path> wins over SIGNSTREAM_CONFIG
std::string configPath(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            return argv[i + 1];
        }
        const std::string arg = argv[i];
        const std::string prefix = "--config=";
        if (arg.rfind(prefix, 0) == 0) {
            return arg.substr(prefix.size());
        }
    }
    const char* env = std::getenv("SIGNSTREAM_CONFIG");
    return env ? std::string(env) : std::string();
}

net::WebSocketServer::Config serverConfig(const core::AppConfig& app) {
    net::WebSocketServer::Config config;
    config.host = app.server.host;
    config.port = app.server.port;
    config.maxConnections = app.server.maxConnections;
    config.maxMessageBytes = app.server.maxMessageBytes;
    config.session.video = app.video;
    config.session.gesture = app.gesture;
    config.session.idleTimeout = std::chrono::seconds(app.server.idleTimeoutS);
    return config;
}

} // namespace

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    core::Logger::info("Starting ", core::SERVER_NAME, " ", core::SERVER_VERSION, "...");

    core::AppConfig appConfig;
    try {
        appConfig = core::loadConfig(configPath(argc, argv), [](const char* name) { return std::getenv(name); });
    } catch (const core::ConfigError& e) {
        core::Logger::error("Invalid configuration: ", e.what());
        return 1;
    }

    if (auto level = core::Logger::parseLevel(appConfig.server.logLevel)) {
        core::Logger::setLevel(*level);
    }
    core::Logger::info("Video: ", appConfig.video.width, "x", appConfig.video.height, " @ ", appConfig.video.fps,
                       " fps, JPEG quality ", appConfig.video.quality);

    // Outer Loop for auto-restart
    while (g_running) {
        try {
            // 1. Landmark backend, probed once up front
            auto detectorFactory = inference::makeDetectorFactory(appConfig.detector);
            auto summarySink = std::make_shared<core::LoggingSummarySink>();

            // 2. WebSocket endpoint
            net::WebSocketServer server(serverConfig(appConfig), detectorFactory, summarySink);
            server.start();

            core::Logger::info("Service running. Press Ctrl+C to exit.");

            // Main loop (Orchestrator)
            while (g_running) {
                if (!server.isRunning()) {
                    core::Logger::warn("WebSocketServer stopped unexpectedly. Restarting service...");
                    break;
                }
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }

            core::Logger::info("Stopping modules...");
            server.stop();

            if (!g_running) {
                break; // Exit outer loop if user requested shutdown
            }

            core::Logger::info("Restarting in 5 seconds...");
            std::this_thread::sleep_for(std::chrono::seconds(5));

        } catch (const core::ConfigError& e) {
            core::Logger::error("Invalid configuration: ", e.what());
            return 1;
        } catch (const std::exception& e) {
            core::Logger::error("Fatal error in service loop: ", e.what());
            if (g_running) {
                core::Logger::info("Retrying in 5 seconds...");
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
