#pragma once

#include "core/Config.hpp"
#include "inference/LandmarkDetector.hpp"

#include <functional>
#include <memory>

namespace inference {

// Builds one detector per connection
using DetectorFactory = std::function<std::unique_ptr<LandmarkDetector>()>;

/**
 * Factory for the backend named in config.backend ("null" or "opencv").
 * Constructs one detector up front so that a broken backend fails at
 * startup instead of on the first connection.
 * @throws core::ConfigError for an unknown backend, DetectorError if it cannot be built
 */
DetectorFactory makeDetectorFactory(const core::DetectorConfig& config);

} // namespace inference
