#include "inference/DetectorFactory.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "inference/NullDetector.hpp"
#include "inference/OpenCvDetector.hpp"

namespace inference {

DetectorFactory makeDetectorFactory(const core::DetectorConfig& config) {
    DetectorFactory factory;

    if (config.backend == "null") {
        factory = [] { return std::make_unique<NullDetector>(); };
    } else if (config.backend == "opencv") {
        factory = [config] { return std::make_unique<OpenCvDetector>(config); };
    } else {
        throw core::ConfigError("unknown detector backend: " + config.backend);
    }

    auto probe = factory();
    core::Logger::info("Landmark detector backend: ", probe->name());
    return factory;
}

} // namespace inference
