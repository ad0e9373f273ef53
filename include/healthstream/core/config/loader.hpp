#pragma once

#include <healthstream/core/config/app_config.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace HealthStream {

class ConfigLoader {
public:
    // Throws std::runtime_error if the file is missing or not valid YAML
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    // HEALTH_* environment variables override file values
    static void applyEnvironment(AppConfig::AppConfiguration& config);

    // "500ms", "60s", "5m", "1h"
    static std::optional<std::chrono::milliseconds> parseDuration(const std::string& text);
};

} // namespace HealthStream
