#pragma once

#include <healthstream/core/storage/storage_config.hpp>
#include <string>

namespace HealthStream {
namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

/**
 * persistence.window and persistence.backup are not read from the
 * persistence block; HealthState fills them from sample_rate_seconds and
 * the top-level backup block.
 */
struct AppConfiguration {
    std::string app_name = "HealthStream";
    std::string version = "1.0.0";
    std::string identity;
    int sample_rate_seconds = 60;
    PersistenceConfig persistence;
    BackupConfig backup;
    LoggingConfig logging;
};

} // namespace AppConfig
} // namespace HealthStream
