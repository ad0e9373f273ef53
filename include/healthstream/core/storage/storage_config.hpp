#pragma once

#include <healthstream/core/metrics/window_key.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace HealthStream {

struct BackupConfig {
    bool enabled = false;
    std::string backup_dir = "./backups";
    int retention_days = 30;
};

struct PersistenceConfig {
    bool enabled = false;
    std::string db_path = "/tmp/health.db";     // empty selects the in-memory backend
    std::chrono::milliseconds flush_interval{60000};
    size_t batch_size = 100;
    std::chrono::seconds window = WindowKey::DEFAULT_WINDOW;  // raw-point aggregation
    BackupConfig backup;
};

} // namespace HealthStream
