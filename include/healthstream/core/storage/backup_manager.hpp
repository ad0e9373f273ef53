#pragma once

#include <healthstream/core/metrics/window_key.hpp>
#include <healthstream/core/storage/storage_config.hpp>
#include <optional>
#include <string>
#include <vector>

namespace HealthStream {

class SqliteBackend;

struct BackupInfo {
    bool enabled = false;
    std::string backup_dir;
    int retention_days = 0;
};

/**
 * @class BackupManager
 * @brief Dated snapshots of the SQLite store plus retention
 *
 * Artifacts are named health_YYYYMMDD.db (UTC date). A snapshot is written to
 * a .tmp sibling first and renamed into place, so a reader never sees a
 * partial file and a second backup on the same day replaces the first.
 * Nothing here is scheduled; callers decide when to back up.
 */
class BackupManager {
public:
    static constexpr const char* FILE_PREFIX = "health_";
    static constexpr const char* FILE_SUFFIX = ".db";

    explicit BackupManager(BackupConfig config, TimeSource now = &WindowKey::systemNow);

    /**
     * @brief Snapshot the live database, then apply retention
     * @return Path of the artifact, empty when backups are disabled
     * @throws StorageError(BACKUP_FAILED)
     */
    std::string createBackup(SqliteBackend& backend);

    // Remove artifacts older than today - retention_days; returns the count removed
    size_t cleanup();

    // Artifact names, oldest first
    std::vector<std::string> listBackups() const;

    /**
     * @brief Copy an artifact over target_path
     * @throws StorageError(BACKUP_NOT_FOUND) if name does not exist
     * @throws StorageError(RESTORE_FAILED) if the copy fails
     */
    void restore(const std::string& name, const std::string& target_path) const;

    // @throws StorageError(BACKUP_NOT_FOUND)
    std::string findBackupForDate(const std::string& date) const;

    BackupInfo info() const;
    bool isEnabled() const { return config_.enabled; }

    static std::string fileNameForDate(const std::string& date);

    // YYYYMMDD embedded in an artifact name, nullopt for anything else
    static std::optional<std::string> parseFileDate(const std::string& name);

private:
    BackupConfig config_;
    TimeSource now_;
};

} // namespace HealthStream
