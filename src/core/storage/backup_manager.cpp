#include <healthstream/core/storage/backup_manager.hpp>
#include <healthstream/core/storage/sqlite_backend.hpp>
#include <healthstream/core/storage/storage_error.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace HealthStream {

namespace {

constexpr size_t DATE_LENGTH = 8;
constexpr int64_t SECONDS_PER_DAY = 86400;

bool isValidDate(const std::string& date) {
    if (date.size() != DATE_LENGTH) return false;
    if (!std::all_of(date.begin(), date.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    // Round-trip through a key rejects 20240231 and friends
    return WindowKey::isValid(date + "000000");
}

} // namespace

BackupManager::BackupManager(BackupConfig config, TimeSource now)
    : config_(std::move(config)),
      now_(now ? std::move(now) : TimeSource(&WindowKey::systemNow)) {
    if (config_.retention_days < 0) {
        config_.retention_days = 0;
    }
}

std::string BackupManager::fileNameForDate(const std::string& date) {
    return std::string(FILE_PREFIX) + date + FILE_SUFFIX;
}

std::optional<std::string> BackupManager::parseFileDate(const std::string& name) {
    const std::string prefix(FILE_PREFIX);
    const std::string suffix(FILE_SUFFIX);
    if (name.size() != prefix.size() + DATE_LENGTH + suffix.size()) return std::nullopt;
    if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    std::string date = name.substr(prefix.size(), DATE_LENGTH);
    if (!isValidDate(date)) return std::nullopt;
    return date;
}

std::string BackupManager::createBackup(SqliteBackend& backend) {
    if (!config_.enabled) {
        return {};
    }

    const fs::path dir(config_.backup_dir);
    const fs::path target = dir / fileNameForDate(WindowKey::dateStamp(now_()));
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError(StorageErrc::BACKUP_FAILED,
                           "cannot create backup directory " + dir.string() + ": " + ec.message());
    }

    // Leftover from an interrupted run; VACUUM INTO refuses existing files
    fs::remove(tmp, ec);

    try {
        backend.vacuumInto(tmp.string());
    } catch (const StorageError& e) {
        fs::remove(tmp, ec);
        spdlog::error("[BackupManager] Snapshot failed: {}", e.what());
        throw StorageError(StorageErrc::BACKUP_FAILED, e.what());
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        throw StorageError(StorageErrc::BACKUP_FAILED,
                           "cannot move snapshot into " + target.string() + ": " + ec.message());
    }
    spdlog::info("[BackupManager] Backup written to {}", target.string());

    size_t removed = cleanup();
    if (removed > 0) {
        spdlog::info("[BackupManager] Retention removed {} old backup(s)", removed);
    }
    return target.string();
}

size_t BackupManager::cleanup() {
    const fs::path dir(config_.backup_dir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    const auto now = now_();
    const std::string today = WindowKey::dateStamp(now);

    // Whole days in time_t seconds; a retention reaching back past the epoch keeps everything
    const int64_t nowSeconds = static_cast<int64_t>(SystemClock::to_time_t(now));
    const int64_t retention = config_.retention_days;
    if (retention > nowSeconds / SECONDS_PER_DAY) {
        return 0;
    }
    const std::string cutoffDate = WindowKey::dateStamp(
        SystemClock::from_time_t(static_cast<std::time_t>(nowSeconds - retention * SECONDS_PER_DAY)));

    size_t removed = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;

        auto date = parseFileDate(it->path().filename().string());
        // Cutoff day is expired; today's artifact always survives
        if (!date || *date > cutoffDate || *date == today) continue;

        std::error_code rm_ec;
        if (fs::remove(it->path(), rm_ec)) {
            ++removed;
            spdlog::debug("[BackupManager] Removed expired backup {}", it->path().filename().string());
        } else if (rm_ec) {
            spdlog::warn("[BackupManager] Cannot remove {}: {}", it->path().string(), rm_ec.message());
        }
    }
    if (ec) {
        throw StorageError(StorageErrc::BACKUP_FAILED,
                           "cannot read backup directory " + dir.string() + ": " + ec.message());
    }
    return removed;
}

std::vector<std::string> BackupManager::listBackups() const {
    std::vector<std::string> names;
    const fs::path dir(config_.backup_dir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return names;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (parseFileDate(name)) {
            names.push_back(std::move(name));
        }
    }
    if (ec) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           "cannot read backup directory " + dir.string() + ": " + ec.message());
    }

    // Fixed-width dates, so name order is chronological
    std::sort(names.begin(), names.end());
    return names;
}

void BackupManager::restore(const std::string& name, const std::string& target_path) const {
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw StorageError(StorageErrc::BACKUP_NOT_FOUND, "invalid backup name '" + name + "'");
    }

    const fs::path source = fs::path(config_.backup_dir) / name;
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw StorageError(StorageErrc::BACKUP_NOT_FOUND, source.string());
    }

    const fs::path target(target_path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw StorageError(StorageErrc::RESTORE_FAILED,
                               "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    if (!fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec) || ec) {
        throw StorageError(StorageErrc::RESTORE_FAILED,
                           "cannot copy " + source.string() + " to " + target.string() + ": " +
                           (ec ? ec.message() : std::string("copy skipped")));
    }
    spdlog::info("[BackupManager] Restored {} to {}", name, target.string());
}

std::string BackupManager::findBackupForDate(const std::string& date) const {
    if (!isValidDate(date)) {
        throw StorageError(StorageErrc::BACKUP_NOT_FOUND, "invalid date '" + date + "'");
    }

    std::string name = fileNameForDate(date);
    std::error_code ec;
    if (!fs::is_regular_file(fs::path(config_.backup_dir) / name, ec)) {
        throw StorageError(StorageErrc::BACKUP_NOT_FOUND, "no backup for " + date);
    }
    return name;
}

BackupInfo BackupManager::info() const {
    return BackupInfo{config_.enabled, config_.backup_dir, config_.retention_days};
}

} // namespace HealthStream
