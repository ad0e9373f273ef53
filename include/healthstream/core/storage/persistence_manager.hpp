#pragma once

#include <healthstream/core/metrics/metric_types.hpp>
#include <healthstream/core/pipeline/batch_queue.hpp>
#include <healthstream/core/storage/backup_manager.hpp>
#include <healthstream/core/storage/storage_backend.hpp>
#include <healthstream/core/storage/storage_config.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace HealthStream {

/**
 * @class PersistenceManager
 * @brief Owns the storage backend and everything between it and the caller
 *
 * A manager without a backend is "disabled": writes are silently ignored and
 * reads throw StorageError(NOT_ENABLED). A process whose database cannot be
 * opened keeps collecting in memory instead of failing.
 *
 * Raw points go through a BatchQueue whose sink aggregates them per window
 * before the backend sees them. Already-aggregated entries (from FlushQueue)
 * are written directly.
 */
class PersistenceManager {
public:
    PersistenceManager(std::unique_ptr<StorageBackend> backend, PersistenceConfig config,
                       TimeSource now = &WindowKey::systemNow);
    ~PersistenceManager() noexcept;

    PersistenceManager(const PersistenceManager&) = delete;
    PersistenceManager& operator=(const PersistenceManager&) = delete;

    /**
     * @brief Build a manager from configuration
     *
     * Disabled when config.enabled is false, in-memory when db_path is empty,
     * SQLite otherwise. Never throws on backend failure; logs and disables.
     */
    static std::unique_ptr<PersistenceManager> create(const PersistenceConfig& config);

    void persistMetric(const std::string& component, const std::string& name,
                       double value, MetricKind kind);
    void persistMetrics(std::vector<RawMetricPoint> points);
    void persistAggregated(const std::vector<AggregatedEntry>& entries);

    std::vector<AggregatedEntry> readMetrics(const std::string& component,
                                             SystemClock::time_point start,
                                             SystemClock::time_point end);
    std::vector<std::string> listComponents();

    // Raw queue, then backend queue; errors propagate
    void forceFlush();

    // Flushes, then snapshots; empty result when backups do not apply
    std::string createBackup();
    std::vector<std::string> listBackups() const;
    void restoreFromBackup(const std::string& name, const std::string& target_path) const;
    std::string findBackupForDate(const std::string& date) const;
    BackupInfo backupInfo() const { return backup_.info(); }

    /**
     * @brief Final flush, best-effort backup, backend close
     *
     * Idempotent. Never throws; failures are logged.
     */
    void close();

    bool isEnabled() const { return backend_ != nullptr; }
    bool isClosed() const { return closed_.load(std::memory_order_acquire); }
    StorageBackend* backend() const { return backend_.get(); }
    size_t queuedPoints() const { return raw_queue_ ? raw_queue_->size() : 0; }

private:
    void writeRawBatch(std::vector<RawMetricPoint>& batch);
    void ensureReadable() const;
    void ensureBackupEnabled() const;

    PersistenceConfig config_;
    TimeSource now_;
    std::unique_ptr<StorageBackend> backend_;
    BackupManager backup_;
    std::unique_ptr<BatchQueue<RawMetricPoint>> raw_queue_;
    std::atomic<bool> closed_{false};
};

} // namespace HealthStream
