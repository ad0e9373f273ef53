#include <healthstream/core/storage/persistence_manager.hpp>
#include <healthstream/core/metrics/statistics.hpp>
#include <healthstream/core/storage/memory_backend.hpp>
#include <healthstream/core/storage/sqlite_backend.hpp>
#include <exception>
#include <utility>
#include <spdlog/spdlog.h>

namespace HealthStream {

PersistenceManager::PersistenceManager(std::unique_ptr<StorageBackend> backend,
                                       PersistenceConfig config, TimeSource now)
    : config_(std::move(config)),
      now_(now ? std::move(now) : TimeSource(&WindowKey::systemNow)),
      backend_(std::move(backend)),
      backup_(config_.backup, now_) {
    if (!backend_) {
        spdlog::info("[PersistenceManager] Persistence disabled");
        return;
    }

    raw_queue_ = std::make_unique<BatchQueue<RawMetricPoint>>(
        "RawMetricQueue", config_.flush_interval, config_.batch_size,
        [this](std::vector<RawMetricPoint>& batch) { writeRawBatch(batch); });
    raw_queue_->start();

    spdlog::info("[PersistenceManager] Using {} (backup: {})", backend_->name(),
                 config_.backup.enabled ? config_.backup.backup_dir : std::string("off"));
}

PersistenceManager::~PersistenceManager() noexcept {
    close();
}

std::unique_ptr<PersistenceManager> PersistenceManager::create(const PersistenceConfig& config) {
    if (!config.enabled) {
        return std::make_unique<PersistenceManager>(nullptr, config);
    }

    std::unique_ptr<StorageBackend> backend;
    if (config.db_path.empty()) {
        backend = std::make_unique<MemoryBackend>();
    } else {
        try {
            SqliteConfig sqlite;
            sqlite.db_path = config.db_path;
            sqlite.flush_interval = config.flush_interval;
            sqlite.batch_size = config.batch_size;
            backend = std::make_unique<SqliteBackend>(sqlite);
        } catch (const std::exception& e) {
            spdlog::warn("[PersistenceManager] Storage unavailable, continuing without persistence: {}",
                         e.what());
        }
    }
    return std::make_unique<PersistenceManager>(std::move(backend), config);
}

void PersistenceManager::writeRawBatch(std::vector<RawMetricPoint>& batch) {
    auto entries = Statistics::aggregatePoints(batch, config_.window);
    if (entries.empty()) return;
    backend_->writeAggregated(entries);
}

void PersistenceManager::persistMetric(const std::string& component, const std::string& name,
                                       double value, MetricKind kind) {
    if (!raw_queue_ || isClosed()) return;

    RawMetricPoint point;
    point.timestamp = now_();
    point.component = component.empty() ? std::string(GLOBAL_COMPONENT) : component;
    point.name = name;
    point.value = kind == MetricKind::COUNTER ? 1.0 : value;
    point.kind = kind;
    raw_queue_->enqueue(std::move(point));
}

void PersistenceManager::persistMetrics(std::vector<RawMetricPoint> points) {
    if (!raw_queue_ || isClosed() || points.empty()) return;
    raw_queue_->enqueue(std::move(points));
}

void PersistenceManager::persistAggregated(const std::vector<AggregatedEntry>& entries) {
    if (!backend_ || isClosed() || entries.empty()) return;
    backend_->writeAggregated(entries);
}

void PersistenceManager::ensureReadable() const {
    if (!backend_) {
        throw StorageError(StorageErrc::NOT_ENABLED, "no storage backend configured");
    }
    if (isClosed()) {
        throw StorageError(StorageErrc::CLOSED, "persistence manager is closed");
    }
}

std::vector<AggregatedEntry> PersistenceManager::readMetrics(const std::string& component,
                                                             SystemClock::time_point start,
                                                             SystemClock::time_point end) {
    ensureReadable();
    try {
        return backend_->readMetrics(component, start, end);
    } catch (const std::exception& e) {
        throw StorageError(StorageErrc::QUERY_FAILED, e.what());
    }
}

std::vector<std::string> PersistenceManager::listComponents() {
    ensureReadable();
    try {
        return backend_->listComponents();
    } catch (const std::exception& e) {
        throw StorageError(StorageErrc::QUERY_FAILED, e.what());
    }
}

void PersistenceManager::forceFlush() {
    if (!backend_ || isClosed()) return;
    raw_queue_->forceFlush();
    backend_->flush();
}

std::string PersistenceManager::createBackup() {
    if (!backend_ || !backup_.isEnabled() || isClosed()) {
        return {};
    }
    auto* sqlite = dynamic_cast<SqliteBackend*>(backend_.get());
    if (!sqlite) {
        spdlog::debug("[PersistenceManager] {} has nothing to back up", backend_->name());
        return {};
    }

    forceFlush();
    return backup_.createBackup(*sqlite);
}

void PersistenceManager::ensureBackupEnabled() const {
    if (!backup_.isEnabled()) {
        throw StorageError(StorageErrc::BACKUP_DISABLED, "set backup.enabled to use backups");
    }
}

std::vector<std::string> PersistenceManager::listBackups() const {
    ensureBackupEnabled();
    return backup_.listBackups();
}

void PersistenceManager::restoreFromBackup(const std::string& name,
                                           const std::string& target_path) const {
    ensureBackupEnabled();
    backup_.restore(name, target_path);
}

std::string PersistenceManager::findBackupForDate(const std::string& date) const {
    ensureBackupEnabled();
    return backup_.findBackupForDate(date);
}

void PersistenceManager::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (!backend_) {
        return;
    }

    // Final raw flush runs inside stop()
    raw_queue_->stop();

    try {
        backend_->flush();
    } catch (const std::exception& e) {
        spdlog::error("[PersistenceManager] Final flush failed: {}", e.what());
    }

    if (backup_.isEnabled()) {
        if (auto* sqlite = dynamic_cast<SqliteBackend*>(backend_.get())) {
            try {
                backup_.createBackup(*sqlite);
            } catch (const std::exception& e) {
                spdlog::error("[PersistenceManager] Shutdown backup failed: {}", e.what());
            }
        }
    }

    try {
        backend_->close();
    } catch (const std::exception& e) {
        spdlog::error("[PersistenceManager] Closing {} failed: {}", backend_->name(), e.what());
    }
    spdlog::info("[PersistenceManager] Closed");
}

} // namespace HealthStream
