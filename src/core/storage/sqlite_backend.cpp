#include <healthstream/core/storage/sqlite_backend.hpp>
#include <healthstream/core/storage/migrations.hpp>
#include <sqlite3.h>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace HealthStream {

namespace {

constexpr const char* UPSERT_SQL = R"(
    INSERT INTO time_series_metrics
        (time_window_key, component, metric, min_value, max_value, avg_value, count)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    ON CONFLICT(time_window_key, component, metric) DO UPDATE SET
        min_value = MIN(min_value, excluded.min_value),
        max_value = MAX(max_value, excluded.max_value),
        avg_value = (avg_value * count + excluded.avg_value * excluded.count) /
                    (count + excluded.count),
        count = count + excluded.count
)";

constexpr const char* SELECT_ALL_SQL = R"(
    SELECT time_window_key, component, metric, min_value, max_value, avg_value, count
    FROM time_series_metrics
    WHERE time_window_key >= ?1 AND time_window_key <= ?2
    ORDER BY time_window_key ASC, component ASC, metric ASC
)";

constexpr const char* SELECT_COMPONENT_SQL = R"(
    SELECT time_window_key, component, metric, min_value, max_value, avg_value, count
    FROM time_series_metrics
    WHERE component = ?3 AND time_window_key >= ?1 AND time_window_key <= ?2
    ORDER BY time_window_key ASC, metric ASC
)";

// RAII for statements prepared per call
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() { sqlite3_finalize(stmt); }
};

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

void execOrThrow(sqlite3* db, const char* sql, StorageErrc code) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw StorageError(code, msg);
    }
}

} // namespace

SqliteBackend::SqliteBackend(const SqliteConfig& config) : config_(config) {
    if (config_.db_path.empty()) {
        throw StorageError(StorageErrc::BACKEND_UNAVAILABLE, "empty database path");
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(config_.db_path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        closeConnection();
        spdlog::error("[SqliteBackend] Failed to open {}: {}", config_.db_path, msg);
        throw StorageError(StorageErrc::BACKEND_UNAVAILABLE,
                           "failed to open database " + config_.db_path + ": " + msg);
    }

    try {
        sqlite3_busy_timeout(db_, 5000);
        if (config_.db_path != ":memory:") {
            execOrThrow(db_, "PRAGMA journal_mode=WAL;", StorageErrc::BACKEND_UNAVAILABLE);
            execOrThrow(db_, "PRAGMA synchronous=NORMAL;", StorageErrc::BACKEND_UNAVAILABLE);
        }
        MigrationRunner::run(db_);

        rc = sqlite3_prepare_v2(db_, UPSERT_SQL, -1, &upsert_stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw StorageError(StorageErrc::BACKEND_UNAVAILABLE,
                               std::string("failed to prepare insert statement: ") + sqlite3_errmsg(db_));
        }
    } catch (const StorageError& e) {
        spdlog::error("[SqliteBackend] Initialization of {} failed: {}", config_.db_path, e.what());
        closeConnection();
        throw StorageError(StorageErrc::BACKEND_UNAVAILABLE, e.what());
    }

    queue_ = std::make_unique<BatchQueue<AggregatedEntry>>(
        "SqliteWriteQueue", config_.flush_interval, config_.batch_size,
        [this](std::vector<AggregatedEntry>& batch) { writeBatch(batch); });
    queue_->start();

    spdlog::info("[SqliteBackend] Opened {} (schema v{}, flush: {}ms, batch: {})",
                 config_.db_path, MigrationRunner::latestVersion(),
                 queue_->interval().count(), queue_->batchSize());
}

SqliteBackend::~SqliteBackend() noexcept {
    close();
}

void SqliteBackend::ensureOpen() const {
    if (closed_.load(std::memory_order_acquire)) {
        throw StorageError(StorageErrc::CLOSED, "SqliteBackend " + config_.db_path + " is closed");
    }
}

void SqliteBackend::writeAggregated(const std::vector<AggregatedEntry>& entries) {
    ensureOpen();
    if (entries.empty()) return;
    queue_->enqueue(entries);
}

void SqliteBackend::flush() {
    ensureOpen();
    queue_->forceFlush();
}

void SqliteBackend::writeBatch(std::vector<AggregatedEntry>& batch) {
    if (batch.empty()) return;

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_ || !upsert_stmt_) {
        throw StorageError(StorageErrc::CLOSED, "database connection is closed");
    }

    execOrThrow(db_, "BEGIN IMMEDIATE", StorageErrc::WRITE_FAILED);

    for (const auto& e : batch) {
        sqlite3_reset(upsert_stmt_);
        sqlite3_clear_bindings(upsert_stmt_);
        sqlite3_bind_text(upsert_stmt_, 1, e.time_window_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(upsert_stmt_, 2, e.component.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(upsert_stmt_, 3, e.metric.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(upsert_stmt_, 4, e.min);
        sqlite3_bind_double(upsert_stmt_, 5, e.max);
        sqlite3_bind_double(upsert_stmt_, 6, e.avg);
        sqlite3_bind_int64(upsert_stmt_, 7, static_cast<sqlite3_int64>(e.count));

        int rc = sqlite3_step(upsert_stmt_);
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_reset(upsert_stmt_);
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            spdlog::error("[SqliteBackend] Insert failed, rolled back {} entries: {}", batch.size(), msg);
            throw StorageError(StorageErrc::WRITE_FAILED, msg);
        }
    }
    sqlite3_reset(upsert_stmt_);

    try {
        execOrThrow(db_, "COMMIT", StorageErrc::WRITE_FAILED);
    } catch (const StorageError&) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
    spdlog::debug("[SqliteBackend] Committed {} entries", batch.size());
}

std::vector<AggregatedEntry> SqliteBackend::readMetrics(const std::string& component,
                                                        SystemClock::time_point start,
                                                        SystemClock::time_point end) {
    ensureOpen();
    const std::string startKey = WindowKey::fromTimeExact(start);
    const std::string endKey = WindowKey::fromTimeExact(end);

    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement q;
    const char* sql = component.empty() ? SELECT_ALL_SQL : SELECT_COMPONENT_SQL;
    if (sqlite3_prepare_v2(db_, sql, -1, &q.stmt, nullptr) != SQLITE_OK) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           std::string("failed to query metrics: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(q.stmt, 1, startKey.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(q.stmt, 2, endKey.c_str(), -1, SQLITE_TRANSIENT);
    if (!component.empty()) {
        sqlite3_bind_text(q.stmt, 3, component.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<AggregatedEntry> result;
    int rc;
    while ((rc = sqlite3_step(q.stmt)) == SQLITE_ROW) {
        AggregatedEntry e;
        e.time_window_key = columnText(q.stmt, 0);
        e.component = columnText(q.stmt, 1);
        e.metric = columnText(q.stmt, 2);
        e.min = sqlite3_column_double(q.stmt, 3);
        e.max = sqlite3_column_double(q.stmt, 4);
        e.avg = sqlite3_column_double(q.stmt, 5);
        e.count = static_cast<uint64_t>(sqlite3_column_int64(q.stmt, 6));
        result.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           std::string("error iterating rows: ") + sqlite3_errmsg(db_));
    }
    return result;
}

std::vector<std::string> SqliteBackend::listComponents() {
    ensureOpen();

    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement q;
    if (sqlite3_prepare_v2(db_, "SELECT DISTINCT component FROM time_series_metrics ORDER BY component",
                           -1, &q.stmt, nullptr) != SQLITE_OK) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           std::string("failed to query components: ") + sqlite3_errmsg(db_));
    }

    std::vector<std::string> components;
    int rc;
    while ((rc = sqlite3_step(q.stmt)) == SQLITE_ROW) {
        components.push_back(columnText(q.stmt, 0));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           std::string("error iterating rows: ") + sqlite3_errmsg(db_));
    }
    return components;
}

void SqliteBackend::vacuumInto(const std::string& target) {
    ensureOpen();

    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement q;
    if (sqlite3_prepare_v2(db_, "VACUUM INTO ?1", -1, &q.stmt, nullptr) != SQLITE_OK) {
        throw StorageError(StorageErrc::BACKUP_FAILED, sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(q.stmt, 1, target.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(q.stmt) != SQLITE_DONE) {
        throw StorageError(StorageErrc::BACKUP_FAILED,
                           "VACUUM INTO " + target + " failed: " + sqlite3_errmsg(db_));
    }
}

int SqliteBackend::schemaVersion() {
    ensureOpen();
    std::lock_guard<std::mutex> lock(db_mutex_);
    return MigrationRunner::currentVersion(db_);
}

size_t SqliteBackend::queuedEntries() const {
    return queue_ ? queue_->size() : 0;
}

void SqliteBackend::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // Final flush happens inside stop(); failures are logged there
    if (queue_) {
        queue_->stop();
    }
    closeConnection();
    spdlog::info("[SqliteBackend] Closed {}", config_.db_path);
}

void SqliteBackend::closeConnection() noexcept {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (upsert_stmt_) {
        sqlite3_finalize(upsert_stmt_);
        upsert_stmt_ = nullptr;
    }
    if (db_) {
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            spdlog::warn("[SqliteBackend] sqlite3_close returned {}", sqlite3_errstr(rc));
        }
        db_ = nullptr;
    }
}

} // namespace HealthStream
