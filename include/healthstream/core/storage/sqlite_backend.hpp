#pragma once

#include <healthstream/core/pipeline/batch_queue.hpp>
#include <healthstream/core/storage/storage_backend.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace HealthStream {

struct SqliteConfig {
    std::string db_path = ":memory:";
    std::chrono::milliseconds flush_interval{60000};
    size_t batch_size = 100;
};

/**
 * @class SqliteBackend
 * @brief Durable backend on a single-file embedded SQLite database
 *
 * - One connection, guarded by db_mutex_; SQLite serialises writers anyway
 * - Schema migrations run on construction
 * - writeAggregated() goes through an internal BatchQueue, one transaction
 *   per batch; a window written twice is merged into the stored row
 * - Reads are one indexed range query per call
 *
 * Construction failure (bad path, unwritable directory, failed migration)
 * throws StorageError(BACKEND_UNAVAILABLE).
 */
class SqliteBackend : public StorageBackend {
public:
    explicit SqliteBackend(const SqliteConfig& config);
    ~SqliteBackend() noexcept override;

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    void writeAggregated(const std::vector<AggregatedEntry>& entries) override;
    std::vector<AggregatedEntry> readMetrics(const std::string& component,
                                             SystemClock::time_point start,
                                             SystemClock::time_point end) override;
    std::vector<std::string> listComponents() override;
    void close() override;
    const char* name() const override { return "SqliteBackend"; }

    // Drains the internal write queue; errors propagate
    void flush() override;

    // Consistent snapshot of the live database into target (must not exist)
    void vacuumInto(const std::string& target);

    int schemaVersion();
    size_t queuedEntries() const;
    const std::string& path() const { return config_.db_path; }
    bool isClosed() const { return closed_.load(std::memory_order_acquire); }

private:
    void writeBatch(std::vector<AggregatedEntry>& batch);
    void ensureOpen() const;
    void closeConnection() noexcept;

    SqliteConfig config_;
    mutable std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* upsert_stmt_ = nullptr;
    std::unique_ptr<BatchQueue<AggregatedEntry>> queue_;
    std::atomic<bool> closed_{false};
};

} // namespace HealthStream
