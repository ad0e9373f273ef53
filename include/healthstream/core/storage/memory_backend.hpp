#pragma once

#include <healthstream/core/storage/storage_backend.hpp>
#include <atomic>
#include <map>
#include <shared_mutex>
#include <tuple>
#include <vector>

namespace HealthStream {

/**
 * @brief In-memory backend for tests and zero-dependency deployments
 *
 * Rows are keyed by (window, component, metric). A second write for the same
 * key is merged into the stored row with Statistics::merge, as the SQLite
 * upsert does. close() discards all data; any later call throws
 * StorageErrc::CLOSED.
 */
class MemoryBackend : public StorageBackend {
public:
    MemoryBackend() = default;
    ~MemoryBackend() override = default;

    void writeAggregated(const std::vector<AggregatedEntry>& entries) override;
    std::vector<AggregatedEntry> readMetrics(const std::string& component,
                                             SystemClock::time_point start,
                                             SystemClock::time_point end) override;
    std::vector<std::string> listComponents() override;
    void close() override;
    const char* name() const override { return "MemoryBackend"; }

    // Number of distinct (window, component, metric) rows
    size_t size() const;
    void clear();

private:
    void ensureOpen() const;

    using RowKey = std::tuple<std::string, std::string, std::string>;

    mutable std::shared_mutex mtx_;
    std::map<RowKey, AggregatedEntry> storage_;
    std::atomic<bool> closed_{false};
};

} // namespace HealthStream
