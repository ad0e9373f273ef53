#pragma once

#include <healthstream/core/metrics/metric_types.hpp>
#include <healthstream/core/storage/storage_error.hpp>
#include <string>
#include <vector>

namespace HealthStream {

/**
 * @class StorageBackend
 * @brief Uniform CRUD contract for persisted statistics
 *
 * Backends only store what they are given. Aggregation happens once,
 * upstream, so raw points are refused.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual void writeAggregated(const std::vector<AggregatedEntry>& entries) = 0;

    /**
     * @brief Read stored entries for a window-key range
     * @param component Component filter; empty means all components
     * @param start Inclusive lower bound (second precision)
     * @param end Inclusive upper bound (second precision)
     * @return Entries sorted by window key
     */
    virtual std::vector<AggregatedEntry> readMetrics(const std::string& component,
                                                     SystemClock::time_point start,
                                                     SystemClock::time_point end) = 0;

    // Sorted, unique
    virtual std::vector<std::string> listComponents() = 0;

    // Idempotent
    virtual void close() = 0;

    virtual const char* name() const = 0;

    // Drain any internal write queue
    virtual void flush() {}

    virtual void writeRaw(const std::vector<RawMetricPoint>& points) {
        if (points.empty()) return;
        throw StorageError(StorageErrc::RAW_WRITE_REJECTED,
                           std::string(name()) + " accepts aggregated statistics only");
    }
};

} // namespace HealthStream
