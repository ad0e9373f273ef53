#pragma once

#include <healthstream/core/metrics/metric_types.hpp>
#include <chrono>
#include <vector>

namespace HealthStream {

/**
 * @brief min/max/avg/count reduction shared by the flush path and query-side
 * re-aggregation. All operations are order-insensitive.
 *
 * NaN samples are counted and poison avg, but min/max only look at the
 * other samples.
 */
class Statistics {
public:
    static MetricStats reduce(const std::vector<double>& values);

    // True iff non-empty and every value is exactly 1.0
    static bool isCounterSeries(const std::vector<double>& values);

    // Count-weighted combination of two reductions
    static MetricStats merge(const MetricStats& a, const MetricStats& b);

    static MetricSummary summarize(const std::vector<double>& values);

    /**
     * @brief Group raw points by (component, name, window of timestamp) and reduce
     * @return Entries sorted by window key, then component, then metric
     */
    static std::vector<AggregatedEntry> aggregatePoints(const std::vector<RawMetricPoint>& points,
                                                        std::chrono::seconds window);

    // Reduce every sequence of a moved-out table
    static std::vector<AggregatedEntry> aggregateTable(const CollectionTable& table);

    // Re-aggregate stored entries into coarser per-(component, metric) totals
    static std::vector<AggregatedEntry> rollup(const std::vector<AggregatedEntry>& entries);
};

} // namespace HealthStream
