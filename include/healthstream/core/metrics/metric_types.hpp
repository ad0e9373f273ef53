#pragma once

#include <healthstream/core/metrics/window_key.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace HealthStream {

constexpr const char* GLOBAL_COMPONENT = "Global";

enum class MetricKind : uint8_t {
    COUNTER = 0,      // recorded as the sentinel value 1.0
    MEASUREMENT = 1
};

/**
 * @brief One write event handed to the persistence path
 */
struct RawMetricPoint {
    SystemClock::time_point timestamp{};
    std::string component = GLOBAL_COMPONENT;
    std::string name;
    double value = 0.0;
    MetricKind kind = MetricKind::MEASUREMENT;
};

struct MetricStats {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    uint64_t count = 0;
};

/**
 * @brief Unit persisted to a backend: one (window, component, metric) reduction
 *
 * There is no stored kind flag. Counters are the entries whose min, max and avg
 * all equal 1.0, in which case count is the increment total.
 */
struct AggregatedEntry {
    std::string time_window_key;
    std::string component;
    std::string metric;
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    uint64_t count = 0;

    bool isCounter() const { return min == 1.0 && max == 1.0 && avg == 1.0; }

    MetricStats stats() const { return MetricStats{min, max, avg, count}; }
};

inline bool operator==(const AggregatedEntry& a, const AggregatedEntry& b) {
    return a.time_window_key == b.time_window_key && a.component == b.component &&
           a.metric == b.metric && a.min == b.min && a.max == b.max &&
           a.avg == b.avg && a.count == b.count;
}

// Current-window view rendered by snapshot/dump
struct MetricSummary {
    uint64_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    bool counter = false;
};

// metric name -> ordered raw values
using MetricSeries = std::unordered_map<std::string, std::vector<double>>;
// window key -> metrics
using WindowTable = std::unordered_map<std::string, MetricSeries>;
// component -> windows. Shared shape of the collection and flush-queue tables.
using CollectionTable = std::unordered_map<std::string, WindowTable>;

using CollectionSnapshot = std::map<std::string, std::map<std::string, MetricSummary>>;

} // namespace HealthStream
