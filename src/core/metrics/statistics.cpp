#include <healthstream/core/metrics/statistics.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <tuple>

namespace HealthStream {

namespace {

// NaN-skipping bounds; NaN only when both sides are NaN
double lowerOf(double a, double b) {
    if (std::isnan(a)) return b;
    if (std::isnan(b)) return a;
    return std::min(a, b);
}

double upperOf(double a, double b) {
    if (std::isnan(a)) return b;
    if (std::isnan(b)) return a;
    return std::max(a, b);
}

bool entryLess(const AggregatedEntry& a, const AggregatedEntry& b) {
    return std::tie(a.time_window_key, a.component, a.metric) <
           std::tie(b.time_window_key, b.component, b.metric);
}

AggregatedEntry makeEntry(const std::string& key, const std::string& component,
                          const std::string& metric, const MetricStats& s) {
    AggregatedEntry e;
    e.time_window_key = key;
    e.component = component;
    e.metric = metric;
    e.min = s.min;
    e.max = s.max;
    e.avg = s.avg;
    e.count = s.count;
    return e;
}

} // namespace

MetricStats Statistics::reduce(const std::vector<double>& values) {
    MetricStats s;
    if (values.empty()) {
        return s;
    }

    // An all-NaN series keeps NaN bounds
    s.min = std::numeric_limits<double>::quiet_NaN();
    s.max = std::numeric_limits<double>::quiet_NaN();
    double sum = 0.0;
    for (double v : values) {
        s.min = lowerOf(s.min, v);
        s.max = upperOf(s.max, v);
        sum += v;
    }
    s.count = values.size();
    s.avg = sum / static_cast<double>(s.count);
    return s;
}

bool Statistics::isCounterSeries(const std::vector<double>& values) {
    if (values.empty()) {
        return false;
    }
    return std::all_of(values.begin(), values.end(), [](double v) { return v == 1.0; });
}

MetricStats Statistics::merge(const MetricStats& a, const MetricStats& b) {
    if (a.count == 0) return b;
    if (b.count == 0) return a;

    MetricStats out;
    out.min = lowerOf(a.min, b.min);
    out.max = upperOf(a.max, b.max);
    out.count = a.count + b.count;
    out.avg = (a.avg * static_cast<double>(a.count) + b.avg * static_cast<double>(b.count)) /
              static_cast<double>(out.count);
    return out;
}

MetricSummary Statistics::summarize(const std::vector<double>& values) {
    auto s = reduce(values);
    MetricSummary summary;
    summary.count = s.count;
    summary.min = s.min;
    summary.max = s.max;
    summary.avg = s.avg;
    summary.counter = isCounterSeries(values);
    return summary;
}

std::vector<AggregatedEntry> Statistics::aggregatePoints(const std::vector<RawMetricPoint>& points,
                                                         std::chrono::seconds window) {
    // ordered map gives the sorted output for free
    std::map<std::tuple<std::string, std::string, std::string>, std::vector<double>> groups;
    for (const auto& p : points) {
        const std::string& component = p.component.empty() ? std::string(GLOBAL_COMPONENT) : p.component;
        groups[std::make_tuple(WindowKey::fromTime(p.timestamp, window), component, p.name)]
            .push_back(p.value);
    }

    std::vector<AggregatedEntry> out;
    out.reserve(groups.size());
    for (const auto& [key, values] : groups) {
        out.push_back(makeEntry(std::get<0>(key), std::get<1>(key), std::get<2>(key), reduce(values)));
    }
    return out;
}

std::vector<AggregatedEntry> Statistics::aggregateTable(const CollectionTable& table) {
    std::vector<AggregatedEntry> out;
    for (const auto& [component, windows] : table) {
        for (const auto& [key, metrics] : windows) {
            for (const auto& [metric, values] : metrics) {
                if (values.empty()) continue;
                out.push_back(makeEntry(key, component, metric, reduce(values)));
            }
        }
    }
    std::sort(out.begin(), out.end(), entryLess);
    return out;
}

std::vector<AggregatedEntry> Statistics::rollup(const std::vector<AggregatedEntry>& entries) {
    std::map<std::pair<std::string, std::string>, AggregatedEntry> merged;
    for (const auto& e : entries) {
        auto [it, inserted] = merged.try_emplace(std::make_pair(e.component, e.metric), e);
        if (inserted) continue;

        auto& acc = it->second;
        auto s = merge(acc.stats(), e.stats());
        acc.min = s.min;
        acc.max = s.max;
        acc.avg = s.avg;
        acc.count = s.count;
        // rollup is keyed by the earliest window it covers
        acc.time_window_key = std::min(acc.time_window_key, e.time_window_key);
    }

    std::vector<AggregatedEntry> out;
    out.reserve(merged.size());
    for (auto& [key, e] : merged) {
        out.push_back(std::move(e));
    }
    std::sort(out.begin(), out.end(), entryLess);
    return out;
}

} // namespace HealthStream
