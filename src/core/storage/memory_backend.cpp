#include <healthstream/core/storage/memory_backend.hpp>
#include <healthstream/core/metrics/statistics.hpp>
#include <mutex>
#include <set>

namespace HealthStream {

void MemoryBackend::ensureOpen() const {
    if (closed_.load(std::memory_order_acquire)) {
        throw StorageError(StorageErrc::CLOSED, "MemoryBackend is closed");
    }
}

void MemoryBackend::writeAggregated(const std::vector<AggregatedEntry>& entries) {
    ensureOpen();
    if (entries.empty()) return;

    std::unique_lock<std::shared_mutex> lock(mtx_);
    for (const auto& e : entries) {
        auto [it, inserted] = storage_.try_emplace(RowKey{e.time_window_key, e.component, e.metric}, e);
        if (inserted) continue;

        auto& row = it->second;
        auto s = Statistics::merge(row.stats(), e.stats());
        row.min = s.min;
        row.max = s.max;
        row.avg = s.avg;
        row.count = s.count;
    }
}

std::vector<AggregatedEntry> MemoryBackend::readMetrics(const std::string& component,
                                                        SystemClock::time_point start,
                                                        SystemClock::time_point end) {
    ensureOpen();
    const std::string startKey = WindowKey::fromTimeExact(start);
    const std::string endKey = WindowKey::fromTimeExact(end);

    // Map order is window, component, metric
    std::vector<AggregatedEntry> result;
    std::shared_lock<std::shared_mutex> lock(mtx_);
    for (const auto& [key, e] : storage_) {
        if (!component.empty() && e.component != component) continue;
        if (e.time_window_key < startKey || e.time_window_key > endKey) continue;
        result.push_back(e);
    }
    return result;
}

std::vector<std::string> MemoryBackend::listComponents() {
    ensureOpen();
    std::set<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        for (const auto& [key, e] : storage_) {
            names.insert(e.component);
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

void MemoryBackend::close() {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    closed_.store(true, std::memory_order_release);
    storage_.clear();
}

size_t MemoryBackend::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return storage_.size();
}

void MemoryBackend::clear() {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    storage_.clear();
}

} // namespace HealthStream
