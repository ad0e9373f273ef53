#include <healthstream/core/pipeline/flush_queue.hpp>
#include <healthstream/core/metrics/statistics.hpp>
#include <healthstream/core/storage/persistence_manager.hpp>
#include <exception>
#include <iterator>
#include <spdlog/spdlog.h>

namespace HealthStream {

FlushQueue::FlushQueue(Collector& collector, PersistenceManager& persistence,
                       std::chrono::milliseconds interval)
    : collector_(collector),
      persistence_(persistence),
      interval_(interval.count() > 0
                    ? interval
                    : std::chrono::duration_cast<std::chrono::milliseconds>(collector.windowSize())) {}

FlushQueue::~FlushQueue() noexcept {
    stop();
}

void FlushQueue::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&FlushQueue::run, this);
    spdlog::info("[FlushQueue] Started with interval {}ms", interval_.count());
}

void FlushQueue::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    try {
        forceFlush();
    } catch (const std::exception& e) {
        spdlog::error("[FlushQueue] Final flush failed: {}", e.what());
    }
    spdlog::info("[FlushQueue] Stopped");
}

void FlushQueue::run() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        moveAndFlush();
    }
}

void FlushQueue::flush(MoveMode mode) {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    CollectionTable moved = collector_.moveWindows(mode);

    std::vector<AggregatedEntry> entries;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (auto& [component, windows] : moved) {
            auto& dst_windows = table_[component];
            for (auto& [key, metrics] : windows) {
                auto& dst_metrics = dst_windows[key];
                for (auto& [metric, values] : metrics) {
                    auto& dst = dst_metrics[metric];
                    dst.insert(dst.end(), std::make_move_iterator(values.begin()),
                               std::make_move_iterator(values.end()));
                }
            }
        }
        if (table_.empty()) return;

        entries = Statistics::aggregateTable(table_);
        table_.clear();
    }

    if (entries.empty()) return;
    try {
        persistence_.persistAggregated(entries);
    } catch (...) {
        dropped_batches_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
    spdlog::debug("[FlushQueue] Persisted {} aggregated entries", entries.size());
}

void FlushQueue::moveAndFlush() {
    try {
        flush(MoveMode::COMPLETED_ONLY);
    } catch (const std::exception& e) {
        spdlog::error("[FlushQueue] Periodic flush failed, batch dropped: {}", e.what());
    }
}

void FlushQueue::forceFlush() {
    flush(MoveMode::ALL);
    persistence_.forceFlush();
}

size_t FlushQueue::pendingEntries() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    size_t n = 0;
    for (const auto& [component, windows] : table_) {
        for (const auto& [key, metrics] : windows) {
            n += metrics.size();
        }
    }
    return n;
}

} // namespace HealthStream
