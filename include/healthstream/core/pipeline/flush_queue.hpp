#pragma once

#include <healthstream/core/metrics/collector.hpp>
#include <healthstream/core/metrics/metric_types.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace HealthStream {

class PersistenceManager;

/**
 * @class FlushQueue
 * @brief Periodic move of completed windows out of the Collector into storage
 *
 * Each tick:
 * 1. Collector::moveWindows(COMPLETED_ONLY), brief exclusive hold on the collector
 * 2. merge into the FlushQueueTable under this queue's own mutex
 * 3. reduce every (component, window, metric) sequence
 * 4. PersistenceManager::persistAggregated
 *
 * The collector lock is never held during steps 2-4, so writers only wait for
 * the move itself.
 */
class FlushQueue {
public:
    FlushQueue(Collector& collector, PersistenceManager& persistence,
               std::chrono::milliseconds interval);
    ~FlushQueue() noexcept;

    FlushQueue(const FlushQueue&) = delete;
    FlushQueue& operator=(const FlushQueue&) = delete;

    void start();

    // Idempotent. Joins the ticker, then moves and flushes everything left.
    void stop();

    // One tick; failures are logged and the batch dropped
    void moveAndFlush();

    // Moves all windows including the current one; errors propagate
    void forceFlush();

    size_t pendingEntries() const;
    uint64_t droppedBatches() const { return dropped_batches_.load(std::memory_order_relaxed); }
    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void run();
    void flush(MoveMode mode);

    Collector& collector_;
    PersistenceManager& persistence_;
    const std::chrono::milliseconds interval_;

    mutable std::mutex table_mutex_;
    CollectionTable table_;
    std::mutex flush_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::thread worker_thread_;
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    std::atomic<uint64_t> dropped_batches_{0};
};

} // namespace HealthStream
