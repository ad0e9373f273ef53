#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace HealthStream {

/**
 * @class BatchQueue
 * @brief Batch/timer-driven dispatch of items to a sink
 *
 * Items are handed to the sink when:
 * - the queued count reaches batch_size (synchronously, on the enqueuing thread)
 * - the flush interval elapses (background thread)
 * - forceFlush() or stop() is called
 *
 * A batch is taken out of the queue before the sink runs. If the sink throws
 * the batch is dropped, never retried.
 * Explicit calls (enqueue-triggered flush, forceFlush) rethrow; the periodic
 * and final flushes only log.
 *
 * queue_mutex_ guards the pending items, flush_mutex_ serialises sink calls.
 * Every taken batch is written under flush_mutex_, so once forceFlush() returns
 * everything enqueued before the call has reached the sink.
 */
template<typename T>
class BatchQueue {
public:
    using Sink = std::function<void(std::vector<T>&)>;

    static constexpr size_t DEFAULT_BATCH_SIZE = 100;
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{60000};

    BatchQueue(std::string name, std::chrono::milliseconds interval, size_t batch_size, Sink sink)
        : name_(std::move(name)),
          interval_(interval.count() > 0 ? interval : DEFAULT_INTERVAL),
          batch_size_(batch_size > 0 ? batch_size : DEFAULT_BATCH_SIZE),
          sink_(std::move(sink)) {
        pending_.reserve(batch_size_);
    }

    ~BatchQueue() noexcept {
        stop();
    }

    BatchQueue(const BatchQueue&) = delete;
    BatchQueue& operator=(const BatchQueue&) = delete;

    void start() {
        if (stopped_.load(std::memory_order_acquire)) return;
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }
        worker_thread_ = std::thread(&BatchQueue::loop, this);
        spdlog::debug("[{}] Started (interval: {}ms, batch: {})", name_, interval_.count(), batch_size_);
    }

    /**
     * @brief Stop the timer thread, then flush what is left
     *
     * Idempotent and safe to call from several threads; every caller returns
     * only after the thread is joined and the final flush ran. A stopped
     * queue cannot be restarted.
     */
    void stop() {
        std::lock_guard<std::mutex> stop_lock(stop_mutex_);
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
        flushLogged("final");
    }

    void enqueue(std::vector<T> items) {
        if (items.empty()) return;

        bool full = false;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (pending_.empty()) {
                pending_ = std::move(items);
            } else {
                pending_.insert(pending_.end(),
                                std::make_move_iterator(items.begin()),
                                std::make_move_iterator(items.end()));
            }
            full = pending_.size() >= batch_size_;
        }

        if (full) {
            forceFlush();
        }
    }

    void enqueue(T item) {
        std::vector<T> items;
        items.push_back(std::move(item));
        enqueue(std::move(items));
    }

    // Synchronously write everything queued; sink errors propagate
    void forceFlush() {
        std::lock_guard<std::mutex> flush_lock(flush_mutex_);
        std::vector<T> batch = takeAll();
        if (batch.empty()) return;

        try {
            sink_(batch);
        } catch (...) {
            dropped_batches_.fetch_add(1, std::memory_order_relaxed);
            throw;
        }
        flushed_items_.fetch_add(batch.size(), std::memory_order_relaxed);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return pending_.size();
    }

    uint64_t droppedBatches() const { return dropped_batches_.load(std::memory_order_relaxed); }
    uint64_t flushedItems() const { return flushed_items_.load(std::memory_order_relaxed); }
    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    size_t batchSize() const { return batch_size_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::vector<T> takeAll() {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::vector<T> batch;
        batch.swap(pending_);
        pending_.reserve(batch_size_);
        return batch;
    }

    void flushLogged(const char* reason) {
        try {
            forceFlush();
        } catch (const std::exception& e) {
            spdlog::error("[{}] {} flush failed, batch dropped: {}", name_, reason, e.what());
        }
    }

    void loop() {
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
            flushLogged("periodic");
        }
    }

    const std::string name_;
    const std::chrono::milliseconds interval_;
    const size_t batch_size_;
    Sink sink_;

    mutable std::mutex queue_mutex_;
    std::vector<T> pending_;
    std::mutex flush_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::mutex stop_mutex_;
    std::thread worker_thread_;
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    std::atomic<uint64_t> dropped_batches_{0};
    std::atomic<uint64_t> flushed_items_{0};
};

} // namespace HealthStream
