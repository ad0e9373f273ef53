#pragma once

#include <healthstream/core/config/app_config.hpp>
#include <healthstream/core/metrics/collector.hpp>
#include <healthstream/core/pipeline/flush_queue.hpp>
#include <healthstream/core/storage/persistence_manager.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace HealthStream {

/**
 * @class HealthState
 * @brief Process-facing entry point: record, inspect, flush, close
 *
 * Owns the Collector, the PersistenceManager and the FlushQueue ticker that
 * connects them. Construct one per process (or per test) and pass it around;
 * there is no global instance.
 *
 * Recording is safe from any thread and never touches storage.
 */
class HealthState {
public:
    static constexpr const char* DEFAULT_IDENTITY = "identity unset";

    explicit HealthState(const AppConfig::AppConfiguration& config);
    HealthState(std::chrono::seconds window, std::unique_ptr<PersistenceManager> persistence,
                TimeSource now = &WindowKey::systemNow);
    ~HealthState() noexcept;

    HealthState(const HealthState&) = delete;
    HealthState& operator=(const HealthState&) = delete;

    // Sets identity (empty -> "identity unset") and resets the start time
    void info(const std::string& identity);

    void incrMetric(const std::string& name);
    void incrComponentMetric(const std::string& component, const std::string& name);
    void addMetric(const std::string& name, double value);
    void addComponentMetric(const std::string& component, const std::string& name, double value);

    CollectionSnapshot snapshot() const;

    /**
     * @brief JSON view of the current window
     *
     * {"Identity": ..., "Started": <unix seconds>, "Metrics": {component: {metric: v}}}
     * where v is the plain count for counters and {count, min, max, avg} otherwise.
     */
    std::string dump() const;

    // Moves every window, including the current one, into storage; errors propagate
    void forceFlush();

    // Idempotent; final flush then persistence close. Never throws.
    void close();

    PersistenceManager& persistence() { return *persistence_; }
    const Collector& collector() const { return collector_; }
    std::string identity() const;
    int64_t started() const;
    bool isClosed() const { return closed_.load(std::memory_order_acquire); }

    static PersistenceConfig persistenceConfigFrom(const AppConfig::AppConfiguration& config);

private:
    TimeSource now_;
    Collector collector_;
    std::unique_ptr<PersistenceManager> persistence_;
    std::unique_ptr<FlushQueue> flush_queue_;

    mutable std::mutex info_mutex_;
    std::string identity_ = DEFAULT_IDENTITY;
    int64_t started_ = 0;

    std::atomic<bool> closed_{false};
};

} // namespace HealthStream
