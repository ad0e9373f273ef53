#pragma once

#include <healthstream/core/metrics/metric_types.hpp>
#include <healthstream/core/metrics/window_key.hpp>
#include <chrono>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace HealthStream {

enum class MoveMode {
    COMPLETED_ONLY = 0,  // periodic tick: everything except the current window
    ALL = 1              // force flush / shutdown: include the current window
};

/**
 * @class Collector
 * @brief Time-windowed hot-path store for metric writes
 *
 * Layout: component -> window key -> metric -> raw values (append order).
 * The window key is recomputed from the time source on every call, so old
 * windows simply stop receiving writes until moveWindows() takes them out.
 *
 * Locking:
 * - append/incr take the exclusive lock only for the map insertion
 * - snapshot takes the shared lock
 * - moveWindows takes the exclusive lock and moves whole window tables
 *   (O(component x window pairs), never O(values))
 *
 * Nothing else shares this lock; backend I/O happens on the flush side.
 */
class Collector {
public:
    explicit Collector(std::chrono::seconds window = WindowKey::DEFAULT_WINDOW,
                       TimeSource now = &WindowKey::systemNow);
    ~Collector() = default;

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    // Counter increment: appends the sentinel 1.0
    void incr(std::string_view component, std::string_view name);

    // Raw measurement; value is stored as given (NaN/inf included)
    void append(std::string_view component, std::string_view name, double value);

    // Current window only
    CollectionSnapshot snapshot() const;

    /**
     * @brief Relocate windows out of the collection table
     * @return Moved windows; removed from this collector
     *
     * Running COMPLETED_ONLY twice without new writes returns an empty table
     * the second time.
     */
    CollectionTable moveWindows(MoveMode mode = MoveMode::COMPLETED_ONLY);

    std::string currentWindowKey() const;
    std::chrono::seconds windowSize() const { return window_; }

    // Number of (component, window) pairs held
    size_t pendingWindows() const;

    // Number of raw values held across all windows
    size_t pendingValues() const;

    static bool isValidName(std::string_view name);

private:
    std::chrono::seconds window_;
    TimeSource now_;

    mutable std::shared_mutex mtx_;
    CollectionTable table_;
};

} // namespace HealthStream
