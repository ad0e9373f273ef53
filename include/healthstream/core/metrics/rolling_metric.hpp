#pragma once

#include <cstddef>
#include <vector>

namespace HealthStream {

/**
 * @brief Fixed-capacity circular buffer returning the rolling average
 *
 * The average always divides by the full capacity; slots that were never
 * written count as zero. Not thread-safe.
 */
class RollingMetric {
public:
    explicit RollingMetric(size_t capacity);

    // Store value, overwriting the oldest slot, and return the new average
    double add(double value);

    double average() const;
    size_t capacity() const { return data_.size(); }

private:
    std::vector<double> data_;
    size_t index_ = 0;
};

} // namespace HealthStream
