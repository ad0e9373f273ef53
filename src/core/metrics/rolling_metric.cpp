#include <healthstream/core/metrics/rolling_metric.hpp>
#include <numeric>
#include <stdexcept>

namespace HealthStream {

RollingMetric::RollingMetric(size_t capacity) : data_(capacity, 0.0) {
    if (capacity == 0) {
        throw std::invalid_argument("RollingMetric capacity must be positive");
    }
}

double RollingMetric::add(double value) {
    if (index_ >= data_.size()) {
        index_ = 0;
    }
    data_[index_++] = value;
    return average();
}

double RollingMetric::average() const {
    double total = std::accumulate(data_.begin(), data_.end(), 0.0);
    return total / static_cast<double>(data_.size());
}

} // namespace HealthStream
