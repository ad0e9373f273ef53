// ============================================================================
// ROLLING METRIC UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <healthstream/core/metrics/rolling_metric.hpp>
#include <stdexcept>

using namespace HealthStream;

TEST(RollingMetric, AverageCountsUnfilledSlotsAsZero) {
    RollingMetric rm(3);
    EXPECT_DOUBLE_EQ(rm.add(3.0), 1.0);
    EXPECT_DOUBLE_EQ(rm.add(3.0), 2.0);
    EXPECT_DOUBLE_EQ(rm.add(3.0), 3.0);
}

TEST(RollingMetric, OverwritesOldestValue) {
    RollingMetric rm(3);
    rm.add(3.0);
    rm.add(3.0);
    rm.add(3.0);
    EXPECT_DOUBLE_EQ(rm.add(6.0), 4.0);
    EXPECT_DOUBLE_EQ(rm.average(), 4.0);
}

TEST(RollingMetric, ZeroCapacityThrows) {
    EXPECT_THROW(RollingMetric(0), std::invalid_argument);
}

TEST(RollingMetric, CapacityReported) {
    RollingMetric rm(20);
    EXPECT_EQ(rm.capacity(), 20u);
    EXPECT_DOUBLE_EQ(rm.average(), 0.0);
}
