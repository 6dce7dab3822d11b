#include "cirrus/transfer/throughput.hpp"

#include <gtest/gtest.h>

using cirrus::transfer::ThroughputEstimator;

TEST(ThroughputTest, FallbackUntilSpeedIsKnown) {
    ThroughputEstimator estimator(5, 0.1, 3600);
    EXPECT_DOUBLE_EQ(estimator.average_speed(), 0.0);
    EXPECT_EQ(estimator.remaining_seconds(1'000'000), 3600u);

    estimator.record(100, 0.0);
    EXPECT_EQ(estimator.sample_count(), 0u);
}

TEST(ThroughputTest, AveragesOverWindow) {
    ThroughputEstimator estimator(3, 0.1, 3600);
    estimator.record(1000, 1.0);
    estimator.record(3000, 1.0);
    EXPECT_DOUBLE_EQ(estimator.average_speed(), 2000.0);
    EXPECT_EQ(estimator.remaining_seconds(10'000), 5u);

    estimator.record(2000, 1.0);
    estimator.record(8000, 2.0);
    EXPECT_EQ(estimator.sample_count(), 3u);
    EXPECT_DOUBLE_EQ(estimator.average_speed(), 3000.0);
}

TEST(ThroughputTest, TinySpeedUsesFallback) {
    ThroughputEstimator estimator(5, 0.1, 42);
    estimator.record(1, 100.0);
    EXPECT_EQ(estimator.remaining_seconds(500), 42u);
}
