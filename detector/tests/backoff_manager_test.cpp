// backoff_manager_test.cpp: exponential growth, cap, jitter bounds and per-key reset.

#include <gtest/gtest.h>

#include "backoff_manager.hpp"

#include <chrono>

using std::chrono::milliseconds;

TEST(BackoffManagerTest, DelayDoublesWithinJitter) {
    BackoffManager backoff(1.0, 60.0);

    auto first = backoff.record_failure("feed:BTCUSDT");
    EXPECT_GE(first.count(), 899);
    EXPECT_LE(first.count(), 1100);

    auto second = backoff.record_failure("feed:BTCUSDT");
    EXPECT_GE(second.count(), 1799);
    EXPECT_LE(second.count(), 2200);

    EXPECT_EQ(backoff.failure_count("feed:BTCUSDT"), 2);
}

TEST(BackoffManagerTest, DelayIsCapped) {
    BackoffManager backoff(1.0, 4.0);
    milliseconds delay{0};
    for (int i = 0; i < 8; ++i) {
        delay = backoff.record_failure("backfill:ETHUSDT");
    }
    EXPECT_GE(delay.count(), 3599);
    EXPECT_LE(delay.count(), 4400);
}

TEST(BackoffManagerTest, KeysAreIndependent) {
    BackoffManager backoff(1.0, 60.0);
    backoff.record_failure("feed:BTCUSDT");

    EXPECT_EQ(backoff.failure_count("feed:ETHUSDT"), 0);
    EXPECT_EQ(backoff.failure_count("feed:BTCUSDT"), 1);

    auto other = backoff.record_failure("feed:ETHUSDT");
    EXPECT_LE(other.count(), 1100);
}

TEST(BackoffManagerTest, SuccessResetsStreak) {
    BackoffManager backoff(1.0, 60.0);
    backoff.record_failure("feed:BTCUSDT");
    backoff.record_failure("feed:BTCUSDT");
    backoff.record_success("feed:BTCUSDT");

    EXPECT_EQ(backoff.failure_count("feed:BTCUSDT"), 0);

    auto next = backoff.record_failure("feed:BTCUSDT");
    EXPECT_LE(next.count(), 1100);
}

TEST(BackoffManagerTest, ForgetDropsOnlyThatKey) {
    BackoffManager backoff(1.0, 60.0);
    backoff.record_failure("feed:SOLUSDT");
    backoff.record_failure("backfill:SOLUSDT");

    backoff.forget("feed:SOLUSDT");
    EXPECT_EQ(backoff.failure_count("feed:SOLUSDT"), 0);
    EXPECT_EQ(backoff.failure_count("backfill:SOLUSDT"), 1);
}
