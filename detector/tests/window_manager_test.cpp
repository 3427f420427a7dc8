// window_manager_test.cpp: rolling window readiness and sample statistics.

#include <gtest/gtest.h>

#include "bar_store.hpp"
#include "sqlite_db.hpp"
#include "test_helpers.hpp"
#include "window_manager.hpp"

#include <cmath>
#include <vector>

using namespace test_helpers;

// ===========================================================================
// Statistics helpers
// ===========================================================================

TEST(SampleStatsTest, BesselCorrectedStddev) {
    std::vector<double> values{1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(sample_mean(values), 2.5);
    // sum of squares 5.0 over n - 1 = 3
    EXPECT_NEAR(sample_stddev(values), std::sqrt(5.0 / 3.0), 1e-12);
}

TEST(SampleStatsTest, DegenerateInputs) {
    EXPECT_DOUBLE_EQ(sample_mean({}), 0.0);
    EXPECT_DOUBLE_EQ(sample_stddev({}), 0.0);
    EXPECT_DOUBLE_EQ(sample_stddev({42.0}), 0.0);
    EXPECT_DOUBLE_EQ(sample_stddev({3.0, 3.0, 3.0}), 0.0);
}

TEST(SampleStatsTest, VolatilityProxy) {
    auto bar = make_bar("BTCUSDT", T0, 200.0);
    bar.high = 204.0;
    bar.low = 198.0;
    EXPECT_DOUBLE_EQ(bar_volatility(bar), 0.03);
}

// ===========================================================================
// Window readiness
// ===========================================================================

class WindowManagerTest : public ::testing::Test {
protected:
    void store_series(int count) {
        for (const auto& bar : make_quiet_series("BTCUSDT", T0, count)) {
            ASSERT_NE(store.upsert(bar), UpsertResult::Failed);
        }
    }

    SqliteDatabase db{":memory:"};
    BarStore store{db};
    WindowManager windows{store};
};

TEST_F(WindowManagerTest, InsufficientDataBelowWindowSize) {
    store_series(15);
    EXPECT_FALSE(windows.summarize("BTCUSDT", "15m", 16).has_value());
}

TEST_F(WindowManagerTest, ReadyAtExactlyWindowSizeWithoutPriorClose) {
    store_series(16);
    auto summary = windows.summarize("BTCUSDT", "15m", 16);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->bars.size(), 16u);
    // No 17th close exists, so the oldest bar has no return
    EXPECT_EQ(summary->returns.size(), 15u);
    EXPECT_EQ(summary->last_bar().open_time_ms, T0 + 15 * BAR_MS);
}

TEST_F(WindowManagerTest, UsesPriorCloseWhenAvailable) {
    store_series(20);
    auto summary = windows.summarize("BTCUSDT", "15m", 16);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->bars.size(), 16u);
    EXPECT_EQ(summary->returns.size(), 16u);
    EXPECT_EQ(summary->bars.front().open_time_ms, T0 + 4 * BAR_MS);
}

TEST_F(WindowManagerTest, OpenBarsAreNotPartOfTheWindow) {
    store_series(15);
    store.upsert(make_bar("BTCUSDT", T0 + 15 * BAR_MS, 100.0, 1000.0, 0.004, false));
    EXPECT_FALSE(windows.summarize("BTCUSDT", "15m", 16).has_value());
}

TEST_F(WindowManagerTest, WindowEndsStrictlyBeforeScoredBar) {
    store_series(20);
    auto summary = windows.summarize("BTCUSDT", "15m", 16, T0 + 19 * BAR_MS);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->last_bar().open_time_ms, T0 + 18 * BAR_MS);
    EXPECT_EQ(summary->bars.front().open_time_ms, T0 + 3 * BAR_MS);
}

TEST_F(WindowManagerTest, StatisticsMatchAlternatingSeries) {
    store_series(17);
    auto summary = windows.summarize("BTCUSDT", "15m", 16);
    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(summary->returns.size(), 16u);

    // Eight +0.1% and eight -0.1% moves
    EXPECT_NEAR(summary->return_mean, 0.0, 1e-9);
    EXPECT_NEAR(summary->return_stddev, 0.001 * std::sqrt(16.0 / 15.0), 1e-9);
    EXPECT_NEAR(summary->volume_mean, 1000.0, 1e-9);
    EXPECT_NEAR(summary->volume_stddev, 100.0 * std::sqrt(16.0 / 15.0), 1e-9);
    EXPECT_NEAR(summary->volatility_mean, 0.005, 1e-12);
}

TEST_F(WindowManagerTest, RecomputedFromStoreOnEveryCall) {
    store_series(16);
    auto first = windows.summarize("BTCUSDT", "15m", 16);
    store.upsert(make_bar("BTCUSDT", T0 + 16 * BAR_MS, 100.0));
    auto second = windows.summarize("BTCUSDT", "15m", 16);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->last_bar().open_time_ms, second->last_bar().open_time_ms);
}
