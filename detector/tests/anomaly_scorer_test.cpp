// anomaly_scorer_test.cpp: z-scores, threshold gating and the composite score.

#include <gtest/gtest.h>

#include "anomaly_scorer.hpp"
#include "test_helpers.hpp"
#include "window_manager.hpp"

#include <cmath>
#include <vector>

using namespace test_helpers;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// Window whose newest bar closes at 100 with the given return statistics and
// flat volume/volatility (zero stddev, so those dimensions never trigger)
WindowSummary make_window(double return_mean, double return_stddev) {
    WindowSummary window;
    window.instrument = "BTCUSDT";
    window.interval = "15m";
    for (int i = 0; i < 16; ++i) {
        window.bars.push_back(make_bar("BTCUSDT", T0 + i * BAR_MS, 100.0));
        window.returns.push_back(i % 2 == 0 ? return_mean + return_stddev : return_mean - return_stddev);
    }
    window.return_mean = return_mean;
    window.return_stddev = return_stddev;
    window.volume_mean = 1000.0;
    window.volume_stddev = 0.0;
    window.volatility_mean = 0.004;
    window.volatility_stddev = 0.0;
    return window;
}

Bar bar_with_return(double ret) {
    return make_bar("BTCUSDT", T0 + 16 * BAR_MS, 100.0 * (1.0 + ret));
}

}  // namespace

// ===========================================================================
// z-score
// ===========================================================================

TEST(ZScoreTest, ZeroStddevYieldsZero) {
    EXPECT_DOUBLE_EQ(z_score(5.0, 1.0, 0.0), 0.0);
}

TEST(ZScoreTest, SignedDistanceInStddevs) {
    EXPECT_DOUBLE_EQ(z_score(7.0, 1.0, 2.0), 3.0);
    EXPECT_DOUBLE_EQ(z_score(-5.0, 1.0, 2.0), -3.0);
}

TEST(AnomalyScorerTest, ReturnThreeStddevsAboveMeanScoresThree) {
    const double mu = 0.001;
    const double sigma = 0.01;
    auto result = score_bar(bar_with_return(mu + 3.0 * sigma), make_window(mu, sigma), 0.0, ScoringThresholds{});

    EXPECT_NEAR(result.record.price_zscore, 3.0, 1e-9);
    EXPECT_NEAR(result.record.cur_return, 0.031, 1e-12);
    EXPECT_TRUE(result.triggered);
    EXPECT_NEAR(result.record.price_score, 0.4 * 3.0, 1e-9);
}

// ===========================================================================
// Threshold gating
// ===========================================================================

TEST(AnomalyScorerTest, SmallReturnSuppressedByAbsoluteFloor) {
    ScoringThresholds thresholds;
    thresholds.min_abs_return = 0.01;

    auto window = make_window(0.0, 0.001);

    auto small = score_bar(bar_with_return(0.003), window, 0.0, thresholds);
    EXPECT_GE(std::fabs(small.record.price_zscore), thresholds.price_z);
    EXPECT_FALSE(small.triggered);
    EXPECT_DOUBLE_EQ(small.record.anomaly_score, 0.0);
    EXPECT_EQ(small.record.reasons, std::vector<std::string>{"normal"});

    auto large = score_bar(bar_with_return(0.03), window, 0.0, thresholds);
    EXPECT_TRUE(large.triggered);
    EXPECT_EQ(large.record.reasons, std::vector<std::string>{"price"});
}

TEST(AnomalyScorerTest, NegativeMovesTriggerOnAbsoluteZ) {
    auto result = score_bar(bar_with_return(-0.04), make_window(0.0, 0.005), 0.0, ScoringThresholds{});
    EXPECT_LT(result.record.price_zscore, -2.5);
    EXPECT_TRUE(result.triggered);
    EXPECT_GT(result.record.anomaly_score, 0.0);
}

TEST(AnomalyScorerTest, ZeroStddevDimensionsNeverTrigger) {
    auto window = make_window(0.0, 0.0);
    auto bar = bar_with_return(0.05);
    bar.quote_volume = 1e9;
    auto result = score_bar(bar, window, 0.0, ScoringThresholds{});

    EXPECT_DOUBLE_EQ(result.record.price_zscore, 0.0);
    EXPECT_DOUBLE_EQ(result.record.volume_zscore, 0.0);
    EXPECT_FALSE(result.triggered);
}

// ===========================================================================
// Composite score
// ===========================================================================

TEST(AnomalyScorerTest, CompositeIsWeightedSumOfTriggeredDimensions) {
    auto window = make_window(0.0, 0.01);
    window.volume_stddev = 100.0;
    window.volatility_stddev = 0.001;

    auto bar = bar_with_return(0.05);      // price z = 5
    bar.quote_volume = 1300.0;             // volume z = 3
    bar.high = bar.close * 1.0005;         // volatility 0.001, z = -3
    bar.low = bar.close * 0.9995;

    auto result = score_bar(bar, window, 2.5e6, ScoringThresholds{});
    const auto& r = result.record;

    EXPECT_NEAR(r.price_zscore, 5.0, 1e-6);
    EXPECT_NEAR(r.volume_zscore, 3.0, 1e-9);
    EXPECT_NEAR(r.volatility_zscore, -3.0, 1e-6);
    EXPECT_NEAR(r.price_score, 0.4 * 5.0, 1e-6);
    EXPECT_NEAR(r.volume_score, 0.3 * 3.0, 1e-9);
    EXPECT_NEAR(r.volatility_score, 0.3 * 3.0, 1e-6);
    EXPECT_NEAR(r.anomaly_score, r.price_score + r.volume_score + r.volatility_score, 1e-12);
    EXPECT_EQ(r.reasons, (std::vector<std::string>{"price", "volume", "volatility"}));
    EXPECT_DOUBLE_EQ(r.quote_volume_24h, 2.5e6);
    EXPECT_TRUE(r.is_anomaly);
}

TEST(AnomalyScorerTest, VolumeBelowThresholdContributesNothing) {
    auto window = make_window(0.0, 0.01);
    window.volume_stddev = 100.0;

    auto bar = bar_with_return(0.05);
    bar.quote_volume = 1150.0;  // z = 1.5

    auto result = score_bar(bar, window, 0.0, ScoringThresholds{});
    EXPECT_DOUBLE_EQ(result.record.volume_score, 0.0);
    EXPECT_EQ(result.record.reasons, std::vector<std::string>{"price"});
}

TEST(AnomalyScorerTest, RecordIdentityAndContext) {
    auto bar = bar_with_return(0.05);
    auto result = score_bar(bar, make_window(0.0, 0.01), 123.0, ScoringThresholds{});

    EXPECT_EQ(result.record.instrument, "BTCUSDT");
    EXPECT_EQ(result.record.interval_type, "15m");
    EXPECT_EQ(result.record.timestamp, (T0 + 16 * BAR_MS) / 1000);
    EXPECT_DOUBLE_EQ(result.record.close_price, bar.close);
    EXPECT_DOUBLE_EQ(result.record.quote_volume_24h, 123.0);
}

// ===========================================================================
// Percentile
// ===========================================================================

TEST(ReturnPercentileTest, ShareOfSmallerAbsoluteReturns) {
    std::vector<double> returns{0.001, -0.002, 0.003, -0.004};
    EXPECT_DOUBLE_EQ(return_percentile(returns, 0.0035), 75.0);
    EXPECT_DOUBLE_EQ(return_percentile(returns, -0.01), 100.0);
    EXPECT_DOUBLE_EQ(return_percentile(returns, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(return_percentile({}, 0.5), 0.0);
}
