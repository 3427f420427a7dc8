// scoring_engine_test.cpp: end-to-end scoring of finalized bars against the
// store: recording, idempotency, degraded instruments and pass budgeting.

#include <gtest/gtest.h>

#include "anomaly_sink.hpp"
#include "bar_store.hpp"
#include "scoring_engine.hpp"
#include "sqlite_db.hpp"
#include "test_helpers.hpp"
#include "universe_state.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace test_helpers;

class ScoringEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = test_config(16);
        universe.replace({"BTCUSDT"});
    }

    // 17 quiet closed bars (indices 0..16) followed by a +3% bar at index 17
    BarKey seed_spike() {
        auto bars = make_quiet_series("BTCUSDT", T0, 17);
        for (const auto& bar : bars) {
            EXPECT_EQ(store.upsert(bar), UpsertResult::Inserted);
        }
        auto spike = make_bar("BTCUSDT", T0 + 17 * BAR_MS, bars.back().close * 1.030, 1000.0, 0.005);
        EXPECT_EQ(store.upsert(spike), UpsertResult::Inserted);
        last_close = spike.close;
        return spike.key();
    }

    // 17 closed bars whose 16 returns alternate +/-a with sample stddev exactly
    // 0.010 and mean 0; quote volume and range alternate around 1000 and 0.5%
    void seed_unit_volatility() {
        const double a = 0.010 * std::sqrt(15.0 / 16.0);
        auto bars = make_quiet_series("BTCUSDT", T0, 17, 100.0, a);
        for (const auto& bar : bars) {
            EXPECT_EQ(store.upsert(bar), UpsertResult::Inserted);
        }
        last_close = bars.back().close;
    }

    BarKey add_bar(int index, double close) {
        auto bar = make_bar("BTCUSDT", T0 + index * BAR_MS, close, 1000.0, 0.005);
        EXPECT_EQ(store.upsert(bar), UpsertResult::Inserted);
        last_close = close;
        return bar.key();
    }

    Config config;
    SqliteDatabase db{":memory:"};
    BarStore store{db};
    AnomalySink sink{db};
    UniverseState universe;
    double last_close = 0.0;
};

// ===========================================================================
// Scoring a single bar
// ===========================================================================

TEST_F(ScoringEngineTest, PriceSpikeIsRecordedWithPriceReason) {
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();

    EXPECT_EQ(engine.score_bar(key), ScoreOutcome::Recorded);

    auto records = sink.query(AnomalyQuery{});
    ASSERT_EQ(records.size(), 1u);
    const auto& r = records.front();
    EXPECT_EQ(r.instrument, "BTCUSDT");
    EXPECT_EQ(r.interval_type, "15m");
    EXPECT_EQ(r.timestamp, key.open_time_ms / 1000);
    EXPECT_NEAR(r.cur_return, 0.030, 1e-9);
    EXPECT_GT(r.price_zscore, 25.0);
    EXPECT_EQ(r.reasons, std::vector<std::string>{"price"});
    EXPECT_TRUE(r.is_anomaly);
    EXPECT_NEAR(r.anomaly_score, 0.4 * r.price_zscore, 1e-9);
    EXPECT_DOUBLE_EQ(r.close_price, last_close);
}

TEST_F(ScoringEngineTest, ThreeSigmaReturnRecordedThenSmallReturnIgnored) {
    ScoringEngine engine(config, store, sink, universe);
    seed_unit_volatility();

    auto spike = add_bar(17, last_close * 1.030);
    EXPECT_EQ(engine.score_bar(spike), ScoreOutcome::Recorded);

    auto records = sink.query(AnomalyQuery{});
    ASSERT_EQ(records.size(), 1u);
    const auto& r = records.front();
    EXPECT_NEAR(r.cur_return, 0.030, 1e-9);
    EXPECT_NEAR(r.price_zscore, 3.0, 0.01);
    EXPECT_NEAR(r.volume_zscore, 0.0, 1e-6);
    EXPECT_EQ(r.reasons, std::vector<std::string>{"price"});
    EXPECT_TRUE(r.is_anomaly);
    EXPECT_GT(r.anomaly_score, 0.0);

    auto quiet = add_bar(18, last_close * 1.002);
    EXPECT_EQ(engine.score_bar(quiet), ScoreOutcome::BelowThreshold);
    EXPECT_EQ(sink.row_count(), 1);
}

TEST_F(ScoringEngineTest, SmallReturnScoresAboutPointTwoSigma) {
    config.record_all_bars = true;
    ScoringEngine engine(config, store, sink, universe);
    seed_unit_volatility();

    auto quiet = add_bar(17, last_close * 1.002);
    EXPECT_EQ(engine.score_bar(quiet), ScoreOutcome::Recorded);

    auto records = sink.query(AnomalyQuery{});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_NEAR(records.front().price_zscore, 0.2, 0.01);
    EXPECT_FALSE(records.front().is_anomaly);
    EXPECT_EQ(records.front().reasons, std::vector<std::string>{"normal"});
}

TEST_F(ScoringEngineTest, QuietBarAfterSpikeIsBelowThreshold) {
    ScoringEngine engine(config, store, sink, universe);
    seed_spike();
    auto quiet = add_bar(18, last_close * 1.002);

    EXPECT_EQ(engine.score_bar(quiet), ScoreOutcome::BelowThreshold);
    EXPECT_EQ(sink.row_count(), 0);
}

TEST_F(ScoringEngineTest, RecordAllBarsPersistsNormalBars) {
    config.record_all_bars = true;
    ScoringEngine engine(config, store, sink, universe);
    seed_spike();
    auto quiet = add_bar(18, last_close * 1.002);

    EXPECT_EQ(engine.score_bar(quiet), ScoreOutcome::Recorded);

    auto records = sink.query(AnomalyQuery{});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records.front().is_anomaly);
    EXPECT_DOUBLE_EQ(records.front().anomaly_score, 0.0);
    EXPECT_EQ(records.front().reasons, std::vector<std::string>{"normal"});

    AnomalyQuery anomalies_only;
    anomalies_only.anomaly_only = true;
    EXPECT_TRUE(sink.query(anomalies_only).empty());
}

TEST_F(ScoringEngineTest, ScoringTwiceRecordsOnce) {
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();

    EXPECT_EQ(engine.score_bar(key), ScoreOutcome::Recorded);
    EXPECT_EQ(engine.score_bar(key), ScoreOutcome::Duplicate);
    EXPECT_EQ(sink.row_count(), 1);
}

TEST_F(ScoringEngineTest, ShortHistoryIsInsufficientData) {
    ScoringEngine engine(config, store, sink, universe);
    for (const auto& bar : make_quiet_series("BTCUSDT", T0, 10)) {
        store.upsert(bar);
    }
    BarKey key{"BTCUSDT", "15m", T0 + 9 * BAR_MS};

    EXPECT_EQ(engine.score_bar(key), ScoreOutcome::InsufficientData);
    EXPECT_EQ(sink.row_count(), 0);
}

TEST_F(ScoringEngineTest, OpenOrMissingBarsAreSkipped) {
    ScoringEngine engine(config, store, sink, universe);
    seed_spike();

    EXPECT_EQ(engine.score_bar(BarKey{"BTCUSDT", "15m", T0 + 40 * BAR_MS}), ScoreOutcome::Skipped);

    auto open = make_bar("BTCUSDT", T0 + 18 * BAR_MS, last_close * 1.05, 1000.0, 0.005, false);
    store.upsert(open);
    EXPECT_EQ(engine.score_bar(open.key()), ScoreOutcome::Skipped);
}

TEST_F(ScoringEngineTest, DegradedInstrumentIsSkipped) {
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();
    universe.mark_degraded("BTCUSDT");

    EXPECT_EQ(engine.score_bar(key), ScoreOutcome::Skipped);
    EXPECT_EQ(sink.row_count(), 0);

    universe.clear_degraded("BTCUSDT");
    EXPECT_EQ(engine.score_bar(key), ScoreOutcome::Recorded);
}

TEST_F(ScoringEngineTest, UsesSnapshotQuoteVolume) {
    universe.update_volumes({{"BTCUSDT", 7.5e9}});
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();

    ASSERT_EQ(engine.score_bar(key), ScoreOutcome::Recorded);
    EXPECT_DOUBLE_EQ(sink.query(AnomalyQuery{}).front().quote_volume_24h, 7.5e9);
}

// ===========================================================================
// Passes
// ===========================================================================

TEST_F(ScoringEngineTest, NotificationsCollapseWhileQueued) {
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();

    engine.notify_finalized(key);
    engine.notify_finalized(key);
    EXPECT_EQ(engine.pending(), 1u);

    auto summary = engine.run_pass(false);
    EXPECT_EQ(summary.scored, 1u);
    EXPECT_EQ(summary.recorded, 1u);
    EXPECT_EQ(engine.pending(), 0u);
    EXPECT_TRUE(engine.last_pass_time().has_value());
}

TEST_F(ScoringEngineTest, RescanIsIdempotentAcrossPasses) {
    ScoringEngine engine(config, store, sink, universe);
    seed_spike();

    auto first = engine.run_pass(true);
    EXPECT_EQ(first.recorded, 1u);

    auto second = engine.run_pass(true);
    EXPECT_EQ(second.scored, 1u);
    EXPECT_EQ(second.recorded, 0u);
    EXPECT_EQ(sink.row_count(), 1);
}

TEST_F(ScoringEngineTest, RescanIgnoresDegradedInstruments) {
    ScoringEngine engine(config, store, sink, universe);
    seed_spike();
    universe.mark_degraded("BTCUSDT");

    auto summary = engine.run_pass(true);
    EXPECT_EQ(summary.scored, 0u);
}

TEST_F(ScoringEngineTest, ExhaustedBudgetDefersRemainingWork) {
    config.scoring_pass_budget_ms = 0;
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();

    engine.notify_finalized(key);
    auto summary = engine.run_pass(false);
    EXPECT_EQ(summary.scored, 0u);
    EXPECT_EQ(summary.deferred, 1u);
    EXPECT_EQ(engine.pending(), 1u);
    EXPECT_EQ(sink.row_count(), 0);
}

TEST_F(ScoringEngineTest, BackgroundWorkerScoresNotifiedBars) {
    ScoringEngine engine(config, store, sink, universe);
    auto key = seed_spike();

    engine.start();
    engine.notify_finalized(key);
    EXPECT_TRUE(wait_for([&]() { return sink.row_count() == 1; }));
    engine.stop();

    EXPECT_EQ(engine.pending(), 0u);
}
