#include "anomaly_scorer.hpp"
#include "window_manager.hpp"
#include "util.hpp"
#include <cmath>

ScoringThresholds ScoringThresholds::from_config(const Config& config) {
    ScoringThresholds t;
    t.price_z = config.price_z_threshold;
    t.volume_z = config.volume_z_threshold;
    t.volatility_z = config.volatility_z_threshold;
    t.min_abs_return = config.min_abs_return;
    t.weight_price = config.weight_price;
    t.weight_volume = config.weight_volume;
    t.weight_volatility = config.weight_volatility;
    return t;
}

double z_score(double value, double mean, double stddev) {
    if (stddev <= 0.0 || !std::isfinite(stddev)) {
        return 0.0;
    }
    return (value - mean) / stddev;
}

double return_percentile(const std::vector<double>& window_returns, double current_return) {
    if (window_returns.empty()) return 0.0;

    double current_abs = std::fabs(current_return);
    size_t below = 0;
    for (double r : window_returns) {
        if (std::fabs(r) < current_abs) ++below;
    }
    return 100.0 * static_cast<double>(below) / static_cast<double>(window_returns.size());
}

ScoreResult score_bar(const Bar& current,
                      const WindowSummary& window,
                      double quote_volume_24h,
                      const ScoringThresholds& thresholds) {
    ScoreResult result;
    AnomalyRecord& record = result.record;

    double prev_close = window.last_bar().close;
    double cur_return = prev_close > 0.0 ? (current.close - prev_close) / prev_close : 0.0;
    double cur_volatility = bar_volatility(current);

    record.instrument = current.instrument;
    record.timestamp = current.open_time_ms / 1000;
    record.interval_type = current.interval;
    record.cur_return = cur_return;
    record.cur_abs_return = std::fabs(cur_return);
    record.close_price = current.close;
    record.cur_volume = current.quote_volume;
    record.cur_volatility = cur_volatility;
    record.quote_volume_24h = quote_volume_24h;

    record.price_zscore = z_score(cur_return, window.return_mean, window.return_stddev);
    record.volume_zscore = z_score(current.quote_volume, window.volume_mean, window.volume_stddev);
    record.volatility_zscore = z_score(cur_volatility, window.volatility_mean, window.volatility_stddev);
    record.price_percentile = return_percentile(window.returns, cur_return);

    bool price_hit = std::fabs(record.price_zscore) >= thresholds.price_z &&
                     record.cur_abs_return >= thresholds.min_abs_return;
    bool volume_hit = std::fabs(record.volume_zscore) >= thresholds.volume_z;
    bool volatility_hit = std::fabs(record.volatility_zscore) >= thresholds.volatility_z;

    if (price_hit) {
        record.price_score = thresholds.weight_price * std::fabs(record.price_zscore);
        record.reasons.push_back("price");
    }
    if (volume_hit) {
        record.volume_score = thresholds.weight_volume * std::fabs(record.volume_zscore);
        record.reasons.push_back("volume");
    }
    if (volatility_hit) {
        record.volatility_score = thresholds.weight_volatility * std::fabs(record.volatility_zscore);
        record.reasons.push_back("volatility");
    }

    record.anomaly_score = record.price_score + record.volume_score + record.volatility_score;
    result.triggered = record.anomaly_score > 0.0;
    record.is_anomaly = result.triggered;
    if (record.reasons.empty()) {
        record.reasons.push_back("normal");
    }
    record.created_at = util::now_seconds();

    return result;
}
