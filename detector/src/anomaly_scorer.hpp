#pragma once
#include "config.hpp"
#include "types.hpp"

struct ScoringThresholds {
    double price_z = 2.5;
    double volume_z = 2.0;
    double volatility_z = 2.0;
    double min_abs_return = 0.005;

    double weight_price = 0.4;
    double weight_volume = 0.3;
    double weight_volatility = 0.3;

    static ScoringThresholds from_config(const Config& config);
};

struct ScoreResult {
    AnomalyRecord record;
    bool triggered = false; // composite score is nonzero
};

double z_score(double value, double mean, double stddev);

// Share of window |returns| strictly below |current_return|, as 0..100
double return_percentile(const std::vector<double>& window_returns, double current_return);

// Scores `current` against the window of closed bars preceding it.
// The window must be non-empty; its newest bar supplies the previous close.
ScoreResult score_bar(const Bar& current,
                      const WindowSummary& window,
                      double quote_volume_24h,
                      const ScoringThresholds& thresholds);
