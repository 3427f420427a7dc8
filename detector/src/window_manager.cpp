#include "window_manager.hpp"
#include <cmath>

double sample_mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double sample_stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;

    double mean = sample_mean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - mean) * (v - mean);
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

double bar_volatility(const Bar& bar) {
    return bar.close > 0.0 ? (bar.high - bar.low) / bar.close : 0.0;
}

WindowManager::WindowManager(BarStore& store) : store_(store) {
}

std::optional<WindowSummary> WindowManager::summarize(const std::string& instrument,
                                                      const std::string& interval,
                                                      int window_size,
                                                      std::optional<int64_t> before_open_time) {
    if (window_size <= 0) {
        return std::nullopt;
    }

    // One extra bar so every bar in the window has a predecessor close
    auto bars = store_.query_window(instrument, interval,
                                    static_cast<size_t>(window_size) + 1, before_open_time);
    return build_summary(bars, window_size);
}

std::optional<WindowSummary> WindowManager::build_summary(const std::vector<Bar>& bars, int window_size) {
    if (window_size <= 0 || bars.size() < static_cast<size_t>(window_size)) {
        return std::nullopt;
    }

    WindowSummary summary;
    size_t first = bars.size() - static_cast<size_t>(window_size);
    summary.instrument = bars.back().instrument;
    summary.interval = bars.back().interval;
    summary.bars.assign(bars.begin() + static_cast<std::ptrdiff_t>(first), bars.end());

    std::vector<double> volumes;
    std::vector<double> volatilities;
    for (size_t i = first; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        if (i > 0 && bars[i - 1].close > 0.0) {
            summary.returns.push_back((bar.close - bars[i - 1].close) / bars[i - 1].close);
        }
        volumes.push_back(bar.quote_volume);
        volatilities.push_back(bar_volatility(bar));
    }

    summary.return_mean = sample_mean(summary.returns);
    summary.return_stddev = sample_stddev(summary.returns);
    summary.volume_mean = sample_mean(volumes);
    summary.volume_stddev = sample_stddev(volumes);
    summary.volatility_mean = sample_mean(volatilities);
    summary.volatility_stddev = sample_stddev(volatilities);
    return summary;
}
