#pragma once
#include "bar_store.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

// Sample statistics
double sample_mean(const std::vector<double>& values);
double sample_stddev(const std::vector<double>& values); // Bessel-corrected, 0 when n < 2

// Volatility proxy of a bar: (high - low) / close
double bar_volatility(const Bar& bar);

// Stateless: every call recomputes the summary from the Bar Store
class WindowManager {
public:
    explicit WindowManager(BarStore& store);

    // Summary of the last `window_size` closed bars (strictly before
    // `before_open_time` when given). Empty when fewer bars exist.
    // Throws StoreError.
    std::optional<WindowSummary> summarize(const std::string& instrument,
                                           const std::string& interval,
                                           int window_size,
                                           std::optional<int64_t> before_open_time = std::nullopt);

    // Pure computation over bars ordered oldest first; `window_size` trailing
    // bars form the window and an extra leading bar supplies the first return.
    static std::optional<WindowSummary> build_summary(const std::vector<Bar>& bars, int window_size);

private:
    BarStore& store_;
};
