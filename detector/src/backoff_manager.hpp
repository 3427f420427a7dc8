#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-key exponential backoff shared by feed reconnects and backfill retries.
// Keys are free-form, e.g. "feed:BTCUSDT" or "backfill:BTCUSDT".
class BackoffManager {
public:
    BackoffManager(double base_delay_seconds = 1.0, double max_delay_seconds = 60.0, double multiplier = 2.0);

    // Record a failure and return the delay to wait before the next attempt
    std::chrono::milliseconds record_failure(const std::string& key);

    // Clear the failure streak for a key
    void record_success(const std::string& key);

    int failure_count(const std::string& key) const;

    // Drop all state for a key, e.g. when its instrument leaves the universe
    void forget(const std::string& key);

private:
    std::chrono::milliseconds calculate_delay(int failure_count) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int> failures_;
    double base_delay_seconds_;
    double max_delay_seconds_;
    double multiplier_;
};
