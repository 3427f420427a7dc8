#include "backoff_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffManager::BackoffManager(double base_delay_seconds, double max_delay_seconds, double multiplier)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      multiplier_(multiplier) {
}

std::chrono::milliseconds BackoffManager::record_failure(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return calculate_delay(++failures_[key]);
}

void BackoffManager::record_success(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = failures_.find(key);
    if (it != failures_.end()) {
        it->second = 0;
    }
}

int BackoffManager::failure_count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = failures_.find(key);
    return it == failures_.end() ? 0 : it->second;
}

void BackoffManager::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(key);
}

std::chrono::milliseconds BackoffManager::calculate_delay(int failure_count) const {
    if (failure_count <= 0) {
        return std::chrono::milliseconds(0);
    }

    // base * multiplier^(n-1), capped, then +-10% jitter
    double delay_seconds = base_delay_seconds_ * std::pow(multiplier_, failure_count - 1);
    delay_seconds = std::min(delay_seconds, max_delay_seconds_);
    delay_seconds = util::random_jitter(delay_seconds, 0.1);

    return std::chrono::milliseconds(static_cast<int64_t>(delay_seconds * 1000));
}
