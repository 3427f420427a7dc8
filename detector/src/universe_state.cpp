#include "universe_state.hpp"
#include <algorithm>

UniverseDiff UniverseState::replace(const std::vector<std::string>& instruments) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> previous(active_.begin(), active_.end());
    std::set<std::string> next(instruments.begin(), instruments.end());

    UniverseDiff diff;
    for (const auto& instrument : instruments) {
        if (!previous.count(instrument)) diff.added.push_back(instrument);
    }
    for (const auto& instrument : active_) {
        if (!next.count(instrument)) diff.removed.push_back(instrument);
    }

    active_ = instruments;
    return diff;
}

void UniverseState::update_volumes(const std::unordered_map<std::string, double>& quote_volumes_24h) {
    std::lock_guard<std::mutex> lock(mutex_);
    quote_volumes_ = quote_volumes_24h;
}

std::vector<std::string> UniverseState::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool UniverseState::is_active(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(active_.begin(), active_.end(), instrument) != active_.end();
}

size_t UniverseState::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void UniverseState::mark_degraded(const std::string& instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    degraded_.insert(instrument);
}

void UniverseState::clear_degraded(const std::string& instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    degraded_.erase(instrument);
}

bool UniverseState::is_degraded(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_.count(instrument) > 0;
}

std::vector<std::string> UniverseState::degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(degraded_.begin(), degraded_.end());
}

size_t UniverseState::degraded_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_.size();
}

double UniverseState::quote_volume_24h(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quote_volumes_.find(instrument);
    return it == quote_volumes_.end() ? 0.0 : it->second;
}
