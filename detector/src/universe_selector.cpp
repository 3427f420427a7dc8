#include "universe_selector.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>
#include <unordered_map>

std::vector<std::string> select_top(const std::vector<MarketTicker>& snapshot,
                                    const SelectionCriteria& criteria) {
    std::vector<MarketTicker> eligible;
    for (const auto& ticker : snapshot) {
        if (ticker.instrument.empty() || !std::isfinite(ticker.quote_volume_24h)) continue;
        if (!criteria.symbol_suffix.empty() && !util::ends_with(ticker.instrument, criteria.symbol_suffix)) continue;
        if (ticker.quote_volume_24h < criteria.min_quote_volume) continue;
        eligible.push_back(ticker);
    }

    std::sort(eligible.begin(), eligible.end(), [](const MarketTicker& a, const MarketTicker& b) {
        if (a.quote_volume_24h != b.quote_volume_24h) return a.quote_volume_24h > b.quote_volume_24h;
        return a.instrument < b.instrument;
    });

    std::vector<std::string> selected;
    std::set<std::string> seen;
    for (const auto& ticker : eligible) {
        if (static_cast<int>(selected.size()) >= criteria.top_n) break;
        if (!seen.insert(ticker.instrument).second) continue;
        selected.push_back(ticker.instrument);
    }
    return selected;
}

UniverseSelector::UniverseSelector(const Config& config, MarketDataClient& client, UniverseState& state)
    : client_(client), state_(state) {
    criteria_.top_n = config.universe_top_n;
    criteria_.min_quote_volume = config.universe_min_quote_volume;
    criteria_.symbol_suffix = config.universe_symbol_suffix;
}

RefreshResult UniverseSelector::refresh() {
    RefreshResult result;

    std::vector<MarketTicker> snapshot;
    try {
        snapshot = client_.fetch_market_snapshot();
    } catch (const MarketDataUnavailable& e) {
        spdlog::warn("Market snapshot unavailable, keeping {} instruments: {}", state_.size(), e.what());
        result.status = RefreshStatus::DataUnavailable;
        return result;
    }

    if (snapshot.empty()) {
        spdlog::warn("Market snapshot is empty, keeping {} instruments", state_.size());
        result.status = RefreshStatus::DataUnavailable;
        return result;
    }

    auto selected = select_top(snapshot, criteria_);
    if (selected.empty()) {
        spdlog::warn("No instrument passed the universe filters, keeping {} instruments", state_.size());
        result.status = RefreshStatus::DataUnavailable;
        return result;
    }

    std::unordered_map<std::string, double> volumes;
    for (const auto& ticker : snapshot) {
        volumes[ticker.instrument] = ticker.quote_volume_24h;
    }
    state_.update_volumes(volumes);

    result.diff = state_.replace(selected);
    result.status = result.diff.empty() ? RefreshStatus::Unchanged : RefreshStatus::Updated;

    spdlog::info("Universe refreshed: {} instruments (+{} / -{})",
                 selected.size(), result.diff.added.size(), result.diff.removed.size());
    return result;
}
