#pragma once
#include "config.hpp"
#include "market_data_client.hpp"
#include "universe_state.hpp"
#include <string>
#include <vector>

struct SelectionCriteria {
    int top_n = 150;
    double min_quote_volume = 5000.0;
    std::string symbol_suffix = "USDT"; // empty accepts every instrument
};

enum class RefreshStatus {
    Updated,
    Unchanged,
    DataUnavailable // previous universe retained
};

struct RefreshResult {
    RefreshStatus status = RefreshStatus::Unchanged;
    UniverseDiff diff;
};

// Top-N instruments by descending 24h quote volume; ties broken by name
std::vector<std::string> select_top(const std::vector<MarketTicker>& snapshot,
                                    const SelectionCriteria& criteria);

class UniverseSelector {
public:
    UniverseSelector(const Config& config, MarketDataClient& client, UniverseState& state);

    // Fetch a snapshot and apply it; never empties a non-empty universe
    RefreshResult refresh();

private:
    SelectionCriteria criteria_;
    MarketDataClient& client_;
    UniverseState& state_;
};
