#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Snapshot or historical request failed (network, HTTP status, malformed body)
class MarketDataUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MarketDataClient {
public:
    virtual ~MarketDataClient() = default;

    // 24h quote volume of every listed instrument; throws MarketDataUnavailable
    virtual std::vector<MarketTicker> fetch_market_snapshot() = 0;

    // Up to `limit` most recent bars, oldest first; the newest may still be open.
    // Throws MarketDataUnavailable.
    virtual std::vector<Bar> fetch_recent_bars(const std::string& instrument,
                                               const std::string& interval,
                                               int limit) = 0;
};
