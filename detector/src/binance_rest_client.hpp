#pragma once
#include "config.hpp"
#include "market_data_client.hpp"
#include <memory>

// Binance USD-M futures REST adapter for snapshots and historical bars
class BinanceRestClient : public MarketDataClient {
public:
    explicit BinanceRestClient(const Config& config);
    ~BinanceRestClient() override;

    std::vector<MarketTicker> fetch_market_snapshot() override;
    std::vector<Bar> fetch_recent_bars(const std::string& instrument,
                                       const std::string& interval,
                                       int limit) override;

    // Cheap connectivity probe
    bool ping();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
