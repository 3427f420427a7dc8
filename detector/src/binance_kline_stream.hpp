#pragma once
#include "bar_feed.hpp"
#include "config.hpp"
#include <chrono>
#include <string>

// One TLS websocket per subscription on <symbol>@kline_<interval>
class BinanceKlineStream : public BarFeed {
public:
    explicit BinanceKlineStream(const Config& config);

    void run(const std::string& instrument,
             const std::string& interval,
             const UpdateHandler& on_update,
             const std::atomic<bool>& running) override;

private:
    std::string host_;
    std::string port_;
    std::chrono::seconds idle_timeout_;
};
