#include "binance_rest_client.hpp"
#include "binance_codec.hpp"
#include "util.hpp"
#include <algorithm>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace {

// /fapi/v1/klines accepts at most 1500 rows per request
constexpr int kMaxKlinesLimit = 1500;

} // namespace

class BinanceRestClient::Impl {
public:
    explicit Impl(const Config& config)
        : base_url_(config.rest_base_url),
          timeout_ms_(config.http_timeout_ms) {}

    std::vector<MarketTicker> fetch_market_snapshot() {
        spdlog::debug("Fetching 24h ticker snapshot...");

        auto response = get("/fapi/v1/ticker/24hr", cpr::Parameters{});
        try {
            auto tickers = binance::parse_ticker_snapshot(response.text);
            spdlog::debug("Fetched {} tickers", tickers.size());
            return tickers;
        } catch (const std::runtime_error& e) {
            throw MarketDataUnavailable(std::string("Ticker snapshot: ") + e.what());
        }
    }

    std::vector<Bar> fetch_recent_bars(const std::string& instrument,
                                       const std::string& interval,
                                       int limit) {
        limit = std::clamp(limit, 1, kMaxKlinesLimit);
        spdlog::debug("Fetching {} {} klines for {}", limit, interval, instrument);

        auto response = get("/fapi/v1/klines", cpr::Parameters{
            {"symbol", instrument},
            {"interval", interval},
            {"limit", std::to_string(limit)}
        });

        try {
            return binance::parse_rest_klines(response.text, instrument, interval, util::now_ms());
        } catch (const std::runtime_error& e) {
            throw MarketDataUnavailable("Klines for " + instrument + ": " + e.what());
        }
    }

    bool ping() {
        auto response = cpr::Get(
            cpr::Url{base_url_ + "/fapi/v1/ping"},
            cpr::Timeout{timeout_ms_}
        );
        return !response.error && response.status_code == 200;
    }

private:
    cpr::Response get(const std::string& path, cpr::Parameters params) {
        auto response = cpr::Get(
            cpr::Url{base_url_ + path},
            params,
            cpr::Timeout{timeout_ms_},
            cpr::Header{{"User-Agent", "PerpScout/1.0"}}
        );

        if (response.error) {
            throw MarketDataUnavailable("GET " + path + " failed: " + response.error.message);
        }
        if (response.status_code != 200) {
            if (util::is_network_error(static_cast<int>(response.status_code))) {
                spdlog::warn("GET {} throttled or unavailable, status: {}", path, response.status_code);
            }
            throw MarketDataUnavailable("GET " + path + " returned status " +
                                        std::to_string(response.status_code));
        }
        return response;
    }

    std::string base_url_;
    int timeout_ms_;
};

BinanceRestClient::BinanceRestClient(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
BinanceRestClient::~BinanceRestClient() = default;
std::vector<MarketTicker> BinanceRestClient::fetch_market_snapshot() { return pImpl_->fetch_market_snapshot(); }
std::vector<Bar> BinanceRestClient::fetch_recent_bars(const std::string& instrument, const std::string& interval, int limit) {
    return pImpl_->fetch_recent_bars(instrument, interval, limit);
}
bool BinanceRestClient::ping() { return pImpl_->ping(); }
