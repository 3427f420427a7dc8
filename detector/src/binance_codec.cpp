#include "binance_codec.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace binance {

namespace {

// Binance sends prices and volumes as strings, times and counts as numbers
double as_double(const json& value) {
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}

int64_t as_int64(const json& value) {
    if (value.is_string()) {
        return std::stoll(value.get<std::string>());
    }
    return value.get<int64_t>();
}

json parse_document(const std::string& payload) {
    try {
        return json::parse(payload);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed JSON: ") + e.what());
    }
}

} // namespace

std::string kline_stream_name(const std::string& instrument, const std::string& interval) {
    return util::to_lower(instrument) + "@kline_" + interval;
}

std::optional<BarUpdate> parse_kline_message(const std::string& payload) {
    json doc = parse_document(payload);

    const json* event = &doc;
    if (doc.contains("stream") && doc.contains("data")) {
        event = &doc["data"];
    }
    if (!event->is_object() || !event->contains("k")) {
        return std::nullopt;
    }

    try {
        const json& k = (*event)["k"];

        BarUpdate bar;
        bar.instrument = k.at("s").get<std::string>();
        bar.interval = k.at("i").get<std::string>();
        bar.open_time_ms = as_int64(k.at("t"));
        bar.close_time_ms = as_int64(k.at("T"));
        bar.open = as_double(k.at("o"));
        bar.high = as_double(k.at("h"));
        bar.low = as_double(k.at("l"));
        bar.close = as_double(k.at("c"));
        bar.volume = as_double(k.at("v"));
        bar.quote_volume = as_double(k.at("q"));
        bar.trade_count = as_int64(k.at("n"));
        bar.is_final = k.at("x").get<bool>();
        return bar;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Malformed kline event: ") + e.what());
    }
}

std::vector<Bar> parse_rest_klines(const std::string& body,
                                   const std::string& instrument,
                                   const std::string& interval,
                                   int64_t now_ms) {
    json doc = parse_document(body);
    if (!doc.is_array()) {
        throw std::runtime_error("Unexpected klines response format");
    }

    std::vector<Bar> bars;
    bars.reserve(doc.size());

    for (const auto& row : doc) {
        try {
            if (!row.is_array() || row.size() < 9) {
                throw std::runtime_error("short row");
            }

            Bar bar;
            bar.instrument = instrument;
            bar.interval = interval;
            bar.open_time_ms = as_int64(row[0]);
            bar.open = as_double(row[1]);
            bar.high = as_double(row[2]);
            bar.low = as_double(row[3]);
            bar.close = as_double(row[4]);
            bar.volume = as_double(row[5]);
            bar.close_time_ms = as_int64(row[6]);
            bar.quote_volume = as_double(row[7]);
            bar.trade_count = as_int64(row[8]);
            bar.is_final = bar.close_time_ms < now_ms;
            bars.push_back(bar);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("Malformed kline row: ") + e.what());
        }
    }

    return bars;
}

std::vector<MarketTicker> parse_ticker_snapshot(const std::string& body) {
    json doc = parse_document(body);
    if (!doc.is_array()) {
        throw std::runtime_error("Unexpected ticker response format");
    }

    std::vector<MarketTicker> tickers;
    tickers.reserve(doc.size());

    for (const auto& item : doc) {
        if (!item.is_object() || !item.contains("symbol") || !item.contains("quoteVolume")) {
            continue;
        }
        try {
            MarketTicker ticker;
            ticker.instrument = item["symbol"].get<std::string>();
            ticker.quote_volume_24h = as_double(item["quoteVolume"]);
            tickers.push_back(ticker);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed ticker entry: {}", e.what());
        }
    }

    return tickers;
}

} // namespace binance
