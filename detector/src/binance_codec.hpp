#pragma once
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Decoders for Binance USD-M futures payloads. Malformed documents throw
// std::runtime_error; well-formed frames of another kind yield nothing.
namespace binance {

// "btcusdt@kline_15m"
std::string kline_stream_name(const std::string& instrument, const std::string& interval);

// Kline event, bare or wrapped in a combined-stream envelope
std::optional<BarUpdate> parse_kline_message(const std::string& payload);

// GET /fapi/v1/klines array rows. A row closing after `now_ms` is still forming.
std::vector<Bar> parse_rest_klines(const std::string& body,
                                   const std::string& instrument,
                                   const std::string& interval,
                                   int64_t now_ms);

// GET /fapi/v1/ticker/24hr; entries without symbol or quoteVolume are skipped
std::vector<MarketTicker> parse_ticker_snapshot(const std::string& body);

} // namespace binance
