#include "json_schemas.hpp"
#include "util.hpp"

nlohmann::json anomaly_to_json(const AnomalyRecord& record) {
    nlohmann::json j;
    j["symbol"] = record.instrument;
    j["timestamp"] = record.timestamp;
    j["interval_type"] = record.interval_type;
    j["cur_return"] = record.cur_return;
    j["cur_abs_return"] = record.cur_abs_return;
    j["close_price"] = record.close_price;
    j["cur_volume"] = record.cur_volume;
    j["cur_volatility"] = record.cur_volatility;
    j["price_zscore"] = record.price_zscore;
    j["price_percentile"] = record.price_percentile;
    j["volume_zscore"] = record.volume_zscore;
    j["volatility_zscore"] = record.volatility_zscore;
    j["anomaly_score"] = record.anomaly_score;
    j["price_score"] = record.price_score;
    j["volume_score"] = record.volume_score;
    j["volatility_score"] = record.volatility_score;
    j["anomaly_reasons"] = record.reasons;
    j["quote_volume_24h"] = record.quote_volume_24h;
    j["is_anomaly"] = record.is_anomaly;
    j["created_at"] = record.created_at;
    return j;
}

nlohmann::json health_to_json(const HealthSnapshot& health) {
    nlohmann::json j;
    j["stored_row_count"] = health.stored_row_count;
    j["anomaly_row_count"] = health.anomaly_row_count;
    j["database_bytes"] = health.database_bytes;
    j["database_ok"] = health.database_ok;
    j["active_universe_size"] = health.active_universe_size;
    j["degraded_instruments"] = health.degraded_instruments;
    j["active_subscriptions"] = health.active_subscriptions;
    j["retention_consecutive_failures"] = health.retention_consecutive_failures;
    if (health.publisher_ok) {
        j["publisher_ok"] = *health.publisher_ok;
    }

    if (health.oldest_bar_age) {
        j["oldest_bar_age_seconds"] = health.oldest_bar_age->count();
    } else {
        j["oldest_bar_age_seconds"] = nullptr;
    }
    if (health.last_scoring_pass) {
        j["last_scoring_pass"] = util::format_timestamp(*health.last_scoring_pass);
    } else {
        j["last_scoring_pass"] = nullptr;
    }
    if (health.last_retention_sweep) {
        j["last_retention_sweep"] = util::format_timestamp(*health.last_retention_sweep);
    } else {
        j["last_retention_sweep"] = nullptr;
    }
    return j;
}
