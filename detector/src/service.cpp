#include "service.hpp"
#include "binance_kline_stream.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <thread>

namespace {

// Refresh cadence while no universe could be established yet
constexpr auto kEmptyUniverseRetry = std::chrono::seconds(30);

} // namespace

Service::Service(const Config& config)
    : config_(config),
      db_(config.db_path),
      bar_store_(db_),
      anomaly_sink_(db_),
      rest_client_(config),
      publisher_(config.redis_host.empty() ? nullptr : std::make_unique<AnomalyPublisher>(config)),
      scoring_engine_(config, bar_store_, anomaly_sink_, universe_, publisher_.get()),
      pipeline_(config, bar_store_, universe_, rest_client_,
                [&config]() { return std::make_unique<BinanceKlineStream>(config); }),
      selector_(config, rest_client_, universe_),
      retention_(config, db_, bar_store_, anomaly_sink_) {

    pipeline_.set_finalized_handler([this](const BarKey& key) {
        scoring_engine_.notify_finalized(key);
    });

    if (config.health_port > 0) {
        health_server_ = std::make_unique<HealthServer>(
            config,
            [this]() { return health(); },
            [this](const AnomalyQuery& query) { return query_anomalies(query); });
    }
}

Service::~Service() {
    shutdown();
}

void Service::run() {
    running_ = true;
    spdlog::info("Detector started: {} bars, window {}, universe top {} refreshed every {} seconds",
                 config_.bar_interval, config_.window_size, config_.universe_top_n,
                 config_.universe_refresh_seconds);

    if (!rest_client_.ping()) {
        spdlog::warn("Market data REST endpoint {} is not reachable yet", config_.rest_base_url);
    }

    scoring_engine_.start();
    retention_.start();
    if (health_server_) {
        health_server_->start();
    }

    while (running_) {
        try {
            refresh_universe();
        } catch (const std::exception& e) {
            spdlog::error("Error in universe refresh: {}", e.what());
        }

        auto period = universe_.size() == 0
            ? std::min<std::chrono::seconds>(kEmptyUniverseRetry, std::chrono::seconds(config_.universe_refresh_seconds))
            : std::chrono::seconds(config_.universe_refresh_seconds);
        auto wake_up_time = std::chrono::steady_clock::now() + period;
        while (running_ && std::chrono::steady_clock::now() < wake_up_time) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    shutdown();
    spdlog::info("Detector run loop finished.");
}

void Service::stop() {
    running_ = false;
}

void Service::shutdown() {
    // Ingestion first so no new bars reach the scoring queue
    pipeline_.stop();
    scoring_engine_.stop();
    retention_.stop();
    if (health_server_) {
        health_server_->stop();
    }
}

void Service::refresh_universe() {
    auto start_time = std::chrono::steady_clock::now();

    auto result = selector_.refresh();
    if (result.status == RefreshStatus::DataUnavailable) {
        // Keep the current universe; still give degraded instruments another chance
        pipeline_.retry_degraded();
        return;
    }

    pipeline_.apply_universe(result.diff);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    auto stats = pipeline_.stats();
    spdlog::info("Universe refresh completed in {} ms: {} subscriptions, {} degraded, "
                 "{} updates applied, {} bars closed, {} backfilled",
                 duration, pipeline_.subscription_count(), universe_.degraded_count(),
                 stats.updates_applied, stats.bars_finalized, stats.backfilled_bars);
}

HealthSnapshot Service::health() {
    HealthSnapshot snapshot;
    snapshot.database_ok = db_.is_healthy();

    try {
        snapshot.stored_row_count = bar_store_.row_count();
        snapshot.anomaly_row_count = anomaly_sink_.row_count();
        {
            std::lock_guard<std::mutex> lock(db_.mutex());
            snapshot.database_bytes = db_.used_bytes();
        }
        if (auto oldest = bar_store_.oldest_open_time()) {
            snapshot.oldest_bar_age = std::chrono::seconds((util::now_ms() - *oldest) / 1000);
        }
    } catch (const StoreError& e) {
        spdlog::warn("Health probe could not read storage: {}", e.what());
        snapshot.database_ok = false;
    }

    snapshot.active_universe_size = universe_.size();
    snapshot.degraded_instruments = universe_.degraded_count();
    snapshot.active_subscriptions = pipeline_.subscription_count();
    snapshot.last_scoring_pass = scoring_engine_.last_pass_time();
    snapshot.last_retention_sweep = retention_.last_sweep_time();
    snapshot.retention_consecutive_failures = retention_.consecutive_failures();
    if (publisher_) {
        snapshot.publisher_ok = publisher_->check_health();
    }
    return snapshot;
}

std::vector<AnomalyRecord> Service::query_anomalies(const AnomalyQuery& query) {
    return anomaly_sink_.query(query);
}
