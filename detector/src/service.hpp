#pragma once

#include "anomaly_publisher.hpp"
#include "anomaly_sink.hpp"
#include "bar_store.hpp"
#include "binance_rest_client.hpp"
#include "config.hpp"
#include "health_server.hpp"
#include "ingestion_pipeline.hpp"
#include "retention_manager.hpp"
#include "scoring_engine.hpp"
#include "sqlite_db.hpp"
#include "universe_selector.hpp"
#include "universe_state.hpp"
#include <atomic>
#include <chrono>
#include <memory>

class Service {
public:
    explicit Service(const Config& config);
    ~Service();

    // Blocks running the universe refresh loop until stop()
    void run();

    // Safe to call from a signal handler; run() performs the teardown
    void stop();

    HealthSnapshot health();
    std::vector<AnomalyRecord> query_anomalies(const AnomalyQuery& query);

private:
    void refresh_universe();
    void shutdown();

    const Config& config_;
    SqliteDatabase db_;
    BarStore bar_store_;
    AnomalySink anomaly_sink_;
    UniverseState universe_;
    BinanceRestClient rest_client_;
    std::unique_ptr<AnomalyPublisher> publisher_;
    ScoringEngine scoring_engine_;
    IngestionPipeline pipeline_;
    UniverseSelector selector_;
    RetentionManager retention_;
    std::unique_ptr<HealthServer> health_server_;

    std::atomic<bool> running_{false};
};
