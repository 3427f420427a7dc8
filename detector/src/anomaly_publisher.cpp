#include "anomaly_publisher.hpp"
#include "json_schemas.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <unordered_map>

class AnomalyPublisher::Impl {
public:
    explicit Impl(const Config& config) : stream_(config.redis_stream) {
        try {
            sw::redis::ConnectionOptions connection_opts;
            connection_opts.host = config.redis_host;
            connection_opts.port = config.redis_port;
            connection_opts.socket_timeout = std::chrono::milliseconds(config.http_timeout_ms);

            if (!config.redis_password.empty()) {
                connection_opts.password = config.redis_password;
            }

            sw::redis::ConnectionPoolOptions pool_opts;
            pool_opts.size = 2;

            redis_ = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);

            spdlog::info("Anomalies will be published to Redis {}:{} stream {}",
                         config.redis_host, config.redis_port, stream_);
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_ = nullptr;
        }
    }

    bool publish(const AnomalyRecord& record) {
        if (!redis_) {
            spdlog::debug("Redis client not initialized, anomaly for {} not published", record.instrument);
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields;
            fields["symbol"] = record.instrument;
            fields["data"] = anomaly_to_json(record).dump();

            redis_->xadd(stream_, "*", fields.begin(), fields.end());
            spdlog::debug("Published anomaly {} {} to {}", record.instrument, record.timestamp, stream_);
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to publish anomaly for {}: {}", record.instrument, e.what());
            return false;
        }
    }

    bool check_health() {
        if (!redis_) {
            return false;
        }

        try {
            redis_->ping();
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Redis health check failed: {}", e.what());
            return false;
        }
    }

private:
    std::string stream_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

AnomalyPublisher::AnomalyPublisher(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
AnomalyPublisher::~AnomalyPublisher() = default;
bool AnomalyPublisher::publish(const AnomalyRecord& record) { return pImpl_->publish(record); }
bool AnomalyPublisher::check_health() { return pImpl_->check_health(); }
