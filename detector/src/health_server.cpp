#include "health_server.hpp"
#include "json_schemas.hpp"
#include "sqlite_db.hpp"
#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace {

constexpr int kRetentionFailureLimit = 3;
constexpr int kMaxQueryLimit = 1000;

AnomalyQuery parse_query(const httplib::Request& req) {
    AnomalyQuery query;
    if (req.has_param("symbol")) {
        query.instrument = util::to_upper(req.get_param_value("symbol"));
    }
    if (req.has_param("min_score")) {
        query.min_score = std::stod(req.get_param_value("min_score"));
    }
    if (req.has_param("anomaly_only")) {
        auto value = util::to_lower(req.get_param_value("anomaly_only"));
        query.anomaly_only = value == "1" || value == "true";
    }
    if (req.has_param("interval")) {
        query.interval_type = req.get_param_value("interval");
    }
    if (req.has_param("since")) {
        query.since_timestamp = std::stoll(req.get_param_value("since"));
    }
    if (req.has_param("limit")) {
        query.limit = std::clamp(std::stoi(req.get_param_value("limit")), 1, kMaxQueryLimit);
    }
    if (req.has_param("order")) {
        query.order_by_score = req.get_param_value("order") == "score";
    }
    return query;
}

} // namespace

bool is_healthy(const HealthSnapshot& health) {
    return health.database_ok && health.retention_consecutive_failures < kRetentionFailureLimit;
}

class HealthServer::Impl {
public:
    Impl(const Config& config, HealthProvider health, AnomalyProvider anomalies)
        : config_(config), health_(std::move(health)), anomalies_(std::move(anomalies)) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body;
            body["service"] = config_.service_name;
            body["timestamp"] = util::format_timestamp(std::chrono::system_clock::now());

            try {
                auto snapshot = health_();
                bool healthy = is_healthy(snapshot);
                body["status"] = healthy ? "healthy" : "unhealthy";
                body["components"] = health_to_json(snapshot);
                res.status = healthy ? 200 : 503;
            } catch (const StoreError& e) {
                body["status"] = "unhealthy";
                body["error"] = e.what();
                res.status = 503;
            }

            res.set_content(body.dump(2), "application/json");
        });

        auto handle_anomalies = [this](const httplib::Request& req, httplib::Response& res, bool top) {
            AnomalyQuery query;
            try {
                query = parse_query(req);
            } catch (const std::exception& e) {
                nlohmann::json error = {{"error", std::string("invalid query parameter: ") + e.what()}};
                res.status = 400;
                res.set_content(error.dump(), "application/json");
                return;
            }
            if (top) {
                query.order_by_score = true;
            }

            try {
                nlohmann::json body = nlohmann::json::array();
                for (const auto& record : anomalies_(query)) {
                    body.push_back(anomaly_to_json(record));
                }
                res.status = 200;
                res.set_content(body.dump(), "application/json");
            } catch (const StoreError& e) {
                spdlog::error("Anomaly query failed: {}", e.what());
                nlohmann::json error = {{"error", "storage unavailable"}};
                res.status = 503;
                res.set_content(error.dump(), "application/json");
            }
        };

        server_.Get("/api/anomalies", [handle_anomalies](const httplib::Request& req, httplib::Response& res) {
            handle_anomalies(req, res, false);
        });
        server_.Get("/api/anomalies/top", [handle_anomalies](const httplib::Request& req, httplib::Response& res) {
            handle_anomalies(req, res, true);
        });

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server failed to listen on {}:{}",
                              config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (running_.exchange(false)) {
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    const Config& config_;
    HealthProvider health_;
    AnomalyProvider anomalies_;
    httplib::Server server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, HealthProvider health, AnomalyProvider anomalies)
    : pImpl_(std::make_unique<Impl>(config, std::move(health), std::move(anomalies))) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}
