#pragma once
#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <vector>

// Health endpoint and read-only anomaly queries over HTTP
class HealthServer {
public:
    using HealthProvider = std::function<HealthSnapshot()>;
    using AnomalyProvider = std::function<std::vector<AnomalyRecord>(const AnomalyQuery&)>;

    HealthServer(const Config& config, HealthProvider health, AnomalyProvider anomalies);
    ~HealthServer();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// HTTP 503 when the database is down or retention keeps failing
bool is_healthy(const HealthSnapshot& health);
