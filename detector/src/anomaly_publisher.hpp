#pragma once
#include "config.hpp"
#include "types.hpp"
#include <memory>

// Appends newly detected anomalies to a Redis stream
class AnomalyPublisher {
public:
    explicit AnomalyPublisher(const Config& config);
    ~AnomalyPublisher();

    // Failures are logged and reported, never thrown
    bool publish(const AnomalyRecord& record);

    bool check_health();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
