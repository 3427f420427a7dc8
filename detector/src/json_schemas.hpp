#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>

// Wire shapes shared by the anomaly stream and the HTTP query server
nlohmann::json anomaly_to_json(const AnomalyRecord& record);
nlohmann::json health_to_json(const HealthSnapshot& health);
