#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string join_strings(const std::vector<std::string>& parts, const std::string& separator);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
bool ends_with(const std::string& str, const std::string& suffix);

// Time utilities
int64_t now_ms();
int64_t now_seconds();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::string format_epoch_ms(int64_t epoch_ms);

// Duration of a bar interval label such as "1m", "15m", "4h", "1d"; 0 if unknown
int64_t interval_to_ms(const std::string& interval);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

// Network utilities
bool is_network_error(int http_status);

} // namespace util
