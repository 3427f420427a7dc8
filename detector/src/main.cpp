#include "config.hpp"
#include "service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <memory>
#include <vector>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<Service> service_ptr;

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, shutting down...", signum);
    if (service_ptr) {
        service_ptr->stop();
    }
}

namespace {

void setup_logging(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_file.empty()) {
        // 5 MiB x 5 files
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, 5 * 1024 * 1024, 5));
    }

    auto logger = std::make_shared<spdlog::logger>(config.service_name, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        setup_logging(config);
        spdlog::info("Log level set to '{}'", config.log_level);

        // 3. Validate before anything touches the network or the database
        config.validate();
        spdlog::info("Starting {}...", config.service_name);

        // 4. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 5. Create and run the service
        service_ptr = std::make_unique<Service>(config);
        service_ptr->run();
        service_ptr.reset();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Detector has shut down gracefully.");
    return 0;
}
