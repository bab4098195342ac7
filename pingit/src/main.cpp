#include "config.hpp"
#include "ping_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main(int argc, char* argv[]) {
    std::unique_ptr<PingService> service;

    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        util::setup_logging(config.service_name, config.log_level, config.log_dir,
                            config.log_max_size_mb, config.log_backup_count);
        int removed = util::cleanup_old_logs(config.log_dir, config.service_name + "-",
                                             config.log_retention_days);
        if (removed > 0) {
            spdlog::info("Removed {} log files older than {} days", removed, config.log_retention_days);
        }
        spdlog::info("Log level set to '{}'", config.log_level);

        // 3. Targets: argv[1] overrides TARGETS_FILE
        std::string targets_path = argc > 1 ? argv[1] : config.targets_file;
        config.load_targets_file(targets_path);
        config.validate();

        // 4. Setup signal handling for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 5. Initialize and run the service
        service = std::make_unique<PingService>(config);
        service->start();

        while (!g_terminate_flag) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::info("Termination signal received. Shutting down...");
        service->stop();
        spdlog::info("{} has shut down.", config.service_name);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during initialization or runtime: {}", e.what());
        if (service) {
            service->stop();
        }
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
