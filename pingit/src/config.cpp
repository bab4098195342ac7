#include "config.hpp"
#include "util.hpp"
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

OverrunPolicy overrun_policy_from_string(const std::string& value) {
    auto v = util::to_lower(util::trim(value));
    if (v == "immediate") return OverrunPolicy::Immediate;
    if (v == "skip") return OverrunPolicy::SkipMissed;
    throw ConfigError("OVERRUN_POLICY must be 'immediate' or 'skip', got '" + value + "'");
}

Config Config::from_env() {
    Config config;

    try {
        // Service
        config.service_name = util::get_env_var("SERVICE_NAME", "pingit");
        config.log_level = util::get_env_var("LOG_LEVEL", "info");

        // Logging
        config.log_dir = util::get_env_var("LOG_DIR");
        config.log_max_size_mb = util::get_env_int("LOG_MAX_SIZE_MB", 10);
        config.log_backup_count = util::get_env_int("LOG_BACKUP_COUNT", 10);
        config.log_retention_days = util::get_env_int("LOG_RETENTION_DAYS", 7);

        // Probing
        config.targets_file = util::get_env_var("TARGETS_FILE", "/etc/pingit/targets.json");
        config.ping_interval_seconds = util::get_env_int("PING_INTERVAL_SECONDS", 60);
        config.ping_timeout_seconds = util::get_env_int("PING_TIMEOUT_SECONDS", 5);
        config.report_interval_cycles = util::get_env_int("REPORT_INTERVAL_CYCLES", 10);
        config.overrun_policy = overrun_policy_from_string(util::get_env_var("OVERRUN_POLICY", "immediate"));
        config.delivery_grace_ms = util::get_env_int("DELIVERY_GRACE_MS", 250);

        // Database
        config.db_path = util::get_env_var("DB_PATH", "pingit.db");

        // Persistence writer
        config.persist_queue_capacity = util::get_env_int("PERSIST_QUEUE_CAPACITY", 10000);
        config.persist_batch_size = util::get_env_int("PERSIST_BATCH_SIZE", 500);
        config.persist_flush_ms = util::get_env_int("PERSIST_FLUSH_MS", 5000);
        config.persist_max_attempts = util::get_env_int("PERSIST_MAX_ATTEMPTS", 3);
        config.persist_retry_base_ms = util::get_env_int("PERSIST_RETRY_BASE_MS", 200);
        config.shutdown_grace_ms = util::get_env_int("SHUTDOWN_GRACE_MS", 5000);

        // Metrics
        config.metrics_drain_on_scrape = util::get_env_bool("METRICS_DRAIN_ON_SCRAPE", true);
        config.report_to_log = util::get_env_bool("REPORT_TO_LOG", false);

        // HTTP
        config.http_host = util::get_env_var("HTTP_HOST", "0.0.0.0");
        config.http_port = util::get_env_int("HTTP_PORT", 7030);
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError(e.what());
    }

    return config;
}

void Config::load_targets_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Targets file not found: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    targets_file = path;
    load_targets_json(buffer.str());
    spdlog::info("Loaded {} targets from {}", targets.size(), path);
}

void Config::load_targets_json(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(fmt::format("Targets file is not valid JSON: {}", e.what()));
    }
    if (!doc.is_object()) {
        throw ConfigError("Targets file must contain a JSON object");
    }

    try {
        if (doc.contains("ping")) {
            const auto& ping = doc.at("ping");
            ping_interval_seconds = ping.value("interval", ping_interval_seconds);
            ping_timeout_seconds = ping.value("timeout", ping_timeout_seconds);
        }
        if (doc.contains("reporting")) {
            report_interval_cycles = doc.at("reporting").value("interval", report_interval_cycles);
        }

        targets.clear();
        for (const auto& entry : doc.value("targets", json::array())) {
            Target target;
            target.name = entry.at("name").get<std::string>();
            target.host = entry.at("host").get<std::string>();
            target.interval = std::chrono::seconds(entry.value("interval", ping_interval_seconds));
            target.timeout = std::chrono::seconds(entry.value("timeout", ping_timeout_seconds));
            targets.push_back(std::move(target));
            spdlog::debug("Loaded target: {} ({})", targets.back().name, targets.back().host);
        }
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("Malformed targets file: {}", e.what()));
    }
}

void Config::validate() const {
    if (ping_interval_seconds <= 0) {
        throw ConfigError("Ping interval must be positive");
    }
    if (ping_timeout_seconds <= 0) {
        throw ConfigError("Ping timeout must be positive");
    }
    if (report_interval_cycles <= 0) {
        throw ConfigError("Reporting interval must be at least 1 cycle");
    }
    if (delivery_grace_ms < 0) {
        throw ConfigError("DELIVERY_GRACE_MS cannot be negative");
    }

    if (targets.empty()) {
        throw ConfigError("No targets configured");
    }

    std::unordered_set<std::string> names;
    for (const auto& target : targets) {
        if (target.name.empty()) {
            throw ConfigError("Target name cannot be empty");
        }
        if (target.host.empty()) {
            throw ConfigError("Target '" + target.name + "' has an empty host");
        }
        if (target.interval.count() <= 0 || target.timeout.count() <= 0) {
            throw ConfigError("Target '" + target.name + "' needs a positive interval and timeout");
        }
        if (!names.insert(target.name).second) {
            throw ConfigError("Duplicate target name: " + target.name);
        }
    }

    if (db_path.empty()) {
        throw ConfigError("DB_PATH cannot be empty");
    }
    if (persist_queue_capacity < 1) {
        throw ConfigError("PERSIST_QUEUE_CAPACITY must be at least 1");
    }
    if (persist_batch_size < 1) {
        throw ConfigError("PERSIST_BATCH_SIZE must be at least 1");
    }
    if (persist_flush_ms < 1 || persist_retry_base_ms < 0 || shutdown_grace_ms < 0) {
        throw ConfigError("Persistence timings must be positive");
    }
    if (persist_max_attempts < 1 || persist_max_attempts > 10) {
        throw ConfigError("PERSIST_MAX_ATTEMPTS must be between 1 and 10");
    }

    if (http_port <= 0 || http_port > 65535) {
        throw ConfigError("HTTP_PORT must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}
