#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class OverrunPolicy {
    Immediate,  // next cycle starts right after an overrunning probe
    SkipMissed  // wait for the next slot of the original schedule
};

class Config {
public:
    // Service info
    std::string service_name = "pingit";
    std::string log_level = "info";

    // Logging
    std::string log_dir;
    int log_max_size_mb = 10;
    int log_backup_count = 10;
    int log_retention_days = 7;

    // Targets
    std::string targets_file = "/etc/pingit/targets.json";
    int ping_interval_seconds = 60;
    int ping_timeout_seconds = 5;
    int report_interval_cycles = 10;
    OverrunPolicy overrun_policy = OverrunPolicy::Immediate;
    int delivery_grace_ms = 250;
    std::vector<Target> targets;

    // Database
    std::string db_path = "pingit.db";

    // Persistence writer
    int persist_queue_capacity = 10000;
    int persist_batch_size = 500;
    int persist_flush_ms = 5000;
    int persist_max_attempts = 3;
    int persist_retry_base_ms = 200;
    int shutdown_grace_ms = 5000;

    // Metrics / reporting
    bool metrics_drain_on_scrape = true;
    bool report_to_log = false;

    // HTTP listener
    std::string http_host = "0.0.0.0";
    int http_port = 7030;

    static Config from_env();

    // Reads the JSON targets file; global interval/timeout/reporting values in
    // the file override the env defaults.
    void load_targets_file(const std::string& path);
    void load_targets_json(const std::string& text);

    void validate() const;
};

OverrunPolicy overrun_policy_from_string(const std::string& value);
