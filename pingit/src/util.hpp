#pragma once
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(std::string str);

// Time utilities
std::string current_iso8601();
std::string current_date();

// Logging
void setup_logging(const std::string& service_name, const std::string& level,
                   const std::string& log_dir, int max_size_mb, int backup_count);
int cleanup_old_logs(const std::string& log_dir, const std::string& prefix, int retention_days);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
