#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::runtime_error(fmt::format("Invalid boolean value for env var {}: {}", name, value));
}

std::string trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string current_date() {
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d");
    return ss.str();
}

void setup_logging(const std::string& service_name, const std::string& level,
                   const std::string& log_dir, int max_size_mb, int backup_count) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir);
        auto file_name = fmt::format("{}/{}-{}.log", log_dir, service_name, current_date());
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_name, static_cast<size_t>(max_size_mb) * 1024 * 1024, static_cast<size_t>(backup_count)));
    }

    auto logger = std::make_shared<spdlog::logger>(service_name, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

int cleanup_old_logs(const std::string& log_dir, const std::string& prefix, int retention_days) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (log_dir.empty() || !fs::is_directory(log_dir, ec)) {
        return 0;
    }

    auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * retention_days);
    int removed = 0;
    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        const auto name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || name.rfind(prefix, 0) != 0 ||
            entry.path().extension() != ".log") {
            continue;
        }
        auto mtime = fs::last_write_time(entry.path(), ec);
        if (ec || mtime >= cutoff) {
            continue;
        }
        if (fs::remove(entry.path(), ec)) {
            spdlog::debug("Deleted old log file: {}", entry.path().string());
            ++removed;
        } else {
            spdlog::warn("Failed to delete log file {}: {}", entry.path().string(), ec.message());
        }
    }
    return removed;
}

double random_jitter(double base_value, double jitter_factor) {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dis(1.0 - jitter_factor, 1.0 + jitter_factor);
    return base_value * dis(gen);
}

} // namespace util
