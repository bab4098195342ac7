#include "types.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Unreachable: return "unreachable";
        case ErrorKind::HostResolutionFailed: return "host_resolution_failed";
    }
    return "unknown";
}

const char* to_string(HealthState state) {
    switch (state) {
        case HealthState::Unknown: return "unknown";
        case HealthState::Up: return "up";
        case HealthState::Down: return "down";
    }
    return "unknown";
}

ProbeResult ProbeResult::ok(const Target& target, Timestamp ts, double rtt_ms) {
    ProbeResult result;
    result.target_name = target.name;
    result.host = target.host;
    result.timestamp = ts;
    result.success = true;
    result.response_time_ms = rtt_ms;
    return result;
}

ProbeResult ProbeResult::failed(const Target& target, Timestamp ts, ErrorKind kind) {
    ProbeResult result;
    result.target_name = target.name;
    result.host = target.host;
    result.timestamp = ts;
    result.success = false;
    result.error_kind = kind;
    return result;
}

double TargetStats::success_rate() const {
    if (ping_count == 0) {
        return 0.0;
    }
    return static_cast<double>(success_count) * 100.0 / static_cast<double>(ping_count);
}

int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

void to_json(nlohmann::json& j, const TargetStats& stats) {
    auto optional_number = [](const std::optional<double>& v) {
        return v ? nlohmann::json(*v) : nlohmann::json();
    };
    j = nlohmann::json{
        {"target_name", stats.target_name},
        {"total_pings", stats.ping_count},
        {"successful_pings", stats.success_count},
        {"failed_pings", stats.failure_count},
        {"success_rate", stats.success_rate()},
        {"avg_response_time", optional_number(stats.avg_rt)},
        {"min_response_time", optional_number(stats.min_rt)},
        {"max_response_time", optional_number(stats.max_rt)},
        {"status", to_string(stats.current_state)}
    };
}
