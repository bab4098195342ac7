#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

struct Target {
    std::string name;
    std::string host;
    std::chrono::milliseconds interval{60000};
    std::chrono::milliseconds timeout{5000};
};

enum class ErrorKind {
    Timeout,
    Unreachable,
    HostResolutionFailed
};

enum class HealthState {
    Unknown,
    Up,
    Down
};

const char* to_string(ErrorKind kind);
const char* to_string(HealthState state);

struct ProbeResult {
    std::string target_name;
    std::string host;
    Timestamp timestamp;
    bool success = false;
    std::optional<double> response_time_ms;
    std::optional<ErrorKind> error_kind;

    static ProbeResult ok(const Target& target, Timestamp ts, double rtt_ms);
    static ProbeResult failed(const Target& target, Timestamp ts, ErrorKind kind);
};

struct TargetStats {
    std::string target_name;
    uint64_t ping_count = 0;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    std::optional<double> min_rt;
    std::optional<double> max_rt;
    std::optional<double> avg_rt;
    HealthState current_state = HealthState::Unknown;

    // Percent of successful pings, 0 when nothing was probed yet.
    double success_rate() const;
};

struct DisconnectEvent {
    std::string target_name;
    std::string host;
    Timestamp start_time;
    std::optional<Timestamp> end_time;
    uint32_t consecutive_failure_count = 0;

    bool is_open() const { return !end_time.has_value(); }
};

struct StatsSnapshot {
    std::string host;
    Timestamp taken_at;
    TargetStats stats;
};

// Anything the persistence writer can be handed.
using PersistItem = std::variant<ProbeResult, DisconnectEvent, StatsSnapshot>;

int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(int64_t ms);

void to_json(nlohmann::json& j, const TargetStats& stats);
