#pragma once
#include "result_store.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct PingHistoryRow {
    std::string target_name;
    std::string host;
    int64_t timestamp_ms = 0;
    bool success = false;
    std::optional<double> response_time_ms;
    std::optional<std::string> error_kind;
};

struct StatisticsRow {
    std::string target_name;
    std::string host;
    int64_t timestamp_ms = 0;
    int64_t total_pings = 0;
    int64_t successful_pings = 0;
    int64_t failed_pings = 0;
    double success_rate = 0.0;
    std::optional<double> avg_response_time;
    std::optional<double> min_response_time;
    std::optional<double> max_response_time;
    std::string last_status;
};

struct DisconnectRow {
    std::string target_name;
    std::string host;
    int64_t start_time_ms = 0;
    std::optional<int64_t> end_time_ms;
    int64_t disconnect_count = 0;
};

// One ping_statistics snapshot reduced to its response times.
struct StatisticsPoint {
    std::string target_name;
    int64_t timestamp_ms = 0;
    std::optional<double> avg_response_time;
    std::optional<double> min_response_time;
    std::optional<double> max_response_time;
};

// Per-target rollup over a time window, computed from ping history.
struct TargetSummary {
    std::string target_name;
    std::string host;
    int64_t pings = 0;
    int64_t successful_pings = 0;
    double success_rate = 0.0;
    std::optional<double> avg_response_time;
    std::optional<double> min_response_time;
    std::optional<double> max_response_time;
    int64_t disconnect_count = 0;
    std::optional<int64_t> last_disconnect_ms;
    bool last_success = false;
};

// sqlite3-backed store. All access is serialized on one connection.
class DatabaseManager : public ResultStore {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager() override;

    void write_batch(const std::vector<PersistItem>& items) override;

    // Query side
    std::vector<PingHistoryRow> ping_history(const std::string& target_name, int limit = 100) const;
    std::optional<StatisticsRow> latest_statistics(const std::string& target_name) const;
    std::vector<DisconnectRow> disconnects(const std::string& target_name, int limit = 100) const;
    std::vector<TargetSummary> summarize_since(int64_t since_ms) const;
    // Snapshots newer than since_ms, ordered by target then time.
    std::vector<StatisticsPoint> statistics_series(int64_t since_ms) const;

    // Health check
    bool is_healthy() const;

    // Non-copyable
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
