#pragma once
#include "config.hpp"
#include "database_manager.hpp"
#include "metrics_collector.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Serves /metrics, /health and the read-only query API on one listener.
class HttpServer {
public:
    using StatsProvider = std::function<std::vector<TargetStats>()>;

    HttpServer(const Config& config, MetricsCollector& metrics, DatabaseManager* db_manager,
               StatsProvider live_stats = nullptr);
    ~HttpServer();

    void start();
    void stop();
    bool is_running() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Query API payloads; kept apart from the listener so they can be tested.
namespace api {

// "1h", "24h" or "30d"; anything else falls back to 24h.
std::chrono::hours range_window(const std::string& range);

nlohmann::json statistics_json(const StatisticsRow& row);
nlohmann::json disconnects_json(const std::string& target_name, const std::vector<DisconnectRow>& rows);
// A response-time sample on the dashboard chart.
struct TrendPoint {
    int64_t x_ms = 0;
    double y = 0.0;
};

// Indices, ascending, of the points worth charting: about baseline_points
// evenly spaced ones (first and last always) plus every point further than
// outlier_threshold_ms from the least-squares trend line. Short or flat
// series are returned whole.
std::vector<size_t> trend_filter(const std::vector<TrendPoint>& points, size_t baseline_points = 20,
                                 double outlier_threshold_ms = 5.0);

// Sample standard deviation rounded to 2 decimals; 0 for fewer than two values.
double jitter(const std::vector<double>& values);

// target_name -> {timestamps, avg/min/max_response_times}, thinned by trend_filter.
nlohmann::json timeseries_json(const std::vector<StatisticsPoint>& series);

nlohmann::json summary_json(const std::string& range, const std::vector<TargetSummary>& summaries,
                            const std::vector<StatisticsPoint>& series = {});
nlohmann::json health_json(const std::string& service_name, bool db_healthy);

} // namespace api
