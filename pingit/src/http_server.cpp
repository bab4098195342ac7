#include "http_server.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <thread>

namespace api {

std::chrono::hours range_window(const std::string& range) {
    if (range == "1h") return std::chrono::hours(1);
    if (range == "30d") return std::chrono::hours(24 * 30);
    return std::chrono::hours(24);
}

namespace {

nlohmann::json optional_value(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

nlohmann::json statistics_json(const StatisticsRow& row) {
    return {
        {"target_name", row.target_name},
        {"host", row.host},
        {"total_pings", row.total_pings},
        {"successful_pings", row.successful_pings},
        {"failed_pings", row.failed_pings},
        {"success_rate", row.success_rate},
        {"avg_response_time", optional_value(row.avg_response_time)},
        {"min_response_time", optional_value(row.min_response_time)},
        {"max_response_time", optional_value(row.max_response_time)},
        {"last_status", row.last_status},
        {"timestamp", row.timestamp_ms}
    };
}

nlohmann::json disconnects_json(const std::string& target_name, const std::vector<DisconnectRow>& rows) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json event;
        event["target_name"] = row.target_name;
        event["host"] = row.host;
        event["start_time"] = row.start_time_ms;
        event["disconnect_count"] = row.disconnect_count;
        if (row.end_time_ms) {
            event["end_time"] = *row.end_time_ms;
            event["duration_seconds"] = static_cast<double>(*row.end_time_ms - row.start_time_ms) / 1000.0;
        } else {
            event["end_time"] = nullptr;
            event["duration_seconds"] = nullptr;
        }
        events.push_back(std::move(event));
    }

    return {
        {"target_name", target_name},
        {"disconnect_count", rows.size()},
        {"disconnects", events}
    };
}

std::vector<size_t> trend_filter(const std::vector<TrendPoint>& points, size_t baseline_points,
                                 double outlier_threshold_ms) {
    std::vector<size_t> all(points.size());
    std::iota(all.begin(), all.end(), size_t{0});
    if (points.size() < 2 || baseline_points == 0 || points.size() <= baseline_points) {
        return all;
    }

    // Fit on offsets from the first sample; squared epoch milliseconds lose precision.
    const double x0 = static_cast<double>(points.front().x_ms);
    const double n = static_cast<double>(points.size());
    double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0;
    for (const auto& p : points) {
        double x = static_cast<double>(p.x_ms) - x0;
        sum_x += x;
        sum_y += p.y;
        sum_xy += x * p.y;
        sum_x2 += x * x;
    }
    double denominator = n * sum_x2 - sum_x * sum_x;
    if (denominator == 0.0) {
        return all;
    }
    double slope = (n * sum_xy - sum_x * sum_y) / denominator;
    double intercept = (sum_y - slope * sum_x) / n;

    std::set<size_t> selected{0, points.size() - 1};
    double spacing = n / static_cast<double>(baseline_points);
    for (size_t i = 0; i < baseline_points; ++i) {
        selected.insert(static_cast<size_t>(static_cast<double>(i) * spacing));
    }
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        double x = static_cast<double>(points[i].x_ms) - x0;
        if (std::abs(points[i].y - (slope * x + intercept)) > outlier_threshold_ms) {
            selected.insert(i);
        }
    }
    return {selected.begin(), selected.end()};
}

double jitter(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    double squares = 0.0;
    for (double v : values) {
        squares += (v - mean) * (v - mean);
    }
    return round2(std::sqrt(squares / static_cast<double>(values.size() - 1)));
}

nlohmann::json timeseries_json(const std::vector<StatisticsPoint>& series) {
    std::map<std::string, std::vector<const StatisticsPoint*>> by_target;
    for (const auto& point : series) {
        by_target[point.target_name].push_back(&point);
    }

    nlohmann::json result = nlohmann::json::object();
    for (const auto& [target_name, rows] : by_target) {
        std::vector<TrendPoint> points;
        points.reserve(rows.size());
        for (const auto* row : rows) {
            points.push_back({row->timestamp_ms, row->avg_response_time.value_or(0.0)});
        }
        auto keep = trend_filter(points);

        nlohmann::json entry = {
            {"timestamps", nlohmann::json::array()},
            {"avg_response_times", nlohmann::json::array()},
            {"min_response_times", nlohmann::json::array()},
            {"max_response_times", nlohmann::json::array()}
        };
        for (size_t i : keep) {
            entry["timestamps"].push_back(rows[i]->timestamp_ms);
            entry["avg_response_times"].push_back(rows[i]->avg_response_time.value_or(0.0));
            entry["min_response_times"].push_back(rows[i]->min_response_time.value_or(0.0));
            entry["max_response_times"].push_back(rows[i]->max_response_time.value_or(0.0));
        }
        spdlog::debug("Timeseries for {}: {} -> {} points", target_name, rows.size(), keep.size());
        result[target_name] = std::move(entry);
    }
    return result;
}

nlohmann::json summary_json(const std::string& range, const std::vector<TargetSummary>& summaries,
                            const std::vector<StatisticsPoint>& series) {
    std::map<std::string, std::vector<double>> averages;
    for (const auto& point : series) {
        if (point.avg_response_time) {
            averages[point.target_name].push_back(*point.avg_response_time);
        }
    }

    nlohmann::json targets = nlohmann::json::array();
    nlohmann::json disconnects = nlohmann::json::array();
    int64_t total_pings = 0;
    int64_t total_successful = 0;
    int64_t total_disconnects = 0;

    for (const auto& s : summaries) {
        total_pings += s.pings;
        total_successful += s.successful_pings;
        total_disconnects += s.disconnect_count;

        if (s.disconnect_count > 0) {
            nlohmann::json event;
            event["target_name"] = s.target_name;
            event["host"] = s.host;
            event["disconnect_count"] = s.disconnect_count;
            event["last_disconnect"] = s.last_disconnect_ms ? nlohmann::json(*s.last_disconnect_ms)
                                                            : nlohmann::json(nullptr);
            disconnects.push_back(std::move(event));
        }

        nlohmann::json target;
        target["target_name"] = s.target_name;
        target["host"] = s.host;
        target["total_pings"] = s.pings;
        target["successful_pings"] = s.successful_pings;
        target["success_rate"] = round2(s.success_rate);
        target["avg_response_time"] = optional_value(s.avg_response_time);
        target["min_response_time"] = optional_value(s.min_response_time);
        target["max_response_time"] = optional_value(s.max_response_time);
        auto avg_it = averages.find(s.target_name);
        target["jitter"] = avg_it == averages.end() ? 0.0 : jitter(avg_it->second);
        target["disconnect_count"] = s.disconnect_count;
        target["last_disconnect"] = s.last_disconnect_ms ? nlohmann::json(*s.last_disconnect_ms)
                                                         : nlohmann::json(nullptr);
        target["status"] = s.pings > 0 && s.last_success ? "up" : "down";
        targets.push_back(std::move(target));
    }

    double uptime = total_pings > 0
        ? static_cast<double>(total_successful) * 100.0 / static_cast<double>(total_pings)
        : 0.0;

    return {
        {"time_range", range},
        {"targets", targets},
        {"disconnects", disconnects},
        {"timeseries", timeseries_json(series)},
        {"total_targets", summaries.size()},
        {"total_disconnects", disconnects.size()},
        {"total_disconnect_events", total_disconnects},
        {"uptime_percentage", round2(uptime)}
    };
}

nlohmann::json health_json(const std::string& service_name, bool db_healthy) {
    nlohmann::json health_status;
    health_status["service"] = service_name;
    health_status["status"] = db_healthy ? "healthy" : "unhealthy";
    health_status["timestamp"] = util::current_iso8601();
    health_status["components"]["database"] = db_healthy ? "healthy" : "unhealthy";
    return health_status;
}

} // namespace api

class HttpServer::Impl {
public:
    Impl(const Config& config, MetricsCollector& metrics, DatabaseManager* db_manager,
         StatsProvider live_stats)
        : config_(config), metrics_(metrics), db_manager_(db_manager),
          live_stats_(std::move(live_stats)), running_(false) {
        setup_routes();
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) return;
        running_ = true;
        listen_done_ = false;
        server_thread_ = std::thread([this]() {
            spdlog::info("HTTP server starting on {}:{}", config_.http_host, config_.http_port);
            if (!server_.listen(config_.http_host.c_str(), config_.http_port)) {
                spdlog::error("HTTP server could not listen on {}:{}", config_.http_host, config_.http_port);
            }
            listen_done_ = true;
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            // stop() is lost if it lands before listen() has bound the socket.
            for (int i = 0; i < 100 && !server_.is_running() && !listen_done_; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("HTTP server stopped");
        }
    }

    bool is_running() const {
        return running_;
    }

private:
    void setup_routes() {
        server_.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(metrics_.collect(config_.metrics_drain_on_scrape),
                            "text/plain; version=0.0.4");
        });

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            bool db_healthy = db_manager_ && db_manager_->is_healthy();
            res.status = db_healthy ? 200 : 503;
            res.set_content(api::health_json(config_.service_name, db_healthy).dump(2), "application/json");
        });

        // In-memory counters since process start, no database round trip.
        server_.Get("/api/live", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json targets = nlohmann::json::array();
            if (live_stats_) {
                for (const auto& stats : live_stats_()) {
                    targets.push_back(stats);
                }
            }
            res.set_content(nlohmann::json{{"targets", targets}}.dump(), "application/json");
        });

        server_.Get(R"(/api/statistics/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            with_database(res, [&](DatabaseManager& db) {
                const std::string target = req.matches[1];
                auto row = db.latest_statistics(target);
                if (!row) {
                    send_error(res, 404, "No statistics found for " + target);
                    return;
                }
                res.set_content(api::statistics_json(*row).dump(), "application/json");
            });
        });

        server_.Get(R"(/api/disconnects/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            with_database(res, [&](DatabaseManager& db) {
                const std::string target = req.matches[1];
                auto rows = db.disconnects(target, 100);
                res.set_content(api::disconnects_json(target, rows).dump(), "application/json");
            });
        });

        server_.Get("/api/data", [this](const httplib::Request& req, httplib::Response& res) {
            with_database(res, [&](DatabaseManager& db) {
                std::string range = req.has_param("range") ? req.get_param_value("range") : "24h";
                if (range != "1h" && range != "24h" && range != "30d") {
                    range = "24h";
                }
                int64_t since_ms = to_epoch_ms(Clock::now() - api::range_window(range));
                auto summaries = db.summarize_since(since_ms);
                auto series = db.statistics_series(since_ms);
                res.set_content(api::summary_json(range, summaries, series).dump(), "application/json");
            });
        });
    }

    template <typename Handler>
    void with_database(httplib::Response& res, Handler&& handler) {
        if (!db_manager_) {
            send_error(res, 503, "Database unavailable");
            return;
        }
        try {
            handler(*db_manager_);
        } catch (const std::exception& e) {
            spdlog::error("Query failed: {}", e.what());
            send_error(res, 500, e.what());
        }
    }

    static void send_error(httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
    }

    Config config_;
    MetricsCollector& metrics_;
    DatabaseManager* db_manager_;
    StatsProvider live_stats_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::atomic<bool> listen_done_{false};
    std::thread server_thread_;
};

HttpServer::HttpServer(const Config& config, MetricsCollector& metrics, DatabaseManager* db_manager,
                       StatsProvider live_stats)
    : pImpl_(std::make_unique<Impl>(config, metrics, db_manager, std::move(live_stats))) {}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    pImpl_->start();
}

void HttpServer::stop() {
    pImpl_->stop();
}

bool HttpServer::is_running() const {
    return pImpl_->is_running();
}
