#include <gtest/gtest.h>
#include "http_server.hpp"
#include "test_helpers.hpp"
#include <httplib.h>
#include <algorithm>

TEST(HttpApi, RangeWindows) {
    EXPECT_EQ(api::range_window("1h"), std::chrono::hours(1));
    EXPECT_EQ(api::range_window("24h"), std::chrono::hours(24));
    EXPECT_EQ(api::range_window("30d"), std::chrono::hours(720));
    EXPECT_EQ(api::range_window("7w"), std::chrono::hours(24));
}

TEST(HttpApi, StatisticsPayload) {
    StatisticsRow row;
    row.target_name = "dns";
    row.host = "8.8.8.8";
    row.timestamp_ms = 1234;
    row.total_pings = 10;
    row.successful_pings = 8;
    row.failed_pings = 2;
    row.success_rate = 80.0;
    row.avg_response_time = 12.5;
    row.last_status = "up";

    auto j = api::statistics_json(row);
    EXPECT_EQ(j["target_name"], "dns");
    EXPECT_EQ(j["total_pings"], 10);
    EXPECT_DOUBLE_EQ(j["avg_response_time"].get<double>(), 12.5);
    EXPECT_TRUE(j["min_response_time"].is_null());
    EXPECT_EQ(j["last_status"], "up");
    EXPECT_EQ(j["timestamp"], 1234);
}

TEST(HttpApi, DisconnectsPayload) {
    DisconnectRow closed{"dns", "8.8.8.8", 1000, 4000, 3};
    DisconnectRow open{"dns", "8.8.8.8", 9000, std::nullopt, 1};

    auto j = api::disconnects_json("dns", {open, closed});
    EXPECT_EQ(j["disconnect_count"], 2);
    ASSERT_EQ(j["disconnects"].size(), 2u);
    EXPECT_TRUE(j["disconnects"][0]["end_time"].is_null());
    EXPECT_DOUBLE_EQ(j["disconnects"][1]["duration_seconds"].get<double>(), 3.0);
    EXPECT_EQ(j["disconnects"][1]["disconnect_count"], 3);
}

TEST(HttpApi, SummaryPayload) {
    TargetSummary up;
    up.target_name = "dns";
    up.host = "8.8.8.8";
    up.pings = 3;
    up.successful_pings = 3;
    up.success_rate = 100.0;
    up.last_success = true;

    TargetSummary down;
    down.target_name = "gw";
    down.host = "192.168.1.1";
    down.pings = 1;
    down.successful_pings = 0;
    down.disconnect_count = 2;
    down.last_disconnect_ms = 5000;

    auto j = api::summary_json("1h", {up, down});
    EXPECT_EQ(j["time_range"], "1h");
    EXPECT_EQ(j["total_targets"], 2);
    EXPECT_EQ(j["total_disconnect_events"], 2);
    EXPECT_DOUBLE_EQ(j["uptime_percentage"].get<double>(), 75.0);
    EXPECT_EQ(j["targets"][0]["status"], "up");
    EXPECT_EQ(j["targets"][1]["status"], "down");
    EXPECT_EQ(j["targets"][1]["last_disconnect"], 5000);
}

TEST(HttpApi, TrendFilterKeepsShortSeriesWhole) {
    std::vector<api::TrendPoint> points;
    for (int i = 0; i < 20; ++i) {
        points.push_back({i * 60'000, 10.0 + i});
    }
    EXPECT_EQ(api::trend_filter(points).size(), 20u);
    EXPECT_EQ(api::trend_filter({}).size(), 0u);
}

TEST(HttpApi, TrendFilterThinsToBaselineAndKeepsOutliers) {
    const int64_t start = 1'700'000'000'000;
    std::vector<api::TrendPoint> points;
    for (int i = 0; i < 100; ++i) {
        points.push_back({start + i * 60'000, 10.0 + (i % 2) * 0.5});
    }
    points[52].y = 30.0;

    auto kept = api::trend_filter(points);

    // Every fifth point, the last one, and the spike.
    ASSERT_EQ(kept.size(), 22u);
    EXPECT_EQ(kept.front(), 0u);
    EXPECT_EQ(kept.back(), 99u);
    EXPECT_NE(std::find(kept.begin(), kept.end(), 52u), kept.end());
    EXPECT_NE(std::find(kept.begin(), kept.end(), 95u), kept.end());
    EXPECT_EQ(std::find(kept.begin(), kept.end(), 51u), kept.end());
    EXPECT_TRUE(std::is_sorted(kept.begin(), kept.end()));
}

TEST(HttpApi, TrendFilterFollowsTheSlope) {
    std::vector<api::TrendPoint> points;
    for (int i = 0; i < 50; ++i) {
        points.push_back({i * 1000, 2.0 * i});
    }
    // A steady climb has no outliers, however far it moves from the mean.
    EXPECT_EQ(api::trend_filter(points).size(), 21u);
}

TEST(HttpApi, JitterIsSampleStandardDeviation) {
    EXPECT_DOUBLE_EQ(api::jitter({}), 0.0);
    EXPECT_DOUBLE_EQ(api::jitter({7.0}), 0.0);
    EXPECT_DOUBLE_EQ(api::jitter({10.0, 12.0, 14.0}), 2.0);
    EXPECT_DOUBLE_EQ(api::jitter({1.0, 2.0}), 0.71);
}

TEST(HttpApi, TimeseriesPayloadPerTarget) {
    std::vector<StatisticsPoint> series = {
        {"dns", 1000, 10.0, 8.0, 12.0},
        {"dns", 2000, std::nullopt, std::nullopt, std::nullopt},
        {"gw", 1500, 1.0, 0.5, 2.0},
    };

    auto j = api::timeseries_json(series);
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j["dns"]["timestamps"], nlohmann::json::array({1000, 2000}));
    EXPECT_DOUBLE_EQ(j["dns"]["avg_response_times"][1].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(j["dns"]["max_response_times"][0].get<double>(), 12.0);
    EXPECT_DOUBLE_EQ(j["gw"]["min_response_times"][0].get<double>(), 0.5);
}

TEST(HttpApi, SummaryIncludesJitterDisconnectsAndTimeseries) {
    TargetSummary dns;
    dns.target_name = "dns";
    dns.host = "8.8.8.8";
    dns.pings = 10;
    dns.successful_pings = 10;
    dns.last_success = true;

    TargetSummary gw;
    gw.target_name = "gw";
    gw.host = "192.168.1.1";
    gw.pings = 10;
    gw.successful_pings = 8;
    gw.disconnect_count = 2;
    gw.last_disconnect_ms = 7000;

    std::vector<StatisticsPoint> series = {
        {"dns", 1000, 10.0, 9.0, 11.0},
        {"dns", 2000, 14.0, 9.0, 20.0},
    };

    auto j = api::summary_json("24h", {dns, gw}, series);
    EXPECT_DOUBLE_EQ(j["targets"][0]["jitter"].get<double>(), 2.83);
    EXPECT_DOUBLE_EQ(j["targets"][1]["jitter"].get<double>(), 0.0);
    ASSERT_EQ(j["disconnects"].size(), 1u);
    EXPECT_EQ(j["disconnects"][0]["target_name"], "gw");
    EXPECT_EQ(j["disconnects"][0]["last_disconnect"], 7000);
    EXPECT_EQ(j["total_disconnects"], 1);
    EXPECT_EQ(j["total_disconnect_events"], 2);
    EXPECT_EQ(j["timeseries"]["dns"]["timestamps"].size(), 2u);
    EXPECT_FALSE(j["timeseries"].contains("gw"));
}

TEST(HttpApi, HealthPayload) {
    auto healthy = api::health_json("pingit", true);
    EXPECT_EQ(healthy["status"], "healthy");
    EXPECT_EQ(healthy["components"]["database"], "healthy");

    auto unhealthy = api::health_json("pingit", false);
    EXPECT_EQ(unhealthy["status"], "unhealthy");
    EXPECT_EQ(unhealthy["service"], "pingit");
}

TEST(HttpApi, LiveStatsSerialization) {
    TargetStats stats;
    stats.target_name = "dns";
    stats.ping_count = 4;
    stats.success_count = 3;
    stats.failure_count = 1;
    stats.avg_rt = 9.0;
    stats.current_state = HealthState::Down;

    nlohmann::json j = stats;
    EXPECT_EQ(j["total_pings"], 4);
    EXPECT_DOUBLE_EQ(j["success_rate"].get<double>(), 75.0);
    EXPECT_TRUE(j["min_response_time"].is_null());
    EXPECT_EQ(j["status"], "down");
}

TEST(HttpServer, ServesRoutesAgainAfterRestart) {
    Config config;
    config.http_host = "127.0.0.1";
    config.http_port = 18931;
    config.targets = {make_target("dns", "8.8.8.8")};
    MetricsCollector metrics(config.targets);
    DatabaseManager db(":memory:");
    HttpServer server(config, metrics, &db);
    httplib::Client client("127.0.0.1", config.http_port);

    for (int round = 0; round < 2; ++round) {
        server.start();
        ASSERT_TRUE(wait_for([&] {
            auto res = client.Get("/health");
            return res && res->status == 200;
        }));
        auto res = client.Get("/api/statistics/dns");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 404);
        server.stop();
        EXPECT_FALSE(server.is_running());
    }
}
