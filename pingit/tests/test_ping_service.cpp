#include <gtest/gtest.h>
#include "metrics_collector.hpp"
#include "ping_service.hpp"
#include "target_registry.hpp"
#include "test_helpers.hpp"

namespace {

Config service_config() {
    Config config;
    config.db_path = ":memory:";
    config.http_host = "127.0.0.1";
    config.http_port = 0;
    config.persist_flush_ms = 10;
    config.report_interval_cycles = 2;
    config.targets = {make_target("a", "10.0.0.1"), make_target("b", "10.0.0.2")};
    return config;
}

} // namespace

TEST(PingService, ProbesEveryTargetAndFeedsMetrics) {
    auto prober = std::make_unique<ScriptedProber>(std::vector<ProbeOutcome>{ProbeOutcome::success(2.5)});
    PingService service(service_config(), std::move(prober));
    EXPECT_EQ(service.registry().size(), 2u);

    service.start();
    EXPECT_TRUE(service.is_running());
    ASSERT_TRUE(wait_for([&] {
        auto stats = service.stats();
        return stats.size() == 2 && stats[0].ping_count >= 3 && stats[1].ping_count >= 3;
    }));

    std::string text = service.metrics().collect(true);
    EXPECT_NE(text.find("pingit_ping_time_ms{target_name=\"a\",host=\"10.0.0.1\"} 2.5"), std::string::npos);
    service.stop();
    EXPECT_FALSE(service.is_running());

    for (const auto& stats : service.stats()) {
        EXPECT_EQ(stats.current_state, HealthState::Up);
        EXPECT_EQ(stats.failure_count, 0u);
    }
}

TEST(PingService, OutageCountsOneDisconnect) {
    auto prober = std::make_unique<ScriptedProber>(std::vector<ProbeOutcome>{
        ProbeOutcome::success(1.0),
        ProbeOutcome::failure(ErrorKind::Timeout),
        ProbeOutcome::failure(ErrorKind::Timeout),
        ProbeOutcome::failure(ErrorKind::Timeout),
        ProbeOutcome::failure(ErrorKind::Timeout),
        ProbeOutcome::failure(ErrorKind::Timeout),
        ProbeOutcome::failure(ErrorKind::Timeout),
        ProbeOutcome::success(1.0)});
    auto config = service_config();
    config.targets = {make_target("only")};
    PingService service(config, std::move(prober));

    service.start();
    ASSERT_TRUE(wait_for([&] { return service.stats()[0].ping_count >= 10; }));
    service.stop();

    auto samples = service.metrics().scrape(true);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].disconnect_events, 1u);
    EXPECT_EQ(service.stats()[0].current_state, HealthState::Up);
}
