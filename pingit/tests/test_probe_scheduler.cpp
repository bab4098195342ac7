#include <gtest/gtest.h>
#include "probe_scheduler.hpp"
#include "test_helpers.hpp"
#include <mutex>
#include <set>

namespace {

struct ResultLog {
    std::mutex mutex;
    std::vector<ProbeResult> results;

    ResultHandler handler() {
        return [this](const ProbeResult& r) {
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(r);
        };
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return results.size();
    }

    std::vector<ProbeResult> copy() {
        std::lock_guard<std::mutex> lock(mutex);
        return results;
    }
};

} // namespace

TEST(ProbeWorker, EmitsOneResultPerCycle) {
    ScriptedProber prober({ProbeOutcome::success(4.0), ProbeOutcome::failure(ErrorKind::Unreachable),
                           ProbeOutcome::success(6.0)});
    ResultLog log;
    ProbeWorker worker(make_target("t"), prober, log.handler(), OverrunPolicy::Immediate);
    worker.start();
    ASSERT_TRUE(wait_for([&] { return log.size() >= 3; }));
    worker.request_stop();
    worker.join();

    auto results = log.copy();
    EXPECT_EQ(results.size(), worker.cycles());
    EXPECT_EQ(static_cast<int>(results.size()), prober.calls());
    EXPECT_TRUE(results[0].success);
    EXPECT_DOUBLE_EQ(results[0].response_time_ms.value_or(0), 4.0);
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error_kind, ErrorKind::Unreachable);
    EXPECT_FALSE(results[1].response_time_ms.has_value());
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_LE(results[i - 1].timestamp, results[i].timestamp);
        EXPECT_EQ(results[i].target_name, "t");
    }
}

TEST(ProbeWorker, StopInterruptsLongWait) {
    ScriptedProber prober({});
    ResultLog log;
    ProbeWorker worker(make_target("t", "192.0.2.1", std::chrono::minutes(10)), prober, log.handler(),
                       OverrunPolicy::Immediate);
    worker.start();
    ASSERT_TRUE(wait_for([&] { return log.size() == 1; }));

    auto started = std::chrono::steady_clock::now();
    worker.request_stop();
    worker.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    EXPECT_EQ(log.size(), 1u);
    EXPECT_FALSE(worker.is_running());
}

TEST(ProbeWorker, NoNewCycleAfterStop) {
    ScriptedProber prober({}, std::chrono::milliseconds(50));
    ResultLog log;
    ProbeWorker worker(make_target("t", "192.0.2.1", std::chrono::milliseconds(1)), prober, log.handler(),
                       OverrunPolicy::Immediate);
    worker.start();
    ASSERT_TRUE(wait_for([&] { return prober.calls() >= 1; }));
    worker.request_stop();
    worker.join();

    // The in-flight probe completes and is delivered; nothing starts after.
    EXPECT_EQ(static_cast<int>(log.size()), prober.calls());
    EXPECT_LE(prober.calls(), 2);
}

TEST(ProbeWorker, SkipPolicyCountsMissedSlots) {
    ScriptedProber prober({}, std::chrono::milliseconds(35));
    ResultLog log;
    ProbeWorker worker(make_target("t", "192.0.2.1", std::chrono::milliseconds(10)), prober, log.handler(),
                       OverrunPolicy::SkipMissed);
    worker.start();
    ASSERT_TRUE(wait_for([&] { return log.size() >= 2; }));
    worker.request_stop();
    worker.join();
    EXPECT_GE(worker.skipped_slots(), 3u);
}

TEST(ProbeWorker, ImmediatePolicySkipsNothing) {
    ScriptedProber prober({}, std::chrono::milliseconds(15));
    ResultLog log;
    ProbeWorker worker(make_target("t", "192.0.2.1", std::chrono::milliseconds(5)), prober, log.handler(),
                       OverrunPolicy::Immediate);
    worker.start();
    ASSERT_TRUE(wait_for([&] { return log.size() >= 3; }));
    worker.request_stop();
    worker.join();
    EXPECT_EQ(worker.skipped_slots(), 0u);
}

TEST(ProbeWorker, HandlerExceptionDoesNotKillWorker) {
    ScriptedProber prober({});
    std::atomic<int> calls{0};
    ProbeWorker worker(make_target("t"), prober, [&](const ProbeResult&) {
        if (++calls == 1) throw std::runtime_error("boom");
    }, OverrunPolicy::Immediate);
    worker.start();
    ASSERT_TRUE(wait_for([&] { return calls.load() >= 3; }));
    worker.request_stop();
    worker.join();
}

TEST(ProbeScheduler, RunsEveryTargetInParallel) {
    std::vector<Target> targets;
    for (int i = 0; i < 5; ++i) targets.push_back(make_target("t" + std::to_string(i)));
    ScriptedProber prober({}, std::chrono::milliseconds(100));
    ResultLog log;

    ProbeScheduler scheduler(targets, prober, log.handler(), OverrunPolicy::Immediate);
    EXPECT_EQ(scheduler.size(), 5u);
    auto started = std::chrono::steady_clock::now();
    scheduler.start();
    ASSERT_TRUE(wait_for([&] { return log.size() >= 5; }));
    // Serial probing would need at least 500 ms for the first round.
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(400));
    scheduler.stop();

    EXPECT_EQ(scheduler.total_cycles(), log.size());
    std::set<std::string> seen;
    for (const auto& r : log.copy()) seen.insert(r.target_name);
    EXPECT_EQ(seen.size(), 5u);
}
