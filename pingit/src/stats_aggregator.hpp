#pragma once
#include "disconnect_tracker.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct AggregatorOptions {
    int report_interval_cycles = 10;
    bool report_to_log = false;
};

// Running statistics and disconnect FSM for a single target. Everything it
// hands to the sink is emitted under the target's lock, so the sink sees
// this target's records in arrival order.
class TargetAggregator {
public:
    using Sink = std::function<void(PersistItem)>;

    TargetAggregator(Target target, AggregatorOptions options, Sink sink);

    // Waits at most `grace` for the target lock. Returns nullopt when the
    // result could not be applied in time.
    std::optional<Transition> record(const ProbeResult& result, std::chrono::milliseconds grace);
    Transition record(const ProbeResult& result);

    TargetStats stats() const;
    std::optional<DisconnectEvent> open_event() const;

    const Target& target() const { return target_; }

    // Non-copyable
    TargetAggregator(const TargetAggregator&) = delete;
    TargetAggregator& operator=(const TargetAggregator&) = delete;

private:
    Transition apply(const ProbeResult& result);
    void emit_snapshot(Timestamp taken_at);

    const Target target_;
    const AggregatorOptions options_;
    Sink sink_;

    mutable std::timed_mutex mutex_;
    TargetStats stats_;
    uint64_t rt_samples_ = 0;
    uint64_t cycles_since_report_ = 0;
    DisconnectTracker tracker_;
};

// One TargetAggregator per configured target. The set is fixed at
// construction; lookups need no lock.
class StatsAggregator {
public:
    StatsAggregator(const std::vector<Target>& targets, AggregatorOptions options,
                    TargetAggregator::Sink sink);

    TargetAggregator* find(const std::string& target_name);
    std::vector<TargetStats> all_stats() const;
    size_t size() const { return aggregators_.size(); }

private:
    std::map<std::string, std::unique_ptr<TargetAggregator>> aggregators_;
};
