#include "stats_aggregator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

TargetAggregator::TargetAggregator(Target target, AggregatorOptions options, Sink sink)
    : target_(std::move(target)),
      options_(options),
      sink_(std::move(sink)),
      tracker_(target_.name, target_.host) {
    stats_.target_name = target_.name;
}

std::optional<Transition> TargetAggregator::record(const ProbeResult& result,
                                                   std::chrono::milliseconds grace) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(grace)) {
        spdlog::warn("Result for {} not applied within {} ms, dropped", target_.name, grace.count());
        return std::nullopt;
    }
    return apply(result);
}

Transition TargetAggregator::record(const ProbeResult& result) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return apply(result);
}

TargetStats TargetAggregator::stats() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return stats_;
}

std::optional<DisconnectEvent> TargetAggregator::open_event() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return tracker_.open_event();
}

Transition TargetAggregator::apply(const ProbeResult& result) {
    ++stats_.ping_count;
    if (result.success) {
        ++stats_.success_count;
        if (result.response_time_ms) {
            double rt = *result.response_time_ms;
            ++rt_samples_;
            stats_.min_rt = stats_.min_rt ? std::min(*stats_.min_rt, rt) : rt;
            stats_.max_rt = stats_.max_rt ? std::max(*stats_.max_rt, rt) : rt;
            double avg = stats_.avg_rt.value_or(0.0);
            avg += (rt - avg) / static_cast<double>(rt_samples_);
            // Keep the mean inside [min, max] despite rounding.
            stats_.avg_rt = std::clamp(avg, *stats_.min_rt, *stats_.max_rt);
        }
    } else {
        ++stats_.failure_count;
    }

    Transition transition = tracker_.on_result(result.success, result.timestamp);
    stats_.current_state = transition.to;

    if (sink_) {
        sink_(result);
    }

    if (transition.effect != Transition::Effect::None) {
        spdlog::debug("{}: {} -> {} ({})", target_.name, to_string(transition.from),
                      to_string(transition.to), to_string(transition.effect));
    }

    switch (transition.effect) {
        case Transition::Effect::Opened:
            if (options_.report_to_log) {
                spdlog::warn("DISCONNECT: {} ({})", target_.name, target_.host);
            }
            if (sink_) sink_(*transition.event);
            break;
        case Transition::Effect::Closed:
            if (options_.report_to_log) {
                spdlog::info("RECONNECT: {} ({}) after {} failed pings", target_.name, target_.host,
                             transition.event->consecutive_failure_count);
            }
            if (sink_) sink_(*transition.event);
            break;
        default:
            break;
    }

    if (++cycles_since_report_ >= static_cast<uint64_t>(options_.report_interval_cycles)) {
        cycles_since_report_ = 0;
        emit_snapshot(result.timestamp);
    }

    return transition;
}

void TargetAggregator::emit_snapshot(Timestamp taken_at) {
    if (options_.report_to_log) {
        spdlog::info("{} ({}): {} pings, {:.1f}% success, avg {} ms, status {}",
                     target_.name, target_.host, stats_.ping_count, stats_.success_rate(),
                     stats_.avg_rt ? fmt::format("{:.2f}", *stats_.avg_rt) : "n/a",
                     to_string(stats_.current_state));
    }
    if (!sink_) return;

    StatsSnapshot snapshot;
    snapshot.host = target_.host;
    snapshot.taken_at = taken_at;
    snapshot.stats = stats_;
    sink_(std::move(snapshot));

    if (const auto& open = tracker_.open_event()) {
        sink_(*open);
    }
}

StatsAggregator::StatsAggregator(const std::vector<Target>& targets, AggregatorOptions options,
                                 TargetAggregator::Sink sink) {
    for (const auto& target : targets) {
        auto [it, inserted] = aggregators_.emplace(
            target.name, std::make_unique<TargetAggregator>(target, options, sink));
        if (!inserted) {
            throw std::invalid_argument("Duplicate target name: " + target.name);
        }
    }
}

TargetAggregator* StatsAggregator::find(const std::string& target_name) {
    auto it = aggregators_.find(target_name);
    return it == aggregators_.end() ? nullptr : it->second.get();
}

std::vector<TargetStats> StatsAggregator::all_stats() const {
    std::vector<TargetStats> result;
    result.reserve(aggregators_.size());
    for (const auto& entry : aggregators_) {
        result.push_back(entry.second->stats());
    }
    return result;
}
