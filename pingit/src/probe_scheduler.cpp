#include "probe_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

ProbeWorker::ProbeWorker(Target target, EchoProber& prober, ResultHandler handler, OverrunPolicy policy)
    : target_(std::move(target)),
      prober_(prober),
      handler_(std::move(handler)),
      policy_(policy) {}

ProbeWorker::~ProbeWorker() {
    request_stop();
    join();
}

void ProbeWorker::start() {
    if (running_) {
        spdlog::warn("Probe worker for {} already running", target_.name);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread(&ProbeWorker::run, this);
}

void ProbeWorker::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

void ProbeWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void ProbeWorker::run() {
    spdlog::info("Probing {} ({}) every {} ms, timeout {} ms", target_.name, target_.host,
                 target_.interval.count(), target_.timeout.count());

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) break;
        }

        auto cycle_start = std::chrono::steady_clock::now();
        try {
            run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("Probe cycle for {} failed: {}", target_.name, e.what());
        }
        ++cycles_;

        if (!wait_until(next_start(cycle_start))) break;
    }

    spdlog::info("Probe worker for {} stopped after {} cycles", target_.name, cycles_.load());
}

void ProbeWorker::run_cycle() {
    ProbeOutcome outcome = prober_.probe(target_);
    Timestamp ts = monotonic_timestamp();

    ProbeResult result = outcome.ok()
        ? ProbeResult::ok(target_, ts, *outcome.rtt_ms)
        : ProbeResult::failed(target_, ts, outcome.error);

    if (result.success) {
        spdlog::debug("{} ({}): {:.2f} ms", target_.name, target_.host, *result.response_time_ms);
    } else {
        spdlog::debug("{} ({}): {}", target_.name, target_.host, to_string(outcome.error));
    }

    if (handler_) {
        handler_(result);
    }
}

std::chrono::steady_clock::time_point ProbeWorker::next_start(std::chrono::steady_clock::time_point cycle_start) {
    auto next = cycle_start + target_.interval;
    auto now = std::chrono::steady_clock::now();
    if (next > now) {
        return next;
    }

    if (policy_ == OverrunPolicy::Immediate) {
        spdlog::debug("Probe of {} overran its {} ms interval", target_.name, target_.interval.count());
        return now;
    }

    // Skip to the first slot of the original schedule still ahead of us.
    auto missed = (now - next) / target_.interval + 1;
    skipped_slots_ += static_cast<uint64_t>(missed);
    spdlog::debug("Probe of {} overran, skipping {} slot(s)", target_.name, static_cast<int64_t>(missed));
    return next + missed * target_.interval;
}

bool ProbeWorker::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_until(lock, deadline, [this] { return stop_requested_; });
}

Timestamp ProbeWorker::monotonic_timestamp() {
    // A wall clock step backwards must not reorder this target's results.
    Timestamp now = Clock::now();
    if (now < last_timestamp_) {
        now = last_timestamp_;
    }
    last_timestamp_ = now;
    return now;
}

ProbeScheduler::ProbeScheduler(const std::vector<Target>& targets, EchoProber& prober,
                               ResultHandler handler, OverrunPolicy policy) {
    workers_.reserve(targets.size());
    for (const auto& target : targets) {
        workers_.push_back(std::make_unique<ProbeWorker>(target, prober, handler, policy));
    }
}

ProbeScheduler::~ProbeScheduler() {
    stop();
}

void ProbeScheduler::start() {
    for (auto& worker : workers_) {
        worker->start();
    }
    spdlog::info("Started {} probe workers", workers_.size());
}

void ProbeScheduler::stop() {
    for (auto& worker : workers_) {
        worker->request_stop();
    }
    for (auto& worker : workers_) {
        worker->join();
    }
}

uint64_t ProbeScheduler::total_cycles() const {
    uint64_t total = 0;
    for (const auto& worker : workers_) {
        total += worker->cycles();
    }
    return total;
}
