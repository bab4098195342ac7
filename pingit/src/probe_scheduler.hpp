#pragma once
#include "config.hpp"
#include "icmp_prober.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using ResultHandler = std::function<void(const ProbeResult&)>;

// Probes one target on its own thread until stopped. The next cycle is
// scheduled from the start of the previous one.
class ProbeWorker {
public:
    ProbeWorker(Target target, EchoProber& prober, ResultHandler handler, OverrunPolicy policy);
    ~ProbeWorker();

    void start();
    // Wakes a waiting worker; an in-flight probe still runs to its timeout.
    void request_stop();
    void join();

    bool is_running() const { return running_; }
    uint64_t cycles() const { return cycles_; }
    uint64_t skipped_slots() const { return skipped_slots_; }
    const Target& target() const { return target_; }

    // Non-copyable
    ProbeWorker(const ProbeWorker&) = delete;
    ProbeWorker& operator=(const ProbeWorker&) = delete;

private:
    void run();
    void run_cycle();
    std::chrono::steady_clock::time_point next_start(std::chrono::steady_clock::time_point cycle_start);
    // Returns false if stop was requested before the deadline.
    bool wait_until(std::chrono::steady_clock::time_point deadline);
    Timestamp monotonic_timestamp();

    const Target target_;
    EchoProber& prober_;
    ResultHandler handler_;
    const OverrunPolicy policy_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> skipped_slots_{0};
    Timestamp last_timestamp_{};
    std::thread thread_;
};

class ProbeScheduler {
public:
    ProbeScheduler(const std::vector<Target>& targets, EchoProber& prober,
                   ResultHandler handler, OverrunPolicy policy);
    ~ProbeScheduler();

    void start();
    // Signals every worker first, then joins them.
    void stop();

    size_t size() const { return workers_.size(); }
    uint64_t total_cycles() const;

private:
    std::vector<std::unique_ptr<ProbeWorker>> workers_;
};
