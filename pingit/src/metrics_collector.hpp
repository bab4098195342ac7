#pragma once
#include "types.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct MetricSample {
    std::string target_name;
    std::string host;
    std::optional<double> ping_time_ms;
    uint64_t disconnect_events = 0;
};

// Per-target gauge (last response time) and counter (disconnects opened).
// Each target has its own lock; the target set is fixed at construction.
class MetricsCollector {
public:
    explicit MetricsCollector(const std::vector<Target>& targets);

    // Successful results set the gauge; failures leave it alone.
    bool record_result(const ProbeResult& result);
    bool record_disconnect(const std::string& target_name);

    // With drain=true every entry is read and reset in one step.
    std::vector<MetricSample> scrape(bool drain);

    // Prometheus text exposition of a scrape.
    static std::string render(const std::vector<MetricSample>& samples);
    std::string collect(bool drain) { return render(scrape(drain)); }

    // Non-copyable
    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

private:
    struct Entry {
        std::string host;
        std::mutex mutex;
        std::optional<double> ping_time_ms;
        uint64_t disconnect_events = 0;
    };

    Entry* find(const std::string& target_name);

    std::map<std::string, std::unique_ptr<Entry>> entries_;
};

std::string escape_label_value(const std::string& value);
