#include "metrics_collector.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace {

constexpr const char* kPingTimeMetric = "pingit_ping_time_ms";
constexpr const char* kDisconnectMetric = "pingit_disconnect_events_total";

void write_labels(std::ostringstream& out, const MetricSample& sample) {
    out << "{target_name=\"" << escape_label_value(sample.target_name)
        << "\",host=\"" << escape_label_value(sample.host) << "\"}";
}

} // namespace

std::string escape_label_value(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"': escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

MetricsCollector::MetricsCollector(const std::vector<Target>& targets) {
    for (const auto& target : targets) {
        auto entry = std::make_unique<Entry>();
        entry->host = target.host;
        entries_.emplace(target.name, std::move(entry));
    }
}

MetricsCollector::Entry* MetricsCollector::find(const std::string& target_name) {
    auto it = entries_.find(target_name);
    if (it == entries_.end()) {
        spdlog::debug("No metrics entry for target {}", target_name);
        return nullptr;
    }
    return it->second.get();
}

bool MetricsCollector::record_result(const ProbeResult& result) {
    Entry* entry = find(result.target_name);
    if (!entry) return false;
    if (result.success && result.response_time_ms) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->ping_time_ms = result.response_time_ms;
    }
    return true;
}

bool MetricsCollector::record_disconnect(const std::string& target_name) {
    Entry* entry = find(target_name);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    ++entry->disconnect_events;
    return true;
}

std::vector<MetricSample> MetricsCollector::scrape(bool drain) {
    std::vector<MetricSample> samples;
    samples.reserve(entries_.size());

    for (auto& [name, entry] : entries_) {
        MetricSample sample;
        sample.target_name = name;
        sample.host = entry->host;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            sample.ping_time_ms = entry->ping_time_ms;
            sample.disconnect_events = entry->disconnect_events;
            if (drain) {
                entry->ping_time_ms.reset();
                entry->disconnect_events = 0;
            }
        }
        samples.push_back(std::move(sample));
    }
    return samples;
}

std::string MetricsCollector::render(const std::vector<MetricSample>& samples) {
    std::ostringstream out;

    out << "# HELP " << kPingTimeMetric << " Last successful ping response time in milliseconds\n";
    out << "# TYPE " << kPingTimeMetric << " gauge\n";
    for (const auto& sample : samples) {
        if (!sample.ping_time_ms) continue;
        out << kPingTimeMetric;
        write_labels(out, sample);
        out << " " << *sample.ping_time_ms << "\n";
    }

    out << "# HELP " << kDisconnectMetric << " Disconnect events opened since the last scrape\n";
    out << "# TYPE " << kDisconnectMetric << " counter\n";
    for (const auto& sample : samples) {
        out << kDisconnectMetric;
        write_labels(out, sample);
        out << " " << sample.disconnect_events << "\n";
    }

    return out.str();
}
