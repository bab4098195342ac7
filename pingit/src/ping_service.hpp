#pragma once
#include "config.hpp"
#include "icmp_prober.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <vector>

// Forward declarations for components
class TargetRegistry;
class StatsAggregator;
class MetricsCollector;
class DatabaseManager;
class PersistenceWriter;
class ProbeScheduler;
class HttpServer;

class PingService {
public:
    // A null prober selects ICMP echo.
    explicit PingService(const Config& config, std::unique_ptr<EchoProber> prober = nullptr);
    ~PingService();

    void start();
    // Stops probing first, then drains persistence, then closes the listener.
    void stop();
    bool is_running() const { return running_; }

    std::vector<TargetStats> stats() const;
    MetricsCollector& metrics();
    const TargetRegistry& registry() const;

private:
    void on_result(const ProbeResult& result);

    Config config_;
    std::atomic<bool> running_{false};
    std::unique_ptr<TargetRegistry> registry_;
    std::unique_ptr<EchoProber> prober_;
    std::unique_ptr<DatabaseManager> db_manager_;
    std::unique_ptr<PersistenceWriter> writer_;
    std::unique_ptr<StatsAggregator> aggregator_;
    std::unique_ptr<MetricsCollector> metrics_;
    std::unique_ptr<ProbeScheduler> scheduler_;
    std::unique_ptr<HttpServer> http_server_;
};
