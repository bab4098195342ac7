#include "ping_service.hpp"
#include "database_manager.hpp"
#include "http_server.hpp"
#include "icmp_prober.hpp"
#include "metrics_collector.hpp"
#include "persistence_writer.hpp"
#include "probe_scheduler.hpp"
#include "stats_aggregator.hpp"
#include "target_registry.hpp"
#include <spdlog/spdlog.h>

namespace {

WriterOptions writer_options(const Config& config) {
    WriterOptions options;
    options.queue_capacity = static_cast<size_t>(config.persist_queue_capacity);
    options.batch_size = static_cast<size_t>(config.persist_batch_size);
    options.flush_interval = std::chrono::milliseconds(config.persist_flush_ms);
    options.max_attempts = config.persist_max_attempts;
    options.retry_base = std::chrono::milliseconds(config.persist_retry_base_ms);
    options.shutdown_grace = std::chrono::milliseconds(config.shutdown_grace_ms);
    return options;
}

} // namespace

PingService::PingService(const Config& config, std::unique_ptr<EchoProber> prober)
    : config_(config),
      prober_(std::move(prober)) {

    // Initialize components
    registry_ = std::make_unique<TargetRegistry>(config_.targets);
    if (!prober_) {
        prober_ = std::make_unique<IcmpEchoProber>();
    }
    db_manager_ = std::make_unique<DatabaseManager>(config_.db_path);
    writer_ = std::make_unique<PersistenceWriter>(*db_manager_, writer_options(config_));

    auto targets = registry_->snapshot();

    AggregatorOptions aggregator_options;
    aggregator_options.report_interval_cycles = config_.report_interval_cycles;
    aggregator_options.report_to_log = config_.report_to_log;
    aggregator_ = std::make_unique<StatsAggregator>(
        *targets, aggregator_options,
        [this](PersistItem item) { writer_->enqueue(std::move(item)); });

    metrics_ = std::make_unique<MetricsCollector>(*targets);
    scheduler_ = std::make_unique<ProbeScheduler>(
        *targets, *prober_,
        [this](const ProbeResult& result) { on_result(result); },
        config_.overrun_policy);
    http_server_ = std::make_unique<HttpServer>(config_, *metrics_, db_manager_.get(),
                                                [this] { return aggregator_->all_stats(); });
}

PingService::~PingService() {
    stop();
}

void PingService::start() {
    if (running_) {
        spdlog::warn("{} already running", config_.service_name);
        return;
    }
    spdlog::info("Starting {} with {} targets", config_.service_name, registry_->size());
    running_ = true;

    writer_->start();
    http_server_->start();
    scheduler_->start();

    spdlog::info("{} started successfully.", config_.service_name);
}

void PingService::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    spdlog::info("Stopping {}...", config_.service_name);
    scheduler_->stop();
    writer_->stop();
    http_server_->stop();

    for (const auto& stats : aggregator_->all_stats()) {
        spdlog::info("{}: {} pings, {} ok, {} failed, status {}", stats.target_name, stats.ping_count,
                     stats.success_count, stats.failure_count, to_string(stats.current_state));
    }
}

std::vector<TargetStats> PingService::stats() const {
    return aggregator_->all_stats();
}

MetricsCollector& PingService::metrics() {
    return *metrics_;
}

const TargetRegistry& PingService::registry() const {
    return *registry_;
}

void PingService::on_result(const ProbeResult& result) {
    metrics_->record_result(result);

    TargetAggregator* aggregator = aggregator_->find(result.target_name);
    if (!aggregator) {
        spdlog::warn("Result for unknown target {} ignored", result.target_name);
        return;
    }

    auto transition = aggregator->record(result, std::chrono::milliseconds(config_.delivery_grace_ms));
    if (transition && transition->effect == Transition::Effect::Opened) {
        metrics_->record_disconnect(result.target_name);
    }
}
