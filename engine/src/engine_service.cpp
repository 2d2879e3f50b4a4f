#include "engine_service.hpp"
#include "redis_odds_source.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

void FanoutSink::publish(const Recommendation& recommendation) {
    for (auto* sink : sinks_) {
        try {
            sink->publish(recommendation);
        } catch (const std::exception& e) {
            spdlog::error("Recommendation sink failed for {}: {}", recommendation.match.match_id, e.what());
        }
    }
}

EngineService::EngineService(const Config& config)
    : config_(config) {

    // Initialize components
    history_ = std::make_unique<PostgresStore>(config_);
    ratings_ = std::make_unique<PostgresRatingStore>(config_);
    audit_ = std::make_unique<DecisionAudit>(config_);
    redis_bus_ = std::make_unique<RedisBus>(config_);
    execution_ = std::make_unique<RedisExecutionClient>(config_);
    prices_ = std::make_unique<PriceBoard>(config_);

    if (!history_->initialize_schema()) {
        spdlog::warn("Failed to initialize bet history schema");
    }
    if (!ratings_->initialize_schema()) {
        spdlog::warn("Failed to initialize rating store schema");
    }
    if (!audit_->initialize_schema()) {
        spdlog::warn("Failed to initialize decision audit schema");
    }

    std::vector<std::shared_ptr<OddsSource>> sources;
    for (const auto& source_id : config_.odds_sources) {
        sources.push_back(std::make_shared<RedisOddsSource>(config_, source_id));
    }
    collector_ = std::make_unique<SourceCollector>(std::move(sources),
                                                   std::chrono::milliseconds(config_.source_timeout_ms));

    sink_.add(redis_bus_.get());
    sink_.add(audit_.get());

    runner_ = std::make_unique<CycleRunner>(config_, *collector_, *ratings_, *history_,
                                            *execution_, sink_, *prices_);

    health_ = std::make_unique<HealthServer>(config_, [this](nlohmann::json& status) {
        return fill_health(status);
    });
}

EngineService::~EngineService() {
    stop();
}

void EngineService::run() {
    if (running_) {
        spdlog::warn("Engine service is already running");
        return;
    }

    running_ = true;

    // Live prices keep the gate's view current between cycles
    redis_bus_->subscribe_price_ticks([this](const OddsQuote& quote) {
        prices_->apply(quote);
    });

    health_->start();
    service_thread_ = std::thread(&EngineService::service_thread_func, this);

    spdlog::info("Engine service started. Refresh every {} seconds over {} sources.",
                 config_.refresh_interval_sec, config_.odds_sources.size());
}

void EngineService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("Stopping engine service...");
    redis_bus_->stop_subscribers();

    if (service_thread_.joinable()) {
        service_thread_.join();
    }

    runner_->supersede();
    for (auto& cycle : draining_) {
        cycle.wait();
    }
    draining_.clear();

    health_->stop();
    spdlog::info("Engine service stopped");
}

void EngineService::service_thread_func() {
    spdlog::info("Engine service thread started");

    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            spdlog::error("Error in refresh cycle: {}", e.what());
        }

        auto wake_up_time = std::chrono::steady_clock::now() + std::chrono::seconds(config_.refresh_interval_sec);
        while (running_ && std::chrono::steady_clock::now() < wake_up_time) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    spdlog::info("Engine service thread stopped");
}

void EngineService::tick() {
    reap_finished_cycles();

    auto cycle = std::async(std::launch::async, [this]() { return runner_->run_cycle(); });

    if (cycle.wait_for(std::chrono::milliseconds(config_.cycle_timeout_ms)) != std::future_status::ready) {
        // Let it unwind in the background; it publishes nothing more
        runner_->supersede();
        spdlog::warn("Cycle overran {} ms and was superseded", config_.cycle_timeout_ms);
        draining_.push_back(std::move(cycle));
        return;
    }

    auto report = cycle.get();
    std::lock_guard<std::mutex> lock(report_mutex_);
    last_report_ = std::move(report);
    has_report_ = true;
}

void EngineService::reap_finished_cycles() {
    for (auto it = draining_.begin(); it != draining_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            try {
                auto report = it->get();
                spdlog::info("Superseded cycle {} finished after {} ms", report.cycle_id, report.duration.count());
            } catch (const std::exception& e) {
                spdlog::error("Superseded cycle failed: {}", e.what());
            }
            it = draining_.erase(it);
        } else {
            ++it;
        }
    }
}

bool EngineService::fill_health(nlohmann::json& status) {
    bool history_ok = history_->is_connected();
    bool ratings_ok = ratings_->is_connected();
    bool redis_ok = redis_bus_->is_connected();
    bool audit_ok = audit_->check_health();

    status["components"]["bet_history"] = history_ok ? "healthy" : "unhealthy";
    status["components"]["ratings"] = ratings_ok ? "healthy" : "unhealthy";
    status["components"]["redis"] = redis_ok ? "healthy" : "unhealthy";
    status["components"]["decision_audit"] = audit_ok ? "healthy" : "unhealthy";

    std::lock_guard<std::mutex> lock(report_mutex_);
    if (has_report_) {
        auto& cycle = status["last_cycle"];
        cycle["cycle_id"] = last_report_.cycle_id;
        cycle["quotes"] = last_report_.quotes;
        cycle["stale_quotes"] = last_report_.stale_quotes;
        cycle["matches"] = last_report_.matches;
        cycle["excluded_matches"] = last_report_.excluded_matches;
        cycle["positive_edges"] = last_report_.positive_edges;
        cycle["recommendations"] = last_report_.recommendations;
        cycle["approved"] = last_report_.approved;
        cycle["execution_rejected"] = last_report_.execution_rejected;
        cycle["execution_unconfirmed"] = last_report_.execution_unconfirmed;
        cycle["absent_sources"] = last_report_.absent_sources;
        cycle["duration_ms"] = last_report_.duration.count();
    }

    return history_ok && redis_ok;
}
