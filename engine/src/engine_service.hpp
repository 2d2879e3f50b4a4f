#pragma once

#include "audit_logger.hpp"
#include "config.hpp"
#include "cycle_runner.hpp"
#include "health.hpp"
#include "pg_rating_store.hpp"
#include "pg_store.hpp"
#include "price_board.hpp"
#include "redis_bus.hpp"
#include "redis_execution_client.hpp"
#include "source_collector.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Forwards each recommendation to every attached sink
class FanoutSink : public RecommendationSink {
public:
    void add(RecommendationSink* sink) { sinks_.push_back(sink); }
    void publish(const Recommendation& recommendation) override;

private:
    std::vector<RecommendationSink*> sinks_;
};

class EngineService {
public:
    explicit EngineService(const Config& config);
    ~EngineService();

    // Start the service
    void run();

    // Stop the service
    void stop();

private:
    void service_thread_func();
    void tick();
    void reap_finished_cycles();
    bool fill_health(nlohmann::json& status);

    Config config_;

    // Service components
    std::unique_ptr<PostgresStore> history_;
    std::unique_ptr<PostgresRatingStore> ratings_;
    std::unique_ptr<DecisionAudit> audit_;
    std::unique_ptr<RedisBus> redis_bus_;
    std::unique_ptr<RedisExecutionClient> execution_;
    std::unique_ptr<SourceCollector> collector_;
    std::unique_ptr<PriceBoard> prices_;
    FanoutSink sink_;
    std::unique_ptr<CycleRunner> runner_;
    std::unique_ptr<HealthServer> health_;

    // Thread management
    std::atomic<bool> running_{false};
    std::thread service_thread_;

    // Superseded cycles still unwinding
    std::vector<std::future<CycleReport>> draining_;

    std::mutex report_mutex_;
    CycleReport last_report_;
    bool has_report_ = false;
};
