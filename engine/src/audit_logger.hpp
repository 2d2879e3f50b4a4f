#pragma once

#include "config.hpp"
#include "recommendation_sink.hpp"
#include "types.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>

// Every recommendation that reached the gate, into `engine_decisions`
class DecisionAudit : public RecommendationSink {
public:
    explicit DecisionAudit(const Config& config);
    ~DecisionAudit() override;

    void publish(const Recommendation& recommendation) override;
    bool check_health();
    bool initialize_schema();

private:
    bool connect();
    bool ensure_connection();

    const Config& config_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex conn_mutex_;
};
