#include "audit_logger.hpp"
#include "json_schemas.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

DecisionAudit::DecisionAudit(const Config& config) : config_(config) {
    connect();
}

DecisionAudit::~DecisionAudit() {
    if (conn_ && conn_->is_open()) {
        conn_->close();
    }
}

bool DecisionAudit::connect() {
    try {
        conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
        spdlog::info("Successfully connected to decision audit database.");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to decision audit database: {}", e.what());
        conn_.reset();
        return false;
    }
}

// Caller holds conn_mutex_
bool DecisionAudit::ensure_connection() {
    if (!conn_ || !conn_->is_open()) {
        if (!connect()) {
            return false;
        }
    }
    try {
        pqxx::nontransaction n(*conn_);
        n.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Decision audit database health check failed: {}", e.what());
        return false;
    }
}

bool DecisionAudit::check_health() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    return ensure_connection();
}

bool DecisionAudit::initialize_schema() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return false;
    }

    try {
        pqxx::work w(*conn_);
        w.exec(R"(
            CREATE TABLE IF NOT EXISTS engine_decisions (
                id BIGSERIAL PRIMARY KEY,
                timestamp TIMESTAMP WITH TIME ZONE NOT NULL,
                match_id TEXT NOT NULL,
                market TEXT NOT NULL,
                selection TEXT NOT NULL,
                price DOUBLE PRECISION NOT NULL,
                edge DOUBLE PRECISION NOT NULL,
                confidence DOUBLE PRECISION NOT NULL,
                stake DOUBLE PRECISION NOT NULL,
                outcome TEXT NOT NULL,
                reason TEXT NOT NULL,
                note TEXT,
                raw_recommendation JSONB NOT NULL
            )
        )");
        w.exec("CREATE INDEX IF NOT EXISTS idx_engine_decisions_match ON engine_decisions(match_id)");
        w.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize decision audit schema: {}", e.what());
        return false;
    }
}

void DecisionAudit::publish(const Recommendation& recommendation) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        spdlog::error("Cannot write decision audit record, database connection is down.");
        return;
    }

    const auto& probability = recommendation.probability;
    const auto& decision = recommendation.decision;
    try {
        pqxx::work w(*conn_);
        w.exec_params(
            "INSERT INTO engine_decisions (timestamp, match_id, market, selection, price, edge, confidence, "
            "stake, outcome, reason, note, raw_recommendation) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)",
            util::format_iso8601(decision.timestamp),
            recommendation.match.match_id,
            probability.market.to_string(),
            to_string(probability.selection),
            probability.price,
            probability.edge,
            recommendation.confidence,
            recommendation.stake.amount,
            to_string(decision.outcome),
            to_string(decision.reason),
            decision.note,
            recommendation_to_json(recommendation).dump()
        );
        w.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to write decision audit record: {}", e.what());
    }
}
