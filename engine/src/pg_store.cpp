#include "pg_store.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>

class PostgresStore::Impl {
public:
    Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        disconnect();
    }

    bool connect() {
        try {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL bet history");
                backoff_ms_ = 1000;
                retry_count_ = 0;
                return true;
            }
            spdlog::error("PostgreSQL connection is not open");
            return false;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            conn_.reset();
            return false;
        }
    }

    void disconnect() {
        if (conn_ && conn_->is_open()) {
            conn_->close();
            conn_.reset();
            spdlog::info("Disconnected from PostgreSQL bet history");
        }
    }

    bool is_connected() const {
        return conn_ && conn_->is_open();
    }

    bool healthy() {
        std::lock_guard<std::mutex> lock(mutex_);
        return is_connected();
    }

    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;
        if (connect()) {
            spdlog::info("PostgreSQL connection restored");
            return true;
        }

        spdlog::warn("PostgreSQL reconnection failed (attempt {})", ++retry_count_);
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    bool initialize_schema() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS bets (
                    id BIGSERIAL PRIMARY KEY,
                    match_id TEXT NOT NULL,
                    market TEXT NOT NULL,
                    selection TEXT NOT NULL,
                    stake DOUBLE PRECISION NOT NULL,
                    price DOUBLE PRECISION NOT NULL,
                    status TEXT NOT NULL DEFAULT 'open',
                    placed_at TIMESTAMP WITH TIME ZONE NOT NULL,
                    settled_at TIMESTAMP WITH TIME ZONE
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_bets_status ON bets(status)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_bets_settled_at ON bets(settled_at)");
            txn.commit();
            spdlog::info("Bet history schema initialized");
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to initialize bet history schema: {}", e.what());
            return false;
        }
    }

    bool record_bet(const BetRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            txn.exec_params(
                "INSERT INTO bets (match_id, market, selection, stake, price, status, placed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7)",
                record.key.match_id,
                record.key.market.to_string(),
                to_string(record.key.selection),
                record.stake,
                record.price,
                to_string(record.status),
                util::format_iso8601(record.timestamp)
            );
            txn.commit();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to record bet on {}: {}", record.key.match_id, e.what());
            return false;
        }
    }

    PositionSet query_open_positions(const std::optional<std::string>& match_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            throw std::runtime_error("bet history unavailable");
        }

        pqxx::work txn(*conn_);
        pqxx::result result = match_id
            ? txn.exec_params("SELECT match_id, market, selection FROM bets "
                              "WHERE status IN ('open', 'pending') AND match_id = $1", *match_id)
            : txn.exec("SELECT match_id, market, selection FROM bets WHERE status IN ('open', 'pending')");
        txn.commit();

        PositionSet positions;
        for (const auto& row : result) {
            auto market = Market::parse(row["market"].as<std::string>());
            auto selection = parse_selection(row["selection"].as<std::string>());
            if (!market || !selection) {
                spdlog::warn("Skipping open bet with unknown market/selection: {} {}",
                             row["market"].as<std::string>(), row["selection"].as<std::string>());
                continue;
            }
            positions.insert(PositionKey{row["match_id"].as<std::string>(), *market, *selection});
        }
        return positions;
    }

    double query_realized_pnl(TimePoint since) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            throw std::runtime_error("bet history unavailable");
        }

        pqxx::work txn(*conn_);
        pqxx::result result = txn.exec_params(
            "SELECT COALESCE(SUM(CASE "
            "WHEN status = 'won' THEN stake * (price - 1) "
            "WHEN status = 'lost' THEN -stake "
            "ELSE 0 END), 0) AS pnl "
            "FROM bets WHERE settled_at >= $1",
            util::format_iso8601(since)
        );
        txn.commit();
        return result[0]["pnl"].as<double>();
    }

private:
    const Config& config_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex mutex_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

PostgresStore::PostgresStore(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}

PostgresStore::~PostgresStore() = default;

bool PostgresStore::is_connected() const {
    return pImpl_->healthy();
}

bool PostgresStore::initialize_schema() {
    return pImpl_->initialize_schema();
}

bool PostgresStore::record_bet(const BetRecord& record) {
    return pImpl_->record_bet(record);
}

PositionSet PostgresStore::query_open_positions(const std::optional<std::string>& match_id) {
    return pImpl_->query_open_positions(match_id);
}

double PostgresStore::query_realized_pnl(TimePoint since) {
    return pImpl_->query_realized_pnl(since);
}
