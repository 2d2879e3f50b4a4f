#include "pg_rating_store.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace {

constexpr auto kCacheTtl = std::chrono::minutes(5);

template <typename T>
struct Cached {
    std::optional<T> value;
    std::chrono::steady_clock::time_point fetched_at;
};

template <typename T>
bool cache_hit(const std::unordered_map<std::string, Cached<T>>& cache, const std::string& key,
               std::optional<T>& out) {
    auto it = cache.find(key);
    if (it == cache.end() || std::chrono::steady_clock::now() - it->second.fetched_at >= kCacheTtl) {
        return false;
    }
    out = it->second.value;
    return true;
}

} // namespace

class PostgresRatingStore::Impl {
public:
    Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        if (conn_ && conn_->is_open()) {
            conn_->close();
        }
    }

    bool connect() {
        try {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL rating store");
                backoff_ms_ = 1000;
                retry_count_ = 0;
                return true;
            }
            return false;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect rating store to PostgreSQL: {}", e.what());
            conn_.reset();
            return false;
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
            spdlog::info("Rating store connection restored");
            return true;
        }

        spdlog::warn("Rating store reconnection failed (attempt {})", ++retry_count_);
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
                CREATE TABLE IF NOT EXISTS team_ratings (
                    team_id TEXT PRIMARY KEY,
                    attack_strength DOUBLE PRECISION NOT NULL,
                    defense_strength DOUBLE PRECISION NOT NULL,
                    home_advantage DOUBLE PRECISION NOT NULL DEFAULT 1.0,
                    updated_at TIMESTAMP WITH TIME ZONE NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS team_form (
                    team_id TEXT PRIMARY KEY,
                    form DOUBLE PRECISION NOT NULL,
                    updated_at TIMESTAMP WITH TIME ZONE NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS head_to_head (
                    home_team TEXT NOT NULL,
                    away_team TEXT NOT NULL,
                    home_score DOUBLE PRECISION NOT NULL,
                    updated_at TIMESTAMP WITH TIME ZONE NOT NULL DEFAULT NOW(),
                    PRIMARY KEY (home_team, away_team)
                )
            )");
            txn.commit();
            spdlog::info("Rating store schema initialized");
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to initialize rating store schema: {}", e.what());
            return false;
        }
    }

    std::optional<TeamRating> get_rating(const std::string& team_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<TeamRating> cached;
        if (cache_hit(rating_cache_, team_id, cached)) {
            return cached;
        }

        if (!ensure_connection()) {
            return std::nullopt;
        }

        try {
            pqxx::work txn(*conn_);
            pqxx::result result = txn.exec_params(
                "SELECT attack_strength, defense_strength, home_advantage, "
                "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_epoch "
                "FROM team_ratings WHERE team_id = $1",
                team_id
            );
            txn.commit();

            std::optional<TeamRating> rating;
            if (!result.empty()) {
                TeamRating r;
                r.team_id = team_id;
                r.attack_strength = result[0]["attack_strength"].as<double>();
                r.defense_strength = result[0]["defense_strength"].as<double>();
                r.home_advantage = result[0]["home_advantage"].as<double>();
                r.last_updated = Clock::from_time_t(result[0]["updated_epoch"].as<long long>());
                rating = r;
            }

            rating_cache_[team_id] = {rating, std::chrono::steady_clock::now()};
            return rating;
        } catch (const std::exception& e) {
            spdlog::error("Error fetching rating for {}: {}", team_id, e.what());
            return std::nullopt;
        }
    }

    bool is_fresh(const TeamRating& rating) const {
        return Clock::now() - rating.last_updated <= std::chrono::hours(config_.rating_staleness_hours);
    }

    std::optional<double> get_recent_form(const std::string& team_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<double> cached;
        if (cache_hit(form_cache_, team_id, cached)) {
            return cached;
        }

        if (!ensure_connection()) {
            return std::nullopt;
        }

        try {
            pqxx::work txn(*conn_);
            pqxx::result result = txn.exec_params(
                "SELECT form FROM team_form WHERE team_id = $1", team_id);
            txn.commit();

            std::optional<double> form;
            if (!result.empty()) {
                form = std::clamp(result[0]["form"].as<double>(), 0.0, 1.0);
            }
            form_cache_[team_id] = {form, std::chrono::steady_clock::now()};
            return form;
        } catch (const std::exception& e) {
            spdlog::error("Error fetching form for {}: {}", team_id, e.what());
            return std::nullopt;
        }
    }

    std::optional<double> get_head_to_head(const std::string& home_team, const std::string& away_team) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string key = home_team + "|" + away_team;
        std::optional<double> cached;
        if (cache_hit(h2h_cache_, key, cached)) {
            return cached;
        }

        if (!ensure_connection()) {
            return std::nullopt;
        }

        try {
            pqxx::work txn(*conn_);
            pqxx::result result = txn.exec_params(
                "SELECT home_score FROM head_to_head WHERE home_team = $1 AND away_team = $2",
                home_team, away_team);
            txn.commit();

            std::optional<double> score;
            if (!result.empty()) {
                score = std::clamp(result[0]["home_score"].as<double>(), 0.0, 1.0);
            }
            h2h_cache_[key] = {score, std::chrono::steady_clock::now()};
            return score;
        } catch (const std::exception& e) {
            spdlog::error("Error fetching head-to-head for {} vs {}: {}", home_team, away_team, e.what());
            return std::nullopt;
        }
    }

private:
    const Config& config_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex mutex_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;

    // Caches
    std::unordered_map<std::string, Cached<TeamRating>> rating_cache_;
    std::unordered_map<std::string, Cached<double>> form_cache_;
    std::unordered_map<std::string, Cached<double>> h2h_cache_;
};

PostgresRatingStore::PostgresRatingStore(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}

PostgresRatingStore::~PostgresRatingStore() = default;

bool PostgresRatingStore::is_connected() const {
    return pImpl_->healthy();
}

bool PostgresRatingStore::initialize_schema() {
    return pImpl_->initialize_schema();
}

std::optional<TeamRating> PostgresRatingStore::get_rating(const std::string& team_id) {
    return pImpl_->get_rating(team_id);
}

bool PostgresRatingStore::is_fresh(const TeamRating& rating) const {
    return pImpl_->is_fresh(rating);
}

std::optional<double> PostgresRatingStore::get_recent_form(const std::string& team_id) {
    return pImpl_->get_recent_form(team_id);
}

std::optional<double> PostgresRatingStore::get_head_to_head(const std::string& home_team, const std::string& away_team) {
    return pImpl_->get_head_to_head(home_team, away_team);
}
