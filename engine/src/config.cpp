#include "config.hpp"
#include "util.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    // Malformed numbers are fatal: the engine never runs under guessed bounds
    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != std::string(value).size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::exception&) {
            throw std::runtime_error(fmt::format("Invalid integer value for {}: {}", name, value));
        }
    }

    // Whole string must be a number; std::stod alone accepts "60x"
    double parse_double(const std::string& text) {
        size_t consumed = 0;
        double parsed = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return parsed;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        try {
            return parse_double(value);
        } catch (const std::exception&) {
            throw std::runtime_error(fmt::format("Invalid double value for {}: {}", name, value));
        }
    }

    void require(bool condition, const std::string& message) {
        if (!condition) {
            throw std::runtime_error(message);
        }
    }
}

void Config::load_from_env() {
    // Service configuration
    service_name = util::get_env_var("SERVICE_NAME", service_name);
    log_level = util::get_env_var("LOG_LEVEL", log_level);
    health_host = util::get_env_var("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);
    thread_pool_size = get_env_int("THREAD_POOL_SIZE", thread_pool_size);

    // Storage and messaging
    pg_dsn = util::get_env_var("PG_DSN", pg_dsn);
    redis_url = util::get_env_var("REDIS_URL", redis_url);
    const char* sources = std::getenv("ODDS_SOURCES");
    if (sources) {
        odds_sources = util::split_string(sources, ',');
    }
    odds_snapshot_prefix = util::get_env_var("ODDS_SNAPSHOT_PREFIX", odds_snapshot_prefix);
    stream_price_ticks = util::get_env_var("STREAM_PRICE_TICKS", stream_price_ticks);
    stream_recommendations = util::get_env_var("STREAM_RECOMMENDATIONS", stream_recommendations);
    stream_intents = util::get_env_var("STREAM_INTENTS", stream_intents);
    intent_reply_prefix = util::get_env_var("INTENT_REPLY_PREFIX", intent_reply_prefix);
    intent_reply_timeout_ms = get_env_int("INTENT_REPLY_TIMEOUT_MS", intent_reply_timeout_ms);

    // Refresh cycle
    refresh_interval_sec = get_env_int("REFRESH_INTERVAL_SEC", refresh_interval_sec);
    source_timeout_ms = get_env_int("SOURCE_TIMEOUT_MS", source_timeout_ms);
    cycle_timeout_ms = get_env_int("CYCLE_TIMEOUT_MS", cycle_timeout_ms);

    // Source aggregation
    match_tolerance_min = get_env_int("MATCH_TOLERANCE_MIN", match_tolerance_min);
    price_discrepancy_tol = get_env_double("PRICE_DISCREPANCY_TOL", price_discrepancy_tol);

    // Scoreline model
    scoreline_cutoff = get_env_int("SCORELINE_CUTOFF", scoreline_cutoff);
    model_rho = get_env_double("MODEL_RHO", model_rho);
    rating_staleness_hours = get_env_int("RATING_STALENESS_HOURS", rating_staleness_hours);
    league_avg_goals = get_env_double("LEAGUE_AVG_GOALS", league_avg_goals);
    default_home_advantage = get_env_double("DEFAULT_HOME_ADVANTAGE", default_home_advantage);
    match_minutes = get_env_int("MATCH_MINUTES", match_minutes);
    fatigue_threshold_min = get_env_int("FATIGUE_THRESHOLD_MIN", fatigue_threshold_min);
    fatigue_decay_per_min = get_env_double("FATIGUE_DECAY_PER_MIN", fatigue_decay_per_min);
    trailing_attack_boost = get_env_double("TRAILING_ATTACK_BOOST", trailing_attack_boost);
    trailing_attack_cap = get_env_double("TRAILING_ATTACK_CAP", trailing_attack_cap);

    // Confidence scoring
    weights.edge = get_env_double("WEIGHT_EDGE", weights.edge);
    weights.agreement = get_env_double("WEIGHT_AGREEMENT", weights.agreement);
    weights.recent_form = get_env_double("WEIGHT_FORM", weights.recent_form);
    weights.head_to_head = get_env_double("WEIGHT_H2H", weights.head_to_head);
    weights.home_away = get_env_double("WEIGHT_HOME_AWAY", weights.home_away);
    edge_saturation = get_env_double("EDGE_SATURATION", edge_saturation);
    low_confidence_ceiling = get_env_double("LOW_CONFIDENCE_CEILING", low_confidence_ceiling);

    // Stake sizing
    bankroll = get_env_double("BANKROLL", bankroll);
    currency = util::get_env_var("CURRENCY", currency);
    kelly_max_fraction = get_env_double("KELLY_MAX_FRACTION", kelly_max_fraction);
    const char* brackets = std::getenv("STAKE_BRACKETS");
    if (brackets) {
        stake_brackets = parse_stake_brackets(brackets);
    }
    max_stake = get_env_double("MAX_STAKE", max_stake);

    // Safety gate
    auto_act_threshold = get_env_double("AUTO_ACT_THRESHOLD", auto_act_threshold);
    daily_loss_limit = get_env_double("DAILY_LOSS_LIMIT", daily_loss_limit);
    snapshot_staleness_sec = get_env_int("SNAPSHOT_STALENESS_SEC", snapshot_staleness_sec);
    price_move_tol = get_env_double("PRICE_MOVE_TOL", price_move_tol);
}

void Config::validate() const {
    require(thread_pool_size >= 1, "THREAD_POOL_SIZE must be at least 1");
    require(health_port > 0 && health_port <= 65535, "HEALTH_PORT must be between 1 and 65535");
    require(!odds_sources.empty(), "At least one odds source is required");
    require(intent_reply_timeout_ms > 0, "INTENT_REPLY_TIMEOUT_MS must be positive");

    require(refresh_interval_sec > 0, "REFRESH_INTERVAL_SEC must be positive");
    require(source_timeout_ms > 0, "SOURCE_TIMEOUT_MS must be positive");
    require(cycle_timeout_ms >= source_timeout_ms, "CYCLE_TIMEOUT_MS must not be shorter than SOURCE_TIMEOUT_MS");

    require(match_tolerance_min >= 0, "MATCH_TOLERANCE_MIN must not be negative");
    require(price_discrepancy_tol >= 0.0, "PRICE_DISCREPANCY_TOL must not be negative");

    require(scoreline_cutoff >= 1, "SCORELINE_CUTOFF must be at least 1");
    require(model_rho >= -1.0 && model_rho <= 1.0, "MODEL_RHO must lie within [-1, 1]");
    require(rating_staleness_hours > 0, "RATING_STALENESS_HOURS must be positive");
    require(league_avg_goals > 0.0, "LEAGUE_AVG_GOALS must be positive");
    require(default_home_advantage > 0.0, "DEFAULT_HOME_ADVANTAGE must be positive");
    require(match_minutes > 0, "MATCH_MINUTES must be positive");
    require(fatigue_threshold_min >= 0 && fatigue_threshold_min <= match_minutes,
            "FATIGUE_THRESHOLD_MIN must lie within the match length");
    require(fatigue_decay_per_min >= 0.0, "FATIGUE_DECAY_PER_MIN must not be negative");
    require(trailing_attack_boost >= 0.0 && trailing_attack_cap >= 0.0,
            "Trailing attack boost and cap must not be negative");

    require(weights.edge >= 0.0 && weights.agreement >= 0.0 && weights.recent_form >= 0.0 &&
            weights.head_to_head >= 0.0 && weights.home_away >= 0.0,
            "Scoring weights must not be negative");
    require(std::fabs(weights.sum() - 1.0) <= 1e-6,
            fmt::format("Scoring weights must sum to 1.0 (got {:.6f})", weights.sum()));
    require(edge_saturation > 0.0, "EDGE_SATURATION must be positive");
    require(low_confidence_ceiling >= 0.0 && low_confidence_ceiling <= 100.0,
            "LOW_CONFIDENCE_CEILING must lie within [0, 100]");

    require(bankroll > 0.0, "BANKROLL must be positive");
    require(!currency.empty(), "CURRENCY cannot be empty");
    require(kelly_max_fraction > 0.0 && kelly_max_fraction <= 1.0, "KELLY_MAX_FRACTION must lie within (0, 1]");
    validate_stake_brackets(stake_brackets, max_stake);

    require(auto_act_threshold >= 0.0 && auto_act_threshold <= 100.0,
            "AUTO_ACT_THRESHOLD must lie within [0, 100]");
    require(daily_loss_limit > 0.0, "DAILY_LOSS_LIMIT must be positive");
    require(snapshot_staleness_sec > 0, "SNAPSHOT_STALENESS_SEC must be positive");
    require(price_move_tol >= 0.0, "PRICE_MOVE_TOL must not be negative");

    spdlog::info("Configuration validated successfully");
}

std::vector<StakeBracket> parse_stake_brackets(const std::string& spec) {
    std::vector<StakeBracket> brackets;
    for (const auto& entry : util::split_string(spec, ',')) {
        auto parts = util::split_string(entry, ':');
        if (parts.size() != 3) {
            throw std::runtime_error(fmt::format("Malformed stake bracket '{}'", entry));
        }
        try {
            StakeBracket bracket;
            bracket.min_confidence = parse_double(parts[0]);
            bracket.stake_min = parse_double(parts[1]);
            bracket.stake_max = parse_double(parts[2]);
            brackets.push_back(bracket);
        } catch (const std::exception&) {
            throw std::runtime_error(fmt::format("Malformed stake bracket '{}'", entry));
        }
    }
    return brackets;
}

void validate_stake_brackets(const std::vector<StakeBracket>& brackets, double max_stake) {
    require(!brackets.empty(), "Stake bracket table cannot be empty");
    require(max_stake > 0.0, "MAX_STAKE must be positive");

    for (size_t i = 0; i < brackets.size(); ++i) {
        const auto& b = brackets[i];
        require(b.min_confidence >= 0.0 && b.min_confidence <= 100.0,
                fmt::format("Bracket {} threshold {} outside [0, 100]", i, b.min_confidence));
        require(b.stake_min >= 0.0 && b.stake_max >= 0.0,
                fmt::format("Bracket {} has a negative stake bound", i));
        require(b.stake_min <= b.stake_max,
                fmt::format("Bracket {} stake_min {} exceeds stake_max {}", i, b.stake_min, b.stake_max));
        require(b.stake_min <= max_stake,
                fmt::format("Bracket {} stake_min {} exceeds MAX_STAKE {}", i, b.stake_min, max_stake));
        if (i > 0) {
            require(b.min_confidence > brackets[i - 1].min_confidence,
                    fmt::format("Bracket thresholds must be strictly increasing ({} after {})",
                                b.min_confidence, brackets[i - 1].min_confidence));
        }
    }
}
