#include "json_schemas.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {

nlohmann::json position_to_json(const PositionKey& key) {
    nlohmann::json j;
    j["match_id"] = key.match_id;
    j["market"] = key.market.to_string();
    j["selection"] = to_string(key.selection);
    return j;
}

} // namespace

OddsQuote quote_from_json(const nlohmann::json& j) {
    OddsQuote quote;
    if (j.contains("source_id")) {
        quote.source_id = j.at("source_id").get<std::string>();
    }
    quote.home_team = j.at("home_team").get<std::string>();
    quote.away_team = j.at("away_team").get<std::string>();
    if (j.contains("competition")) {
        quote.competition = j.at("competition").get<std::string>();
    }
    quote.kickoff_time = util::parse_iso8601(j.at("kickoff_time").get<std::string>());

    auto market_code = j.at("market").get<std::string>();
    auto market = Market::parse(market_code);
    if (!market) {
        throw std::invalid_argument("unsupported market: " + market_code);
    }
    quote.market = *market;

    auto selection_code = j.at("selection").get<std::string>();
    auto selection = parse_selection(selection_code);
    if (!selection) {
        throw std::invalid_argument("unknown selection: " + selection_code);
    }
    quote.selection = *selection;

    quote.price = j.at("price").get<double>();
    quote.observed_at = util::parse_iso8601(j.at("observed_at").get<std::string>());

    if (j.contains("match_minute")) {
        quote.match_minute = j.at("match_minute").get<int>();
        if (quote.match_minute < 0) {
            throw std::invalid_argument("negative match_minute");
        }
    }
    if (j.contains("score")) {
        const auto& score = j.at("score");
        quote.live_score.home = score.at("home").get<int>();
        quote.live_score.away = score.at("away").get<int>();
        if (quote.live_score.home < 0 || quote.live_score.away < 0) {
            throw std::invalid_argument("negative score");
        }
    }
    return quote;
}

nlohmann::json recommendation_to_json(const Recommendation& recommendation) {
    const auto& match = recommendation.match;
    const auto& probability = recommendation.probability;
    const auto& stake = recommendation.stake;
    const auto& decision = recommendation.decision;

    nlohmann::json j;
    j["match"]["match_id"] = match.match_id;
    j["match"]["home_team"] = match.normalized_home_team;
    j["match"]["away_team"] = match.normalized_away_team;
    j["match"]["competition"] = match.competition;
    j["match"]["kickoff_time"] = util::format_iso8601(match.kickoff_time);
    j["match"]["minute"] = recommendation.match_minute;
    j["match"]["score"]["home"] = recommendation.live_score.home;
    j["match"]["score"]["away"] = recommendation.live_score.away;

    j["market"] = probability.market.to_string();
    j["selection"] = to_string(probability.selection);
    j["price"] = probability.price;
    j["model_probability"] = probability.model_probability;
    j["fair_implied_probability"] = probability.fair_implied_probability;
    j["edge"] = probability.edge;
    j["confidence"] = recommendation.confidence;

    j["stake"]["amount"] = stake.amount;
    j["stake"]["currency"] = stake.currency;
    j["stake"]["kelly_fraction"] = stake.kelly_fraction_used;
    j["stake"]["bracket_min"] = stake.bracket_bounds.stake_min;
    j["stake"]["bracket_max"] = stake.bracket_bounds.stake_max;

    j["decision"]["outcome"] = to_string(decision.outcome);
    j["decision"]["reason"] = to_string(decision.reason);
    j["decision"]["timestamp"] = util::format_iso8601(decision.timestamp);
    if (!decision.note.empty()) {
        j["decision"]["note"] = decision.note;
    }

    j["reasons"] = recommendation.reasons;
    return j;
}

nlohmann::json intent_to_json(const BetIntent& intent) {
    nlohmann::json j;
    j["intent_id"] = intent.intent_id;
    j["position"] = position_to_json(intent.key);
    j["home_team"] = intent.home_team;
    j["away_team"] = intent.away_team;
    j["price"] = intent.price;
    j["stake"] = intent.stake;
    j["currency"] = intent.currency;
    j["confidence"] = intent.confidence;
    j["created_at"] = util::format_iso8601(intent.created_at);
    return j;
}

ExecutionResult execution_result_from_json(const nlohmann::json& j) {
    ExecutionResult result;
    result.status = j.at("accepted").get<bool>() ? ExecutionStatus::Accepted : ExecutionStatus::Rejected;
    if (j.contains("reason")) {
        result.reason = j.at("reason").get<std::string>();
    }
    return result;
}
