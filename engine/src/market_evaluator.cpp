#include "market_evaluator.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

MatchResultProbabilities MarketEvaluator::match_result(const ScorelineDistribution& distribution) {
    MatchResultProbabilities result;
    const auto& base = distribution.base_score();
    const int cutoff = distribution.cutoff();

    for (int h = 0; h <= cutoff; ++h) {
        for (int a = 0; a <= cutoff; ++a) {
            double p = distribution.residual(h, a);
            int diff = (base.home + h) - (base.away + a);
            if (diff > 0) {
                result.home += p;
            } else if (diff == 0) {
                result.draw += p;
            } else {
                result.away += p;
            }
        }
    }
    return result;
}

double MarketEvaluator::over_probability(const ScorelineDistribution& distribution, double line) {
    const auto& base = distribution.base_score();
    const int cutoff = distribution.cutoff();
    double probability = 0.0;
    for (int h = 0; h <= cutoff; ++h) {
        for (int a = 0; a <= cutoff; ++a) {
            if (base.home + h + base.away + a > line) {
                probability += distribution.residual(h, a);
            }
        }
    }
    return probability;
}

double MarketEvaluator::under_probability(const ScorelineDistribution& distribution, double line) {
    const auto& base = distribution.base_score();
    const int cutoff = distribution.cutoff();
    double probability = 0.0;
    for (int h = 0; h <= cutoff; ++h) {
        for (int a = 0; a <= cutoff; ++a) {
            if (base.home + h + base.away + a < line) {
                probability += distribution.residual(h, a);
            }
        }
    }
    return probability;
}

double MarketEvaluator::both_teams_score(const ScorelineDistribution& distribution) {
    const auto& base = distribution.base_score();
    const int upper = std::max(base.home, base.away) + distribution.cutoff();
    double home_blank = 0.0;
    double away_blank = 0.0;
    for (int goals = 0; goals <= upper; ++goals) {
        home_blank += distribution.final_probability(0, goals);
        away_blank += distribution.final_probability(goals, 0);
    }
    // Inclusion-exclusion over the two blank events
    return 1.0 - home_blank - away_blank + distribution.final_probability(0, 0);
}

double MarketEvaluator::model_probability(const ScorelineDistribution& distribution,
                                          const Market& market, Selection selection) {
    switch (market.kind) {
        case MarketKind::MatchResult: {
            auto probs = match_result(distribution);
            if (selection == Selection::Home) return probs.home;
            if (selection == Selection::Draw) return probs.draw;
            if (selection == Selection::Away) return probs.away;
            break;
        }
        case MarketKind::TotalGoals:
            if (selection == Selection::Over) return over_probability(distribution, market.line);
            if (selection == Selection::Under) return under_probability(distribution, market.line);
            break;
        case MarketKind::BothTeamsScore: {
            double btts = both_teams_score(distribution);
            if (selection == Selection::Yes) return btts;
            if (selection == Selection::No) return 1.0 - btts;
            break;
        }
    }
    throw std::invalid_argument("Selection " + to_string(selection) + " does not belong to market " + market.to_string());
}

double MarketEvaluator::overround(const std::vector<double>& prices) {
    double sum = 0.0;
    for (double price : prices) {
        sum += 1.0 / price;
    }
    return sum;
}

std::vector<double> MarketEvaluator::demargin(const std::vector<double>& prices) {
    if (prices.empty()) {
        throw std::invalid_argument("Cannot de-margin an empty market");
    }
    for (double price : prices) {
        if (!(price > 1.0)) {
            throw std::invalid_argument("Decimal prices must exceed 1.0");
        }
    }

    double book = overround(prices);
    std::vector<double> fair;
    fair.reserve(prices.size());
    for (double price : prices) {
        fair.push_back((1.0 / price) / book);
    }
    return fair;
}

MarketEvaluation MarketEvaluator::evaluate(const MatchView& view, const ScorelineDistribution& distribution) const {
    MarketEvaluation evaluation;

    std::vector<Market> markets;
    for (const auto& [key, best] : view.prices) {
        if (std::find(markets.begin(), markets.end(), key.market) == markets.end()) {
            markets.push_back(key.market);
        }
    }

    int complete_markets = 0;
    int agreeing_markets = 0;

    for (const auto& market : markets) {
        auto selections = market.selections();

        std::vector<double> prices;
        for (auto selection : selections) {
            auto it = view.prices.find({market, selection});
            if (it == view.prices.end()) {
                break;
            }
            prices.push_back(it->second.price);
        }
        if (prices.size() != selections.size()) {
            spdlog::debug("{}: market {} incomplete, skipping", view.match.match_id, market.to_string());
            evaluation.incomplete_markets.push_back(market.to_string());
            continue;
        }

        auto fair = demargin(prices);

        size_t model_favourite = 0;
        size_t market_favourite = 0;
        std::vector<double> model_probs;
        for (size_t i = 0; i < selections.size(); ++i) {
            MarketProbability mp;
            mp.market = market;
            mp.selection = selections[i];
            mp.price = prices[i];
            mp.model_probability = model_probability(distribution, market, selections[i]);
            mp.fair_implied_probability = fair[i];
            mp.edge = mp.model_probability - mp.fair_implied_probability;
            model_probs.push_back(mp.model_probability);
            evaluation.probabilities.push_back(mp);

            if (model_probs[i] > model_probs[model_favourite]) {
                model_favourite = i;
            }
            if (fair[i] > fair[market_favourite]) {
                market_favourite = i;
            }
        }

        complete_markets++;
        if (model_favourite == market_favourite) {
            agreeing_markets++;
        }
    }

    if (complete_markets > 0) {
        evaluation.cross_market_agreement = static_cast<double>(agreeing_markets) / complete_markets;
    }
    return evaluation;
}

std::vector<MarketProbability> MarketEvaluator::positive_edges(const MarketEvaluation& evaluation) {
    std::vector<MarketProbability> forwarded;
    for (const auto& mp : evaluation.probabilities) {
        if (mp.edge > 0.0) {
            forwarded.push_back(mp);
        }
    }
    return forwarded;
}
