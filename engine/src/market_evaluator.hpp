#pragma once

#include "scoreline_model.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct MatchResultProbabilities {
    double home = 0.0;
    double draw = 0.0;
    double away = 0.0;
};

struct MarketEvaluation {
    // Every selection of every complete market, whatever the sign of its edge
    std::vector<MarketProbability> probabilities;
    // Share of complete markets where model and market agree on the favourite
    double cross_market_agreement = 0.5;
    std::vector<std::string> incomplete_markets;
};

class MarketEvaluator {
public:
    MarketEvaluation evaluate(const MatchView& view, const ScorelineDistribution& distribution) const;

    // Only strictly positive edges continue down the pipeline
    static std::vector<MarketProbability> positive_edges(const MarketEvaluation& evaluation);

    static MatchResultProbabilities match_result(const ScorelineDistribution& distribution);
    static double over_probability(const ScorelineDistribution& distribution, double line);
    static double under_probability(const ScorelineDistribution& distribution, double line);
    static double both_teams_score(const ScorelineDistribution& distribution);
    static double model_probability(const ScorelineDistribution& distribution, const Market& market, Selection selection);

    // Sum of naive implied probabilities 1/price
    static double overround(const std::vector<double>& prices);

    // Proportional de-margining; prices must all exceed 1.0
    static std::vector<double> demargin(const std::vector<double>& prices);
};
