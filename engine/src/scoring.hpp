#pragma once

#include "config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Team-level auxiliary signals for one match, each in [0,1]
struct MatchSignals {
    double home_form = 0.5;
    double away_form = 0.5;
    double head_to_head = 0.5;  // home side's historical advantage
    double home_advantage = 1.0;
};

// Raw inputs for one selection; normalised inside the scorer
struct ScoreInputs {
    double edge = 0.0;
    double cross_market_agreement = 0.5;
    double recent_form = 0.5;
    double head_to_head = 0.5;
    double home_away_factor = 0.5;
    bool low_confidence = false;
};

struct ConfidenceResult {
    double score = 0.0;
    bool ceiling_applied = false;
    std::vector<std::string> reasons;
};

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const Config& config);

    // Weighted ensemble scaled to [0,100]; non-decreasing in edge
    ConfidenceResult calculate_confidence(const ScoreInputs& inputs) const;

    // Orient the match's team-level signals towards one selection
    static ScoreInputs build_inputs(const MarketProbability& probability,
                                    const MatchSignals& signals,
                                    double cross_market_agreement,
                                    bool low_confidence);

private:
    const Config& config_;
};
