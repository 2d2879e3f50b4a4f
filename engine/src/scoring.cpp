#include "scoring.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace {
    double unit(double value) {
        return std::clamp(value, 0.0, 1.0);
    }
}

ConfidenceScorer::ConfidenceScorer(const Config& config) : config_(config) {}

ConfidenceResult ConfidenceScorer::calculate_confidence(const ScoreInputs& inputs) const {
    ConfidenceResult result;
    const auto& w = config_.weights;

    double edge_score = unit(inputs.edge / config_.edge_saturation);

    double weighted_sum =
        w.edge * edge_score +
        w.agreement * unit(inputs.cross_market_agreement) +
        w.recent_form * unit(inputs.recent_form) +
        w.head_to_head * unit(inputs.head_to_head) +
        w.home_away * unit(inputs.home_away_factor);

    result.score = std::clamp(weighted_sum * 100.0, 0.0, 100.0);
    result.reasons.push_back(fmt::format("Edge {:+.1f}% (score {:.2f}), market agreement {:.2f}",
                                         inputs.edge * 100.0, edge_score, inputs.cross_market_agreement));

    // Fallback priors never produce an overconfident recommendation
    if (inputs.low_confidence && result.score > config_.low_confidence_ceiling) {
        result.score = config_.low_confidence_ceiling;
        result.ceiling_applied = true;
        result.reasons.push_back(fmt::format("Confidence capped at {:.0f} (missing ratings)",
                                             config_.low_confidence_ceiling));
    }

    return result;
}

ScoreInputs ConfidenceScorer::build_inputs(const MarketProbability& probability,
                                           const MatchSignals& signals,
                                           double cross_market_agreement,
                                           bool low_confidence) {
    ScoreInputs inputs;
    inputs.edge = probability.edge;
    inputs.cross_market_agreement = cross_market_agreement;
    inputs.low_confidence = low_confidence;

    double home_strength = unit(0.5 + (signals.home_advantage - 1.0));
    double mean_form = (signals.home_form + signals.away_form) / 2.0;

    switch (probability.selection) {
        case Selection::Home:
            inputs.recent_form = signals.home_form;
            inputs.head_to_head = signals.head_to_head;
            inputs.home_away_factor = home_strength;
            break;
        case Selection::Away:
            inputs.recent_form = signals.away_form;
            inputs.head_to_head = 1.0 - signals.head_to_head;
            inputs.home_away_factor = 1.0 - home_strength;
            break;
        case Selection::Draw:
            inputs.recent_form = 1.0 - std::fabs(signals.home_form - signals.away_form);
            inputs.head_to_head = 1.0 - std::fabs(2.0 * signals.head_to_head - 1.0);
            inputs.home_away_factor = 0.5;
            break;
        case Selection::Over:
        case Selection::Yes:
            inputs.recent_form = mean_form;
            break;
        case Selection::Under:
        case Selection::No:
            inputs.recent_form = 1.0 - mean_form;
            break;
    }
    return inputs;
}
