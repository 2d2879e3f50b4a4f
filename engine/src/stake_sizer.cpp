#include "stake_sizer.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

StakeSizer::StakeSizer(const Config& config) : config_(config) {
    validate_stake_brackets(config_.stake_brackets, config_.max_stake);
}

double StakeSizer::kelly_fraction(double probability, double price, double fair_probability) {
    if (price <= 1.0 || probability <= fair_probability) {
        return 0.0;
    }
    double b = price - 1.0;
    double q = 1.0 - probability;
    double f = (b * probability - q) / b;
    return f > 0.0 ? f : 0.0;
}

std::optional<StakeBracket> StakeSizer::select_bracket(double confidence) const {
    std::optional<StakeBracket> selected;
    for (const auto& bracket : config_.stake_brackets) {
        if (confidence >= bracket.min_confidence) {
            selected = bracket;
        } else {
            break;
        }
    }
    return selected;
}

std::optional<StakeRecommendation> StakeSizer::size(const MarketProbability& probability,
                                                    double confidence,
                                                    double bankroll) const {
    double kelly = kelly_fraction(probability.model_probability, probability.price,
                                  probability.fair_implied_probability);
    if (kelly <= 0.0) {
        spdlog::debug("No Kelly stake for {} {} @ {:.2f}", probability.market.to_string(),
                      to_string(probability.selection), probability.price);
        return std::nullopt;
    }

    auto bracket = select_bracket(confidence);
    if (!bracket) {
        spdlog::debug("Confidence {:.1f} below the lowest stake bracket", confidence);
        return std::nullopt;
    }

    double clipped = std::min(kelly, config_.kelly_max_fraction);
    double amount = std::clamp(bankroll * clipped, bracket->stake_min, bracket->stake_max);
    amount = std::min(amount, config_.max_stake);

    StakeRecommendation recommendation;
    recommendation.amount = amount;
    recommendation.currency = config_.currency;
    recommendation.kelly_fraction_used = clipped;
    recommendation.bracket_bounds = *bracket;
    return recommendation;
}
