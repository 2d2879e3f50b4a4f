#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

class StakeSizer {
public:
    // Re-validates the bracket table; throws std::runtime_error when invalid
    explicit StakeSizer(const Config& config);

    // Kelly f* = (b*p - q) / b with b = price - 1; zero without a positive edge
    static double kelly_fraction(double probability, double price, double fair_probability);

    // Highest bracket whose threshold the confidence reaches
    std::optional<StakeBracket> select_bracket(double confidence) const;

    // No stake when Kelly is non-positive or no bracket applies
    std::optional<StakeRecommendation> size(const MarketProbability& probability,
                                            double confidence,
                                            double bankroll) const;

private:
    const Config& config_;
};
