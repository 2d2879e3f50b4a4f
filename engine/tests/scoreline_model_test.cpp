#include "scoreline_model.hpp"
#include "market_evaluator.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace {

double poisson(double lambda, int k) {
    double p = std::exp(-lambda);
    for (int i = 1; i <= k; ++i) {
        p *= lambda / i;
    }
    return p;
}

Config model_config(double rho, int cutoff = 10) {
    Config config;
    config.model_rho = rho;
    config.scoreline_cutoff = cutoff;
    return config;
}

} // namespace

TEST(ScorelineModelTest, DistributionSumsToOne) {
    const double lambdas[] = {0.0, 0.05, 1.1, 1.4, 3.2, 7.5, 12.0};
    const int cutoffs[] = {1, 2, 5, 10};
    const double rhos[] = {0.0, -0.1, -0.3, 0.15};

    for (double rho : rhos) {
        for (int cutoff : cutoffs) {
            Config config = model_config(rho, cutoff);
            ScorelineModel model(config);
            for (double home : lambdas) {
                for (double away : lambdas) {
                    auto dist = model.build_distribution(home, away, LiveScore{});
                    EXPECT_NEAR(dist.total(), 1.0, 1e-9)
                        << "rho=" << rho << " cutoff=" << cutoff << " lambdas=" << home << "," << away;
                }
            }
        }
    }
}

TEST(ScorelineModelTest, ZeroRhoMatchesIndependentPoissonProduct) {
    Config config = model_config(0.0);
    ScorelineModel model(config);
    auto dist = model.build_distribution(1.4, 1.1, LiveScore{});

    for (int h = 0; h < config.scoreline_cutoff; ++h) {
        for (int a = 0; a < config.scoreline_cutoff; ++a) {
            EXPECT_NEAR(dist.residual(h, a), poisson(1.4, h) * poisson(1.1, a), 1e-12);
        }
    }
}

TEST(ScorelineModelTest, OverTwoAndAHalfMatchesConvolution) {
    Config config = model_config(0.0);
    ScorelineModel model(config);
    auto dist = model.build_distribution(1.4, 1.1, LiveScore{});

    double at_most_two = 0.0;
    for (int total = 0; total <= 2; ++total) {
        for (int h = 0; h <= total; ++h) {
            at_most_two += poisson(1.4, h) * poisson(1.1, total - h);
        }
    }

    EXPECT_NEAR(MarketEvaluator::over_probability(dist, 2.5), 1.0 - at_most_two, 1e-12);
    // Sum of two Poissons is Poisson(2.5)
    double pooled = poisson(2.5, 0) + poisson(2.5, 1) + poisson(2.5, 2);
    EXPECT_NEAR(MarketEvaluator::over_probability(dist, 2.5), 1.0 - pooled, 1e-12);
}

TEST(ScorelineModelTest, NegativeRhoInflatesLowDraws) {
    Config independent_config = model_config(0.0);
    Config corrected_config = model_config(-0.1);
    auto independent = ScorelineModel(independent_config).build_distribution(1.4, 1.1, LiveScore{});
    auto corrected = ScorelineModel(corrected_config).build_distribution(1.4, 1.1, LiveScore{});

    EXPECT_GT(corrected.residual(0, 0), independent.residual(0, 0));
    EXPECT_GT(corrected.residual(1, 1), independent.residual(1, 1));
    EXPECT_LT(corrected.residual(1, 0), independent.residual(1, 0));
}

TEST(ScorelineModelTest, TruncatedPoissonFoldsTailIntoCutoff) {
    auto pmf = ScorelineModel::truncated_poisson(2.0, 3);
    ASSERT_EQ(pmf.size(), 4u);
    EXPECT_NEAR(pmf[0] + pmf[1] + pmf[2] + pmf[3], 1.0, 1e-12);
    EXPECT_NEAR(pmf[3], 1.0 - poisson(2.0, 0) - poisson(2.0, 1) - poisson(2.0, 2), 1e-12);
}

TEST(ScorelineModelTest, ResidualRatesNeverIncreaseWithElapsedTime) {
    Config config;
    ScorelineModel model(config);

    double previous_home = 1e9;
    double previous_away = 1e9;
    for (int minute : {0, 15, 45, 70, 75, 80, 85, 89, 90, 95}) {
        auto [home, away] = model.adjust_for_live(1.6, 1.2, minute, LiveScore{1, 1});
        EXPECT_LE(home, previous_home) << "minute " << minute;
        EXPECT_LE(away, previous_away) << "minute " << minute;
        previous_home = home;
        previous_away = away;
    }

    auto [home_at_full_time, away_at_full_time] = model.adjust_for_live(1.6, 1.2, 90, LiveScore{});
    EXPECT_DOUBLE_EQ(home_at_full_time, 0.0);
    EXPECT_DOUBLE_EQ(away_at_full_time, 0.0);
}

TEST(ScorelineModelTest, FatigueOnlyAppliesPastThreshold) {
    Config config;
    ScorelineModel model(config);

    auto [home_before, away_before] = model.adjust_for_live(1.8, 1.8, 60, LiveScore{});
    EXPECT_NEAR(home_before, 1.8 * 30.0 / 90.0, 1e-12);

    auto [home_after, away_after] = model.adjust_for_live(1.8, 1.8, 80, LiveScore{});
    double fatigue = 1.0 - config.fatigue_decay_per_min * 5;
    EXPECT_NEAR(home_after, 1.8 * 10.0 / 90.0 * fatigue, 1e-12);
    (void)away_before;
    (void)away_after;
}

TEST(ScorelineModelTest, TrailingSideIsBoostedUpToCap) {
    Config config;
    ScorelineModel model(config);

    auto [level_home, level_away] = model.adjust_for_live(1.5, 1.5, 45, LiveScore{0, 0});
    auto [one_down_home, one_down_away] = model.adjust_for_live(1.5, 1.5, 45, LiveScore{0, 1});
    auto [four_down_home, four_down_away] = model.adjust_for_live(1.5, 1.5, 45, LiveScore{0, 4});

    EXPECT_NEAR(one_down_home, level_home * (1.0 + config.trailing_attack_boost), 1e-12);
    EXPECT_NEAR(four_down_home, level_home * (1.0 + config.trailing_attack_cap), 1e-12);
    EXPECT_DOUBLE_EQ(one_down_away, level_away);
    EXPECT_DOUBLE_EQ(four_down_away, level_away);
}

TEST(ScorelineModelTest, MissingRatingsFallBackToPriors) {
    Config config;
    ScorelineModel model(config);

    TeamRating home;
    home.team_id = "arsenal";
    home.attack_strength = 1.3;
    home.defense_strength = 0.8;
    home.home_advantage = 1.2;

    auto output = model.evaluate("arsenal", "chelsea", home, std::nullopt, 0, LiveScore{});
    EXPECT_TRUE(output.low_confidence);
    EXPECT_NEAR(output.base_lambda_home, config.league_avg_goals * 1.3 * 1.0 * 1.2, 1e-12);
    EXPECT_NEAR(output.base_lambda_away, config.league_avg_goals * 1.0 * 0.8, 1e-12);
    EXPECT_NEAR(output.distribution.total(), 1.0, 1e-9);

    bool mentions_fallback = false;
    for (const auto& reason : output.reasons) {
        if (reason.find("chelsea") != std::string::npos) {
            mentions_fallback = true;
        }
    }
    EXPECT_TRUE(mentions_fallback);
}

TEST(ScorelineModelTest, NonPositiveStrengthIsTreatedAsMissing) {
    Config config;
    ScorelineModel model(config);

    TeamRating broken;
    broken.attack_strength = 0.0;

    auto output = model.evaluate("a", "b", broken, broken, 0, LiveScore{});
    EXPECT_TRUE(output.low_confidence);
    EXPECT_GT(output.base_lambda_home, 0.0);
}

TEST(ScorelineModelTest, DistributionIsShiftedByObservedScore) {
    Config config = model_config(0.0);
    ScorelineModel model(config);
    auto dist = model.build_distribution(0.4, 0.3, LiveScore{2, 1});

    EXPECT_DOUBLE_EQ(dist.final_probability(1, 1), 0.0);
    EXPECT_NEAR(dist.final_probability(2, 1), poisson(0.4, 0) * poisson(0.3, 0), 1e-12);
    EXPECT_EQ(dist.most_likely_final_score(), std::make_pair(2, 1));
    EXPECT_NEAR(dist.expected_final_goals(), 3.7, 1e-6);
}
