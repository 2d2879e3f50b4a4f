#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Probability mass over residual goals (0..cutoff for each side) on top of
// an already observed score. Immutable once constructed.
class ScorelineDistribution {
public:
    ScorelineDistribution(std::vector<double> cells, int cutoff, LiveScore base_score);

    int cutoff() const { return cutoff_; }
    const LiveScore& base_score() const { return base_score_; }

    // P(home scores `home_goals` more, away scores `away_goals` more)
    double residual(int home_goals, int away_goals) const;

    // P(final score is home_goals-away_goals); zero below the observed score
    double final_probability(int home_goals, int away_goals) const;

    double total() const;
    std::pair<int, int> most_likely_final_score() const;
    double expected_final_goals() const;

private:
    std::vector<double> cells_;  // row-major, home residual goals first
    int cutoff_;
    LiveScore base_score_;
};

struct ModelOutput {
    ScorelineDistribution distribution;
    double base_lambda_home = 0.0;  // full-match rates from ratings
    double base_lambda_away = 0.0;
    double lambda_home = 0.0;       // residual rates actually modelled
    double lambda_away = 0.0;
    double home_advantage = 1.0;
    bool low_confidence = false;    // a side fell back to league priors
    std::vector<std::string> reasons;
};

class ScorelineModel {
public:
    explicit ScorelineModel(const Config& config);

    // Pure function of ratings, live state and configuration. A missing
    // rating (absent or stale) falls back to league-average priors.
    ModelOutput evaluate(const std::string& home_team,
                         const std::string& away_team,
                         const std::optional<TeamRating>& home_rating,
                         const std::optional<TeamRating>& away_rating,
                         int match_minute,
                         LiveScore score) const;

    // Full-match expected goals: baseline x attack x opponent defense (x home advantage)
    std::pair<double, double> expected_goals(const TeamRating& home, const TeamRating& away) const;

    // Residual expected goals for the time left, fatigue-discounted
    std::pair<double, double> adjust_for_live(double lambda_home, double lambda_away,
                                              int match_minute, LiveScore score) const;

    ScorelineDistribution build_distribution(double lambda_home, double lambda_away, LiveScore base_score) const;

    TeamRating prior(const std::string& team_id) const;

    // Poisson PMF on 0..cutoff with the tail mass folded into the last cell
    static std::vector<double> truncated_poisson(double lambda, int cutoff);

private:
    const Config& config_;
};
