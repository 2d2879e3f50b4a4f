#include "scoreline_model.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <fmt/format.h>

ScorelineDistribution::ScorelineDistribution(std::vector<double> cells, int cutoff, LiveScore base_score)
    : cells_(std::move(cells)), cutoff_(cutoff), base_score_(base_score) {
    if (cutoff_ < 1 || cells_.size() != static_cast<size_t>((cutoff_ + 1) * (cutoff_ + 1))) {
        throw std::invalid_argument("Scoreline grid does not match cutoff");
    }
}

double ScorelineDistribution::residual(int home_goals, int away_goals) const {
    if (home_goals < 0 || away_goals < 0 || home_goals > cutoff_ || away_goals > cutoff_) {
        return 0.0;
    }
    return cells_[static_cast<size_t>(home_goals * (cutoff_ + 1) + away_goals)];
}

double ScorelineDistribution::final_probability(int home_goals, int away_goals) const {
    return residual(home_goals - base_score_.home, away_goals - base_score_.away);
}

double ScorelineDistribution::total() const {
    return std::accumulate(cells_.begin(), cells_.end(), 0.0);
}

std::pair<int, int> ScorelineDistribution::most_likely_final_score() const {
    auto it = std::max_element(cells_.begin(), cells_.end());
    int index = static_cast<int>(std::distance(cells_.begin(), it));
    return {base_score_.home + index / (cutoff_ + 1), base_score_.away + index % (cutoff_ + 1)};
}

double ScorelineDistribution::expected_final_goals() const {
    double expected = base_score_.home + base_score_.away;
    for (int h = 0; h <= cutoff_; ++h) {
        for (int a = 0; a <= cutoff_; ++a) {
            expected += (h + a) * residual(h, a);
        }
    }
    return expected;
}

ScorelineModel::ScorelineModel(const Config& config) : config_(config) {}

TeamRating ScorelineModel::prior(const std::string& team_id) const {
    TeamRating rating;
    rating.team_id = team_id;
    rating.attack_strength = 1.0;
    rating.defense_strength = 1.0;
    rating.home_advantage = config_.default_home_advantage;
    return rating;
}

std::pair<double, double> ScorelineModel::expected_goals(const TeamRating& home, const TeamRating& away) const {
    double lambda_home = config_.league_avg_goals * home.attack_strength * away.defense_strength * home.home_advantage;
    double lambda_away = config_.league_avg_goals * away.attack_strength * home.defense_strength;
    return {lambda_home, lambda_away};
}

std::pair<double, double> ScorelineModel::adjust_for_live(double lambda_home, double lambda_away,
                                                          int match_minute, LiveScore score) const {
    if (match_minute <= 0) {
        return {lambda_home, lambda_away};
    }

    const double minutes = static_cast<double>(config_.match_minutes);
    double remaining = std::clamp((minutes - match_minute) / minutes, 0.0, 1.0);

    // Linear decay past the threshold, floored at zero
    double past_threshold = std::max(0, match_minute - config_.fatigue_threshold_min);
    double fatigue = std::max(0.0, 1.0 - config_.fatigue_decay_per_min * past_threshold);

    double home_remaining = lambda_home * remaining * fatigue;
    double away_remaining = lambda_away * remaining * fatigue;

    // The trailing side pushes for goals
    int goal_diff = score.home - score.away;
    if (goal_diff < 0) {
        home_remaining *= 1.0 + std::min(config_.trailing_attack_cap, -goal_diff * config_.trailing_attack_boost);
    } else if (goal_diff > 0) {
        away_remaining *= 1.0 + std::min(config_.trailing_attack_cap, goal_diff * config_.trailing_attack_boost);
    }

    return {home_remaining, away_remaining};
}

std::vector<double> ScorelineModel::truncated_poisson(double lambda, int cutoff) {
    std::vector<double> pmf(static_cast<size_t>(cutoff + 1), 0.0);
    double p = std::exp(-lambda);
    double cumulative = 0.0;
    for (int k = 0; k < cutoff; ++k) {
        pmf[k] = p;
        cumulative += p;
        p *= lambda / (k + 1);
    }
    pmf[cutoff] = std::max(0.0, 1.0 - cumulative);
    return pmf;
}

ScorelineDistribution ScorelineModel::build_distribution(double lambda_home, double lambda_away,
                                                         LiveScore base_score) const {
    const int cutoff = config_.scoreline_cutoff;
    const size_t width = static_cast<size_t>(cutoff + 1);

    auto home_pmf = truncated_poisson(lambda_home, cutoff);
    auto away_pmf = truncated_poisson(lambda_away, cutoff);

    std::vector<double> cells(width * width, 0.0);
    for (size_t h = 0; h < width; ++h) {
        for (size_t a = 0; a < width; ++a) {
            cells[h * width + a] = home_pmf[h] * away_pmf[a];
        }
    }

    // Dixon-Coles low-score correction; rho == 0 leaves the product untouched
    const double rho = config_.model_rho;
    if (rho != 0.0) {
        const double tau_00 = std::max(0.0, 1.0 - lambda_home * lambda_away * rho);
        const double tau_01 = std::max(0.0, 1.0 + lambda_home * rho);
        const double tau_10 = std::max(0.0, 1.0 + lambda_away * rho);
        const double tau_11 = std::max(0.0, 1.0 - rho);

        cells[0 * width + 0] *= tau_00;
        cells[0 * width + 1] *= tau_01;
        cells[1 * width + 0] *= tau_10;
        cells[1 * width + 1] *= tau_11;

        double total = std::accumulate(cells.begin(), cells.end(), 0.0);
        if (total > 0.0) {
            for (auto& cell : cells) {
                cell /= total;
            }
        }
    }

    return ScorelineDistribution(std::move(cells), cutoff, base_score);
}

ModelOutput ScorelineModel::evaluate(const std::string& home_team,
                                     const std::string& away_team,
                                     const std::optional<TeamRating>& home_rating,
                                     const std::optional<TeamRating>& away_rating,
                                     int match_minute,
                                     LiveScore score) const {
    std::vector<std::string> reasons;
    bool low_confidence = false;

    // Strengths are multipliers and must be strictly positive
    auto usable = [](const std::optional<TeamRating>& rating) {
        return rating && rating->attack_strength > 0.0 && rating->defense_strength > 0.0 &&
               rating->home_advantage > 0.0;
    };

    TeamRating home = usable(home_rating) ? *home_rating : prior(home_team);
    TeamRating away = usable(away_rating) ? *away_rating : prior(away_team);
    if (!usable(home_rating)) {
        low_confidence = true;
        reasons.push_back(fmt::format("No fresh rating for {}, using league priors", home_team));
    }
    if (!usable(away_rating)) {
        low_confidence = true;
        reasons.push_back(fmt::format("No fresh rating for {}, using league priors", away_team));
    }

    auto [base_home, base_away] = expected_goals(home, away);
    auto [live_home, live_away] = adjust_for_live(base_home, base_away, match_minute, score);

    reasons.push_back(fmt::format("xG {:.2f}-{:.2f} full match, {:.2f}-{:.2f} remaining at {}'",
                                  base_home, base_away, live_home, live_away, match_minute));

    ModelOutput output{build_distribution(live_home, live_away, score),
                       base_home, base_away, live_home, live_away,
                       home.home_advantage, low_confidence, std::move(reasons)};

    auto [likely_home, likely_away] = output.distribution.most_likely_final_score();
    output.reasons.push_back(fmt::format("Most likely final score {}-{}", likely_home, likely_away));
    return output;
}
