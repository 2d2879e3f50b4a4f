#pragma once

#include "config.hpp"
#include "rating_store.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

// Team ratings and form signals from the `team_ratings`, `team_form` and
// `head_to_head` tables, cached for five minutes
class PostgresRatingStore : public RatingStore {
public:
    explicit PostgresRatingStore(const Config& config);
    ~PostgresRatingStore() override;

    bool is_connected() const;
    bool initialize_schema();

    std::optional<TeamRating> get_rating(const std::string& team_id) override;
    bool is_fresh(const TeamRating& rating) const override;
    std::optional<double> get_recent_form(const std::string& team_id) override;
    std::optional<double> get_head_to_head(const std::string& home_team, const std::string& away_team) override;


    // Non-copyable
    PostgresRatingStore(const PostgresRatingStore&) = delete;
    PostgresRatingStore& operator=(const PostgresRatingStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
