#pragma once

#include "types.hpp"
#include <optional>
#include <string>

// Read side of the external stats collaborator. Ratings are refreshed on
// their own cadence; the engine only consumes them.
class RatingStore {
public:
    virtual ~RatingStore() = default;

    virtual std::optional<TeamRating> get_rating(const std::string& team_id) = 0;
    virtual bool is_fresh(const TeamRating& rating) const = 0;

    // Auxiliary scorer signals in [0,1]; absent means neutral
    virtual std::optional<double> get_recent_form(const std::string& team_id) {
        (void)team_id;
        return std::nullopt;
    }
    virtual std::optional<double> get_head_to_head(const std::string& home_team, const std::string& away_team) {
        (void)home_team;
        (void)away_team;
        return std::nullopt;
    }
};
