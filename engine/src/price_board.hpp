#pragma once

#include "config.hpp"
#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Latest price per source for every selection, shared between the cycle and
// the live tick subscriber. Used by the gate to detect price movement.
// Prices are filed by fixture and matched to a canonical match by kickoff
// tolerance, so lookups do not depend on how the match id was dated.
class PriceBoard {
public:
    explicit PriceBoard(const Config& config);

    // Record a quote; older observations never overwrite newer ones
    void apply(const OddsQuote& quote);
    void apply_all(const std::vector<OddsQuote>& quotes);

    std::optional<double> best_price(const CanonicalMatch& match, const Market& market, Selection selection) const;

    void clear();

private:
    struct FixtureSelection {
        std::string home;
        std::string away;
        SelectionKey selection;

        bool operator<(const FixtureSelection& other) const {
            return std::tie(home, away, selection) < std::tie(other.home, other.away, other.selection);
        }
    };

    struct SourcePrice {
        double price = 0.0;
        TimePoint observed_at;
    };

    const Config& config_;
    mutable std::mutex mutex_;
    // Per source and quoted kickoff
    std::map<FixtureSelection, std::map<std::pair<std::string, TimePoint>, SourcePrice>> prices_;
};
