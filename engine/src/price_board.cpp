#include "price_board.hpp"
#include "util.hpp"
#include <algorithm>

PriceBoard::PriceBoard(const Config& config) : config_(config) {}

void PriceBoard::apply(const OddsQuote& quote) {
    if (quote.price <= 1.0) {
        return;
    }

    FixtureSelection key{util::normalize_team_name(quote.home_team),
                         util::normalize_team_name(quote.away_team),
                         SelectionKey{quote.market, quote.selection}};

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = prices_[key][{quote.source_id, quote.kickoff_time}];
    if (slot.price == 0.0 || quote.observed_at >= slot.observed_at) {
        slot.price = quote.price;
        slot.observed_at = quote.observed_at;
    }
}

void PriceBoard::apply_all(const std::vector<OddsQuote>& quotes) {
    for (const auto& quote : quotes) {
        apply(quote);
    }
}

std::optional<double> PriceBoard::best_price(const CanonicalMatch& match, const Market& market, Selection selection) const {
    const auto tolerance = std::chrono::minutes(config_.match_tolerance_min);
    FixtureSelection key{match.normalized_home_team, match.normalized_away_team, SelectionKey{market, selection}};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(key);
    if (it == prices_.end()) {
        return std::nullopt;
    }

    std::optional<double> best;
    for (const auto& [source, entry] : it->second) {
        const auto& kickoff = source.second;
        auto diff = kickoff > match.kickoff_time ? kickoff - match.kickoff_time : match.kickoff_time - kickoff;
        if (diff > tolerance) {
            continue;
        }
        best = std::max(best.value_or(0.0), entry.price);
    }
    return best;
}

void PriceBoard::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_.clear();
}
