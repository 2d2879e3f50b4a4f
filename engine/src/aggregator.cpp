#include "aggregator.hpp"
#include "util.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    struct FixtureCandidate {
        std::string source_id;
        std::string home;
        std::string away;
        std::string competition;
        TimePoint kickoff;
        std::vector<const OddsQuote*> quotes;
    };

    struct WorkingMatch {
        CanonicalMatch match;
        std::vector<const OddsQuote*> quotes;
        bool ambiguous = false;
    };

    bool is_usable(const OddsQuote& quote) {
        return quote.price > 1.0 && selection_belongs_to(quote.selection, quote.market.kind) &&
               !quote.home_team.empty() && !quote.away_team.empty() &&
               quote.match_minute >= 0 && quote.live_score.home >= 0 && quote.live_score.away >= 0;
    }

    struct MatchIdParts {
        std::string home;
        std::string away;
        TimePoint date;
    };

    // <home>__vs__<away>__<date>[__<kickoff minutes>]
    std::optional<MatchIdParts> split_match_id(const std::string& match_id) {
        const std::string separator = "__";
        std::vector<std::string> parts;
        size_t start = 0;
        for (size_t pos = match_id.find(separator); pos != std::string::npos; pos = match_id.find(separator, start)) {
            parts.push_back(match_id.substr(start, pos - start));
            start = pos + separator.size();
        }
        parts.push_back(match_id.substr(start));

        if (parts.size() < 4 || parts[1] != "vs") {
            return std::nullopt;
        }
        try {
            return MatchIdParts{parts[0], parts[2], util::parse_iso8601(parts[3] + "T00:00:00")};
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }
}

std::string to_string(MatchResolution resolution) {
    switch (resolution) {
        case MatchResolution::Matched: return "matched";
        case MatchResolution::Ambiguous: return "ambiguous";
        case MatchResolution::NoMatch: return "no_match";
    }
    return "unknown";
}

std::string to_string(ExclusionReason reason) {
    return reason == ExclusionReason::Ambiguous ? "ambiguous" : "suspect";
}

SourceAggregator::SourceAggregator(const Config& config) : config_(config) {}

std::string SourceAggregator::make_match_id(const std::string& normalized_home,
                                            const std::string& normalized_away,
                                            TimePoint kickoff) {
    // Called with the earliest kickoff any source quotes for the fixture
    return fmt::format("{}__vs__{}__{}", normalized_home, normalized_away, util::format_utc_date(kickoff));
}

bool SourceAggregator::same_fixture(const std::string& match_id, const std::string& other_id) {
    if (match_id == other_id) {
        return true;
    }
    auto a = split_match_id(match_id);
    auto b = split_match_id(other_id);
    if (!a || !b || a->home != b->home || a->away != b->away) {
        return false;
    }
    // A kickoff near midnight may be dated either side of it
    auto diff = a->date > b->date ? a->date - b->date : b->date - a->date;
    return diff <= std::chrono::hours(24);
}

MatchResolution SourceAggregator::resolve(const std::string& normalized_home,
                                          const std::string& normalized_away,
                                          TimePoint kickoff,
                                          const std::vector<CanonicalMatch>& existing,
                                          std::vector<size_t>& hits) const {
    hits.clear();
    const auto tolerance = std::chrono::minutes(config_.match_tolerance_min);

    for (size_t i = 0; i < existing.size(); ++i) {
        const auto& match = existing[i];
        if (match.normalized_home_team != normalized_home || match.normalized_away_team != normalized_away) {
            continue;
        }
        auto diff = kickoff > match.kickoff_time ? kickoff - match.kickoff_time : match.kickoff_time - kickoff;
        if (diff <= tolerance) {
            hits.push_back(i);
        }
    }

    if (hits.empty()) {
        return MatchResolution::NoMatch;
    }
    return hits.size() == 1 ? MatchResolution::Matched : MatchResolution::Ambiguous;
}

AggregationResult SourceAggregator::aggregate(const std::vector<OddsQuote>& quotes) const {
    AggregationResult result;

    // Group quotes into per-source fixture candidates
    std::vector<FixtureCandidate> candidates;
    std::map<std::string, size_t> candidate_index;
    for (const auto& quote : quotes) {
        if (!is_usable(quote)) {
            spdlog::debug("Dropping unusable quote from {}: {} vs {} {} {} @ {} (minute {}, score {}-{})",
                          quote.source_id, quote.home_team, quote.away_team,
                          quote.market.to_string(), to_string(quote.selection), quote.price,
                          quote.match_minute, quote.live_score.home, quote.live_score.away);
            result.dropped_quotes++;
            continue;
        }

        std::string home = util::normalize_team_name(quote.home_team);
        std::string away = util::normalize_team_name(quote.away_team);
        std::string key = fmt::format("{}|{}|{}|{}", quote.source_id, home, away,
                                      quote.kickoff_time.time_since_epoch().count());

        auto it = candidate_index.find(key);
        if (it == candidate_index.end()) {
            FixtureCandidate candidate;
            candidate.source_id = quote.source_id;
            candidate.home = home;
            candidate.away = away;
            candidate.competition = quote.competition;
            candidate.kickoff = quote.kickoff_time;
            candidate_index.emplace(key, candidates.size());
            candidates.push_back(std::move(candidate));
            it = candidate_index.find(key);
        }
        candidates[it->second].quotes.push_back(&quote);
    }

    // Resolution runs in fixture order, never in arrival order, so the same
    // quotes always produce the same canonical matches and ids
    std::sort(candidates.begin(), candidates.end(), [](const FixtureCandidate& a, const FixtureCandidate& b) {
        return std::tie(a.home, a.away, a.kickoff, a.source_id) < std::tie(b.home, b.away, b.kickoff, b.source_id);
    });

    // First pass: every candidate no earlier match covers opens a canonical
    // match at its kickoff, which is the earliest kickoff of that fixture
    std::vector<WorkingMatch> working;
    std::vector<CanonicalMatch> canonical;
    std::set<std::string> used_ids;
    std::vector<size_t> hits;

    for (const auto& candidate : candidates) {
        if (resolve(candidate.home, candidate.away, candidate.kickoff, canonical, hits) != MatchResolution::NoMatch) {
            continue;
        }

        CanonicalMatch match;
        match.match_id = make_match_id(candidate.home, candidate.away, candidate.kickoff);
        if (used_ids.count(match.match_id)) {
            // Same pairing on the same day outside tolerance
            match.match_id += fmt::format("__{}", std::chrono::duration_cast<std::chrono::minutes>(
                candidate.kickoff.time_since_epoch()).count());
        }
        match.normalized_home_team = candidate.home;
        match.normalized_away_team = candidate.away;
        match.competition = candidate.competition;
        match.kickoff_time = candidate.kickoff;
        used_ids.insert(match.match_id);

        WorkingMatch w;
        w.match = match;
        working.push_back(std::move(w));
        canonical.push_back(match);
    }

    // Second pass: attach each candidate to the one match it falls within
    // tolerance of; a candidate within tolerance of several is ambiguous
    for (const auto& candidate : candidates) {
        if (resolve(candidate.home, candidate.away, candidate.kickoff, canonical, hits) == MatchResolution::Ambiguous) {
            for (size_t index : hits) {
                working[index].ambiguous = true;
            }
            spdlog::warn("Ambiguous fixture from {}: {} vs {} matches {} canonical matches, excluding",
                         candidate.source_id, candidate.home, candidate.away, hits.size());
            result.dropped_quotes += candidate.quotes.size();
            continue;
        }

        // Every candidate is within tolerance of the match it opened or joined
        auto& w = working[hits.front()];
        w.quotes.insert(w.quotes.end(), candidate.quotes.begin(), candidate.quotes.end());
        if (w.match.competition.empty()) {
            w.match.competition = candidate.competition;
        }
    }

    // Best price per selection, with cross-source divergence check
    for (auto& w : working) {
        if (w.ambiguous) {
            result.excluded.push_back({w.match.match_id, ExclusionReason::Ambiguous,
                                       "fixture matched more than one canonical match"});
            continue;
        }

        // Freshest quote per source per selection
        std::map<SelectionKey, std::map<std::string, const OddsQuote*>> by_selection;
        const OddsQuote* freshest = nullptr;
        for (const auto* quote : w.quotes) {
            auto& slot = by_selection[{quote->market, quote->selection}][quote->source_id];
            if (!slot || quote->observed_at > slot->observed_at ||
                (quote->observed_at == slot->observed_at && quote->price > slot->price)) {
                slot = quote;
            }
            if (!freshest || quote->observed_at > freshest->observed_at ||
                (quote->observed_at == freshest->observed_at && quote->match_minute > freshest->match_minute)) {
                freshest = quote;
            }
        }

        MatchView view;
        view.match = w.match;
        view.match_minute = freshest->match_minute;
        view.live_score = freshest->live_score;
        view.snapshot_time = TimePoint::max();

        std::set<std::string> sources;
        std::string suspect_detail;
        for (const auto& [key, per_source] : by_selection) {
            const OddsQuote* best = nullptr;
            double min_price = 0.0;
            for (const auto& [source_id, quote] : per_source) {
                sources.insert(source_id);
                if (!best || quote->price > best->price ||
                    (quote->price == best->price && quote->observed_at > best->observed_at)) {
                    best = quote;
                }
                if (min_price == 0.0 || quote->price < min_price) {
                    min_price = quote->price;
                }
            }

            double divergence = (best->price - min_price) / min_price;
            if (divergence > config_.price_discrepancy_tol) {
                suspect_detail = fmt::format("{} {} diverges {:.1f}% across sources",
                                             key.market.to_string(), to_string(key.selection), divergence * 100.0);
                break;
            }

            view.prices[key] = BestPrice{best->price, best->source_id, best->observed_at};
            view.snapshot_time = std::min(view.snapshot_time, best->observed_at);
        }

        if (!suspect_detail.empty()) {
            spdlog::warn("Suspect quote set for {}: {}", w.match.match_id, suspect_detail);
            result.excluded.push_back({w.match.match_id, ExclusionReason::Suspect, suspect_detail});
            continue;
        }

        view.sources.assign(sources.begin(), sources.end());
        result.views.push_back(std::move(view));
    }

    spdlog::debug("Aggregated {} quotes into {} views ({} excluded, {} quotes dropped)",
                  quotes.size(), result.views.size(), result.excluded.size(), result.dropped_quotes);
    return result;
}
