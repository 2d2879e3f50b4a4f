#pragma once

#include "config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Outcome of resolving one source's fixture against the canonical matches
// already formed this cycle
enum class MatchResolution {
    Matched,
    Ambiguous,
    NoMatch
};

enum class ExclusionReason {
    Ambiguous,
    Suspect
};

std::string to_string(MatchResolution resolution);
std::string to_string(ExclusionReason reason);

struct ExcludedMatch {
    std::string match_id;
    ExclusionReason reason = ExclusionReason::Ambiguous;
    std::string detail;
};

struct AggregationResult {
    std::vector<MatchView> views;
    std::vector<ExcludedMatch> excluded;
    size_t dropped_quotes = 0;
};

class SourceAggregator {
public:
    explicit SourceAggregator(const Config& config);

    // Merge one cycle's quotes into one best-priced view per fixture
    AggregationResult aggregate(const std::vector<OddsQuote>& quotes) const;

    // Indices of `existing` that the fixture falls within tolerance of are
    // written to `hits`
    MatchResolution resolve(const std::string& normalized_home,
                            const std::string& normalized_away,
                            TimePoint kickoff,
                            const std::vector<CanonicalMatch>& existing,
                            std::vector<size_t>& hits) const;

    static std::string make_match_id(const std::string& normalized_home,
                                     const std::string& normalized_away,
                                     TimePoint kickoff);

    // True when two ids may name the same fixture: same pairing, kickoff
    // dates at most a day apart. Ids of one cycle are exact; across cycles
    // the earliest quoted kickoff may move over midnight.
    static bool same_fixture(const std::string& match_id, const std::string& other_id);

private:
    const Config& config_;
};
