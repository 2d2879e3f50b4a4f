#include "aggregator.hpp"
#include "test_support.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace testing_support;

namespace {

const MatchView* find_view(const AggregationResult& result, const std::string& home) {
    for (const auto& view : result.views) {
        if (view.match.normalized_home_team == home) {
            return &view;
        }
    }
    return nullptr;
}

} // namespace

TEST(AggregatorTest, KeepsBestPriceAcrossSources) {
    Config config;
    SourceAggregator aggregator(config);

    auto kickoff = reference_time() - std::chrono::minutes(30);
    std::vector<OddsQuote> quotes = {
        make_quote("a", "Arsenal", "Chelsea", "total_2.5", Selection::Over, 1.90, reference_time(), kickoff),
        make_quote("b", "Arsenal", "Chelsea", "total_2.5", Selection::Over, 1.85, reference_time(),
                   kickoff + std::chrono::minutes(2)),
    };

    auto result = aggregator.aggregate(quotes);
    ASSERT_EQ(result.views.size(), 1u);
    EXPECT_TRUE(result.excluded.empty());

    const auto& view = result.views.front();
    auto it = view.prices.find({*Market::parse("total_2.5"), Selection::Over});
    ASSERT_NE(it, view.prices.end());
    EXPECT_DOUBLE_EQ(it->second.price, 1.90);
    EXPECT_EQ(it->second.source_id, "a");
    EXPECT_EQ(view.sources, (std::vector<std::string>{"a", "b"}));
}

TEST(AggregatorTest, NeverEmitsDuplicateCanonicalMatches) {
    Config config;
    SourceAggregator aggregator(config);

    auto kickoff = reference_time() - std::chrono::minutes(30);
    std::vector<OddsQuote> quotes;
    const char* sources[] = {"a", "b", "c"};
    const char* home_names[] = {"Arsenal FC", "arsenal", "Arsenal F.C."};
    for (int i = 0; i < 3; ++i) {
        for (auto selection : {Selection::Home, Selection::Draw, Selection::Away}) {
            quotes.push_back(make_quote(sources[i], home_names[i], "Chelsea", "1x2", selection,
                                        2.5 + 0.05 * i, reference_time(), kickoff + std::chrono::minutes(i)));
        }
    }
    quotes.push_back(make_quote("a", "Everton", "Fulham", "1x2", Selection::Home, 2.2));

    auto result = aggregator.aggregate(quotes);
    ASSERT_EQ(result.views.size(), 2u);

    std::set<std::string> ids;
    for (const auto& view : result.views) {
        EXPECT_TRUE(ids.insert(view.match.match_id).second) << view.match.match_id;
    }

    const auto* arsenal = find_view(result, "arsenal");
    ASSERT_NE(arsenal, nullptr);
    EXPECT_EQ(arsenal->match.match_id, "arsenal__vs__chelsea__2024-03-09");
    EXPECT_EQ(arsenal->sources.size(), 3u);
    EXPECT_DOUBLE_EQ(arsenal->prices.at({*Market::parse("1x2"), Selection::Home}).price, 2.6);
}

TEST(AggregatorTest, ResolutionOutcomes) {
    Config config;
    SourceAggregator aggregator(config);

    CanonicalMatch early;
    early.normalized_home_team = "arsenal";
    early.normalized_away_team = "chelsea";
    early.kickoff_time = reference_time();
    CanonicalMatch late = early;
    late.kickoff_time = reference_time() + std::chrono::minutes(8);
    std::vector<CanonicalMatch> existing = {early, late};

    std::vector<size_t> hits;
    EXPECT_EQ(aggregator.resolve("arsenal", "chelsea", reference_time() + std::chrono::minutes(1), existing, hits),
              MatchResolution::Matched);
    EXPECT_EQ(hits, (std::vector<size_t>{0}));

    EXPECT_EQ(aggregator.resolve("arsenal", "chelsea", reference_time() + std::chrono::minutes(4), existing, hits),
              MatchResolution::Ambiguous);
    EXPECT_EQ(hits.size(), 2u);

    EXPECT_EQ(aggregator.resolve("arsenal", "chelsea", reference_time() + std::chrono::minutes(20), existing, hits),
              MatchResolution::NoMatch);
    EXPECT_EQ(aggregator.resolve("everton", "chelsea", reference_time(), existing, hits),
              MatchResolution::NoMatch);
    EXPECT_TRUE(hits.empty());
}

TEST(AggregatorTest, AmbiguousFixtureExcludesTouchedMatches) {
    Config config;
    SourceAggregator aggregator(config);

    auto kickoff = reference_time() - std::chrono::minutes(30);
    std::vector<OddsQuote> quotes = {
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.10, reference_time(), kickoff),
        make_quote("b", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.12, reference_time(),
                   kickoff + std::chrono::minutes(8)),
        make_quote("c", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.15, reference_time(),
                   kickoff + std::chrono::minutes(4)),
        make_quote("a", "Everton", "Fulham", "1x2", Selection::Home, 2.20),
    };

    auto result = aggregator.aggregate(quotes);
    ASSERT_EQ(result.views.size(), 1u);
    EXPECT_EQ(result.views.front().match.normalized_home_team, "everton");

    ASSERT_EQ(result.excluded.size(), 2u);
    for (const auto& excluded : result.excluded) {
        EXPECT_EQ(excluded.reason, ExclusionReason::Ambiguous);
    }
    EXPECT_NE(result.excluded[0].match_id, result.excluded[1].match_id);
}

TEST(AggregatorTest, ArrivalOrderDoesNotChangeCanonicalMatch) {
    Config config;
    SourceAggregator aggregator(config);

    // Sources disagree on a kickoff either side of midnight UTC
    auto before_midnight = util::parse_iso8601("2024-03-09T23:58:00");
    auto after_midnight = util::parse_iso8601("2024-03-10T00:02:00");
    auto late_a = make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.10, reference_time(), before_midnight);
    auto late_b = make_quote("b", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.12, reference_time(), after_midnight);

    auto forward = aggregator.aggregate({late_a, late_b});
    auto reversed = aggregator.aggregate({late_b, late_a});
    ASSERT_EQ(forward.views.size(), 1u);
    ASSERT_EQ(reversed.views.size(), 1u);

    EXPECT_EQ(forward.views.front().match.match_id, "arsenal__vs__chelsea__2024-03-09");
    EXPECT_EQ(reversed.views.front().match.match_id, forward.views.front().match.match_id);
    EXPECT_EQ(reversed.views.front().match.kickoff_time, before_midnight);
    EXPECT_EQ(forward.views.front().match.kickoff_time, before_midnight);
}

TEST(AggregatorTest, AmbiguityDoesNotDependOnArrivalOrder) {
    Config config;
    SourceAggregator aggregator(config);

    auto kickoff = reference_time() - std::chrono::minutes(30);
    std::vector<OddsQuote> quotes = {
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.10, reference_time(), kickoff),
        make_quote("b", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.12, reference_time(),
                   kickoff + std::chrono::minutes(4)),
        make_quote("c", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.15, reference_time(),
                   kickoff + std::chrono::minutes(8)),
    };

    std::set<std::string> expected;
    for (const auto& excluded : aggregator.aggregate(quotes).excluded) {
        expected.insert(excluded.match_id);
    }
    ASSERT_EQ(expected.size(), 2u);

    std::vector<std::vector<size_t>> orders = {{1, 0, 2}, {2, 1, 0}, {0, 2, 1}};
    for (const auto& order : orders) {
        std::vector<OddsQuote> shuffled;
        for (size_t index : order) {
            shuffled.push_back(quotes[index]);
        }
        auto result = aggregator.aggregate(shuffled);
        EXPECT_TRUE(result.views.empty());

        std::set<std::string> ids;
        for (const auto& excluded : result.excluded) {
            ids.insert(excluded.match_id);
        }
        EXPECT_EQ(ids, expected);
    }
}

TEST(AggregatorTest, SameFixtureAcrossIdDates) {
    EXPECT_TRUE(SourceAggregator::same_fixture("arsenal__vs__chelsea__2024-03-09",
                                               "arsenal__vs__chelsea__2024-03-09"));
    EXPECT_TRUE(SourceAggregator::same_fixture("arsenal__vs__chelsea__2024-03-09",
                                               "arsenal__vs__chelsea__2024-03-10"));
    EXPECT_TRUE(SourceAggregator::same_fixture("arsenal__vs__chelsea__2024-03-09__28506240",
                                               "arsenal__vs__chelsea__2024-03-09"));
    EXPECT_FALSE(SourceAggregator::same_fixture("arsenal__vs__chelsea__2024-03-09",
                                                "arsenal__vs__chelsea__2024-03-11"));
    EXPECT_FALSE(SourceAggregator::same_fixture("arsenal__vs__chelsea__2024-03-09",
                                                "chelsea__vs__arsenal__2024-03-09"));
    EXPECT_FALSE(SourceAggregator::same_fixture("arsenal__vs__chelsea__2024-03-09", "not-a-match-id"));
}

TEST(AggregatorTest, DivergentPricesMarkMatchSuspect) {
    Config config;
    config.price_discrepancy_tol = 0.15;
    SourceAggregator aggregator(config);

    std::vector<OddsQuote> quotes = {
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.00),
        make_quote("b", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.40),
        make_quote("a", "Everton", "Fulham", "1x2", Selection::Home, 2.00),
        make_quote("b", "Everton", "Fulham", "1x2", Selection::Home, 2.20),
    };

    auto result = aggregator.aggregate(quotes);
    ASSERT_EQ(result.views.size(), 1u);
    EXPECT_EQ(result.views.front().match.normalized_home_team, "everton");
    ASSERT_EQ(result.excluded.size(), 1u);
    EXPECT_EQ(result.excluded.front().reason, ExclusionReason::Suspect);
    EXPECT_EQ(result.excluded.front().match_id, "arsenal__vs__chelsea__2024-03-09");
}

TEST(AggregatorTest, FreshestQuoteWithinSourceWins) {
    Config config;
    SourceAggregator aggregator(config);

    auto older = reference_time() - std::chrono::seconds(40);
    std::vector<OddsQuote> quotes = {
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.30, older),
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.10, reference_time()),
    };
    quotes[1].match_minute = 34;
    quotes[1].live_score = LiveScore{1, 0};

    auto result = aggregator.aggregate(quotes);
    ASSERT_EQ(result.views.size(), 1u);
    const auto& view = result.views.front();
    EXPECT_DOUBLE_EQ(view.prices.at({*Market::parse("1x2"), Selection::Home}).price, 2.10);
    EXPECT_EQ(view.match_minute, 34);
    EXPECT_EQ(view.live_score.home, 1);
    EXPECT_EQ(view.snapshot_time, reference_time());
}

TEST(AggregatorTest, SnapshotTimeIsOldestBestPrice) {
    Config config;
    SourceAggregator aggregator(config);

    auto older = reference_time() - std::chrono::seconds(50);
    std::vector<OddsQuote> quotes = {
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.10, older),
        make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Away, 3.40, reference_time()),
    };

    auto result = aggregator.aggregate(quotes);
    ASSERT_EQ(result.views.size(), 1u);
    EXPECT_EQ(result.views.front().snapshot_time, older);
}

TEST(AggregatorTest, DropsUnusableQuotes) {
    Config config;
    SourceAggregator aggregator(config);

    auto bad_price = make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 1.0);
    auto wrong_selection = make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Over, 1.9);
    auto no_name = make_quote("a", "", "Chelsea", "1x2", Selection::Home, 2.0);

    auto negative_score = make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.0);
    negative_score.live_score = LiveScore{-1, 0};
    auto negative_minute = make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.0);
    negative_minute.match_minute = -5;

    auto result = aggregator.aggregate({bad_price, wrong_selection, no_name, negative_score, negative_minute});
    EXPECT_TRUE(result.views.empty());
    EXPECT_EQ(result.dropped_quotes, 5u);
}

TEST(AggregatorTest, TeamNameNormalisation) {
    EXPECT_EQ(util::normalize_team_name("Arsenal FC"), "arsenal");
    EXPECT_EQ(util::normalize_team_name("  A.F.C. Bournemouth "), "bournemouth");
    EXPECT_EQ(util::normalize_team_name("Brighton & Hove Albion"), "brighton hove albion");
    EXPECT_EQ(util::normalize_team_name("Gor-Mahia"), "gor mahia");
    EXPECT_EQ(util::normalize_team_name("SC Freiburg"), "freiburg");
}
