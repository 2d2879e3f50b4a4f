#pragma once

#include "aggregator.hpp"
#include "config.hpp"
#include "execution_client.hpp"
#include "history_store.hpp"
#include "market_evaluator.hpp"
#include "price_board.hpp"
#include "rating_store.hpp"
#include "recommendation_sink.hpp"
#include "safety_gate.hpp"
#include "scoreline_model.hpp"
#include "scoring.hpp"
#include "source_collector.hpp"
#include "stake_sizer.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct CycleReport {
    uint64_t cycle_id = 0;
    size_t quotes = 0;
    size_t stale_quotes = 0;
    size_t matches = 0;
    size_t excluded_matches = 0;
    size_t positive_edges = 0;
    size_t recommendations = 0;
    size_t approved = 0;
    size_t execution_rejected = 0;
    size_t execution_unconfirmed = 0;
    std::vector<std::string> absent_sources;
    bool superseded = false;
    std::chrono::milliseconds duration{0};
};

// Drives one refresh cycle: collect -> aggregate -> evaluate (parallel per
// match) -> gate -> execution/publication.
class CycleRunner {
public:
    CycleRunner(const Config& config,
                const SourceCollector& collector,
                RatingStore& ratings,
                HistoryStore& history,
                ExecutionClient& execution,
                RecommendationSink& sink,
                PriceBoard& prices);

    // Collects from every source and runs the cycle under a new cycle id
    CycleReport run_cycle();

    // Allocates the next cycle id; every older cycle becomes superseded
    uint64_t begin_cycle() { return ++latest_cycle_; }

    // Runs a cycle over an already collected snapshot. Output stops as soon
    // as the snapshot's cycle is no longer the latest.
    CycleReport run_snapshot(const CycleSnapshot& snapshot);

    void supersede() { latest_cycle_++; }
    uint64_t latest_cycle() const { return latest_cycle_.load(); }

    const BankrollContext& bankroll_context() const { return *context_; }

    void set_clock(std::function<TimePoint()> clock) { clock_ = std::move(clock); }

private:
    struct Counters {
        std::atomic<size_t> positive_edges{0};
        std::atomic<size_t> recommendations{0};
        std::atomic<size_t> approved{0};
        std::atomic<size_t> execution_rejected{0};
        std::atomic<size_t> execution_unconfirmed{0};
    };

    void evaluate_match(const MatchView& view, uint64_t cycle_id, BankrollContext& context, Counters& counters);
    void execute(Recommendation& recommendation, BankrollContext& context, Counters& counters);
    std::optional<TeamRating> lookup_rating(const std::string& team_id);
    MatchSignals match_signals(const MatchView& view, const ModelOutput& model);
    bool is_current(uint64_t cycle_id) const { return cycle_id == latest_cycle_.load(); }

    const Config& config_;
    const SourceCollector& collector_;
    RatingStore& ratings_;
    HistoryStore& history_;
    ExecutionClient& execution_;
    RecommendationSink& sink_;
    PriceBoard& prices_;

    SourceAggregator aggregator_;
    ScorelineModel model_;
    MarketEvaluator evaluator_;
    ConfidenceScorer scorer_;
    StakeSizer sizer_;
    SafetyGate gate_;
    std::unique_ptr<BankrollContext> context_;

    std::atomic<uint64_t> latest_cycle_{0};
    std::function<TimePoint()> clock_;
};
