#include "cycle_runner.hpp"
#include "util.hpp"
#include <algorithm>
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

CycleRunner::CycleRunner(const Config& config,
                         const SourceCollector& collector,
                         RatingStore& ratings,
                         HistoryStore& history,
                         ExecutionClient& execution,
                         RecommendationSink& sink,
                         PriceBoard& prices)
    : config_(config),
      collector_(collector),
      ratings_(ratings),
      history_(history),
      execution_(execution),
      sink_(sink),
      prices_(prices),
      aggregator_(config),
      model_(config),
      scorer_(config),
      sizer_(config),
      gate_(config, prices),
      context_(std::make_unique<BankrollContext>(config.bankroll, 0.0, PositionSet{})),
      clock_([] { return Clock::now(); }) {}

CycleReport CycleRunner::run_cycle() {
    uint64_t cycle_id = begin_cycle();
    return run_snapshot(collector_.collect(cycle_id));
}

CycleReport CycleRunner::run_snapshot(const CycleSnapshot& snapshot) {
    auto start_time = std::chrono::steady_clock::now();

    CycleReport report;
    report.cycle_id = snapshot.cycle_id;
    report.quotes = snapshot.quotes.size();
    report.absent_sources = snapshot.absent_sources;

    spdlog::info("Cycle {} started: {} quotes from {} sources ({} absent)",
                 snapshot.cycle_id, snapshot.quotes.size(),
                 snapshot.reported_sources.size(), snapshot.absent_sources.size());

    // Old prices never reach evaluation
    const auto now = clock_();
    const auto staleness = std::chrono::seconds(config_.snapshot_staleness_sec);
    std::vector<OddsQuote> fresh;
    fresh.reserve(snapshot.quotes.size());
    for (const auto& quote : snapshot.quotes) {
        if (now - quote.observed_at > staleness) {
            report.stale_quotes++;
            continue;
        }
        fresh.push_back(quote);
    }
    if (report.stale_quotes > 0) {
        spdlog::warn("Cycle {}: dropped {} stale quotes older than {}s",
                     snapshot.cycle_id, report.stale_quotes, config_.snapshot_staleness_sec);
    }

    prices_.clear();
    prices_.apply_all(fresh);

    auto aggregation = aggregator_.aggregate(fresh);
    report.matches = aggregation.views.size();
    report.excluded_matches = aggregation.excluded.size();
    for (const auto& excluded : aggregation.excluded) {
        spdlog::warn("Cycle {}: excluded {} ({}): {}", snapshot.cycle_id, excluded.match_id,
                     to_string(excluded.reason), excluded.detail);
    }

    // One consistent view of bankroll and open positions, shared with any
    // superseded cycle still draining
    try {
        context_->refresh(history_, now);
    } catch (const std::exception& e) {
        spdlog::error("Cycle {}: bet history unavailable, skipping evaluation: {}", snapshot.cycle_id, e.what());
        report.superseded = !is_current(snapshot.cycle_id);
        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return report;
    }

    Counters counters;
    const auto& views = aggregation.views;
    std::atomic<size_t> next{0};
    size_t worker_count = std::min(static_cast<size_t>(config_.thread_pool_size), views.size());

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() {
            for (size_t index = next++; index < views.size(); index = next++) {
                try {
                    evaluate_match(views[index], snapshot.cycle_id, *context_, counters);
                } catch (const std::exception& e) {
                    spdlog::error("Cycle {}: error evaluating {}: {}", snapshot.cycle_id,
                                  views[index].match.match_id, e.what());
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    report.positive_edges = counters.positive_edges;
    report.recommendations = counters.recommendations;
    report.approved = counters.approved;
    report.execution_rejected = counters.execution_rejected;
    report.execution_unconfirmed = counters.execution_unconfirmed;
    report.superseded = !is_current(snapshot.cycle_id);
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::info("Cycle {} finished in {} ms: {} matches, {} excluded, {} positive edges, {} recommendations, {} approved{}",
                 report.cycle_id, report.duration.count(), report.matches, report.excluded_matches,
                 report.positive_edges, report.recommendations, report.approved,
                 report.superseded ? " (superseded)" : "");
    return report;
}

std::optional<TeamRating> CycleRunner::lookup_rating(const std::string& team_id) {
    auto rating = ratings_.get_rating(team_id);
    if (!rating) {
        spdlog::warn("No rating for {}, falling back to league priors", team_id);
        return std::nullopt;
    }
    if (!ratings_.is_fresh(*rating)) {
        spdlog::warn("Rating for {} is stale (updated {}), falling back to league priors",
                     team_id, util::format_iso8601(rating->last_updated));
        return std::nullopt;
    }
    return rating;
}

MatchSignals CycleRunner::match_signals(const MatchView& view, const ModelOutput& model) {
    const auto& home = view.match.normalized_home_team;
    const auto& away = view.match.normalized_away_team;

    MatchSignals signals;
    signals.home_form = ratings_.get_recent_form(home).value_or(0.5);
    signals.away_form = ratings_.get_recent_form(away).value_or(0.5);
    signals.head_to_head = ratings_.get_head_to_head(home, away).value_or(0.5);
    signals.home_advantage = model.home_advantage;
    return signals;
}

void CycleRunner::evaluate_match(const MatchView& view, uint64_t cycle_id, BankrollContext& context, Counters& counters) {
    const auto& match = view.match;

    auto model = model_.evaluate(match.normalized_home_team, match.normalized_away_team,
                                 lookup_rating(match.normalized_home_team),
                                 lookup_rating(match.normalized_away_team),
                                 view.match_minute, view.live_score);

    auto evaluation = evaluator_.evaluate(view, model.distribution);
    auto forwarded = MarketEvaluator::positive_edges(evaluation);
    counters.positive_edges += forwarded.size();
    if (forwarded.empty()) {
        spdlog::debug("{}: no positive edge across {} priced selections",
                      match.match_id, evaluation.probabilities.size());
        return;
    }

    auto signals = match_signals(view, model);

    for (const auto& probability : forwarded) {
        auto inputs = ConfidenceScorer::build_inputs(probability, signals, evaluation.cross_market_agreement,
                                                     model.low_confidence);
        auto confidence = scorer_.calculate_confidence(inputs);

        auto stake = sizer_.size(probability, confidence.score, context.bankroll());
        if (!stake) {
            continue;
        }

        if (!is_current(cycle_id)) {
            spdlog::debug("Cycle {} superseded, discarding evaluation of {}", cycle_id, match.match_id);
            return;
        }

        Recommendation recommendation;
        recommendation.match = match;
        recommendation.match_minute = view.match_minute;
        recommendation.live_score = view.live_score;
        recommendation.probability = probability;
        recommendation.confidence = confidence.score;
        recommendation.stake = *stake;
        recommendation.reasons = model.reasons;
        recommendation.reasons.insert(recommendation.reasons.end(),
                                      confidence.reasons.begin(), confidence.reasons.end());

        GateRequest request;
        request.match = match;
        request.key = PositionKey{match.match_id, probability.market, probability.selection};
        request.confidence = confidence.score;
        request.stake = stake->amount;
        request.evaluated_price = probability.price;
        request.snapshot_time = view.snapshot_time;

        recommendation.decision = gate_.evaluate(request, context, clock_());
        counters.recommendations++;

        if (recommendation.decision.outcome == GateOutcome::Approved) {
            // Once reserved the intent is carried through and audited even if
            // a newer cycle has started meanwhile
            counters.approved++;
            execute(recommendation, context, counters);
            sink_.publish(recommendation);
            continue;
        }

        spdlog::debug("Gate rejected {}: {}", recommendation.to_string(),
                      to_string(recommendation.decision.reason));
        if (!is_current(cycle_id)) {
            return;
        }
        sink_.publish(recommendation);
    }
}

void CycleRunner::execute(Recommendation& recommendation, BankrollContext& context, Counters& counters) {
    const auto& probability = recommendation.probability;

    BetIntent intent;
    intent.intent_id = util::generate_uuid();
    intent.key = PositionKey{recommendation.match.match_id, probability.market, probability.selection};
    intent.home_team = recommendation.match.normalized_home_team;
    intent.away_team = recommendation.match.normalized_away_team;
    intent.price = probability.price;
    intent.stake = recommendation.stake.amount;
    intent.currency = recommendation.stake.currency;
    intent.confidence = recommendation.confidence;
    intent.created_at = clock_();

    ExecutionResult result;
    try {
        result = execution_.submit_intent(intent);
    } catch (const std::exception& e) {
        // The intent may or may not have left the process
        result.status = ExecutionStatus::Unconfirmed;
        result.reason = e.what();
    }

    if (result.status == ExecutionStatus::Rejected) {
        // Nothing was staked, so the reservation goes back
        context.release(intent.key, intent.stake);
        counters.execution_rejected++;
        recommendation.decision.note = fmt::format("execution rejected: {}", result.reason);
        spdlog::warn("Execution rejected intent {} for {}: {}", intent.intent_id,
                     recommendation.to_string(), result.reason);
        return;
    }

    BetRecord record;
    record.key = intent.key;
    record.stake = intent.stake;
    record.price = intent.price;
    record.timestamp = intent.created_at;
    record.status = result.status == ExecutionStatus::Accepted ? BetStatus::Open : BetStatus::Pending;

    if (result.status == ExecutionStatus::Unconfirmed) {
        counters.execution_unconfirmed++;
        recommendation.decision.note = fmt::format("execution unconfirmed: {}", result.reason);
        spdlog::warn("Execution did not confirm intent {} for {}: {}; holding the position as pending",
                     intent.intent_id, recommendation.to_string(), result.reason);
    }

    if (history_.record_bet(record)) {
        context.confirm(intent.key);
    } else {
        // Stays in flight so later cycles keep the position and its stake
        spdlog::error("Failed to record {} intent {} in bet history", to_string(record.status), intent.intent_id);
        if (!recommendation.decision.note.empty()) {
            recommendation.decision.note += "; ";
        }
        recommendation.decision.note += "not recorded in history";
    }

    if (result.status == ExecutionStatus::Accepted) {
        spdlog::info("Approved and submitted: {} (intent {})", recommendation.to_string(), intent.intent_id);
    }
}
