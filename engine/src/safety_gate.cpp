#include "safety_gate.hpp"
#include "aggregator.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

BankrollContext::BankrollContext(double bankroll, double realized_pnl_today, PositionSet open_positions)
    : bankroll_(bankroll),
      realized_pnl_today_(realized_pnl_today),
      open_positions_(std::move(open_positions)) {}

void BankrollContext::refresh(HistoryStore& history, TimePoint now) {
    // History is read under the lock so that a confirm() cannot slip between
    // the read and the merge of in-flight intents
    std::lock_guard<std::mutex> lock(mutex_);
    double pnl = history.query_realized_pnl(util::utc_day_start(now));
    auto positions = history.query_open_positions();

    double exposure = 0.0;
    for (const auto& [key, stake] : in_flight_) {
        positions.insert(key);
        exposure += stake;
    }

    realized_pnl_today_ = pnl;
    open_positions_ = std::move(positions);
    reserved_exposure_ = exposure;
    spdlog::debug("Bankroll context: realized P&L today {:.2f}, {} open positions, {} in flight ({:.2f} reserved)",
                  pnl, open_positions_.size(), in_flight_.size(), exposure);
}

double BankrollContext::realized_loss() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::max(0.0, -realized_pnl_today_);
}

double BankrollContext::reserved_exposure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_exposure_;
}

bool BankrollContext::has_position(const PositionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_positions_.count(key) > 0;
}

size_t BankrollContext::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

void BankrollContext::release(const PositionKey& key, double stake) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_exposure_ = std::max(0.0, reserved_exposure_ - stake);
    open_positions_.erase(key);
    in_flight_.erase(key);
}

void BankrollContext::confirm(const PositionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(key);
}

SafetyGate::SafetyGate(const Config& config, const PriceBoard& prices)
    : config_(config), prices_(prices) {}

GateDecision SafetyGate::evaluate(const GateRequest& request, BankrollContext& context, TimePoint now) const {
    GateDecision decision;
    decision.timestamp = now;
    decision.outcome = GateOutcome::Rejected;

    // 1. Confidence
    if (request.confidence < config_.auto_act_threshold) {
        decision.reason = GateReason::BelowConfidenceThreshold;
        return decision;
    }

    // Checks 2..5 and the reservation form one critical section
    std::lock_guard<std::mutex> lock(context.mutex_);

    // 2. Daily loss limit, counting stake already approved this cycle
    if (std::max(0.0, -context.realized_pnl_today_) + context.reserved_exposure_ >= config_.daily_loss_limit) {
        decision.reason = GateReason::DailyLossLimit;
        return decision;
    }

    // 3. Snapshot age
    if (now - request.snapshot_time > std::chrono::seconds(config_.snapshot_staleness_sec)) {
        decision.reason = GateReason::StaleSnapshot;
        return decision;
    }

    // 4. Duplicate position, on this fixture under any id it was dated with
    bool duplicate = std::any_of(context.open_positions_.begin(), context.open_positions_.end(),
                                 [&request](const PositionKey& open) {
        return open.market == request.key.market && open.selection == request.key.selection &&
               SourceAggregator::same_fixture(open.match_id, request.key.match_id);
    });
    if (duplicate) {
        decision.reason = GateReason::DuplicatePosition;
        return decision;
    }

    // 5. Price movement since evaluation
    auto current = prices_.best_price(request.match, request.key.market, request.key.selection);
    if (!current || std::fabs(*current - request.evaluated_price) / request.evaluated_price > config_.price_move_tol) {
        decision.reason = GateReason::PriceMoved;
        if (!current) {
            decision.note = "no current price";
        }
        return decision;
    }

    context.reserved_exposure_ += request.stake;
    context.open_positions_.insert(request.key);
    context.in_flight_[request.key] = request.stake;

    decision.outcome = GateOutcome::Approved;
    decision.reason = GateReason::None;
    return decision;
}
