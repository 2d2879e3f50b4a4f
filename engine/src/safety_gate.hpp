#pragma once

#include "config.hpp"
#include "history_store.hpp"
#include "price_board.hpp"
#include "types.hpp"
#include <map>
#include <mutex>

// Bankroll and position state shared by every cycle, including a superseded
// cycle that is still draining. Refreshed from the history store at the
// start of each cycle and mutated only inside SafetyGate::evaluate, release
// and confirm. Approved intents not yet recorded in history stay reserved
// across refreshes.
class BankrollContext {
public:
    BankrollContext(double bankroll, double realized_pnl_today, PositionSet open_positions);

    // Re-read realized P&L and open positions for a new cycle. Throws, leaving
    // the state untouched, when history cannot be read.
    void refresh(HistoryStore& history, TimePoint now);

    double bankroll() const { return bankroll_; }
    double realized_loss() const;
    double reserved_exposure() const;
    bool has_position(const PositionKey& key) const;
    size_t in_flight() const;

    // Undo a reservation whose intent the execution layer refused
    void release(const PositionKey& key, double stake);

    // The intent is now in history; later refreshes will read it from there
    void confirm(const PositionKey& key);

private:
    friend class SafetyGate;

    mutable std::mutex mutex_;
    const double bankroll_;
    double realized_pnl_today_;
    double reserved_exposure_ = 0.0;
    PositionSet open_positions_;
    std::map<PositionKey, double> in_flight_;
};

struct GateRequest {
    CanonicalMatch match;
    PositionKey key;
    double confidence = 0.0;
    double stake = 0.0;
    double evaluated_price = 0.0;
    TimePoint snapshot_time;
};

class SafetyGate {
public:
    SafetyGate(const Config& config, const PriceBoard& prices);

    // Ordered checklist, first failure wins. On approval the stake and the
    // position are reserved in `context` before the lock is released.
    GateDecision evaluate(const GateRequest& request, BankrollContext& context, TimePoint now) const;

private:
    const Config& config_;
    const PriceBoard& prices_;
};
