#pragma once

#include "types.hpp"
#include <optional>
#include <string>

// Minimal read/write contract of the bet history collaborator. The engine
// treats it as ground truth and never re-derives history. The queries throw
// when history cannot be read; a cycle without history approves nothing.
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    virtual bool record_bet(const BetRecord& record) = 0;
    // Open and pending bets both hold a position
    virtual PositionSet query_open_positions(const std::optional<std::string>& match_id = std::nullopt) = 0;
    virtual double query_realized_pnl(TimePoint since) = 0;
};
