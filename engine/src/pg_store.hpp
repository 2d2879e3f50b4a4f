#pragma once

#include "config.hpp"
#include "history_store.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

// Bet history in the `bets` table
class PostgresStore : public HistoryStore {
public:
    explicit PostgresStore(const Config& config);
    ~PostgresStore() override;

    bool is_connected() const;

    bool initialize_schema();

    bool record_bet(const BetRecord& record) override;
    PositionSet query_open_positions(const std::optional<std::string>& match_id = std::nullopt) override;
    double query_realized_pnl(TimePoint since) override;

    // Non-copyable
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
