#include "types.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

std::string Market::to_string() const {
    switch (kind) {
        case MarketKind::MatchResult:
            return "1x2";
        case MarketKind::BothTeamsScore:
            return "btts";
        case MarketKind::TotalGoals:
            return fmt::format("total_{:.1f}", line);
    }
    return "unknown";
}

std::optional<Market> Market::parse(const std::string& code) {
    if (code == "1x2") {
        return Market{MarketKind::MatchResult, 0.0};
    }
    if (code == "btts") {
        return Market{MarketKind::BothTeamsScore, 0.0};
    }

    const std::string prefix = "total_";
    if (code.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    double line = 0.0;
    try {
        size_t consumed = 0;
        line = std::stod(code.substr(prefix.size()), &consumed);
        if (consumed != code.size() - prefix.size()) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    // Only half-goal lines settle without a push
    if (line <= 0.0 || std::fabs(line - std::floor(line) - 0.5) > 1e-9) {
        return std::nullopt;
    }
    return Market{MarketKind::TotalGoals, line};
}

std::vector<Selection> Market::selections() const {
    switch (kind) {
        case MarketKind::MatchResult:
            return {Selection::Home, Selection::Draw, Selection::Away};
        case MarketKind::TotalGoals:
            return {Selection::Over, Selection::Under};
        case MarketKind::BothTeamsScore:
            return {Selection::Yes, Selection::No};
    }
    return {};
}

std::string to_string(Selection selection) {
    switch (selection) {
        case Selection::Home: return "home";
        case Selection::Draw: return "draw";
        case Selection::Away: return "away";
        case Selection::Over: return "over";
        case Selection::Under: return "under";
        case Selection::Yes: return "yes";
        case Selection::No: return "no";
    }
    return "unknown";
}

std::optional<Selection> parse_selection(const std::string& value) {
    if (value == "home") return Selection::Home;
    if (value == "draw") return Selection::Draw;
    if (value == "away") return Selection::Away;
    if (value == "over") return Selection::Over;
    if (value == "under") return Selection::Under;
    if (value == "yes") return Selection::Yes;
    if (value == "no") return Selection::No;
    return std::nullopt;
}

bool selection_belongs_to(Selection selection, MarketKind kind) {
    Market market{kind, 0.5};
    for (auto s : market.selections()) {
        if (s == selection) {
            return true;
        }
    }
    return false;
}

std::string to_string(GateOutcome outcome) {
    return outcome == GateOutcome::Approved ? "approved" : "rejected";
}

std::string to_string(GateReason reason) {
    switch (reason) {
        case GateReason::None: return "none";
        case GateReason::BelowConfidenceThreshold: return "below_confidence_threshold";
        case GateReason::DailyLossLimit: return "daily_loss_limit";
        case GateReason::StaleSnapshot: return "stale_snapshot";
        case GateReason::DuplicatePosition: return "duplicate_position";
        case GateReason::PriceMoved: return "price_moved";
    }
    return "unknown";
}

std::string to_string(BetStatus status) {
    switch (status) {
        case BetStatus::Open: return "open";
        case BetStatus::Pending: return "pending";
        case BetStatus::Won: return "won";
        case BetStatus::Lost: return "lost";
        case BetStatus::Void: return "void";
    }
    return "unknown";
}

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Accepted: return "accepted";
        case ExecutionStatus::Rejected: return "rejected";
        case ExecutionStatus::Unconfirmed: return "unconfirmed";
    }
    return "unknown";
}

std::optional<BetStatus> parse_bet_status(const std::string& value) {
    if (value == "open") return BetStatus::Open;
    if (value == "pending") return BetStatus::Pending;
    if (value == "won") return BetStatus::Won;
    if (value == "lost") return BetStatus::Lost;
    if (value == "void") return BetStatus::Void;
    return std::nullopt;
}

std::string Recommendation::to_string() const {
    return fmt::format("{} vs {} [{}'] {} {} @ {:.2f}: p={:.3f} fair={:.3f} edge={:+.3f} conf={:.1f} stake={:.2f} {} -> {}{}",
                       match.normalized_home_team, match.normalized_away_team, match_minute,
                       probability.market.to_string(), ::to_string(probability.selection),
                       probability.price, probability.model_probability,
                       probability.fair_implied_probability, probability.edge, confidence,
                       stake.amount, stake.currency, ::to_string(decision.outcome),
                       decision.outcome == GateOutcome::Rejected
                           ? fmt::format(" ({})", ::to_string(decision.reason))
                           : std::string());
}
