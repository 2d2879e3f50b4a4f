#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <chrono>
#include <optional>
#include <tuple>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class MarketKind {
    MatchResult,     // 1X2
    TotalGoals,      // over/under a half-goal line
    BothTeamsScore
};

enum class Selection {
    Home,
    Draw,
    Away,
    Over,
    Under,
    Yes,
    No
};

struct Market {
    MarketKind kind = MarketKind::MatchResult;
    double line = 0.0;  // only meaningful for TotalGoals

    std::string to_string() const;

    // "1x2", "btts", "total_2.5"; integer total lines are rejected
    static std::optional<Market> parse(const std::string& code);

    // Selections that together make the market complete
    std::vector<Selection> selections() const;

    bool operator<(const Market& other) const {
        return std::tie(kind, line) < std::tie(other.kind, other.line);
    }
    bool operator==(const Market& other) const {
        return kind == other.kind && line == other.line;
    }
};

std::string to_string(Selection selection);
std::optional<Selection> parse_selection(const std::string& value);
bool selection_belongs_to(Selection selection, MarketKind kind);

struct LiveScore {
    int home = 0;
    int away = 0;
};

// One price observed by one source. Never modified after construction.
struct OddsQuote {
    std::string source_id;
    std::string home_team;
    std::string away_team;
    std::string competition;
    TimePoint kickoff_time;
    Market market;
    Selection selection = Selection::Home;
    double price = 0.0;
    TimePoint observed_at;
    int match_minute = 0;
    LiveScore live_score;
};

struct CanonicalMatch {
    std::string match_id;
    std::string normalized_home_team;
    std::string normalized_away_team;
    std::string competition;
    TimePoint kickoff_time;
};

struct TeamRating {
    std::string team_id;
    double attack_strength = 1.0;
    double defense_strength = 1.0;
    double home_advantage = 1.0;
    TimePoint last_updated;
};

struct SelectionKey {
    Market market;
    Selection selection = Selection::Home;

    bool operator<(const SelectionKey& other) const {
        if (market == other.market) {
            return selection < other.selection;
        }
        return market < other.market;
    }
    bool operator==(const SelectionKey& other) const {
        return market == other.market && selection == other.selection;
    }
};

struct BestPrice {
    double price = 0.0;
    std::string source_id;
    TimePoint observed_at;
};

// Deduplicated, best-priced view of one fixture for one cycle
struct MatchView {
    CanonicalMatch match;
    int match_minute = 0;
    LiveScore live_score;
    TimePoint snapshot_time;  // oldest quote backing a best price
    std::map<SelectionKey, BestPrice> prices;
    std::vector<std::string> sources;
};

struct MarketProbability {
    Market market;
    Selection selection = Selection::Home;
    double price = 0.0;
    double model_probability = 0.0;
    double fair_implied_probability = 0.0;
    double edge = 0.0;
};

struct StakeBracket {
    double min_confidence = 0.0;
    double stake_min = 0.0;
    double stake_max = 0.0;
};

struct StakeRecommendation {
    double amount = 0.0;
    std::string currency;
    double kelly_fraction_used = 0.0;
    StakeBracket bracket_bounds;
};

enum class GateOutcome {
    Approved,
    Rejected
};

enum class GateReason {
    None,
    BelowConfidenceThreshold,
    DailyLossLimit,
    StaleSnapshot,
    DuplicatePosition,
    PriceMoved
};

std::string to_string(GateOutcome outcome);
std::string to_string(GateReason reason);

struct GateDecision {
    GateOutcome outcome = GateOutcome::Rejected;
    GateReason reason = GateReason::None;
    TimePoint timestamp;
    std::string note;  // secondary note, e.g. execution-layer rejection
};

enum class BetStatus {
    Open,
    Pending,  // intent sent, execution outcome not yet known
    Won,
    Lost,
    Void
};

std::string to_string(BetStatus status);
std::optional<BetStatus> parse_bet_status(const std::string& value);

struct PositionKey {
    std::string match_id;
    Market market;
    Selection selection = Selection::Home;

    bool operator<(const PositionKey& other) const {
        if (match_id != other.match_id) {
            return match_id < other.match_id;
        }
        return SelectionKey{market, selection} < SelectionKey{other.market, other.selection};
    }
};

struct BetRecord {
    PositionKey key;
    double stake = 0.0;
    double price = 0.0;
    TimePoint timestamp;
    BetStatus status = BetStatus::Open;
};

// Approved recommendation forwarded to the execution collaborator
struct BetIntent {
    std::string intent_id;
    PositionKey key;
    std::string home_team;
    std::string away_team;
    double price = 0.0;
    double stake = 0.0;
    std::string currency;
    double confidence = 0.0;
    TimePoint created_at;
};

// Unconfirmed: the intent may have reached the execution layer but no
// answer came back, so it has to be treated as a live position
enum class ExecutionStatus {
    Accepted,
    Rejected,
    Unconfirmed
};

std::string to_string(ExecutionStatus status);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Rejected;
    std::string reason;
};

struct Recommendation {
    CanonicalMatch match;
    int match_minute = 0;
    LiveScore live_score;
    MarketProbability probability;
    double confidence = 0.0;
    StakeRecommendation stake;
    GateDecision decision;
    std::vector<std::string> reasons;
    std::string to_string() const;
};

using PositionSet = std::set<PositionKey>;
