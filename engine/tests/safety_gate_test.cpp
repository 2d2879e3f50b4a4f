#include "safety_gate.hpp"
#include "aggregator.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace testing_support;

namespace {

class SafetyGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.auto_act_threshold = 85.0;
        config_.daily_loss_limit = 3000.0;
        config_.snapshot_staleness_sec = 120;
        config_.price_move_tol = 0.03;
        board_.apply(make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Home, 2.10));
    }

    CanonicalMatch fixture() const {
        CanonicalMatch match;
        match.normalized_home_team = "arsenal";
        match.normalized_away_team = "chelsea";
        match.kickoff_time = reference_time() - std::chrono::minutes(30);
        match.match_id = SourceAggregator::make_match_id("arsenal", "chelsea", match.kickoff_time);
        return match;
    }

    PositionKey home_key() const {
        return PositionKey{fixture().match_id, *Market::parse("1x2"), Selection::Home};
    }

    GateRequest passing_request() const {
        GateRequest request;
        request.match = fixture();
        request.key = home_key();
        request.confidence = 92.0;
        request.stake = 300.0;
        request.evaluated_price = 2.10;
        request.snapshot_time = reference_time() - std::chrono::seconds(10);
        return request;
    }

    Config config_;
    PriceBoard board_{config_};
};

} // namespace

TEST_F(SafetyGateTest, ApprovesAndReserves) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {});

    auto decision = gate.evaluate(passing_request(), context, reference_time());
    EXPECT_EQ(decision.outcome, GateOutcome::Approved);
    EXPECT_EQ(decision.reason, GateReason::None);
    EXPECT_EQ(decision.timestamp, reference_time());
    EXPECT_DOUBLE_EQ(context.reserved_exposure(), 300.0);
    EXPECT_TRUE(context.has_position(home_key()));
}

TEST_F(SafetyGateTest, ConfidenceBelowThresholdRejectsRegardless) {
    SafetyGate gate(config_, board_);
    // Every later check would fail too
    BankrollContext context(10000.0, -5000.0, {home_key()});

    auto request = passing_request();
    request.confidence = 84.0;
    request.snapshot_time = reference_time() - std::chrono::hours(1);
    request.evaluated_price = 3.0;

    auto decision = gate.evaluate(request, context, reference_time());
    EXPECT_EQ(decision.outcome, GateOutcome::Rejected);
    EXPECT_EQ(decision.reason, GateReason::BelowConfidenceThreshold);
}

TEST_F(SafetyGateTest, ConfidenceAtThresholdPasses) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {});

    auto request = passing_request();
    request.confidence = 85.0;
    EXPECT_EQ(gate.evaluate(request, context, reference_time()).outcome, GateOutcome::Approved);
}

TEST_F(SafetyGateTest, LossEqualToLimitRejects) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, -3000.0, {});

    auto request = passing_request();
    request.confidence = 100.0;
    auto decision = gate.evaluate(request, context, reference_time());
    EXPECT_EQ(decision.outcome, GateOutcome::Rejected);
    EXPECT_EQ(decision.reason, GateReason::DailyLossLimit);
    EXPECT_DOUBLE_EQ(context.reserved_exposure(), 0.0);
}

TEST_F(SafetyGateTest, LossOneUnitBelowLimitPasses) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, -2999.0, {});

    EXPECT_EQ(gate.evaluate(passing_request(), context, reference_time()).outcome, GateOutcome::Approved);
}

TEST_F(SafetyGateTest, ProfitNeverCountsAsLoss) {
    BankrollContext context(10000.0, 4200.0, {});
    EXPECT_DOUBLE_EQ(context.realized_loss(), 0.0);
}

TEST_F(SafetyGateTest, StaleSnapshotRejects) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {});

    auto request = passing_request();
    request.snapshot_time = reference_time() - std::chrono::seconds(121);
    EXPECT_EQ(gate.evaluate(request, context, reference_time()).reason, GateReason::StaleSnapshot);

    request.snapshot_time = reference_time() - std::chrono::seconds(120);
    EXPECT_EQ(gate.evaluate(request, context, reference_time()).outcome, GateOutcome::Approved);
}

TEST_F(SafetyGateTest, DuplicatePositionRejects) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {home_key()});

    auto decision = gate.evaluate(passing_request(), context, reference_time());
    EXPECT_EQ(decision.reason, GateReason::DuplicatePosition);
}

TEST_F(SafetyGateTest, PositionUnderDifferentlyDatedIdIsDuplicate) {
    SafetyGate gate(config_, board_);
    auto previous_day = home_key();
    previous_day.match_id = "arsenal__vs__chelsea__2024-03-08";
    BankrollContext context(10000.0, 0.0, {previous_day});

    EXPECT_EQ(gate.evaluate(passing_request(), context, reference_time()).reason, GateReason::DuplicatePosition);
}

TEST_F(SafetyGateTest, OtherSelectionOrFixtureIsNotDuplicate) {
    SafetyGate gate(config_, board_);
    auto draw = home_key();
    draw.selection = Selection::Draw;
    auto other_fixture = home_key();
    other_fixture.match_id = "everton__vs__chelsea__2024-03-09";
    auto last_week = home_key();
    last_week.match_id = "arsenal__vs__chelsea__2024-03-02";
    BankrollContext context(10000.0, 0.0, {draw, other_fixture, last_week});

    EXPECT_EQ(gate.evaluate(passing_request(), context, reference_time()).outcome, GateOutcome::Approved);
}

TEST_F(SafetyGateTest, SecondApprovalOnSamePositionIsDuplicate) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {});

    EXPECT_EQ(gate.evaluate(passing_request(), context, reference_time()).outcome, GateOutcome::Approved);
    EXPECT_EQ(gate.evaluate(passing_request(), context, reference_time()).reason, GateReason::DuplicatePosition);
}

TEST_F(SafetyGateTest, PriceMoveBeyondToleranceRejects) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {});

    auto request = passing_request();
    request.evaluated_price = 2.25;
    auto decision = gate.evaluate(request, context, reference_time());
    EXPECT_EQ(decision.reason, GateReason::PriceMoved);
    EXPECT_TRUE(decision.note.empty());

    request.evaluated_price = 2.05;
    EXPECT_EQ(gate.evaluate(request, context, reference_time()).outcome, GateOutcome::Approved);
}

TEST_F(SafetyGateTest, MissingCurrentPriceRejects) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, 0.0, {});

    auto request = passing_request();
    request.key.selection = Selection::Away;
    auto decision = gate.evaluate(request, context, reference_time());
    EXPECT_EQ(decision.reason, GateReason::PriceMoved);
    EXPECT_EQ(decision.note, "no current price");
}

TEST_F(SafetyGateTest, CurrentPriceFoundWithinKickoffTolerance) {
    // Another source dates the fixture four minutes later and quotes higher
    board_.apply(make_quote("b", "Arsenal FC", "Chelsea", "1x2", Selection::Home, 2.14, reference_time(),
                            reference_time() - std::chrono::minutes(26)));
    // Outside tolerance: a different fixture between the same teams
    board_.apply(make_quote("c", "Arsenal", "Chelsea", "1x2", Selection::Home, 4.00, reference_time(),
                            reference_time() + std::chrono::hours(3)));

    auto match = fixture();
    auto current = board_.best_price(match, *Market::parse("1x2"), Selection::Home);
    ASSERT_TRUE(current.has_value());
    EXPECT_DOUBLE_EQ(*current, 2.14);

    // Same answer when the canonical match carries the later kickoff
    match.kickoff_time += std::chrono::minutes(4);
    current = board_.best_price(match, *Market::parse("1x2"), Selection::Home);
    ASSERT_TRUE(current.has_value());
    EXPECT_DOUBLE_EQ(*current, 2.14);
}

TEST_F(SafetyGateTest, ChecksRunInOrder) {
    SafetyGate gate(config_, board_);

    // Loss limit and staleness both fail: loss limit wins
    BankrollContext over_limit(10000.0, -3500.0, {home_key()});
    auto request = passing_request();
    request.snapshot_time = reference_time() - std::chrono::hours(1);
    EXPECT_EQ(gate.evaluate(request, over_limit, reference_time()).reason, GateReason::DailyLossLimit);

    // Staleness and duplicate both fail: staleness wins
    BankrollContext holding(10000.0, 0.0, {home_key()});
    EXPECT_EQ(gate.evaluate(request, holding, reference_time()).reason, GateReason::StaleSnapshot);

    // Duplicate and price move both fail: duplicate wins
    request = passing_request();
    request.evaluated_price = 5.0;
    EXPECT_EQ(gate.evaluate(request, holding, reference_time()).reason, GateReason::DuplicatePosition);
}

TEST_F(SafetyGateTest, ReservedExposureCountsTowardsLimit) {
    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, -2500.0, {});

    auto first = passing_request();
    first.stake = 500.0;
    EXPECT_EQ(gate.evaluate(first, context, reference_time()).outcome, GateOutcome::Approved);

    board_.apply(make_quote("a", "Arsenal", "Chelsea", "1x2", Selection::Draw, 3.40));
    auto second = passing_request();
    second.key.selection = Selection::Draw;
    second.evaluated_price = 3.40;
    EXPECT_EQ(gate.evaluate(second, context, reference_time()).reason, GateReason::DailyLossLimit);

    // A released reservation frees the headroom again
    context.release(first.key, first.stake);
    EXPECT_EQ(gate.evaluate(second, context, reference_time()).outcome, GateOutcome::Approved);
}

TEST_F(SafetyGateTest, ConcurrentApprovalsNeverOvershootHeadroom) {
    // Distinct positions on one match, all priced on the board
    const int kRequests = 40;
    std::vector<GateRequest> requests;
    for (int i = 0; i < kRequests; ++i) {
        std::string line = std::to_string(i) + ".5";
        auto quote = make_quote("a", "Arsenal", "Chelsea", "total_" + line, Selection::Over, 1.90);
        board_.apply(quote);

        GateRequest request = passing_request();
        request.key.market = quote.market;
        request.key.selection = Selection::Over;
        request.evaluated_price = 1.90;
        request.stake = 100.0;
        requests.push_back(request);
    }

    SafetyGate gate(config_, board_);
    BankrollContext context(10000.0, -2500.0, {});

    std::atomic<int> approved{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = t; i < kRequests; i += 8) {
                if (gate.evaluate(requests[i], context, reference_time()).outcome == GateOutcome::Approved) {
                    approved++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Approvals stop once reserved stake reaches the remaining 500
    EXPECT_EQ(approved.load(), 5);
    EXPECT_DOUBLE_EQ(context.reserved_exposure(), 500.0);
}
