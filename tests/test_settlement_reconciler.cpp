#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "core/settlement_reconciler.hpp"
#include "utils/time_utils.hpp"
#include "fakes/fake_venue_client.hpp"

using namespace crossarb;

namespace {

const char* kPolyMarket = "0xlalgsw";
const char* kKalshiMarket = "KXNBAGAME-26JAN15LALGSW-GSW";

} // namespace

class SettlementReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        polymarket_ = std::make_shared<FakeVenueClient>(Venue::POLYMARKET);
        kalshi_ = std::make_shared<FakeVenueClient>(Venue::KALSHI);
        venues_.add(polymarket_);
        venues_.add(kalshi_);

        placed_at_ = time_utils::from_iso8601("2026-01-15T12:00:00Z");
        ledger_ = Ledger::fresh(10000.0, placed_at_);
        ledger_.append_trade(pending_trade("LAL@GSW", 97.5));
        ledger_.debit(97.5);

        reconciler_ = std::make_unique<SettlementReconciler>(venues_, config_);
    }

    Trade pending_trade(const std::string& id, Usd cost) {
        Trade t;
        t.id = id;
        t.legs[0].venue = Venue::POLYMARKET;
        t.legs[0].code = "LAL";
        t.legs[0].team = "Los Angeles Lakers";
        t.legs[0].market_id = kPolyMarket;
        t.legs[1].venue = Venue::KALSHI;
        t.legs[1].code = "GSW";
        t.legs[1].team = "Golden State Warriors";
        t.legs[1].market_id = kKalshiMarket;
        t.quantity = 100.0;
        t.cost_usd = cost;
        t.expected_profit = 100.0 - cost;
        t.status = TradeStatus::PENDING;
        t.placed_at = placed_at_;
        return t;
    }

    WallClock hours_later(int h) const { return placed_at_ + std::chrono::hours(h); }

    std::shared_ptr<FakeVenueClient> polymarket_;
    std::shared_ptr<FakeVenueClient> kalshi_;
    VenueRegistry venues_;
    ExecutionConfig config_;
    WallClock placed_at_;
    Ledger ledger_;
    std::unique_ptr<SettlementReconciler> reconciler_;
};

TEST_F(SettlementReconcilerTest, SettlesWhenBothLegsResolve) {
    polymarket_->resolve(kPolyMarket, "LAL");
    kalshi_->resolve(kKalshiMarket, "");

    auto report = reconciler_->run_pass(ledger_, hours_later(3));

    EXPECT_EQ(report.checked, 1);
    EXPECT_EQ(report.settled, 1);
    EXPECT_DOUBLE_EQ(report.payout_applied, 100.0);
    ASSERT_EQ(report.settled_ids.size(), 1u);

    const Trade& t = ledger_.trades[0];
    EXPECT_EQ(t.status, TradeStatus::SETTLED);
    ASSERT_TRUE(t.settled_at.has_value());
    EXPECT_DOUBLE_EQ(t.settlement_amount, 100.0);
    EXPECT_NEAR(t.realized_profit, 2.5, 1e-9);
    EXPECT_NEAR(ledger_.balance, 10002.5, 1e-9);
    EXPECT_DOUBLE_EQ(ledger_.daily.daily_loss, 0.0);
}

TEST_F(SettlementReconcilerTest, LosingLegWithoutWinnerSettlesImmediately) {
    // Kalshi reports a "no" result on the losing team's market as resolved with no winner
    polymarket_->resolve(kPolyMarket, "Los Angeles Lakers");
    kalshi_->resolve(kKalshiMarket, "");

    auto report = reconciler_->run_pass(ledger_, hours_later(2));

    EXPECT_EQ(report.settled, 1);
    EXPECT_EQ(report.still_pending, 0);
    const Trade& t = ledger_.trades[0];
    EXPECT_EQ(t.status, TradeStatus::SETTLED);
    EXPECT_DOUBLE_EQ(t.settlement_amount, 100.0);
    EXPECT_NEAR(ledger_.balance, 10002.5, 1e-9);
    EXPECT_TRUE(ledger_.errors.empty());
}

TEST_F(SettlementReconcilerTest, BothLegsWithoutWinnerSettleWithNoPayout) {
    polymarket_->resolve(kPolyMarket, "");
    kalshi_->resolve(kKalshiMarket, "");

    reconciler_->run_pass(ledger_, hours_later(2));

    const Trade& t = ledger_.trades[0];
    EXPECT_EQ(t.status, TradeStatus::SETTLED);
    EXPECT_DOUBLE_EQ(t.settlement_amount, 0.0);
    EXPECT_NEAR(ledger_.balance, 9902.5, 1e-9);
    EXPECT_NEAR(ledger_.daily.daily_loss, 97.5, 1e-9);
}

TEST_F(SettlementReconcilerTest, WinnerMatchesByTeamName) {
    polymarket_->resolve(kPolyMarket, "Golden State Warriors");
    kalshi_->resolve(kKalshiMarket, "GSW");

    reconciler_->run_pass(ledger_, hours_later(3));

    EXPECT_EQ(ledger_.trades[0].status, TradeStatus::SETTLED);
    EXPECT_DOUBLE_EQ(ledger_.trades[0].settlement_amount, 100.0);
}

TEST_F(SettlementReconcilerTest, SecondPassIsNoOp) {
    polymarket_->resolve(kPolyMarket, "LAL");
    kalshi_->resolve(kKalshiMarket, "");

    reconciler_->run_pass(ledger_, hours_later(3));
    int queries = polymarket_->settlement_calls() + kalshi_->settlement_calls();
    Usd balance = ledger_.balance;

    auto report = reconciler_->run_pass(ledger_, hours_later(4));

    EXPECT_EQ(report.checked, 0);
    EXPECT_EQ(report.settled, 0);
    EXPECT_DOUBLE_EQ(ledger_.balance, balance);
    EXPECT_EQ(polymarket_->settlement_calls() + kalshi_->settlement_calls(), queries);
}

TEST_F(SettlementReconcilerTest, OneLegResolvedStaysPendingBeforeTimeout) {
    polymarket_->resolve(kPolyMarket, "LAL");

    auto report = reconciler_->run_pass(ledger_, hours_later(23));

    EXPECT_EQ(report.still_pending, 1);
    EXPECT_EQ(ledger_.trades[0].status, TradeStatus::PENDING);
    EXPECT_NEAR(ledger_.balance, 9902.5, 1e-9);
}

TEST_F(SettlementReconcilerTest, IncompleteAfterTimeoutPaysResolvedLegs) {
    polymarket_->resolve(kPolyMarket, "LAL");

    auto report = reconciler_->run_pass(ledger_, hours_later(24));

    EXPECT_EQ(report.incomplete, 1);
    const Trade& t = ledger_.trades[0];
    EXPECT_EQ(t.status, TradeStatus::INCOMPLETE);
    EXPECT_DOUBLE_EQ(t.settlement_amount, 100.0);
    EXPECT_NEAR(t.realized_profit, 2.5, 1e-9);
    EXPECT_NEAR(ledger_.balance, 10002.5, 1e-9);
    ASSERT_EQ(ledger_.errors.size(), 1u);
    EXPECT_EQ(ledger_.errors[0].trade_id, "LAL@GSW");
}

TEST_F(SettlementReconcilerTest, IncompleteLossCountsTowardDailyLoss) {
    polymarket_->resolve(kPolyMarket, "GSW");
    auto now = hours_later(25);

    reconciler_->run_pass(ledger_, now);

    const Trade& t = ledger_.trades[0];
    EXPECT_EQ(t.status, TradeStatus::INCOMPLETE);
    EXPECT_DOUBLE_EQ(t.settlement_amount, 0.0);
    EXPECT_NEAR(t.realized_profit, -97.5, 1e-9);
    EXPECT_NEAR(ledger_.balance, 9902.5, 1e-9);
    // The pass rolled counters to the new day before adding the loss
    EXPECT_EQ(ledger_.daily.reset_date, time_utils::utc_date(now));
    EXPECT_NEAR(ledger_.daily.daily_loss, 97.5, 1e-9);
}

TEST_F(SettlementReconcilerTest, UnresolvedTradeNeverTimesOut) {
    auto report = reconciler_->run_pass(ledger_, hours_later(72));

    EXPECT_EQ(report.still_pending, 1);
    EXPECT_EQ(ledger_.trades[0].status, TradeStatus::PENDING);
}

TEST_F(SettlementReconcilerTest, UnmatchedWinnerLeavesLegUnresolved) {
    polymarket_->resolve(kPolyMarket, "BOS");
    kalshi_->resolve(kKalshiMarket, "");

    auto report = reconciler_->run_pass(ledger_, hours_later(3));

    EXPECT_EQ(report.settled, 0);
    EXPECT_EQ(report.still_pending, 1);
    EXPECT_EQ(ledger_.trades[0].status, TradeStatus::PENDING);
}

TEST_F(SettlementReconcilerTest, QueryFailureIsRecordedAndRetried) {
    polymarket_->fail_settlement_query(kPolyMarket);
    kalshi_->resolve(kKalshiMarket, "");

    auto report = reconciler_->run_pass(ledger_, hours_later(3));

    EXPECT_EQ(report.query_errors, 1);
    EXPECT_EQ(report.still_pending, 1);
    EXPECT_EQ(ledger_.errors.size(), 1u);

    polymarket_->resolve(kPolyMarket, "LAL");
    report = reconciler_->run_pass(ledger_, hours_later(4));
    EXPECT_EQ(report.settled, 1);
}

TEST_F(SettlementReconcilerTest, SettledLossCountsTowardDailyLoss) {
    ledger_.trades.clear();
    ledger_.balance = 10000.0;
    ledger_.append_trade(pending_trade("LAL@GSW", 101.0));
    ledger_.debit(101.0);

    polymarket_->resolve(kPolyMarket, "LAL");
    kalshi_->resolve(kKalshiMarket, "");
    reconciler_->run_pass(ledger_, hours_later(1));

    EXPECT_EQ(ledger_.trades[0].status, TradeStatus::SETTLED);
    EXPECT_NEAR(ledger_.trades[0].realized_profit, -1.0, 1e-9);
    EXPECT_NEAR(ledger_.daily.daily_loss, 1.0, 1e-9);
}

TEST_F(SettlementReconcilerTest, PollRunsBoundedBatches) {
    for (int i = 0; i < 5; ++i) {
        ledger_.append_trade(pending_trade("T" + std::to_string(i) + "@GSW", 97.5));
    }
    polymarket_->resolve(kPolyMarket, "LAL");
    kalshi_->resolve(kKalshiMarket, "");
    polymarket_->set_settlement_delay_ms(20);
    kalshi_->set_settlement_delay_ms(20);

    // Each batch of two holds one leg per venue
    config_.settlement_concurrency = 2;
    SettlementReconciler bounded(venues_, config_);

    auto statuses = bounded.poll(bounded.collect(ledger_));

    ASSERT_EQ(statuses.size(), 12u);
    for (const auto& s : statuses) {
        EXPECT_TRUE(s.status.resolved);
        EXPECT_TRUE(s.status.error.empty());
    }
    EXPECT_EQ(polymarket_->max_settlements_in_flight(), 1);
    EXPECT_EQ(kalshi_->max_settlements_in_flight(), 1);
}

TEST_F(SettlementReconcilerTest, ThrowingQueryBecomesError) {
    polymarket_->resolve(kPolyMarket, "LAL");
    kalshi_->throw_on_settlement_query();

    auto report = reconciler_->run_pass(ledger_, hours_later(3));

    EXPECT_EQ(report.query_errors, 1);
    EXPECT_EQ(report.still_pending, 1);
    EXPECT_EQ(ledger_.trades[0].status, TradeStatus::PENDING);
}

TEST_F(SettlementReconcilerTest, CollectSkipsClosedTrades) {
    Trade settled = pending_trade("BOS@NYK", 97.5);
    settled.status = TradeStatus::SETTLED;
    ledger_.trades.push_back(settled);

    auto queries = reconciler_->collect(ledger_);
    ASSERT_EQ(queries.size(), 2u);
    EXPECT_EQ(queries[0].trade_id, "LAL@GSW");
    EXPECT_EQ(queries[1].venue, Venue::KALSHI);
}
