#include <gtest/gtest.h>
#include <memory>
#include "core/arbitrage_engine.hpp"
#include "utils/time_utils.hpp"
#include "venue/simulated_venue_client.hpp"
#include "fakes/fake_venue_client.hpp"
#include "fakes/in_memory_ledger_store.hpp"
#include "fakes/test_pairs.hpp"

using namespace crossarb;

class ArbitrageEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.fees = testing_pairs::zero_fees();
        config_.execution.persist_retry_backoff_ms = 0;

        polymarket_ = std::make_shared<FakeVenueClient>(Venue::POLYMARKET);
        kalshi_ = std::make_shared<FakeVenueClient>(Venue::KALSHI);
        venues_.add(polymarket_);
        venues_.add(kalshi_);

        now_ = time_utils::from_iso8601("2026-01-15T12:00:00Z");
        engine_ = std::make_unique<ArbitrageEngine>(
            config_, venues_, store_, ArbitrageEngine::load_or_create(store_, config_, now_));
    }

    Config config_;
    std::shared_ptr<FakeVenueClient> polymarket_;
    std::shared_ptr<FakeVenueClient> kalshi_;
    VenueRegistry venues_;
    InMemoryLedgerStore store_;
    WallClock now_;
    std::unique_ptr<ArbitrageEngine> engine_;
};

TEST_F(ArbitrageEngineTest, FreshLedgerIsPersistedOnFirstStart) {
    ASSERT_TRUE(store_.stored().has_value());
    EXPECT_DOUBLE_EQ(store_.stored()->balance, 10000.0);
}

TEST_F(ArbitrageEngineTest, DiscountedSizeIsWholeContractsOnBothLegs) {
    Config config = config_;
    config.risk.target_units = 250.0;
    InMemoryLedgerStore store;
    ArbitrageEngine engine(config, venues_, store, ArbitrageEngine::load_or_create(store, config, now_));

    auto result = engine.evaluate(testing_pairs::make(47.5, 52, 50, 50), now_);

    ASSERT_TRUE(result.placed()) << result.reason;
    EXPECT_DOUBLE_EQ(result.trade->quantity, 247.0);
    EXPECT_NEAR(result.trade->cost_usd, 240.825, 1e-9);
    EXPECT_NEAR(engine.summary(now_).balance, 10000.0 - 240.825, 1e-9);

    ASSERT_EQ(polymarket_->requests().size(), 1u);
    ASSERT_EQ(kalshi_->requests().size(), 1u);
    EXPECT_DOUBLE_EQ(polymarket_->requests()[0].quantity, 247.0);
    EXPECT_DOUBLE_EQ(kalshi_->requests()[0].quantity, 247.0);
}

TEST_F(ArbitrageEngineTest, EndToEndPlaceAndSettle) {
    auto result = engine_->evaluate(testing_pairs::make(47.5, 52, 50, 50), now_);

    ASSERT_TRUE(result.placed()) << result.reason;
    EXPECT_EQ(result.stage, EvaluationStage::PLACED);
    EXPECT_TRUE(result.persisted);
    ASSERT_TRUE(result.opportunity.has_value());
    EXPECT_EQ(result.opportunity->quality, Quality::PERFECT);

    const Trade& trade = *result.trade;
    EXPECT_DOUBLE_EQ(trade.quantity, 100.0);
    EXPECT_NEAR(trade.cost_usd, 97.50, 1e-9);
    EXPECT_NEAR(trade.expected_profit, 2.50, 1e-9);
    EXPECT_NEAR(trade.roi_percent, 2.564, 0.001);
    EXPECT_EQ(trade.legs[0].venue, Venue::POLYMARKET);
    EXPECT_EQ(trade.legs[1].venue, Venue::KALSHI);

    auto after_trade = engine_->summary(now_);
    EXPECT_NEAR(after_trade.balance, 9902.50, 1e-9);
    EXPECT_EQ(after_trade.pending_count, 1u);
    EXPECT_EQ(after_trade.daily_trades, 1u);

    polymarket_->resolve("0xlalgsw", "LAL");
    kalshi_->resolve("KXNBAGAME-26JAN15LALGSW-GSW", "");

    auto report = engine_->run_settlement_pass(now_ + std::chrono::hours(4));
    EXPECT_EQ(report.settled, 1);

    auto settled = engine_->summary(now_ + std::chrono::hours(4));
    EXPECT_NEAR(settled.balance, 10002.50, 1e-9);
    EXPECT_EQ(settled.pending_count, 0u);
    EXPECT_NEAR(settled.total_realized_profit, 2.50, 1e-9);

    ASSERT_TRUE(store_.stored().has_value());
    EXPECT_NEAR(store_.stored()->balance, 10002.50, 1e-9);
    EXPECT_EQ(store_.stored()->trades[0].status, TradeStatus::SETTLED);
}

TEST_F(ArbitrageEngineTest, RepeatedPollsDoNotDuplicateTrade) {
    auto pair = testing_pairs::make(47.5, 52, 50, 50);

    EXPECT_TRUE(engine_->evaluate(pair, now_).placed());
    for (int i = 0; i < 3; ++i) {
        auto again = engine_->evaluate(pair, now_);
        EXPECT_FALSE(again.placed());
        EXPECT_EQ(again.stage, EvaluationStage::RISK);
        EXPECT_EQ(again.error, ErrorKind::RISK_REJECTED);
    }

    EXPECT_EQ(polymarket_->place_calls(), 1);
    EXPECT_EQ(kalshi_->place_calls(), 1);
    EXPECT_EQ(engine_->ledger_snapshot().trades.size(), 1u);
}

TEST_F(ArbitrageEngineTest, CanTradeAgainAfterSettlement) {
    auto pair = testing_pairs::make(47.5, 52, 50, 50);
    ASSERT_TRUE(engine_->evaluate(pair, now_).placed());

    polymarket_->resolve("0xlalgsw", "GSW");
    kalshi_->resolve("KXNBAGAME-26JAN15LALGSW-GSW", "GSW");
    engine_->run_settlement_pass(now_ + std::chrono::hours(1));

    EXPECT_TRUE(engine_->evaluate(pair, now_ + std::chrono::hours(2)).placed());
    EXPECT_EQ(engine_->ledger_snapshot().trades.size(), 2u);
}

TEST_F(ArbitrageEngineTest, DetectionFailuresStopEarly) {
    config_.fees = FeeConfig{};
    ArbitrageEngine engine(config_, venues_, store_, Ledger::fresh(10000.0, now_));

    auto same_venue = engine.evaluate(testing_pairs::make(45, 50, 55, 48), now_);
    EXPECT_EQ(same_venue.stage, EvaluationStage::DETECTION);
    EXPECT_EQ(same_venue.error, ErrorKind::INVALID_INPUT);

    auto none = engine_->evaluate(testing_pairs::make(53, 54, 54, 53), now_);
    EXPECT_EQ(none.stage, EvaluationStage::DETECTION);
    EXPECT_EQ(none.error, ErrorKind::NO_OPPORTUNITY);

    EXPECT_EQ(polymarket_->place_calls(), 0);
}

TEST_F(ArbitrageEngineTest, PlacementFailureReported) {
    kalshi_->fail_next_placement();

    auto result = engine_->evaluate(testing_pairs::make(47.5, 52, 50, 50), now_);

    EXPECT_FALSE(result.placed());
    EXPECT_EQ(result.stage, EvaluationStage::EXECUTION);
    EXPECT_EQ(result.error, ErrorKind::PLACEMENT_FAILED);
    EXPECT_EQ(polymarket_->cancel_calls(), 1);
    EXPECT_NEAR(engine_->summary(now_).balance, 10000.0, 1e-9);
}

TEST_F(ArbitrageEngineTest, EvaluateAllProcessesEveryPair) {
    auto lal = testing_pairs::make(47.5, 52, 50, 50);
    auto none = testing_pairs::make(53, 54, 54, 53);

    auto results = engine_->evaluate_all({lal, none, lal}, now_);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].placed());
    EXPECT_EQ(results[1].error, ErrorKind::NO_OPPORTUNITY);
    EXPECT_EQ(results[2].error, ErrorKind::RISK_REJECTED);
}

TEST_F(ArbitrageEngineTest, ResetStartsFreshLedger) {
    ASSERT_TRUE(engine_->evaluate(testing_pairs::make(47.5, 52, 50, 50), now_).placed());

    EXPECT_TRUE(engine_->reset(now_));

    auto s = engine_->summary(now_);
    EXPECT_DOUBLE_EQ(s.balance, 10000.0);
    EXPECT_EQ(s.trade_count, 0u);
    EXPECT_TRUE(store_.stored()->trades.empty());
}

TEST_F(ArbitrageEngineTest, ReloadsPersistedLedger) {
    ASSERT_TRUE(engine_->evaluate(testing_pairs::make(47.5, 52, 50, 50), now_).placed());

    ArbitrageEngine restarted(config_, venues_, store_,
                              ArbitrageEngine::load_or_create(store_, config_, now_));

    auto s = restarted.summary(now_);
    EXPECT_NEAR(s.balance, 9902.5, 1e-9);
    EXPECT_EQ(s.pending_count, 1u);

    // Dedup survives the restart
    auto again = restarted.evaluate(testing_pairs::make(47.5, 52, 50, 50), now_);
    EXPECT_EQ(again.error, ErrorKind::RISK_REJECTED);
}

// ============================================================================
// Simulated venues
// ============================================================================

TEST(SimulatedEngineTest, SettlesFromResolutionTable) {
    Config config;
    config.fees = testing_pairs::zero_fees();
    auto now = time_utils::from_iso8601("2026-01-15T12:00:00Z");

    auto polymarket = std::make_shared<SimulatedVenueClient>(Venue::POLYMARKET);
    auto kalshi = std::make_shared<SimulatedVenueClient>(Venue::KALSHI);
    VenueRegistry venues;
    venues.add(polymarket);
    venues.add(kalshi);

    InMemoryLedgerStore store;
    ArbitrageEngine engine(config, venues, store, Ledger::fresh(config.initial_balance, now));

    auto result = engine.evaluate(testing_pairs::make(47.5, 52, 50, 50), now);
    ASSERT_TRUE(result.placed()) << result.reason;
    EXPECT_EQ(polymarket->orders_placed(), 1);
    EXPECT_EQ(result.trade->legs[1].order_id.rfind("SIM-Kalshi-", 0), 0u);

    auto pending = engine.run_settlement_pass(now + std::chrono::hours(1));
    EXPECT_EQ(pending.still_pending, 1);

    polymarket->set_resolution("0xlalgsw", true, "Los Angeles Lakers");
    kalshi->set_resolution("KXNBAGAME-26JAN15LALGSW-GSW", true, "");

    auto report = engine.run_settlement_pass(now + std::chrono::hours(2));
    EXPECT_EQ(report.settled, 1);
    EXPECT_NEAR(engine.summary(now).balance, 10002.5, 1e-9);
}
