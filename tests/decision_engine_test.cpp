#include "test_helpers.hpp"
#include "trader/strategy_analysis/decision_engine.hpp"
#include <gtest/gtest.h>

using namespace ConfluenceTrader::Core;
using namespace ConfluenceTrader::Testing;
using ConfluenceTrader::Config::SystemConfig;

namespace {

class DecisionEngineTest : public ::testing::Test {
protected:
    SystemConfig system_config;
    MarketModeState market_mode_state;
    LossStreakGuard loss_streak_guard{system_config.risk};
    DecisionEngine decision_engine{system_config, market_mode_state, loss_streak_guard};

    IndicatorSnapshot m1 = make_neutral_snapshot(Timeframe::MINUTE_1);
    IndicatorSnapshot m5 = make_neutral_snapshot(Timeframe::MINUTE_5);
    IndicatorSnapshot m15 = make_bullish_m15();

    // Up-trend with every rise rule firing
    void prepare_rise_setup() {
        m5.adx = 35.0;
        m5.plus_di = 30.0;
        m5.minus_di = 10.0;
        m5.adx_slope = 2.0;
        m5.bollinger_percent_b = 0.30;
        m5.macd_bullish = true;
        m1.stochastic_bullish_cross = true;
        m1.stochastic_k = 30.0;
        m1.bullish_pattern = true;
    }
};

TEST_F(DecisionEngineTest, InvalidSnapshotsGiveNoneWithReason) {
    IndicatorSnapshot invalid_m1;
    IndicatorSnapshot invalid_m5;
    IndicatorSnapshot invalid_m15;

    TradeSignal trade_signal = decision_engine.evaluate(invalid_m1, invalid_m5, invalid_m15, QUIET_TIME);
    EXPECT_EQ(trade_signal.side, TradeSide::NONE);
    EXPECT_EQ(trade_signal.decision_id, 1u);
    ASSERT_EQ(trade_signal.factors.size(), 1u);
    EXPECT_EQ(trade_signal.factors[0], "Insufficient indicator history: M1 M5 M15");
    EXPECT_EQ(market_mode_state.get_mode(), MarketMode::UNCERTAIN);
}

TEST_F(DecisionEngineTest, DecisionIdsIncreaseEveryCycle) {
    unsigned long long previous_decision_id = 0;
    for (int cycle = 0; cycle < 5; ++cycle) {
        TradeSignal trade_signal = decision_engine.evaluate(m1, m5, m15, QUIET_TIME + cycle * 60);
        EXPECT_GT(trade_signal.decision_id, previous_decision_id);
        previous_decision_id = trade_signal.decision_id;
    }
}

TEST_F(DecisionEngineTest, FullConfluenceProducesRise) {
    prepare_rise_setup();
    TradeSignal trade_signal = decision_engine.evaluate(m1, m5, m15, LIQUID_TIME);
    EXPECT_EQ(trade_signal.side, TradeSide::RISE);
    EXPECT_EQ(trade_signal.market_mode, MarketMode::TRENDING_UP);
    EXPECT_DOUBLE_EQ(trade_signal.confidence, 95.0);
    EXPECT_DOUBLE_EQ(trade_signal.price, m1.close_price);
    EXPECT_EQ(trade_signal.timestamp, LIQUID_TIME);
}

TEST_F(DecisionEngineTest, ReportedLossesEngageGuard) {
    prepare_rise_setup();
    long long now = LIQUID_TIME;
    for (int loss_index = 0; loss_index < system_config.risk.max_consecutive_losses; ++loss_index) {
        TradeSignal trade_signal = decision_engine.evaluate(m1, m5, m15, now);
        ASSERT_EQ(trade_signal.side, TradeSide::RISE);
        decision_engine.register_execution(trade_signal);
        EXPECT_EQ(decision_engine.get_outstanding_decision_count(), 1u);
        now += 300;
        EXPECT_TRUE(decision_engine.report_outcome(TradeOutcome(trade_signal.decision_id, TradeResult::LOSS, -10.0, now)));
        EXPECT_EQ(decision_engine.get_outstanding_decision_count(), 0u);
    }

    TradeSignal blocked_signal = decision_engine.evaluate(m1, m5, m15, now + 60);
    EXPECT_EQ(blocked_signal.side, TradeSide::NONE);
    EXPECT_TRUE(blocked_signal.blocked_by_guard);
    EXPECT_EQ(blocked_signal.observed_consecutive_losses, system_config.risk.max_consecutive_losses);
}

TEST_F(DecisionEngineTest, UnknownOutcomeIsRejected) {
    EXPECT_FALSE(decision_engine.report_outcome(TradeOutcome(42, TradeResult::LOSS, -10.0, QUIET_TIME)));
    EXPECT_EQ(loss_streak_guard.get_state().consecutive_losses, 0);
}

TEST_F(DecisionEngineTest, OutcomeIsAcceptedOnlyOnce) {
    prepare_rise_setup();
    TradeSignal trade_signal = decision_engine.evaluate(m1, m5, m15, LIQUID_TIME);
    decision_engine.register_execution(trade_signal);

    TradeOutcome trade_outcome(trade_signal.decision_id, TradeResult::LOSS, -10.0, LIQUID_TIME + 300);
    EXPECT_TRUE(decision_engine.report_outcome(trade_outcome));
    EXPECT_FALSE(decision_engine.report_outcome(trade_outcome));
    EXPECT_EQ(loss_streak_guard.get_state().consecutive_losses, 1);
}

TEST_F(DecisionEngineTest, RegisteringNoneDecisionThrows) {
    TradeSignal none_signal = decision_engine.evaluate(m1, m5, m15, QUIET_TIME);
    ASSERT_EQ(none_signal.side, TradeSide::NONE);
    EXPECT_THROW(decision_engine.register_execution(none_signal), std::runtime_error);
}

TEST(DecisionEngineIsolationTest, EnginesDoNotShareState) {
    SystemConfig system_config;
    MarketModeState first_mode_state;
    MarketModeState second_mode_state;
    LossStreakGuard first_guard(system_config.risk);
    LossStreakGuard second_guard(system_config.risk);
    DecisionEngine first_engine(system_config, first_mode_state, first_guard);
    DecisionEngine second_engine(system_config, second_mode_state, second_guard);

    IndicatorSnapshot m1 = make_neutral_snapshot(Timeframe::MINUTE_1);
    IndicatorSnapshot m5 = make_neutral_snapshot(Timeframe::MINUTE_5);
    IndicatorSnapshot m15 = make_neutral_snapshot(Timeframe::MINUTE_15);
    m5.adx = 40.0;
    m5.plus_di = 10.0;
    m5.minus_di = 30.0;

    first_engine.evaluate(m1, m5, m15, QUIET_TIME);
    EXPECT_EQ(first_mode_state.get_mode(), MarketMode::TRENDING_DOWN);
    EXPECT_EQ(second_mode_state.get_mode(), MarketMode::UNCERTAIN);
    EXPECT_EQ(second_engine.evaluate(m1, m5, m15, QUIET_TIME).decision_id, 1u);
}

} // namespace
