#include "test_helpers.hpp"
#include "trader/strategy_analysis/loss_streak_guard.hpp"
#include <gtest/gtest.h>
#include <random>
#include <thread>
#include <vector>

using namespace ConfluenceTrader::Core;
using ConfluenceTrader::Testing::QUIET_TIME;

namespace {

TradeSignal make_rise_signal(long long timestamp) {
    TradeSignal trade_signal;
    trade_signal.side = TradeSide::RISE;
    trade_signal.confidence = 80.0;
    trade_signal.timestamp = timestamp;
    trade_signal.factors.push_back("M5 pullback in up-trend");
    return trade_signal;
}

RiskConfig make_risk_config(int max_consecutive_losses, long long cooldown_seconds) {
    RiskConfig risk_config;
    risk_config.max_consecutive_losses = max_consecutive_losses;
    risk_config.loss_cooldown_seconds = cooldown_seconds;
    return risk_config;
}

TEST(LossStreakGuardTest, ThreeLossesBlockForCooldownThenReset) {
    LossStreakGuard guard(make_risk_config(3, 600));
    const long long loss_time = QUIET_TIME;

    guard.record_outcome(TradeResult::LOSS, loss_time - 120);
    guard.record_outcome(TradeResult::LOSS, loss_time - 60);
    EXPECT_EQ(guard.get_guard_state(), GuardState::ACTIVE);
    guard.record_outcome(TradeResult::LOSS, loss_time);
    EXPECT_EQ(guard.get_guard_state(), GuardState::COOLDOWN);

    for (long long now : {loss_time + 1, loss_time + 300, loss_time + 599}) {
        TradeSignal gated_signal = guard.gate(make_rise_signal(now), now);
        EXPECT_EQ(gated_signal.side, TradeSide::NONE) << "at +" << (now - loss_time);
        EXPECT_TRUE(gated_signal.blocked_by_guard);
        EXPECT_DOUBLE_EQ(gated_signal.confidence, 0.0);
        EXPECT_EQ(gated_signal.observed_consecutive_losses, 3);
    }

    TradeSignal released_signal = guard.gate(make_rise_signal(loss_time + 600), loss_time + 600);
    EXPECT_EQ(released_signal.side, TradeSide::RISE);
    EXPECT_FALSE(released_signal.blocked_by_guard);
    EXPECT_EQ(released_signal.observed_consecutive_losses, 0);
    EXPECT_EQ(guard.get_state().consecutive_losses, 0);
    EXPECT_FALSE(guard.get_state().cooldown_until.has_value());
}

TEST(LossStreakGuardTest, WinResetsAndTieLeavesStreakUnchanged) {
    LossStreakGuard guard(make_risk_config(3, 600));
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME);
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME + 60);
    guard.record_outcome(TradeResult::TIE, QUIET_TIME + 120);
    EXPECT_EQ(guard.get_state().consecutive_losses, 2);

    guard.record_outcome(TradeResult::WIN, QUIET_TIME + 180);
    EXPECT_EQ(guard.get_state().consecutive_losses, 0);
    EXPECT_EQ(guard.get_guard_state(), GuardState::ACTIVE);
}

TEST(LossStreakGuardTest, NoneSignalsPassThroughUnflagged) {
    LossStreakGuard guard(make_risk_config(1, 600));
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME);

    TradeSignal none_signal;
    none_signal.timestamp = QUIET_TIME + 60;
    TradeSignal gated_signal = guard.gate(none_signal, QUIET_TIME + 60);
    EXPECT_EQ(gated_signal.side, TradeSide::NONE);
    EXPECT_FALSE(gated_signal.blocked_by_guard);
}

TEST(LossStreakGuardTest, ZeroCooldownIsHardStopUntilReset) {
    LossStreakGuard guard(make_risk_config(2, 0));
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME);
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME + 60);
    EXPECT_EQ(guard.get_guard_state(), GuardState::HARD_STOP);

    const long long one_week_later = QUIET_TIME + 7 * 86400;
    EXPECT_EQ(guard.gate(make_rise_signal(one_week_later), one_week_later).side, TradeSide::NONE);

    guard.reset();
    EXPECT_EQ(guard.get_guard_state(), GuardState::ACTIVE);
    EXPECT_EQ(guard.gate(make_rise_signal(one_week_later), one_week_later).side, TradeSide::RISE);
}

TEST(LossStreakGuardTest, OutcomesDuringCooldownDoNotExtendStreak) {
    LossStreakGuard guard(make_risk_config(2, 600));
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME);
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME + 60);
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME + 120);
    EXPECT_EQ(guard.get_state().consecutive_losses, 2);
    EXPECT_EQ(guard.get_state().cooldown_until.value(), QUIET_TIME + 660);
}

TEST(LossStreakGuardTest, OutcomeAfterExpiryStartsFreshStreak) {
    LossStreakGuard guard(make_risk_config(2, 600));
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME);
    guard.record_outcome(TradeResult::LOSS, QUIET_TIME + 60);

    guard.record_outcome(TradeResult::LOSS, QUIET_TIME + 700);
    EXPECT_EQ(guard.get_guard_state(), GuardState::ACTIVE);
    EXPECT_EQ(guard.get_state().consecutive_losses, 1);
}

TEST(LossStreakGuardTest, BlockedDecisionAlwaysObservesExactlyTheMaximum) {
    const int max_consecutive_losses = 3;
    LossStreakGuard guard(make_risk_config(max_consecutive_losses, 300));
    std::mt19937 random_engine(20240101);
    std::uniform_int_distribution<int> outcome_distribution(0, 9);

    long long now = QUIET_TIME;
    int blocked_decisions = 0;
    for (int step = 0; step < 2000; ++step) {
        now += 60;
        int outcome_roll = outcome_distribution(random_engine);
        TradeResult result = outcome_roll < 6 ? TradeResult::LOSS : (outcome_roll < 9 ? TradeResult::WIN : TradeResult::TIE);
        guard.record_outcome(result, now);

        TradeSignal gated_signal = guard.gate(make_rise_signal(now), now);
        EXPECT_LE(gated_signal.observed_consecutive_losses, max_consecutive_losses);
        if (gated_signal.blocked_by_guard) {
            ++blocked_decisions;
            EXPECT_EQ(gated_signal.observed_consecutive_losses, max_consecutive_losses);
        }
    }
    EXPECT_GT(blocked_decisions, 0);
}

TEST(LossStreakGuardTest, ConcurrentOutcomesAreNotLost) {
    LossStreakGuard guard(make_risk_config(1000, 600));
    const int thread_count = 4;
    const int losses_per_thread = 200;

    std::vector<std::thread> outcome_threads;
    for (int thread_index = 0; thread_index < thread_count; ++thread_index) {
        outcome_threads.emplace_back([&guard]() {
            ConfluenceTrader::Logging::set_logging_context(ConfluenceTrader::Testing::get_test_logging_context());
            for (int loss_index = 0; loss_index < losses_per_thread; ++loss_index) {
                guard.record_outcome(TradeResult::LOSS, QUIET_TIME);
            }
        });
    }
    for (auto& outcome_thread : outcome_threads) {
        outcome_thread.join();
    }

    EXPECT_EQ(guard.get_state().consecutive_losses, thread_count * losses_per_thread);
    EXPECT_EQ(guard.get_guard_state(), GuardState::ACTIVE);
}

TEST(LossStreakGuardTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(LossStreakGuard guard(make_risk_config(0, 600)), std::runtime_error);
    EXPECT_THROW(LossStreakGuard guard(make_risk_config(3, -1)), std::runtime_error);
}

} // namespace
