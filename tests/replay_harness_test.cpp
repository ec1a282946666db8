#include "test_helpers.hpp"
#include "trader/market_data/candle_file_reader.hpp"
#include "trader/replay/replay_harness.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <sstream>
#include <utility>

using namespace ConfluenceTrader::Core;
using namespace ConfluenceTrader::Testing;
using ConfluenceTrader::Config::SystemConfig;
using ConfluenceTrader::Logging::CSVDecisionLogger;

namespace {

constexpr size_t REPLAY_CANDLE_COUNT = 1500;

class ReplayHarnessTest : public ::testing::Test {
protected:
    SystemConfig system_config;
    std::vector<Candle> candles = make_random_walk_candles(REPLAY_CANDLE_COUNT, DAY_START, 42);

    void SetUp() override {
        system_config.replay.progress_log_interval_candles = 0;
        system_config.replay.max_trades = 0;
    }

    // Low decision thresholds so the random walk produces executed trades
    void use_permissive_thresholds() {
        system_config.strategy.minimum_confidence = 0.0;
        system_config.strategy.minimum_timeframe_agreement = 1;
    }

    void disable_trading_limits() {
        system_config.risk.max_daily_trades = 0;
        system_config.risk.max_daily_loss_percent = 0.0;
        system_config.risk.max_daily_profit_target = 0.0;
        system_config.risk.max_session_loss = 0.0;
    }

    // Sum of pnl settled at or before `now`, optionally restricted to the UTC day of `now`
    static double settled_pnl_before(const ReplayResult& replay_result, long long now, bool same_day_only) {
        double pnl_total = 0.0;
        for (const auto& settled_trade : replay_result.settled_trades) {
            if (settled_trade.expiry_time > now) {
                continue;
            }
            if (same_day_only && settled_trade.expiry_time / 86400 != now / 86400) {
                continue;
            }
            pnl_total += settled_trade.pnl;
        }
        return pnl_total;
    }

    static bool has_skip_reason(const ReplayResult& replay_result, const std::string& skip_reason) {
        return std::any_of(replay_result.records.begin(), replay_result.records.end(),
                           [&skip_reason](const ReplayRecord& replay_record) { return replay_record.skip_reason == skip_reason; });
    }

    static size_t count_executed(const ReplayResult& replay_result) {
        return static_cast<size_t>(std::count_if(replay_result.records.begin(), replay_result.records.end(),
                                                 [](const ReplayRecord& replay_record) { return replay_record.executed; }));
    }
};

TEST_F(ReplayHarnessTest, IdenticalRunsWriteIdenticalDecisionLogs) {
    use_permissive_thresholds();
    std::string first_directory = make_temporary_directory("replay_first");
    std::string second_directory = make_temporary_directory("replay_second");

    ReplayResult first_result;
    ReplayResult second_result;
    {
        auto first_logger = std::make_shared<CSVDecisionLogger>(first_directory + "/decisions.csv", first_directory + "/trades.csv");
        auto second_logger = std::make_shared<CSVDecisionLogger>(second_directory + "/decisions.csv", second_directory + "/trades.csv");
        first_result = ReplayHarness(system_config, first_logger).run(candles);
        second_result = ReplayHarness(system_config, second_logger).run(candles);
    }

    std::string first_decisions = read_file_contents(first_directory + "/decisions.csv");
    EXPECT_FALSE(first_decisions.empty());
    EXPECT_EQ(first_decisions, read_file_contents(second_directory + "/decisions.csv"));
    EXPECT_EQ(read_file_contents(first_directory + "/trades.csv"), read_file_contents(second_directory + "/trades.csv"));
    EXPECT_EQ(first_result.records.size(), second_result.records.size());
    EXPECT_EQ(first_result.settled_trades.size(), second_result.settled_trades.size());
    EXPECT_DOUBLE_EQ(first_result.statistics.final_balance, second_result.statistics.final_balance);
}

TEST_F(ReplayHarnessTest, DecisionLogNamesTradeSettledInEachCycle) {
    use_permissive_thresholds();
    std::string output_directory = make_temporary_directory("replay_settled_columns");
    ReplayResult replay_result;
    {
        auto decision_logger = std::make_shared<CSVDecisionLogger>(output_directory + "/decisions.csv", output_directory + "/trades.csv");
        replay_result = ReplayHarness(system_config, decision_logger).run(candles);
    }
    ASSERT_FALSE(replay_result.settled_trades.empty());

    std::istringstream decision_lines(read_file_contents(output_directory + "/decisions.csv"));
    std::string decision_line;
    ASSERT_TRUE(std::getline(decision_lines, decision_line));
    EXPECT_NE(decision_line.find("skip_reason,settled_decision_id,settled_result,balance"), std::string::npos);

    // Columns before the quoted factor field never contain commas
    std::vector<std::pair<std::string, std::string>> settled_columns;
    while (std::getline(decision_lines, decision_line)) {
        std::istringstream field_stream(decision_line);
        std::vector<std::string> fields;
        std::string field;
        while (fields.size() < 16 && std::getline(field_stream, field, ',')) {
            fields.push_back(field);
        }
        ASSERT_EQ(fields.size(), 16u) << decision_line;
        if (!fields[14].empty()) {
            settled_columns.emplace_back(fields[14], fields[15]);
        }
    }

    ASSERT_EQ(settled_columns.size(), replay_result.settled_trades.size());
    for (size_t trade_index = 0; trade_index < settled_columns.size(); ++trade_index) {
        const SettledTrade& settled_trade = replay_result.settled_trades[trade_index];
        EXPECT_EQ(settled_columns[trade_index].first, std::to_string(settled_trade.decision_id));
        EXPECT_EQ(settled_columns[trade_index].second, trade_result_to_string(settled_trade.result));
    }
}

TEST_F(ReplayHarnessTest, EvaluationStartsAfterWarmup) {
    system_config.replay.warmup_candles = 250;
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    EXPECT_EQ(replay_result.candles_processed, REPLAY_CANDLE_COUNT);
    ASSERT_EQ(replay_result.records.size(), REPLAY_CANDLE_COUNT - 250 + 1);
    EXPECT_EQ(replay_result.records.front().signal.timestamp, candles[249].timestamp + 60);
    EXPECT_EQ(replay_result.statistics.cycles_evaluated, replay_result.records.size());
    for (size_t record_index = 1; record_index < replay_result.records.size(); ++record_index) {
        EXPECT_GT(replay_result.records[record_index].signal.decision_id, replay_result.records[record_index - 1].signal.decision_id);
    }
}

TEST_F(ReplayHarnessTest, AtMostOneContractOpenAtATime) {
    use_permissive_thresholds();
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    ASSERT_GT(replay_result.settled_trades.size(), 1u);
    for (size_t trade_index = 1; trade_index < replay_result.settled_trades.size(); ++trade_index) {
        EXPECT_GE(replay_result.settled_trades[trade_index].entry_time, replay_result.settled_trades[trade_index - 1].expiry_time);
    }
    EXPECT_EQ(count_executed(replay_result), replay_result.settled_trades.size() + replay_result.unsettled_trades.size());

    for (const auto& replay_record : replay_result.records) {
        if (replay_record.signal.side == TradeSide::NONE) {
            EXPECT_FALSE(replay_record.executed);
            EXPECT_TRUE(replay_record.skip_reason.empty());
        }
    }
}

TEST_F(ReplayHarnessTest, SettledTradesFollowContractRules) {
    use_permissive_thresholds();
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);
    ASSERT_FALSE(replay_result.settled_trades.empty());

    double balance = system_config.replay.initial_balance;
    for (const auto& settled_trade : replay_result.settled_trades) {
        EXPECT_EQ(settled_trade.expiry_time - settled_trade.entry_time, system_config.replay.contract_duration_seconds);
        EXPECT_LE(settled_trade.exit_time, settled_trade.expiry_time);
        EXPECT_EQ(settled_trade.result, determine_trade_result(settled_trade.side, settled_trade.entry_price, settled_trade.exit_price));
        balance += settled_trade.pnl;
        EXPECT_NEAR(settled_trade.balance_after, balance, 1e-9);
        EXPECT_GE(settled_trade.max_adverse_excursion, 0.0);
        EXPECT_GE(settled_trade.max_favorable_excursion, 0.0);
    }

    const ReplayStatistics& statistics = replay_result.statistics;
    EXPECT_EQ(statistics.wins + statistics.losses + statistics.ties, statistics.trades_settled);
    EXPECT_NEAR(statistics.final_balance, statistics.initial_balance + statistics.total_pnl, 1e-9);
    EXPECT_LE(statistics.max_consecutive_losses, static_cast<int>(statistics.losses));
}

TEST_F(ReplayHarnessTest, GuardBlocksNeverExceedConfiguredStreak) {
    use_permissive_thresholds();
    system_config.risk.max_consecutive_losses = 2;
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    for (const auto& replay_record : replay_result.records) {
        EXPECT_LE(replay_record.signal.observed_consecutive_losses, 2);
        if (replay_record.signal.blocked_by_guard) {
            EXPECT_EQ(replay_record.signal.observed_consecutive_losses, 2);
            EXPECT_FALSE(replay_record.executed);
        }
    }
}

TEST_F(ReplayHarnessTest, MaxTradesStopsTheRun) {
    use_permissive_thresholds();
    system_config.replay.max_trades = 2;
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    EXPECT_EQ(count_executed(replay_result), 2u);
    EXPECT_TRUE(replay_result.unsettled_trades.empty());
    EXPECT_EQ(replay_result.candles_processed, 910u);
    EXPECT_LT(replay_result.candles_processed, REPLAY_CANDLE_COUNT);
}

TEST_F(ReplayHarnessTest, DailyTradeLimitCapsEntriesPerUtcDay) {
    use_permissive_thresholds();
    disable_trading_limits();
    system_config.risk.max_daily_trades = 3;
    // 06:00 start puts evaluation on both sides of 00:00 UTC
    candles = make_random_walk_candles(REPLAY_CANDLE_COUNT, DAY_START + 6 * 3600, 42);
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    std::map<long long, int> entries_per_day;
    for (const auto& replay_record : replay_result.records) {
        if (replay_record.executed) {
            entries_per_day[replay_record.signal.timestamp / 86400]++;
        }
    }
    ASSERT_EQ(entries_per_day.size(), 2u);
    EXPECT_EQ(entries_per_day.begin()->second, 3);
    EXPECT_GE(entries_per_day.rbegin()->second, 1);
    EXPECT_LE(entries_per_day.rbegin()->second, 3);
    EXPECT_TRUE(has_skip_reason(replay_result, "daily trade limit"));
}

TEST_F(ReplayHarnessTest, DailyLossLimitStopsEntriesForTheDay) {
    use_permissive_thresholds();
    disable_trading_limits();
    system_config.risk.max_daily_loss_percent = 1.0;
    const double daily_loss_limit = system_config.replay.initial_balance * 0.01;
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    for (const auto& replay_record : replay_result.records) {
        double daily_pnl = settled_pnl_before(replay_result, replay_record.signal.timestamp, true);
        if (replay_record.executed) {
            EXPECT_GE(daily_pnl, -daily_loss_limit);
        }
        if (replay_record.skip_reason == "daily loss limit") {
            EXPECT_LT(daily_pnl, -daily_loss_limit);
        }
    }
    EXPECT_TRUE(has_skip_reason(replay_result, "daily loss limit"));
}

TEST_F(ReplayHarnessTest, DailyProfitTargetStopsEntriesForTheDay) {
    use_permissive_thresholds();
    disable_trading_limits();
    system_config.risk.max_daily_profit_target = 5.0;
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    for (const auto& replay_record : replay_result.records) {
        double daily_pnl = settled_pnl_before(replay_result, replay_record.signal.timestamp, true);
        if (replay_record.executed) {
            EXPECT_LT(daily_pnl, 5.0);
        }
        if (replay_record.skip_reason == "daily profit target") {
            EXPECT_GE(daily_pnl, 5.0);
        }
    }
    EXPECT_TRUE(has_skip_reason(replay_result, "daily profit target"));
}

TEST_F(ReplayHarnessTest, SessionLossLimitStopsEntriesForTheRun) {
    use_permissive_thresholds();
    disable_trading_limits();
    system_config.risk.max_session_loss = 20.0;
    ReplayResult replay_result = ReplayHarness(system_config).run(candles);

    for (const auto& replay_record : replay_result.records) {
        double session_pnl = settled_pnl_before(replay_result, replay_record.signal.timestamp, false);
        if (replay_record.executed) {
            EXPECT_GT(session_pnl, -20.0);
        }
        if (replay_record.skip_reason == "session loss limit") {
            EXPECT_LE(session_pnl, -20.0);
        }
    }
    EXPECT_TRUE(has_skip_reason(replay_result, "session loss limit"));
}

TEST_F(ReplayHarnessTest, DuplicateTimestampFailsBeforeAnyCycle) {
    candles[700].timestamp = candles[699].timestamp;
    std::string output_directory = make_temporary_directory("replay_duplicate");
    {
        auto decision_logger = std::make_shared<CSVDecisionLogger>(output_directory + "/decisions.csv", output_directory + "/trades.csv");
        ReplayHarness replay_harness(system_config, decision_logger);
        EXPECT_THROW(replay_harness.run(candles), ReplayInputError);
    }

    std::string decision_contents = read_file_contents(output_directory + "/decisions.csv");
    EXPECT_EQ(std::count(decision_contents.begin(), decision_contents.end(), '\n'), 1);
}

TEST_F(ReplayHarnessTest, StopRequestInterruptsRun) {
    std::atomic<bool> stop_requested(true);
    ReplayResult replay_result = ReplayHarness(system_config).run(candles, &stop_requested);
    EXPECT_TRUE(replay_result.interrupted);
    EXPECT_EQ(replay_result.candles_processed, 0u);
    EXPECT_TRUE(replay_result.records.empty());
}

TEST(TradeResultTest, DirectionalSettlement) {
    EXPECT_EQ(determine_trade_result(TradeSide::RISE, 1.1000, 1.1001), TradeResult::WIN);
    EXPECT_EQ(determine_trade_result(TradeSide::RISE, 1.1000, 1.0999), TradeResult::LOSS);
    EXPECT_EQ(determine_trade_result(TradeSide::FALL, 1.1000, 1.0999), TradeResult::WIN);
    EXPECT_EQ(determine_trade_result(TradeSide::FALL, 1.1000, 1.1001), TradeResult::LOSS);
    EXPECT_EQ(determine_trade_result(TradeSide::FALL, 1.1000, 1.1000), TradeResult::TIE);
    EXPECT_THROW(determine_trade_result(TradeSide::NONE, 1.1000, 1.1001), std::runtime_error);
}

TEST(ReplayStatisticsTest, ProfitFactorWithoutLossesIsNullInJson) {
    SettledTrade winning_trade;
    winning_trade.side = TradeSide::RISE;
    winning_trade.result = TradeResult::WIN;
    winning_trade.stake = 10.0;
    winning_trade.pnl = 9.5;
    winning_trade.balance_after = 1009.5;

    ReplayStatistics statistics = compute_replay_statistics({}, {winning_trade}, 1, 1000.0);
    EXPECT_EQ(statistics.wins, 1u);
    EXPECT_EQ(statistics.trades_unsettled, 1u);
    EXPECT_DOUBLE_EQ(statistics.win_rate, 1.0);
    EXPECT_TRUE(std::isinf(statistics.profit_factor));
    EXPECT_DOUBLE_EQ(statistics.final_balance, 1009.5);

    nlohmann::json statistics_json = replay_statistics_to_json(statistics);
    EXPECT_TRUE(statistics_json["profit_factor"].is_null());
    EXPECT_EQ(statistics_json["trades"]["wins"].get<size_t>(), 1u);
}

} // namespace
