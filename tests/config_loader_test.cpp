#include "test_helpers.hpp"
#include "trader/config_loader/config_loader.hpp"
#include <gtest/gtest.h>
#include <fstream>

using ConfluenceTrader::Config::SystemConfig;
using namespace ConfluenceTrader::Testing;

namespace {

std::string write_config_file(const std::string& directory, const std::string& file_name, const std::string& file_contents) {
    std::string file_path = directory + "/" + file_name;
    std::ofstream config_file(file_path, std::ios::trunc);
    config_file << file_contents;
    return file_path;
}

TEST(ConfigLoaderTest, ShippedConfigurationLoadsAndValidates) {
    SystemConfig system_config;
    ASSERT_EQ(load_system_config(system_config, std::string(CONFLUENCE_TRADER_SOURCE_DIR) + "/config"), 0);

    EXPECT_DOUBLE_EQ(system_config.strategy.adx_trend_entry_threshold, 27.0);
    EXPECT_DOUBLE_EQ(system_config.strategy.adx_range_entry_threshold, 18.0);
    EXPECT_EQ(system_config.risk.max_consecutive_losses, 3);
    EXPECT_EQ(system_config.risk.loss_cooldown_seconds, 600);
    EXPECT_EQ(system_config.risk.max_daily_trades, 1000);
    EXPECT_DOUBLE_EQ(system_config.risk.max_daily_loss_percent, 10.0);
    EXPECT_DOUBLE_EQ(system_config.risk.max_daily_profit_target, 200.0);
    EXPECT_DOUBLE_EQ(system_config.risk.max_session_loss, 100.0);
    ASSERT_EQ(system_config.session.high_liquidity_windows.size(), 2u);
    EXPECT_EQ(system_config.session.high_liquidity_windows[1].start_minute_of_day, 13 * 60);
    ASSERT_EQ(system_config.session.avoid_windows.size(), 1u);
    EXPECT_EQ(system_config.session.avoid_windows[0].end_minute_of_day, 5);
    EXPECT_EQ(system_config.logging.decision_log_file, "decisions.csv");
}

TEST(ConfigLoaderTest, OverridesApplyAndCommentsAreSkipped) {
    std::string config_directory = make_temporary_directory("config_overrides");
    std::string file_path = write_config_file(config_directory, "overrides.csv",
        "# guard\n"
        "risk.max_consecutive_losses, 5\n"
        "risk.loss_cooldown_seconds,0\n"
        "logging.log_every_decision,yes\n"
        "session.avoid_windows,\n");

    SystemConfig system_config;
    ASSERT_TRUE(load_config_from_csv(system_config, file_path));
    EXPECT_EQ(system_config.risk.max_consecutive_losses, 5);
    EXPECT_EQ(system_config.risk.loss_cooldown_seconds, 0);
    EXPECT_TRUE(system_config.logging.log_every_decision);
    EXPECT_TRUE(system_config.session.avoid_windows.empty());
}

TEST(ConfigLoaderTest, UnknownKeysAndBadValuesThrow) {
    std::string config_directory = make_temporary_directory("config_errors");
    SystemConfig system_config;

    EXPECT_THROW(load_config_from_csv(system_config, write_config_file(config_directory, "unknown.csv", "strategy.mystery_points,5\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config_from_csv(system_config, write_config_file(config_directory, "number.csv", "risk.max_consecutive_losses,three\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config_from_csv(system_config, write_config_file(config_directory, "bool.csv", "logging.log_every_decision,maybe\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config_from_csv(system_config, write_config_file(config_directory, "window.csv", "session.avoid_windows,23:55\n")),
                 std::runtime_error);
    EXPECT_FALSE(load_config_from_csv(system_config, config_directory + "/missing.csv"));
}

TEST(ConfigLoaderTest, MissingConfigDirectoryFails) {
    SystemConfig system_config;
    EXPECT_EQ(load_system_config(system_config, make_temporary_directory("config_empty")), 1);
}

TEST(ConfigValidationTest, DefaultsAreValid) {
    SystemConfig system_config;
    std::string validation_error;
    EXPECT_TRUE(validate_config(system_config, validation_error)) << validation_error;
}

TEST(ConfigValidationTest, RejectsInconsistentSettings) {
    std::string validation_error;

    SystemConfig inverted_thresholds;
    inverted_thresholds.strategy.adx_range_entry_threshold = 30.0;
    EXPECT_FALSE(validate_config(inverted_thresholds, validation_error));
    EXPECT_NE(validation_error.find("adx_range_entry_threshold"), std::string::npos);

    SystemConfig weak_avoid_penalty;
    weak_avoid_penalty.session.avoid_window_penalty_points = 50.0;
    EXPECT_FALSE(validate_config(weak_avoid_penalty, validation_error));

    SystemConfig odd_duration;
    odd_duration.replay.contract_duration_seconds = 90;
    EXPECT_FALSE(validate_config(odd_duration, validation_error));

    SystemConfig short_history;
    short_history.indicators.maximum_bars = 30;
    EXPECT_FALSE(validate_config(short_history, validation_error));

    SystemConfig no_guard;
    no_guard.risk.max_consecutive_losses = 0;
    EXPECT_FALSE(validate_config(no_guard, validation_error));

    SystemConfig negative_daily_trades;
    negative_daily_trades.risk.max_daily_trades = -1;
    EXPECT_FALSE(validate_config(negative_daily_trades, validation_error));
    EXPECT_NE(validation_error.find("risk.max_daily_trades"), std::string::npos);

    SystemConfig excessive_daily_loss;
    excessive_daily_loss.risk.max_daily_loss_percent = 150.0;
    EXPECT_FALSE(validate_config(excessive_daily_loss, validation_error));

    SystemConfig negative_session_loss;
    negative_session_loss.risk.max_session_loss = -5.0;
    EXPECT_FALSE(validate_config(negative_session_loss, validation_error));

    SystemConfig loose_tier1;
    loose_tier1.strategy.tier1_rsi_limit = 40.0;
    EXPECT_FALSE(validate_config(loose_tier1, validation_error));

    SystemConfig too_many_timeframes;
    too_many_timeframes.strategy.minimum_timeframe_agreement = 4;
    EXPECT_FALSE(validate_config(too_many_timeframes, validation_error));
}

} // namespace
