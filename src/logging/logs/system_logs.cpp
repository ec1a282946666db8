#include "system_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "trader/strategy_analysis/session_filter.hpp"
#include <iomanip>
#include <sstream>

using ConfluenceTrader::Logging::log_message;

namespace {
    std::string format_decimal(double value, int precision) {
        std::ostringstream decimal_stream;
        decimal_stream << std::fixed << std::setprecision(precision) << value;
        return decimal_stream.str();
    }
}

void SystemLogs::log_startup_banner(const std::string& candles_file, const std::string& config_directory, const std::string& run_folder) {
    log_message("================================================================================", "");
    log_message("                     CONFLUENCE TRADER - DECISION ENGINE REPLAY", "");
    log_message("================================================================================", "");
    LOG_STARTUP_SECTION_HEADER("STARTUP");
    LOG_STARTUP_CONTENT("CANDLES: " + candles_file);
    LOG_STARTUP_CONTENT("CONFIG: " + config_directory);
    LOG_STARTUP_CONTENT("RUN FOLDER: " + run_folder);
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_configuration_summary(const ConfluenceTrader::Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("CONFIGURATION");
    TABLE_HEADER_30("Parameter", "Value");
    TABLE_ROW_30("ADX Trend/Range", format_decimal(config.strategy.adx_trend_entry_threshold, 1) + " / " +
                                    format_decimal(config.strategy.adx_range_entry_threshold, 1));
    TABLE_ROW_30("Min Confidence", format_decimal(config.strategy.minimum_confidence, 1));
    TABLE_ROW_30("Min Agreement", std::to_string(config.strategy.minimum_timeframe_agreement) + " of 3");
    TABLE_ROW_30("Loss Streak", std::to_string(config.risk.max_consecutive_losses) + " losses -> " +
                                std::to_string(config.risk.loss_cooldown_seconds) + "s");
    TABLE_ROW_30("Daily Trades/Loss", std::to_string(config.risk.max_daily_trades) + " / " +
                                      format_decimal(config.risk.max_daily_loss_percent, 1) + "%");
    TABLE_ROW_30("Profit Target/Stop", format_decimal(config.risk.max_daily_profit_target, 2) + " / " +
                                       format_decimal(config.risk.max_session_loss, 2));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("High Liquidity", ConfluenceTrader::Core::format_session_windows(config.session.high_liquidity_windows));
    TABLE_ROW_30("Off Peak", ConfluenceTrader::Core::format_session_windows(config.session.off_peak_windows));
    TABLE_ROW_30("Avoid", ConfluenceTrader::Core::format_session_windows(config.session.avoid_windows));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Payout / Stake", format_decimal(config.replay.payout_rate, 2) + " / " + format_decimal(config.replay.stake_amount, 2));
    TABLE_ROW_30("Duration", std::to_string(config.replay.contract_duration_seconds) + "s");
    TABLE_ROW_30("Warmup", std::to_string(config.replay.warmup_candles) + " M1 candles");
    TABLE_ROW_30("Max Trades", config.replay.max_trades > 0 ? std::to_string(config.replay.max_trades) : std::string("unlimited"));
    TABLE_FOOTER_30();
}

void SystemLogs::log_configuration_validated(bool valid, const std::string& error_message) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED - " + error_message, "");
    }
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SHUTDOWN: Signal " + std::to_string(signal_number) + " received - finishing current cycle", "");
}

void SystemLogs::log_shutdown_complete(bool interrupted) {
    log_message(interrupted ? "SHUTDOWN: Replay interrupted, partial results written" : "SHUTDOWN: Replay complete", "");
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}
