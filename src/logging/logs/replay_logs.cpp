#include "replay_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "trader/replay/replay_statistics.hpp"
#include "utils/time_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ConfluenceTrader {
namespace Logging {

namespace {
    std::string format_decimal(double value, int precision) {
        if (std::isinf(value)) {
            return "inf";
        }
        std::ostringstream decimal_stream;
        decimal_stream << std::fixed << std::setprecision(precision) << value;
        return decimal_stream.str();
    }
}

void ReplayLogs::log_replay_start(size_t candle_count, const std::string& source_path, long long first_timestamp, long long last_timestamp) {
    LOG_REPLAY_RUN_HEADER(candle_count, source_path);
    if (candle_count > 0) {
        LOG_STARTUP_CONTENT("FIRST CANDLE: " + TimeUtils::format_epoch_seconds_iso(first_timestamp));
        LOG_STARTUP_CONTENT("LAST CANDLE: " + TimeUtils::format_epoch_seconds_iso(last_timestamp));
    }
}

void ReplayLogs::log_progress(size_t candles_processed, size_t candles_total, long long cycle_time, double running_balance, size_t trades_settled) {
    double percent_complete = candles_total > 0 ? 100.0 * static_cast<double>(candles_processed) / static_cast<double>(candles_total) : 100.0;
    log_message("REPLAY: " + std::to_string(candles_processed) + "/" + std::to_string(candles_total) +
                " (" + format_decimal(percent_complete, 1) + "%) at " + TimeUtils::format_epoch_seconds_iso(cycle_time) +
                " - balance " + format_decimal(running_balance, 2) + ", trades " + std::to_string(trades_settled), "");
}

void ReplayLogs::log_trade_opened(const Core::TradeSignal& signal, long long expiry_time) {
    log_message("TRADE: #" + std::to_string(signal.decision_id) + " " + Core::trade_side_to_string(signal.side) +
                " @ " + format_decimal(signal.price, 5) + " conf " + format_decimal(signal.confidence, 1) +
                " (" + Core::market_mode_to_string(signal.market_mode) + ") expires " +
                TimeUtils::format_epoch_seconds_iso(expiry_time), "");
}

void ReplayLogs::log_trade_settled(const Core::SettledTrade& settled_trade) {
    LOG_TRADE_SETTLEMENT_HEADER();
    LOG_CONTENT("DECISION: #" + std::to_string(settled_trade.decision_id) + " " + Core::trade_side_to_string(settled_trade.side));
    LOG_CONTENT("ENTRY: " + format_decimal(settled_trade.entry_price, 5) + " at " + TimeUtils::format_epoch_seconds_iso(settled_trade.entry_time));
    LOG_CONTENT("EXIT: " + format_decimal(settled_trade.exit_price, 5) + " at " + TimeUtils::format_epoch_seconds_iso(settled_trade.exit_time));
    LOG_CONTENT("RESULT: " + Core::trade_result_to_string(settled_trade.result) + " pnl " + format_decimal(settled_trade.pnl, 2) +
                " balance " + format_decimal(settled_trade.balance_after, 2));
    LOG_SUBCONTENT("MAE " + format_decimal(settled_trade.max_adverse_excursion, 5) + " / MFE " + format_decimal(settled_trade.max_favorable_excursion, 5));
    LOG_SECTION_FOOTER();
}

void ReplayLogs::log_unsettled_trade(const Core::TradeSignal& signal, long long expiry_time) {
    log_message("WARNING: Decision #" + std::to_string(signal.decision_id) + " still open at end of data (expiry " +
                TimeUtils::format_epoch_seconds_iso(expiry_time) + ") - excluded from statistics", "");
}

void ReplayLogs::log_max_trades_reached(int trades_opened, long long cycle_time) {
    log_message("REPLAY: Maximum of " + std::to_string(trades_opened) + " trades reached and settled - stopping at " +
                TimeUtils::format_epoch_seconds_iso(cycle_time), "");
}

void ReplayLogs::log_replay_interrupted(long long candle_timestamp, size_t candles_processed) {
    log_message("REPLAY: Stop requested - interrupted before " + TimeUtils::format_epoch_seconds_iso(candle_timestamp) +
                " after " + std::to_string(candles_processed) + " candles", "");
}

void ReplayLogs::log_summary_table(const Core::ReplayStatistics& statistics) {
    LOG_STARTUP_SECTION_HEADER("REPLAY SUMMARY");
    TABLE_HEADER_30("Metric", "Value");
    TABLE_ROW_30("Cycles", std::to_string(statistics.cycles_evaluated));
    TABLE_ROW_30("Rise / Fall", std::to_string(statistics.rise_signals) + " / " + std::to_string(statistics.fall_signals));
    TABLE_ROW_30("None", std::to_string(statistics.none_signals));
    TABLE_ROW_30("Guard Blocked", std::to_string(statistics.guard_blocked_signals));
    for (const auto& mode_entry : statistics.market_mode_distribution) {
        TABLE_ROW_30("Mode " + mode_entry.first, std::to_string(mode_entry.second));
    }
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Trades", std::to_string(statistics.trades_settled) + " (+" + std::to_string(statistics.trades_unsettled) + " open)");
    TABLE_ROW_30("W / L / T", std::to_string(statistics.wins) + " / " + std::to_string(statistics.losses) + " / " + std::to_string(statistics.ties));
    TABLE_ROW_30("Win Rate", format_decimal(statistics.win_rate * 100.0, 2) + "%");
    TABLE_ROW_30("Profit Factor", format_decimal(statistics.profit_factor, 3));
    TABLE_ROW_30("Expectancy", format_decimal(statistics.expectancy, 4));
    TABLE_ROW_30("Max Loss Streak", std::to_string(statistics.max_consecutive_losses));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Total PnL", format_decimal(statistics.total_pnl, 2));
    TABLE_ROW_30("Final Balance", format_decimal(statistics.final_balance, 2));
    TABLE_ROW_30("Max Drawdown", format_decimal(statistics.max_drawdown_percent, 2) + "%");
    TABLE_ROW_30("Avg MAE / MFE", format_decimal(statistics.average_mae, 5) + " / " + format_decimal(statistics.average_mfe, 5));
    TABLE_FOOTER_30();
}

void ReplayLogs::log_output_files(const std::string& decision_file, const std::string& trade_file, const std::string& summary_file) {
    LOG_STARTUP_SECTION_HEADER("OUTPUT FILES");
    LOG_STARTUP_CONTENT("DECISIONS: " + decision_file);
    LOG_STARTUP_CONTENT("TRADES: " + trade_file);
    LOG_STARTUP_CONTENT("SUMMARY: " + summary_file);
}

} // namespace Logging
} // namespace ConfluenceTrader
