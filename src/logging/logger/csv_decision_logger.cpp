#include "csv_decision_logger.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <stdexcept>

namespace ConfluenceTrader {
namespace Logging {

CSVDecisionLogger::CSVDecisionLogger(const std::string& decision_log_path, const std::string& trade_log_path)
    : decision_file_path(decision_log_path), trade_file_path(trade_log_path) {
    decision_stream.open(decision_file_path, std::ios::out | std::ios::trunc);
    if (!decision_stream.is_open()) {
        throw std::runtime_error("Failed to open CSV decision log file: " + decision_file_path);
    }
    trade_stream.open(trade_file_path, std::ios::out | std::ios::trunc);
    if (!trade_stream.is_open()) {
        throw std::runtime_error("Failed to open CSV trade log file: " + trade_file_path);
    }

    write_headers();
}

CSVDecisionLogger::~CSVDecisionLogger() {
    if (decision_stream.is_open()) {
        decision_stream.close();
    }
    if (trade_stream.is_open()) {
        trade_stream.close();
    }
}

void CSVDecisionLogger::write_headers() {
    decision_stream << "cycle_time,decision_id,market_mode,side,confidence,agree_count,m1,m5,m15,price,"
                       "guard_blocked,consecutive_losses,executed,skip_reason,settled_decision_id,settled_result,balance,factors\n";
    trade_stream << "decision_id,side,market_mode,confidence,entry_time,entry_price,expiry_time,exit_time,"
                    "exit_price,result,stake,pnl,balance,mae,mfe\n";
}

std::string format_factor_field(const std::vector<std::string>& factors) {
    std::string joined_factors;
    for (size_t factor_index = 0; factor_index < factors.size(); ++factor_index) {
        if (factor_index > 0) {
            joined_factors += "|";
        }
        joined_factors += factors[factor_index];
    }

    std::string quoted_field = "\"";
    for (char factor_character : joined_factors) {
        if (factor_character == '"') {
            quoted_field += "\"\"";
        } else {
            quoted_field += factor_character;
        }
    }
    quoted_field += "\"";
    return quoted_field;
}

void CSVDecisionLogger::log_decision(const Core::TradeSignal& signal, bool executed, const std::string& skip_reason,
                                     const std::optional<Core::SettledTrade>& settled_trade, double running_balance) {
    std::lock_guard<std::mutex> lock(file_mutex);

    decision_stream << TimeUtils::format_epoch_seconds_iso(signal.timestamp) << ","
                    << signal.decision_id << ","
                    << Core::market_mode_to_string(signal.market_mode) << ","
                    << Core::trade_side_to_string(signal.side) << ","
                    << std::fixed << std::setprecision(2) << signal.confidence << ","
                    << signal.confirmations.agree_count() << ","
                    << (signal.confirmations.m1_confirmed ? 1 : 0) << ","
                    << (signal.confirmations.m5_confirmed ? 1 : 0) << ","
                    << (signal.confirmations.m15_confirmed ? 1 : 0) << ","
                    << std::setprecision(5) << signal.price << ","
                    << (signal.blocked_by_guard ? 1 : 0) << ","
                    << signal.observed_consecutive_losses << ","
                    << (executed ? 1 : 0) << ","
                    << skip_reason << ",";
    if (settled_trade) {
        decision_stream << settled_trade->decision_id << "," << Core::trade_result_to_string(settled_trade->result) << ",";
    } else {
        decision_stream << ",,";
    }
    decision_stream << std::setprecision(2) << running_balance << ","
                    << format_factor_field(signal.factors) << "\n";
}

void CSVDecisionLogger::log_trade(const Core::SettledTrade& settled_trade) {
    std::lock_guard<std::mutex> lock(file_mutex);

    trade_stream << settled_trade.decision_id << ","
                 << Core::trade_side_to_string(settled_trade.side) << ","
                 << Core::market_mode_to_string(settled_trade.market_mode) << ","
                 << std::fixed << std::setprecision(2) << settled_trade.confidence << ","
                 << TimeUtils::format_epoch_seconds_iso(settled_trade.entry_time) << ","
                 << std::setprecision(5) << settled_trade.entry_price << ","
                 << TimeUtils::format_epoch_seconds_iso(settled_trade.expiry_time) << ","
                 << TimeUtils::format_epoch_seconds_iso(settled_trade.exit_time) << ","
                 << settled_trade.exit_price << ","
                 << Core::trade_result_to_string(settled_trade.result) << ","
                 << std::setprecision(2) << settled_trade.stake << ","
                 << settled_trade.pnl << ","
                 << settled_trade.balance_after << ","
                 << std::setprecision(5) << settled_trade.max_adverse_excursion << ","
                 << settled_trade.max_favorable_excursion << "\n";
}

void CSVDecisionLogger::flush() {
    std::lock_guard<std::mutex> lock(file_mutex);
    decision_stream.flush();
    trade_stream.flush();
}

} // namespace Logging
} // namespace ConfluenceTrader
