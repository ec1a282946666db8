#ifndef CSV_DECISION_LOGGER_HPP
#define CSV_DECISION_LOGGER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <fstream>
#include <optional>
#include <string>
#include <mutex>

namespace ConfluenceTrader {
namespace Logging {

/**
 * CSV logger for replay output.
 * decisions file: one row per evaluated cycle in chronological order.
 * trades file: one row per settled contract.
 * Rows hold only engine data (no wall-clock fields) so identical runs produce identical files.
 */
class CSVDecisionLogger {
private:
    std::string decision_file_path;
    std::string trade_file_path;
    std::ofstream decision_stream;
    std::ofstream trade_stream;
    std::mutex file_mutex;

    void write_headers();

public:
    CSVDecisionLogger(const std::string& decision_log_path, const std::string& trade_log_path);
    ~CSVDecisionLogger();

    CSVDecisionLogger() = delete;
    CSVDecisionLogger(const CSVDecisionLogger&) = delete;
    CSVDecisionLogger& operator=(const CSVDecisionLogger&) = delete;

    // settled_trade is the contract settled at the start of the same cycle, if any
    void log_decision(const Core::TradeSignal& signal, bool executed, const std::string& skip_reason,
                      const std::optional<Core::SettledTrade>& settled_trade, double running_balance);
    void log_trade(const Core::SettledTrade& settled_trade);
    void flush();

    const std::string& get_decision_file_path() const { return decision_file_path; }
    const std::string& get_trade_file_path() const { return trade_file_path; }
};

// "a|b|c" quoted for CSV
std::string format_factor_field(const std::vector<std::string>& factors);

} // namespace Logging
} // namespace ConfluenceTrader

#endif // CSV_DECISION_LOGGER_HPP
