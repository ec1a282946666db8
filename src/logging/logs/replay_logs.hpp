#ifndef REPLAY_LOGS_HPP
#define REPLAY_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace ConfluenceTrader {
namespace Core {
struct ReplayStatistics;
}

namespace Logging {

/**
 * Console reporting for historical replay runs.
 */
class ReplayLogs {
public:
    static void log_replay_start(size_t candle_count, const std::string& source_path, long long first_timestamp, long long last_timestamp);
    static void log_progress(size_t candles_processed, size_t candles_total, long long cycle_time, double running_balance, size_t trades_settled);

    // Contract lifecycle
    static void log_trade_opened(const Core::TradeSignal& signal, long long expiry_time);
    static void log_trade_settled(const Core::SettledTrade& settled_trade);
    static void log_unsettled_trade(const Core::TradeSignal& signal, long long expiry_time);

    // Early termination
    static void log_max_trades_reached(int trades_opened, long long cycle_time);
    static void log_replay_interrupted(long long candle_timestamp, size_t candles_processed);

    static void log_summary_table(const Core::ReplayStatistics& statistics);
    static void log_output_files(const std::string& decision_file, const std::string& trade_file, const std::string& summary_file);
};

} // namespace Logging
} // namespace ConfluenceTrader

#endif // REPLAY_LOGS_HPP
