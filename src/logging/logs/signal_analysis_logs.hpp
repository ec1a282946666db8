#ifndef SIGNAL_ANALYSIS_LOGS_HPP
#define SIGNAL_ANALYSIS_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace ConfluenceTrader {
namespace Logging {

class SignalAnalysisLogs {
public:
    static void log_score_breakdown(const Core::ScoreResult& score_result, Core::MarketMode market_mode, long long cycle_time, bool include_factors);
    static void log_decision(const Core::TradeSignal& signal);
    static void log_market_mode_change(Core::MarketMode previous_mode, Core::MarketMode current_mode, long long m5_timestamp, double m5_adx);
};

} // namespace Logging
} // namespace ConfluenceTrader

#endif // SIGNAL_ANALYSIS_LOGS_HPP
