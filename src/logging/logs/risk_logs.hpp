#ifndef RISK_LOGS_HPP
#define RISK_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace ConfluenceTrader {
namespace Logging {

class RiskLogs {
public:
    // Loss-streak guard transitions
    static void log_outcome_recorded(const std::string& result_name, int consecutive_losses, int max_consecutive_losses);
    static void log_cooldown_armed(int consecutive_losses, long long armed_at, long long cooldown_until);
    static void log_hard_stop_armed(int consecutive_losses, long long armed_at);
    static void log_cooldown_expired(long long now);
    static void log_guard_reset();

    // Decisions forced to NONE by the guard
    static void log_decision_blocked(const Core::TradeSignal& signal, const std::string& guard_state_name, int consecutive_losses);

    // Daily and session trading limits
    static void log_trading_limit_reached(const std::string& limit_name, long long now, int daily_trade_count,
                                          double daily_pnl, double session_pnl);

    // Outcome notifications that match no outstanding decision
    static void log_unknown_outcome(unsigned long long decision_id, const std::string& result_name);
};

} // namespace Logging
} // namespace ConfluenceTrader

#endif // RISK_LOGS_HPP
