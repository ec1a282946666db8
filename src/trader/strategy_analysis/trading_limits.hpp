#ifndef TRADING_LIMITS_HPP
#define TRADING_LIMITS_HPP

#include "configs/risk_config.hpp"
#include <string>

namespace ConfluenceTrader {
namespace Core {

/**
 * Capital-protection limits checked before an entry: daily entry count, daily loss as a percent of
 * the session start balance, daily profit target and the session loss stop. Daily counters roll over
 * at 00:00 UTC of the time passed in. A zero limit is disabled.
 */
class TradingLimits {
public:
    TradingLimits(const RiskConfig& risk_config, double session_start_balance);

    void record_entry(long long entry_time);
    void record_settlement(double pnl, long long settled_at);

    // Empty when an entry is allowed at `now`, otherwise the name of the first limit reached.
    std::string get_block_reason(long long now);

    int get_daily_trade_count() const { return daily_trade_count; }
    double get_daily_pnl() const { return daily_pnl; }
    double get_session_pnl() const { return session_pnl; }

private:
    const RiskConfig& config;
    double session_start_balance;
    long long current_day_start;
    int daily_trade_count;
    double daily_pnl;
    double session_pnl;
    std::string last_reported_reason;

    void roll_to_day(long long now);
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // TRADING_LIMITS_HPP
