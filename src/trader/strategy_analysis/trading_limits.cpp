#include "trading_limits.hpp"
#include "logging/logs/risk_logs.hpp"
#include "utils/time_utils.hpp"
#include <cmath>
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

using ConfluenceTrader::Logging::RiskLogs;

TradingLimits::TradingLimits(const RiskConfig& risk_config, double session_start_balance_value)
    : config(risk_config), session_start_balance(session_start_balance_value), current_day_start(0),
      daily_trade_count(0), daily_pnl(0.0), session_pnl(0.0), last_reported_reason() {
    if (session_start_balance <= 0.0 || !std::isfinite(session_start_balance)) {
        throw std::runtime_error("Invalid session start balance for trading limits: " + std::to_string(session_start_balance));
    }
}

void TradingLimits::roll_to_day(long long now) {
    long long day_start = TimeUtils::floor_to_interval(now, TimeUtils::SECONDS_PER_DAY);
    if (day_start == current_day_start) {
        return;
    }
    current_day_start = day_start;
    daily_trade_count = 0;
    daily_pnl = 0.0;
    last_reported_reason.clear();
}

void TradingLimits::record_entry(long long entry_time) {
    roll_to_day(entry_time);
    daily_trade_count++;
}

void TradingLimits::record_settlement(double pnl, long long settled_at) {
    if (!std::isfinite(pnl)) {
        throw std::runtime_error("Invalid settlement pnl for trading limits: " + std::to_string(pnl));
    }
    roll_to_day(settled_at);
    daily_pnl += pnl;
    session_pnl += pnl;
}

std::string TradingLimits::get_block_reason(long long now) {
    roll_to_day(now);

    std::string block_reason;
    if (config.max_daily_trades > 0 && daily_trade_count >= config.max_daily_trades) {
        block_reason = "daily trade limit";
    } else if (config.max_daily_loss_percent > 0.0 &&
               daily_pnl < -session_start_balance * config.max_daily_loss_percent / 100.0) {
        block_reason = "daily loss limit";
    } else if (config.max_daily_profit_target > 0.0 && daily_pnl >= config.max_daily_profit_target) {
        block_reason = "daily profit target";
    } else if (config.max_session_loss > 0.0 && session_pnl <= -config.max_session_loss) {
        block_reason = "session loss limit";
    }

    // One log line per limit per day
    if (!block_reason.empty() && block_reason != last_reported_reason) {
        RiskLogs::log_trading_limit_reached(block_reason, now, daily_trade_count, daily_pnl, session_pnl);
    }
    last_reported_reason = block_reason;
    return block_reason;
}

} // namespace Core
} // namespace ConfluenceTrader
