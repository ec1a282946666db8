#include "risk_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace ConfluenceTrader {
namespace Logging {

void RiskLogs::log_outcome_recorded(const std::string& result_name, int consecutive_losses, int max_consecutive_losses) {
    log_message("RISK: Outcome " + result_name + " recorded - consecutive losses " + std::to_string(consecutive_losses) +
                "/" + std::to_string(max_consecutive_losses), "");
}

void RiskLogs::log_cooldown_armed(int consecutive_losses, long long armed_at, long long cooldown_until) {
    LOG_GUARD_HEADER();
    LOG_CONTENT("STATE: ACTIVE -> COOLDOWN after " + std::to_string(consecutive_losses) + " consecutive losses");
    LOG_CONTENT("ARMED AT: " + TimeUtils::format_epoch_seconds_iso(armed_at));
    LOG_CONTENT("RESUMES AT: " + TimeUtils::format_epoch_seconds_iso(cooldown_until));
    LOG_SECTION_FOOTER();
}

void RiskLogs::log_hard_stop_armed(int consecutive_losses, long long armed_at) {
    LOG_GUARD_HEADER();
    LOG_CONTENT("STATE: ACTIVE -> HARD_STOP after " + std::to_string(consecutive_losses) + " consecutive losses");
    LOG_CONTENT("ARMED AT: " + TimeUtils::format_epoch_seconds_iso(armed_at));
    LOG_CONTENT("Zero cooldown configured - trading stays halted until manual reset");
    LOG_SECTION_FOOTER();
}

void RiskLogs::log_cooldown_expired(long long now) {
    log_message("RISK: Cooldown expired at " + TimeUtils::format_epoch_seconds_iso(now) + " - COOLDOWN -> ACTIVE, streak reset", "");
}

void RiskLogs::log_guard_reset() {
    log_message("RISK: Loss-streak guard manually reset", "");
}

void RiskLogs::log_decision_blocked(const Core::TradeSignal& signal, const std::string& guard_state_name, int consecutive_losses) {
    std::ostringstream blocked_stream;
    blocked_stream << "RISK: " << Core::trade_side_to_string(signal.side) << " @ "
                   << std::fixed << std::setprecision(1) << signal.confidence
                   << " blocked by guard (" << guard_state_name << ", streak " << consecutive_losses << ")";
    log_message(blocked_stream.str(), "");
}

void RiskLogs::log_trading_limit_reached(const std::string& limit_name, long long now, int daily_trade_count,
                                         double daily_pnl, double session_pnl) {
    std::ostringstream limit_stream;
    limit_stream << "RISK: Trading limit reached (" << limit_name << ") at " << TimeUtils::format_epoch_seconds_iso(now)
                 << " - trades today " << daily_trade_count << std::fixed << std::setprecision(2)
                 << ", daily pnl " << daily_pnl << ", session pnl " << session_pnl;
    log_message(limit_stream.str(), "");
}

void RiskLogs::log_unknown_outcome(unsigned long long decision_id, const std::string& result_name) {
    log_message("WARNING: Ignoring " + result_name + " outcome for decision " + std::to_string(decision_id) +
                " - no such outstanding decision", "");
}

} // namespace Logging
} // namespace ConfluenceTrader
