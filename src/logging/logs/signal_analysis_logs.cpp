#include "signal_analysis_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace ConfluenceTrader {
namespace Logging {

namespace {
    std::string format_side_line(const std::string& side_name, const Core::SideScore& side_score) {
        std::ostringstream side_stream;
        side_stream << side_name << ": " << std::fixed << std::setprecision(1) << side_score.confidence
                    << " | agree " << side_score.agree_count << "/3"
                    << " [M1 " << (side_score.confirmations.m1_confirmed ? "Y" : "-")
                    << " M5 " << (side_score.confirmations.m5_confirmed ? "Y" : "-")
                    << " M15 " << (side_score.confirmations.m15_confirmed ? "Y" : "-") << "]";
        if (side_score.vetoed) {
            side_stream << " VETO " << side_score.veto_reason;
        }
        return side_stream.str();
    }
}

void SignalAnalysisLogs::log_score_breakdown(const Core::ScoreResult& score_result, Core::MarketMode market_mode, long long cycle_time, bool include_factors) {
    LOG_SIGNAL_ANALYSIS_HEADER(TimeUtils::format_epoch_seconds_iso(cycle_time));
    LOG_CONTENT("MODE: " + Core::market_mode_to_string(market_mode));
    LOG_CONTENT(format_side_line("RISE", score_result.rise));
    if (include_factors) {
        for (const auto& factor : score_result.rise.factors) {
            LOG_SUBCONTENT(factor);
        }
    }
    LOG_CONTENT(format_side_line("FALL", score_result.fall));
    if (include_factors) {
        for (const auto& factor : score_result.fall.factors) {
            LOG_SUBCONTENT(factor);
        }
    }
    LOG_SECTION_FOOTER();
}

void SignalAnalysisLogs::log_decision(const Core::TradeSignal& signal) {
    std::ostringstream decision_stream;
    decision_stream << "DECISION #" << signal.decision_id << " " << TimeUtils::format_epoch_seconds_iso(signal.timestamp)
                    << " " << Core::trade_side_to_string(signal.side)
                    << " @ " << std::fixed << std::setprecision(1) << signal.confidence
                    << " (" << Core::market_mode_to_string(signal.market_mode) << ", price "
                    << std::setprecision(5) << signal.price << ")";
    if (signal.blocked_by_guard) {
        decision_stream << " [guard]";
    }
    log_message(decision_stream.str(), "");
}

void SignalAnalysisLogs::log_market_mode_change(Core::MarketMode previous_mode, Core::MarketMode current_mode, long long m5_timestamp, double m5_adx) {
    std::ostringstream mode_stream;
    mode_stream << "MODE: " << Core::market_mode_to_string(previous_mode) << " -> " << Core::market_mode_to_string(current_mode)
                << " at M5 " << TimeUtils::format_epoch_seconds_iso(m5_timestamp)
                << " (ADX " << std::fixed << std::setprecision(2) << m5_adx << ")";
    log_message(mode_stream.str(), "");
}

} // namespace Logging
} // namespace ConfluenceTrader
