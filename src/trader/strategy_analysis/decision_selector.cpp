#include "decision_selector.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ConfluenceTrader {
namespace Core {

namespace {
    double sanitize_confidence(double confidence_value) {
        return std::isfinite(confidence_value) ? confidence_value : 0.0;
    }
}

TradeSide DecisionSelector::select(double rise_confidence, double fall_confidence, int rise_agree_count, int fall_agree_count,
                                   double minimum_confidence, int minimum_agree_count) {
    double rise_value = sanitize_confidence(rise_confidence);
    double fall_value = sanitize_confidence(fall_confidence);

    if (rise_value > fall_value) {
        if (rise_value >= minimum_confidence && rise_agree_count >= minimum_agree_count) {
            return TradeSide::RISE;
        }
        return TradeSide::NONE;
    }
    if (fall_value > rise_value) {
        if (fall_value >= minimum_confidence && fall_agree_count >= minimum_agree_count) {
            return TradeSide::FALL;
        }
        return TradeSide::NONE;
    }
    return TradeSide::NONE;
}

TradeSignal DecisionSelector::build_signal(const ScoreResult& score_result, MarketMode market_mode, double price, long long timestamp,
                                           double minimum_confidence, int minimum_agree_count) {
    TradeSignal trade_signal;
    trade_signal.market_mode = market_mode;
    trade_signal.price = price;
    trade_signal.timestamp = timestamp;
    trade_signal.side = select(score_result.rise.confidence, score_result.fall.confidence,
                               score_result.rise.agree_count, score_result.fall.agree_count,
                               minimum_confidence, minimum_agree_count);

    if (trade_signal.side == TradeSide::RISE) {
        trade_signal.confidence = score_result.rise.confidence;
        trade_signal.confirmations = score_result.rise.confirmations;
        trade_signal.factors = score_result.rise.factors;
        return trade_signal;
    }
    if (trade_signal.side == TradeSide::FALL) {
        trade_signal.confidence = score_result.fall.confidence;
        trade_signal.confirmations = score_result.fall.confirmations;
        trade_signal.factors = score_result.fall.factors;
        return trade_signal;
    }

    // NONE carries the stronger side's evidence so skipped cycles stay auditable
    const SideScore& stronger_side = (score_result.fall.confidence > score_result.rise.confidence) ? score_result.fall : score_result.rise;
    trade_signal.confidence = 0.0;
    trade_signal.confirmations = stronger_side.confirmations;
    std::ostringstream reason_stream;
    reason_stream << std::fixed << std::setprecision(1)
                  << "No trade: rise " << score_result.rise.confidence << "/" << score_result.rise.agree_count
                  << " fall " << score_result.fall.confidence << "/" << score_result.fall.agree_count
                  << " (min " << minimum_confidence << "/" << minimum_agree_count << ")";
    trade_signal.factors.push_back(reason_stream.str());
    return trade_signal;
}

} // namespace Core
} // namespace ConfluenceTrader
