#ifndef DECISION_SELECTOR_HPP
#define DECISION_SELECTOR_HPP

#include "trader/data_structures/data_structures.hpp"

namespace ConfluenceTrader {
namespace Core {

/**
 * Picks the strictly stronger side when it clears both the confidence and agreement minimums.
 * Ties and failed bounds give NONE. Stateless.
 */
class DecisionSelector {
public:
    static TradeSide select(double rise_confidence, double fall_confidence, int rise_agree_count, int fall_agree_count,
                            double minimum_confidence, int minimum_agree_count);

    // Builds the cycle signal from a score result; the decision id is assigned by the caller.
    static TradeSignal build_signal(const ScoreResult& score_result, MarketMode market_mode, double price, long long timestamp,
                                    double minimum_confidence, int minimum_agree_count);
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // DECISION_SELECTOR_HPP
