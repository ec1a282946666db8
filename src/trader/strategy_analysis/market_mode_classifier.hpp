#ifndef MARKET_MODE_CLASSIFIER_HPP
#define MARKET_MODE_CLASSIFIER_HPP

#include "trader/data_structures/data_structures.hpp"
#include "configs/strategy_config.hpp"
#include <mutex>

namespace ConfluenceTrader {
namespace Core {

/**
 * Maps M5 ADX / +DI / -DI to a market mode with hysteresis.
 * A trend is entered above the trend-entry threshold and only left below the
 * range-entry threshold; RANGING is only left above the trend-entry threshold.
 */
class MarketModeClassifier {
public:
    explicit MarketModeClassifier(const StrategyConfig& strategy_config);

    MarketMode classify(MarketMode previous_mode, double m5_adx, double m5_plus_di, double m5_minus_di) const;

private:
    double trend_entry_threshold;
    double range_entry_threshold;
};

/**
 * Cross-cycle market mode. Only the decision engine updates it, one M5 close at a time.
 */
class MarketModeState {
public:
    MarketModeState();

    MarketMode get_mode() const;
    long long get_last_classified_m5_timestamp() const;

    // Reclassifies when m5_snapshot is newer than the last classified M5 candle; returns the current mode.
    MarketMode update_from_m5_close(const MarketModeClassifier& classifier, const IndicatorSnapshot& m5_snapshot);

    void reset();

private:
    mutable std::mutex state_mutex;
    MarketMode current_mode;
    long long last_classified_m5_timestamp;
    bool has_classified;
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // MARKET_MODE_CLASSIFIER_HPP
