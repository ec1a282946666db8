#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include "trader/data_structures/data_structures.hpp"
#include "configs/indicator_config.hpp"
#include <deque>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

// Series helpers. Each returns one value per input element; positions before the
// indicator is defined hold 0.0.
std::vector<double> compute_ema_series(const std::vector<double>& values, int period);
std::vector<double> compute_wilder_rsi_series(const std::vector<double>& closes, int period);

struct DirectionalSeries {
    std::vector<double> adx;
    std::vector<double> plus_di;
    std::vector<double> minus_di;
    size_t first_valid_adx_index;
};
DirectionalSeries compute_directional_series(const std::deque<Candle>& candles, int period);

struct BollingerBands {
    double upper;
    double middle;
    double lower;
    double percent_b;
};
BollingerBands compute_bollinger_bands(const std::vector<double>& closes, int period, double standard_deviations);

struct StochasticValues {
    double k_current;
    double d_current;
    double k_previous;
    double d_previous;
};
StochasticValues compute_stochastic(const std::deque<Candle>& candles, int k_period, int k_smoothing, int d_period);

// Single-candle and two-candle reversal patterns
bool detect_hammer(const Candle& candle);
bool detect_shooting_star(const Candle& candle);
bool detect_bullish_engulfing(const Candle& previous_candle, const Candle& current_candle);
bool detect_bearish_engulfing(const Candle& previous_candle, const Candle& current_candle);

// Latest close vs the previous lookback closes, confirmed by RSI.
bool detect_bullish_divergence(const std::vector<double>& closes, const std::vector<double>& rsi_values, int lookback);
bool detect_bearish_divergence(const std::vector<double>& closes, const std::vector<double>& rsi_values, int lookback);

// Number of candles needed before compute_indicator_snapshot can return a valid snapshot.
int get_minimum_bars_for_snapshot(const IndicatorConfig& indicator_config);

// Builds the snapshot for the latest candle of the window; returns valid=false on short history.
IndicatorSnapshot compute_indicator_snapshot(const std::deque<Candle>& candles, Timeframe timeframe, const IndicatorConfig& indicator_config);

} // namespace Core
} // namespace ConfluenceTrader

#endif // INDICATORS_HPP
