#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

namespace {
    constexpr double DIVERGENCE_BULLISH_RSI_CEILING = 40.0;
    constexpr double DIVERGENCE_BEARISH_RSI_FLOOR = 60.0;

    std::vector<double> extract_closes(const std::deque<Candle>& candles) {
        std::vector<double> closes;
        closes.reserve(candles.size());
        for (const auto& candle : candles) {
            closes.push_back(candle.close_price);
        }
        return closes;
    }

    double rsi_from_averages(double average_gain, double average_loss) {
        if (average_loss == 0.0) {
            return (average_gain == 0.0) ? 50.0 : 100.0;
        }
        double relative_strength = average_gain / average_loss;
        return 100.0 - (100.0 / (1.0 + relative_strength));
    }
}

std::vector<double> compute_ema_series(const std::vector<double>& values, int period) {
    if (period <= 0) {
        throw std::runtime_error("EMA period must be positive");
    }

    std::vector<double> ema_values(values.size(), 0.0);
    if (values.empty()) {
        return ema_values;
    }

    const double smoothing_factor = 2.0 / (static_cast<double>(period) + 1.0);
    ema_values[0] = values[0];
    for (size_t i = 1; i < values.size(); ++i) {
        ema_values[i] = smoothing_factor * values[i] + (1.0 - smoothing_factor) * ema_values[i - 1];
    }
    return ema_values;
}

std::vector<double> compute_wilder_rsi_series(const std::vector<double>& closes, int period) {
    if (period <= 0) {
        throw std::runtime_error("RSI period must be positive");
    }

    std::vector<double> rsi_values(closes.size(), 0.0);
    if (static_cast<int>(closes.size()) < period + 1) {
        return rsi_values;
    }

    double average_gain = 0.0;
    double average_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0.0) {
            average_gain += change;
        } else {
            average_loss -= change;
        }
    }
    average_gain /= period;
    average_loss /= period;
    rsi_values[period] = rsi_from_averages(average_gain, average_loss);

    for (size_t i = static_cast<size_t>(period) + 1; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        double gain = (change > 0.0) ? change : 0.0;
        double loss = (change < 0.0) ? -change : 0.0;
        average_gain = (average_gain * (period - 1) + gain) / period;
        average_loss = (average_loss * (period - 1) + loss) / period;
        rsi_values[i] = rsi_from_averages(average_gain, average_loss);
    }
    return rsi_values;
}

DirectionalSeries compute_directional_series(const std::deque<Candle>& candles, int period) {
    if (period <= 0) {
        throw std::runtime_error("ADX period must be positive");
    }

    DirectionalSeries directional_series;
    directional_series.adx.assign(candles.size(), 0.0);
    directional_series.plus_di.assign(candles.size(), 0.0);
    directional_series.minus_di.assign(candles.size(), 0.0);
    directional_series.first_valid_adx_index = static_cast<size_t>(2 * period - 1);

    if (candles.size() < static_cast<size_t>(2 * period)) {
        return directional_series;
    }

    std::vector<double> dx_values(candles.size(), 0.0);
    double smoothed_true_range = 0.0;
    double smoothed_plus_dm = 0.0;
    double smoothed_minus_dm = 0.0;

    for (size_t i = 1; i < candles.size(); ++i) {
        const Candle& current_candle = candles[i];
        const Candle& previous_candle = candles[i - 1];

        double true_range = std::max({current_candle.high_price - current_candle.low_price,
                                      std::abs(current_candle.high_price - previous_candle.close_price),
                                      std::abs(current_candle.low_price - previous_candle.close_price)});
        double up_move = current_candle.high_price - previous_candle.high_price;
        double down_move = previous_candle.low_price - current_candle.low_price;
        double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;

        if (i <= static_cast<size_t>(period)) {
            smoothed_true_range += true_range;
            smoothed_plus_dm += plus_dm;
            smoothed_minus_dm += minus_dm;
            if (i < static_cast<size_t>(period)) {
                continue;
            }
        } else {
            smoothed_true_range = smoothed_true_range - (smoothed_true_range / period) + true_range;
            smoothed_plus_dm = smoothed_plus_dm - (smoothed_plus_dm / period) + plus_dm;
            smoothed_minus_dm = smoothed_minus_dm - (smoothed_minus_dm / period) + minus_dm;
        }

        double plus_di = (smoothed_true_range > 0.0) ? 100.0 * smoothed_plus_dm / smoothed_true_range : 0.0;
        double minus_di = (smoothed_true_range > 0.0) ? 100.0 * smoothed_minus_dm / smoothed_true_range : 0.0;
        directional_series.plus_di[i] = plus_di;
        directional_series.minus_di[i] = minus_di;

        double di_sum = plus_di + minus_di;
        dx_values[i] = (di_sum > 0.0) ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
    }

    // First ADX is the mean of the first period DX values, then Wilder smoothing
    size_t first_adx_index = directional_series.first_valid_adx_index;
    double dx_sum = 0.0;
    for (size_t i = static_cast<size_t>(period); i <= first_adx_index; ++i) {
        dx_sum += dx_values[i];
    }
    directional_series.adx[first_adx_index] = dx_sum / period;
    for (size_t i = first_adx_index + 1; i < candles.size(); ++i) {
        directional_series.adx[i] = (directional_series.adx[i - 1] * (period - 1) + dx_values[i]) / period;
    }

    return directional_series;
}

BollingerBands compute_bollinger_bands(const std::vector<double>& closes, int period, double standard_deviations) {
    if (period <= 0 || static_cast<int>(closes.size()) < period) {
        throw std::runtime_error("Insufficient closes for Bollinger Bands");
    }

    double mean_value = 0.0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        mean_value += closes[i];
    }
    mean_value /= period;

    double variance_value = 0.0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        double deviation = closes[i] - mean_value;
        variance_value += deviation * deviation;
    }
    variance_value /= period;
    double standard_deviation = std::sqrt(variance_value);

    BollingerBands bollinger_bands;
    bollinger_bands.middle = mean_value;
    bollinger_bands.upper = mean_value + standard_deviations * standard_deviation;
    bollinger_bands.lower = mean_value - standard_deviations * standard_deviation;
    double band_width = bollinger_bands.upper - bollinger_bands.lower;
    bollinger_bands.percent_b = (band_width > 0.0) ? (closes.back() - bollinger_bands.lower) / band_width : 0.5;
    return bollinger_bands;
}

StochasticValues compute_stochastic(const std::deque<Candle>& candles, int k_period, int k_smoothing, int d_period) {
    const int required_candles = k_period + k_smoothing + d_period - 1;
    if (k_period <= 0 || k_smoothing <= 0 || d_period <= 0 || static_cast<int>(candles.size()) < required_candles) {
        throw std::runtime_error("Insufficient candles for stochastic");
    }

    // Only the tail that feeds the current and previous %D is computed
    const size_t window_start = candles.size() - static_cast<size_t>(required_candles);
    std::vector<double> raw_k_values;
    for (size_t i = window_start + k_period - 1; i < candles.size(); ++i) {
        double highest_high = candles[i].high_price;
        double lowest_low = candles[i].low_price;
        for (size_t j = i + 1 - k_period; j <= i; ++j) {
            highest_high = std::max(highest_high, candles[j].high_price);
            lowest_low = std::min(lowest_low, candles[j].low_price);
        }
        double price_range = highest_high - lowest_low;
        raw_k_values.push_back((price_range > 0.0) ? 100.0 * (candles[i].close_price - lowest_low) / price_range : 50.0);
    }

    std::vector<double> smoothed_k_values;
    for (size_t i = k_smoothing - 1; i < raw_k_values.size(); ++i) {
        double k_sum = 0.0;
        for (size_t j = i + 1 - k_smoothing; j <= i; ++j) {
            k_sum += raw_k_values[j];
        }
        smoothed_k_values.push_back(k_sum / k_smoothing);
    }

    std::vector<double> d_values;
    for (size_t i = d_period - 1; i < smoothed_k_values.size(); ++i) {
        double d_sum = 0.0;
        for (size_t j = i + 1 - d_period; j <= i; ++j) {
            d_sum += smoothed_k_values[j];
        }
        d_values.push_back(d_sum / d_period);
    }

    StochasticValues stochastic_values;
    stochastic_values.k_current = smoothed_k_values.back();
    stochastic_values.k_previous = smoothed_k_values[smoothed_k_values.size() - 2];
    stochastic_values.d_current = d_values.back();
    stochastic_values.d_previous = d_values[d_values.size() - 2];
    return stochastic_values;
}

bool detect_hammer(const Candle& candle) {
    double body = std::abs(candle.close_price - candle.open_price);
    double upper_wick = candle.high_price - std::max(candle.open_price, candle.close_price);
    double lower_wick = std::min(candle.open_price, candle.close_price) - candle.low_price;
    return lower_wick > body * 2.0 && upper_wick < body * 0.5 && candle.close_price > candle.open_price;
}

bool detect_shooting_star(const Candle& candle) {
    double body = std::abs(candle.close_price - candle.open_price);
    double upper_wick = candle.high_price - std::max(candle.open_price, candle.close_price);
    double lower_wick = std::min(candle.open_price, candle.close_price) - candle.low_price;
    return upper_wick > body * 2.0 && lower_wick < body * 0.5 && candle.close_price < candle.open_price;
}

bool detect_bullish_engulfing(const Candle& previous_candle, const Candle& current_candle) {
    return previous_candle.close_price < previous_candle.open_price &&
           current_candle.close_price > current_candle.open_price &&
           current_candle.open_price < previous_candle.close_price &&
           current_candle.close_price > previous_candle.open_price;
}

bool detect_bearish_engulfing(const Candle& previous_candle, const Candle& current_candle) {
    return previous_candle.close_price > previous_candle.open_price &&
           current_candle.close_price < current_candle.open_price &&
           current_candle.open_price > previous_candle.close_price &&
           current_candle.close_price < previous_candle.open_price;
}

bool detect_bullish_divergence(const std::vector<double>& closes, const std::vector<double>& rsi_values, int lookback) {
    if (lookback <= 0 || closes.size() != rsi_values.size() || closes.size() < static_cast<size_t>(lookback) + 1) {
        return false;
    }

    const size_t last_index = closes.size() - 1;
    size_t prior_low_index = last_index - lookback;
    for (size_t i = last_index - lookback; i < last_index; ++i) {
        if (closes[i] < closes[prior_low_index]) {
            prior_low_index = i;
        }
    }

    bool price_lower_low = closes[last_index] < closes[prior_low_index];
    bool rsi_higher_low = rsi_values[last_index] > rsi_values[prior_low_index];
    return price_lower_low && rsi_higher_low && rsi_values[last_index] < DIVERGENCE_BULLISH_RSI_CEILING;
}

bool detect_bearish_divergence(const std::vector<double>& closes, const std::vector<double>& rsi_values, int lookback) {
    if (lookback <= 0 || closes.size() != rsi_values.size() || closes.size() < static_cast<size_t>(lookback) + 1) {
        return false;
    }

    const size_t last_index = closes.size() - 1;
    size_t prior_high_index = last_index - lookback;
    for (size_t i = last_index - lookback; i < last_index; ++i) {
        if (closes[i] > closes[prior_high_index]) {
            prior_high_index = i;
        }
    }

    bool price_higher_high = closes[last_index] > closes[prior_high_index];
    bool rsi_lower_high = rsi_values[last_index] < rsi_values[prior_high_index];
    return price_higher_high && rsi_lower_high && rsi_values[last_index] > DIVERGENCE_BEARISH_RSI_FLOOR;
}

int get_minimum_bars_for_snapshot(const IndicatorConfig& indicator_config) {
    int stochastic_bars = indicator_config.stochastic_k_period + indicator_config.stochastic_k_smoothing + indicator_config.stochastic_d_period - 1;
    return std::max({indicator_config.minimum_bars,
                     indicator_config.bollinger_period,
                     indicator_config.rsi_period + indicator_config.divergence_lookback + 1,
                     2 * indicator_config.adx_period + indicator_config.adx_slope_lookback,
                     indicator_config.macd_slow_period + indicator_config.macd_signal_period,
                     indicator_config.ema_fast_period,
                     stochastic_bars,
                     2});
}

IndicatorSnapshot compute_indicator_snapshot(const std::deque<Candle>& candles, Timeframe timeframe, const IndicatorConfig& indicator_config) {
    IndicatorSnapshot snapshot;
    snapshot.timeframe = timeframe;
    if (candles.empty()) {
        return snapshot;
    }

    snapshot.candle = candles.back();
    snapshot.close_price = candles.back().close_price;
    if (static_cast<int>(candles.size()) < get_minimum_bars_for_snapshot(indicator_config)) {
        return snapshot;
    }

    std::vector<double> closes = extract_closes(candles);
    const size_t last_index = closes.size() - 1;

    BollingerBands bollinger_bands = compute_bollinger_bands(closes, indicator_config.bollinger_period, indicator_config.bollinger_standard_deviations);
    snapshot.bollinger_upper = bollinger_bands.upper;
    snapshot.bollinger_middle = bollinger_bands.middle;
    snapshot.bollinger_lower = bollinger_bands.lower;
    snapshot.bollinger_percent_b = bollinger_bands.percent_b;

    std::vector<double> rsi_values = compute_wilder_rsi_series(closes, indicator_config.rsi_period);
    snapshot.rsi = rsi_values[last_index];

    StochasticValues stochastic_values = compute_stochastic(candles, indicator_config.stochastic_k_period,
                                                            indicator_config.stochastic_k_smoothing, indicator_config.stochastic_d_period);
    snapshot.stochastic_k = stochastic_values.k_current;
    snapshot.stochastic_d = stochastic_values.d_current;
    snapshot.stochastic_bullish_cross = stochastic_values.k_previous <= stochastic_values.d_previous &&
                                        stochastic_values.k_current > stochastic_values.d_current;
    snapshot.stochastic_bearish_cross = stochastic_values.k_previous >= stochastic_values.d_previous &&
                                        stochastic_values.k_current < stochastic_values.d_current;

    DirectionalSeries directional_series = compute_directional_series(candles, indicator_config.adx_period);
    snapshot.adx = directional_series.adx[last_index];
    snapshot.plus_di = directional_series.plus_di[last_index];
    snapshot.minus_di = directional_series.minus_di[last_index];
    snapshot.adx_slope = directional_series.adx[last_index] - directional_series.adx[last_index - indicator_config.adx_slope_lookback];

    snapshot.ema_fast = compute_ema_series(closes, indicator_config.ema_fast_period)[last_index];
    if (static_cast<int>(closes.size()) >= indicator_config.ema_slow_period) {
        snapshot.ema_slow = compute_ema_series(closes, indicator_config.ema_slow_period)[last_index];
    }

    std::vector<double> macd_fast_values = compute_ema_series(closes, indicator_config.macd_fast_period);
    std::vector<double> macd_slow_values = compute_ema_series(closes, indicator_config.macd_slow_period);
    std::vector<double> macd_line_values(closes.size(), 0.0);
    for (size_t i = 0; i < closes.size(); ++i) {
        macd_line_values[i] = macd_fast_values[i] - macd_slow_values[i];
    }
    std::vector<double> macd_signal_values = compute_ema_series(macd_line_values, indicator_config.macd_signal_period);
    snapshot.macd_line = macd_line_values[last_index];
    snapshot.macd_signal = macd_signal_values[last_index];
    snapshot.macd_histogram = snapshot.macd_line - snapshot.macd_signal;
    snapshot.macd_bullish = snapshot.macd_line > snapshot.macd_signal && snapshot.macd_histogram > 0.0;
    snapshot.macd_bearish = snapshot.macd_line < snapshot.macd_signal && snapshot.macd_histogram < 0.0;

    snapshot.rsi_oversold = snapshot.rsi < indicator_config.rsi_oversold_level;
    snapshot.rsi_overbought = snapshot.rsi > indicator_config.rsi_overbought_level;
    snapshot.stochastic_oversold = snapshot.stochastic_k < indicator_config.stochastic_oversold_level;
    snapshot.stochastic_overbought = snapshot.stochastic_k > indicator_config.stochastic_overbought_level;

    const Candle& current_candle = candles[last_index];
    const Candle& previous_candle = candles[last_index - 1];
    snapshot.bullish_pattern = detect_hammer(current_candle) || detect_bullish_engulfing(previous_candle, current_candle);
    snapshot.bearish_pattern = detect_shooting_star(current_candle) || detect_bearish_engulfing(previous_candle, current_candle);
    snapshot.bullish_price_action = current_candle.close_price > previous_candle.high_price;
    snapshot.bearish_price_action = current_candle.close_price < previous_candle.low_price;

    snapshot.bullish_divergence = detect_bullish_divergence(closes, rsi_values, indicator_config.divergence_lookback);
    snapshot.bearish_divergence = detect_bearish_divergence(closes, rsi_values, indicator_config.divergence_lookback);

    snapshot.valid = std::isfinite(snapshot.adx) && std::isfinite(snapshot.rsi) && std::isfinite(snapshot.bollinger_percent_b) &&
                     std::isfinite(snapshot.stochastic_k) && std::isfinite(snapshot.macd_line);
    return snapshot;
}

} // namespace Core
} // namespace ConfluenceTrader
