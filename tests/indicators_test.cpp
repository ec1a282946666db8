#include "test_helpers.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace ConfluenceTrader::Core;
using namespace ConfluenceTrader::Testing;

namespace {

std::deque<Candle> make_rising_candles(size_t candle_count) {
    std::deque<Candle> candles;
    for (size_t candle_index = 0; candle_index < candle_count; ++candle_index) {
        double open_price = 1.0 + 0.001 * static_cast<double>(candle_index);
        double close_price = open_price + 0.001;
        candles.emplace_back(DAY_START + static_cast<long long>(candle_index) * 60, open_price, close_price, open_price - 0.0002, close_price);
    }
    return candles;
}

TEST(IndicatorsTest, EmaOfConstantSeriesIsConstant) {
    std::vector<double> ema_values = compute_ema_series(std::vector<double>(30, 1.25), 10);
    for (double ema_value : ema_values) {
        EXPECT_NEAR(ema_value, 1.25, 1e-12);
    }
    EXPECT_THROW(compute_ema_series({1.0, 2.0}, 0), std::runtime_error);
}

TEST(IndicatorsTest, RsiSaturatesOnOneWayMoves) {
    std::vector<double> rising_closes;
    std::vector<double> falling_closes;
    std::vector<double> flat_closes(20, 1.1);
    for (int i = 0; i < 20; ++i) {
        rising_closes.push_back(1.0 + 0.01 * i);
        falling_closes.push_back(2.0 - 0.01 * i);
    }

    EXPECT_DOUBLE_EQ(compute_wilder_rsi_series(rising_closes, 14).back(), 100.0);
    EXPECT_DOUBLE_EQ(compute_wilder_rsi_series(falling_closes, 14).back(), 0.0);
    EXPECT_DOUBLE_EQ(compute_wilder_rsi_series(flat_closes, 14).back(), 50.0);
    EXPECT_DOUBLE_EQ(compute_wilder_rsi_series(rising_closes, 14)[13], 0.0);
}

TEST(IndicatorsTest, RsiStaysWithinBoundsOnRandomWalk) {
    std::vector<Candle> candles = make_random_walk_candles(500, DAY_START, 7);
    std::vector<double> closes;
    for (const auto& candle : candles) {
        closes.push_back(candle.close_price);
    }
    std::vector<double> rsi_values = compute_wilder_rsi_series(closes, 14);
    for (size_t i = 14; i < rsi_values.size(); ++i) {
        EXPECT_GE(rsi_values[i], 0.0);
        EXPECT_LE(rsi_values[i], 100.0);
    }
}

TEST(IndicatorsTest, BollingerPercentB) {
    BollingerBands flat_bands = compute_bollinger_bands(std::vector<double>(20, 1.25), 20, 2.0);
    EXPECT_DOUBLE_EQ(flat_bands.percent_b, 0.5);
    EXPECT_DOUBLE_EQ(flat_bands.upper, flat_bands.lower);

    std::vector<double> rising_closes;
    for (int i = 1; i <= 20; ++i) {
        rising_closes.push_back(static_cast<double>(i));
    }
    BollingerBands rising_bands = compute_bollinger_bands(rising_closes, 20, 2.0);
    EXPECT_DOUBLE_EQ(rising_bands.middle, 10.5);
    EXPECT_GT(rising_bands.percent_b, 0.5);
    EXPECT_LT(rising_bands.percent_b, 1.0);

    EXPECT_THROW(compute_bollinger_bands(rising_closes, 21, 2.0), std::runtime_error);
}

TEST(IndicatorsTest, StochasticAtTopOfRange) {
    StochasticValues stochastic_values = compute_stochastic(make_rising_candles(30), 14, 3, 3);
    EXPECT_DOUBLE_EQ(stochastic_values.k_current, 100.0);
    EXPECT_DOUBLE_EQ(stochastic_values.d_current, 100.0);
    EXPECT_THROW(compute_stochastic(make_rising_candles(10), 14, 3, 3), std::runtime_error);
}

TEST(IndicatorsTest, DirectionalIndexFavoursPlusDiInUpTrend) {
    DirectionalSeries directional_series = compute_directional_series(make_rising_candles(60), 14);
    EXPECT_GT(directional_series.plus_di.back(), directional_series.minus_di.back());
    EXPECT_GT(directional_series.adx.back(), 27.0);
    EXPECT_LE(directional_series.adx.back(), 100.0 + 1e-9);
}

TEST(IndicatorsTest, CandlePatterns) {
    Candle hammer(DAY_START, 1.000, 1.012, 0.970, 1.010);
    Candle shooting_star(DAY_START, 1.010, 1.040, 0.998, 1.000);
    EXPECT_TRUE(detect_hammer(hammer));
    EXPECT_FALSE(detect_shooting_star(hammer));
    EXPECT_TRUE(detect_shooting_star(shooting_star));
    EXPECT_FALSE(detect_hammer(shooting_star));

    Candle bearish_candle(DAY_START, 1.010, 1.012, 0.999, 1.000);
    Candle bullish_engulfing(DAY_START + 60, 0.995, 1.016, 0.994, 1.015);
    EXPECT_TRUE(detect_bullish_engulfing(bearish_candle, bullish_engulfing));
    EXPECT_FALSE(detect_bearish_engulfing(bearish_candle, bullish_engulfing));

    Candle bullish_candle(DAY_START, 1.000, 1.011, 0.999, 1.010);
    Candle bearish_engulfing(DAY_START + 60, 1.015, 1.016, 0.994, 0.995);
    EXPECT_TRUE(detect_bearish_engulfing(bullish_candle, bearish_engulfing));
}

TEST(IndicatorsTest, DivergenceComparesLastCloseWithLookbackWindow) {
    std::vector<double> closes = {1.00, 0.90, 0.95, 0.92, 0.88};
    EXPECT_TRUE(detect_bullish_divergence(closes, {50.0, 20.0, 30.0, 25.0, 30.0}, 3));
    EXPECT_FALSE(detect_bullish_divergence(closes, {50.0, 20.0, 30.0, 25.0, 15.0}, 3));
    EXPECT_FALSE(detect_bullish_divergence(closes, {50.0, 20.0}, 3));

    std::vector<double> rising_closes = {1.00, 1.10, 1.05, 1.08, 1.12};
    EXPECT_TRUE(detect_bearish_divergence(rising_closes, {50.0, 80.0, 70.0, 75.0, 70.0}, 3));
}

TEST(IndicatorsTest, SnapshotValidOnlyWithEnoughHistory) {
    IndicatorConfig indicator_config;
    ASSERT_EQ(get_minimum_bars_for_snapshot(indicator_config), 60);

    std::vector<Candle> walk = make_random_walk_candles(150, DAY_START, 11);
    std::deque<Candle> short_history(walk.begin(), walk.begin() + 59);
    IndicatorSnapshot short_snapshot = compute_indicator_snapshot(short_history, Timeframe::MINUTE_1, indicator_config);
    EXPECT_FALSE(short_snapshot.valid);
    EXPECT_EQ(short_snapshot.candle.timestamp, walk[58].timestamp);

    std::deque<Candle> full_history(walk.begin(), walk.end());
    IndicatorSnapshot full_snapshot = compute_indicator_snapshot(full_history, Timeframe::MINUTE_1, indicator_config);
    EXPECT_TRUE(full_snapshot.valid);
    EXPECT_DOUBLE_EQ(full_snapshot.close_price, walk.back().close_price);
    EXPECT_GE(full_snapshot.rsi, 0.0);
    EXPECT_LE(full_snapshot.rsi, 100.0);
    EXPECT_TRUE(std::isfinite(full_snapshot.bollinger_percent_b));
    EXPECT_EQ(full_snapshot.rsi_oversold, full_snapshot.rsi < indicator_config.rsi_oversold_level);
    EXPECT_DOUBLE_EQ(full_snapshot.ema_slow, 0.0);
}

} // namespace
