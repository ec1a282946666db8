#ifndef INDICATOR_CONFIG_HPP
#define INDICATOR_CONFIG_HPP

struct IndicatorConfig {
    int bollinger_period = 20;
    double bollinger_standard_deviations = 2.0;
    int rsi_period = 14;                              // Wilder smoothing
    int stochastic_k_period = 14;
    int stochastic_k_smoothing = 3;
    int stochastic_d_period = 3;
    int adx_period = 14;
    int adx_slope_lookback = 3;                       // slope = ADX[now] - ADX[now - lookback]
    int ema_fast_period = 50;
    int ema_slow_period = 200;
    int macd_fast_period = 12;
    int macd_slow_period = 26;
    int macd_signal_period = 9;
    int divergence_lookback = 14;
    double rsi_oversold_level = 30.0;
    double rsi_overbought_level = 70.0;
    double stochastic_oversold_level = 20.0;
    double stochastic_overbought_level = 80.0;
    int minimum_bars = 60;                            // Snapshot is invalid below this many bars
    int maximum_bars = 600;                           // History kept per timeframe
};

#endif // INDICATOR_CONFIG_HPP
