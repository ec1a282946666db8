#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

struct StrategyConfig {
    // ========================================================================
    // MARKET MODE CLASSIFICATION (M5 ADX HYSTERESIS)
    // ========================================================================

    double adx_trend_entry_threshold = 27.0;          // ADX strictly above this enters a trending mode
    double adx_range_entry_threshold = 18.0;          // ADX strictly below this enters RANGING (exit from trend)

    // ========================================================================
    // DECISION THRESHOLDS
    // ========================================================================

    double minimum_confidence = 60.0;                 // Candidate side needs at least this confidence
    int minimum_timeframe_agreement = 2;              // Candidate side needs this many confirming timeframes (of 3)

    // ========================================================================
    // SCORING WEIGHTS
    // ========================================================================

    double m15_confirmation_points = 15.0;            // Higher timeframe bias matches the side
    double m5_setup_points = 25.0;                    // Pullback (trend) or band-extreme (range) setup
    double macd_agreement_points = 5.0;               // M5 MACD agrees with the side
    double m1_stochastic_trigger_points = 15.0;       // M1 stochastic cross in the trade direction
    double m1_reversal_pattern_points = 15.0;         // M1 reversal candle pattern
    double confluence_bonus_points = 10.0;            // All three timeframes confirm the side
    double adx_acceleration_points = 5.0;             // Added when ADX rises, subtracted when it falls
    double adx_slope_threshold = 1.0;                 // |ADX slope| beyond this counts as rising/falling

    // ========================================================================
    // M5 SETUP AND GATE THRESHOLDS
    // ========================================================================

    double rsi_extension_rise_limit = 65.0;           // Trend mode: rise blocked when M5 RSI is above this
    double rsi_extension_fall_limit = 35.0;           // Trend mode: fall blocked when M5 RSI is below this
    double trend_pullback_rise_rsi_floor = 40.0;      // Trend mode: rise setup needs RSI at or above this
    double trend_pullback_fall_rsi_ceiling = 60.0;    // Trend mode: fall setup needs RSI at or below this
    double trend_pullback_percent_b = 0.35;           // Rise pullback needs %B <= this, fall rally needs %B >= 1 - this
    double range_band_touch_percent_b = 0.10;         // Range mode: rise needs %B <= this, fall needs %B >= 1 - this
    double stochastic_midline = 50.0;                 // Rise cross must happen below, fall cross above

    // ========================================================================
    // COUNTER-TREND TIERS (RANGING / UNCERTAIN WITH OPPOSING M15 BIAS)
    // ========================================================================

    double tier1_rsi_limit = 30.0;                    // Rise needs RSI < limit, fall needs RSI > 100 - limit
    double tier1_percent_b_limit = 0.20;              // Rise needs %B <= limit, fall needs %B >= 1 - limit
    double tier2_rsi_limit = 35.0;
    double tier2_percent_b_limit = 0.35;
};

#endif // STRATEGY_CONFIG_HPP
