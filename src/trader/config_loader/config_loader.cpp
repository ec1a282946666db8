#include "config_loader.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "trader/strategy_analysis/session_filter.hpp"
#include "utils/time_utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using ConfluenceTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& config_key, const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::runtime_error("Invalid boolean for " + config_key + ": '" + input_value + "'");
    }

    double to_double(const std::string& config_key, const std::string& input_value) {
        size_t characters_used = 0;
        double parsed_value = 0.0;
        try {
            parsed_value = std::stod(input_value, &characters_used);
        } catch (const std::exception& parse_exception) {
            throw std::runtime_error("Invalid number for " + config_key + ": '" + input_value + "' (" + parse_exception.what() + ")");
        }
        if (characters_used != input_value.size()) {
            throw std::runtime_error("Invalid number for " + config_key + ": '" + input_value + "'");
        }
        return parsed_value;
    }

    long long to_long(const std::string& config_key, const std::string& input_value) {
        size_t characters_used = 0;
        long long parsed_value = 0;
        try {
            parsed_value = std::stoll(input_value, &characters_used);
        } catch (const std::exception& parse_exception) {
            throw std::runtime_error("Invalid integer for " + config_key + ": '" + input_value + "' (" + parse_exception.what() + ")");
        }
        if (characters_used != input_value.size()) {
            throw std::runtime_error("Invalid integer for " + config_key + ": '" + input_value + "'");
        }
        return parsed_value;
    }

    int to_int(const std::string& config_key, const std::string& input_value) {
        return static_cast<int>(to_long(config_key, input_value));
    }

    std::vector<SessionWindow> to_windows(const std::string& config_key, const std::string& input_value) {
        try {
            return ConfluenceTrader::Core::parse_session_windows(input_value);
        } catch (const std::exception& window_exception) {
            throw std::runtime_error("Invalid session windows for " + config_key + ": " + window_exception.what());
        }
    }

    bool is_unit_interval(double value) {
        return value >= 0.0 && value <= 1.0;
    }

    bool is_percentage(double value) {
        return value > 0.0 && value < 100.0;
    }

    bool windows_are_valid(const std::vector<SessionWindow>& session_windows) {
        for (const auto& session_window : session_windows) {
            if (session_window.start_minute_of_day < 0 || session_window.start_minute_of_day >= TimeUtils::MINUTES_PER_DAY ||
                session_window.end_minute_of_day < 0 || session_window.end_minute_of_day >= TimeUtils::MINUTES_PER_DAY ||
                session_window.start_minute_of_day == session_window.end_minute_of_day) {
                return false;
            }
        }
        return true;
    }
}

std::vector<std::string> get_config_file_names() {
    return {
        "strategy_config.csv",
        "session_config.csv",
        "risk_config.csv",
        "replay_config.csv",
        "indicator_config.csv",
        "logging_config.csv"
    };
}

bool load_config_from_csv(ConfluenceTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    while (std::getline(config_file_stream, config_line_string)) {
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        std::getline(config_line_stream, config_value_string);
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);
        const std::string& k = config_key_string;
        const std::string& v = config_value_string;

        // Market mode classification
        if (k == "strategy.adx_trend_entry_threshold") cfg.strategy.adx_trend_entry_threshold = to_double(k, v);
        else if (k == "strategy.adx_range_entry_threshold") cfg.strategy.adx_range_entry_threshold = to_double(k, v);

        // Decision thresholds
        else if (k == "strategy.minimum_confidence") cfg.strategy.minimum_confidence = to_double(k, v);
        else if (k == "strategy.minimum_timeframe_agreement") cfg.strategy.minimum_timeframe_agreement = to_int(k, v);

        // Scoring weights
        else if (k == "strategy.m15_confirmation_points") cfg.strategy.m15_confirmation_points = to_double(k, v);
        else if (k == "strategy.m5_setup_points") cfg.strategy.m5_setup_points = to_double(k, v);
        else if (k == "strategy.macd_agreement_points") cfg.strategy.macd_agreement_points = to_double(k, v);
        else if (k == "strategy.m1_stochastic_trigger_points") cfg.strategy.m1_stochastic_trigger_points = to_double(k, v);
        else if (k == "strategy.m1_reversal_pattern_points") cfg.strategy.m1_reversal_pattern_points = to_double(k, v);
        else if (k == "strategy.confluence_bonus_points") cfg.strategy.confluence_bonus_points = to_double(k, v);
        else if (k == "strategy.adx_acceleration_points") cfg.strategy.adx_acceleration_points = to_double(k, v);
        else if (k == "strategy.adx_slope_threshold") cfg.strategy.adx_slope_threshold = to_double(k, v);

        // Setup and gate thresholds
        else if (k == "strategy.rsi_extension_rise_limit") cfg.strategy.rsi_extension_rise_limit = to_double(k, v);
        else if (k == "strategy.rsi_extension_fall_limit") cfg.strategy.rsi_extension_fall_limit = to_double(k, v);
        else if (k == "strategy.trend_pullback_rise_rsi_floor") cfg.strategy.trend_pullback_rise_rsi_floor = to_double(k, v);
        else if (k == "strategy.trend_pullback_fall_rsi_ceiling") cfg.strategy.trend_pullback_fall_rsi_ceiling = to_double(k, v);
        else if (k == "strategy.trend_pullback_percent_b") cfg.strategy.trend_pullback_percent_b = to_double(k, v);
        else if (k == "strategy.range_band_touch_percent_b") cfg.strategy.range_band_touch_percent_b = to_double(k, v);
        else if (k == "strategy.stochastic_midline") cfg.strategy.stochastic_midline = to_double(k, v);

        // Counter-trend tiers
        else if (k == "strategy.tier1_rsi_limit") cfg.strategy.tier1_rsi_limit = to_double(k, v);
        else if (k == "strategy.tier1_percent_b_limit") cfg.strategy.tier1_percent_b_limit = to_double(k, v);
        else if (k == "strategy.tier2_rsi_limit") cfg.strategy.tier2_rsi_limit = to_double(k, v);
        else if (k == "strategy.tier2_percent_b_limit") cfg.strategy.tier2_percent_b_limit = to_double(k, v);

        // Session windows (UTC)
        else if (k == "session.high_liquidity_windows") cfg.session.high_liquidity_windows = to_windows(k, v);
        else if (k == "session.off_peak_windows") cfg.session.off_peak_windows = to_windows(k, v);
        else if (k == "session.avoid_windows") cfg.session.avoid_windows = to_windows(k, v);
        else if (k == "session.high_liquidity_bonus_points") cfg.session.high_liquidity_bonus_points = to_double(k, v);
        else if (k == "session.off_peak_penalty_points") cfg.session.off_peak_penalty_points = to_double(k, v);
        else if (k == "session.avoid_window_penalty_points") cfg.session.avoid_window_penalty_points = to_double(k, v);

        // Loss-streak guard
        else if (k == "risk.max_consecutive_losses") cfg.risk.max_consecutive_losses = to_int(k, v);
        else if (k == "risk.loss_cooldown_seconds") cfg.risk.loss_cooldown_seconds = to_long(k, v);

        // Trading limits
        else if (k == "risk.max_daily_trades") cfg.risk.max_daily_trades = to_int(k, v);
        else if (k == "risk.max_daily_loss_percent") cfg.risk.max_daily_loss_percent = to_double(k, v);
        else if (k == "risk.max_daily_profit_target") cfg.risk.max_daily_profit_target = to_double(k, v);
        else if (k == "risk.max_session_loss") cfg.risk.max_session_loss = to_double(k, v);

        // Replay harness
        else if (k == "replay.candles_file") cfg.replay.candles_file = v;
        else if (k == "replay.output_directory") cfg.replay.output_directory = v;
        else if (k == "replay.payout_rate") cfg.replay.payout_rate = to_double(k, v);
        else if (k == "replay.stake_amount") cfg.replay.stake_amount = to_double(k, v);
        else if (k == "replay.initial_balance") cfg.replay.initial_balance = to_double(k, v);
        else if (k == "replay.contract_duration_seconds") cfg.replay.contract_duration_seconds = to_long(k, v);
        else if (k == "replay.warmup_candles") cfg.replay.warmup_candles = to_int(k, v);
        else if (k == "replay.max_trades") cfg.replay.max_trades = to_int(k, v);
        else if (k == "replay.min_trade_interval_seconds") cfg.replay.min_trade_interval_seconds = to_long(k, v);
        else if (k == "replay.progress_log_interval_candles") cfg.replay.progress_log_interval_candles = to_int(k, v);

        // Indicators
        else if (k == "indicators.bollinger_period") cfg.indicators.bollinger_period = to_int(k, v);
        else if (k == "indicators.bollinger_standard_deviations") cfg.indicators.bollinger_standard_deviations = to_double(k, v);
        else if (k == "indicators.rsi_period") cfg.indicators.rsi_period = to_int(k, v);
        else if (k == "indicators.stochastic_k_period") cfg.indicators.stochastic_k_period = to_int(k, v);
        else if (k == "indicators.stochastic_k_smoothing") cfg.indicators.stochastic_k_smoothing = to_int(k, v);
        else if (k == "indicators.stochastic_d_period") cfg.indicators.stochastic_d_period = to_int(k, v);
        else if (k == "indicators.adx_period") cfg.indicators.adx_period = to_int(k, v);
        else if (k == "indicators.adx_slope_lookback") cfg.indicators.adx_slope_lookback = to_int(k, v);
        else if (k == "indicators.ema_fast_period") cfg.indicators.ema_fast_period = to_int(k, v);
        else if (k == "indicators.ema_slow_period") cfg.indicators.ema_slow_period = to_int(k, v);
        else if (k == "indicators.macd_fast_period") cfg.indicators.macd_fast_period = to_int(k, v);
        else if (k == "indicators.macd_slow_period") cfg.indicators.macd_slow_period = to_int(k, v);
        else if (k == "indicators.macd_signal_period") cfg.indicators.macd_signal_period = to_int(k, v);
        else if (k == "indicators.divergence_lookback") cfg.indicators.divergence_lookback = to_int(k, v);
        else if (k == "indicators.rsi_oversold_level") cfg.indicators.rsi_oversold_level = to_double(k, v);
        else if (k == "indicators.rsi_overbought_level") cfg.indicators.rsi_overbought_level = to_double(k, v);
        else if (k == "indicators.stochastic_oversold_level") cfg.indicators.stochastic_oversold_level = to_double(k, v);
        else if (k == "indicators.stochastic_overbought_level") cfg.indicators.stochastic_overbought_level = to_double(k, v);
        else if (k == "indicators.minimum_bars") cfg.indicators.minimum_bars = to_int(k, v);
        else if (k == "indicators.maximum_bars") cfg.indicators.maximum_bars = to_int(k, v);

        // Logging
        else if (k == "logging.log_file") cfg.logging.log_file = v;
        else if (k == "logging.decision_log_file") cfg.logging.decision_log_file = v;
        else if (k == "logging.trade_log_file") cfg.logging.trade_log_file = v;
        else if (k == "logging.summary_file") cfg.logging.summary_file = v;
        else if (k == "logging.log_every_decision") cfg.logging.log_every_decision = to_bool(k, v);
        else if (k == "logging.log_score_factors") cfg.logging.log_score_factors = to_bool(k, v);
        else if (k == "logging.logging_poll_interval_milliseconds") cfg.logging.logging_poll_interval_milliseconds = to_int(k, v);

        else {
            throw std::runtime_error("Unknown configuration key '" + k + "' in " + csv_path);
        }
    }
    return true;
}

int load_system_config(ConfluenceTrader::Config::SystemConfig& config, const std::string& config_directory) {
    for (const auto& config_file_name : get_config_file_names()) {
        std::string config_path = config_directory + "/" + config_file_name;
        try {
            if (!load_config_from_csv(config, config_path)) {
                log_message("ERROR: Failed to load config CSV from " + config_path, "");
                return 1;
            }
        } catch (const std::exception& config_exception_error) {
            log_message("ERROR: " + std::string(config_exception_error.what()), "");
            return 1;
        }
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }
    return 0;
}

bool validate_config(const ConfluenceTrader::Config::SystemConfig& config, std::string& error_message) {
    const StrategyConfig& strategy = config.strategy;
    const SessionConfig& session = config.session;
    const ReplayConfig& replay = config.replay;
    const IndicatorConfig& indicators = config.indicators;

    // Market mode hysteresis
    if (!is_percentage(strategy.adx_range_entry_threshold) || !is_percentage(strategy.adx_trend_entry_threshold)) {
        error_message = "strategy.adx_*_entry_threshold must be within (0, 100)";
        return false;
    }
    if (strategy.adx_range_entry_threshold >= strategy.adx_trend_entry_threshold) {
        error_message = "strategy.adx_range_entry_threshold must be strictly below strategy.adx_trend_entry_threshold";
        return false;
    }

    // Decision thresholds
    if (strategy.minimum_confidence < 0.0 || strategy.minimum_confidence > 100.0) {
        error_message = "strategy.minimum_confidence must be within [0, 100]";
        return false;
    }
    if (strategy.minimum_timeframe_agreement < 1 || strategy.minimum_timeframe_agreement > 3) {
        error_message = "strategy.minimum_timeframe_agreement must be 1, 2 or 3";
        return false;
    }

    // Weights
    const double positive_weights[] = {
        strategy.m15_confirmation_points, strategy.m5_setup_points, strategy.macd_agreement_points,
        strategy.m1_stochastic_trigger_points, strategy.m1_reversal_pattern_points, strategy.confluence_bonus_points,
        strategy.adx_acceleration_points, session.high_liquidity_bonus_points
    };
    double positive_weight_total = 0.0;
    for (double weight : positive_weights) {
        if (weight < 0.0) {
            error_message = "Scoring weights and session bonus must be >= 0";
            return false;
        }
        positive_weight_total += weight;
    }
    if (strategy.adx_slope_threshold < 0.0) {
        error_message = "strategy.adx_slope_threshold must be >= 0";
        return false;
    }

    // RSI and %B thresholds
    if (!is_percentage(strategy.rsi_extension_rise_limit) || !is_percentage(strategy.rsi_extension_fall_limit) ||
        !is_percentage(strategy.trend_pullback_rise_rsi_floor) || !is_percentage(strategy.trend_pullback_fall_rsi_ceiling) ||
        !is_percentage(strategy.stochastic_midline) ||
        !is_percentage(strategy.tier1_rsi_limit) || !is_percentage(strategy.tier2_rsi_limit)) {
        error_message = "RSI and stochastic thresholds must be within (0, 100)";
        return false;
    }
    if (!is_unit_interval(strategy.trend_pullback_percent_b) || !is_unit_interval(strategy.range_band_touch_percent_b) ||
        !is_unit_interval(strategy.tier1_percent_b_limit) || !is_unit_interval(strategy.tier2_percent_b_limit)) {
        error_message = "%B thresholds must be within [0, 1]";
        return false;
    }
    if (strategy.tier1_rsi_limit > strategy.tier2_rsi_limit || strategy.tier1_percent_b_limit > strategy.tier2_percent_b_limit) {
        error_message = "Counter-trend tier 1 limits must be at least as strict as tier 2";
        return false;
    }

    // Sessions
    if (!windows_are_valid(session.high_liquidity_windows) || !windows_are_valid(session.off_peak_windows) ||
        !windows_are_valid(session.avoid_windows)) {
        error_message = "Session windows need distinct start/end minutes within a day";
        return false;
    }
    if (session.off_peak_penalty_points < 0.0) {
        error_message = "session.off_peak_penalty_points must be >= 0";
        return false;
    }
    if (session.avoid_window_penalty_points < positive_weight_total) {
        error_message = "session.avoid_window_penalty_points must be at least the sum of all positive weights (" +
                        std::to_string(positive_weight_total) + ")";
        return false;
    }

    // Loss-streak guard
    if (config.risk.max_consecutive_losses < 1) {
        error_message = "risk.max_consecutive_losses must be >= 1";
        return false;
    }
    if (config.risk.loss_cooldown_seconds < 0) {
        error_message = "risk.loss_cooldown_seconds must be >= 0 (0 = hard stop)";
        return false;
    }

    // Trading limits
    if (config.risk.max_daily_trades < 0) {
        error_message = "risk.max_daily_trades must be >= 0 (0 = unlimited)";
        return false;
    }
    if (!(config.risk.max_daily_loss_percent >= 0.0 && config.risk.max_daily_loss_percent <= 100.0)) {
        error_message = "risk.max_daily_loss_percent must be within [0, 100] (0 = disabled)";
        return false;
    }
    if (!(config.risk.max_daily_profit_target >= 0.0 && std::isfinite(config.risk.max_daily_profit_target)) ||
        !(config.risk.max_session_loss >= 0.0 && std::isfinite(config.risk.max_session_loss))) {
        error_message = "risk.max_daily_profit_target and risk.max_session_loss must be finite and >= 0 (0 = disabled)";
        return false;
    }

    // Replay
    if (!(replay.payout_rate > 0.0 && replay.payout_rate <= 10.0)) {
        error_message = "replay.payout_rate must be within (0, 10]";
        return false;
    }
    if (replay.stake_amount <= 0.0 || replay.initial_balance <= 0.0) {
        error_message = "replay.stake_amount and replay.initial_balance must be > 0";
        return false;
    }
    if (replay.contract_duration_seconds <= 0 || replay.contract_duration_seconds % TimeUtils::SECONDS_PER_MINUTE != 0) {
        error_message = "replay.contract_duration_seconds must be a positive multiple of 60";
        return false;
    }
    if (replay.warmup_candles < 0 || replay.max_trades < 0 || replay.min_trade_interval_seconds < 0 ||
        replay.progress_log_interval_candles < 0) {
        error_message = "replay warmup, max_trades, min_trade_interval and progress interval must be >= 0";
        return false;
    }

    // Indicators
    const int indicator_periods[] = {
        indicators.bollinger_period, indicators.rsi_period, indicators.stochastic_k_period, indicators.stochastic_k_smoothing,
        indicators.stochastic_d_period, indicators.adx_period, indicators.adx_slope_lookback, indicators.ema_fast_period,
        indicators.ema_slow_period, indicators.macd_fast_period, indicators.macd_slow_period, indicators.macd_signal_period,
        indicators.divergence_lookback, indicators.minimum_bars
    };
    for (int period : indicator_periods) {
        if (period <= 0) {
            error_message = "Indicator periods and indicators.minimum_bars must be > 0";
            return false;
        }
    }
    if (indicators.bollinger_standard_deviations <= 0.0) {
        error_message = "indicators.bollinger_standard_deviations must be > 0";
        return false;
    }
    if (indicators.macd_fast_period >= indicators.macd_slow_period || indicators.ema_fast_period >= indicators.ema_slow_period) {
        error_message = "Fast MACD/EMA periods must be below their slow periods";
        return false;
    }
    if (indicators.maximum_bars < ConfluenceTrader::Core::get_minimum_bars_for_snapshot(indicators)) {
        error_message = "indicators.maximum_bars must be >= " +
                        std::to_string(ConfluenceTrader::Core::get_minimum_bars_for_snapshot(indicators));
        return false;
    }

    // Logging
    if (config.logging.log_file.empty() || config.logging.decision_log_file.empty() ||
        config.logging.trade_log_file.empty() || config.logging.summary_file.empty()) {
        error_message = "logging file names must not be empty";
        return false;
    }
    if (config.logging.logging_poll_interval_milliseconds <= 0) {
        error_message = "logging.logging_poll_interval_milliseconds must be > 0";
        return false;
    }
    return true;
}
