#include "signal_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ConfluenceTrader {
namespace Core {

namespace {
    constexpr double MINIMUM_CONFIDENCE = 0.0;
    constexpr double MAXIMUM_CONFIDENCE = 100.0;

    std::string format_points(double points_value) {
        std::ostringstream points_stream;
        points_stream << "(" << std::showpos << std::fixed << std::setprecision(1) << points_value << ")";
        return points_stream.str();
    }

    std::string format_value(double value) {
        std::ostringstream value_stream;
        value_stream << std::fixed << std::setprecision(2) << value;
        return value_stream.str();
    }

    bool bias_opposes(HigherTimeframeBias bias, TradeSide side) {
        return (side == TradeSide::RISE && bias == HigherTimeframeBias::BEARISH) ||
               (side == TradeSide::FALL && bias == HigherTimeframeBias::BULLISH);
    }

    bool bias_matches(HigherTimeframeBias bias, TradeSide side) {
        return (side == TradeSide::RISE && bias == HigherTimeframeBias::BULLISH) ||
               (side == TradeSide::FALL && bias == HigherTimeframeBias::BEARISH);
    }
}

std::string higher_timeframe_bias_to_string(HigherTimeframeBias bias) {
    switch (bias) {
        case HigherTimeframeBias::BULLISH: return "bullish";
        case HigherTimeframeBias::BEARISH: return "bearish";
        case HigherTimeframeBias::NEUTRAL: return "neutral";
    }
    return "unknown";
}

SignalScorer::SignalScorer(const StrategyConfig& strategy_config, const SessionConfig& session_config)
    : strategy(strategy_config), session_filter(session_config),
      maximum_penalty_points(std::max(session_config.avoid_window_penalty_points, MAXIMUM_CONFIDENCE)) {
    // Gates first so no additive evidence is collected for a side that cannot trade
    rules = {
        {"extension_gate", &SignalScorer::evaluate_extension_gate},
        {"trend_direction_gate", &SignalScorer::evaluate_trend_direction_gate},
        {"counter_trend_gate", &SignalScorer::evaluate_counter_trend_gate},
        {"m15_confirmation", &SignalScorer::evaluate_m15_confirmation},
        {"m5_setup", &SignalScorer::evaluate_m5_setup},
        {"macd_agreement", &SignalScorer::evaluate_macd_agreement},
        {"m1_stochastic_trigger", &SignalScorer::evaluate_m1_stochastic_trigger},
        {"m1_reversal_pattern", &SignalScorer::evaluate_m1_reversal_pattern},
        {"confluence_bonus", &SignalScorer::evaluate_confluence_bonus},
        {"trend_acceleration", &SignalScorer::evaluate_trend_acceleration},
        {"session_adjustment", &SignalScorer::evaluate_session_adjustment}
    };

    counter_trend_tiers = {
        {"Tier 1", strategy.tier1_rsi_limit, strategy.tier1_percent_b_limit, ReversalEvidence::REVERSAL_HINT},
        {"Tier 2", strategy.tier2_rsi_limit, strategy.tier2_percent_b_limit, ReversalEvidence::PRICE_ACTION_CONFIRMATION}
    };
}

ScoreResult SignalScorer::score(MarketMode market_mode, const IndicatorSnapshot& m1, const IndicatorSnapshot& m5,
                                const IndicatorSnapshot& m15, long long now) const {
    ScoreResult score_result;
    score_result.rise = score_side(TradeSide::RISE, market_mode, m1, m5, m15, now);
    score_result.fall = score_side(TradeSide::FALL, market_mode, m1, m5, m15, now);
    return score_result;
}

SideScore SignalScorer::score_side(TradeSide side, MarketMode market_mode, const IndicatorSnapshot& m1, const IndicatorSnapshot& m5,
                                   const IndicatorSnapshot& m15, long long now) const {
    SideScore side_score;
    if (side == TradeSide::NONE) {
        return side_score;
    }

    ScoringContext context{side, market_mode, m1, m5, m15, now, get_higher_timeframe_bias(m15)};
    double accumulated_points = 0.0;

    for (const auto& rule : rules) {
        RuleVerdict verdict = (this->*rule.evaluate)(context, side_score);

        if (verdict.veto) {
            SideScore vetoed_score;
            vetoed_score.vetoed = true;
            vetoed_score.veto_reason = rule.name + ": " + verdict.factor;
            vetoed_score.factors = side_score.factors;
            vetoed_score.factors.push_back("VETO " + verdict.factor);
            return vetoed_score;
        }

        accumulated_points += clamp_contribution(verdict.points);
        if (!verdict.factor.empty()) {
            side_score.factors.push_back(verdict.factor);
        }
        side_score.confirmations.m1_confirmed = side_score.confirmations.m1_confirmed || verdict.confirms_m1;
        side_score.confirmations.m5_confirmed = side_score.confirmations.m5_confirmed || verdict.confirms_m5;
        side_score.confirmations.m15_confirmed = side_score.confirmations.m15_confirmed || verdict.confirms_m15;
    }

    side_score.confidence = std::min(MAXIMUM_CONFIDENCE, std::max(MINIMUM_CONFIDENCE, accumulated_points));
    side_score.agree_count = side_score.confirmations.agree_count();
    return side_score;
}

double SignalScorer::clamp_contribution(double points_value) const {
    if (!std::isfinite(points_value)) {
        return 0.0;
    }
    return std::min(MAXIMUM_CONFIDENCE, std::max(-maximum_penalty_points, points_value));
}

HigherTimeframeBias SignalScorer::get_higher_timeframe_bias(const IndicatorSnapshot& m15) {
    if (!m15.valid) {
        return HigherTimeframeBias::NEUTRAL;
    }
    if (m15.close_price > m15.ema_fast && m15.plus_di > m15.minus_di) {
        return HigherTimeframeBias::BULLISH;
    }
    if (m15.close_price < m15.ema_fast && m15.minus_di > m15.plus_di) {
        return HigherTimeframeBias::BEARISH;
    }
    return HigherTimeframeBias::NEUTRAL;
}

bool SignalScorer::passes_counter_trend_tier(const CounterTrendTier& tier, const ScoringContext& context) const {
    const IndicatorSnapshot& m5 = context.m5;
    const IndicatorSnapshot& m1 = context.m1;

    bool rsi_extreme = context.is_rise() ? m5.rsi < tier.rsi_limit : m5.rsi > (100.0 - tier.rsi_limit);
    bool percent_b_extreme = context.is_rise() ? m5.bollinger_percent_b <= tier.percent_b_limit
                                               : m5.bollinger_percent_b >= (1.0 - tier.percent_b_limit);

    bool evidence_present = false;
    switch (tier.required_evidence) {
        case ReversalEvidence::REVERSAL_HINT:
            evidence_present = context.is_rise() ? (m1.bullish_pattern || m5.bullish_divergence)
                                                 : (m1.bearish_pattern || m5.bearish_divergence);
            break;
        case ReversalEvidence::PRICE_ACTION_CONFIRMATION:
            evidence_present = context.is_rise() ? m1.bullish_price_action : m1.bearish_price_action;
            break;
    }

    return rsi_extreme && percent_b_extreme && evidence_present;
}

// ========================================================================
// GATES
// ========================================================================

RuleVerdict SignalScorer::evaluate_extension_gate(const ScoringContext& context, const SideScore&) const {
    if (!context.is_trending()) {
        return RuleVerdict::pass();
    }
    if (context.is_rise() && context.m5.rsi > strategy.rsi_extension_rise_limit) {
        return RuleVerdict::reject("M5 RSI " + format_value(context.m5.rsi) + " above extension limit " + format_value(strategy.rsi_extension_rise_limit));
    }
    if (!context.is_rise() && context.m5.rsi < strategy.rsi_extension_fall_limit) {
        return RuleVerdict::reject("M5 RSI " + format_value(context.m5.rsi) + " below extension limit " + format_value(strategy.rsi_extension_fall_limit));
    }
    return RuleVerdict::pass();
}

RuleVerdict SignalScorer::evaluate_trend_direction_gate(const ScoringContext& context, const SideScore&) const {
    if (context.market_mode == MarketMode::TRENDING_UP && !context.is_rise()) {
        return RuleVerdict::reject("Fall against active up-trend");
    }
    if (context.market_mode == MarketMode::TRENDING_DOWN && context.is_rise()) {
        return RuleVerdict::reject("Rise against active down-trend");
    }
    return RuleVerdict::pass();
}

RuleVerdict SignalScorer::evaluate_counter_trend_gate(const ScoringContext& context, const SideScore&) const {
    if (context.is_trending() || !bias_opposes(context.m15_bias, context.side)) {
        return RuleVerdict::pass();
    }

    for (const auto& tier : counter_trend_tiers) {
        if (passes_counter_trend_tier(tier, context)) {
            return RuleVerdict::add(0.0, "Counter-trend " + tier.name + " passed");
        }
    }
    return RuleVerdict::reject("Counter-trend setup failed every tier (M15 " + higher_timeframe_bias_to_string(context.m15_bias) + ")");
}

// ========================================================================
// ADDITIVE RULES
// ========================================================================

RuleVerdict SignalScorer::evaluate_m15_confirmation(const ScoringContext& context, const SideScore&) const {
    if (!bias_matches(context.m15_bias, context.side)) {
        return RuleVerdict::pass();
    }
    return RuleVerdict::add(strategy.m15_confirmation_points,
                            "M15 bias " + higher_timeframe_bias_to_string(context.m15_bias) + " " + format_points(strategy.m15_confirmation_points))
        .confirming(Timeframe::MINUTE_15);
}

RuleVerdict SignalScorer::evaluate_m5_setup(const ScoringContext& context, const SideScore&) const {
    const IndicatorSnapshot& m5 = context.m5;

    if (context.is_trending()) {
        bool pullback_present = context.is_rise() ? m5.bollinger_percent_b <= strategy.trend_pullback_percent_b
                                                  : m5.bollinger_percent_b >= (1.0 - strategy.trend_pullback_percent_b);
        bool rsi_in_band = context.is_rise()
            ? (m5.rsi >= strategy.trend_pullback_rise_rsi_floor && m5.rsi <= strategy.rsi_extension_rise_limit)
            : (m5.rsi <= strategy.trend_pullback_fall_rsi_ceiling && m5.rsi >= strategy.rsi_extension_fall_limit);
        if (!pullback_present || !rsi_in_band) {
            return RuleVerdict::pass();
        }
        std::string setup_name = context.is_rise() ? "M5 pullback in up-trend" : "M5 rally in down-trend";
        return RuleVerdict::add(strategy.m5_setup_points, setup_name + " %B " + format_value(m5.bollinger_percent_b) + " " + format_points(strategy.m5_setup_points))
            .confirming(Timeframe::MINUTE_5);
    }

    bool band_touch = context.is_rise() ? m5.bollinger_percent_b <= strategy.range_band_touch_percent_b
                                        : m5.bollinger_percent_b >= (1.0 - strategy.range_band_touch_percent_b);
    bool rsi_extreme = context.is_rise() ? m5.rsi_oversold : m5.rsi_overbought;
    bool divergence_present = context.is_rise() ? m5.bullish_divergence : m5.bearish_divergence;
    if (!band_touch || !rsi_extreme || !divergence_present) {
        return RuleVerdict::pass();
    }
    std::string setup_name = context.is_rise() ? "M5 lower-band reversal" : "M5 upper-band reversal";
    return RuleVerdict::add(strategy.m5_setup_points, setup_name + " RSI " + format_value(m5.rsi) + " " + format_points(strategy.m5_setup_points))
        .confirming(Timeframe::MINUTE_5);
}

RuleVerdict SignalScorer::evaluate_macd_agreement(const ScoringContext& context, const SideScore&) const {
    bool macd_agrees = context.is_rise() ? context.m5.macd_bullish : context.m5.macd_bearish;
    if (!macd_agrees) {
        return RuleVerdict::pass();
    }
    return RuleVerdict::add(strategy.macd_agreement_points, "M5 MACD agrees " + format_points(strategy.macd_agreement_points));
}

RuleVerdict SignalScorer::evaluate_m1_stochastic_trigger(const ScoringContext& context, const SideScore&) const {
    const IndicatorSnapshot& m1 = context.m1;
    bool trigger_present = context.is_rise()
        ? (m1.stochastic_bullish_cross && m1.stochastic_k < strategy.stochastic_midline)
        : (m1.stochastic_bearish_cross && m1.stochastic_k > strategy.stochastic_midline);
    if (!trigger_present) {
        return RuleVerdict::pass();
    }
    std::string cross_name = context.is_rise() ? "M1 stochastic bullish cross" : "M1 stochastic bearish cross";
    return RuleVerdict::add(strategy.m1_stochastic_trigger_points, cross_name + " %K " + format_value(m1.stochastic_k) + " " + format_points(strategy.m1_stochastic_trigger_points))
        .confirming(Timeframe::MINUTE_1);
}

RuleVerdict SignalScorer::evaluate_m1_reversal_pattern(const ScoringContext& context, const SideScore&) const {
    bool pattern_present = context.is_rise() ? context.m1.bullish_pattern : context.m1.bearish_pattern;
    if (!pattern_present) {
        return RuleVerdict::pass();
    }
    std::string pattern_name = context.is_rise() ? "M1 bullish reversal pattern" : "M1 bearish reversal pattern";
    return RuleVerdict::add(strategy.m1_reversal_pattern_points, pattern_name + " " + format_points(strategy.m1_reversal_pattern_points))
        .confirming(Timeframe::MINUTE_1);
}

RuleVerdict SignalScorer::evaluate_confluence_bonus(const ScoringContext&, const SideScore& accumulated) const {
    if (!accumulated.confirmations.all_confirmed()) {
        return RuleVerdict::pass();
    }
    return RuleVerdict::add(strategy.confluence_bonus_points, "Full M1/M5/M15 confluence " + format_points(strategy.confluence_bonus_points));
}

RuleVerdict SignalScorer::evaluate_trend_acceleration(const ScoringContext& context, const SideScore&) const {
    if (!context.is_trending()) {
        return RuleVerdict::pass();
    }
    if (context.m5.adx_slope > strategy.adx_slope_threshold) {
        return RuleVerdict::add(strategy.adx_acceleration_points, "M5 ADX rising " + format_points(strategy.adx_acceleration_points));
    }
    if (context.m5.adx_slope < -strategy.adx_slope_threshold) {
        return RuleVerdict::add(-strategy.adx_acceleration_points, "M5 ADX falling " + format_points(-strategy.adx_acceleration_points));
    }
    return RuleVerdict::pass();
}

RuleVerdict SignalScorer::evaluate_session_adjustment(const ScoringContext& context, const SideScore&) const {
    SessionAdjustment session_adjustment = session_filter.evaluate(context.now);
    if (session_adjustment.label.empty()) {
        return RuleVerdict::pass();
    }
    return RuleVerdict::add(session_adjustment.points, session_adjustment.label + " " + format_points(session_adjustment.points));
}

} // namespace Core
} // namespace ConfluenceTrader
