#ifndef SIGNAL_SCORER_HPP
#define SIGNAL_SCORER_HPP

#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/session_filter.hpp"
#include "configs/strategy_config.hpp"
#include "configs/session_config.hpp"
#include <string>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

class SignalScorer;

enum class HigherTimeframeBias {
    BULLISH,
    BEARISH,
    NEUTRAL
};

// Inputs seen by every rule while one side is scored.
struct ScoringContext {
    TradeSide side;
    MarketMode market_mode;
    const IndicatorSnapshot& m1;
    const IndicatorSnapshot& m5;
    const IndicatorSnapshot& m15;
    long long now;
    HigherTimeframeBias m15_bias;

    bool is_rise() const { return side == TradeSide::RISE; }
    bool is_trending() const { return market_mode == MarketMode::TRENDING_UP || market_mode == MarketMode::TRENDING_DOWN; }
};

/**
 * Result of one rule: a point delta (possibly zero) or a veto that zeroes the side.
 * A rule that does not apply returns RuleVerdict::pass().
 */
struct RuleVerdict {
    bool veto;
    double points;
    std::string factor;
    bool confirms_m1;
    bool confirms_m5;
    bool confirms_m15;

    RuleVerdict() : veto(false), points(0.0), factor(), confirms_m1(false), confirms_m5(false), confirms_m15(false) {}

    static RuleVerdict pass() { return RuleVerdict(); }

    static RuleVerdict add(double points_value, const std::string& factor_text) {
        RuleVerdict verdict;
        verdict.points = points_value;
        verdict.factor = factor_text;
        return verdict;
    }

    static RuleVerdict reject(const std::string& reason_text) {
        RuleVerdict verdict;
        verdict.veto = true;
        verdict.factor = reason_text;
        return verdict;
    }

    RuleVerdict& confirming(Timeframe timeframe) {
        switch (timeframe) {
            case Timeframe::MINUTE_1: confirms_m1 = true; break;
            case Timeframe::MINUTE_5: confirms_m5 = true; break;
            case Timeframe::MINUTE_15: confirms_m15 = true; break;
        }
        return *this;
    }
};

struct ScoringRule {
    std::string name;
    RuleVerdict (SignalScorer::*evaluate)(const ScoringContext& context, const SideScore& accumulated) const;
};

enum class ReversalEvidence {
    REVERSAL_HINT,                  // M1 reversal pattern or M5 divergence in the trade direction
    PRICE_ACTION_CONFIRMATION       // M1 close broke the previous bar's extreme in the trade direction
};

// One row of the counter-trend decision table. Limits are given for the rise side and mirrored for fall.
struct CounterTrendTier {
    std::string name;
    double rsi_limit;
    double percent_b_limit;
    ReversalEvidence required_evidence;
};

/**
 * Multi-timeframe confluence scorer.
 * Each side is scored independently by running the rule pipeline in order; the first veto
 * forces that side to zero. Scoring is pure: the same inputs always give the same result.
 */
class SignalScorer {
public:
    SignalScorer(const StrategyConfig& strategy_config, const SessionConfig& session_config);

    ScoreResult score(MarketMode market_mode, const IndicatorSnapshot& m1, const IndicatorSnapshot& m5,
                      const IndicatorSnapshot& m15, long long now) const;

    SideScore score_side(TradeSide side, MarketMode market_mode, const IndicatorSnapshot& m1, const IndicatorSnapshot& m5,
                         const IndicatorSnapshot& m15, long long now) const;

    const std::vector<ScoringRule>& get_rules() const { return rules; }
    const std::vector<CounterTrendTier>& get_counter_trend_tiers() const { return counter_trend_tiers; }

    static HigherTimeframeBias get_higher_timeframe_bias(const IndicatorSnapshot& m15);
    bool passes_counter_trend_tier(const CounterTrendTier& tier, const ScoringContext& context) const;

    // Gates
    RuleVerdict evaluate_extension_gate(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_trend_direction_gate(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_counter_trend_gate(const ScoringContext& context, const SideScore& accumulated) const;

    // Additive rules
    RuleVerdict evaluate_m15_confirmation(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_m5_setup(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_macd_agreement(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_m1_stochastic_trigger(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_m1_reversal_pattern(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_confluence_bonus(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_trend_acceleration(const ScoringContext& context, const SideScore& accumulated) const;
    RuleVerdict evaluate_session_adjustment(const ScoringContext& context, const SideScore& accumulated) const;

private:
    StrategyConfig strategy;
    SessionFilter session_filter;
    double maximum_penalty_points;
    std::vector<ScoringRule> rules;
    std::vector<CounterTrendTier> counter_trend_tiers;

    double clamp_contribution(double points_value) const;
};

std::string higher_timeframe_bias_to_string(HigherTimeframeBias bias);

} // namespace Core
} // namespace ConfluenceTrader

#endif // SIGNAL_SCORER_HPP
