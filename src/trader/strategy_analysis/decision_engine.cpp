#include "decision_engine.hpp"
#include "trader/strategy_analysis/decision_selector.hpp"
#include "logging/logs/signal_analysis_logs.hpp"
#include "logging/logs/risk_logs.hpp"
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

using ConfluenceTrader::Logging::SignalAnalysisLogs;
using ConfluenceTrader::Logging::RiskLogs;

DecisionEngine::DecisionEngine(const ConfluenceTrader::Config::SystemConfig& system_config, MarketModeState& mode_state, LossStreakGuard& guard)
    : config(system_config),
      classifier(system_config.strategy),
      scorer(system_config.strategy, system_config.session),
      market_mode_state(mode_state),
      loss_streak_guard(guard),
      next_decision_id(1) {}

std::string DecisionEngine::describe_invalid_snapshots(const IndicatorSnapshot& m1, const IndicatorSnapshot& m5, const IndicatorSnapshot& m15) {
    std::string invalid_timeframes;
    if (!m1.valid) invalid_timeframes += " M1";
    if (!m5.valid) invalid_timeframes += " M5";
    if (!m15.valid) invalid_timeframes += " M15";
    return "Insufficient indicator history:" + invalid_timeframes;
}

TradeSignal DecisionEngine::evaluate(const IndicatorSnapshot& m1, const IndicatorSnapshot& m5, const IndicatorSnapshot& m15, long long now) {
    TradeSignal trade_signal;

    if (!m1.valid || !m5.valid || !m15.valid) {
        trade_signal.market_mode = market_mode_state.get_mode();
        trade_signal.price = m1.close_price;
        trade_signal.timestamp = now;
        trade_signal.factors.push_back(describe_invalid_snapshots(m1, m5, m15));
    } else {
        MarketMode market_mode = market_mode_state.update_from_m5_close(classifier, m5);
        ScoreResult score_result = scorer.score(market_mode, m1, m5, m15, now);
        trade_signal = DecisionSelector::build_signal(score_result, market_mode, m1.close_price, now,
                                                      config.strategy.minimum_confidence, config.strategy.minimum_timeframe_agreement);
        if (config.logging.log_every_decision) {
            SignalAnalysisLogs::log_score_breakdown(score_result, market_mode, now, config.logging.log_score_factors);
        }
    }

    trade_signal.decision_id = next_decision_id.fetch_add(1);

    // The guard is consulted last so score magnitude can never bypass it
    TradeSignal gated_signal = loss_streak_guard.gate(trade_signal, now);
    if (config.logging.log_every_decision) {
        SignalAnalysisLogs::log_decision(gated_signal);
    }
    return gated_signal;
}

void DecisionEngine::register_execution(const TradeSignal& signal) {
    if (signal.side == TradeSide::NONE) {
        throw std::runtime_error("Cannot register execution of a NONE decision (id " + std::to_string(signal.decision_id) + ")");
    }
    std::lock_guard<std::mutex> outstanding_lock(outstanding_mutex);
    outstanding_decision_ids.insert(signal.decision_id);
}

bool DecisionEngine::report_outcome(const TradeOutcome& outcome) {
    {
        std::lock_guard<std::mutex> outstanding_lock(outstanding_mutex);
        auto outstanding_iterator = outstanding_decision_ids.find(outcome.decision_id);
        if (outstanding_iterator == outstanding_decision_ids.end()) {
            RiskLogs::log_unknown_outcome(outcome.decision_id, trade_result_to_string(outcome.result));
            return false;
        }
        outstanding_decision_ids.erase(outstanding_iterator);
    }

    loss_streak_guard.record_outcome(outcome.result, outcome.settled_at);
    return true;
}

size_t DecisionEngine::get_outstanding_decision_count() const {
    std::lock_guard<std::mutex> outstanding_lock(outstanding_mutex);
    return outstanding_decision_ids.size();
}

} // namespace Core
} // namespace ConfluenceTrader
