#ifndef DECISION_ENGINE_HPP
#define DECISION_ENGINE_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/market_mode_classifier.hpp"
#include "trader/strategy_analysis/signal_scorer.hpp"
#include "trader/strategy_analysis/loss_streak_guard.hpp"
#include <atomic>
#include <mutex>
#include <set>

namespace ConfluenceTrader {
namespace Core {

/**
 * One decision cycle: classify (on new M5 closes) -> score -> select -> loss-streak gate.
 * Cross-cycle state lives in the injected MarketModeState and LossStreakGuard so that
 * several engines (live, replay, tests) never share hidden state.
 */
class DecisionEngine {
public:
    DecisionEngine(const ConfluenceTrader::Config::SystemConfig& system_config, MarketModeState& mode_state, LossStreakGuard& guard);

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    TradeSignal evaluate(const IndicatorSnapshot& m1, const IndicatorSnapshot& m5, const IndicatorSnapshot& m15, long long now);

    // The execution layer opened a contract for this decision; its outcome is now expected.
    void register_execution(const TradeSignal& signal);

    // Returns false when the outcome matches no outstanding decision (logged and ignored).
    bool report_outcome(const TradeOutcome& outcome);

    size_t get_outstanding_decision_count() const;
    const SignalScorer& get_scorer() const { return scorer; }

private:
    const ConfluenceTrader::Config::SystemConfig& config;
    MarketModeClassifier classifier;
    SignalScorer scorer;
    MarketModeState& market_mode_state;
    LossStreakGuard& loss_streak_guard;

    std::atomic<unsigned long long> next_decision_id;
    mutable std::mutex outstanding_mutex;
    std::set<unsigned long long> outstanding_decision_ids;

    static std::string describe_invalid_snapshots(const IndicatorSnapshot& m1, const IndicatorSnapshot& m5, const IndicatorSnapshot& m15);
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // DECISION_ENGINE_HPP
