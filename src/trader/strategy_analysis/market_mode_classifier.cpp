#include "market_mode_classifier.hpp"
#include "logging/logs/signal_analysis_logs.hpp"
#include <cmath>
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

using ConfluenceTrader::Logging::SignalAnalysisLogs;

MarketModeClassifier::MarketModeClassifier(const StrategyConfig& strategy_config)
    : trend_entry_threshold(strategy_config.adx_trend_entry_threshold),
      range_entry_threshold(strategy_config.adx_range_entry_threshold) {
    if (!(range_entry_threshold < trend_entry_threshold)) {
        throw std::runtime_error("ADX range-entry threshold must be strictly below the trend-entry threshold");
    }
}

MarketMode MarketModeClassifier::classify(MarketMode previous_mode, double m5_adx, double m5_plus_di, double m5_minus_di) const {
    if (!std::isfinite(m5_adx) || !std::isfinite(m5_plus_di) || !std::isfinite(m5_minus_di)) {
        return previous_mode;
    }

    bool previous_mode_trending = previous_mode == MarketMode::TRENDING_UP || previous_mode == MarketMode::TRENDING_DOWN;

    if (m5_adx > trend_entry_threshold) {
        if (m5_plus_di > m5_minus_di) {
            return MarketMode::TRENDING_UP;
        }
        if (m5_minus_di > m5_plus_di) {
            return MarketMode::TRENDING_DOWN;
        }
        return previous_mode_trending ? previous_mode : MarketMode::UNCERTAIN;
    }

    if (m5_adx < range_entry_threshold) {
        return MarketMode::RANGING;
    }

    // Inside the hysteresis band the established state holds
    if (previous_mode_trending || previous_mode == MarketMode::RANGING) {
        return previous_mode;
    }
    return MarketMode::UNCERTAIN;
}

MarketModeState::MarketModeState()
    : current_mode(MarketMode::UNCERTAIN), last_classified_m5_timestamp(0), has_classified(false) {}

MarketMode MarketModeState::get_mode() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return current_mode;
}

long long MarketModeState::get_last_classified_m5_timestamp() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return last_classified_m5_timestamp;
}

MarketMode MarketModeState::update_from_m5_close(const MarketModeClassifier& classifier, const IndicatorSnapshot& m5_snapshot) {
    MarketMode previous_mode;
    MarketMode classified_mode;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex);
        if (!m5_snapshot.valid) {
            return current_mode;
        }
        if (has_classified && m5_snapshot.candle.timestamp <= last_classified_m5_timestamp) {
            return current_mode;
        }

        previous_mode = current_mode;
        current_mode = classifier.classify(current_mode, m5_snapshot.adx, m5_snapshot.plus_di, m5_snapshot.minus_di);
        last_classified_m5_timestamp = m5_snapshot.candle.timestamp;
        has_classified = true;
        classified_mode = current_mode;
    }

    if (classified_mode != previous_mode) {
        SignalAnalysisLogs::log_market_mode_change(previous_mode, classified_mode, m5_snapshot.candle.timestamp, m5_snapshot.adx);
    }
    return classified_mode;
}

void MarketModeState::reset() {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    current_mode = MarketMode::UNCERTAIN;
    last_classified_m5_timestamp = 0;
    has_classified = false;
}

} // namespace Core
} // namespace ConfluenceTrader
