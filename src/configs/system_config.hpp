#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "strategy_config.hpp"
#include "session_config.hpp"
#include "risk_config.hpp"
#include "replay_config.hpp"
#include "indicator_config.hpp"
#include "logging_config.hpp"

namespace ConfluenceTrader {
namespace Config {

/**
 * Main engine configuration.
 * Strategy config covers mode classification, scoring weights and counter-trend tiers.
 * Session, risk and replay configs cover time-of-day adjustments, the loss-streak guard and the harness.
 */
struct SystemConfig {
    SystemConfig() {}

    StrategyConfig strategy;           // Mode thresholds, scoring weights, decision minimums
    SessionConfig session;             // UTC session windows and their adjustments
    RiskConfig risk;                   // Loss-streak guard
    ReplayConfig replay;               // Contract simulation and execution limits
    IndicatorConfig indicators;        // Indicator periods used to build snapshots
    LoggingConfig logging;             // Log and output file names
};

} // namespace Config
} // namespace ConfluenceTrader

#endif // SYSTEM_CONFIG_HPP
