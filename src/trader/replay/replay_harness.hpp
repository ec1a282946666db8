#ifndef REPLAY_HARNESS_HPP
#define REPLAY_HARNESS_HPP

#include "configs/system_config.hpp"
#include "logging/logger/csv_decision_logger.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/replay/replay_statistics.hpp"
#include "trader/strategy_analysis/trading_limits.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

// One evaluated cycle.
struct ReplayRecord {
    TradeSignal signal;
    bool executed = false;
    std::string skip_reason;                        // empty when executed or when the signal was NONE
    std::optional<SettledTrade> settled_trade;      // contract settled at the start of this cycle
    double running_balance = 0.0;
};

struct ReplayResult {
    std::vector<ReplayRecord> records;
    std::vector<SettledTrade> settled_trades;
    std::vector<TradeSignal> unsettled_trades;      // still open when the data ran out
    ReplayStatistics statistics;
    size_t candles_processed = 0;
    bool interrupted = false;
};

/**
 * Feeds M1 history through a fresh decision engine in timestamp order and simulates fixed-payout
 * contracts on the executed signals. Every run builds its own engine state, so two runs over the
 * same candles and configuration produce identical records and decision logs.
 */
class ReplayHarness {
public:
    ReplayHarness(const ConfluenceTrader::Config::SystemConfig& system_config,
                  std::shared_ptr<ConfluenceTrader::Logging::CSVDecisionLogger> decision_logger = nullptr);

    // Throws ReplayInputError before any cycle when the candles are not strictly increasing.
    ReplayResult run(const std::vector<Candle>& minute_candles, const std::atomic<bool>* stop_requested = nullptr);

private:
    struct OpenPosition {
        TradeSignal signal;
        long long entry_time = 0;
        double entry_price = 0.0;
        long long expiry_time = 0;
        long long exit_time = 0;
        double exit_price = 0.0;
        double stake = 0.0;
        double max_adverse_excursion = 0.0;
        double max_favorable_excursion = 0.0;
    };

    const ConfluenceTrader::Config::SystemConfig& config;
    std::shared_ptr<ConfluenceTrader::Logging::CSVDecisionLogger> csv_decision_logger;

    static void track_position_candle(OpenPosition& position, const Candle& minute_candle);
    SettledTrade settle_position(const OpenPosition& position, double balance_before) const;
    std::string get_skip_reason(const TradeSignal& signal, bool position_open, int trades_opened,
                                bool has_previous_entry, long long previous_entry_time, double balance,
                                TradingLimits& trading_limits) const;
};

TradeResult determine_trade_result(TradeSide side, double entry_price, double exit_price);

} // namespace Core
} // namespace ConfluenceTrader

#endif // REPLAY_HARNESS_HPP
