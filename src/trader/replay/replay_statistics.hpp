#ifndef REPLAY_STATISTICS_HPP
#define REPLAY_STATISTICS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

struct ReplayRecord;

struct ReplayStatistics {
    size_t cycles_evaluated = 0;
    size_t rise_signals = 0;
    size_t fall_signals = 0;
    size_t none_signals = 0;
    size_t guard_blocked_signals = 0;
    std::map<std::string, size_t> market_mode_distribution;     // cycles per mode name

    size_t trades_settled = 0;
    size_t trades_unsettled = 0;
    size_t wins = 0;
    size_t losses = 0;
    size_t ties = 0;

    double win_rate = 0.0;                  // wins / (wins + losses), ties excluded
    double profit_factor = 0.0;             // gross wins / gross losses, infinity with wins and no losses
    double expectancy = 0.0;                // mean pnl per settled trade
    double total_pnl = 0.0;
    double initial_balance = 0.0;
    double final_balance = 0.0;
    double max_drawdown_percent = 0.0;      // largest drop from a balance peak, percent of that peak
    int max_consecutive_losses = 0;
    double average_mae = 0.0;
    double average_mfe = 0.0;
};

ReplayStatistics compute_replay_statistics(const std::vector<ReplayRecord>& records,
                                           const std::vector<SettledTrade>& settled_trades,
                                           size_t unsettled_trade_count,
                                           double initial_balance);

// Non-finite values (profit factor with no losses) are written as null.
nlohmann::json replay_statistics_to_json(const ReplayStatistics& statistics);

} // namespace Core
} // namespace ConfluenceTrader

#endif // REPLAY_STATISTICS_HPP
