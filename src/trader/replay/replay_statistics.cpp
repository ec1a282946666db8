#include "replay_statistics.hpp"
#include "trader/replay/replay_harness.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace ConfluenceTrader {
namespace Core {

ReplayStatistics compute_replay_statistics(const std::vector<ReplayRecord>& records,
                                           const std::vector<SettledTrade>& settled_trades,
                                           size_t unsettled_trade_count,
                                           double initial_balance) {
    ReplayStatistics statistics;
    statistics.initial_balance = initial_balance;
    statistics.final_balance = initial_balance;
    statistics.trades_unsettled = unsettled_trade_count;

    for (const ReplayRecord& record : records) {
        statistics.cycles_evaluated++;
        statistics.market_mode_distribution[market_mode_to_string(record.signal.market_mode)]++;
        switch (record.signal.side) {
            case TradeSide::RISE: statistics.rise_signals++; break;
            case TradeSide::FALL: statistics.fall_signals++; break;
            case TradeSide::NONE: statistics.none_signals++; break;
        }
        if (record.signal.blocked_by_guard) {
            statistics.guard_blocked_signals++;
        }
    }

    double gross_wins = 0.0;
    double gross_losses = 0.0;
    double running_balance = initial_balance;
    double peak_balance = initial_balance;
    int current_loss_streak = 0;
    double total_mae = 0.0;
    double total_mfe = 0.0;

    for (const SettledTrade& settled_trade : settled_trades) {
        statistics.trades_settled++;
        statistics.total_pnl += settled_trade.pnl;
        total_mae += settled_trade.max_adverse_excursion;
        total_mfe += settled_trade.max_favorable_excursion;

        switch (settled_trade.result) {
            case TradeResult::WIN:
                statistics.wins++;
                gross_wins += settled_trade.pnl;
                current_loss_streak = 0;
                break;
            case TradeResult::LOSS:
                statistics.losses++;
                gross_losses += -settled_trade.pnl;
                current_loss_streak++;
                statistics.max_consecutive_losses = std::max(statistics.max_consecutive_losses, current_loss_streak);
                break;
            case TradeResult::TIE:
                statistics.ties++;
                break;
        }

        running_balance += settled_trade.pnl;
        peak_balance = std::max(peak_balance, running_balance);
        if (peak_balance > 0.0) {
            double drawdown_percent = (peak_balance - running_balance) / peak_balance * 100.0;
            statistics.max_drawdown_percent = std::max(statistics.max_drawdown_percent, drawdown_percent);
        }
    }

    statistics.final_balance = running_balance;

    size_t decisive_trades = statistics.wins + statistics.losses;
    if (decisive_trades > 0) {
        statistics.win_rate = static_cast<double>(statistics.wins) / static_cast<double>(decisive_trades);
    }
    if (gross_losses > 0.0) {
        statistics.profit_factor = gross_wins / gross_losses;
    } else if (gross_wins > 0.0) {
        statistics.profit_factor = std::numeric_limits<double>::infinity();
    }
    if (statistics.trades_settled > 0) {
        double trade_count = static_cast<double>(statistics.trades_settled);
        statistics.expectancy = statistics.total_pnl / trade_count;
        statistics.average_mae = total_mae / trade_count;
        statistics.average_mfe = total_mfe / trade_count;
    }
    return statistics;
}

namespace {
    nlohmann::json finite_or_null(double value) {
        if (!std::isfinite(value)) {
            return nlohmann::json(nullptr);
        }
        return nlohmann::json(value);
    }
}

nlohmann::json replay_statistics_to_json(const ReplayStatistics& statistics) {
    nlohmann::json summary_json;
    summary_json["cycles_evaluated"] = statistics.cycles_evaluated;
    summary_json["signals"] = {
        {"rise", statistics.rise_signals},
        {"fall", statistics.fall_signals},
        {"none", statistics.none_signals},
        {"guard_blocked", statistics.guard_blocked_signals}
    };
    summary_json["market_mode_distribution"] = statistics.market_mode_distribution;
    summary_json["trades"] = {
        {"settled", statistics.trades_settled},
        {"unsettled", statistics.trades_unsettled},
        {"wins", statistics.wins},
        {"losses", statistics.losses},
        {"ties", statistics.ties}
    };
    summary_json["win_rate"] = finite_or_null(statistics.win_rate);
    summary_json["profit_factor"] = finite_or_null(statistics.profit_factor);
    summary_json["expectancy"] = finite_or_null(statistics.expectancy);
    summary_json["total_pnl"] = finite_or_null(statistics.total_pnl);
    summary_json["initial_balance"] = finite_or_null(statistics.initial_balance);
    summary_json["final_balance"] = finite_or_null(statistics.final_balance);
    summary_json["max_drawdown_percent"] = finite_or_null(statistics.max_drawdown_percent);
    summary_json["max_consecutive_losses"] = statistics.max_consecutive_losses;
    summary_json["average_mae"] = finite_or_null(statistics.average_mae);
    summary_json["average_mfe"] = finite_or_null(statistics.average_mfe);
    return summary_json;
}

} // namespace Core
} // namespace ConfluenceTrader
