#include "replay_harness.hpp"
#include "logging/logs/replay_logs.hpp"
#include "trader/market_data/candle_file_reader.hpp"
#include "trader/market_data/multi_timeframe_manager.hpp"
#include "trader/strategy_analysis/decision_engine.hpp"
#include "trader/strategy_analysis/loss_streak_guard.hpp"
#include "trader/strategy_analysis/market_mode_classifier.hpp"
#include <algorithm>
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

using ConfluenceTrader::Logging::ReplayLogs;

TradeResult determine_trade_result(TradeSide side, double entry_price, double exit_price) {
    if (exit_price == entry_price) {
        return TradeResult::TIE;
    }
    if (side == TradeSide::RISE) {
        return exit_price > entry_price ? TradeResult::WIN : TradeResult::LOSS;
    }
    if (side == TradeSide::FALL) {
        return exit_price < entry_price ? TradeResult::WIN : TradeResult::LOSS;
    }
    throw std::runtime_error("Cannot settle a contract without a side");
}

ReplayHarness::ReplayHarness(const ConfluenceTrader::Config::SystemConfig& system_config,
                             std::shared_ptr<ConfluenceTrader::Logging::CSVDecisionLogger> decision_logger)
    : config(system_config), csv_decision_logger(std::move(decision_logger)) {}

void ReplayHarness::track_position_candle(OpenPosition& position, const Candle& minute_candle) {
    double adverse_move = 0.0;
    double favorable_move = 0.0;
    if (position.signal.side == TradeSide::RISE) {
        adverse_move = position.entry_price - minute_candle.low_price;
        favorable_move = minute_candle.high_price - position.entry_price;
    } else {
        adverse_move = minute_candle.high_price - position.entry_price;
        favorable_move = position.entry_price - minute_candle.low_price;
    }
    position.max_adverse_excursion = std::max(position.max_adverse_excursion, adverse_move);
    position.max_favorable_excursion = std::max(position.max_favorable_excursion, favorable_move);
    position.exit_price = minute_candle.close_price;
    position.exit_time = minute_candle.timestamp + timeframe_seconds(Timeframe::MINUTE_1);
}

SettledTrade ReplayHarness::settle_position(const OpenPosition& position, double balance_before) const {
    SettledTrade settled_trade;
    settled_trade.decision_id = position.signal.decision_id;
    settled_trade.side = position.signal.side;
    settled_trade.market_mode = position.signal.market_mode;
    settled_trade.confidence = position.signal.confidence;
    settled_trade.entry_time = position.entry_time;
    settled_trade.entry_price = position.entry_price;
    settled_trade.expiry_time = position.expiry_time;
    settled_trade.exit_time = position.exit_time;
    settled_trade.exit_price = position.exit_price;
    settled_trade.result = determine_trade_result(position.signal.side, position.entry_price, position.exit_price);
    settled_trade.stake = position.stake;

    switch (settled_trade.result) {
        case TradeResult::WIN: settled_trade.pnl = position.stake * config.replay.payout_rate; break;
        case TradeResult::LOSS: settled_trade.pnl = -position.stake; break;
        case TradeResult::TIE: settled_trade.pnl = 0.0; break;
    }
    settled_trade.balance_after = balance_before + settled_trade.pnl;
    settled_trade.max_adverse_excursion = position.max_adverse_excursion;
    settled_trade.max_favorable_excursion = position.max_favorable_excursion;
    return settled_trade;
}

std::string ReplayHarness::get_skip_reason(const TradeSignal& signal, bool position_open, int trades_opened,
                                           bool has_previous_entry, long long previous_entry_time, double balance,
                                           TradingLimits& trading_limits) const {
    if (signal.side == TradeSide::NONE) {
        return "";
    }
    if (position_open) {
        return "position open";
    }
    if (config.replay.max_trades > 0 && trades_opened >= config.replay.max_trades) {
        return "max trades reached";
    }
    if (has_previous_entry && signal.timestamp - previous_entry_time < config.replay.min_trade_interval_seconds) {
        return "min trade interval";
    }
    std::string limit_reason = trading_limits.get_block_reason(signal.timestamp);
    if (!limit_reason.empty()) {
        return limit_reason;
    }
    if (balance < config.replay.stake_amount) {
        return "insufficient balance";
    }
    return "";
}

ReplayResult ReplayHarness::run(const std::vector<Candle>& minute_candles, const std::atomic<bool>* stop_requested) {
    validate_candle_sequence(minute_candles);

    MultiTimeframeManager timeframe_manager(config.indicators);
    MarketModeState market_mode_state;
    LossStreakGuard loss_streak_guard(config.risk);
    DecisionEngine decision_engine(config, market_mode_state, loss_streak_guard);
    TradingLimits trading_limits(config.risk, config.replay.initial_balance);

    ReplayResult replay_result;
    std::optional<OpenPosition> open_position;
    double running_balance = config.replay.initial_balance;
    int trades_opened = 0;
    bool has_previous_entry = false;
    long long previous_entry_time = 0;
    const size_t warmup_candles = static_cast<size_t>(std::max(0, config.replay.warmup_candles));

    for (const Candle& minute_candle : minute_candles) {
        if (stop_requested && stop_requested->load()) {
            replay_result.interrupted = true;
            ReplayLogs::log_replay_interrupted(minute_candle.timestamp, replay_result.candles_processed);
            break;
        }
        if (config.replay.max_trades > 0 && trades_opened >= config.replay.max_trades && !open_position) {
            ReplayLogs::log_max_trades_reached(trades_opened, minute_candle.timestamp);
            break;
        }

        timeframe_manager.process_minute_candle(minute_candle);
        replay_result.candles_processed++;
        const long long cycle_time = minute_candle.timestamp + timeframe_seconds(Timeframe::MINUTE_1);

        // Settle before evaluating so the guard sees the outcome in this cycle
        std::optional<SettledTrade> settled_this_cycle;
        if (open_position) {
            if (cycle_time <= open_position->expiry_time) {
                track_position_candle(*open_position, minute_candle);
            }
            if (cycle_time >= open_position->expiry_time) {
                SettledTrade settled_trade = settle_position(*open_position, running_balance);
                running_balance = settled_trade.balance_after;
                trading_limits.record_settlement(settled_trade.pnl, settled_trade.expiry_time);
                TradeOutcome trade_outcome(settled_trade.decision_id, settled_trade.result, settled_trade.pnl, settled_trade.expiry_time);
                if (!decision_engine.report_outcome(trade_outcome)) {
                    throw std::runtime_error("Replay settled decision " + std::to_string(settled_trade.decision_id) +
                                             " that the engine does not track");
                }
                ReplayLogs::log_trade_settled(settled_trade);
                if (csv_decision_logger) {
                    csv_decision_logger->log_trade(settled_trade);
                }
                replay_result.settled_trades.push_back(settled_trade);
                settled_this_cycle = settled_trade;
                open_position.reset();
            }
        }

        if (config.replay.progress_log_interval_candles > 0 &&
            replay_result.candles_processed % static_cast<size_t>(config.replay.progress_log_interval_candles) == 0) {
            ReplayLogs::log_progress(replay_result.candles_processed, minute_candles.size(), cycle_time,
                                     running_balance, replay_result.settled_trades.size());
        }

        if (replay_result.candles_processed < warmup_candles) {
            continue;
        }

        TradeSignal trade_signal = decision_engine.evaluate(timeframe_manager.get_latest_snapshot(Timeframe::MINUTE_1),
                                                            timeframe_manager.get_latest_snapshot(Timeframe::MINUTE_5),
                                                            timeframe_manager.get_latest_snapshot(Timeframe::MINUTE_15),
                                                            cycle_time);

        ReplayRecord replay_record;
        replay_record.signal = trade_signal;
        replay_record.settled_trade = settled_this_cycle;
        replay_record.skip_reason = get_skip_reason(trade_signal, open_position.has_value(), trades_opened,
                                                    has_previous_entry, previous_entry_time, running_balance,
                                                    trading_limits);

        if (trade_signal.side != TradeSide::NONE && replay_record.skip_reason.empty()) {
            decision_engine.register_execution(trade_signal);

            OpenPosition new_position;
            new_position.signal = trade_signal;
            new_position.entry_time = cycle_time;
            new_position.entry_price = minute_candle.close_price;
            new_position.expiry_time = cycle_time + config.replay.contract_duration_seconds;
            new_position.exit_time = cycle_time;
            new_position.exit_price = minute_candle.close_price;
            new_position.stake = config.replay.stake_amount;
            open_position = new_position;

            replay_record.executed = true;
            trades_opened++;
            trading_limits.record_entry(cycle_time);
            has_previous_entry = true;
            previous_entry_time = cycle_time;
            ReplayLogs::log_trade_opened(trade_signal, new_position.expiry_time);
        }

        replay_record.running_balance = running_balance;
        if (csv_decision_logger) {
            csv_decision_logger->log_decision(trade_signal, replay_record.executed, replay_record.skip_reason,
                                              replay_record.settled_trade, running_balance);
        }
        replay_result.records.push_back(std::move(replay_record));
    }

    if (open_position) {
        replay_result.unsettled_trades.push_back(open_position->signal);
        ReplayLogs::log_unsettled_trade(open_position->signal, open_position->expiry_time);
    }
    if (csv_decision_logger) {
        csv_decision_logger->flush();
    }

    replay_result.statistics = compute_replay_statistics(replay_result.records, replay_result.settled_trades,
                                                         replay_result.unsettled_trades.size(), config.replay.initial_balance);
    return replay_result;
}

} // namespace Core
} // namespace ConfluenceTrader
