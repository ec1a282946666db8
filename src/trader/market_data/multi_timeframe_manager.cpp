#include "multi_timeframe_manager.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

MultiTimeframeManager::MultiTimeframeManager(const IndicatorConfig& indicator_config)
    : indicators(indicator_config),
      minute_series(Timeframe::MINUTE_1),
      five_minute_series(Timeframe::MINUTE_5),
      fifteen_minute_series(Timeframe::MINUTE_15),
      last_minute_timestamp(0),
      processed_minute_count(0) {
    if (indicators.maximum_bars < get_minimum_bars_for_snapshot(indicators)) {
        throw std::runtime_error("indicators.maximum_bars must be at least the bars needed for a snapshot (" +
                                 std::to_string(get_minimum_bars_for_snapshot(indicators)) + ")");
    }
}

TimeframeCloseEvents MultiTimeframeManager::process_minute_candle(const Candle& minute_candle) {
    if (processed_minute_count > 0 && minute_candle.timestamp <= last_minute_timestamp) {
        throw std::runtime_error("Non-monotonic M1 candle: " + TimeUtils::format_epoch_seconds_iso(minute_candle.timestamp) +
                                 " after " + TimeUtils::format_epoch_seconds_iso(last_minute_timestamp));
    }
    last_minute_timestamp = minute_candle.timestamp;
    processed_minute_count++;

    minute_series.closed_candles.push_back(minute_candle);
    maintain_deque_size(minute_series.closed_candles, static_cast<size_t>(indicators.maximum_bars));
    minute_series.latest_snapshot = compute_indicator_snapshot(minute_series.closed_candles, Timeframe::MINUTE_1, indicators);

    TimeframeCloseEvents close_events;
    close_events.m5_closed = accumulate_into_timeframe(five_minute_series, minute_candle);
    close_events.m15_closed = accumulate_into_timeframe(fifteen_minute_series, minute_candle);
    return close_events;
}

bool MultiTimeframeManager::accumulate_into_timeframe(TimeframeSeries& series, const Candle& minute_candle) {
    const long long timeframe_length = timeframe_seconds(series.timeframe);
    const long long bucket_start = TimeUtils::floor_to_interval(minute_candle.timestamp, timeframe_length);
    bool candle_closed = false;

    // A gap skipped past the end of the forming bucket
    if (series.has_forming_candle && series.forming_candle.timestamp != bucket_start) {
        close_forming_candle(series);
        candle_closed = true;
    }

    if (!series.has_forming_candle) {
        series.forming_candle = Candle(bucket_start, minute_candle.open_price, minute_candle.high_price,
                                       minute_candle.low_price, minute_candle.close_price);
        series.has_forming_candle = true;
    } else {
        series.forming_candle.high_price = std::max(series.forming_candle.high_price, minute_candle.high_price);
        series.forming_candle.low_price = std::min(series.forming_candle.low_price, minute_candle.low_price);
        series.forming_candle.close_price = minute_candle.close_price;
    }

    if (minute_candle.timestamp + timeframe_seconds(Timeframe::MINUTE_1) >= bucket_start + timeframe_length) {
        close_forming_candle(series);
        candle_closed = true;
    }
    return candle_closed;
}

void MultiTimeframeManager::close_forming_candle(TimeframeSeries& series) {
    series.closed_candles.push_back(series.forming_candle);
    series.has_forming_candle = false;
    maintain_deque_size(series.closed_candles, static_cast<size_t>(indicators.maximum_bars));
    series.latest_snapshot = compute_indicator_snapshot(series.closed_candles, series.timeframe, indicators);
}

void MultiTimeframeManager::maintain_deque_size(std::deque<Candle>& candle_deque, size_t maximum_size) {
    while (candle_deque.size() > maximum_size) {
        candle_deque.pop_front();
    }
}

const TimeframeSeries& MultiTimeframeManager::get_series(Timeframe timeframe) const {
    switch (timeframe) {
        case Timeframe::MINUTE_1: return minute_series;
        case Timeframe::MINUTE_5: return five_minute_series;
        case Timeframe::MINUTE_15: return fifteen_minute_series;
    }
    throw std::runtime_error("Unknown timeframe");
}

const IndicatorSnapshot& MultiTimeframeManager::get_latest_snapshot(Timeframe timeframe) const {
    return get_series(timeframe).latest_snapshot;
}

const std::deque<Candle>& MultiTimeframeManager::get_closed_candles(Timeframe timeframe) const {
    return get_series(timeframe).closed_candles;
}

} // namespace Core
} // namespace ConfluenceTrader
