#ifndef MULTI_TIMEFRAME_MANAGER_HPP
#define MULTI_TIMEFRAME_MANAGER_HPP

#include "configs/indicator_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <deque>

namespace ConfluenceTrader {
namespace Core {

struct TimeframeSeries {
    Timeframe timeframe;
    std::deque<Candle> closed_candles;
    Candle forming_candle;
    bool has_forming_candle;
    IndicatorSnapshot latest_snapshot;

    explicit TimeframeSeries(Timeframe timeframe_value)
        : timeframe(timeframe_value), closed_candles(), forming_candle(), has_forming_candle(false), latest_snapshot() {
        latest_snapshot.timeframe = timeframe_value;
    }
};

struct TimeframeCloseEvents {
    bool m5_closed;
    bool m15_closed;

    TimeframeCloseEvents() : m5_closed(false), m15_closed(false) {}
};

/**
 * Builds M5 and M15 candles from a strictly ordered M1 stream and keeps one snapshot per timeframe.
 * A higher-timeframe candle closes when the M1 candle ending on its UTC boundary arrives, or
 * earlier when an M1 candle from a later bucket shows the bucket is over.
 * Snapshots are recomputed only when their own timeframe closes.
 */
class MultiTimeframeManager {
public:
    explicit MultiTimeframeManager(const IndicatorConfig& indicator_config);

    // Throws std::runtime_error when the candle is not strictly after the previous one.
    TimeframeCloseEvents process_minute_candle(const Candle& minute_candle);

    const IndicatorSnapshot& get_latest_snapshot(Timeframe timeframe) const;
    const std::deque<Candle>& get_closed_candles(Timeframe timeframe) const;
    size_t get_processed_minute_count() const { return processed_minute_count; }

private:
    IndicatorConfig indicators;
    TimeframeSeries minute_series;
    TimeframeSeries five_minute_series;
    TimeframeSeries fifteen_minute_series;
    long long last_minute_timestamp;
    size_t processed_minute_count;

    const TimeframeSeries& get_series(Timeframe timeframe) const;
    bool accumulate_into_timeframe(TimeframeSeries& series, const Candle& minute_candle);
    void close_forming_candle(TimeframeSeries& series);
    void maintain_deque_size(std::deque<Candle>& candle_deque, size_t maximum_size);
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // MULTI_TIMEFRAME_MANAGER_HPP
