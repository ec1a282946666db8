#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

enum class Timeframe {
    MINUTE_1,
    MINUTE_5,
    MINUTE_15
};

inline long long timeframe_seconds(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::MINUTE_1: return 60;
        case Timeframe::MINUTE_5: return 300;
        case Timeframe::MINUTE_15: return 900;
    }
    return 60;
}

inline std::string timeframe_to_string(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::MINUTE_1: return "M1";
        case Timeframe::MINUTE_5: return "M5";
        case Timeframe::MINUTE_15: return "M15";
    }
    return "UNKNOWN";
}

// timestamp is the bar open in UTC epoch seconds
struct Candle {
    long long timestamp;
    double open_price;
    double high_price;
    double low_price;
    double close_price;

    Candle() : timestamp(0), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0) {}
    Candle(long long timestamp_value, double open_value, double high_value, double low_value, double close_value)
        : timestamp(timestamp_value), open_price(open_value), high_price(high_value), low_price(low_value), close_price(close_value) {}
};

/**
 * Indicator values for one timeframe as of its latest closed candle.
 * Superseded by the next snapshot, never updated in place.
 */
struct IndicatorSnapshot {
    bool valid;                         // false until enough history exists for every indicator
    Timeframe timeframe;
    Candle candle;
    double close_price;

    double bollinger_upper;
    double bollinger_middle;
    double bollinger_lower;
    double bollinger_percent_b;         // 0 = lower band, 1 = upper band
    double rsi;
    double stochastic_k;
    double stochastic_d;
    double adx;
    double plus_di;
    double minus_di;
    double adx_slope;
    double ema_fast;                    // EMA50
    double ema_slow;                    // EMA200, 0 until enough history
    double macd_line;
    double macd_signal;
    double macd_histogram;

    // Derived facts
    bool rsi_oversold;
    bool rsi_overbought;
    bool stochastic_oversold;
    bool stochastic_overbought;
    bool stochastic_bullish_cross;      // %K crossed above %D on the latest bar
    bool stochastic_bearish_cross;
    bool macd_bullish;
    bool macd_bearish;
    bool bullish_pattern;               // hammer or bullish engulfing
    bool bearish_pattern;               // shooting star or bearish engulfing
    bool bullish_divergence;
    bool bearish_divergence;
    bool bullish_price_action;          // close broke the previous high
    bool bearish_price_action;          // close broke the previous low

    IndicatorSnapshot()
        : valid(false), timeframe(Timeframe::MINUTE_1), candle(), close_price(0.0),
          bollinger_upper(0.0), bollinger_middle(0.0), bollinger_lower(0.0), bollinger_percent_b(0.5),
          rsi(50.0), stochastic_k(50.0), stochastic_d(50.0), adx(0.0), plus_di(0.0), minus_di(0.0), adx_slope(0.0),
          ema_fast(0.0), ema_slow(0.0), macd_line(0.0), macd_signal(0.0), macd_histogram(0.0),
          rsi_oversold(false), rsi_overbought(false), stochastic_oversold(false), stochastic_overbought(false),
          stochastic_bullish_cross(false), stochastic_bearish_cross(false), macd_bullish(false), macd_bearish(false),
          bullish_pattern(false), bearish_pattern(false), bullish_divergence(false), bearish_divergence(false),
          bullish_price_action(false), bearish_price_action(false) {}
};

enum class MarketMode {
    TRENDING_UP,
    TRENDING_DOWN,
    RANGING,
    UNCERTAIN
};

enum class TradeSide {
    RISE,
    FALL,
    NONE
};

enum class TradeResult {
    WIN,
    LOSS,
    TIE
};

std::string market_mode_to_string(MarketMode market_mode);
std::string trade_side_to_string(TradeSide trade_side);
std::string trade_result_to_string(TradeResult trade_result);

struct TimeframeConfirmation {
    bool m1_confirmed;
    bool m5_confirmed;
    bool m15_confirmed;

    TimeframeConfirmation() : m1_confirmed(false), m5_confirmed(false), m15_confirmed(false) {}

    int agree_count() const {
        return (m1_confirmed ? 1 : 0) + (m5_confirmed ? 1 : 0) + (m15_confirmed ? 1 : 0);
    }

    bool all_confirmed() const { return m1_confirmed && m5_confirmed && m15_confirmed; }
};

struct SideScore {
    double confidence;
    int agree_count;
    TimeframeConfirmation confirmations;
    std::vector<std::string> factors;
    bool vetoed;
    std::string veto_reason;

    SideScore() : confidence(0.0), agree_count(0), confirmations(), factors(), vetoed(false), veto_reason() {}
};

struct ScoreResult {
    SideScore rise;
    SideScore fall;
};

struct TradeSignal {
    unsigned long long decision_id;
    TradeSide side;
    double confidence;
    std::vector<std::string> factors;
    TimeframeConfirmation confirmations;
    MarketMode market_mode;
    double price;
    long long timestamp;
    bool blocked_by_guard;              // selector produced a side but the loss-streak guard forced NONE
    int observed_consecutive_losses;    // guard counter seen when the decision was gated

    TradeSignal()
        : decision_id(0), side(TradeSide::NONE), confidence(0.0), factors(), confirmations(),
          market_mode(MarketMode::UNCERTAIN), price(0.0), timestamp(0), blocked_by_guard(false),
          observed_consecutive_losses(0) {}
};

struct TradeOutcome {
    unsigned long long decision_id;
    TradeResult result;
    double pnl;
    long long settled_at;

    TradeOutcome() : decision_id(0), result(TradeResult::TIE), pnl(0.0), settled_at(0) {}
    TradeOutcome(unsigned long long decision_id_value, TradeResult result_value, double pnl_value, long long settled_at_value)
        : decision_id(decision_id_value), result(result_value), pnl(pnl_value), settled_at(settled_at_value) {}
};

// One simulated contract from entry to settlement.
struct SettledTrade {
    unsigned long long decision_id;
    TradeSide side;
    MarketMode market_mode;
    double confidence;
    long long entry_time;
    double entry_price;
    long long expiry_time;
    long long exit_time;
    double exit_price;
    TradeResult result;
    double stake;
    double pnl;
    double balance_after;
    double max_adverse_excursion;       // worst move against the position, in price units
    double max_favorable_excursion;     // best move in favour of the position, in price units

    SettledTrade()
        : decision_id(0), side(TradeSide::NONE), market_mode(MarketMode::UNCERTAIN), confidence(0.0),
          entry_time(0), entry_price(0.0), expiry_time(0), exit_time(0), exit_price(0.0),
          result(TradeResult::TIE), stake(0.0), pnl(0.0), balance_after(0.0),
          max_adverse_excursion(0.0), max_favorable_excursion(0.0) {}
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // DATA_STRUCTURES_HPP
