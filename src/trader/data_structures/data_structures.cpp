#include "data_structures.hpp"

namespace ConfluenceTrader {
namespace Core {

std::string market_mode_to_string(MarketMode market_mode) {
    switch (market_mode) {
        case MarketMode::TRENDING_UP: return "TRENDING_UP";
        case MarketMode::TRENDING_DOWN: return "TRENDING_DOWN";
        case MarketMode::RANGING: return "RANGING";
        case MarketMode::UNCERTAIN: return "UNCERTAIN";
    }
    return "UNKNOWN";
}

std::string trade_side_to_string(TradeSide trade_side) {
    switch (trade_side) {
        case TradeSide::RISE: return "RISE";
        case TradeSide::FALL: return "FALL";
        case TradeSide::NONE: return "NONE";
    }
    return "UNKNOWN";
}

std::string trade_result_to_string(TradeResult trade_result) {
    switch (trade_result) {
        case TradeResult::WIN: return "WIN";
        case TradeResult::LOSS: return "LOSS";
        case TradeResult::TIE: return "TIE";
    }
    return "UNKNOWN";
}

} // namespace Core
} // namespace ConfluenceTrader
