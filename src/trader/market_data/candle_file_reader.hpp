#ifndef CANDLE_FILE_READER_HPP
#define CANDLE_FILE_READER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

// Candle history that cannot be replayed deterministically. Fatal for the run.
class ReplayInputError : public std::runtime_error {
public:
    explicit ReplayInputError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Reads M1 candles from CSV: timestamp,open,high,low,close[,volume...]
 * timestamp is UTC epoch seconds or ISO-8601 (YYYY-MM-DDTHH:MM:SS[Z]). A non-numeric first
 * line is treated as a header; '#' lines are comments.
 */
std::vector<Candle> load_candles_from_csv(const std::string& csv_path);

// Rejects malformed prices, unaligned minutes, and duplicate or out-of-order timestamps.
void validate_candle_sequence(const std::vector<Candle>& candles);

long long parse_candle_timestamp(const std::string& timestamp_text);

} // namespace Core
} // namespace ConfluenceTrader

#endif // CANDLE_FILE_READER_HPP
