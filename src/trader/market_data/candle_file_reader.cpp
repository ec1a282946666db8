#include "candle_file_reader.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ConfluenceTrader {
namespace Core {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    double parse_price_field(const std::string& field_text, const std::string& field_name, size_t line_number) {
        try {
            size_t characters_used = 0;
            double price_value = std::stod(field_text, &characters_used);
            if (characters_used != field_text.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return price_value;
        } catch (const std::exception& parse_exception) {
            throw ReplayInputError("Line " + std::to_string(line_number) + ": invalid " + field_name + " '" + field_text + "': " + parse_exception.what());
        }
    }
}

long long parse_candle_timestamp(const std::string& timestamp_text) {
    bool all_digits = !timestamp_text.empty();
    for (char timestamp_character : timestamp_text) {
        if (timestamp_character < '0' || timestamp_character > '9') {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        return std::stoll(timestamp_text);
    }

    std::string iso_text = timestamp_text;
    if (!iso_text.empty() && iso_text.back() == 'Z') {
        iso_text.pop_back();
    }
    std::tm parsed_time = {};
    std::istringstream iso_stream(iso_text);
    iso_stream >> std::get_time(&parsed_time, "%Y-%m-%dT%H:%M:%S");
    if (iso_stream.fail()) {
        throw std::runtime_error("Unrecognised timestamp '" + timestamp_text + "'");
    }
    return static_cast<long long>(timegm(&parsed_time));
}

std::vector<Candle> load_candles_from_csv(const std::string& csv_path) {
    std::ifstream candle_file_stream(csv_path);
    if (!candle_file_stream.is_open()) {
        throw ReplayInputError("Cannot open candle file: " + csv_path);
    }

    std::vector<Candle> candles;
    std::string candle_line_string;
    size_t line_number = 0;

    while (std::getline(candle_file_stream, candle_line_string)) {
        line_number++;
        candle_line_string = trim(candle_line_string);
        if (candle_line_string.empty() || candle_line_string[0] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        std::stringstream candle_line_stream(candle_line_string);
        std::string field_string;
        while (std::getline(candle_line_stream, field_string, ',')) {
            fields.push_back(trim(field_string));
        }

        // Header row
        if (candles.empty() && !fields.empty() && !fields[0].empty() && std::isalpha(static_cast<unsigned char>(fields[0][0]))) {
            continue;
        }
        if (fields.size() < 5) {
            throw ReplayInputError("Line " + std::to_string(line_number) + ": expected timestamp,open,high,low,close");
        }

        Candle candle;
        try {
            candle.timestamp = parse_candle_timestamp(fields[0]);
        } catch (const std::exception& timestamp_exception) {
            throw ReplayInputError("Line " + std::to_string(line_number) + ": " + timestamp_exception.what());
        }
        candle.open_price = parse_price_field(fields[1], "open", line_number);
        candle.high_price = parse_price_field(fields[2], "high", line_number);
        candle.low_price = parse_price_field(fields[3], "low", line_number);
        candle.close_price = parse_price_field(fields[4], "close", line_number);
        candles.push_back(candle);
    }

    validate_candle_sequence(candles);
    return candles;
}

void validate_candle_sequence(const std::vector<Candle>& candles) {
    for (size_t candle_index = 0; candle_index < candles.size(); ++candle_index) {
        const Candle& candle = candles[candle_index];
        const std::string candle_label = "Candle " + std::to_string(candle_index) + " (" + TimeUtils::format_epoch_seconds_iso(candle.timestamp) + ")";

        if (candle.timestamp % TimeUtils::SECONDS_PER_MINUTE != 0) {
            throw ReplayInputError(candle_label + ": timestamp not aligned to a minute boundary");
        }
        if (!std::isfinite(candle.open_price) || !std::isfinite(candle.high_price) ||
            !std::isfinite(candle.low_price) || !std::isfinite(candle.close_price) || candle.low_price <= 0.0) {
            throw ReplayInputError(candle_label + ": non-finite or non-positive price");
        }
        if (candle.high_price < std::max(candle.open_price, candle.close_price) ||
            candle.low_price > std::min(candle.open_price, candle.close_price)) {
            throw ReplayInputError(candle_label + ": high/low do not bound open/close");
        }
        if (candle_index > 0 && candle.timestamp <= candles[candle_index - 1].timestamp) {
            throw ReplayInputError(candle_label + ": timestamp not after previous candle " +
                                   TimeUtils::format_epoch_seconds_iso(candles[candle_index - 1].timestamp) +
                                   (candle.timestamp == candles[candle_index - 1].timestamp ? " (duplicate)" : " (out of order)"));
        }
    }
}

} // namespace Core
} // namespace ConfluenceTrader
