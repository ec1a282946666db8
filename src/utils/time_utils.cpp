#include "time_utils.hpp"
#include <ctime>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string get_current_log_filename_stamp() {
    auto in_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::stringstream ss;
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, LOG_FILENAME);
    return ss.str();
}

std::string format_epoch_seconds_iso(long long epoch_seconds) {
    std::time_t epoch_time_value = static_cast<std::time_t>(epoch_seconds);
    std::stringstream ss;

    // Use thread-safe gmtime_r instead of gmtime
    struct tm timeinfo;
    gmtime_r(&epoch_time_value, &timeinfo);
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

int get_utc_minute_of_day(long long epoch_seconds) {
    long long seconds_into_day = epoch_seconds % SECONDS_PER_DAY;
    if (seconds_into_day < 0) {
        seconds_into_day += SECONDS_PER_DAY;
    }
    return static_cast<int>(seconds_into_day / SECONDS_PER_MINUTE);
}

long long floor_to_interval(long long epoch_seconds, long long interval_seconds) {
    if (interval_seconds <= 0) {
        throw std::runtime_error("Interval must be positive, got " + std::to_string(interval_seconds));
    }
    long long remainder_seconds = epoch_seconds % interval_seconds;
    if (remainder_seconds < 0) {
        remainder_seconds += interval_seconds;
    }
    return epoch_seconds - remainder_seconds;
}

int parse_clock_minutes(const std::string& clock_text) {
    size_t colon_position = clock_text.find(':');
    if (colon_position == std::string::npos || colon_position == 0 || colon_position + 1 >= clock_text.size()) {
        throw std::runtime_error("Invalid clock time '" + clock_text + "' (expected HH:MM)");
    }

    int hour_value = 0;
    int minute_value = 0;
    try {
        size_t hour_characters_used = 0;
        size_t minute_characters_used = 0;
        std::string hour_text = clock_text.substr(0, colon_position);
        std::string minute_text = clock_text.substr(colon_position + 1);
        hour_value = std::stoi(hour_text, &hour_characters_used);
        minute_value = std::stoi(minute_text, &minute_characters_used);
        if (hour_characters_used != hour_text.size() || minute_characters_used != minute_text.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception& parse_exception) {
        throw std::runtime_error("Invalid clock time '" + clock_text + "': " + parse_exception.what());
    }

    // 24:00 is accepted as end of day
    if (hour_value < 0 || minute_value < 0 || minute_value >= MINUTES_PER_HOUR ||
        hour_value > HOURS_PER_DAY || (hour_value == HOURS_PER_DAY && minute_value != 0)) {
        throw std::runtime_error("Clock time out of range: " + clock_text);
    }
    return hour_value * static_cast<int>(MINUTES_PER_HOUR) + minute_value;
}

std::string format_clock_minutes(int minute_of_day) {
    std::stringstream ss;
    ss << std::setw(2) << std::setfill('0') << (minute_of_day / MINUTES_PER_HOUR) << ":"
       << std::setw(2) << std::setfill('0') << (minute_of_day % MINUTES_PER_HOUR);
    return ss.str();
}

} // namespace TimeUtils
