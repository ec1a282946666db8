#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;
constexpr int MINUTES_PER_DAY = static_cast<int>(MINUTES_PER_HOUR * HOURS_PER_DAY);

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Wall clock, used for log lines and run folder names only
std::string get_current_human_readable_time();
std::string get_current_log_filename_stamp();

// Epoch-second helpers (UTC); all engine time is epoch seconds
std::string format_epoch_seconds_iso(long long epoch_seconds);
int get_utc_minute_of_day(long long epoch_seconds);
long long floor_to_interval(long long epoch_seconds, long long interval_seconds);

// "HH:MM" -> minute of day; throws std::runtime_error on malformed input
int parse_clock_minutes(const std::string& clock_text);
std::string format_clock_minutes(int minute_of_day);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
