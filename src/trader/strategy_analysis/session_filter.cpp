#include "session_filter.hpp"
#include "utils/time_utils.hpp"
#include <sstream>
#include <stdexcept>

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

    bool any_window_contains(const std::vector<SessionWindow>& session_windows, int minute_of_day) {
        for (const auto& session_window : session_windows) {
            if (session_window_contains(session_window, minute_of_day)) {
                return true;
            }
        }
        return false;
    }
}

SessionFilter::SessionFilter(const SessionConfig& session_config) : config(session_config) {}

bool session_window_contains(const SessionWindow& session_window, int minute_of_day) {
    if (session_window.start_minute_of_day == session_window.end_minute_of_day) {
        return false;
    }
    if (session_window.start_minute_of_day < session_window.end_minute_of_day) {
        return minute_of_day >= session_window.start_minute_of_day && minute_of_day < session_window.end_minute_of_day;
    }
    // Wraps midnight
    return minute_of_day >= session_window.start_minute_of_day || minute_of_day < session_window.end_minute_of_day;
}

bool SessionFilter::is_in_avoid_window(long long epoch_seconds) const {
    return any_window_contains(config.avoid_windows, TimeUtils::get_utc_minute_of_day(epoch_seconds));
}

SessionAdjustment SessionFilter::evaluate(long long epoch_seconds) const {
    SessionAdjustment session_adjustment;
    int minute_of_day = TimeUtils::get_utc_minute_of_day(epoch_seconds);

    if (any_window_contains(config.avoid_windows, minute_of_day)) {
        session_adjustment.points = -config.avoid_window_penalty_points;
        session_adjustment.label = "Avoid window (rollover)";
    } else if (any_window_contains(config.off_peak_windows, minute_of_day)) {
        session_adjustment.points = -config.off_peak_penalty_points;
        session_adjustment.label = "Off-peak session";
    } else if (any_window_contains(config.high_liquidity_windows, minute_of_day)) {
        session_adjustment.points = config.high_liquidity_bonus_points;
        session_adjustment.label = "High-liquidity session";
    }
    return session_adjustment;
}

std::vector<SessionWindow> parse_session_windows(const std::string& windows_text) {
    std::vector<SessionWindow> session_windows;
    std::stringstream windows_stream(windows_text);
    std::string window_text;

    while (std::getline(windows_stream, window_text, ';')) {
        window_text = trim(window_text);
        if (window_text.empty()) {
            continue;
        }

        size_t dash_position = window_text.find('-');
        if (dash_position == std::string::npos) {
            throw std::runtime_error("Invalid session window '" + window_text + "' (expected HH:MM-HH:MM)");
        }

        SessionWindow session_window;
        session_window.start_minute_of_day = TimeUtils::parse_clock_minutes(trim(window_text.substr(0, dash_position)));
        session_window.end_minute_of_day = TimeUtils::parse_clock_minutes(trim(window_text.substr(dash_position + 1)));
        if (session_window.start_minute_of_day == TimeUtils::MINUTES_PER_DAY) {
            session_window.start_minute_of_day = 0;
        }
        if (session_window.end_minute_of_day == TimeUtils::MINUTES_PER_DAY) {
            session_window.end_minute_of_day = 0;
        }
        session_windows.push_back(session_window);
    }
    return session_windows;
}

std::string format_session_windows(const std::vector<SessionWindow>& session_windows) {
    std::string windows_text;
    for (size_t window_index = 0; window_index < session_windows.size(); ++window_index) {
        if (window_index > 0) {
            windows_text += ";";
        }
        windows_text += TimeUtils::format_clock_minutes(session_windows[window_index].start_minute_of_day) + "-" +
                        TimeUtils::format_clock_minutes(session_windows[window_index].end_minute_of_day);
    }
    return windows_text;
}

} // namespace Core
} // namespace ConfluenceTrader
