#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

#include <string>
#include <vector>

// Half-open range of UTC minutes-of-day [start, end). Wraps midnight when end <= start.
struct SessionWindow {
    int start_minute_of_day = 0;
    int end_minute_of_day = 0;
};

struct SessionConfig {
    std::vector<SessionWindow> high_liquidity_windows = {{7 * 60, 11 * 60}, {13 * 60, 17 * 60}};
    std::vector<SessionWindow> off_peak_windows = {{5, 6 * 60}, {21 * 60, 23 * 60 + 55}};
    std::vector<SessionWindow> avoid_windows = {{23 * 60 + 55, 5}};   // Daily rollover

    double high_liquidity_bonus_points = 5.0;
    double off_peak_penalty_points = 5.0;
    double avoid_window_penalty_points = 1000.0;      // Must exceed every achievable positive score
};

#endif // SESSION_CONFIG_HPP
