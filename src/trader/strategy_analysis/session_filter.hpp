#ifndef SESSION_FILTER_HPP
#define SESSION_FILTER_HPP

#include "configs/session_config.hpp"
#include <string>
#include <vector>

namespace ConfluenceTrader {
namespace Core {

struct SessionAdjustment {
    double points;
    std::string label;              // empty when no window applies

    SessionAdjustment() : points(0.0), label() {}
};

/**
 * UTC time-of-day scoring adjustment.
 * The avoid window wins over every other window; high liquidity wins over off-peak.
 */
class SessionFilter {
public:
    explicit SessionFilter(const SessionConfig& session_config);

    // Avoid window first, then off-peak, then high liquidity; the first match decides.
    SessionAdjustment evaluate(long long epoch_seconds) const;
    bool is_in_avoid_window(long long epoch_seconds) const;

private:
    SessionConfig config;
};

bool session_window_contains(const SessionWindow& session_window, int minute_of_day);

// "07:00-11:00;13:00-17:00" -> windows. Empty text gives no windows.
std::vector<SessionWindow> parse_session_windows(const std::string& windows_text);
std::string format_session_windows(const std::vector<SessionWindow>& session_windows);

} // namespace Core
} // namespace ConfluenceTrader

#endif // SESSION_FILTER_HPP
