// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

struct LoggingConfig {
    std::string log_file = "confluence_trader.log";
    std::string decision_log_file = "decisions.csv";
    std::string trade_log_file = "trades.csv";
    std::string summary_file = "summary.json";
    bool log_every_decision = false;                  // Console line per evaluated cycle
    bool log_score_factors = false;                   // Include factor lists in console decision lines
    int logging_poll_interval_milliseconds = 100;     // Logging thread drain interval
};

#endif // LOGGING_CONFIG_HPP
