#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <algorithm>
#include <string>

// Standard indentation levels
#define LOG_INDENT_L1 "        "            // 8 spaces - Main section level
#define LOG_INDENT_L2 "        |   "        // 8 spaces + |   - Content level
#define LOG_INDENT_L3 "        |     "      // 8 spaces + |     - Sub-content level

// Section headers and footers
#define LOG_SECTION_HEADER(title) log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() log_message(LOG_INDENT_L1 "+-- ", "")

// Content logging macros
#define LOG_CONTENT(msg) log_message(LOG_INDENT_L2 + std::string(msg), "")
#define LOG_SUBCONTENT(msg) log_message(LOG_INDENT_L3 + std::string(msg), "")

// Specialized macros for common patterns
#define LOG_SIGNAL_ANALYSIS_HEADER(cycle_time) LOG_SECTION_HEADER("SIGNAL ANALYSIS - " + std::string(cycle_time))
#define LOG_GUARD_HEADER() LOG_SECTION_HEADER("LOSS-STREAK GUARD")
#define LOG_TRADE_SETTLEMENT_HEADER() LOG_SECTION_HEADER("TRADE SETTLEMENT")

// Startup-specific macros (no indentation for top-level sections)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// Replay run banner (special case - no indentation)
#define LOG_REPLAY_RUN_HEADER(candle_count, source) \
    log_message("", ""); \
    log_message("================================================================================", ""); \
    log_message("                 REPLAY RUN - " + std::to_string(candle_count) + " M1 candles from " + std::string(source), ""); \
    log_message("================================================================================", ""); \
    log_message("", "")

#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")

// Table formatting macros for structured reports
#define TABLE_HEADER_30(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬────────────────────────────────┐"); \
    LOG_THREAD_CONTENT("│ " + std::string(title).substr(0,17) + std::string(17 - std::min(17, (int)std::string(title).length()), ' ') + " │ " + std::string(subtitle).substr(0,30) + std::string(30 - std::min(30, (int)std::string(subtitle).length()), ' ') + " │"); \
    LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤"); \
} while(0)

#define TABLE_ROW_30(label, value) do { \
    std::string label_str = std::string(label).substr(0,17); \
    std::string value_str = std::string(value).substr(0,30); \
    LOG_THREAD_CONTENT("│ " + label_str + std::string(17 - label_str.length(), ' ') + " │ " + value_str + std::string(30 - value_str.length(), ' ') + " │"); \
} while(0)

#define TABLE_SEPARATOR_30() do { \
    LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤"); \
} while(0)

#define TABLE_FOOTER_30() do { \
    LOG_THREAD_CONTENT("└───────────────────┴────────────────────────────────┘"); \
} while(0)

#endif // LOGGING_MACROS_HPP
