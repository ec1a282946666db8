#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>

/**
 * Specialized logging for system management operations.
 * Handles startup, configuration and shutdown logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup_banner(const std::string& candles_file, const std::string& config_directory, const std::string& run_folder);
    static void log_configuration_summary(const ConfluenceTrader::Config::SystemConfig& config);
    static void log_configuration_validated(bool valid, const std::string& error_message);
    static void log_shutdown_requested(int signal_number);
    static void log_shutdown_complete(bool interrupted);

    // Errors
    static void log_system_startup_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
};

#endif // SYSTEM_LOGS_HPP
