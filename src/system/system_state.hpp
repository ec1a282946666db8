#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <memory>
#include <string>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"

/**
 * @brief Command line inputs; empty fields fall back to configuration
 */
struct CommandLineArguments {
    std::string candles_file;           // argv[1], replay.candles_file when empty
    std::string config_directory;       // argv[2], "config" when empty
    std::string output_directory;       // argv[3], replay.output_directory when empty
};

/**
 * @brief Central system state container
 *
 * Holds the loaded configuration, run control flags and the logging context shared by all threads.
 */
struct SystemState {
    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};                // Main system running flag
    std::atomic<bool> shutdown_requested{false};    // Set by the signal handler, checked between replay cycles
    std::atomic<int> shutdown_signal{0};            // Signal that requested the shutdown

    // =========================================================================
    // CONFIGURATION AND RUN INPUTS
    // =========================================================================
    ConfluenceTrader::Config::SystemConfig config;  // Complete system configuration
    std::string candles_file;                       // Resolved M1 candle source
    std::string config_directory;                   // Directory the config CSVs came from
    std::shared_ptr<ConfluenceTrader::Logging::LoggingContext> logging_context;
    bool interrupted = false;                       // Replay stopped by a shutdown request

    explicit SystemState(const ConfluenceTrader::Config::SystemConfig& initial) : config(initial) {}
};

#endif // SYSTEM_STATE_HPP
