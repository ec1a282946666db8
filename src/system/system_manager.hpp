#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace ConfluenceTrader {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<ConfluenceTrader::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

CommandLineArguments parse_command_line(int argc, char* argv[]);

// Loads and validates configuration, creates the run folder, log file and CSV outputs
SystemInitializationResult initialize(const CommandLineArguments& arguments);

// System lifecycle management
SystemThreads startup(SystemState& system_state, std::shared_ptr<ConfluenceTrader::Logging::AsyncLogger> logger);
void run(SystemState& system_state);
void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<ConfluenceTrader::Logging::AsyncLogger> logger);

} // namespace System
} // namespace ConfluenceTrader

#endif // SYSTEM_MANAGER_HPP
