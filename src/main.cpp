// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>

using namespace ConfluenceTrader::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    // Only lock-free atomic stores here; the replay loop picks the request up between cycles
    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            SystemState* state = system_state_pointer.load();
            if (state) {
                state->shutdown_signal.store(signal_number);
                state->shutdown_requested.store(true);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        CommandLineArguments arguments = parse_command_line(argc, argv);

        // Config loading, run folder and output files
        SystemInitializationResult initialization_result = initialize(arguments);
        SystemState& system_state = *initialization_result.system_state;
        ShutdownHandler::get_instance().set_system_state(&system_state);

        SystemThreads thread_handles = startup(system_state, initialization_result.logger);

        try {
            run(system_state);
        } catch (const std::exception& run_exception) {
            SystemLogs::log_fatal_error(run_exception.what());
            shutdown(system_state, thread_handles, initialization_result.logger);
            ShutdownHandler::get_instance().set_system_state(nullptr);
            return 1;
        }

        shutdown(system_state, thread_handles, initialization_result.logger);
        ShutdownHandler::get_instance().set_system_state(nullptr);
        return 0;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
