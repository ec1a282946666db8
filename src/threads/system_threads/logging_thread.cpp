/**
 * Logging thread.
 * Writes queued log lines to the console and the run log file.
 */
#include "logging_thread.hpp"
#include <fstream>
#include <iostream>
#include <vector>

using namespace ConfluenceTrader::Threads;
using namespace ConfluenceTrader::Logging;

void LoggingThread::operator()() {
    try {
        set_logging_context(logging_context);
        set_log_thread_tag("LOGGER");

        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        std::cerr << "ERROR: Logging thread terminated: " << exception.what() << std::endl;
    }
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "ERROR: Failed to open log file: " << logger_ptr->get_file_path() << std::endl;
    }

    while (logger_ptr->running.load()) {
        logger_ptr->process_logging_queue_with_timeout(log_file, config.logging.logging_poll_interval_milliseconds);
    }

    // Final flush of anything queued before stop()
    std::vector<std::string> message_buffer;
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
