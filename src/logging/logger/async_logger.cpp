#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <sstream>
#include <cstdio>
#include <stdexcept>
#include <filesystem>

namespace ConfluenceTrader {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

void log_message_to_stderr(const std::string& error_message);

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }
    return thread_logging_context_ptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* thread_logging_context_ptr = get_logging_context();

        std::string timestamp_string = TimeUtils::get_current_human_readable_time();
        std::string thread_tag_string = thread_logging_context_ptr->get_thread_tag();
        std::stringstream log_stream;
        log_stream << timestamp_string << " [" << thread_tag_string << "]   " << message << std::endl;
        std::string log_formatted_string = log_stream.str();

        if (thread_logging_context_ptr->async_logger && thread_logging_context_ptr->async_logger->running.load()) {
            thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
            return;
        }

        {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::cout << log_formatted_string << std::flush;
        }

        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (log_file_stream.is_open()) {
                log_file_stream << log_formatted_string;
            } else {
                log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
            }
        }
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
        std::cerr << message << std::endl;
    }
}

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string get_git_commit_hash() {
    FILE* pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!pipe) {
        return "unknown";
    }

    char buffer[128];
    std::string result = "";
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result += buffer;
    }
    pclose(pipe);

    if (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }

    return result.empty() ? "unknown" : result;
}

std::string create_unique_run_folder(const std::string& output_directory) {
    std::stringstream ss;
    ss << output_directory << "/run_" << TimeUtils::get_current_log_filename_stamp() << "_" << get_git_commit_hash();

    std::string run_folder = ss.str();

    // Repeated runs within the same minute get a numeric suffix
    std::string candidate_folder = run_folder;
    int suffix_value = 1;
    while (std::filesystem::exists(candidate_folder)) {
        candidate_folder = run_folder + "_" + std::to_string(suffix_value++);
    }

    try {
        std::filesystem::create_directories(candidate_folder);
    } catch (const std::exception& filesystem_exception_error) {
        log_message_to_stderr(std::string("CRITICAL ERROR: Failed to create run folder: ") + filesystem_exception_error.what());
        throw std::runtime_error("Failed to create run folder: " + candidate_folder);
    }

    return candidate_folder;
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const std::string& output_directory, const std::string& log_file_name) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    thread_logging_context_ptr->run_folder = create_unique_run_folder(output_directory);

    std::string log_file_path = thread_logging_context_ptr->run_folder + "/" + std::filesystem::path(log_file_name).filename().string();
    auto logger_instance = std::make_shared<AsyncLogger>(log_file_path);

    thread_logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN  ");

    return logger_instance;
}

std::shared_ptr<CSVDecisionLogger> initialize_csv_decision_logger(const std::string& decision_file_name, const std::string& trade_file_name) {
    try {
        LoggingContext* thread_logging_context_ptr = get_logging_context();

        if (thread_logging_context_ptr->run_folder.empty()) {
            throw std::runtime_error("Run folder not initialized - call initialize_application_foundation first");
        }

        std::string decision_file_path = thread_logging_context_ptr->run_folder + "/" + std::filesystem::path(decision_file_name).filename().string();
        std::string trade_file_path = thread_logging_context_ptr->run_folder + "/" + std::filesystem::path(trade_file_name).filename().string();
        auto decision_logger_instance = std::make_shared<CSVDecisionLogger>(decision_file_path, trade_file_path);

        thread_logging_context_ptr->csv_decision_logger = decision_logger_instance;
        return decision_logger_instance;
    } catch (const std::exception& exception_error) {
        log_message_to_stderr(std::string("CRITICAL ERROR: Failed to initialize CSV decision logger: ") + exception_error.what());
        throw;
    }
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::lock_guard<std::mutex> lock(mtx);
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    {
        LoggingContext* thread_logging_context_ptr = get_logging_context();
        std::lock_guard<std::mutex> cguard(thread_logging_context_ptr->console_mutex);
        std::cout << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
    }
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    message_buffer.clear();
}

void AsyncLogger::process_logging_queue_with_timeout(std::ofstream& log_file, int poll_interval_milliseconds) {
    std::unique_lock<std::mutex> lock(mtx);

    // Wake periodically so a stop request is noticed even without traffic
    cv.wait_for(lock, std::chrono::milliseconds(poll_interval_milliseconds), [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        std::string line = std::move(queue.front());
        queue.pop();
        lock.unlock();

        output_log_line_internal(line, log_file);

        lock.lock();
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
}

} // namespace Logging
} // namespace ConfluenceTrader
