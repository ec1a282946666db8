#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include "csv_decision_logger.hpp"

namespace ConfluenceTrader {
namespace Logging {


// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

class AsyncLogger {
private:
    std::string file_path;

    void output_log_line_internal(const std::string& log_line, std::ofstream& log_file);

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};

    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);
    void stop();

    // Called by the logging thread
    void collect_all_available_messages(std::vector<std::string>& message_buffer);
    void flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file);
    void process_logging_queue_with_timeout(std::ofstream& log_file, int poll_interval_milliseconds);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::shared_ptr<CSVDecisionLogger> csv_decision_logger;
    std::mutex console_mutex;
    std::string run_folder;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const {
        std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
        std::unordered_map<std::thread::id, std::string>::const_iterator thread_tag_map_iterator = thread_tags.find(std::this_thread::get_id());
        if (thread_tag_map_iterator != thread_tags.end()) {
            return thread_tag_map_iterator->second;
        }
        return "MAIN  ";
    }

    void set_thread_tag(const std::string& tag_value) {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        std::string tag_string = tag_value;
        if (tag_string.size() < LOG_TAG_WIDTH) {
            tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        }
        if (tag_string.size() > LOG_TAG_WIDTH) {
            tag_string = tag_string.substr(0, LOG_TAG_WIDTH);
        }
        thread_tags[std::this_thread::get_id()] = tag_string;
    }
};

// Thread-local log tag (6 characters, padded/truncated) to appear in timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function
void log_message(const std::string& message, const std::string& log_file_path);

// Run folder: <output_directory>/run_DD-HH-MM_githash
std::string get_git_commit_hash();
std::string create_unique_run_folder(const std::string& output_directory);

// Creates the run folder and async logger and installs them in the current context
std::shared_ptr<AsyncLogger> initialize_application_foundation(const std::string& output_directory, const std::string& log_file_name);

// Decision/trade CSV logging inside the run folder
std::shared_ptr<CSVDecisionLogger> initialize_csv_decision_logger(const std::string& decision_file_name, const std::string& trade_file_name);

void shutdown_global_logger(AsyncLogger& logger);

// Context access (validates context exists before returning)
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace ConfluenceTrader

#endif // ASYNC_LOGGER_HPP
