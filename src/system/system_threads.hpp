#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <chrono>

/**
 * @brief System thread handles
 *
 * The replay runs on the main thread; the logger drains in the background.
 */
struct SystemThreads {
    std::thread logger_thread;                          // Logging system thread
    std::chrono::steady_clock::time_point start_time;   // System startup timestamp

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;

    SystemThreads(SystemThreads&& other) noexcept
        : logger_thread(std::move(other.logger_thread)), start_time(other.start_time) {}

    SystemThreads& operator=(SystemThreads&& other) noexcept {
        if (this != &other) {
            logger_thread = std::move(other.logger_thread);
            start_time = other.start_time;
        }
        return *this;
    }
};

#endif // SYSTEM_THREADS_HPP
