#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/system_config.hpp"

namespace ConfluenceTrader {
namespace Threads {

/**
 * Drains the async logger queue to console and the run log file until the logger is stopped.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<ConfluenceTrader::Logging::AsyncLogger> logger,
                  ConfluenceTrader::Logging::LoggingContext& context,
                  const ConfluenceTrader::Config::SystemConfig& system_config)
        : logger_ptr(logger), logging_context(context), config(system_config) {}

    void operator()();

private:
    std::shared_ptr<ConfluenceTrader::Logging::AsyncLogger> logger_ptr;
    ConfluenceTrader::Logging::LoggingContext& logging_context;
    const ConfluenceTrader::Config::SystemConfig& config;

    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace ConfluenceTrader

#endif // LOGGING_THREAD_HPP
