#include "system_manager.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "configs/system_config.hpp"
#include "logging/logs/replay_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/market_data/candle_file_reader.hpp"
#include "trader/replay/replay_harness.hpp"

using namespace ConfluenceTrader::Logging;
using namespace ConfluenceTrader::Threads;

namespace ConfluenceTrader {
namespace System {

namespace {
    const char* DEFAULT_CONFIG_DIRECTORY = "config";

    void write_summary_file(const SystemState& state, const ConfluenceTrader::Core::ReplayResult& replay_result, const std::string& summary_path) {
        nlohmann::json summary_json;
        summary_json["candles_file"] = state.candles_file;
        summary_json["config_directory"] = state.config_directory;
        summary_json["candles_processed"] = replay_result.candles_processed;
        summary_json["interrupted"] = replay_result.interrupted;
        summary_json["settings"] = {
            {"payout_rate", state.config.replay.payout_rate},
            {"stake_amount", state.config.replay.stake_amount},
            {"contract_duration_seconds", state.config.replay.contract_duration_seconds},
            {"minimum_confidence", state.config.strategy.minimum_confidence},
            {"minimum_timeframe_agreement", state.config.strategy.minimum_timeframe_agreement},
            {"max_consecutive_losses", state.config.risk.max_consecutive_losses},
            {"loss_cooldown_seconds", state.config.risk.loss_cooldown_seconds},
            {"max_daily_trades", state.config.risk.max_daily_trades},
            {"max_daily_loss_percent", state.config.risk.max_daily_loss_percent},
            {"max_daily_profit_target", state.config.risk.max_daily_profit_target},
            {"max_session_loss", state.config.risk.max_session_loss}
        };
        summary_json["statistics"] = ConfluenceTrader::Core::replay_statistics_to_json(replay_result.statistics);

        std::ofstream summary_stream(summary_path, std::ios::trunc);
        if (!summary_stream.is_open()) {
            throw std::runtime_error("Cannot write summary file: " + summary_path);
        }
        summary_stream << std::setw(2) << summary_json << std::endl;
    }
}

CommandLineArguments parse_command_line(int argc, char* argv[]) {
    CommandLineArguments arguments;
    if (argc > 4) {
        throw std::runtime_error("Usage: confluence_trader [candles.csv] [config_dir] [output_dir]");
    }
    if (argc > 1) arguments.candles_file = argv[1];
    if (argc > 2) arguments.config_directory = argv[2];
    if (argc > 3) arguments.output_directory = argv[3];
    return arguments;
}

SystemInitializationResult initialize(const CommandLineArguments& arguments) {
    SystemInitializationResult initialization_result;

    try {
        // Logging context is required before any logging calls
        auto early_logging_context = std::make_shared<LoggingContext>();
        set_logging_context(*early_logging_context);

        std::string config_directory = arguments.config_directory.empty() ? DEFAULT_CONFIG_DIRECTORY : arguments.config_directory;
        ConfluenceTrader::Config::SystemConfig initial_config;
        int config_load_result = load_system_config(initial_config, config_directory);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error("Config load failed with result: " + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }
        SystemLogs::log_configuration_validated(true, "");

        if (!arguments.candles_file.empty()) {
            initial_config.replay.candles_file = arguments.candles_file;
        }
        if (!arguments.output_directory.empty()) {
            initial_config.replay.output_directory = arguments.output_directory;
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        SystemState& system_state = *initialization_result.system_state;
        system_state.logging_context = early_logging_context;
        system_state.candles_file = initial_config.replay.candles_file;
        system_state.config_directory = config_directory;

        initialization_result.logger = initialize_application_foundation(system_state.config.replay.output_directory,
                                                                         system_state.config.logging.log_file);
        initialize_csv_decision_logger(system_state.config.logging.decision_log_file, system_state.config.logging.trade_log_file);

    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }

    return initialization_result;
}

SystemThreads startup(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    SystemThreads thread_handles;

    // Messages logged from here on go through the queue
    logger->running.store(true);
    thread_handles.logger_thread = std::thread(LoggingThread(logger, *system_state.logging_context, system_state.config));

    SystemLogs::log_startup_banner(system_state.candles_file, system_state.config_directory, system_state.logging_context->run_folder);
    SystemLogs::log_configuration_summary(system_state.config);
    return thread_handles;
}

void run(SystemState& system_state) {
    std::vector<ConfluenceTrader::Core::Candle> minute_candles = ConfluenceTrader::Core::load_candles_from_csv(system_state.candles_file);
    ReplayLogs::log_replay_start(minute_candles.size(), system_state.candles_file,
                                 minute_candles.empty() ? 0 : minute_candles.front().timestamp,
                                 minute_candles.empty() ? 0 : minute_candles.back().timestamp);

    ConfluenceTrader::Core::ReplayHarness replay_harness(system_state.config, system_state.logging_context->csv_decision_logger);
    ConfluenceTrader::Core::ReplayResult replay_result = replay_harness.run(minute_candles, &system_state.shutdown_requested);
    system_state.interrupted = replay_result.interrupted;
    if (system_state.shutdown_signal.load() != 0) {
        SystemLogs::log_shutdown_requested(system_state.shutdown_signal.load());
    }

    std::string summary_path = system_state.logging_context->run_folder + "/" +
                               std::filesystem::path(system_state.config.logging.summary_file).filename().string();
    write_summary_file(system_state, replay_result, summary_path);

    ReplayLogs::log_summary_table(replay_result.statistics);
    const auto& csv_decision_logger = system_state.logging_context->csv_decision_logger;
    ReplayLogs::log_output_files(csv_decision_logger->get_decision_file_path(), csv_decision_logger->get_trade_file_path(), summary_path);
}

void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    system_state.running.store(false);
    SystemLogs::log_shutdown_complete(system_state.interrupted);

    if (system_state.logging_context && system_state.logging_context->csv_decision_logger) {
        system_state.logging_context->csv_decision_logger->flush();
    }
    if (logger) {
        shutdown_global_logger(*logger);
    }
    if (thread_handles.logger_thread.joinable()) {
        thread_handles.logger_thread.join();
    }
}

} // namespace System
} // namespace ConfluenceTrader
