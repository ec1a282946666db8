#ifndef REPLAY_CONFIG_HPP
#define REPLAY_CONFIG_HPP

#include <string>

struct ReplayConfig {
    std::string candles_file = "data/m1_candles.csv";          // M1 history (epoch,open,high,low,close)
    std::string output_directory = "runtime_logs";             // Parent folder of each run folder

    // ========================================================================
    // CONTRACT SIMULATION
    // ========================================================================

    double payout_rate = 0.95;                        // Profit per unit stake on a win
    double stake_amount = 10.0;                       // Fixed stake per contract
    double initial_balance = 1000.0;                  // Starting balance for the running total
    long long contract_duration_seconds = 300;        // Expiry measured from the entry candle close

    // ========================================================================
    // EXECUTION LIMITS
    // ========================================================================

    int warmup_candles = 250;                         // M1 candles consumed before the first evaluation
    int max_trades = 200;                             // Entries before the run stops, 0 = unlimited
    long long min_trade_interval_seconds = 60;        // Minimum spacing between entries
    int progress_log_interval_candles = 1440;         // Progress line every N candles, 0 = off
};

#endif // REPLAY_CONFIG_HPP
