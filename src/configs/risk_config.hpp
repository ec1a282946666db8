#ifndef RISK_CONFIG_HPP
#define RISK_CONFIG_HPP

struct RiskConfig {
    // ========================================================================
    // LOSS-STREAK GUARD
    // ========================================================================

    int max_consecutive_losses = 3;                   // Loss streak that arms the cooldown
    long long loss_cooldown_seconds = 600;            // Cooldown length, 0 = hard stop until manual reset

    // ========================================================================
    // TRADING LIMITS (daily limits reset at 00:00 UTC, 0 = disabled)
    // ========================================================================

    int max_daily_trades = 1000;                      // Entries per UTC day
    double max_daily_loss_percent = 10.0;             // Daily loss as a percent of the session start balance
    double max_daily_profit_target = 200.0;           // Daily profit that ends trading for the day
    double max_session_loss = 100.0;                  // Loss since session start that stops trading for the run
};

#endif // RISK_CONFIG_HPP
