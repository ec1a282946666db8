#include "loss_streak_guard.hpp"
#include "logging/logs/risk_logs.hpp"
#include "utils/time_utils.hpp"
#include <stdexcept>

namespace ConfluenceTrader {
namespace Core {

using ConfluenceTrader::Logging::RiskLogs;

std::string guard_state_to_string(GuardState guard_state) {
    switch (guard_state) {
        case GuardState::ACTIVE: return "ACTIVE";
        case GuardState::COOLDOWN: return "COOLDOWN";
        case GuardState::HARD_STOP: return "HARD_STOP";
    }
    return "UNKNOWN";
}

LossStreakGuard::LossStreakGuard(const RiskConfig& risk_config)
    : state(), max_consecutive_losses(risk_config.max_consecutive_losses), cooldown_seconds(risk_config.loss_cooldown_seconds) {
    if (max_consecutive_losses < 1) {
        throw std::runtime_error("max_consecutive_losses must be >= 1, got " + std::to_string(max_consecutive_losses));
    }
    if (cooldown_seconds < 0) {
        throw std::runtime_error("loss_cooldown_seconds must be >= 0, got " + std::to_string(cooldown_seconds));
    }
}

GuardState LossStreakGuard::get_guard_state_locked() const {
    if (state.hard_stopped) {
        return GuardState::HARD_STOP;
    }
    if (state.cooldown_until.has_value()) {
        return GuardState::COOLDOWN;
    }
    return GuardState::ACTIVE;
}

TradeSignal LossStreakGuard::gate(const TradeSignal& signal, long long now) {
    TradeSignal gated_signal = signal;
    bool cooldown_expired = false;
    GuardState guard_state_value;
    std::optional<long long> blocking_cooldown_until;

    {
        std::lock_guard<std::mutex> guard_lock(guard_mutex);
        if (!state.hard_stopped && state.cooldown_until.has_value() && now >= state.cooldown_until.value()) {
            state.cooldown_until.reset();
            state.consecutive_losses = 0;
            cooldown_expired = true;
        }

        guard_state_value = get_guard_state_locked();
        gated_signal.observed_consecutive_losses = state.consecutive_losses;
        blocking_cooldown_until = state.cooldown_until;
    }

    if (cooldown_expired) {
        RiskLogs::log_cooldown_expired(now);
    }

    if (guard_state_value == GuardState::ACTIVE) {
        return gated_signal;
    }

    bool had_trade_side = gated_signal.side != TradeSide::NONE;
    gated_signal.blocked_by_guard = had_trade_side;
    gated_signal.side = TradeSide::NONE;
    gated_signal.confidence = 0.0;
    if (guard_state_value == GuardState::HARD_STOP) {
        gated_signal.factors.push_back("Loss-streak hard stop active (manual reset required)");
    } else {
        gated_signal.factors.push_back("Loss-streak cooldown active until " + TimeUtils::format_epoch_seconds_iso(blocking_cooldown_until.value()));
    }

    if (had_trade_side) {
        RiskLogs::log_decision_blocked(signal, guard_state_to_string(guard_state_value), gated_signal.observed_consecutive_losses);
    }
    return gated_signal;
}

void LossStreakGuard::record_outcome(TradeResult result, long long event_time) {
    int consecutive_losses_value = 0;
    bool cooldown_armed = false;
    bool hard_stop_armed = false;
    long long cooldown_until_value = 0;
    bool cooldown_expired = false;

    {
        std::lock_guard<std::mutex> guard_lock(guard_mutex);
        if (!state.hard_stopped && state.cooldown_until.has_value() && event_time >= state.cooldown_until.value()) {
            state.cooldown_until.reset();
            state.consecutive_losses = 0;
            cooldown_expired = true;
        }

        // The streak is frozen at its arming value until the cooldown expires or a reset
        bool guard_active = get_guard_state_locked() == GuardState::ACTIVE;
        if (guard_active) {
            switch (result) {
                case TradeResult::WIN:
                    state.consecutive_losses = 0;
                    break;
                case TradeResult::LOSS:
                    state.consecutive_losses += 1;
                    break;
                case TradeResult::TIE:
                    break;
            }
        }

        if (guard_active && result == TradeResult::LOSS && state.consecutive_losses >= max_consecutive_losses) {
            if (cooldown_seconds == 0) {
                state.hard_stopped = true;
                hard_stop_armed = true;
            } else {
                state.cooldown_until = event_time + cooldown_seconds;
                cooldown_until_value = state.cooldown_until.value();
                cooldown_armed = true;
            }
        }
        consecutive_losses_value = state.consecutive_losses;
    }

    if (cooldown_expired) {
        RiskLogs::log_cooldown_expired(event_time);
    }
    RiskLogs::log_outcome_recorded(trade_result_to_string(result), consecutive_losses_value, max_consecutive_losses);
    if (cooldown_armed) {
        RiskLogs::log_cooldown_armed(consecutive_losses_value, event_time, cooldown_until_value);
    }
    if (hard_stop_armed) {
        RiskLogs::log_hard_stop_armed(consecutive_losses_value, event_time);
    }
}

void LossStreakGuard::reset() {
    {
        std::lock_guard<std::mutex> guard_lock(guard_mutex);
        state = LossStreakState();
    }
    RiskLogs::log_guard_reset();
}

LossStreakState LossStreakGuard::get_state() const {
    std::lock_guard<std::mutex> guard_lock(guard_mutex);
    return state;
}

GuardState LossStreakGuard::get_guard_state() const {
    std::lock_guard<std::mutex> guard_lock(guard_mutex);
    return get_guard_state_locked();
}

} // namespace Core
} // namespace ConfluenceTrader
