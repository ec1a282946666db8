#ifndef LOSS_STREAK_GUARD_HPP
#define LOSS_STREAK_GUARD_HPP

#include "trader/data_structures/data_structures.hpp"
#include "configs/risk_config.hpp"
#include <mutex>
#include <optional>

namespace ConfluenceTrader {
namespace Core {

enum class GuardState {
    ACTIVE,
    COOLDOWN,
    HARD_STOP           // zero cooldown configured; only reset() leaves this state
};

std::string guard_state_to_string(GuardState guard_state);

struct LossStreakState {
    int consecutive_losses;
    std::optional<long long> cooldown_until;
    bool hard_stopped;

    LossStreakState() : consecutive_losses(0), cooldown_until(), hard_stopped(false) {}
};

/**
 * Consecutive-loss circuit breaker, consulted last in every decision cycle.
 * Outcome notifications and gating may arrive from different threads; one mutex covers
 * every read-modify-write of the state.
 */
class LossStreakGuard {
public:
    explicit LossStreakGuard(const RiskConfig& risk_config);

    LossStreakGuard(const LossStreakGuard&) = delete;
    LossStreakGuard& operator=(const LossStreakGuard&) = delete;

    // Passes the signal through while ACTIVE, otherwise returns it forced to NONE.
    // An expired cooldown is cleared (counter reset) before the signal is judged.
    TradeSignal gate(const TradeSignal& signal, long long now);

    // LOSS increments, WIN resets, TIE leaves the streak unchanged. Ignored outside ACTIVE.
    void record_outcome(TradeResult result, long long event_time);

    // Manual intervention: clears the streak, any cooldown and a hard stop.
    void reset();

    LossStreakState get_state() const;
    GuardState get_guard_state() const;
    int get_max_consecutive_losses() const { return max_consecutive_losses; }
    long long get_cooldown_seconds() const { return cooldown_seconds; }

private:
    mutable std::mutex guard_mutex;
    LossStreakState state;
    int max_consecutive_losses;
    long long cooldown_seconds;

    GuardState get_guard_state_locked() const;
};

} // namespace Core
} // namespace ConfluenceTrader

#endif // LOSS_STREAK_GUARD_HPP
