#ifndef REMOTEHEALTHTRACKER_HPP
#define REMOTEHEALTHTRACKER_HPP

#include <chrono>
#include <mutex>
#include <optional>

#include "../models/RemoteHealth.hpp"

struct HealthTransition {
    RemoteHealthState from;
    RemoteHealthState to;
};

// Connectivity state with hysteresis:
//   Healthy  -> Degraded     after degrade_threshold consecutive failures
//   Healthy  -> Unreachable  directly if failure_threshold is reached first
//   Degraded -> Unreachable  after failure_threshold consecutive failures
//   Degraded -> Healthy      after success_threshold consecutive successes
// Unreachable is only left through markReconnected().
class RemoteHealthTracker {
public:
    RemoteHealthTracker(int failure_threshold, int success_threshold, int degrade_threshold = 2);

    std::optional<HealthTransition> recordSuccess();
    std::optional<HealthTransition> recordFailure();
    // A fresh connection starts out Degraded and must earn Healthy again.
    std::optional<HealthTransition> markReconnected();
    // Used when the initial connect fails.
    std::optional<HealthTransition> markUnreachable();

    RemoteHealthState state() const;
    int consecutiveFailures() const;
    int consecutiveSuccesses() const;

private:
    std::optional<HealthTransition> moveTo(RemoteHealthState next);

    const int failure_threshold_;
    const int success_threshold_;
    const int degrade_threshold_;

    mutable std::mutex mutex_;
    RemoteHealthState state_ = RemoteHealthState::Healthy;
    int consecutive_failures_ = 0;
    int consecutive_successes_ = 0;
};

// delay(n) = min(initial * multiplier^(n-1), max_delay) for attempt n >= 1.
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::milliseconds initial_delay,
                     double multiplier,
                     std::chrono::milliseconds max_delay,
                     int max_attempts);

    std::chrono::milliseconds delayFor(int attempt) const;

    // Counts an attempt and returns the delay to wait before it.
    std::chrono::milliseconds nextDelay();
    // True exactly once: the first time the attempt count passes max_attempts.
    bool consumeExhausted();
    bool exhausted() const { return attempts_ > max_attempts_; }
    void reset();
    int attempts() const { return attempts_; }

private:
    std::chrono::milliseconds initial_delay_;
    double multiplier_;
    std::chrono::milliseconds max_delay_;
    int max_attempts_;
    int attempts_ = 0;
    bool exhausted_reported_ = false;
};

#endif // REMOTEHEALTHTRACKER_HPP
