#include "RemoteHealthTracker.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

RemoteHealthTracker::RemoteHealthTracker(int failure_threshold, int success_threshold, int degrade_threshold)
    : failure_threshold_(failure_threshold),
      success_threshold_(success_threshold),
      degrade_threshold_(degrade_threshold) {
    if (failure_threshold_ < 1 || success_threshold_ < 1 || degrade_threshold_ < 1) {
        throw std::invalid_argument("Health thresholds must be at least 1");
    }
}

std::optional<HealthTransition> RemoteHealthTracker::moveTo(RemoteHealthState next) {
    if (next == state_) {
        return std::nullopt;
    }
    HealthTransition transition{state_, next};
    state_ = next;
    return transition;
}

std::optional<HealthTransition> RemoteHealthTracker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
    ++consecutive_successes_;
    if (state_ == RemoteHealthState::Degraded && consecutive_successes_ >= success_threshold_) {
        return moveTo(RemoteHealthState::Healthy);
    }
    return std::nullopt;
}

std::optional<HealthTransition> RemoteHealthTracker::recordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_successes_ = 0;
    ++consecutive_failures_;
    if (state_ == RemoteHealthState::Healthy) {
        if (consecutive_failures_ >= failure_threshold_) {
            return moveTo(RemoteHealthState::Unreachable);
        }
        if (consecutive_failures_ >= degrade_threshold_) {
            return moveTo(RemoteHealthState::Degraded);
        }
        return std::nullopt;
    }
    if (state_ == RemoteHealthState::Degraded && consecutive_failures_ >= failure_threshold_) {
        return moveTo(RemoteHealthState::Unreachable);
    }
    return std::nullopt;
}

std::optional<HealthTransition> RemoteHealthTracker::markReconnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
    consecutive_successes_ = 0;
    return moveTo(RemoteHealthState::Degraded);
}

std::optional<HealthTransition> RemoteHealthTracker::markUnreachable() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_successes_ = 0;
    consecutive_failures_ = std::max(consecutive_failures_, failure_threshold_);
    return moveTo(RemoteHealthState::Unreachable);
}

RemoteHealthState RemoteHealthTracker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int RemoteHealthTracker::consecutiveFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

int RemoteHealthTracker::consecutiveSuccesses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_successes_;
}

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds initial_delay,
                                   double multiplier,
                                   std::chrono::milliseconds max_delay,
                                   int max_attempts)
    : initial_delay_(initial_delay),
      multiplier_(multiplier),
      max_delay_(max_delay),
      max_attempts_(max_attempts) {
    if (initial_delay_.count() <= 0 || max_delay_ < initial_delay_) {
        throw std::invalid_argument("Reconnect delays must be positive and max >= initial");
    }
    if (multiplier_ < 1.0) {
        throw std::invalid_argument("Reconnect multiplier must be >= 1.0");
    }
    if (max_attempts_ < 1) {
        throw std::invalid_argument("Reconnect max attempts must be at least 1");
    }
}

std::chrono::milliseconds ReconnectBackoff::delayFor(int attempt) const {
    if (attempt <= 1) {
        return initial_delay_;
    }
    double delay = static_cast<double>(initial_delay_.count()) * std::pow(multiplier_, attempt - 1);
    if (delay >= static_cast<double>(max_delay_.count())) {
        return max_delay_;
    }
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::chrono::milliseconds ReconnectBackoff::nextDelay() {
    ++attempts_;
    return attempts_ > max_attempts_ ? max_delay_ : delayFor(attempts_);
}

bool ReconnectBackoff::consumeExhausted() {
    if (attempts_ > max_attempts_ && !exhausted_reported_) {
        exhausted_reported_ = true;
        return true;
    }
    return false;
}

void ReconnectBackoff::reset() {
    attempts_ = 0;
    exhausted_reported_ = false;
}
