#ifndef REMOTEHEALTH_HPP
#define REMOTEHEALTH_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum class RemoteHealthState {
    Healthy,
    Degraded,
    Unreachable
};

inline std::string healthStateToString(RemoteHealthState state) {
    switch (state) {
        case RemoteHealthState::Healthy: return "healthy";
        case RemoteHealthState::Degraded: return "degraded";
        case RemoteHealthState::Unreachable: return "unreachable";
    }
    return "unknown";
}

struct RemoteHealthStatus {
    bool enabled = false;
    RemoteHealthState state = RemoteHealthState::Unreachable;
    bool connected = false;
    bool cluster_mode = false;
    std::size_t node_count = 0;
    double last_latency_ms = 0.0;
    int consecutive_failures = 0;
    int consecutive_successes = 0;
    int reconnect_attempts = 0;
    bool reconnect_exhausted = false;
    std::string last_error;
    std::optional<std::chrono::system_clock::time_point> last_check;
    std::optional<std::int64_t> key_count;
};

#endif // REMOTEHEALTH_HPP
