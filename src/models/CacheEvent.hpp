#ifndef CACHEEVENT_HPP
#define CACHEEVENT_HPP

#include <chrono>
#include <optional>
#include <string>

#include "CacheTier.hpp"

enum class CacheEventType {
    Hit,
    Miss,
    Set,
    Delete,
    Error,
    Evict,
    Expire,
    Clear,
    Invalidate,
    WarmUp,
    HealthChange,
    ReconnectExhausted
};

inline std::string eventTypeToString(CacheEventType type) {
    switch (type) {
        case CacheEventType::Hit: return "hit";
        case CacheEventType::Miss: return "miss";
        case CacheEventType::Set: return "set";
        case CacheEventType::Delete: return "delete";
        case CacheEventType::Error: return "error";
        case CacheEventType::Evict: return "evict";
        case CacheEventType::Expire: return "expire";
        case CacheEventType::Clear: return "clear";
        case CacheEventType::Invalidate: return "invalidate";
        case CacheEventType::WarmUp: return "warmup";
        case CacheEventType::HealthChange: return "health_change";
        case CacheEventType::ReconnectExhausted: return "reconnect_exhausted";
    }
    return "unknown";
}

struct CacheEvent {
    CacheEventType type;
    std::string key;                 // empty for bulk and health events
    std::optional<CacheTier> tier;
    std::string detail;              // operation name, policy, error text, ...
    std::size_t count = 0;           // bulk operations
    double latency_ms = 0.0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

#endif // CACHEEVENT_HPP
