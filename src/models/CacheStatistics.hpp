#ifndef CACHESTATISTICS_HPP
#define CACHESTATISTICS_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "RemoteHealth.hpp"

using json = nlohmann::json;

struct KeyAccessSummary {
    std::string key;
    std::uint64_t access_count = 0;
    std::size_t size_bytes = 0;
};

// --- Point-in-time snapshot of the engine counters ---
struct CacheStatistics {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    double hit_rate = 0.0;
    std::uint64_t sets = 0;
    std::uint64_t deletes = 0;
    std::uint64_t errors = 0;

    std::uint64_t evictions_total = 0;
    std::map<std::string, std::uint64_t> evictions_by_policy;
    std::uint64_t expirations = 0;
    std::uint64_t capacity_rejections = 0;

    std::size_t memory_entries = 0;
    std::int64_t remote_entries = -1; // -1 when unknown
    std::int64_t persistent_entries = -1;

    std::size_t memory_bytes_used = 0;
    std::size_t memory_bytes_budget = 0;
    std::size_t memory_items_budget = 0;

    std::size_t indexed_keys = 0;
    std::size_t indexed_tags = 0;
    std::size_t indexed_dependencies = 0;

    double avg_latency_ms = 0.0;
    double max_latency_ms = 0.0;
    std::size_t latency_samples = 0;

    std::size_t pending_backfills = 0;
    std::size_t remote_tombstones = 0;

    RemoteHealthStatus remote;
    std::vector<KeyAccessSummary> top_keys;
};

inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, Constants::TIME_FORMAT) << "Z";
    return oss.str();
}

inline json toJson(const RemoteHealthStatus& status) {
    json j = {
        {"enabled", status.enabled},
        {"state", healthStateToString(status.state)},
        {"connected", status.connected},
        {"cluster_mode", status.cluster_mode},
        {"node_count", status.node_count},
        {"last_latency_ms", status.last_latency_ms},
        {"consecutive_failures", status.consecutive_failures},
        {"consecutive_successes", status.consecutive_successes},
        {"reconnect_attempts", status.reconnect_attempts},
        {"reconnect_exhausted", status.reconnect_exhausted},
        {"last_error", status.last_error}
    };
    j["last_check"] = status.last_check ? json(formatTimestamp(*status.last_check)) : json(nullptr);
    j["key_count"] = status.key_count ? json(*status.key_count) : json(nullptr);
    return j;
}

inline json toJson(const CacheStatistics& stats) {
    json top = json::array();
    for (const auto& k : stats.top_keys) {
        top.push_back({{"key", k.key}, {"access_count", k.access_count}, {"size_bytes", k.size_bytes}});
    }
    return {
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", stats.hit_rate},
        {"sets", stats.sets},
        {"deletes", stats.deletes},
        {"errors", stats.errors},
        {"evictions", {{"total", stats.evictions_total}, {"by_policy", stats.evictions_by_policy}}},
        {"expirations", stats.expirations},
        {"capacity_rejections", stats.capacity_rejections},
        {"entries", {
            {"memory", stats.memory_entries},
            {"remote", stats.remote_entries},
            {"persistent", stats.persistent_entries}
        }},
        {"memory", {
            {"bytes_used", stats.memory_bytes_used},
            {"bytes_budget", stats.memory_bytes_budget},
            {"items_budget", stats.memory_items_budget}
        }},
        {"index", {
            {"keys", stats.indexed_keys},
            {"tags", stats.indexed_tags},
            {"dependencies", stats.indexed_dependencies}
        }},
        {"performance", {
            {"avg_latency_ms", stats.avg_latency_ms},
            {"max_latency_ms", stats.max_latency_ms},
            {"samples", stats.latency_samples}
        }},
        {"pending_backfills", stats.pending_backfills},
        {"remote_tombstones", stats.remote_tombstones},
        {"remote", toJson(stats.remote)},
        {"top_keys", top}
    };
}

#endif // CACHESTATISTICS_HPP
