#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>

#include "CacheTier.hpp"

// Serialized payload plus a caller-defined type tag. The engine never looks inside `data`.
struct CacheValue {
    std::string data;
    std::string type;

    bool operator==(const CacheValue& other) const {
        return data == other.data && type == other.type;
    }
    bool operator!=(const CacheValue& other) const {
        return !(*this == other);
    }
};

struct CacheEntry {
    std::string key;
    CacheValue value;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_accessed_at;
    int ttl_seconds = 0;
    std::uint64_t access_count = 0;
    std::size_t size_bytes = 0;
    std::set<std::string> tags;
    std::set<std::string> dependencies;
    CacheTier tier = CacheTier::Memory;

    // Expired strictly after ttl_seconds have elapsed since creation.
    bool isExpired(std::chrono::system_clock::time_point now) const {
        return now - created_at > std::chrono::seconds(ttl_seconds);
    }

    // Whole seconds of life left, rounded up. Zero once expired.
    int remainingTtlSeconds(std::chrono::system_clock::time_point now) const {
        auto remaining = created_at + std::chrono::seconds(ttl_seconds) - now;
        if (remaining <= std::chrono::system_clock::duration::zero()) {
            return 0;
        }
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(remaining).count();
        return static_cast<int>((millis + 999) / 1000);
    }

    void recomputeSize() {
        size_bytes = estimateSize(key, value, tags, dependencies);
    }

    static std::size_t estimateSize(const std::string& key,
                                    const CacheValue& value,
                                    const std::set<std::string>& tags,
                                    const std::set<std::string>& dependencies) {
        std::size_t size = key.size() + value.data.size() + value.type.size();
        for (const auto& tag : tags) size += tag.size();
        for (const auto& dep : dependencies) size += dep.size();
        return size;
    }
};

// Memory-tier bookkeeping wrapped around an entry. Eviction policies rank these.
struct MemoryRecord {
    CacheEntry entry;
    std::chrono::steady_clock::time_point expires_at;
    std::uint64_t access_sequence = 0;
};

using MemoryEntryTable = std::unordered_map<std::string, MemoryRecord>;

#endif // CACHEENTRY_HPP
