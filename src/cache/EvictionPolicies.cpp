#include "EvictionPolicies.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <queue>
#include <stdexcept>

namespace {

// Pops candidates in rank order until the request is covered. Only the victims are
// fully ordered, so a small eviction out of a large table stays cheap.
template <typename Less>
std::vector<std::string> takeVictims(const MemoryEntryTable& table,
                                     const EvictionRequest& request,
                                     Less evict_first) {
    std::vector<std::string> victims;
    if (request.bytes_to_free == 0 && request.items_to_free == 0) {
        return victims;
    }

    using Candidate = MemoryEntryTable::const_iterator;
    auto later = [&evict_first](const Candidate& a, const Candidate& b) {
        return evict_first(b->second, a->second);
    };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(later)> heap(later);
    for (auto it = table.begin(); it != table.end(); ++it) {
        heap.push(it);
    }

    std::size_t bytes_freed = 0;
    std::size_t items_freed = 0;
    while (!heap.empty() && (bytes_freed < request.bytes_to_free || items_freed < request.items_to_free)) {
        auto it = heap.top();
        heap.pop();
        victims.push_back(it->first);
        bytes_freed += it->second.entry.size_bytes;
        ++items_freed;
    }
    return victims;
}

} // namespace

std::vector<std::string> LruEvictionPolicy::selectVictims(const MemoryEntryTable& table,
                                                          const EvictionRequest& request) const {
    return takeVictims(table, request, [](const MemoryRecord& a, const MemoryRecord& b) {
        return a.access_sequence < b.access_sequence;
    });
}

std::vector<std::string> LfuEvictionPolicy::selectVictims(const MemoryEntryTable& table,
                                                          const EvictionRequest& request) const {
    return takeVictims(table, request, [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.entry.access_count != b.entry.access_count) {
            return a.entry.access_count < b.entry.access_count;
        }
        return a.access_sequence < b.access_sequence;
    });
}

std::vector<std::string> TtlEvictionPolicy::selectVictims(const MemoryEntryTable& table,
                                                          const EvictionRequest& request) const {
    return takeVictims(table, request, [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.expires_at != b.expires_at) {
            return a.expires_at < b.expires_at;
        }
        return a.access_sequence < b.access_sequence;
    });
}

std::unique_ptr<IEvictionPolicy> makeEvictionPolicy(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lowered == "lru") return std::make_unique<LruEvictionPolicy>();
    if (lowered == "lfu") return std::make_unique<LfuEvictionPolicy>();
    if (lowered == "ttl") return std::make_unique<TtlEvictionPolicy>();
    throw std::invalid_argument("Unknown eviction policy: " + name);
}
