#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../models/CacheEntry.hpp"

struct EvictionRequest {
    std::size_t bytes_to_free = 0;
    std::size_t items_to_free = 0;
};

// Chooses which memory-tier entries to drop so that a new entry can be admitted.
// Called with the store lock held; must not call back into the store.
class IEvictionPolicy {
public:
    virtual ~IEvictionPolicy() = default;

    // Returns keys in eviction order. Selection stops once both amounts are covered
    // or the table is exhausted.
    virtual std::vector<std::string> selectVictims(const MemoryEntryTable& table,
                                                   const EvictionRequest& request) const = 0;
    virtual std::string name() const = 0;
};
