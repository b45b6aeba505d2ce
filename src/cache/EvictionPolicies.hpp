#ifndef EVICTIONPOLICIES_HPP
#define EVICTIONPOLICIES_HPP

#include <memory>
#include <string>
#include <vector>

#include "../interfaces/IEvictionPolicy.hpp"

// Least recently accessed first.
class LruEvictionPolicy : public IEvictionPolicy {
public:
    std::vector<std::string> selectVictims(const MemoryEntryTable& table,
                                           const EvictionRequest& request) const override;
    std::string name() const override { return "lru"; }
};

// Fewest accesses first; ties go to the least recently accessed.
class LfuEvictionPolicy : public IEvictionPolicy {
public:
    std::vector<std::string> selectVictims(const MemoryEntryTable& table,
                                           const EvictionRequest& request) const override;
    std::string name() const override { return "lfu"; }
};

// Earliest expiry first, regardless of access pattern.
class TtlEvictionPolicy : public IEvictionPolicy {
public:
    std::vector<std::string> selectVictims(const MemoryEntryTable& table,
                                           const EvictionRequest& request) const override;
    std::string name() const override { return "ttl"; }
};

// Accepts "lru", "lfu" or "ttl". Throws std::invalid_argument for anything else.
std::unique_ptr<IEvictionPolicy> makeEvictionPolicy(const std::string& name);

#endif // EVICTIONPOLICIES_HPP
