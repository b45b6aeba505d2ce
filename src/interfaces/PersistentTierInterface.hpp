#ifndef PERSISTENTTIERINTERFACE_HPP
#define PERSISTENTTIERINTERFACE_HPP

#include <optional>
#include <string>
#include <vector>

#include "../models/CacheEntry.hpp"

// Slowest tier. Entries are stored whole so that TTL and tags survive a round trip.
// Implementations report failures through their return values and must not throw
// for I/O errors.
class PersistentTierInterface {
public:
    virtual ~PersistentTierInterface() = default;
    virtual std::string name() const = 0;
    virtual bool set(const CacheEntry& entry) = 0;
    virtual std::optional<CacheEntry> get(const std::string& key) = 0;
    virtual bool remove(const std::string& key) = 0;
    // Glob pattern over keys, empty matches all. Every listed tag must be present.
    virtual std::vector<std::string> removeMatching(const std::string& pattern, const std::vector<std::string>& tags) = 0;
    virtual std::optional<std::size_t> size() = 0;
};

#endif // PERSISTENTTIERINTERFACE_HPP
