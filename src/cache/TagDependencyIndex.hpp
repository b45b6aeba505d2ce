#ifndef TAGDEPENDENCYINDEX_HPP
#define TAGDEPENDENCYINDEX_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "../models/CacheTier.hpp"

// Reverse maps tag -> keys and dependency -> keys, so bulk invalidation touches only
// the matching keys. Each tier's copy of a key is tracked separately; a key leaves the
// index once no tier holds a tagged copy of it.
class TagDependencyIndex {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    TagDependencyIndex() = default;

    // Replaces the tier's copy. Recording empty tags and dependencies drops that copy.
    void recordTags(const std::string& key,
                    const std::set<std::string>& tags,
                    const std::set<std::string>& dependencies,
                    CacheTier tier = CacheTier::Memory,
                    TimePoint expires_at = TimePoint::max());

    // Drops every tier's copy.
    void removeKey(const std::string& key);
    void removeTierCopy(const std::string& key, CacheTier tier);

    std::set<std::string> keysForTag(const std::string& tag) const;
    std::set<std::string> keysForDependency(const std::string& dependency) const;
    // Keys carrying every listed tag. Empty input yields an empty set.
    std::set<std::string> keysForAllTags(const std::vector<std::string>& tags) const;

    // Tiers whose copy of the key is currently indexed.
    std::vector<CacheTier> tiersForKey(const std::string& key) const;

    // Drops copies whose expiry has passed. Returns the number of copies removed.
    std::size_t purgeExpired(TimePoint now = std::chrono::steady_clock::now());

    bool contains(const std::string& key) const;
    std::size_t size() const;
    std::size_t tagCount() const;
    std::size_t dependencyCount() const;

private:
    struct TierCopy {
        std::set<std::string> tags;
        std::set<std::string> dependencies;
        TimePoint expires_at;
    };

    // Rebuilds the reverse-map membership of key from its remaining copies.
    void reindexLocked(const std::string& key,
                       const std::set<std::string>& old_tags,
                       const std::set<std::string>& old_deps);
    static void collect(const std::map<CacheTier, TierCopy>& copies,
                        std::set<std::string>& tags,
                        std::set<std::string>& deps);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<CacheTier, TierCopy>> copies_;
    std::unordered_map<std::string, std::set<std::string>> tag_to_keys_;
    std::unordered_map<std::string, std::set<std::string>> dep_to_keys_;
};

#endif // TAGDEPENDENCYINDEX_HPP
