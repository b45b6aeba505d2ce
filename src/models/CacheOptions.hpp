#ifndef CACHEOPTIONS_HPP
#define CACHEOPTIONS_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "CacheEntry.hpp"
#include "CacheTier.hpp"

struct GetOptions {
    std::optional<CacheTier> preferred_tier;
    // Unset means AppConfig::read_through decides.
    std::optional<bool> backfill;
};

struct SetOptions {
    // Unset or 0 means AppConfig::default_ttl_seconds.
    std::optional<int> ttl_seconds;
    // Unset writes every enabled tier.
    std::optional<CacheTier> tier;
    std::set<std::string> tags;
    std::set<std::string> dependencies;
};

struct DeleteOptions {
    std::optional<CacheTier> tier;
};

struct ClearCriteria {
    std::optional<CacheTier> tier;
    // Glob over keys ('*', '?', '[...]'). Empty matches every key.
    std::string pattern;
    // An entry must carry all of these.
    std::vector<std::string> tags;

    bool hasFilter() const { return !pattern.empty() || !tags.empty(); }
};

struct CacheQuery {
    std::string pattern;
    std::vector<std::string> tags;
    std::uint64_t min_access = 0;
    std::optional<int> max_age_seconds;
    std::size_t limit = 0; // 0 = unlimited
};

struct WarmUpItem {
    std::string key;
    CacheValue value;
    std::optional<int> ttl_seconds;
    std::set<std::string> tags;
    std::set<std::string> dependencies;
};

struct SetResult {
    bool ok = false;
    // The memory tier refused the entry because it exceeds the whole budget.
    bool capacity_rejected = false;
    std::vector<CacheTier> written;
    std::vector<CacheTier> failed;

    explicit operator bool() const { return ok; }
};

#endif // CACHEOPTIONS_HPP
