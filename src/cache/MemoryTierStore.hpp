#ifndef MEMORYTIERSTORE_HPP
#define MEMORYTIERSTORE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../interfaces/IEvictionPolicy.hpp"
#include "../models/CacheEntry.hpp"
#include "../models/CacheStatistics.hpp"
#include "TagDependencyIndex.hpp"

enum class AdmissionResult {
    Admitted,
    RejectedTooLarge,
    // only_if_absent was set and a live copy already exists.
    SkippedExisting
};

enum class RemovalReason {
    Expired,
    Evicted,
    Deleted,
    Cleared
};

struct MemoryTierStats {
    std::map<std::string, std::uint64_t> evictions_by_policy;
    std::uint64_t expirations = 0;
    std::uint64_t rejections = 0;
};

// Bounded process-local tier. Byte and item budgets are enforced on every admission;
// expired entries are dropped lazily on access and by sweepExpired().
class MemoryTierStore {
public:
    // Invoked after the store lock is released. policy is empty unless reason is Evicted.
    using RemovalListener = std::function<void(const std::string& key, RemovalReason reason, const std::string& policy)>;
    using Predicate = std::function<bool(const CacheEntry&)>;

    MemoryTierStore(std::size_t max_bytes,
                    std::size_t max_items,
                    std::unique_ptr<IEvictionPolicy> policy,
                    std::shared_ptr<TagDependencyIndex> index = nullptr);
    ~MemoryTierStore() = default;

    MemoryTierStore(const MemoryTierStore&) = delete;
    MemoryTierStore& operator=(const MemoryTierStore&) = delete;

    // Updates access bookkeeping on a hit.
    std::optional<CacheEntry> get(const std::string& key);

    // An entry bigger than the whole byte budget is rejected and any existing copy
    // of the key is left as it was.
    AdmissionResult set(const std::string& key,
                        const CacheValue& value,
                        int ttl_seconds,
                        const std::set<std::string>& tags = {},
                        const std::set<std::string>& dependencies = {},
                        bool only_if_absent = false);

    bool remove(const std::string& key);
    std::size_t clearByPredicate(const Predicate& predicate, std::vector<std::string>* removed_keys = nullptr);
    std::size_t clear();
    std::size_t sweepExpired();

    bool contains(const std::string& key) const;
    std::size_t size() const;
    std::size_t bytesUsed() const;
    std::size_t maxBytes() const { return max_bytes_; }
    std::size_t maxItems() const { return max_items_; }
    std::string policyName() const { return policy_->name(); }

    // Live entries, without touching access bookkeeping.
    std::vector<CacheEntry> snapshot() const;
    std::vector<KeyAccessSummary> topKeys(std::size_t n) const;
    MemoryTierStats stats() const;

    void setRemovalListener(RemovalListener listener);

private:
    struct Removal {
        std::string key;
        RemovalReason reason;
        std::string policy;
    };

    void eraseLocked(MemoryEntryTable::iterator it, RemovalReason reason, std::vector<Removal>& removals);
    void purgeExpiredLocked(std::chrono::steady_clock::time_point now, std::vector<Removal>& removals);
    void notify(const std::vector<Removal>& removals) const;

    const std::size_t max_bytes_;
    const std::size_t max_items_;
    std::unique_ptr<IEvictionPolicy> policy_;
    std::shared_ptr<TagDependencyIndex> index_;

    mutable std::mutex mutex_;
    MemoryEntryTable entries_;
    std::size_t bytes_used_ = 0;
    std::uint64_t next_sequence_ = 0;
    MemoryTierStats stats_;

    mutable std::mutex listener_mutex_;
    RemovalListener listener_;
};

#endif // MEMORYTIERSTORE_HPP
