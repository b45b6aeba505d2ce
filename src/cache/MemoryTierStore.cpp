#include "MemoryTierStore.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std::chrono;

MemoryTierStore::MemoryTierStore(std::size_t max_bytes,
                                 std::size_t max_items,
                                 std::unique_ptr<IEvictionPolicy> policy,
                                 std::shared_ptr<TagDependencyIndex> index)
    : max_bytes_(max_bytes),
      max_items_(max_items),
      policy_(std::move(policy)),
      index_(std::move(index)) {
    if (max_bytes_ == 0 || max_items_ == 0) {
        throw std::invalid_argument("Memory tier budgets must be greater than zero");
    }
    if (!policy_) {
        throw std::invalid_argument("Eviction policy pointer cannot be null");
    }
}

void MemoryTierStore::setRemovalListener(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void MemoryTierStore::notify(const std::vector<Removal>& removals) const {
    if (removals.empty()) return;
    RemovalListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) return;
    for (const auto& removal : removals) {
        listener(removal.key, removal.reason, removal.policy);
    }
}

// Caller holds mutex_.
void MemoryTierStore::eraseLocked(MemoryEntryTable::iterator it, RemovalReason reason, std::vector<Removal>& removals) {
    bytes_used_ -= it->second.entry.size_bytes;
    if (index_) {
        index_->removeTierCopy(it->first, CacheTier::Memory);
    }
    std::string policy;
    if (reason == RemovalReason::Evicted) {
        policy = policy_->name();
        ++stats_.evictions_by_policy[policy];
    } else if (reason == RemovalReason::Expired) {
        ++stats_.expirations;
    }
    removals.push_back(Removal{it->first, reason, policy});
    entries_.erase(it);
}

// Caller holds mutex_.
void MemoryTierStore::purgeExpiredLocked(steady_clock::time_point now, std::vector<Removal>& removals) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto current = it++;
        if (now > current->second.expires_at) {
            eraseLocked(current, RemovalReason::Expired, removals);
        }
    }
}

std::optional<CacheEntry> MemoryTierStore::get(const std::string& key) {
    std::vector<Removal> removals;
    std::optional<CacheEntry> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (steady_clock::now() > it->second.expires_at) {
                eraseLocked(it, RemovalReason::Expired, removals);
            } else {
                MemoryRecord& record = it->second;
                record.access_sequence = ++next_sequence_;
                record.entry.access_count++;
                record.entry.last_accessed_at = system_clock::now();
                result = record.entry;
                result->tier = CacheTier::Memory;
            }
        }
    }
    notify(removals);
    return result;
}

AdmissionResult MemoryTierStore::set(const std::string& key,
                                     const CacheValue& value,
                                     int ttl_seconds,
                                     const std::set<std::string>& tags,
                                     const std::set<std::string>& dependencies,
                                     bool only_if_absent) {
    const std::size_t size = CacheEntry::estimateSize(key, value, tags, dependencies);
    std::vector<Removal> removals;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size > max_bytes_) {
            ++stats_.rejections;
            return AdmissionResult::RejectedTooLarge;
        }

        const auto steady_now = steady_clock::now();
        auto existing = entries_.find(key);
        if (only_if_absent && existing != entries_.end() && steady_now <= existing->second.expires_at) {
            return AdmissionResult::SkippedExisting;
        }
        if (existing != entries_.end()) {
            bytes_used_ -= existing->second.entry.size_bytes;
            entries_.erase(existing);
        }

        purgeExpiredLocked(steady_now, removals);

        EvictionRequest request;
        if (bytes_used_ + size > max_bytes_) {
            request.bytes_to_free = bytes_used_ + size - max_bytes_;
        }
        if (entries_.size() + 1 > max_items_) {
            request.items_to_free = entries_.size() + 1 - max_items_;
        }
        for (const auto& victim : policy_->selectVictims(entries_, request)) {
            auto vit = entries_.find(victim);
            if (vit != entries_.end()) {
                eraseLocked(vit, RemovalReason::Evicted, removals);
            }
        }

        const auto now = system_clock::now();
        MemoryRecord record;
        record.entry.key = key;
        record.entry.value = value;
        record.entry.created_at = now;
        record.entry.last_accessed_at = now;
        record.entry.ttl_seconds = ttl_seconds;
        record.entry.tags = tags;
        record.entry.dependencies = dependencies;
        record.entry.tier = CacheTier::Memory;
        record.entry.size_bytes = size;
        record.expires_at = steady_now + seconds(ttl_seconds);
        record.access_sequence = ++next_sequence_;

        bytes_used_ += size;
        entries_[key] = std::move(record);
        if (index_) {
            index_->recordTags(key, tags, dependencies, CacheTier::Memory, steady_now + seconds(ttl_seconds));
        }
    }
    notify(removals);
    return AdmissionResult::Admitted;
}

bool MemoryTierStore::remove(const std::string& key) {
    std::vector<Removal> removals;
    bool was_present = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            // An expired copy is not reported as present.
            was_present = steady_clock::now() <= it->second.expires_at;
            eraseLocked(it, was_present ? RemovalReason::Deleted : RemovalReason::Expired, removals);
        }
    }
    notify(removals);
    return was_present;
}

std::size_t MemoryTierStore::clearByPredicate(const Predicate& predicate, std::vector<std::string>* removed_keys) {
    std::vector<Removal> removals;
    std::size_t cleared = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = steady_clock::now();
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto current = it++;
            if (now > current->second.expires_at) {
                eraseLocked(current, RemovalReason::Expired, removals);
                continue;
            }
            if (predicate(current->second.entry)) {
                if (removed_keys) removed_keys->push_back(current->first);
                eraseLocked(current, RemovalReason::Cleared, removals);
                ++cleared;
            }
        }
    }
    notify(removals);
    return cleared;
}

std::size_t MemoryTierStore::clear() {
    return clearByPredicate([](const CacheEntry&) { return true; });
}

std::size_t MemoryTierStore::sweepExpired() {
    std::vector<Removal> removals;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        purgeExpiredLocked(steady_clock::now(), removals);
    }
    notify(removals);
    return removals.size();
}

bool MemoryTierStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && steady_clock::now() <= it->second.expires_at;
}

std::size_t MemoryTierStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t MemoryTierStore::bytesUsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_used_;
}

std::vector<CacheEntry> MemoryTierStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = steady_clock::now();
    std::vector<CacheEntry> entries;
    entries.reserve(entries_.size());
    for (const auto& pair : entries_) {
        if (now <= pair.second.expires_at) {
            entries.push_back(pair.second.entry);
        }
    }
    return entries;
}

std::vector<KeyAccessSummary> MemoryTierStore::topKeys(std::size_t n) const {
    std::vector<KeyAccessSummary> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        keys.reserve(entries_.size());
        for (const auto& pair : entries_) {
            keys.push_back(KeyAccessSummary{pair.first, pair.second.entry.access_count, pair.second.entry.size_bytes});
        }
    }
    auto by_access = [](const KeyAccessSummary& a, const KeyAccessSummary& b) {
        if (a.access_count != b.access_count) return a.access_count > b.access_count;
        return a.key < b.key;
    };
    if (keys.size() > n) {
        std::partial_sort(keys.begin(), keys.begin() + n, keys.end(), by_access);
        keys.resize(n);
    } else {
        std::sort(keys.begin(), keys.end(), by_access);
    }
    return keys;
}

MemoryTierStats MemoryTierStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}
