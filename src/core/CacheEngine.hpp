#ifndef CACHEENGINE_HPP
#define CACHEENGINE_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ThreadPoolQueue.hpp"
#include "../cache/EntryCodec.hpp"
#include "../cache/MemoryTierStore.hpp"
#include "../cache/RemoteTierClient.hpp"
#include "../cache/TagDependencyIndex.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ICacheObserver.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/PersistentTierInterface.hpp"
#include "../metrics/LatencyWindow.hpp"
#include "../models/CacheEntry.hpp"
#include "../models/CacheOptions.hpp"
#include "../models/CacheStatistics.hpp"

// Orchestrates the memory, remote and persistent tiers behind one contract.
//
// Reads go preferred tier -> memory -> remote -> persistent and may backfill faster
// tiers in the background. Writes go to one or every enabled tier and succeed when at
// least one tier took the value. Remote-tier trouble never escapes as an exception;
// only contract violations (empty or oversized key, negative TTL) throw
// std::invalid_argument.
//
// Deletes, clears and invalidations hold invalidation_mutex_ exclusively and bump the
// generation; writes and backfills hold it shared, and a backfill that started before
// the latest generation is dropped. Writes also bump a per-key-stripe version under
// the stripe mutex, so a backfill read before a set of the same key is dropped too.
class CacheEngine {
public:
    CacheEngine(const AppConfig& config,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<RemoteTierClient> remote = nullptr,
                std::shared_ptr<PersistentTierInterface> persistent = nullptr);
    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    // Connects the remote tier (a failure leaves the engine running degraded while
    // the monitor keeps reconnecting) and starts the expiry sweep.
    void init();
    void shutdown(bool drain_backfill);
    void shutdown() { shutdown(config_.drain_backfill_on_shutdown); }

    std::optional<CacheValue> get(const std::string& key, const GetOptions& options = {});
    std::optional<CacheEntry> getEntry(const std::string& key, const GetOptions& options = {});

    SetResult set(const std::string& key, const CacheValue& value, const SetOptions& options = {});

    // Returns whether any targeted tier held the key. Safe to repeat.
    bool remove(const std::string& key, const DeleteOptions& options = {});

    // Distinct keys removed across the targeted tiers.
    std::size_t clear(const ClearCriteria& criteria = {});
    std::size_t invalidateByDependencies(const std::vector<std::string>& dependencies);

    // Snapshot from in-process counters only; never waits on a tier.
    CacheStatistics getMetrics() const;

    // Returns the number of items loaded. Bad items are logged and skipped.
    std::size_t warmUp(const std::vector<WarmUpItem>& items);

    // Memory-tier entries, most accessed first.
    std::vector<CacheEntry> query(const CacheQuery& query) const;

    RemoteHealthStatus remoteHealth() const;

    // Drops expired memory entries and index copies, retries failed remote deletes.
    // Returns the number of memory entries expired.
    std::size_t sweepExpired();

    // Waits for queued read-through backfills. False if the timeout passed first.
    bool drainBackfill(std::chrono::milliseconds timeout);

    void subscribe(std::shared_ptr<ICacheObserver> observer);
    void unsubscribe(const std::shared_ptr<ICacheObserver>& observer);

    bool isTierEnabled(CacheTier tier) const;
    const TagDependencyIndex& index() const { return *index_; }
    const AppConfig& config() const { return config_; }

private:
    void validateKey(const std::string& key) const;
    int resolveTtl(const std::optional<int>& ttl_seconds) const;
    std::vector<CacheTier> targetTiers(const std::optional<CacheTier>& tier) const;
    std::vector<CacheTier> readOrder(const std::optional<CacheTier>& preferred) const;

    std::optional<CacheEntry> readTier(CacheTier tier, const std::string& key);
    struct BackfillTicket {
        std::uint64_t generation;
        std::uint64_t write_version;
    };
    void scheduleBackfill(const CacheEntry& entry, CacheTier source, BackfillTicket ticket);
    void runBackfill(const CacheEntry& entry, CacheTier source, BackfillTicket ticket);
    std::size_t stripeFor(const std::string& key) const;

    bool writeRemote(const CacheEntry& entry, bool only_if_absent);
    bool writePersistent(const CacheEntry& entry);
    // Runs under the exclusive lock. Tombstones the key when the remote delete fails.
    RemoteDeleteStatus removeRemote(const std::string& key, std::vector<CacheEvent>& events);
    bool removePersistent(const std::string& key, std::vector<CacheEvent>& events);

    void tombstoneKey(const std::string& key);
    void tombstonePattern(const std::string& pattern);
    void liftTombstone(const std::string& key);
    bool isTombstoned(const std::string& key) const;
    void retryTombstones();

    void onMemoryRemoval(const std::string& key, RemovalReason reason, const std::string& policy);
    void emit(const CacheEvent& event);
    void emitAll(const std::vector<CacheEvent>& events);
    CacheEvent errorEvent(const std::string& key, CacheTier tier, const std::string& detail);

    void armSweepTimer();
    // Returns the elapsed milliseconds it recorded.
    double recordLatency(std::chrono::steady_clock::time_point started);

    AppConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<RemoteTierClient> remote_;
    std::shared_ptr<PersistentTierInterface> persistent_;

    std::shared_ptr<TagDependencyIndex> index_;
    std::unique_ptr<MemoryTierStore> memory_;
    EntryCodec codec_;
    std::unique_ptr<ThreadPoolQueue> backfill_pool_;
    LatencyWindow latency_;

    mutable std::shared_mutex invalidation_mutex_;
    std::atomic<std::uint64_t> generation_{0};

    static constexpr std::size_t WRITE_STRIPES = 64;
    std::array<std::mutex, WRITE_STRIPES> write_mutexes_;
    std::array<std::atomic<std::uint64_t>, WRITE_STRIPES> write_versions_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> sets_{0};
    std::atomic<std::uint64_t> deletes_{0};
    std::atomic<std::uint64_t> errors_{0};
    std::atomic<std::int64_t> persistent_entries_{-1};
    // Longest TTL written to the remote tier; bounds how long a tombstone must live.
    std::atomic<int> max_remote_ttl_seconds_;

    mutable std::mutex tombstone_mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> key_tombstones_;
    std::map<std::string, std::chrono::steady_clock::time_point> pattern_tombstones_;

    mutable std::mutex observer_mutex_;
    std::vector<std::shared_ptr<ICacheObserver>> observers_;

    boost::asio::io_context sweep_ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> sweep_work_;
    boost::asio::steady_timer sweep_timer_;
    std::thread sweep_thread_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

#endif // CACHEENGINE_HPP
