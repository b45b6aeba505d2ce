#include "CacheEngine.hpp"

#include <algorithm>
#include <functional>
#include <set>
#include <stdexcept>

#include <boost/asio/post.hpp>

#include "../cache/EvictionPolicies.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::size_t TOP_KEYS = 10;

    CacheEvent makeEvent(CacheEventType type,
                         const std::string& key,
                         std::optional<CacheTier> tier = std::nullopt,
                         const std::string& detail = "") {
        CacheEvent event;
        event.type = type;
        event.key = key;
        event.tier = tier;
        event.detail = detail;
        return event;
    }

    std::string joinTiers(const std::vector<CacheTier>& tiers) {
        std::string joined;
        for (CacheTier tier : tiers) {
            if (!joined.empty()) joined += ",";
            joined += tierToString(tier);
        }
        return joined;
    }

    bool hasTier(const std::vector<CacheTier>& tiers, CacheTier tier) {
        return std::find(tiers.begin(), tiers.end(), tier) != tiers.end();
    }

    // Glob over the key plus "carries every listed tag".
    bool matchesCriteria(const std::string& key,
                         const std::set<std::string>& tags,
                         const std::string& pattern,
                         const std::vector<std::string>& required_tags) {
        if (!pattern.empty() && !Utils::globMatch(pattern, key)) {
            return false;
        }
        for (const auto& tag : required_tags) {
            if (tags.count(tag) == 0) {
                return false;
            }
        }
        return true;
    }
}

CacheEngine::CacheEngine(const AppConfig& config,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<RemoteTierClient> remote,
                         std::shared_ptr<PersistentTierInterface> persistent)
    : config_(config),
      logger_(std::move(logger)),
      remote_(std::move(remote)),
      persistent_(std::move(persistent)),
      index_(std::make_shared<TagDependencyIndex>()),
      codec_(config.remote_compression, config.compression_min_bytes),
      latency_(config.latency_window_size),
      max_remote_ttl_seconds_(config.default_ttl_seconds),
      sweep_work_(boost::asio::make_work_guard(sweep_ioc_)),
      sweep_timer_(sweep_ioc_) {
    for (auto& version : write_versions_) {
        version.store(0);
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (config_.default_ttl_seconds <= 0) {
        throw std::invalid_argument("default_ttl_seconds must be positive");
    }
    if (config_.max_key_length <= 0) {
        throw std::invalid_argument("max_key_length must be positive");
    }
    if (remote_ && !config_.use_remote) {
        logger_->warn("use_remote is false, ignoring the supplied remote tier client.");
        remote_.reset();
    }

    memory_ = std::make_unique<MemoryTierStore>(config_.memory_max_bytes,
                                                config_.memory_max_items,
                                                makeEvictionPolicy(config_.eviction_policy),
                                                index_);
    memory_->setRemovalListener([this](const std::string& key, RemovalReason reason, const std::string& policy) {
        onMemoryRemoval(key, reason, policy);
    });

    backfill_pool_ = std::make_unique<ThreadPoolQueue>(
        static_cast<size_t>(std::max(1, config_.backfill_threads)), logger_, "BackfillPool");

    if (remote_) {
        remote_->setHealthChangeCallback([this](RemoteHealthState from, RemoteHealthState to) {
            logger_->warn("Remote tier health changed: " + healthStateToString(from) + " -> " + healthStateToString(to));
            emit(makeEvent(CacheEventType::HealthChange, "", CacheTier::Remote, healthStateToString(to)));
        });
        remote_->setReconnectExhaustedCallback([this](int attempts) {
            logger_->error("Remote tier reconnect gave up after " + std::to_string(attempts) +
                           " attempts, retrying at the maximum interval.");
            CacheEvent event = makeEvent(CacheEventType::ReconnectExhausted, "", CacheTier::Remote, std::to_string(attempts));
            event.count = static_cast<std::size_t>(attempts);
            emit(event);
        });
    }
    logger_->debug("CacheEngine constructed");
}

CacheEngine::~CacheEngine() {
    shutdown();
}

// --- Lifecycle ---

void CacheEngine::init() {
    if (stopped_) {
        logger_->warn("CacheEngine::init called after shutdown, ignoring.");
        return;
    }
    if (started_.exchange(true)) {
        return;
    }
    logger_->setup("Initializing cache engine: memory " +
                   std::string(config_.memory_enabled ? "enabled" : "disabled") +
                   " (" + std::to_string(config_.memory_max_bytes) + " bytes, " +
                   std::to_string(config_.memory_max_items) + " items, policy " + memory_->policyName() +
                   "), remote " + std::string(remote_ ? "enabled" : "disabled") +
                   ", persistent " + (persistent_ ? persistent_->name() : std::string("disabled")));

    if (remote_) {
        if (!remote_->connect()) {
            logger_->warn("Remote tier unavailable at startup, running degraded until it reconnects.");
        }
        remote_->startMonitoring();
    }

    sweep_thread_ = std::thread([this]() {
        try {
            sweep_ioc_.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in expiry sweep thread: " + std::string(e.what()));
        }
    });
    boost::asio::post(sweep_ioc_, [this]() { armSweepTimer(); });
    logger_->setup("Cache engine started, expiry sweep every " + std::to_string(config_.sweep_interval_seconds) + "s.");
}

void CacheEngine::shutdown(bool drain_backfill) {
    if (stopped_.exchange(true)) {
        return;
    }
    logger_->setup("Cache engine shutting down...");

    boost::asio::post(sweep_ioc_, [this]() { sweep_timer_.cancel(); });
    sweep_work_.reset();
    if (sweep_thread_.joinable()) {
        sweep_ioc_.stop();
        sweep_thread_.join();
    }

    if (drain_backfill) {
        if (!backfill_pool_->waitIdle(std::chrono::milliseconds(config_.shutdown_drain_timeout_ms))) {
            logger_->warn("Backfill drain timed out after " + std::to_string(config_.shutdown_drain_timeout_ms) +
                          "ms, dropping " + std::to_string(backfill_pool_->pending()) + " pending backfill(s).");
        }
    }
    backfill_pool_->shutdown(false);

    if (remote_) {
        remote_->setHealthChangeCallback(nullptr);
        remote_->setReconnectExhaustedCallback(nullptr);
        remote_->shutdown();
    }
    logger_->setup("Cache engine shut down complete.");
}

void CacheEngine::armSweepTimer() {
    if (stopped_) {
        return;
    }
    sweep_timer_.expires_after(std::chrono::seconds(config_.sweep_interval_seconds));
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || stopped_) {
            return;
        }
        try {
            sweepExpired();
        } catch (const std::exception& e) {
            logger_->error("Expiry sweep failed: " + std::string(e.what()));
        }
        armSweepTimer();
    });
}

// --- Reads ---

std::optional<CacheValue> CacheEngine::get(const std::string& key, const GetOptions& options) {
    auto entry = getEntry(key, options);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

std::optional<CacheEntry> CacheEngine::getEntry(const std::string& key, const GetOptions& options) {
    validateKey(key);
    const auto started = std::chrono::steady_clock::now();
    const bool backfill = options.backfill.value_or(config_.read_through);

    for (CacheTier tier : readOrder(options.preferred_tier)) {
        // Captured before the read: an invalidation or a set of this key that lands after
        // it voids the backfill.
        const BackfillTicket ticket{generation_.load(), write_versions_[stripeFor(key)].load()};
        auto entry = readTier(tier, key);
        if (!entry) {
            continue;
        }
        ++hits_;
        CacheEvent hit = makeEvent(CacheEventType::Hit, key, tier);
        hit.latency_ms = recordLatency(started);
        logger_->debug("Cache hit for key " + key + " in " + tierToString(tier) + " tier");
        emit(hit);
        if (backfill) {
            scheduleBackfill(*entry, tier, ticket);
        }
        return entry;
    }

    ++misses_;
    CacheEvent miss = makeEvent(CacheEventType::Miss, key);
    miss.latency_ms = recordLatency(started);
    logger_->debug("Cache miss for key " + key);
    emit(miss);
    return std::nullopt;
}

std::optional<CacheEntry> CacheEngine::readTier(CacheTier tier, const std::string& key) {
    const auto now = std::chrono::system_clock::now();
    switch (tier) {
        case CacheTier::Memory:
            return memory_->get(key);

        case CacheTier::Remote: {
            if (isTombstoned(key)) {
                logger_->debug("Skipping remote read of tombstoned key " + key);
                return std::nullopt;
            }
            auto payload = remote_->get(key);
            if (!payload) {
                return std::nullopt;
            }
            auto entry = codec_.decode(key, *payload);
            if (!entry) {
                ++errors_;
                logger_->warn("Discarding undecodable remote value for key " + key);
                emit(errorEvent(key, CacheTier::Remote, "decode"));
                return std::nullopt;
            }
            if (entry->isExpired(now)) {
                return std::nullopt;
            }
            entry->tier = CacheTier::Remote;
            entry->last_accessed_at = now;
            ++entry->access_count;
            return entry;
        }

        case CacheTier::Persistent: {
            try {
                auto entry = persistent_->get(key);
                if (!entry || entry->isExpired(now)) {
                    return std::nullopt;
                }
                entry->tier = CacheTier::Persistent;
                entry->last_accessed_at = now;
                ++entry->access_count;
                return entry;
            } catch (const std::exception& e) {
                ++errors_;
                logger_->warn("Persistent tier read failed for key " + key + ": " + e.what());
                emit(errorEvent(key, CacheTier::Persistent, "get"));
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

void CacheEngine::scheduleBackfill(const CacheEntry& entry, CacheTier source, BackfillTicket ticket) {
    bool has_faster_tier = false;
    for (CacheTier tier : allTiers()) {
        if (isFasterThan(tier, source) && isTierEnabled(tier)) {
            has_faster_tier = true;
        }
    }
    if (!has_faster_tier || stopped_) {
        return;
    }
    if (!backfill_pool_->enqueue([this, entry, source, ticket]() { runBackfill(entry, source, ticket); })) {
        logger_->debug("Backfill for key " + entry.key + " not queued, engine is shutting down.");
    }
}

void CacheEngine::runBackfill(const CacheEntry& entry, CacheTier source, BackfillTicket ticket) {
    std::shared_lock<std::shared_mutex> lock(invalidation_mutex_);
    if (generation_.load() != ticket.generation) {
        logger_->debug("Dropping backfill for key " + entry.key + ", invalidated since it was read.");
        return;
    }
    const std::size_t stripe = stripeFor(entry.key);
    std::lock_guard<std::mutex> write_lock(write_mutexes_[stripe]);
    if (write_versions_[stripe].load() != ticket.write_version) {
        logger_->debug("Dropping backfill for key " + entry.key + ", written since it was read.");
        return;
    }
    const auto now = std::chrono::system_clock::now();
    const int remaining_ttl = entry.remainingTtlSeconds(now);
    if (remaining_ttl <= 0) {
        return;
    }

    for (CacheTier tier : allTiers()) {
        if (!isFasterThan(tier, source) || !isTierEnabled(tier)) {
            continue;
        }
        if (tier == CacheTier::Memory) {
            auto admission = memory_->set(entry.key, entry.value, remaining_ttl, entry.tags, entry.dependencies, true);
            if (admission == AdmissionResult::Admitted) {
                logger_->debug("Backfilled key " + entry.key + " into memory tier from " + tierToString(source));
            }
        } else if (tier == CacheTier::Remote) {
            CacheEntry copy = entry;
            copy.created_at = now;
            copy.ttl_seconds = remaining_ttl;
            copy.recomputeSize();
            if (writeRemote(copy, true)) {
                logger_->debug("Backfilled key " + entry.key + " into remote tier from " + tierToString(source));
            }
        }
    }
}

bool CacheEngine::drainBackfill(std::chrono::milliseconds timeout) {
    return backfill_pool_->waitIdle(timeout);
}

// --- Writes ---

SetResult CacheEngine::set(const std::string& key, const CacheValue& value, const SetOptions& options) {
    validateKey(key);
    const int ttl = resolveTtl(options.ttl_seconds);
    const auto started = std::chrono::steady_clock::now();

    SetResult result;
    if (options.tier && !isTierEnabled(*options.tier)) {
        logger_->warn("Set for key " + key + " targeted the disabled " + tierToString(*options.tier) + " tier.");
        result.failed.push_back(*options.tier);
        return result;
    }
    const auto tiers = targetTiers(options.tier);
    if (tiers.empty()) {
        logger_->warn("Set for key " + key + " skipped, no cache tier is enabled.");
        return result;
    }

    CacheEntry entry;
    entry.key = key;
    entry.value = value;
    entry.created_at = std::chrono::system_clock::now();
    entry.last_accessed_at = entry.created_at;
    entry.ttl_seconds = ttl;
    entry.tags = options.tags;
    entry.dependencies = options.dependencies;
    entry.recomputeSize();

    std::vector<CacheEvent> events;
    {
        std::shared_lock<std::shared_mutex> lock(invalidation_mutex_);
        const std::size_t stripe = stripeFor(key);
        std::lock_guard<std::mutex> write_lock(write_mutexes_[stripe]);
        // A memory copy outside the targeted tiers is older than this value and would
        // shadow it on the next read.
        if (!hasTier(tiers, CacheTier::Memory) && memory_->remove(key)) {
            logger_->debug("Dropped stale memory copy of key " + key + " replaced in " + joinTiers(tiers));
        }
        for (CacheTier tier : tiers) {
            bool written = false;
            switch (tier) {
                case CacheTier::Memory: {
                    entry.tier = CacheTier::Memory;
                    auto admission = memory_->set(key, value, ttl, options.tags, options.dependencies);
                    written = admission == AdmissionResult::Admitted;
                    if (!written) {
                        result.capacity_rejected = true;
                        // The old copy would otherwise outlive the value that replaced it.
                        memory_->remove(key);
                        logger_->warn("Entry for key " + key + " (" + std::to_string(entry.size_bytes) +
                                      " bytes) exceeds the memory budget of " + std::to_string(memory_->maxBytes()) +
                                      " bytes, not cached in memory.");
                    }
                    break;
                }
                case CacheTier::Remote:
                    entry.tier = CacheTier::Remote;
                    written = writeRemote(entry, false);
                    if (!written) {
                        ++errors_;
                        events.push_back(errorEvent(key, tier, "set"));
                    }
                    break;
                case CacheTier::Persistent:
                    entry.tier = CacheTier::Persistent;
                    written = writePersistent(entry);
                    if (!written) {
                        ++errors_;
                        events.push_back(errorEvent(key, tier, "set"));
                    }
                    break;
            }
            (written ? result.written : result.failed).push_back(tier);
        }
        // Bumped after the writes: a read that overlapped them must not backfill.
        ++write_versions_[stripe];
    }

    result.ok = !result.written.empty();
    const double latency_ms = recordLatency(started);
    if (result.ok) {
        ++sets_;
        if (!result.failed.empty()) {
            logger_->warn("Degraded set for key " + key + ": written to " + joinTiers(result.written) +
                          ", failed on " + joinTiers(result.failed));
        }
        CacheEvent set_event = makeEvent(CacheEventType::Set, key, result.written.front(), joinTiers(result.written));
        set_event.latency_ms = latency_ms;
        events.push_back(set_event);
    } else {
        logger_->warn("Set for key " + key + " failed on every targeted tier (" + joinTiers(result.failed) + ")");
    }
    emitAll(events);
    return result;
}

bool CacheEngine::writeRemote(const CacheEntry& entry, bool only_if_absent) {
    const std::string payload = codec_.encode(entry);
    if (remote_->set(entry.key, payload, entry.ttl_seconds, only_if_absent)) {
        liftTombstone(entry.key);
        int known = max_remote_ttl_seconds_.load();
        while (entry.ttl_seconds > known && !max_remote_ttl_seconds_.compare_exchange_weak(known, entry.ttl_seconds)) {
        }
        index_->recordTags(entry.key, entry.tags, entry.dependencies, CacheTier::Remote,
                           std::chrono::steady_clock::now() + std::chrono::seconds(entry.ttl_seconds));
        return true;
    }
    if (!only_if_absent) {
        // Whatever the remote tier still holds for this key is now older than the caller's value.
        tombstoneKey(entry.key);
        index_->removeTierCopy(entry.key, CacheTier::Remote);
        logger_->warn("Remote write failed for key " + entry.key + ", tombstoned until a later write or delete succeeds.");
    }
    return false;
}

bool CacheEngine::writePersistent(const CacheEntry& entry) {
    try {
        if (persistent_->set(entry)) {
            index_->recordTags(entry.key, entry.tags, entry.dependencies, CacheTier::Persistent,
                               std::chrono::steady_clock::now() + std::chrono::seconds(entry.ttl_seconds));
            return true;
        }
        logger_->warn("Persistent tier " + persistent_->name() + " rejected key " + entry.key);
    } catch (const std::exception& e) {
        logger_->warn("Persistent tier write failed for key " + entry.key + ": " + e.what());
    }
    try {
        persistent_->remove(entry.key);
    } catch (const std::exception& e) {
        logger_->warn("Persistent tier cleanup failed for key " + entry.key + ": " + e.what());
    }
    index_->removeTierCopy(entry.key, CacheTier::Persistent);
    return false;
}

// --- Deletes and invalidation ---

bool CacheEngine::remove(const std::string& key, const DeleteOptions& options) {
    validateKey(key);
    const auto started = std::chrono::steady_clock::now();
    if (options.tier && !isTierEnabled(*options.tier)) {
        logger_->debug("Delete for key " + key + " targeted the disabled " + tierToString(*options.tier) + " tier.");
        return false;
    }
    const auto tiers = targetTiers(options.tier);

    bool present = false;
    std::vector<CacheEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(invalidation_mutex_);
        ++generation_;
        for (CacheTier tier : tiers) {
            switch (tier) {
                case CacheTier::Memory:
                    present = memory_->remove(key) || present;
                    break;
                case CacheTier::Remote:
                    present = removeRemote(key, events) == RemoteDeleteStatus::Deleted || present;
                    break;
                case CacheTier::Persistent:
                    present = removePersistent(key, events) || present;
                    break;
            }
        }
        if (!options.tier) {
            index_->removeKey(key);
        }
    }

    recordLatency(started);
    if (present) {
        ++deletes_;
        events.push_back(makeEvent(CacheEventType::Delete, key, options.tier, joinTiers(tiers)));
    }
    emitAll(events);
    return present;
}

RemoteDeleteStatus CacheEngine::removeRemote(const std::string& key, std::vector<CacheEvent>& events) {
    auto status = remote_->remove(key);
    index_->removeTierCopy(key, CacheTier::Remote);
    if (status == RemoteDeleteStatus::Failed) {
        tombstoneKey(key);
        ++errors_;
        events.push_back(errorEvent(key, CacheTier::Remote, "delete"));
        logger_->warn("Remote delete failed for key " + key + ", tombstoned until the remote copy expires.");
    } else {
        liftTombstone(key);
    }
    return status;
}

bool CacheEngine::removePersistent(const std::string& key, std::vector<CacheEvent>& events) {
    try {
        bool removed = persistent_->remove(key);
        index_->removeTierCopy(key, CacheTier::Persistent);
        return removed;
    } catch (const std::exception& e) {
        ++errors_;
        events.push_back(errorEvent(key, CacheTier::Persistent, "delete"));
        logger_->warn("Persistent tier delete failed for key " + key + ": " + e.what());
        return false;
    }
}

std::size_t CacheEngine::clear(const ClearCriteria& criteria) {
    if (criteria.tier && !isTierEnabled(*criteria.tier)) {
        logger_->debug("Clear targeted the disabled " + tierToString(*criteria.tier) + " tier.");
        return 0;
    }
    const auto tiers = targetTiers(criteria.tier);

    std::set<std::string> removed;
    std::vector<CacheEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(invalidation_mutex_);
        ++generation_;

        if (hasTier(tiers, CacheTier::Memory)) {
            std::vector<std::string> keys;
            memory_->clearByPredicate([&criteria](const CacheEntry& entry) {
                return matchesCriteria(entry.key, entry.tags, criteria.pattern, criteria.tags);
            }, &keys);
            removed.insert(keys.begin(), keys.end());
        }

        if (hasTier(tiers, CacheTier::Remote)) {
            if (!criteria.tags.empty()) {
                // Tags live only in the index, so a tag clear touches just the indexed remote copies.
                for (const auto& key : index_->keysForAllTags(criteria.tags)) {
                    if (!criteria.pattern.empty() && !Utils::globMatch(criteria.pattern, key)) {
                        continue;
                    }
                    if (!hasTier(index_->tiersForKey(key), CacheTier::Remote)) {
                        continue;
                    }
                    if (removeRemote(key, events) == RemoteDeleteStatus::Deleted) {
                        removed.insert(key);
                    }
                }
            } else {
                const std::string glob = criteria.pattern.empty() ? "*" : criteria.pattern;
                auto keys = remote_->removeMatching(glob);
                if (keys) {
                    for (const auto& key : *keys) {
                        index_->removeTierCopy(key, CacheTier::Remote);
                        liftTombstone(key);
                        removed.insert(key);
                    }
                } else {
                    tombstonePattern(glob);
                    ++errors_;
                    events.push_back(errorEvent("", CacheTier::Remote, "clear"));
                    logger_->warn("Remote clear of '" + glob + "' failed, matching keys tombstoned until it can be retried.");
                }
            }
        }

        if (hasTier(tiers, CacheTier::Persistent)) {
            try {
                for (const auto& key : persistent_->removeMatching(criteria.pattern, criteria.tags)) {
                    index_->removeTierCopy(key, CacheTier::Persistent);
                    removed.insert(key);
                }
            } catch (const std::exception& e) {
                ++errors_;
                events.push_back(errorEvent("", CacheTier::Persistent, "clear"));
                logger_->warn("Persistent tier clear failed: " + std::string(e.what()));
            }
        }
    }

    std::string description = "tiers=" + joinTiers(tiers);
    if (!criteria.pattern.empty()) description += " pattern=" + criteria.pattern;
    if (!criteria.tags.empty()) {
        std::string tags;
        for (const auto& tag : criteria.tags) {
            if (!tags.empty()) tags += ",";
            tags += tag;
        }
        description += " tags=" + tags;
    }
    logger_->info("Cleared " + std::to_string(removed.size()) + " key(s) (" + description + ")");

    CacheEvent clear_event = makeEvent(CacheEventType::Clear, "", criteria.tier, description);
    clear_event.count = removed.size();
    events.push_back(clear_event);
    emitAll(events);
    return removed.size();
}

std::size_t CacheEngine::invalidateByDependencies(const std::vector<std::string>& dependencies) {
    if (dependencies.empty()) {
        return 0;
    }

    std::size_t invalidated = 0;
    std::vector<CacheEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(invalidation_mutex_);
        ++generation_;

        std::set<std::string> keys;
        for (const auto& dependency : dependencies) {
            auto matching = index_->keysForDependency(dependency);
            keys.insert(matching.begin(), matching.end());
        }

        for (const auto& key : keys) {
            const auto tiers = index_->tiersForKey(key);
            bool removed = memory_->remove(key);
            if (remote_ && hasTier(tiers, CacheTier::Remote)) {
                removed = removeRemote(key, events) != RemoteDeleteStatus::NotFound || removed;
            }
            if (persistent_ && hasTier(tiers, CacheTier::Persistent)) {
                removed = removePersistent(key, events) || removed;
            }
            index_->removeKey(key);
            if (removed) {
                ++invalidated;
            }
        }
    }

    std::string joined;
    for (const auto& dependency : dependencies) {
        if (!joined.empty()) joined += ",";
        joined += dependency;
    }
    logger_->info("Invalidated " + std::to_string(invalidated) + " key(s) for dependencies " + joined);

    CacheEvent invalidate_event = makeEvent(CacheEventType::Invalidate, "", std::nullopt, joined);
    invalidate_event.count = invalidated;
    events.push_back(invalidate_event);
    emitAll(events);
    return invalidated;
}

// --- Tombstones ---

void CacheEngine::tombstoneKey(const std::string& key) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(max_remote_ttl_seconds_.load());
    std::lock_guard<std::mutex> lock(tombstone_mutex_);
    auto& expiry = key_tombstones_[key];
    expiry = std::max(expiry, until);
}

void CacheEngine::tombstonePattern(const std::string& pattern) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(max_remote_ttl_seconds_.load());
    std::lock_guard<std::mutex> lock(tombstone_mutex_);
    auto& expiry = pattern_tombstones_[pattern];
    expiry = std::max(expiry, until);
}

void CacheEngine::liftTombstone(const std::string& key) {
    std::lock_guard<std::mutex> lock(tombstone_mutex_);
    key_tombstones_.erase(key);
}

bool CacheEngine::isTombstoned(const std::string& key) const {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(tombstone_mutex_);
    auto it = key_tombstones_.find(key);
    if (it != key_tombstones_.end() && it->second > now) {
        return true;
    }
    for (const auto& pattern : pattern_tombstones_) {
        if (pattern.second > now && Utils::globMatch(pattern.first, key)) {
            return true;
        }
    }
    return false;
}

void CacheEngine::retryTombstones() {
    if (!remote_) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> keys;
    std::vector<std::string> patterns;
    {
        std::lock_guard<std::mutex> lock(tombstone_mutex_);
        for (auto it = key_tombstones_.begin(); it != key_tombstones_.end();) {
            if (it->second <= now) {
                it = key_tombstones_.erase(it);
            } else {
                keys.push_back(it->first);
                ++it;
            }
        }
        for (auto it = pattern_tombstones_.begin(); it != pattern_tombstones_.end();) {
            if (it->second <= now) {
                it = pattern_tombstones_.erase(it);
            } else {
                patterns.push_back(it->first);
                ++it;
            }
        }
    }
    if ((keys.empty() && patterns.empty()) || !remote_->isAvailable()) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(invalidation_mutex_);
    std::size_t lifted = 0;
    for (const auto& key : keys) {
        {
            // A write may have replaced the stale copy since the list was taken.
            std::lock_guard<std::mutex> tombstone_lock(tombstone_mutex_);
            if (key_tombstones_.count(key) == 0) {
                continue;
            }
        }
        if (remote_->remove(key) != RemoteDeleteStatus::Failed) {
            liftTombstone(key);
            ++lifted;
        }
    }
    for (const auto& pattern : patterns) {
        auto removed = remote_->removeMatching(pattern);
        if (!removed) {
            continue;
        }
        for (const auto& key : *removed) {
            index_->removeTierCopy(key, CacheTier::Remote);
        }
        std::lock_guard<std::mutex> tombstone_lock(tombstone_mutex_);
        pattern_tombstones_.erase(pattern);
        ++lifted;
    }
    if (lifted > 0) {
        logger_->info("Lifted " + std::to_string(lifted) + " remote tombstone(s) after retrying the delete.");
    }
}

// --- Maintenance and introspection ---

std::size_t CacheEngine::sweepExpired() {
    const std::size_t expired = memory_->sweepExpired();
    const std::size_t purged = index_->purgeExpired();
    retryTombstones();
    if (persistent_) {
        try {
            auto size = persistent_->size();
            persistent_entries_ = size ? static_cast<std::int64_t>(*size) : -1;
        } catch (const std::exception& e) {
            persistent_entries_ = -1;
            logger_->warn("Persistent tier size lookup failed: " + std::string(e.what()));
        }
    }
    logger_->debug("Expiry sweep removed " + std::to_string(expired) + " memory entries and " +
                   std::to_string(purged) + " index copies.");
    return expired;
}

CacheStatistics CacheEngine::getMetrics() const {
    CacheStatistics stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    const std::uint64_t lookups = stats.hits + stats.misses;
    stats.hit_rate = lookups == 0 ? 0.0 : static_cast<double>(stats.hits) / static_cast<double>(lookups);
    stats.sets = sets_.load();
    stats.deletes = deletes_.load();
    stats.errors = errors_.load();

    const MemoryTierStats memory_stats = memory_->stats();
    stats.evictions_by_policy = memory_stats.evictions_by_policy;
    for (const auto& pair : memory_stats.evictions_by_policy) {
        stats.evictions_total += pair.second;
    }
    stats.expirations = memory_stats.expirations;
    stats.capacity_rejections = memory_stats.rejections;

    stats.memory_entries = memory_->size();
    stats.memory_bytes_used = memory_->bytesUsed();
    stats.memory_bytes_budget = memory_->maxBytes();
    stats.memory_items_budget = memory_->maxItems();
    stats.persistent_entries = persistent_ ? persistent_entries_.load() : -1;

    stats.indexed_keys = index_->size();
    stats.indexed_tags = index_->tagCount();
    stats.indexed_dependencies = index_->dependencyCount();

    const auto window = latency_.summarize();
    stats.avg_latency_ms = window.avg_ms;
    stats.max_latency_ms = window.max_ms;
    stats.latency_samples = window.samples;

    stats.pending_backfills = backfill_pool_->pending();
    {
        std::lock_guard<std::mutex> lock(tombstone_mutex_);
        stats.remote_tombstones = key_tombstones_.size() + pattern_tombstones_.size();
    }

    stats.remote = remoteHealth();
    if (stats.remote.key_count) {
        stats.remote_entries = *stats.remote.key_count;
    }
    stats.top_keys = memory_->topKeys(TOP_KEYS);
    return stats;
}

RemoteHealthStatus CacheEngine::remoteHealth() const {
    if (!remote_) {
        return RemoteHealthStatus{};
    }
    return remote_->healthStatus();
}

std::size_t CacheEngine::warmUp(const std::vector<WarmUpItem>& items) {
    std::size_t loaded = 0;
    std::size_t failed = 0;
    for (const auto& item : items) {
        try {
            SetOptions options;
            options.ttl_seconds = item.ttl_seconds;
            options.tags = item.tags;
            options.dependencies = item.dependencies;
            if (set(item.key, item.value, options).ok) {
                ++loaded;
            } else {
                ++failed;
                logger_->warn("Warm-up item '" + item.key + "' was not stored in any tier.");
            }
        } catch (const std::invalid_argument& e) {
            ++failed;
            logger_->warn("Skipping warm-up item '" + item.key + "': " + e.what());
        }
    }
    logger_->info("Warm-up loaded " + std::to_string(loaded) + " of " + std::to_string(items.size()) +
                  " entries (" + std::to_string(failed) + " failed)");
    CacheEvent event = makeEvent(CacheEventType::WarmUp, "", std::nullopt, "failed=" + std::to_string(failed));
    event.count = loaded;
    emit(event);
    return loaded;
}

std::vector<CacheEntry> CacheEngine::query(const CacheQuery& query) const {
    const auto now = std::chrono::system_clock::now();
    std::vector<CacheEntry> matches;
    for (auto& entry : memory_->snapshot()) {
        if (!matchesCriteria(entry.key, entry.tags, query.pattern, query.tags)) {
            continue;
        }
        if (entry.access_count < query.min_access) {
            continue;
        }
        if (query.max_age_seconds && now - entry.created_at > std::chrono::seconds(*query.max_age_seconds)) {
            continue;
        }
        matches.push_back(std::move(entry));
    }
    std::sort(matches.begin(), matches.end(), [](const CacheEntry& a, const CacheEntry& b) {
        if (a.access_count != b.access_count) {
            return a.access_count > b.access_count;
        }
        return a.key < b.key;
    });
    if (query.limit > 0 && matches.size() > query.limit) {
        matches.resize(query.limit);
    }
    return matches;
}

// --- Observers ---

void CacheEngine::subscribe(std::shared_ptr<ICacheObserver> observer) {
    if (!observer) {
        throw std::invalid_argument("Observer pointer cannot be null");
    }
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observers_.push_back(std::move(observer));
}

void CacheEngine::unsubscribe(const std::shared_ptr<ICacheObserver>& observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void CacheEngine::emit(const CacheEvent& event) {
    std::vector<std::shared_ptr<ICacheObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        try {
            observer->onCacheEvent(event);
        } catch (const std::exception& e) {
            logger_->error("Cache observer threw on " + eventTypeToString(event.type) + " event: " + e.what());
        }
    }
}

void CacheEngine::emitAll(const std::vector<CacheEvent>& events) {
    for (const auto& event : events) {
        emit(event);
    }
}

CacheEvent CacheEngine::errorEvent(const std::string& key, CacheTier tier, const std::string& detail) {
    return makeEvent(CacheEventType::Error, key, tier, detail);
}

void CacheEngine::onMemoryRemoval(const std::string& key, RemovalReason reason, const std::string& policy) {
    if (reason == RemovalReason::Evicted) {
        logger_->debug("Evicted key " + key + " from memory tier (" + policy + ")");
        emit(makeEvent(CacheEventType::Evict, key, CacheTier::Memory, policy));
    } else if (reason == RemovalReason::Expired) {
        emit(makeEvent(CacheEventType::Expire, key, CacheTier::Memory));
    }
}

// --- Helpers ---

std::size_t CacheEngine::stripeFor(const std::string& key) const {
    return std::hash<std::string>{}(key) % WRITE_STRIPES;
}

void CacheEngine::validateKey(const std::string& key) const {
    if (key.empty()) {
        throw std::invalid_argument("Cache key must not be empty");
    }
    if (key.size() > static_cast<std::size_t>(config_.max_key_length)) {
        throw std::invalid_argument("Cache key exceeds max_key_length of " + std::to_string(config_.max_key_length));
    }
}

int CacheEngine::resolveTtl(const std::optional<int>& ttl_seconds) const {
    if (ttl_seconds && *ttl_seconds < 0) {
        throw std::invalid_argument("TTL must not be negative: " + std::to_string(*ttl_seconds));
    }
    if (!ttl_seconds || *ttl_seconds == 0) {
        return config_.default_ttl_seconds;
    }
    return *ttl_seconds;
}

bool CacheEngine::isTierEnabled(CacheTier tier) const {
    switch (tier) {
        case CacheTier::Memory: return config_.memory_enabled;
        case CacheTier::Remote: return remote_ != nullptr;
        case CacheTier::Persistent: return persistent_ != nullptr;
    }
    return false;
}

std::vector<CacheTier> CacheEngine::targetTiers(const std::optional<CacheTier>& tier) const {
    if (tier) {
        return {*tier};
    }
    std::vector<CacheTier> tiers;
    for (CacheTier candidate : allTiers()) {
        if (isTierEnabled(candidate)) {
            tiers.push_back(candidate);
        }
    }
    return tiers;
}

std::vector<CacheTier> CacheEngine::readOrder(const std::optional<CacheTier>& preferred) const {
    std::vector<CacheTier> order;
    if (preferred && isTierEnabled(*preferred)) {
        order.push_back(*preferred);
    }
    for (CacheTier tier : allTiers()) {
        if (isTierEnabled(tier) && (!preferred || tier != *preferred)) {
            order.push_back(tier);
        }
    }
    return order;
}

double CacheEngine::recordLatency(std::chrono::steady_clock::time_point started) {
    const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    latency_.record(elapsed_ms);
    return elapsed_ms;
}
