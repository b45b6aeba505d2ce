// tests/test_memorytierstore.cpp
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/cache/EvictionPolicies.hpp"
#include "../src/cache/MemoryTierStore.hpp"
#include "../src/cache/TagDependencyIndex.hpp"

namespace {
    CacheValue text(const std::string& data) {
        return CacheValue{data, "text/plain"};
    }

    std::unique_ptr<MemoryTierStore> makeStore(std::size_t max_bytes,
                                               std::size_t max_items,
                                               const std::string& policy = "lru",
                                               std::shared_ptr<TagDependencyIndex> index = nullptr) {
        return std::make_unique<MemoryTierStore>(max_bytes, max_items, makeEvictionPolicy(policy), index);
    }
}

TEST(MemoryTierStoreTest, SetAndGet) {
    auto store = makeStore(1024, 10);
    EXPECT_EQ(store->set("user:1", text("alice"), 60), AdmissionResult::Admitted);

    auto entry = store->get("user:1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value, text("alice"));
    EXPECT_EQ(entry->tier, CacheTier::Memory);
    EXPECT_EQ(entry->ttl_seconds, 60);
    EXPECT_EQ(entry->access_count, 1u);
}

TEST(MemoryTierStoreTest, GetNonExistent) {
    auto store = makeStore(1024, 10);
    EXPECT_FALSE(store->get("missing").has_value());
}

TEST(MemoryTierStoreTest, AccessCountGrowsOnEveryHit) {
    auto store = makeStore(1024, 10);
    store->set("k", text("v"), 60);
    store->get("k");
    store->get("k");
    auto entry = store->get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->access_count, 3u);
}

TEST(MemoryTierStoreTest, GetExpired) {
    auto store = makeStore(1024, 10);
    std::vector<RemovalReason> reasons;
    store->setRemovalListener([&reasons](const std::string&, RemovalReason reason, const std::string&) {
        reasons.push_back(reason);
    });
    store->set("short", text("lived"), 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_FALSE(store->get("short").has_value());
    EXPECT_EQ(store->size(), 0u);
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], RemovalReason::Expired);
    EXPECT_EQ(store->stats().expirations, 1u);
}

TEST(MemoryTierStoreTest, OverwriteReplacesValueAndSize) {
    auto store = makeStore(1024, 10);
    store->set("k", text("short"), 60);
    store->set("k", text("a much longer value"), 60);

    auto entry = store->get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value.data, "a much longer value");
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(store->bytesUsed(), CacheEntry::estimateSize("k", text("a much longer value"), {}, {}));
}

TEST(MemoryTierStoreTest, RejectsEntryLargerThanBudgetAndKeepsOldCopy) {
    auto store = makeStore(32, 10);
    store->set("k", text("small"), 60);

    EXPECT_EQ(store->set("k", text(std::string(64, 'x')), 60), AdmissionResult::RejectedTooLarge);

    auto entry = store->get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value.data, "small");
    EXPECT_EQ(store->stats().rejections, 1u);
}

TEST(MemoryTierStoreTest, ItemBudgetEvictsLeastRecentlyUsed) {
    auto store = makeStore(1024, 2);
    std::vector<std::string> evicted;
    store->setRemovalListener([&evicted](const std::string& key, RemovalReason reason, const std::string& policy) {
        if (reason == RemovalReason::Evicted) {
            evicted.push_back(key + "/" + policy);
        }
    });

    store->set("a", text("1"), 60);
    store->set("b", text("2"), 60);
    store->get("a");
    store->set("c", text("3"), 60);

    EXPECT_TRUE(store->contains("a"));
    EXPECT_FALSE(store->contains("b"));
    EXPECT_TRUE(store->contains("c"));
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "b/lru");
    EXPECT_EQ(store->stats().evictions_by_policy.at("lru"), 1u);
}

TEST(MemoryTierStoreTest, ByteBudgetEvictsUntilTheNewEntryFits) {
    // Each entry is key(1) + data(10) + type(10) = 21 bytes.
    auto store = makeStore(64, 100);
    store->set("a", text("0123456789"), 60);
    store->set("b", text("0123456789"), 60);
    store->set("c", text("0123456789"), 60);
    EXPECT_EQ(store->size(), 3u);

    store->set("d", text("0123456789"), 60);

    EXPECT_LE(store->bytesUsed(), store->maxBytes());
    EXPECT_FALSE(store->contains("a"));
    EXPECT_TRUE(store->contains("d"));
}

TEST(MemoryTierStoreTest, OnlyIfAbsentSkipsLiveCopy) {
    auto store = makeStore(1024, 10);
    store->set("k", text("newer"), 60);

    EXPECT_EQ(store->set("k", text("older"), 60, {}, {}, true), AdmissionResult::SkippedExisting);
    EXPECT_EQ(store->get("k")->value.data, "newer");

    EXPECT_EQ(store->set("other", text("fresh"), 60, {}, {}, true), AdmissionResult::Admitted);
}

TEST(MemoryTierStoreTest, RemoveEntry) {
    auto store = makeStore(1024, 10);
    store->set("k", text("v"), 60);

    EXPECT_TRUE(store->remove("k"));
    EXPECT_FALSE(store->contains("k"));
    EXPECT_FALSE(store->remove("k"));
    EXPECT_EQ(store->bytesUsed(), 0u);
}

TEST(MemoryTierStoreTest, ClearByPredicateReportsRemovedKeys) {
    auto store = makeStore(1024, 10);
    store->set("user:1", text("a"), 60, {"users"});
    store->set("user:2", text("b"), 60, {"users"});
    store->set("order:1", text("c"), 60, {"orders"});

    std::vector<std::string> removed;
    std::size_t cleared = store->clearByPredicate([](const CacheEntry& e) { return e.tags.count("users") > 0; }, &removed);

    EXPECT_EQ(cleared, 2u);
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_TRUE(store->contains("order:1"));
    EXPECT_EQ(store->clear(), 1u);
    EXPECT_EQ(store->size(), 0u);
}

TEST(MemoryTierStoreTest, KeepsIndexInStep) {
    auto index = std::make_shared<TagDependencyIndex>();
    auto store = makeStore(1024, 1, "lru", index);

    store->set("a", text("1"), 60, {"t"}, {"d"});
    EXPECT_EQ(index->keysForTag("t"), std::set<std::string>{"a"});

    // Evicting "a" for "b" must drop its index entry too.
    store->set("b", text("2"), 60, {"t"});
    EXPECT_EQ(index->keysForTag("t"), std::set<std::string>{"b"});
    EXPECT_TRUE(index->keysForDependency("d").empty());

    store->remove("b");
    EXPECT_FALSE(index->contains("b"));
}

TEST(MemoryTierStoreTest, SweepExpiredDropsOnlyExpired) {
    auto store = makeStore(1024, 10);
    store->set("short", text("1"), 1);
    store->set("long", text("2"), 60);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_EQ(store->sweepExpired(), 1u);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_TRUE(store->contains("long"));
}

TEST(MemoryTierStoreTest, TopKeysOrderedByAccessCount) {
    auto store = makeStore(1024, 10);
    store->set("a", text("1"), 60);
    store->set("b", text("2"), 60);
    store->set("c", text("3"), 60);
    store->get("b");
    store->get("b");
    store->get("c");

    auto top = store->topKeys(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].key, "b");
    EXPECT_EQ(top[0].access_count, 2u);
    EXPECT_EQ(top[1].key, "c");
}

TEST(MemoryTierStoreTest, RejectsZeroBudgets) {
    EXPECT_THROW(MemoryTierStore(0, 10, makeEvictionPolicy("lru")), std::invalid_argument);
    EXPECT_THROW(MemoryTierStore(10, 0, makeEvictionPolicy("lru")), std::invalid_argument);
    EXPECT_THROW(MemoryTierStore(10, 10, nullptr), std::invalid_argument);
}

TEST(MemoryTierStoreTest, ConcurrentWritersStayWithinBudget) {
    auto store = makeStore(2048, 50);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&store, t]() {
            for (int i = 0; i < 200; ++i) {
                store->set("k" + std::to_string(t) + ":" + std::to_string(i), text("value"), 60);
                store->get("k" + std::to_string(t) + ":" + std::to_string(i / 2));
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_LE(store->size(), 50u);
    EXPECT_LE(store->bytesUsed(), 2048u);
}
