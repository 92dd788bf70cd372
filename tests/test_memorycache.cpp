// test/test_memorycache.cpp
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "TestDoubles.hpp"
#include "../src/cache/MemoryCache.hpp"

using namespace std::chrono_literals;

class MemoryCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();

    std::unique_ptr<MemoryCache> makeCache(std::size_t capacity,
                                           std::optional<std::chrono::milliseconds> default_ttl = std::nullopt) {
        CacheOptions options;
        options.capacity = capacity;
        options.default_ttl = default_ttl;
        return std::make_unique<MemoryCache>(options, clock);
    }

    static MemoryKey key(const std::string& owner, const std::string& subkey) {
        return MemoryKey(owner, "pref", subkey);
    }
};

TEST_F(MemoryCacheTest, SetAndGet) {
    auto cache = makeCache(10);
    json value = {{"name", "TestCo"}};

    cache->put(key("agent", "k1"), value);
    auto retrieved = cache->get(key("agent", "k1"));
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ(*retrieved, value);
}

TEST_F(MemoryCacheTest, GetNonExistentIsMiss) {
    auto cache = makeCache(10);

    EXPECT_FALSE(cache->get(key("agent", "missing")).has_value());
    auto stats = cache->getStats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 0u);
}

TEST_F(MemoryCacheTest, OverwriteEntry) {
    auto cache = makeCache(10);
    cache->put(key("agent", "k"), {{"name", "OldCo"}});
    cache->put(key("agent", "k"), {{"name", "NewCo"}});

    auto retrieved = cache->get(key("agent", "k"));
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ((*retrieved)["name"], "NewCo");
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(MemoryCacheTest, OverwriteResetsAccessCountAndTtl) {
    auto cache = makeCache(10);
    cache->put(key("agent", "k"), {{"v", 1}}, 1s);
    cache->get(key("agent", "k"));
    EXPECT_EQ(cache->accessCount(key("agent", "k")), 1u);

    clock->advance(900ms);
    cache->put(key("agent", "k"), {{"v", 2}}, 1s);
    EXPECT_EQ(cache->accessCount(key("agent", "k")), 0u);

    // Age is measured from the second put
    clock->advance(900ms);
    EXPECT_TRUE(cache->get(key("agent", "k")).has_value());
}

TEST_F(MemoryCacheTest, SizeNeverExceedsCapacity) {
    auto cache = makeCache(3);
    for (int i = 0; i < 20; ++i) {
        cache->put(key("agent", "k" + std::to_string(i)), {{"v", i}});
        EXPECT_LE(cache->size(), 3u);
    }
    EXPECT_EQ(cache->size(), 3u);
    EXPECT_EQ(cache->getStats().evictions, 17u);
}

TEST_F(MemoryCacheTest, EvictsLeastRecentlyInserted) {
    auto cache = makeCache(2);
    cache->put(key("o", "a"), {{"v", "a"}});
    cache->put(key("o", "b"), {{"v", "b"}});
    cache->put(key("o", "c"), {{"v", "c"}});

    EXPECT_FALSE(cache->get(key("o", "a")).has_value());
    EXPECT_TRUE(cache->get(key("o", "b")).has_value());
    EXPECT_TRUE(cache->get(key("o", "c")).has_value());
}

TEST_F(MemoryCacheTest, GetPromotesEntry) {
    auto cache = makeCache(2);
    cache->put(key("o", "a"), {{"v", "a"}});
    cache->put(key("o", "b"), {{"v", "b"}});
    ASSERT_TRUE(cache->get(key("o", "a")).has_value());
    cache->put(key("o", "c"), {{"v", "c"}});

    EXPECT_FALSE(cache->get(key("o", "b")).has_value());
    EXPECT_TRUE(cache->get(key("o", "a")).has_value());
    EXPECT_TRUE(cache->get(key("o", "c")).has_value());
}

TEST_F(MemoryCacheTest, ReinsertPromotesWithoutEvicting) {
    auto cache = makeCache(2);
    cache->put(key("o", "a"), {{"v", 1}});
    cache->put(key("o", "b"), {{"v", 2}});
    cache->put(key("o", "a"), {{"v", 3}});
    EXPECT_EQ(cache->getStats().evictions, 0u);

    cache->put(key("o", "c"), {{"v", 4}});
    EXPECT_FALSE(cache->get(key("o", "b")).has_value());
    EXPECT_TRUE(cache->get(key("o", "a")).has_value());
}

TEST_F(MemoryCacheTest, AccessCountDoesNotProtectFromEviction) {
    auto cache = makeCache(2);
    cache->put(key("o", "hot"), {{"v", 1}});
    for (int i = 0; i < 10; ++i) {
        cache->get(key("o", "hot"));
    }
    cache->put(key("o", "cold"), {{"v", 2}});
    cache->put(key("o", "new"), {{"v", 3}});

    // "hot" was read many times but "cold" was touched more recently
    EXPECT_FALSE(cache->get(key("o", "hot")).has_value());
    EXPECT_TRUE(cache->get(key("o", "cold")).has_value());
}

TEST_F(MemoryCacheTest, TtlExpiresLazily) {
    auto cache = makeCache(10);
    cache->put(key("o", "k"), {{"v", 1}}, 1s);

    clock->advance(500ms);
    EXPECT_TRUE(cache->get(key("o", "k")).has_value());

    clock->advance(1000ms);
    EXPECT_FALSE(cache->get(key("o", "k")).has_value());
    EXPECT_EQ(cache->size(), 0u);

    auto stats = cache->getStats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.expirations, 1u);
}

TEST_F(MemoryCacheTest, EntryAtExactTtlIsStillFresh) {
    auto cache = makeCache(10);
    cache->put(key("o", "k"), {{"v", 1}}, 1s);
    clock->advance(1000ms);
    EXPECT_TRUE(cache->get(key("o", "k")).has_value());
    clock->advance(1ms);
    EXPECT_FALSE(cache->get(key("o", "k")).has_value());
}

TEST_F(MemoryCacheTest, DefaultTtlAppliesWithoutOverride) {
    auto cache = makeCache(10, 2s);
    cache->put(key("o", "default"), {{"v", 1}});
    cache->put(key("o", "override"), {{"v", 2}}, 10s);

    clock->advance(3s);
    EXPECT_FALSE(cache->get(key("o", "default")).has_value());
    EXPECT_TRUE(cache->get(key("o", "override")).has_value());
}

TEST_F(MemoryCacheTest, NoTtlNeverExpires) {
    auto cache = makeCache(10);
    cache->put(key("o", "k"), {{"v", 1}});
    clock->advance(std::chrono::hours(24 * 365));
    EXPECT_TRUE(cache->get(key("o", "k")).has_value());
    EXPECT_EQ(cache->cleanupExpired(), 0u);
}

TEST_F(MemoryCacheTest, RemoveEntry) {
    auto cache = makeCache(10);
    cache->put(key("o", "k"), {{"name", "ToBeRemoved"}});

    EXPECT_TRUE(cache->remove(key("o", "k")));
    EXPECT_FALSE(cache->remove(key("o", "k")));
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(MemoryCacheTest, RemoveIgnoresExpiry) {
    auto cache = makeCache(10);
    cache->put(key("o", "k"), {{"v", 1}}, 1s);
    clock->advance(5s);
    EXPECT_TRUE(cache->remove(key("o", "k")));
}

TEST_F(MemoryCacheTest, ClearForOwnerMatchesWholeOwnerOnly) {
    auto cache = makeCache(10);
    cache->put(key("x", "k1"), {{"v", 1}});
    cache->put(MemoryKey("x", "other", "k2"), {{"v", 2}});
    cache->put(key("xy", "k1"), {{"v", 3}});
    cache->put(key("y", "k1"), {{"v", 4}});

    EXPECT_EQ(cache->clearForOwner("x"), 2u);
    EXPECT_EQ(cache->size(), 2u);
    EXPECT_TRUE(cache->get(key("xy", "k1")).has_value());
    EXPECT_TRUE(cache->get(key("y", "k1")).has_value());
    EXPECT_EQ(cache->clearForOwner("x"), 0u);
}

TEST_F(MemoryCacheTest, CleanupExpiredRemovesOnlyExpired) {
    auto cache = makeCache(10);
    cache->put(key("o", "short1"), {{"v", 1}}, 1s);
    cache->put(key("o", "short2"), {{"v", 2}}, 1s);
    cache->put(key("o", "long"), {{"v", 3}}, 1h);
    cache->put(key("o", "forever"), {{"v", 4}});

    clock->advance(2s);
    EXPECT_EQ(cache->cleanupExpired(clock->now()), 2u);
    EXPECT_EQ(cache->size(), 2u);

    auto stats = cache->getStats();
    EXPECT_EQ(stats.hits + stats.misses, 0u); // Sweeps are not lookups
    EXPECT_EQ(stats.expirations, 2u);
}

TEST_F(MemoryCacheTest, CleanupExpiredAtExplicitTime) {
    auto cache = makeCache(10);
    cache->put(key("o", "k"), {{"v", 1}}, 1s);

    EXPECT_EQ(cache->cleanupExpired(clock->now() + 500ms), 0u);
    EXPECT_EQ(cache->cleanupExpired(clock->now() + 1500ms), 1u);
}

TEST_F(MemoryCacheTest, ClearAllResetsEntriesAndCounters) {
    auto cache = makeCache(10);
    cache->put(key("o", "a"), {{"v", 1}});
    cache->put(key("o", "b"), {{"v", 2}});
    cache->get(key("o", "a"));
    cache->get(key("o", "missing"));

    cache->clearAll();
    auto stats = cache->getStats();
    EXPECT_EQ(stats.size, 0u);
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.total_requests, 0u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.0);
}

TEST_F(MemoryCacheTest, HitRateMatchesLookups) {
    auto cache = makeCache(10);
    cache->put(key("o", "a"), {{"v", 1}});
    for (int i = 0; i < 3; ++i) {
        cache->get(key("o", "a"));
    }
    cache->get(key("o", "missing"));

    auto stats = cache->getStats();
    EXPECT_EQ(stats.hits, 3u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.total_requests, 4u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 75.0);
    EXPECT_EQ(stats.capacity, 10u);
}

TEST_F(MemoryCacheTest, PutRemoveAndScansDoNotCountAsLookups) {
    auto cache = makeCache(10);
    cache->put(key("o", "a"), {{"v", 1}});
    cache->remove(key("o", "a"));
    cache->clearForOwner("o");
    cache->cleanupExpired();
    cache->getAllEntries();

    auto stats = cache->getStats();
    EXPECT_EQ(stats.total_requests, 0u);
}

TEST_F(MemoryCacheTest, GetAllEntriesHasNoSideEffects) {
    auto cache = makeCache(10);
    cache->put(key("o", "a"), {{"v", 1}});
    cache->put(key("o", "b"), {{"v", 2}});
    cache->get(key("o", "a"));
    const auto order_before = cache->keysByRecency();
    const auto stats_before = cache->getStats();

    auto entries = cache->getAllEntries();
    EXPECT_EQ(entries.size(), 2u);

    const auto stats_after = cache->getStats();
    EXPECT_EQ(cache->keysByRecency(), order_before);
    EXPECT_EQ(stats_after.hits, stats_before.hits);
    EXPECT_EQ(stats_after.misses, stats_before.misses);
    EXPECT_EQ(cache->accessCount(key("o", "a")), 1u);
    EXPECT_EQ(cache->accessCount(key("o", "b")), 0u);
}

TEST_F(MemoryCacheTest, GetAllEntriesSkipsExpiredAndFiltersByOwner) {
    auto cache = makeCache(10);
    cache->put(key("x", "live"), {{"v", 1}});
    cache->put(key("x", "stale"), {{"v", 2}}, 1s);
    cache->put(key("xy", "live"), {{"v", 3}});
    clock->advance(2s);

    auto all = cache->getAllEntries();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(all.count(key("x", "stale")), 0u);

    auto only_x = cache->getAllEntries(std::string("x"));
    ASSERT_EQ(only_x.size(), 1u);
    EXPECT_EQ(only_x.begin()->first, key("x", "live"));

    // Expired entries are reported missing but not removed by the snapshot
    EXPECT_EQ(cache->size(), 3u);
}

TEST_F(MemoryCacheTest, ExportEntriesIsFlatJson) {
    auto cache = makeCache(10);
    cache->put(MemoryKey("a1", "pref", "k1"), {{"v", 1}});
    cache->put(MemoryKey("a:2", "pref", "k1"), {{"v", 2}});

    json exported = cache->exportEntries();
    ASSERT_TRUE(exported.is_object());
    EXPECT_EQ(exported.size(), 2u);
    EXPECT_EQ(exported["a1:pref:k1"], json({{"v", 1}}));
    EXPECT_EQ(exported["a%3A2:pref:k1"], json({{"v", 2}}));
}

TEST_F(MemoryCacheTest, KeysByRecencyIsMostRecentFirst) {
    auto cache = makeCache(10);
    cache->put(key("o", "a"), {{"v", 1}});
    cache->put(key("o", "b"), {{"v", 2}});
    cache->put(key("o", "c"), {{"v", 3}});
    cache->get(key("o", "a"));

    std::vector<MemoryKey> expected = {key("o", "a"), key("o", "c"), key("o", "b")};
    EXPECT_EQ(cache->keysByRecency(), expected);
}

TEST_F(MemoryCacheTest, EndToEndScenario) {
    auto cache = makeCache(3);
    cache->put(MemoryKey("a1", "pref", "k1"), {{"v", 1}});
    cache->put(MemoryKey("a1", "pref", "k2"), {{"v", 2}});
    cache->put(MemoryKey("a2", "pref", "k1"), {{"v", 3}});
    cache->put(MemoryKey("a1", "pref", "k3"), {{"v", 4}});

    EXPECT_FALSE(cache->get(MemoryKey("a1", "pref", "k1")).has_value());
    EXPECT_EQ(cache->get(MemoryKey("a1", "pref", "k2")).value_or(json()), json({{"v", 2}}));
    EXPECT_EQ(cache->get(MemoryKey("a2", "pref", "k1")).value_or(json()), json({{"v", 3}}));
    EXPECT_EQ(cache->get(MemoryKey("a1", "pref", "k3")).value_or(json()), json({{"v", 4}}));
}

TEST_F(MemoryCacheTest, RejectsInvalidConstruction) {
    CacheOptions zero_capacity;
    zero_capacity.capacity = 0;
    EXPECT_THROW(MemoryCache cache(zero_capacity, clock), std::invalid_argument);

    CacheOptions bad_ttl;
    bad_ttl.default_ttl = std::chrono::milliseconds(0);
    EXPECT_THROW(MemoryCache cache(bad_ttl, clock), std::invalid_argument);

    EXPECT_THROW(MemoryCache cache(CacheOptions{}, nullptr), std::invalid_argument);
}

TEST_F(MemoryCacheTest, RejectsMalformedPut) {
    auto cache = makeCache(10);
    EXPECT_THROW(cache->put(key("o", "k"), json::array({1, 2})), std::invalid_argument);
    EXPECT_THROW(cache->put(key("o", "k"), json("text")), std::invalid_argument);
    EXPECT_THROW(cache->put(key("o", "k"), {{"v", 1}}, std::chrono::milliseconds(-5)), std::invalid_argument);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(MemoryCacheTest, ConcurrentAccessKeepsInvariants) {
    constexpr std::size_t capacity = 16;
    constexpr int threads = 8;
    constexpr int ops_per_thread = 2000;
    auto cache = makeCache(capacity);
    std::atomic<std::size_t> max_seen_size{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&cache, &max_seen_size, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                MemoryKey k("agent" + std::to_string(t % 3), "pref", "k" + std::to_string(i % 40));
                if (i % 2 == 0) {
                    cache->put(k, {{"t", t}, {"i", i}});
                } else {
                    cache->get(k);
                }
                std::size_t current = cache->size();
                std::size_t seen = max_seen_size.load();
                while (current > seen && !max_seen_size.compare_exchange_weak(seen, current)) {
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    auto stats = cache->getStats();
    EXPECT_LE(max_seen_size.load(), capacity);
    EXPECT_LE(stats.size, capacity);
    EXPECT_EQ(stats.hits + stats.misses, static_cast<std::uint64_t>(threads * ops_per_thread / 2));
}

// --- putIfAbsent ---

TEST_F(MemoryCacheTest, PutIfAbsentInsertsOnlyMissingKeys) {
    auto cache = makeCache(10);
    EXPECT_TRUE(cache->putIfAbsent(key("agent", "k"), {{"v", "first"}}));
    EXPECT_FALSE(cache->putIfAbsent(key("agent", "k"), {{"v", "second"}}));

    EXPECT_EQ(cache->get(key("agent", "k")).value_or(json())["v"], "first");
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(MemoryCacheTest, PutIfAbsentLeavesLiveEntryRecencyAlone) {
    auto cache = makeCache(2);
    cache->put(key("agent", "a"), {{"v", "a"}});
    cache->put(key("agent", "b"), {{"v", "b"}});

    EXPECT_FALSE(cache->putIfAbsent(key("agent", "a"), {{"v", "a2"}}));
    std::vector<MemoryKey> expected = {key("agent", "b"), key("agent", "a")};
    EXPECT_EQ(cache->keysByRecency(), expected);
}

TEST_F(MemoryCacheTest, PutIfAbsentReplacesExpiredEntry) {
    auto cache = makeCache(10);
    cache->put(key("agent", "k"), {{"v", "old"}}, 1s);
    clock->advance(2s);

    EXPECT_TRUE(cache->putIfAbsent(key("agent", "k"), {{"v", "new"}}));
    EXPECT_EQ(cache->getStats().expirations, 1u);
    EXPECT_EQ(cache->get(key("agent", "k")).value_or(json())["v"], "new");
}

TEST_F(MemoryCacheTest, PutIfAbsentEvictsWhenFull) {
    auto cache = makeCache(2);
    cache->put(key("agent", "a"), {{"v", "a"}});
    cache->put(key("agent", "b"), {{"v", "b"}});

    EXPECT_TRUE(cache->putIfAbsent(key("agent", "c"), {{"v", "c"}}));
    EXPECT_EQ(cache->size(), 2u);
    EXPECT_EQ(cache->getStats().evictions, 1u);
    EXPECT_FALSE(cache->accessCount(key("agent", "a")).has_value());
}

TEST_F(MemoryCacheTest, PutIfAbsentRejectsMalformedInput) {
    auto cache = makeCache(10);
    EXPECT_THROW(cache->putIfAbsent(key("agent", "k"), json::array()), std::invalid_argument);
    EXPECT_THROW(cache->putIfAbsent(key("agent", "k"), {{"v", 1}}, 0ms), std::invalid_argument);
    EXPECT_EQ(cache->size(), 0u);
}
