#include <gtest/gtest.h>
#include <snmpcore/cache/response_cache.h>

#include <chrono>
#include <thread>

using namespace snmpcore::v1;
using namespace snmpcore::v1::cache;
using namespace std::chrono_literals;

class ResponseCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_cache_size = 10;
        config_.cleanup_interval = std::chrono::hours(1);
    }

    static VarBind sys_name(const std::string& name) {
        return VarBind("1.3.6.1.2.1.1.5.0", ObjectType::OCTET_STRING, name);
    }

    CacheConfig config_;
};

TEST_F(ResponseCacheTest, PutAndGet) {
    ResponseCache cache(config_);
    EXPECT_FALSE(cache.get("10.0.0.1", "1.3.6.1.2.1.1.5.0").has_value());

    cache.put("10.0.0.1", "1.3.6.1.2.1.1.5.0", sys_name("core-sw-01"));
    auto hit = cache.get("10.0.0.1", "1.3.6.1.2.1.1.5.0");
    ASSERT_TRUE(hit.has_value());
    ASSERT_EQ(hit->size(), 1u);
    EXPECT_EQ(std::get<std::string>((*hit)[0].value), "core-sw-01");

    // Device part of the key is case-insensitive, the OID is not rewritten
    EXPECT_TRUE(cache.get("ROUTER", "1.3.6.1.2.1.1.5.0") == std::nullopt);
    cache.put("Router", "1.3.6.1.2.1.1.5.0", sys_name("edge"));
    EXPECT_TRUE(cache.get("router", "1.3.6.1.2.1.1.5.0").has_value());

    auto stats = cache.get_statistics();
    EXPECT_EQ(stats.total_entries, 2u);
    EXPECT_EQ(stats.total_hits, 2u);
    EXPECT_EQ(stats.total_misses, 2u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.5);
    EXPECT_GT(stats.memory_usage, 0u);
    EXPECT_TRUE(stats.oldest_entry.has_value());
}

// Values are copied, later changes by the caller do not leak in
TEST_F(ResponseCacheTest, ValuesAreCopied) {
    ResponseCache cache(config_);
    VarBindList value{sys_name("first")};
    cache.put("r1", "1.3.6.1.2.1.1.5.0", value);
    value[0].value = std::string("changed");

    auto hit = cache.get("r1", "1.3.6.1.2.1.1.5.0");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(std::get<std::string>((*hit)[0].value), "first");
}

TEST_F(ResponseCacheTest, EntriesExpire) {
    ResponseCache cache(config_);
    cache.put("r1", "1.3.6.1.2.1.1.3.0", VarBind("1.3.6.1.2.1.1.3.0", ObjectType::TIME_TICKS,
                                                  uint64_t{42}), 50ms);
    EXPECT_TRUE(cache.get("r1", "1.3.6.1.2.1.1.3.0").has_value());

    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(cache.get("r1", "1.3.6.1.2.1.1.3.0").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

// A rewrite starts the TTL over
TEST_F(ResponseCacheTest, RewriteResetsTtl) {
    ResponseCache cache(config_);
    cache.put("r2", "1.3.6.1.2.1.1.5.0", sys_name("first"), 200ms);

    std::this_thread::sleep_for(150ms);
    ASSERT_TRUE(cache.get("r2", "1.3.6.1.2.1.1.5.0").has_value());
    cache.put("r2", "1.3.6.1.2.1.1.5.0", sys_name("second"), 200ms);

    std::this_thread::sleep_for(100ms);
    auto hit = cache.get("r2", "1.3.6.1.2.1.1.5.0");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(std::get<std::string>((*hit)[0].value), "second");

    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(cache.get("r2", "1.3.6.1.2.1.1.5.0").has_value());
}

TEST_F(ResponseCacheTest, CleanupRemovesOnlyExpired) {
    ResponseCache cache(config_);
    cache.put("r1", "1.3.6.1.2.1.2.2.1.10.1", sys_name("a"), 30ms);
    cache.put("r1", "1.3.6.1.2.1.2.2.1.10.2", sys_name("b"), 30ms);
    cache.put("r1", "1.3.6.1.2.1.1.5.0", sys_name("c"));

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(cache.cleanup_expired(), 2u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResponseCacheTest, TtlClassification) {
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.1.1.0"), TtlCategory::STATIC_SYSTEM);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.1.6.0"), TtlCategory::STATIC_SYSTEM);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.1.3.0"), TtlCategory::STATUS);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.2.2.1.2.3"), TtlCategory::INTERFACE_CONFIG);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.2.2.1.10.3"), TtlCategory::COUNTERS);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.2.2.1.17.1"), TtlCategory::COUNTERS);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.2.2.1.8.1"), TtlCategory::STATUS);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.4.1.9.9.13.1"), TtlCategory::ENTERPRISE);
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.4.20.1.1"), TtlCategory::DYNAMIC);
    // Exact match only for the system group
    EXPECT_EQ(ResponseCache::classify_oid("1.3.6.1.2.1.1.1.0.5"), TtlCategory::DYNAMIC);

    ResponseCache cache(config_);
    EXPECT_EQ(cache.determine_ttl("1.3.6.1.2.1.1.5.0"), config_.static_data_ttl);
    EXPECT_EQ(cache.determine_ttl("1.3.6.1.2.1.2.2.1.5.1"), std::chrono::hours(1));
    EXPECT_EQ(cache.determine_ttl("1.3.6.1.2.1.2.2.1.16.1"), std::chrono::minutes(5));
    EXPECT_EQ(cache.determine_ttl("1.3.6.1.2.1.2.2.1.7.1"), std::chrono::seconds(30));
    EXPECT_EQ(cache.determine_ttl("1.3.6.1.4.1.2021.10.1.3.1"), std::chrono::minutes(10));
    EXPECT_EQ(cache.determine_ttl("1.3.6.1.2.1.25.1.1.0"), config_.dynamic_data_ttl);
}

// At capacity the least recently used fifth is evicted
TEST_F(ResponseCacheTest, EvictsLeastRecentlyUsed) {
    ResponseCache cache(config_);
    for (int i = 1; i <= 10; ++i) {
        cache.put("r1", "1.3.6.1.2.1.2.2.1.10." + std::to_string(i), sys_name("x"));
        std::this_thread::sleep_for(1ms);
    }
    // Touch the two oldest so they survive
    ASSERT_TRUE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.1").has_value());
    ASSERT_TRUE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.2").has_value());

    cache.put("r1", "1.3.6.1.2.1.2.2.1.10.11", sys_name("new"));

    EXPECT_EQ(cache.size(), 9u);
    EXPECT_TRUE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.1").has_value());
    EXPECT_TRUE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.2").has_value());
    EXPECT_FALSE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.3").has_value());
    EXPECT_FALSE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.4").has_value());
    EXPECT_TRUE(cache.get("r1", "1.3.6.1.2.1.2.2.1.10.11").has_value());
}

TEST_F(ResponseCacheTest, Invalidation) {
    ResponseCache cache(config_);
    cache.put("r1", "1.3.6.1.2.1.1.5.0", sys_name("a"));
    cache.put("r1", "1.3.6.1.2.1.1.1.0", sys_name("b"));
    cache.put("r2", "1.3.6.1.2.1.1.5.0", sys_name("c"));

    EXPECT_TRUE(cache.invalidate("r1", "1.3.6.1.2.1.1.5.0"));
    EXPECT_FALSE(cache.invalidate("r1", "1.3.6.1.2.1.1.5.0"));
    EXPECT_EQ(cache.invalidate_device("R1"), 1u);
    EXPECT_EQ(cache.size(), 1u);

    cache.get("r2", "1.3.6.1.2.1.1.5.0");
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.get_statistics().total_hits, 0u);
}

TEST_F(ResponseCacheTest, DeviceEntriesSortedByOid) {
    ResponseCache cache(config_);
    cache.put("r1", "1.3.6.1.2.1.1.5.0", sys_name("a"));
    cache.put("r1", "1.3.6.1.2.1.1.1.0", sys_name("b"));
    cache.put("r2", "1.3.6.1.2.1.1.1.0", sys_name("c"));
    cache.get("r1", "1.3.6.1.2.1.1.5.0");

    auto rows = cache.get_device_entries("r1");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].oid, "1.3.6.1.2.1.1.1.0");
    EXPECT_EQ(rows[1].oid, "1.3.6.1.2.1.1.5.0");
    EXPECT_EQ(rows[1].hit_count, 1u);
    EXPECT_FALSE(rows[0].expired);
}

TEST_F(ResponseCacheTest, SnapshotImportSkipsStaleEntries) {
    ResponseCache source(config_);
    source.put("r1", "1.3.6.1.2.1.1.5.0", sys_name("a"));
    source.put("r1", "1.3.6.1.2.1.1.1.0", sys_name("b"));

    auto snapshot = source.export_snapshot();
    ASSERT_EQ(snapshot.entries.size(), 2u);
    EXPECT_EQ(snapshot.statistics.total_entries, 2u);

    CacheSnapshot::Entry stale;
    stale.host = "r9";
    stale.oid = "1.3.6.1.2.1.1.5.0";
    stale.value = {sys_name("old")};
    stale.ttl = 1000ms;
    stale.created = std::chrono::system_clock::now() - std::chrono::seconds(5);
    snapshot.entries.push_back(stale);

    ResponseCache target(config_);
    EXPECT_EQ(target.import_snapshot(snapshot), 2u);
    EXPECT_TRUE(target.get("r1", "1.3.6.1.2.1.1.1.0").has_value());
    EXPECT_FALSE(target.get("r9", "1.3.6.1.2.1.1.5.0").has_value());
}

TEST_F(ResponseCacheTest, PreloadSkipsProviderErrors) {
    ResponseCache cache(config_);
    auto loaded = cache.preload("r1", {"1.3.6.1.2.1.1.5.0", "1.3.6.1.2.1.1.99.0"},
        [](const std::string& oid) -> Result<VarBindList> {
            if (oid == "1.3.6.1.2.1.1.99.0") {
                return make_error<VarBindList>(SNMPError::NO_SUCH_OBJECT);
            }
            return make_result(VarBindList{VarBind(oid, ObjectType::OCTET_STRING,
                                                   std::string("sw"))});
        });
    EXPECT_EQ(loaded, 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResponseCacheTest, ConfigUpdates) {
    CacheConfig bad = config_;
    bad.max_cache_size = 0;
    EXPECT_EQ(validate_config(bad).error(), SNMPError::INVALID_CONFIGURATION);
    bad = config_;
    bad.dynamic_data_ttl = 0ms;
    EXPECT_EQ(validate_config(bad).error(), SNMPError::INVALID_CONFIGURATION);

    ResponseCache cache(config_);
    for (int i = 1; i <= 10; ++i) {
        cache.put("r1", "1.3.6.1.2.1.2.2.1.10." + std::to_string(i), sys_name("x"));
    }
    EXPECT_FALSE(cache.update_config(bad).is_success());

    CacheConfig smaller = config_;
    smaller.max_cache_size = 5;
    ASSERT_TRUE(cache.update_config(smaller).is_success());
    EXPECT_LT(cache.size(), 5u);
    EXPECT_EQ(cache.get_config().max_cache_size, 5u);

    cache.shutdown();
    EXPECT_EQ(cache.size(), 0u);
}
