#ifndef SNMPCORE_CACHE_RESPONSE_CACHE_H
#define SNMPCORE_CACHE_RESPONSE_CACHE_H

#include <snmpcore/config.h>
#include <snmpcore/result.h>
#include <snmpcore/types.h>
#include <snmpcore/periodic_task.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace cache {

/**
 * Cache configuration
 */
struct CacheConfig {
    std::chrono::milliseconds static_data_ttl{24 * 60 * 60 * 1000};   // System identity OIDs
    std::chrono::milliseconds dynamic_data_ttl{5 * 60 * 1000};         // OIDs with no pattern
    size_t max_cache_size = 10000;
    bool enable_compression = false;   // Accepted; values are stored as-is
    std::chrono::milliseconds cleanup_interval{5 * 60 * 1000};

    CacheConfig() = default;
};

SNMPCORE_API Result<void> validate_config(const CacheConfig& config);

/**
 * TTL classes derived from the OID
 */
enum class TtlCategory : uint8_t {
    STATIC_SYSTEM,
    INTERFACE_CONFIG,
    COUNTERS,
    STATUS,
    ENTERPRISE,
    DYNAMIC
};

/**
 * One memoized response
 */
struct CacheEntry {
    VarBindList value;
    Timestamp created;
    std::chrono::milliseconds ttl{0};
    std::string host;
    std::string oid;
    uint64_t hit_count = 0;
    Timestamp last_access;
};

struct CacheStatistics {
    size_t total_entries = 0;
    double hit_rate = 0.0;
    double miss_rate = 0.0;
    uint64_t total_hits = 0;
    uint64_t total_misses = 0;
    size_t memory_usage = 0;                    // Rough estimate in bytes
    std::optional<SystemTimestamp> oldest_entry;
    std::optional<SystemTimestamp> newest_entry;
};

struct DeviceCacheEntry {
    std::string oid;
    std::chrono::milliseconds age{0};
    uint64_t hit_count = 0;
    std::chrono::milliseconds ttl{0};
    bool expired = false;
};

/**
 * Portable form of the cache contents. Creation times are wall clock so a
 * snapshot can be imported by another process.
 */
struct CacheSnapshot {
    struct Entry {
        std::string host;
        std::string oid;
        VarBindList value;
        SystemTimestamp created;
        std::chrono::milliseconds ttl{0};
    };
    std::vector<Entry> entries;
    CacheStatistics statistics;
    SystemTimestamp export_time;
};

/**
 * TTL cache of device responses keyed by (device, OID).
 *
 * Entries are readable only while their age is below their TTL. When no
 * TTL is given on put, one is chosen from the OID (system identity 24h,
 * interface configuration 1h, counters 5min, status 30s, enterprise
 * 10min, otherwise dynamic_data_ttl). At capacity, expired entries are
 * swept first, then the least recently accessed fifth of the cache is
 * evicted. Values are copied in and out.
 */
class SNMPCORE_API ResponseCache {
public:
    explicit ResponseCache(const CacheConfig& config = CacheConfig{});
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /**
     * Look up a fresh value. Expired entries count as misses and are removed.
     */
    std::optional<VarBindList> get(const std::string& device, const std::string& oid);

    void put(const std::string& device, const std::string& oid, VarBindList value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    void put(const std::string& device, const std::string& oid, const VarBind& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    bool invalidate(const std::string& device, const std::string& oid);

    /**
     * Remove every entry of one device
     * @return Number of entries removed
     */
    size_t invalidate_device(const std::string& device);

    /**
     * Remove everything and reset hit/miss counters
     */
    void clear();

    /**
     * Remove expired entries
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    CacheStatistics get_statistics() const;

    /**
     * Entries of one device sorted by OID
     */
    std::vector<DeviceCacheEntry> get_device_entries(const std::string& device) const;

    CacheSnapshot export_snapshot() const;

    /**
     * Import entries whose TTL has not elapsed since their recorded creation
     * @return Number of entries imported
     */
    size_t import_snapshot(const CacheSnapshot& snapshot);

    /**
     * Fill the cache for one device from a value provider. Provider errors
     * skip that OID.
     * @return Number of OIDs cached
     */
    size_t preload(const std::string& device, const std::vector<std::string>& oids,
                   const std::function<Result<VarBindList>(const std::string&)>& provider);

    std::chrono::milliseconds determine_ttl(const std::string& oid) const;

    static TtlCategory classify_oid(const std::string& oid);

    Result<void> update_config(const CacheConfig& new_config);

    CacheConfig get_config() const;

    size_t size() const;

    /**
     * Stop the sweep and clear the cache
     */
    void shutdown();

private:
    static std::string make_key(const std::string& device, const std::string& oid);
    static bool is_expired(const CacheEntry& entry, Timestamp now);
    static size_t estimate_entry_size(const CacheEntry& entry);
    std::chrono::milliseconds ttl_for_locked(const std::string& oid) const;
    size_t cleanup_expired_locked(Timestamp now);
    void evict_locked(Timestamp now);
    void put_locked(const std::string& device, const std::string& oid, VarBindList value,
                    std::chrono::milliseconds ttl, Timestamp created);

    CacheConfig config_;
    std::unordered_map<std::string, CacheEntry> entries_;
    uint64_t total_hits_ = 0;
    uint64_t total_misses_ = 0;
    mutable std::mutex mutex_;
    PeriodicTask sweeper_;
};

}  // namespace cache
}  // namespace v1
}  // namespace snmpcore

#endif // SNMPCORE_CACHE_RESPONSE_CACHE_H
