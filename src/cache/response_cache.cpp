#include <snmpcore/cache/response_cache.h>

#include <algorithm>

namespace snmpcore {
namespace v1 {
namespace cache {

namespace {

constexpr std::chrono::milliseconds kInterfaceConfigTtl{60 * 60 * 1000};
constexpr std::chrono::milliseconds kCountersTtl{5 * 60 * 1000};
constexpr std::chrono::milliseconds kStatusTtl{30 * 1000};
constexpr std::chrono::milliseconds kEnterpriseTtl{10 * 60 * 1000};

bool starts_with(const std::string& value, const char* prefix) {
    return value.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

size_t estimate_value_size(const VarBindList& value) {
    size_t size = 0;
    for (const auto& vb : value) {
        size += vb.oid.size() + sizeof(VarBind);
        if (auto s = std::get_if<std::string>(&vb.value)) {
            size += s->size();
        } else if (auto b = std::get_if<Bytes>(&vb.value)) {
            size += b->size();
        }
    }
    return size;
}

}  // namespace

Result<void> validate_config(const CacheConfig& config) {
    if (config.max_cache_size == 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "max_cache_size must be greater than zero");
    }
    if (config.static_data_ttl.count() <= 0 || config.dynamic_data_ttl.count() <= 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION, "TTL values must be positive");
    }
    return make_result();
}

ResponseCache::ResponseCache(const CacheConfig& config)
    : config_(config) {
    sweeper_.start(config_.cleanup_interval, [this] { cleanup_expired(); });
}

ResponseCache::~ResponseCache() {
    sweeper_.stop();
}

std::optional<VarBindList> ResponseCache::get(const std::string& device, const std::string& oid) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(make_key(device, oid));
    if (it == entries_.end()) {
        total_misses_++;
        return std::nullopt;
    }

    const auto now = Clock::now();
    if (is_expired(it->second, now)) {
        entries_.erase(it);
        total_misses_++;
        return std::nullopt;
    }

    it->second.hit_count++;
    it->second.last_access = now;
    total_hits_++;
    return it->second.value;
}

void ResponseCache::put(const std::string& device, const std::string& oid, VarBindList value,
                        std::optional<std::chrono::milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto effective_ttl = ttl ? *ttl : ttl_for_locked(oid);
    put_locked(device, oid, std::move(value), effective_ttl, Clock::now());
}

void ResponseCache::put(const std::string& device, const std::string& oid, const VarBind& value,
                        std::optional<std::chrono::milliseconds> ttl) {
    put(device, oid, VarBindList{value}, ttl);
}

bool ResponseCache::invalidate(const std::string& device, const std::string& oid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(make_key(device, oid)) > 0;
}

size_t ResponseCache::invalidate_device(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string host = to_lower_ascii(device);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (to_lower_ascii(it->second.host) == host) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    total_hits_ = 0;
    total_misses_ = 0;
}

size_t ResponseCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanup_expired_locked(Clock::now());
}

CacheStatistics ResponseCache::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStatistics stats;
    stats.total_entries = entries_.size();
    stats.total_hits = total_hits_;
    stats.total_misses = total_misses_;

    const uint64_t total_requests = total_hits_ + total_misses_;
    if (total_requests > 0) {
        stats.hit_rate = static_cast<double>(total_hits_) / static_cast<double>(total_requests);
        stats.miss_rate = static_cast<double>(total_misses_) / static_cast<double>(total_requests);
    }

    std::optional<Timestamp> oldest;
    std::optional<Timestamp> newest;
    for (const auto& [key, entry] : entries_) {
        stats.memory_usage += estimate_entry_size(entry);
        if (!oldest || entry.created < *oldest) {
            oldest = entry.created;
        }
        if (!newest || entry.created > *newest) {
            newest = entry.created;
        }
    }
    if (oldest) {
        stats.oldest_entry = to_system_timestamp(*oldest);
        stats.newest_entry = to_system_timestamp(*newest);
    }
    return stats;
}

std::vector<DeviceCacheEntry> ResponseCache::get_device_entries(const std::string& device) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string host = to_lower_ascii(device);
    const auto now = Clock::now();
    std::vector<DeviceCacheEntry> result;

    for (const auto& [key, entry] : entries_) {
        if (to_lower_ascii(entry.host) != host) {
            continue;
        }
        DeviceCacheEntry row;
        row.oid = entry.oid;
        row.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.created);
        row.hit_count = entry.hit_count;
        row.ttl = entry.ttl;
        row.expired = is_expired(entry, now);
        result.push_back(std::move(row));
    }

    std::sort(result.begin(), result.end(),
              [](const DeviceCacheEntry& a, const DeviceCacheEntry& b) { return a.oid < b.oid; });
    return result;
}

CacheSnapshot ResponseCache::export_snapshot() const {
    CacheSnapshot snapshot;
    snapshot.statistics = get_statistics();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.entries.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        CacheSnapshot::Entry row;
        row.host = entry.host;
        row.oid = entry.oid;
        row.value = entry.value;
        row.created = to_system_timestamp(entry.created);
        row.ttl = entry.ttl;
        snapshot.entries.push_back(std::move(row));
    }
    snapshot.export_time = std::chrono::system_clock::now();
    return snapshot;
}

size_t ResponseCache::import_snapshot(const CacheSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = std::chrono::system_clock::now();
    size_t imported = 0;
    for (const auto& row : snapshot.entries) {
        if (now - row.created >= row.ttl) {
            continue;
        }
        put_locked(row.host, row.oid, row.value, row.ttl, to_steady_timestamp(row.created));
        imported++;
    }
    return imported;
}

size_t ResponseCache::preload(const std::string& device, const std::vector<std::string>& oids,
                              const std::function<Result<VarBindList>(const std::string&)>& provider) {
    size_t loaded = 0;
    for (const auto& oid : oids) {
        auto value = provider(oid);
        if (!value) {
            continue;
        }
        put(device, oid, std::move(value).value());
        loaded++;
    }
    return loaded;
}

std::chrono::milliseconds ResponseCache::determine_ttl(const std::string& oid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ttl_for_locked(oid);
}

TtlCategory ResponseCache::classify_oid(const std::string& oid) {
    static const char* const static_system[] = {
        "1.3.6.1.2.1.1.1.0",   // sysDescr
        "1.3.6.1.2.1.1.2.0",   // sysObjectID
        "1.3.6.1.2.1.1.4.0",   // sysContact
        "1.3.6.1.2.1.1.5.0",   // sysName
        "1.3.6.1.2.1.1.6.0"    // sysLocation
    };
    static const char* const interface_config[] = {
        "1.3.6.1.2.1.2.2.1.2.",   // ifDescr
        "1.3.6.1.2.1.2.2.1.3.",   // ifType
        "1.3.6.1.2.1.2.2.1.4.",   // ifMtu
        "1.3.6.1.2.1.2.2.1.5.",   // ifSpeed
        "1.3.6.1.2.1.2.2.1.6."    // ifPhysAddress
    };
    static const char* const counters[] = {
        "1.3.6.1.2.1.2.2.1.10.",  // ifInOctets
        "1.3.6.1.2.1.2.2.1.11.",  // ifInUcastPkts
        "1.3.6.1.2.1.2.2.1.16.",  // ifOutOctets
        "1.3.6.1.2.1.2.2.1.17."   // ifOutUcastPkts
    };
    static const char* const status[] = {
        "1.3.6.1.2.1.2.2.1.7.",   // ifAdminStatus
        "1.3.6.1.2.1.2.2.1.8."    // ifOperStatus
    };

    for (const char* exact : static_system) {
        if (oid == exact) return TtlCategory::STATIC_SYSTEM;
    }
    for (const char* prefix : interface_config) {
        if (starts_with(oid, prefix)) return TtlCategory::INTERFACE_CONFIG;
    }
    for (const char* prefix : counters) {
        if (starts_with(oid, prefix)) return TtlCategory::COUNTERS;
    }
    if (oid == "1.3.6.1.2.1.1.3.0") {   // sysUpTime
        return TtlCategory::STATUS;
    }
    for (const char* prefix : status) {
        if (starts_with(oid, prefix)) return TtlCategory::STATUS;
    }
    if (starts_with(oid, "1.3.6.1.4.1.")) {
        return TtlCategory::ENTERPRISE;
    }
    return TtlCategory::DYNAMIC;
}

Result<void> ResponseCache::update_config(const CacheConfig& new_config) {
    auto valid = validate_config(new_config);
    if (!valid) {
        return valid;
    }

    bool interval_changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_changed = new_config.cleanup_interval != config_.cleanup_interval;
        config_ = new_config;
        if (entries_.size() > config_.max_cache_size) {
            evict_locked(Clock::now());
        }
    }

    if (interval_changed) {
        sweeper_.start(new_config.cleanup_interval, [this] { cleanup_expired(); });
    }
    return make_result();
}

CacheConfig ResponseCache::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResponseCache::shutdown() {
    sweeper_.stop();
    clear();
}

// Private helpers

std::string ResponseCache::make_key(const std::string& device, const std::string& oid) {
    return to_lower_ascii(device) + ":" + oid;
}

bool ResponseCache::is_expired(const CacheEntry& entry, Timestamp now) {
    return now - entry.created >= entry.ttl;
}

size_t ResponseCache::estimate_entry_size(const CacheEntry& entry) {
    return 200 + entry.host.size() + entry.oid.size() + estimate_value_size(entry.value);
}

std::chrono::milliseconds ResponseCache::ttl_for_locked(const std::string& oid) const {
    switch (classify_oid(oid)) {
        case TtlCategory::STATIC_SYSTEM: return config_.static_data_ttl;
        case TtlCategory::INTERFACE_CONFIG: return kInterfaceConfigTtl;
        case TtlCategory::COUNTERS: return kCountersTtl;
        case TtlCategory::STATUS: return kStatusTtl;
        case TtlCategory::ENTERPRISE: return kEnterpriseTtl;
        case TtlCategory::DYNAMIC: break;
    }
    return config_.dynamic_data_ttl;
}

size_t ResponseCache::cleanup_expired_locked(Timestamp now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResponseCache::evict_locked(Timestamp now) {
    cleanup_expired_locked(now);
    if (entries_.size() < config_.max_cache_size) {
        return;
    }

    std::vector<std::unordered_map<std::string, CacheEntry>::iterator> candidates;
    candidates.reserve(entries_.size());
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        candidates.push_back(it);
    }
    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a->second.last_access != b->second.last_access) {
            return a->second.last_access < b->second.last_access;
        }
        return a->second.hit_count < b->second.hit_count;
    });

    // Evict a fifth of the cache, and enough to get below the ceiling
    size_t to_remove = std::max(entries_.size() / 5,
                                entries_.size() - config_.max_cache_size + 1);
    to_remove = std::min(to_remove, candidates.size());
    for (size_t i = 0; i < to_remove; ++i) {
        entries_.erase(candidates[i]);
    }
}

void ResponseCache::put_locked(const std::string& device, const std::string& oid, VarBindList value,
                               std::chrono::milliseconds ttl, Timestamp created) {
    const std::string key = make_key(device, oid);
    const auto now = Clock::now();

    auto existing = entries_.find(key);
    if (existing == entries_.end() && entries_.size() >= config_.max_cache_size) {
        evict_locked(now);
    }

    CacheEntry entry;
    entry.value = std::move(value);
    entry.created = created;
    entry.ttl = ttl;
    entry.host = device;
    entry.oid = oid;
    entry.last_access = now;

    entries_[key] = std::move(entry);
}

}  // namespace cache
}  // namespace v1
}  // namespace snmpcore
