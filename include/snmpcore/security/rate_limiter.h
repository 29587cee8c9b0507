#pragma once

#include <snmpcore/result.h>
#include <snmpcore/types.h>
#include <snmpcore/error.h>
#include <snmpcore/periodic_task.h>

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace security {

/**
 * Rate limiting configuration
 */
struct RateLimitConfig {
    uint32_t max_requests_per_window = 60;              // Requests allowed per window
    std::chrono::milliseconds window_size{60000};       // Sliding window length
    std::chrono::milliseconds block_duration{300000};   // Cooldown once the ceiling is hit
    bool enable_rate_limiting = true;

    RateLimitConfig() = default;
};

SNMPCORE_API Result<void> validate_config(const RateLimitConfig& config);

/**
 * Decision for one request. A denial is a normal outcome, not an error.
 */
struct RateLimitDecision {
    bool allowed = true;
    std::optional<uint32_t> retry_after_seconds;   // Set on denial
    std::string reason;
};

/**
 * Per-device sliding window with block state
 */
struct RateLimitEntry {
    std::string device;
    std::deque<Timestamp> requests;   // Ascending
    Timestamp window_start;           // Block start while blocked
    bool blocked = false;
};

/**
 * Snapshot of one device's limiter state
 */
struct RateLimitStatus {
    uint32_t current_requests = 0;
    uint32_t max_requests = 0;
    std::chrono::milliseconds window_size{0};
    bool blocked = false;
    std::optional<SystemTimestamp> reset_time;   // When the block ends
};

struct HostRateStats {
    std::string device;
    uint32_t requests = 0;
    bool blocked = false;
    std::optional<SystemTimestamp> last_request;
};

struct RateLimitStatistics {
    size_t total_hosts = 0;
    size_t blocked_hosts = 0;
    size_t total_requests = 0;
    double average_requests_per_host = 0.0;
    std::vector<HostRateStats> host_stats;
};

struct RateLimitExport {
    RateLimitConfig config;
    struct Entry {
        std::string device;
        size_t request_count = 0;
        bool blocked = false;
        SystemTimestamp last_activity;
    };
    std::vector<Entry> entries;
    SystemTimestamp export_time;
};

/**
 * Per-device sliding window rate limiter with cooldown.
 *
 * Device keys are normalized (ASCII lowercase, trimmed). When a device
 * reaches max_requests_per_window within window_size it is blocked for
 * block_duration; every check during the block is denied with the
 * remaining cooldown. A background sweep drops idle, unblocked entries.
 */
class SNMPCORE_API RateLimiter {
public:
    explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig{});
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Check whether a request to device may proceed, recording it if so
     * @param device Device address or name
     * @return Decision with retry_after_seconds on denial
     */
    RateLimitDecision check(const std::string& device);

    RateLimitStatus get_status(const std::string& device) const;

    /**
     * Forget all state for one device
     */
    void reset(const std::string& device);

    void reset_all();

    RateLimitStatistics get_statistics() const;

    RateLimitExport export_data() const;

    /**
     * Enable or disable limiting. Disabling stops the sweep and clears
     * all state; enabling restarts the sweep.
     */
    void set_enabled(bool enabled);

    bool is_enabled() const;

    Result<void> update_config(const RateLimitConfig& new_config);

    RateLimitConfig get_config() const;

    /**
     * Drop idle unblocked entries and timestamps older than one window
     * @return Number of entries removed
     */
    size_t cleanup_expired_entries();

    /**
     * Stop the sweep and clear state
     */
    void shutdown();

    size_t tracked_devices() const;

private:
    static std::string normalize_device(const std::string& device);
    void start_sweep();

    RateLimitConfig config_;
    std::unordered_map<std::string, RateLimitEntry> entries_;
    mutable std::mutex mutex_;
    PeriodicTask sweeper_;
};

/**
 * Rate limiter factory for different use cases
 */
class SNMPCORE_API RateLimiterFactory {
public:
    /**
     * Permissive limits for lab networks and tests
     */
    static std::unique_ptr<RateLimiter> create_development();

    /**
     * Defaults: 60 requests per minute, 5 minute cooldown
     */
    static std::unique_ptr<RateLimiter> create_production();

    /**
     * Gentle polling of fragile devices
     */
    static std::unique_ptr<RateLimiter> create_conservative();

    static std::unique_ptr<RateLimiter> create_custom(const RateLimitConfig& config);
};

}  // namespace security
}  // namespace v1
}  // namespace snmpcore
