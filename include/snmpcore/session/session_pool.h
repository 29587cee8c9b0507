#ifndef SNMPCORE_SESSION_SESSION_POOL_H
#define SNMPCORE_SESSION_SESSION_POOL_H

#include <snmpcore/config.h>
#include <snmpcore/result.h>
#include <snmpcore/types.h>
#include <snmpcore/error_reporter.h>
#include <snmpcore/periodic_task.h>
#include <snmpcore/transport/device_transport.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace session {

/**
 * Session pool configuration
 */
struct SessionPoolConfig {
    size_t max_sessions = 100;
    std::chrono::milliseconds session_timeout{300000};     // Idle limit
    std::chrono::milliseconds cleanup_interval{60000};
    uint64_t max_requests_per_session = 1000;
    bool enable_metrics = true;

    // Exchange policy handed to every new handle
    std::chrono::milliseconds handle_timeout{5000};
    uint32_t handle_retries = 3;

    SessionPoolConfig() = default;
};

SNMPCORE_API Result<void> validate_config(const SessionPoolConfig& config);

/**
 * Identity of a pooled session. The credentials are only used to open the
 * handle and derive the fingerprint; they are never stored in the pool.
 */
struct SessionKey {
    std::string host;
    uint16_t port = 161;
    SnmpVersion version = SnmpVersion::V2C;
    Credentials credentials;
};

/**
 * Credential-free snapshot of a session
 */
struct SessionInfo {
    std::string id;
    std::string host;
    uint16_t port = 161;
    SnmpVersion version = SnmpVersion::V2C;
    std::string fingerprint;
    Timestamp created_at;
    Timestamp last_used;
    uint64_t request_count = 0;
    uint64_t error_count = 0;
    uint32_t borrowers = 0;      // leases not yet released
    bool active = false;         // borrowers > 0
};

/**
 * What acquire() hands out: the session identity and the handle for the
 * duration of one exchange. Give it back with release(id).
 */
struct SessionLease {
    std::string id;
    SessionInfo info;
    std::shared_ptr<transport::DeviceHandle> handle;
};

struct SessionHealth {
    std::string session_id;
    std::string host;
    bool healthy = false;
    SystemTimestamp last_check;
    std::chrono::microseconds response_time{0};
    uint64_t error_count = 0;
    uint64_t consecutive_errors = 0;
};

struct SessionMetrics {
    size_t total_sessions = 0;
    size_t active_sessions = 0;
    uint64_t total_requests = 0;
    uint64_t total_errors = 0;
    double average_request_time_ms = 0.0;
    double error_rate = 0.0;
    double pool_utilization = 0.0;
};

struct SessionPoolStatus {
    size_t size = 0;
    size_t max_size = 0;
    size_t active_connections = 0;
    SessionMetrics metrics;
    std::vector<SessionInfo> sessions;
};

enum class SessionEvent : uint8_t {
    CREATED,
    REUSED,
    RELEASED,
    DESTROYED,
    ERROR
};

using SessionEventCallback =
    std::function<void(SessionEvent event, const std::string& session_id, const std::string& host)>;

/**
 * Bounded pool of device handles keyed by host, port, version and a
 * credential fingerprint.
 *
 * A pooled session is reused while it has been idle less than
 * session_timeout, has served fewer than max_requests_per_session requests
 * and its handle is open. New sessions are opened through the injected
 * DeviceTransport outside the pool lock. A session is active while any
 * lease on it is unreleased. When the pool is full the least recently used
 * inactive session is closed; if every session is active, acquire fails
 * with SESSION_POOL_EXHAUSTED. A background sweep closes invalid inactive
 * sessions. A session replaced while still lent out is closed when its last
 * borrower releases it.
 */
class SNMPCORE_API SessionPool {
public:
    SessionPool(std::shared_ptr<transport::DeviceTransport> transport,
                const SessionPoolConfig& config = SessionPoolConfig{},
                std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /**
     * Get a valid session for key, reusing a pooled one when possible.
     * Every successful acquire must be paired with one release().
     */
    Result<SessionLease> acquire(const SessionKey& key);

    /**
     * Give back one lease. The session becomes inactive, and so available
     * for eviction, once every lease on it is released.
     */
    void release(const std::string& session_id);

    /**
     * Close the handle and remove the session
     */
    void close(const std::string& session_id);

    void close_all();

    /**
     * Record a completed exchange on a session
     */
    void record_request(const std::string& session_id, std::chrono::microseconds latency);

    /**
     * Record a failed exchange or pool operation
     */
    void record_error(const std::string& kind, const std::string& host,
                      const std::string& session_id = {});

    /**
     * Close every session that is no longer valid
     * @return Number of sessions closed
     */
    size_t cleanup_expired_sessions();

    std::vector<SessionHealth> health_check() const;

    SessionPoolStatus get_status() const;

    Result<void> update_config(const SessionPoolConfig& new_config);

    SessionPoolConfig get_config() const;

    void set_event_callback(SessionEventCallback callback);

    /**
     * Stop the sweep and close every session
     */
    void shutdown();

    size_t size() const;

    /**
     * Pool key for a session identity; contains no credential material
     */
    static Result<std::string> make_pool_key(const SessionKey& key);

private:
    struct PooledSession {
        SessionInfo info;
        std::shared_ptr<transport::DeviceHandle> handle;
        uint64_t consecutive_errors = 0;
    };

    using HandleList = std::vector<std::shared_ptr<transport::DeviceHandle>>;
    using DestroyedList = std::vector<std::pair<std::string, std::string>>;   // id, host

    bool is_valid_locked(const PooledSession& session, Timestamp now) const;
    std::shared_ptr<transport::DeviceHandle> remove_locked(const std::string& pool_key);
    std::string find_key_by_id_locked(const std::string& session_id) const;
    PooledSession* find_session_locked(const std::string& session_id);
    std::optional<SessionLease> try_reuse_locked(const std::string& pool_key, Timestamp now,
                                                 HandleList& to_close, DestroyedList& destroyed);
    Result<void> make_room_locked(HandleList& to_close, DestroyedList& destroyed);
    Result<void> evict_oldest_inactive_locked(HandleList& to_close, DestroyedList& destroyed);
    Result<SessionLease> open_session(const SessionKey& key, const std::string& pool_key,
                                      const transport::HandleOptions& options, bool& reused);
    void finish_removals(const HandleList& to_close, const DestroyedList& destroyed) const;
    std::string generate_session_id();
    void close_handle(const std::shared_ptr<transport::DeviceHandle>& handle) const;
    void emit(SessionEvent event, const std::string& session_id, const std::string& host) const;
    double average_request_time_locked() const;

    std::shared_ptr<transport::DeviceTransport> transport_;
    std::shared_ptr<ErrorReporter> reporter_;
    SessionPoolConfig config_;

    std::unordered_map<std::string, PooledSession> sessions_;   // pool key -> session
    std::unordered_map<std::string, PooledSession> retired_;    // session id -> replaced, still lent out
    size_t pending_opens_ = 0;                                  // slots reserved for handles being opened
    mutable std::mutex mutex_;

    uint64_t total_requests_ = 0;
    uint64_t total_errors_ = 0;
    std::deque<double> request_times_ms_;    // Most recent 1000
    std::atomic<uint64_t> session_counter_{0};

    SessionEventCallback event_callback_;
    mutable std::mutex callback_mutex_;

    PeriodicTask sweeper_;
};

}  // namespace session
}  // namespace v1
}  // namespace snmpcore

#endif // SNMPCORE_SESSION_SESSION_POOL_H
