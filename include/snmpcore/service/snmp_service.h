#ifndef SNMPCORE_SERVICE_SNMP_SERVICE_H
#define SNMPCORE_SERVICE_SNMP_SERVICE_H

#include <snmpcore/config.h>
#include <snmpcore/result.h>
#include <snmpcore/types.h>
#include <snmpcore/error_reporter.h>
#include <snmpcore/cache/response_cache.h>
#include <snmpcore/security/input_validator.h>
#include <snmpcore/security/rate_limiter.h>
#include <snmpcore/session/session_pool.h>
#include <snmpcore/transport/device_transport.h>
#include <snmpcore/trap/listener_registry.h>
#include <snmpcore/trap/trap_listener.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace service {

struct ServiceConfig {
    security::RateLimitConfig rate_limit;
    cache::CacheConfig cache;
    session::SessionPoolConfig sessions;
    security::HostPolicy host_policy;
    bool enable_cache = true;
    uint32_t max_walk_items = 1000;
};

SNMPCORE_API Result<void> validate_config(const ServiceConfig& config);

/**
 * One device as addressed by a query
 */
struct DeviceTarget {
    std::string host;
    uint16_t port = 161;
    SnmpVersion version = SnmpVersion::V2C;
    Credentials credentials = Credentials::from_community("public");
};

enum class QueryOperation : uint8_t {
    GET,
    BULK_GET,
    WALK
};

std::string to_string(QueryOperation operation);

struct QueryResponse {
    std::string host;
    QueryOperation operation = QueryOperation::GET;
    SystemTimestamp timestamp;
    std::string session_id;      // empty when served from cache
    VarBindList varbinds;
    bool cached = false;
};

/**
 * Entry point for device queries and trap listeners.
 *
 * Owns the rate limiter, response cache, session pool and the listener
 * registry. Components exist between init() and teardown(); calls outside
 * that window fail with NOT_INITIALIZED.
 *
 * A query runs validate, rate limit, cache lookup, session acquire,
 * exchange, metrics, cache store and session release, in that order.
 */
class SNMPCORE_API SnmpService {
public:
    SnmpService(std::shared_ptr<transport::DeviceTransport> transport,
                const ServiceConfig& config = ServiceConfig{},
                std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~SnmpService();

    SnmpService(const SnmpService&) = delete;
    SnmpService& operator=(const SnmpService&) = delete;

    Result<void> init();

    /**
     * Stop every trap listener, close every session and stop the sweeps
     */
    void teardown();

    bool is_initialized() const;

    Result<QueryResponse> get(const DeviceTarget& target, const std::vector<std::string>& oids,
                              bool use_cache = true);

    Result<QueryResponse> bulk_get(const DeviceTarget& target, const std::vector<std::string>& oids,
                                   uint32_t non_repeaters = 0, uint32_t max_repetitions = 10,
                                   bool use_cache = true);

    /**
     * Walk the subtree under root_oid, at most max_items bindings
     * (0 uses ServiceConfig::max_walk_items)
     */
    Result<QueryResponse> walk(const DeviceTarget& target, const std::string& root_oid,
                               uint32_t max_items = 0, bool use_cache = true);

    /**
     * Start a trap listener registered with this service's registry
     * @param parser Defaults to RawTrapParser
     */
    Result<std::shared_ptr<trap::TrapListener>> start_trap_listener(
        const trap::TrapListenerOptions& options,
        trap::TrapSink sink = nullptr,
        std::shared_ptr<trap::TrapParser> parser = nullptr);

    /**
     * Stop the listener bound to port
     * @return false if no listener of this service holds the port
     */
    bool stop_trap_listener(uint16_t port);

    std::vector<trap::TrapListenerInfo> trap_listeners() const;

    // Component access; null outside init()/teardown()
    std::shared_ptr<security::RateLimiter> rate_limiter() const;
    std::shared_ptr<cache::ResponseCache> response_cache() const;
    std::shared_ptr<session::SessionPool> session_pool() const;
    trap::ListenerRegistry& listener_registry() { return registry_; }

private:
    struct Components {
        std::shared_ptr<security::RateLimiter> rate_limiter;
        std::shared_ptr<cache::ResponseCache> cache;
        std::shared_ptr<session::SessionPool> sessions;
    };

    Result<Components> components() const;
    Result<void> validate_target(const DeviceTarget& target) const;
    Result<void> admit(security::RateLimiter& limiter, const std::string& host) const;

    template<typename Exchange>
    Result<VarBindList> run_exchange(session::SessionPool& pool, const DeviceTarget& target,
                                     const char* operation, std::string& session_id,
                                     Exchange&& exchange);

    std::shared_ptr<transport::DeviceTransport> transport_;
    std::shared_ptr<ErrorReporter> reporter_;
    ServiceConfig config_;

    std::shared_ptr<security::RateLimiter> rate_limiter_;
    std::shared_ptr<cache::ResponseCache> cache_;
    std::shared_ptr<session::SessionPool> sessions_;
    trap::ListenerRegistry registry_;

    std::map<uint16_t, std::shared_ptr<trap::TrapListener>> listeners_;
    mutable std::mutex mutex_;
    bool initialized_ = false;
};

}  // namespace service
}  // namespace v1
}  // namespace snmpcore

#endif // SNMPCORE_SERVICE_SNMP_SERVICE_H
