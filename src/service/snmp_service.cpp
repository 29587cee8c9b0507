#include <snmpcore/service/snmp_service.h>
#include <snmpcore/security/credential_utils.h>

#include <sstream>

namespace snmpcore {
namespace v1 {
namespace service {

namespace {

std::string bulk_cache_key(const std::vector<std::string>& oids, uint32_t non_repeaters,
                           uint32_t max_repetitions) {
    std::ostringstream oss;
    oss << "getbulk:" << non_repeaters << ":" << max_repetitions;
    for (const auto& oid : oids) {
        oss << ":" << oid;
    }
    return oss.str();
}

std::string walk_cache_key(const std::string& root, uint32_t max_items) {
    return "walk:" + std::to_string(max_items) + ":" + root;
}

bool cacheable(const VarBindList& varbinds) {
    for (const auto& vb : varbinds) {
        if (vb.error) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string to_string(QueryOperation operation) {
    switch (operation) {
        case QueryOperation::GET: return "get";
        case QueryOperation::BULK_GET: return "getBulk";
        case QueryOperation::WALK: return "walk";
    }
    return "unknown";
}

Result<void> validate_config(const ServiceConfig& config) {
    SNMPCORE_RETURN_IF_ERROR(security::validate_config(config.rate_limit));
    SNMPCORE_RETURN_IF_ERROR(cache::validate_config(config.cache));
    SNMPCORE_RETURN_IF_ERROR(session::validate_config(config.sessions));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_max_varbinds(config.max_walk_items));
    return make_result();
}

SnmpService::SnmpService(std::shared_ptr<transport::DeviceTransport> transport,
                         const ServiceConfig& config,
                         std::shared_ptr<ErrorReporter> reporter)
    : transport_(std::move(transport))
    , reporter_(std::move(reporter))
    , config_(config) {
}

SnmpService::~SnmpService() {
    teardown();
}

Result<void> SnmpService::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return make_error<void>(SNMPError::ALREADY_INITIALIZED, "SNMP service is already initialized");
    }
    if (!transport_) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION, "SNMP service needs a device transport");
    }
    SNMPCORE_RETURN_IF_ERROR(validate_config(config_));
    SNMPCORE_RETURN_IF_ERROR(registry_.init());

    rate_limiter_ = std::make_shared<security::RateLimiter>(config_.rate_limit);
    cache_ = std::make_shared<cache::ResponseCache>(config_.cache);
    sessions_ = std::make_shared<session::SessionPool>(transport_, config_.sessions, reporter_);
    initialized_ = true;

    SNMPCORE_REPORT_INFO(reporter_, "SNMP service initialized");
    return make_result();
}

void SnmpService::teardown() {
    std::map<uint16_t, std::shared_ptr<trap::TrapListener>> listeners;
    Components parts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return;
        }
        listeners.swap(listeners_);
        parts.rate_limiter = std::move(rate_limiter_);
        parts.cache = std::move(cache_);
        parts.sessions = std::move(sessions_);
        initialized_ = false;
    }

    for (auto& entry : listeners) {
        entry.second->stop();
    }
    parts.sessions->shutdown();
    parts.cache->shutdown();
    parts.rate_limiter->shutdown();
    registry_.teardown();

    SNMPCORE_REPORT_INFO(reporter_, "SNMP service stopped");
}

bool SnmpService::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::shared_ptr<security::RateLimiter> SnmpService::rate_limiter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rate_limiter_;
}

std::shared_ptr<cache::ResponseCache> SnmpService::response_cache() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_;
}

std::shared_ptr<session::SessionPool> SnmpService::session_pool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_;
}

template<typename Exchange>
Result<VarBindList> SnmpService::run_exchange(session::SessionPool& pool,
                                              const DeviceTarget& target,
                                              const char* operation,
                                              std::string& session_id,
                                              Exchange&& exchange) {
    session::SessionKey key;
    key.host = target.host;
    key.port = target.port;
    key.version = target.version;
    key.credentials = target.credentials;

    auto lease = pool.acquire(key);
    if (!lease) {
        return forward_error<VarBindList>(lease);
    }
    session_id = lease->id;

    const auto started = Clock::now();
    Result<VarBindList> result = exchange(*lease->handle);
    const auto latency =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started);

    if (result) {
        pool.record_request(lease->id, latency);
    } else {
        pool.record_error("request_error", target.host, lease->id);
    }
    pool.release(lease->id);

    if (!result) {
        return make_error<VarBindList>(
            result.error(),
            std::string("SNMP ") + operation + " failed for " + target.host + ": " +
                security::CredentialUtils::safe_error_message(result.error_message()));
    }
    return result;
}

Result<QueryResponse> SnmpService::get(const DeviceTarget& target,
                                       const std::vector<std::string>& oids,
                                       bool use_cache) {
    auto parts = components();
    if (!parts) {
        return forward_error<QueryResponse>(parts);
    }
    SNMPCORE_RETURN_IF_ERROR(validate_target(target));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_oids(oids));
    SNMPCORE_RETURN_IF_ERROR(admit(*parts->rate_limiter, target.host));

    QueryResponse response;
    response.host = target.host;
    response.operation = QueryOperation::GET;

    const bool caching = use_cache && config_.enable_cache;
    std::vector<VarBindList> slots(oids.size());
    std::vector<size_t> missing;
    for (size_t i = 0; i < oids.size(); ++i) {
        auto hit = caching ? parts->cache->get(target.host, oids[i]) : std::nullopt;
        if (hit) {
            slots[i] = std::move(*hit);
        } else {
            missing.push_back(i);
        }
    }

    if (!missing.empty()) {
        std::vector<std::string> request;
        request.reserve(missing.size());
        for (size_t index : missing) {
            request.push_back(oids[index]);
        }

        auto fetched = run_exchange(*parts->sessions, target, "GET", response.session_id,
                                    [&request](transport::DeviceHandle& handle) {
                                        return handle.get(request);
                                    });
        if (!fetched) {
            return forward_error<QueryResponse>(fetched);
        }

        auto& varbinds = *fetched;
        if (varbinds.size() == missing.size()) {
            for (size_t i = 0; i < missing.size(); ++i) {
                if (caching && !varbinds[i].error) {
                    parts->cache->put(target.host, oids[missing[i]], varbinds[i]);
                }
                slots[missing[i]] = VarBindList{std::move(varbinds[i])};
            }
        } else {
            // Unexpected response shape; return it as is, uncached
            for (auto& vb : varbinds) {
                slots[missing.front()].push_back(std::move(vb));
            }
        }
    }

    for (auto& slot : slots) {
        for (auto& vb : slot) {
            response.varbinds.push_back(std::move(vb));
        }
    }
    response.cached = missing.empty();
    response.timestamp = std::chrono::system_clock::now();
    return make_result(std::move(response));
}

Result<QueryResponse> SnmpService::bulk_get(const DeviceTarget& target,
                                            const std::vector<std::string>& oids,
                                            uint32_t non_repeaters,
                                            uint32_t max_repetitions,
                                            bool use_cache) {
    auto parts = components();
    if (!parts) {
        return forward_error<QueryResponse>(parts);
    }
    SNMPCORE_RETURN_IF_ERROR(validate_target(target));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_oids(oids));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_max_varbinds(max_repetitions));
    if (non_repeaters > oids.size()) {
        return make_error<QueryResponse>(SNMPError::INVALID_PARAMETER,
                                         "non_repeaters exceeds the number of OIDs");
    }
    SNMPCORE_RETURN_IF_ERROR(admit(*parts->rate_limiter, target.host));

    QueryResponse response;
    response.host = target.host;
    response.operation = QueryOperation::BULK_GET;

    const bool caching = use_cache && config_.enable_cache;
    const std::string key = bulk_cache_key(oids, non_repeaters, max_repetitions);
    if (caching) {
        if (auto hit = parts->cache->get(target.host, key)) {
            response.varbinds = std::move(*hit);
            response.cached = true;
            response.timestamp = std::chrono::system_clock::now();
            return make_result(std::move(response));
        }
    }

    auto fetched = run_exchange(*parts->sessions, target, "GETBULK", response.session_id,
                                [&](transport::DeviceHandle& handle) {
                                    return handle.bulk_get(oids, non_repeaters, max_repetitions);
                                });
    if (!fetched) {
        return forward_error<QueryResponse>(fetched);
    }

    if (caching && cacheable(*fetched)) {
        parts->cache->put(target.host, key, *fetched, parts->cache->determine_ttl(oids.front()));
    }
    response.varbinds = std::move(fetched).value();
    response.timestamp = std::chrono::system_clock::now();
    return make_result(std::move(response));
}

Result<QueryResponse> SnmpService::walk(const DeviceTarget& target,
                                        const std::string& root_oid,
                                        uint32_t max_items,
                                        bool use_cache) {
    auto parts = components();
    if (!parts) {
        return forward_error<QueryResponse>(parts);
    }
    SNMPCORE_RETURN_IF_ERROR(validate_target(target));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_oid(root_oid));
    if (max_items == 0) {
        max_items = config_.max_walk_items;
    }
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_max_varbinds(max_items));
    SNMPCORE_RETURN_IF_ERROR(admit(*parts->rate_limiter, target.host));

    QueryResponse response;
    response.host = target.host;
    response.operation = QueryOperation::WALK;

    const bool caching = use_cache && config_.enable_cache;
    const std::string key = walk_cache_key(root_oid, max_items);
    if (caching) {
        if (auto hit = parts->cache->get(target.host, key)) {
            response.varbinds = std::move(*hit);
            response.cached = true;
            response.timestamp = std::chrono::system_clock::now();
            return make_result(std::move(response));
        }
    }

    auto fetched = run_exchange(
        *parts->sessions, target, "WALK", response.session_id,
        [&](transport::DeviceHandle& handle) -> Result<VarBindList> {
            VarBindList collected;
            auto count = handle.walk(root_oid, max_items, [&collected](const VarBind& vb) {
                collected.push_back(vb);
                return true;
            });
            if (!count) {
                return forward_error<VarBindList>(count);
            }
            return make_result(std::move(collected));
        });
    if (!fetched) {
        return forward_error<QueryResponse>(fetched);
    }

    if (caching && cacheable(*fetched)) {
        parts->cache->put(target.host, key, *fetched, parts->cache->determine_ttl(root_oid));
    }
    response.varbinds = std::move(fetched).value();
    response.timestamp = std::chrono::system_clock::now();
    return make_result(std::move(response));
}

Result<std::shared_ptr<trap::TrapListener>> SnmpService::start_trap_listener(
    const trap::TrapListenerOptions& options,
    trap::TrapSink sink,
    std::shared_ptr<trap::TrapParser> parser) {
    if (!is_initialized()) {
        return make_error<std::shared_ptr<trap::TrapListener>>(SNMPError::NOT_INITIALIZED,
                                                               "SNMP service is not initialized");
    }

    auto listener = std::make_shared<trap::TrapListener>(registry_, std::move(parser), reporter_);
    auto started = listener->start(options, std::move(sink));
    if (!started) {
        return forward_error<std::shared_ptr<trap::TrapListener>>(started);
    }

    std::shared_ptr<trap::TrapListener> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = listeners_[listener->port()];
        replaced = std::move(slot);   // a listener on this port that already stopped
        slot = listener;
    }
    return make_result(std::move(listener));
}

bool SnmpService::stop_trap_listener(uint16_t port) {
    std::shared_ptr<trap::TrapListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(port);
        if (it == listeners_.end()) {
            return false;
        }
        listener = std::move(it->second);
        listeners_.erase(it);
    }
    listener->stop();
    return true;
}

std::vector<trap::TrapListenerInfo> SnmpService::trap_listeners() const {
    std::vector<std::shared_ptr<trap::TrapListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    std::vector<trap::TrapListenerInfo> infos;
    infos.reserve(listeners.size());
    for (const auto& listener : listeners) {
        infos.push_back(listener->get_info());
    }
    return infos;
}

// Private helpers

Result<SnmpService::Components> SnmpService::components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return make_error<Components>(SNMPError::NOT_INITIALIZED, "SNMP service is not initialized");
    }
    return make_result(Components{rate_limiter_, cache_, sessions_});
}

Result<void> SnmpService::validate_target(const DeviceTarget& target) const {
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_host(target.host, config_.host_policy));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_port(target.port));

    if (target.version == SnmpVersion::V3) {
        if (target.credentials.username.empty()) {
            return make_error<void>(SNMPError::INVALID_PARAMETER, "SNMPv3 requires a username");
        }
    } else {
        SNMPCORE_RETURN_IF_ERROR(
            security::InputValidator::validate_community(target.credentials.community));
    }

    auto report = security::CredentialUtils::validate_credential_security(
        target.version, target.credentials, config_.sessions.handle_timeout,
        config_.sessions.handle_retries);
    if (!report.secure && reporter_) {
        for (const auto& issue : report.issues) {
            SNMPCORE_REPORT_DEBUG(reporter_, "Credential issue for " + target.host + ": " + issue);
        }
    }
    return make_result();
}

Result<void> SnmpService::admit(security::RateLimiter& limiter, const std::string& host) const {
    auto decision = limiter.check(host);
    if (decision.allowed) {
        return make_result();
    }

    std::string message = "Rate limit exceeded for " + host;
    if (decision.retry_after_seconds) {
        message += ". Retry after " + std::to_string(*decision.retry_after_seconds) + " seconds";
    }
    SNMPCORE_REPORT_WARNING(reporter_, SNMPError::RATE_LIMITED, message);
    return make_error<void>(SNMPError::RATE_LIMITED, message);
}

}  // namespace service
}  // namespace v1
}  // namespace snmpcore
