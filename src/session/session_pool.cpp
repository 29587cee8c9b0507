#include <snmpcore/session/session_pool.h>
#include <snmpcore/security/credential_utils.h>
#include <snmpcore/security/input_validator.h>

#include <algorithm>
#include <numeric>
#include <sstream>

namespace snmpcore {
namespace v1 {
namespace session {

namespace {

constexpr size_t kMaxLatencySamples = 1000;

const char* event_name(SessionEvent event) {
    switch (event) {
        case SessionEvent::CREATED: return "created";
        case SessionEvent::REUSED: return "reused";
        case SessionEvent::RELEASED: return "released";
        case SessionEvent::DESTROYED: return "destroyed";
        case SessionEvent::ERROR: return "error";
    }
    return "unknown";
}

}  // namespace

Result<void> validate_config(const SessionPoolConfig& config) {
    if (config.max_sessions == 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "max_sessions must be greater than zero");
    }
    if (config.session_timeout.count() <= 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "session_timeout must be positive");
    }
    if (config.max_requests_per_session == 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "max_requests_per_session must be greater than zero");
    }
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_timeout(config.handle_timeout));
    SNMPCORE_RETURN_IF_ERROR(security::InputValidator::validate_retries(config.handle_retries));
    return make_result();
}

SessionPool::SessionPool(std::shared_ptr<transport::DeviceTransport> transport,
                         const SessionPoolConfig& config,
                         std::shared_ptr<ErrorReporter> reporter)
    : transport_(std::move(transport))
    , reporter_(std::move(reporter))
    , config_(config) {
    sweeper_.start(config_.cleanup_interval, [this] { cleanup_expired_sessions(); });
}

SessionPool::~SessionPool() {
    shutdown();
}

Result<std::string> SessionPool::make_pool_key(const SessionKey& key) {
    auto fingerprint = security::CredentialUtils::credential_fingerprint(
        key.host, key.version, key.port, key.credentials);
    if (!fingerprint) {
        return forward_error<std::string>(fingerprint);
    }

    std::ostringstream oss;
    oss << to_lower_ascii(key.host) << ':' << key.port << ':' << to_string(key.version)
        << ':' << *fingerprint;
    return make_result(oss.str());
}

Result<SessionLease> SessionPool::acquire(const SessionKey& key) {
    auto host_check = security::InputValidator::validate_host(
        key.host, security::HostPolicy{true, true});
    if (!host_check) {
        return forward_error<SessionLease>(host_check);
    }
    auto port_check = security::InputValidator::validate_port(key.port);
    if (!port_check) {
        return forward_error<SessionLease>(port_check);
    }
    if (!transport_) {
        return make_error<SessionLease>(SNMPError::NOT_INITIALIZED,
                                        "Session pool has no device transport");
    }

    auto pool_key = make_pool_key(key);
    if (!pool_key) {
        return forward_error<SessionLease>(pool_key);
    }

    HandleList to_close;
    DestroyedList destroyed;
    Result<SessionLease> outcome = make_error<SessionLease>(SNMPError::INTERNAL_ERROR);
    transport::HandleOptions options;
    bool reused = false;
    bool need_open = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto lease = try_reuse_locked(*pool_key, Clock::now(), to_close, destroyed);
        if (lease) {
            outcome = std::move(*lease);
            reused = true;
        } else {
            auto capacity = make_room_locked(to_close, destroyed);
            if (!capacity) {
                outcome = forward_error<SessionLease>(capacity);
            } else {
                pending_opens_++;
                need_open = true;

                options.host = key.host;
                options.port = key.port;
                options.version = key.version;
                options.credentials = key.credentials;
                options.timeout = config_.handle_timeout;
                options.retries = config_.handle_retries;
            }
        }
    }
    finish_removals(to_close, destroyed);

    if (need_open) {
        outcome = open_session(key, *pool_key, options, reused);
    }

    if (!outcome) {
        if (outcome.error() == SNMPError::HANDLE_CREATION_FAILED) {
            record_error("session_creation_error", key.host);
        }
        SNMPCORE_REPORT_WARNING(reporter_, outcome.error(), outcome.error_message());
        return outcome;
    }

    emit(reused ? SessionEvent::REUSED : SessionEvent::CREATED, outcome->id, key.host);
    return outcome;
}

void SessionPool::release(const std::string& session_id) {
    std::shared_ptr<transport::DeviceHandle> retired_handle;
    bool last_retired_lease = false;
    std::string host;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = find_key_by_id_locked(session_id);
        if (!key.empty()) {
            auto& session = sessions_[key];
            if (session.info.borrowers > 0) {
                session.info.borrowers--;
            }
            session.info.active = session.info.borrowers > 0;
            session.info.last_used = Clock::now();
            host = session.info.host;
        } else {
            auto it = retired_.find(session_id);
            if (it == retired_.end()) {
                return;
            }
            host = it->second.info.host;
            if (it->second.info.borrowers > 0) {
                it->second.info.borrowers--;
            }
            if (it->second.info.borrowers == 0) {
                retired_handle = std::move(it->second.handle);
                retired_.erase(it);
                last_retired_lease = true;
            }
        }
    }
    emit(SessionEvent::RELEASED, session_id, host);

    if (last_retired_lease) {
        close_handle(retired_handle);
        emit(SessionEvent::DESTROYED, session_id, host);
    }
}

void SessionPool::close(const std::string& session_id) {
    std::shared_ptr<transport::DeviceHandle> handle;
    std::string host;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = find_key_by_id_locked(session_id);
        if (!key.empty()) {
            host = sessions_[key].info.host;
            handle = remove_locked(key);
        } else {
            auto it = retired_.find(session_id);
            if (it == retired_.end()) {
                return;
            }
            host = it->second.info.host;
            handle = std::move(it->second.handle);
            retired_.erase(it);
        }
    }
    close_handle(handle);
    emit(SessionEvent::DESTROYED, session_id, host);
}

void SessionPool::close_all() {
    DestroyedList destroyed;
    HandleList handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* pool : {&sessions_, &retired_}) {
            for (auto& [key, session] : *pool) {
                destroyed.emplace_back(session.info.id, session.info.host);
                handles.push_back(std::move(session.handle));
            }
            pool->clear();
        }
    }
    finish_removals(handles, destroyed);
}

void SessionPool::record_request(const std::string& session_id, std::chrono::microseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto* session = find_session_locked(session_id)) {
        session->info.request_count++;
        session->info.last_used = Clock::now();
        session->consecutive_errors = 0;
    }

    if (config_.enable_metrics) {
        total_requests_++;
        request_times_ms_.push_back(static_cast<double>(latency.count()) / 1000.0);
        while (request_times_ms_.size() > kMaxLatencySamples) {
            request_times_ms_.pop_front();
        }
    }
}

void SessionPool::record_error(const std::string& kind, const std::string& host,
                               const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.enable_metrics) {
            total_errors_++;
        }
        if (auto* session = find_session_locked(session_id)) {
            session->info.error_count++;
            session->consecutive_errors++;
        }
    }

    if (reporter_) {
        (void)reporter_->create_report(ErrorReporter::LogLevel::DEBUG, SNMPError::REQUEST_FAILED)
            .category("session")
            .component("SessionPool")
            .message("Session error recorded")
            .metadata("kind", kind)
            .metadata("host", host)
            .submit();
    }
    emit(SessionEvent::ERROR, session_id, host);
}

size_t SessionPool::cleanup_expired_sessions() {
    DestroyedList destroyed;
    HandleList handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            // Lent out sessions are left to their borrowers
            if (it->second.info.borrowers == 0 && !is_valid_locked(it->second, now)) {
                destroyed.emplace_back(it->second.info.id, it->second.info.host);
                handles.push_back(std::move(it->second.handle));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    finish_removals(handles, destroyed);
    if (!destroyed.empty()) {
        SNMPCORE_REPORT_DEBUG(reporter_, "Closed " + std::to_string(destroyed.size()) +
                                             " expired sessions");
    }
    return destroyed.size();
}

std::vector<SessionHealth> SessionPool::health_check() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionHealth> results;
    results.reserve(sessions_.size());

    const auto now = Clock::now();
    const auto wall_now = std::chrono::system_clock::now();
    for (const auto& [key, session] : sessions_) {
        const auto started = Clock::now();
        SessionHealth health;
        health.session_id = session.info.id;
        health.host = session.info.host;
        health.healthy = is_valid_locked(session, now);
        health.last_check = wall_now;
        health.response_time = std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - started);
        health.error_count = session.info.error_count;
        health.consecutive_errors = session.consecutive_errors;
        results.push_back(std::move(health));
    }
    return results;
}

SessionPoolStatus SessionPool::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionPoolStatus status;
    status.size = sessions_.size();
    status.max_size = config_.max_sessions;

    for (const auto& [key, session] : sessions_) {
        if (session.info.active) {
            status.active_connections++;
        }
        status.sessions.push_back(session.info);
    }
    status.active_connections += retired_.size();

    status.metrics.total_sessions = sessions_.size();
    status.metrics.active_sessions = status.active_connections;
    status.metrics.total_requests = total_requests_;
    status.metrics.total_errors = total_errors_;
    status.metrics.average_request_time_ms = average_request_time_locked();
    status.metrics.error_rate = total_requests_ > 0
        ? static_cast<double>(total_errors_) / static_cast<double>(total_requests_)
        : 0.0;
    status.metrics.pool_utilization =
        static_cast<double>(sessions_.size()) / static_cast<double>(config_.max_sessions);
    return status;
}

Result<void> SessionPool::update_config(const SessionPoolConfig& new_config) {
    SNMPCORE_RETURN_IF_ERROR(validate_config(new_config));

    bool interval_changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_changed = new_config.cleanup_interval != config_.cleanup_interval;
        config_ = new_config;
    }
    if (interval_changed) {
        sweeper_.start(new_config.cleanup_interval, [this] { cleanup_expired_sessions(); });
    }
    return make_result();
}

SessionPoolConfig SessionPool::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void SessionPool::set_event_callback(SessionEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void SessionPool::shutdown() {
    sweeper_.stop();
    close_all();
}

size_t SessionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// Private helpers

bool SessionPool::is_valid_locked(const PooledSession& session, Timestamp now) const {
    if (now - session.info.last_used >= config_.session_timeout) {
        return false;
    }
    if (session.info.request_count >= config_.max_requests_per_session) {
        return false;
    }
    return session.handle && session.handle->is_open();
}

std::shared_ptr<transport::DeviceHandle> SessionPool::remove_locked(const std::string& pool_key) {
    auto it = sessions_.find(pool_key);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto handle = std::move(it->second.handle);
    sessions_.erase(it);
    return handle;
}

std::string SessionPool::find_key_by_id_locked(const std::string& session_id) const {
    for (const auto& [key, session] : sessions_) {
        if (session.info.id == session_id) {
            return key;
        }
    }
    return {};
}

SessionPool::PooledSession* SessionPool::find_session_locked(const std::string& session_id) {
    if (session_id.empty()) {
        return nullptr;
    }
    auto key = find_key_by_id_locked(session_id);
    if (!key.empty()) {
        return &sessions_[key];
    }
    auto it = retired_.find(session_id);
    return it == retired_.end() ? nullptr : &it->second;
}

std::optional<SessionLease> SessionPool::try_reuse_locked(const std::string& pool_key, Timestamp now,
                                                          HandleList& to_close,
                                                          DestroyedList& destroyed) {
    auto it = sessions_.find(pool_key);
    if (it == sessions_.end()) {
        return std::nullopt;
    }

    auto& session = it->second;
    if (is_valid_locked(session, now)) {
        session.info.last_used = now;
        session.info.borrowers++;
        session.info.active = true;
        return SessionLease{session.info.id, session.info, session.handle};
    }

    // Replace the stale session; one that is still lent out stays open until released
    if (session.info.borrowers > 0) {
        const std::string id = session.info.id;
        retired_.emplace(id, std::move(session));
    } else {
        destroyed.emplace_back(session.info.id, session.info.host);
        to_close.push_back(std::move(session.handle));
    }
    sessions_.erase(it);
    return std::nullopt;
}

Result<void> SessionPool::make_room_locked(HandleList& to_close, DestroyedList& destroyed) {
    if (sessions_.size() + pending_opens_ < config_.max_sessions) {
        return make_result();
    }
    return evict_oldest_inactive_locked(to_close, destroyed);
}

Result<void> SessionPool::evict_oldest_inactive_locked(HandleList& to_close,
                                                       DestroyedList& destroyed) {
    auto oldest = sessions_.end();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (it->second.info.borrowers > 0) {
            continue;
        }
        if (oldest == sessions_.end() || it->second.info.last_used < oldest->second.info.last_used) {
            oldest = it;
        }
    }

    if (oldest == sessions_.end()) {
        return make_error<void>(SNMPError::SESSION_POOL_EXHAUSTED,
                                "Cannot create new session: session pool is full (" +
                                    std::to_string(sessions_.size() + pending_opens_) +
                                    " sessions) and all sessions are active");
    }

    destroyed.emplace_back(oldest->second.info.id, oldest->second.info.host);
    to_close.push_back(std::move(oldest->second.handle));
    sessions_.erase(oldest);
    return make_result();
}

Result<SessionLease> SessionPool::open_session(const SessionKey& key, const std::string& pool_key,
                                               const transport::HandleOptions& options,
                                               bool& reused) {
    // The slot reserved by acquire() keeps capacity while the lock is released
    auto handle = transport_->open_handle(options);

    HandleList to_close;
    DestroyedList destroyed;
    Result<SessionLease> outcome = make_error<SessionLease>(SNMPError::INTERNAL_ERROR);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_opens_--;
        const auto now = Clock::now();

        if (!handle || !*handle) {
            std::string cause = handle ? std::string("transport returned no handle")
                                       : handle.error_message();
            outcome = make_error<SessionLease>(
                SNMPError::HANDLE_CREATION_FAILED,
                "Failed to create SNMP session for " + key.host + ": " +
                    security::CredentialUtils::safe_error_message(cause));
        } else if (auto lease = try_reuse_locked(pool_key, now, to_close, destroyed)) {
            // Another caller pooled this key while the handle was opening
            to_close.push_back(std::move(handle).value());
            outcome = std::move(*lease);
            reused = true;
        } else if (auto capacity = make_room_locked(to_close, destroyed); !capacity) {
            to_close.push_back(std::move(handle).value());
            outcome = forward_error<SessionLease>(capacity);
        } else {
            PooledSession pooled;
            pooled.info.id = generate_session_id();
            pooled.info.host = key.host;
            pooled.info.port = key.port;
            pooled.info.version = key.version;
            pooled.info.fingerprint = pool_key.substr(pool_key.rfind(':') + 1);
            pooled.info.created_at = now;
            pooled.info.last_used = now;
            pooled.info.borrowers = 1;
            pooled.info.active = true;
            pooled.handle = std::move(handle).value();

            outcome = SessionLease{pooled.info.id, pooled.info, pooled.handle};
            sessions_.emplace(pool_key, std::move(pooled));
        }
    }
    finish_removals(to_close, destroyed);
    return outcome;
}

void SessionPool::finish_removals(const HandleList& to_close, const DestroyedList& destroyed) const {
    for (const auto& handle : to_close) {
        close_handle(handle);
    }
    for (const auto& [id, host] : destroyed) {
        emit(SessionEvent::DESTROYED, id, host);
    }
}

std::string SessionPool::generate_session_id() {
    std::ostringstream oss;
    oss << "session_" << ++session_counter_ << "_"
        << to_unix_millis(std::chrono::system_clock::now());
    return oss.str();
}

void SessionPool::close_handle(const std::shared_ptr<transport::DeviceHandle>& handle) const {
    if (!handle) {
        return;
    }
    try {
        handle->close();
    } catch (const std::exception& e) {
        // Teardown is unconditional; the failure is only logged
        SNMPCORE_REPORT_WARNING(reporter_, SNMPError::TRANSPORT_ERROR,
                                std::string("Session close failed: ") + e.what());
    }
}

void SessionPool::emit(SessionEvent event, const std::string& session_id,
                       const std::string& host) const {
    SNMPCORE_REPORT_DEBUG(reporter_, std::string("Session ") + event_name(event) + " " +
                                         session_id + " host=" + host);

    SessionEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(event, session_id, host);
    }
}

double SessionPool::average_request_time_locked() const {
    if (request_times_ms_.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(request_times_ms_.begin(), request_times_ms_.end(), 0.0);
    return sum / static_cast<double>(request_times_ms_.size());
}

}  // namespace session
}  // namespace v1
}  // namespace snmpcore
