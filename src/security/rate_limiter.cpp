#include <snmpcore/security/rate_limiter.h>
#include <algorithm>
#include <sstream>

namespace snmpcore {
namespace v1 {
namespace security {

namespace {

uint32_t ceil_seconds(std::chrono::milliseconds ms) {
    if (ms.count() <= 0) {
        return 0;
    }
    return static_cast<uint32_t>((ms.count() + 999) / 1000);
}

void prune_window(RateLimitEntry& entry, Timestamp cutoff) {
    // Keep only requests strictly newer than the cutoff
    while (!entry.requests.empty() && entry.requests.front() <= cutoff) {
        entry.requests.pop_front();
    }
}

}  // namespace

Result<void> validate_config(const RateLimitConfig& config) {
    if (config.max_requests_per_window == 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "max_requests_per_window must be greater than zero");
    }
    if (config.window_size.count() <= 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "window_size must be positive");
    }
    if (config.block_duration.count() < 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "block_duration must not be negative");
    }
    return make_result();
}

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : config_(config) {
    if (config_.enable_rate_limiting) {
        start_sweep();
    }
}

RateLimiter::~RateLimiter() {
    sweeper_.stop();
}

RateLimitDecision RateLimiter::check(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_.enable_rate_limiting) {
        return RateLimitDecision{};
    }

    const auto now = Clock::now();
    const std::string key = normalize_device(device);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        RateLimitEntry fresh;
        fresh.device = key;
        fresh.window_start = now;
        it = entries_.emplace(key, std::move(fresh)).first;
    }
    RateLimitEntry& entry = it->second;

    if (entry.blocked) {
        auto blocked_for = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - entry.window_start);
        if (blocked_for < config_.block_duration) {
            uint32_t retry_after = ceil_seconds(config_.block_duration - blocked_for);
            RateLimitDecision decision;
            decision.allowed = false;
            decision.retry_after_seconds = retry_after;
            decision.reason = "Rate limit exceeded for host " + device + ". Blocked for " +
                              std::to_string(retry_after) + " more seconds.";
            return decision;
        }

        // Cooldown elapsed
        entry.blocked = false;
        entry.requests.clear();
        entry.window_start = now;
    }

    prune_window(entry, now - config_.window_size);

    if (entry.requests.size() >= config_.max_requests_per_window) {
        entry.blocked = true;
        entry.window_start = now;

        std::ostringstream reason;
        reason << "Rate limit exceeded: " << entry.requests.size()
               << " requests in the last " << config_.window_size.count() / 1000.0
               << " seconds (max: " << config_.max_requests_per_window << ")";

        RateLimitDecision decision;
        decision.allowed = false;
        decision.retry_after_seconds = ceil_seconds(config_.block_duration);
        decision.reason = reason.str();
        return decision;
    }

    entry.requests.push_back(now);
    return RateLimitDecision{};
}

RateLimitStatus RateLimiter::get_status(const std::string& device) const {
    std::lock_guard<std::mutex> lock(mutex_);

    RateLimitStatus status;
    status.max_requests = config_.max_requests_per_window;
    status.window_size = config_.window_size;

    auto it = entries_.find(normalize_device(device));
    if (it == entries_.end()) {
        return status;
    }

    const auto cutoff = Clock::now() - config_.window_size;
    const auto& requests = it->second.requests;
    status.current_requests = static_cast<uint32_t>(
        std::count_if(requests.begin(), requests.end(),
                      [cutoff](const Timestamp& t) { return t > cutoff; }));
    status.blocked = it->second.blocked;
    if (status.blocked) {
        status.reset_time =
            to_system_timestamp(it->second.window_start + config_.block_duration);
    }
    return status;
}

void RateLimiter::reset(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(normalize_device(device));
}

void RateLimiter::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

RateLimitStatistics RateLimiter::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RateLimitStatistics stats;
    const auto cutoff = Clock::now() - config_.window_size;

    for (const auto& [key, entry] : entries_) {
        HostRateStats host;
        host.device = key;
        host.blocked = entry.blocked;
        for (const auto& t : entry.requests) {
            if (t > cutoff) {
                host.requests++;
            }
        }
        if (host.requests > 0) {
            host.last_request = to_system_timestamp(entry.requests.back());
        }
        if (entry.blocked) {
            stats.blocked_hosts++;
        }
        stats.total_requests += host.requests;
        stats.host_stats.push_back(std::move(host));
    }

    stats.total_hosts = entries_.size();
    stats.average_requests_per_host = stats.total_hosts > 0
        ? static_cast<double>(stats.total_requests) / static_cast<double>(stats.total_hosts)
        : 0.0;
    return stats;
}

RateLimitExport RateLimiter::export_data() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RateLimitExport data;
    data.config = config_;
    data.export_time = std::chrono::system_clock::now();
    for (const auto& [key, entry] : entries_) {
        RateLimitExport::Entry row;
        row.device = key;
        row.request_count = entry.requests.size();
        row.blocked = entry.blocked;
        row.last_activity = to_system_timestamp(
            entry.requests.empty() ? entry.window_start : entry.requests.back());
        data.entries.push_back(std::move(row));
    }
    return data;
}

void RateLimiter::set_enabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.enable_rate_limiting = enabled;
    }

    if (!enabled) {
        shutdown();
    } else if (!sweeper_.is_running()) {
        start_sweep();
    }
}

bool RateLimiter::is_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.enable_rate_limiting;
}

Result<void> RateLimiter::update_config(const RateLimitConfig& new_config) {
    auto valid = validate_config(new_config);
    if (!valid) {
        return valid;
    }

    bool window_changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        window_changed = new_config.window_size != config_.window_size;
        config_ = new_config;
    }

    if (!new_config.enable_rate_limiting) {
        shutdown();
    } else if (window_changed || !sweeper_.is_running()) {
        start_sweep();
    }
    return make_result();
}

RateLimitConfig RateLimiter::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

size_t RateLimiter::cleanup_expired_entries() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = Clock::now();
    const auto cutoff = now - config_.window_size;
    size_t removed = 0;

    for (auto it = entries_.begin(); it != entries_.end();) {
        RateLimitEntry& entry = it->second;
        if (entry.blocked && now - entry.window_start >= config_.block_duration) {
            entry.blocked = false;
            entry.requests.clear();
        }
        prune_window(entry, cutoff);

        if (!entry.blocked && entry.requests.empty()) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void RateLimiter::shutdown() {
    sweeper_.stop();
    reset_all();
}

size_t RateLimiter::tracked_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string RateLimiter::normalize_device(const std::string& device) {
    return to_lower_ascii(trim_whitespace(device));
}

void RateLimiter::start_sweep() {
    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval = config_.window_size;
    }
    sweeper_.start(interval, [this] { cleanup_expired_entries(); });
}

// Factory implementations
std::unique_ptr<RateLimiter> RateLimiterFactory::create_development() {
    RateLimitConfig config;
    config.max_requests_per_window = 600;
    config.window_size = std::chrono::milliseconds{60000};
    config.block_duration = std::chrono::milliseconds{10000};   // 10 seconds
    return std::make_unique<RateLimiter>(config);
}

std::unique_ptr<RateLimiter> RateLimiterFactory::create_production() {
    return std::make_unique<RateLimiter>(RateLimitConfig{});
}

std::unique_ptr<RateLimiter> RateLimiterFactory::create_conservative() {
    RateLimitConfig config;
    config.max_requests_per_window = 10;
    config.window_size = std::chrono::milliseconds{60000};
    config.block_duration = std::chrono::milliseconds{900000};  // 15 minutes
    return std::make_unique<RateLimiter>(config);
}

std::unique_ptr<RateLimiter> RateLimiterFactory::create_custom(const RateLimitConfig& config) {
    return std::make_unique<RateLimiter>(config);
}

}  // namespace security
}  // namespace v1
}  // namespace snmpcore
