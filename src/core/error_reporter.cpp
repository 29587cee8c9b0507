#include <snmpcore/error_reporter.h>
#include <snmpcore/security/credential_utils.h>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace snmpcore {
namespace v1 {

ErrorReporter::ErrorReporter() : ErrorReporter(ReportingConfig{}) {}

ErrorReporter::ErrorReporter(const ReportingConfig& config) : config_(config) {
    rate_limit_.second_start = std::chrono::steady_clock::now();
    rate_limit_.minute_start = rate_limit_.second_start;
}

ErrorReporter::~ErrorReporter() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_) {
        log_file_->flush();
    }
}

Result<void> ErrorReporter::report_error(LogLevel level,
                                         SNMPError error,
                                         const std::string& category,
                                         const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (level < config_.minimum_level) {
            return make_result();
        }
    }

    if (!admit_report()) {
        stats_.rate_limited_reports++;
        return make_error<void>(SNMPError::RATE_LIMITED, "Log flood limit reached");
    }

    ErrorReport report(level, error, message);
    report.category = category;
    return deliver(std::move(report));
}

Result<void> ErrorReporter::report_security_incident(SNMPError error,
                                                     const std::string& incident_type,
                                                     const std::string& detail) {
    // Security incidents are always logged regardless of rate limits
    ErrorReport report(LogLevel::SECURITY, error, detail);
    report.category = "security";
    report.is_security_incident = true;
    report.metadata["incident"] = incident_type;
    stats_.security_incidents++;
    return deliver(std::move(report));
}

ErrorReporter::ReportBuilder ErrorReporter::create_report(LogLevel level, SNMPError error) {
    return ReportBuilder(*this, level, error);
}

Result<void> ErrorReporter::submit_report(const ErrorReport& report) {
    if (!report.is_security_incident) {
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            if (report.level < config_.minimum_level) {
                return make_result();
            }
        }
        if (!admit_report()) {
            stats_.rate_limited_reports++;
            return make_error<void>(SNMPError::RATE_LIMITED, "Log flood limit reached");
        }
    } else {
        stats_.security_incidents++;
    }
    return deliver(report);
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    if (config.max_reports_per_second == 0 || config.max_reports_per_minute == 0) {
        return make_error<void>(SNMPError::INVALID_CONFIGURATION,
                                "Report limits must be greater than zero");
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    bool path_changed = config.log_file_path != config_.log_file_path;
    config_ = config;
    if (path_changed) {
        std::lock_guard<std::mutex> out_lock(output_mutex_);
        log_file_.reset();
    }
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

Result<void> ErrorReporter::flush_logs() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_) {
        log_file_->flush();
        if (!log_file_->good()) {
            return make_error<void>(SNMPError::INTERNAL_ERROR, "Failed to flush log file");
        }
    } else {
        std::cerr.flush();
    }
    return make_result();
}

ErrorReporter::ReportingStatistics ErrorReporter::get_statistics() const {
    ReportingStatistics snapshot;
    snapshot.total_reports = stats_.total_reports.load();
    for (size_t i = 0; i < 6; ++i) {
        snapshot.reports_by_level[i] = stats_.reports_by_level[i].load();
    }
    snapshot.security_incidents = stats_.security_incidents.load();
    snapshot.rate_limited_reports = stats_.rate_limited_reports.load();
    snapshot.failed_reports = stats_.failed_reports.load();
    snapshot.bytes_logged = stats_.bytes_logged.load();
    return snapshot;
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
    stats_.security_incidents = 0;
    stats_.rate_limited_reports = 0;
    stats_.failed_reports = 0;
    stats_.bytes_logged = 0;
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::SECURITY: return "SECURITY";
        default: return "UNKNOWN";
    }
}

// Private method implementations

bool ErrorReporter::admit_report() {
    uint32_t max_per_second, max_per_minute;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        max_per_second = config_.max_reports_per_second;
        max_per_minute = config_.max_reports_per_minute;
    }

    std::lock_guard<std::mutex> lock(rate_limit_.reset_mutex);
    auto now = std::chrono::steady_clock::now();

    if (now - rate_limit_.second_start >= std::chrono::seconds(1)) {
        rate_limit_.reports_this_second = 0;
        rate_limit_.second_start = now;
    }
    if (now - rate_limit_.minute_start >= std::chrono::minutes(1)) {
        rate_limit_.reports_this_minute = 0;
        rate_limit_.minute_start = now;
    }

    // Check limits BEFORE incrementing
    if (rate_limit_.reports_this_second >= max_per_second ||
        rate_limit_.reports_this_minute >= max_per_minute) {
        return false;
    }

    rate_limit_.reports_this_second++;
    rate_limit_.reports_this_minute++;
    return true;
}

Result<void> ErrorReporter::deliver(ErrorReport report) {
    report.message = security::CredentialUtils::redact_sensitive_data(report.message);
    for (auto& entry : report.metadata) {
        entry.second = security::CredentialUtils::redact_sensitive_data(entry.second);
    }

    size_t level_index = static_cast<size_t>(report.level);
    if (level_index < 6) {
        stats_.reports_by_level[level_index]++;
    }

    auto result = write_report(report);
    if (!result.is_success()) {
        stats_.failed_reports++;
        return result;
    }
    stats_.total_reports++;

    std::vector<ReporterCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        callbacks = custom_reporters_;
    }
    for (const auto& callback : callbacks) {
        callback(report);
    }

    return make_result();
}

Result<void> ErrorReporter::write_report(const ErrorReport& report) {
    ReportingConfig config = get_configuration();
    std::string formatted = format_report(report, config);
    if (formatted.size() > config.max_log_entry_size) {
        formatted.resize(config.max_log_entry_size);
    }

    std::lock_guard<std::mutex> lock(output_mutex_);

    if (!config.log_file_path.empty()) {
        auto file_result = ensure_log_file(config);
        if (!file_result.is_success()) {
            return file_result;
        }
        *log_file_ << formatted << '\n';
        if (!log_file_->good()) {
            return make_error<void>(SNMPError::INTERNAL_ERROR, "Failed to write log file");
        }
    } else {
        std::cerr << formatted << std::endl;
    }

    stats_.bytes_logged += formatted.length();
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report,
                                         const ReportingConfig& config) const {
    std::ostringstream oss;

    if (config.format == OutputFormat::JSON) {
        oss << "{";
        if (config.include_timestamps) {
            oss << "\"timestamp\":\""
                << format_timestamp(report.timestamp, config.use_utc_timestamps) << "\",";
        }
        oss << "\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"error\":" << static_cast<int>(report.error_code)
            << ",\"category\":\"" << json_escape(report.category) << "\"";
        if (!report.component.empty()) {
            oss << ",\"component\":\"" << json_escape(report.component) << "\"";
        }
        oss << ",\"message\":\"" << json_escape(report.message) << "\"";
        for (const auto& [key, value] : report.metadata) {
            oss << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
        }
        if (report.is_security_incident) {
            oss << ",\"security_incident\":true";
        }
        oss << "}";
    } else {
        if (config.include_timestamps) {
            oss << format_timestamp(report.timestamp, config.use_utc_timestamps) << " ";
        }
        oss << log_level_to_string(report.level) << " [" << report.category << "]";
        if (!report.component.empty()) {
            oss << " " << report.component;
        }
        if (report.error_code != SNMPError::SUCCESS) {
            oss << " Error " << static_cast<int>(report.error_code);
        }
        oss << ": " << report.message;
        for (const auto& [key, value] : report.metadata) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string ErrorReporter::format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                            bool utc) const {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    if (utc) {
        gmtime_r(&t, &tm_buf);
    } else {
        localtime_r(&t, &tm_buf);
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

Result<void> ErrorReporter::ensure_log_file(const ReportingConfig& config) {
    if (log_file_ && log_file_->is_open()) {
        return make_result();
    }
    log_file_ = std::make_unique<std::ofstream>(config.log_file_path, std::ios::app);
    if (!log_file_->is_open()) {
        log_file_.reset();
        return make_error<void>(SNMPError::INTERNAL_ERROR,
                                "Unable to open log file " + config.log_file_path);
    }
    return make_result();
}

std::string ErrorReporter::json_escape(const std::string& input) {
    std::ostringstream oss;
    for (char c : input) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// ReportBuilder

ErrorReporter::ReportBuilder::ReportBuilder(ErrorReporter& reporter, LogLevel level, SNMPError error)
    : reporter_(reporter)
    , report_(level, error, "") {}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::category(const std::string& cat) {
    report_.category = cat;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::message(const std::string& msg) {
    report_.message = msg;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::component(const std::string& comp) {
    report_.component = comp;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::metadata(const std::string& key,
                                                                     const std::string& value) {
    report_.metadata[key] = value;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::security_incident(bool is_incident) {
    report_.is_security_incident = is_incident;
    return *this;
}

Result<void> ErrorReporter::ReportBuilder::submit() {
    return reporter_.submit_report(report_);
}

} // namespace v1
} // namespace snmpcore
