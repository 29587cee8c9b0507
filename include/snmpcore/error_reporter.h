#ifndef SNMPCORE_ERROR_REPORTER_H
#define SNMPCORE_ERROR_REPORTER_H

#include <snmpcore/config.h>
#include <snmpcore/error.h>
#include <snmpcore/result.h>
#include <snmpcore/types.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <fstream>
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace snmpcore {
namespace v1 {

/**
 * ErrorReporter is the logging layer shared by all snmpcore components.
 *
 * 1. Every message passes through the credential redaction filter
 * 2. Output is human readable text or one JSON object per line
 * 3. Reports are rate limited per second and per minute so a flood of
 *    misbehaving devices cannot flood the log
 * 4. Custom callbacks receive every report that passed the filters
 */
class SNMPCORE_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,      // Detailed diagnostic information
        INFO,       // General operational information
        WARNING,    // Warning conditions, non-fatal errors
        ERROR,      // Error conditions, recoverable
        CRITICAL,   // Critical errors, may affect service
        SECURITY    // Security-relevant events, always logged
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        // Rate limiting and resource protection
        uint32_t max_reports_per_second = 100;
        uint32_t max_reports_per_minute = 1000;
        size_t max_log_entry_size = 4096;

        // Output configuration
        std::string log_file_path;                 // Empty = stderr
        bool use_utc_timestamps = true;
        bool include_timestamps = true;
    };

    struct ErrorReport {
        LogLevel level;
        SNMPError error_code;
        std::string category;                     // e.g., "session", "trap"
        std::string component;
        std::string message;                      // Redacted before output
        std::chrono::system_clock::time_point timestamp;
        std::unordered_map<std::string, std::string> metadata;
        bool is_security_incident = false;

        ErrorReport(LogLevel lvl, SNMPError error, const std::string& msg)
            : level(lvl)
            , error_code(error)
            , message(msg)
            , timestamp(std::chrono::system_clock::now()) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an event
     * @param level Log level for the report
     * @param error Error code, SUCCESS for informational events
     * @param category Reporting component or function
     * @param message Descriptive message
     * @return RATE_LIMITED when the report was dropped by the flood limit
     */
    Result<void> report_error(LogLevel level,
                              SNMPError error,
                              const std::string& category,
                              const std::string& message);

    /**
     * Report a security event. Security events bypass the level filter
     * and the flood limit.
     */
    Result<void> report_security_incident(SNMPError error,
                                          const std::string& incident_type,
                                          const std::string& detail);

    class ReportBuilder;
    ReportBuilder create_report(LogLevel level, SNMPError error);

    Result<void> submit_report(const ErrorReport& report);

    Result<void> update_configuration(const ReportingConfig& config);

    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);

    void clear_reporter_callbacks();

    Result<void> flush_logs();

    struct ReportingStatistics {
        uint64_t total_reports = 0;
        uint64_t reports_by_level[6] = {0, 0, 0, 0, 0, 0};
        uint64_t security_incidents = 0;
        uint64_t rate_limited_reports = 0;
        uint64_t failed_reports = 0;
        uint64_t bytes_logged = 0;
    };

    ReportingStatistics get_statistics() const;

    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);

private:
    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex output_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    struct Counters {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[6]{};
        std::atomic<uint64_t> security_incidents{0};
        std::atomic<uint64_t> rate_limited_reports{0};
        std::atomic<uint64_t> failed_reports{0};
        std::atomic<uint64_t> bytes_logged{0};
    };
    mutable Counters stats_;

    struct RateLimitState {
        uint32_t reports_this_second = 0;
        uint32_t reports_this_minute = 0;
        std::chrono::steady_clock::time_point second_start;
        std::chrono::steady_clock::time_point minute_start;
        std::mutex reset_mutex;
    };
    RateLimitState rate_limit_;

    bool admit_report();
    Result<void> deliver(ErrorReport report);
    Result<void> write_report(const ErrorReport& report);
    std::string format_report(const ErrorReport& report, const ReportingConfig& config) const;
    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                 bool utc) const;
    Result<void> ensure_log_file(const ReportingConfig& config);
    static std::string json_escape(const std::string& input);
};

/**
 * Fluent construction of reports with metadata
 */
class SNMPCORE_API ErrorReporter::ReportBuilder {
public:
    ReportBuilder(ErrorReporter& reporter, LogLevel level, SNMPError error);

    ReportBuilder& category(const std::string& cat);
    ReportBuilder& message(const std::string& msg);
    ReportBuilder& component(const std::string& comp);
    ReportBuilder& metadata(const std::string& key, const std::string& value);
    ReportBuilder& security_incident(bool is_incident = true);

    Result<void> submit();

private:
    ErrorReporter& reporter_;
    ErrorReport report_;
};

#define SNMPCORE_REPORT_ERROR(reporter, level, error, message) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_error((level), (error), __FUNCTION__, (message)); \
        } \
    } while(0)

#define SNMPCORE_REPORT_SECURITY(reporter, error, incident_type, detail) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_security_incident((error), (incident_type), (detail)); \
        } \
    } while(0)

#define SNMPCORE_REPORT_DEBUG(reporter, message) \
    SNMPCORE_REPORT_ERROR(reporter, ::snmpcore::v1::ErrorReporter::LogLevel::DEBUG, \
                          ::snmpcore::v1::SNMPError::SUCCESS, message)

#define SNMPCORE_REPORT_INFO(reporter, message) \
    SNMPCORE_REPORT_ERROR(reporter, ::snmpcore::v1::ErrorReporter::LogLevel::INFO, \
                          ::snmpcore::v1::SNMPError::SUCCESS, message)

#define SNMPCORE_REPORT_WARNING(reporter, error, message) \
    SNMPCORE_REPORT_ERROR(reporter, ::snmpcore::v1::ErrorReporter::LogLevel::WARNING, error, message)

} // namespace v1
} // namespace snmpcore

#endif // SNMPCORE_ERROR_REPORTER_H
