#ifndef SNMPCORE_ERROR_H
#define SNMPCORE_ERROR_H

#include <snmpcore/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace snmpcore {
namespace v1 {

// snmpcore error codes
enum class SNMPError : int {
    SUCCESS = 0,

    // Validation errors (1-19)
    INVALID_PARAMETER = 1,
    INVALID_HOST = 2,
    INVALID_OID = 3,
    INVALID_PORT = 4,
    INVALID_COMMUNITY = 5,
    INVALID_TIMEOUT = 6,
    INVALID_RETRIES = 7,
    INVALID_MAX_VARBINDS = 8,
    INVALID_CONFIGURATION = 9,

    // Capacity errors (20-29)
    SESSION_POOL_EXHAUSTED = 20,
    CACHE_CAPACITY_EXCEEDED = 21,
    QUOTA_EXCEEDED = 22,

    // Rate limiting (30-39)
    RATE_LIMITED = 30,

    // Transport errors (40-59)
    HANDLE_CREATION_FAILED = 40,
    REQUEST_FAILED = 41,
    TIMEOUT = 42,
    TRANSPORT_ERROR = 43,
    SESSION_NOT_FOUND = 44,
    NO_SUCH_OBJECT = 45,

    // Parse errors (60-69)
    DECODE_ERROR = 60,
    UNSUPPORTED_PDU = 61,

    // Socket errors (70-89)
    SOCKET_ERROR = 70,
    ADDRESS_IN_USE = 71,
    PORT_IN_USE = 72,
    ADDRESS_RESOLUTION_FAILED = 73,
    RECEIVE_ERROR = 74,

    // State errors (90-99)
    NOT_INITIALIZED = 90,
    ALREADY_INITIALIZED = 91,
    STATE_MACHINE_ERROR = 92,
    INTERNAL_ERROR = 93
};

/**
 * Coarse classification of error codes, used by callers to decide
 * whether to retry, back off or give up.
 */
enum class ErrorKind : uint8_t {
    NONE,
    VALIDATION,
    CAPACITY,
    RATE_LIMIT,
    TRANSPORT,
    PARSE,
    FATAL_SOCKET,
    STATE
};

// Error category for snmpcore errors
class SNMPErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "snmpcore";
    }

    std::string message(int ev) const override;

    static const SNMPErrorCategory& instance() {
        static SNMPErrorCategory instance;
        return instance;
    }
};

inline std::error_code make_error_code(SNMPError e) {
    return std::error_code(static_cast<int>(e), SNMPErrorCategory::instance());
}

// Exception class for snmpcore errors
class SNMPCORE_API SNMPException : public std::system_error {
public:
    explicit SNMPException(SNMPError error)
        : std::system_error(make_error_code(error)) {}

    SNMPException(SNMPError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    SNMPError snmp_error() const noexcept {
        return static_cast<SNMPError>(code().value());
    }
};

// Utility functions
SNMPCORE_API std::string error_message(SNMPError error);
SNMPCORE_API ErrorKind error_kind(SNMPError error);
SNMPCORE_API const char* error_kind_name(ErrorKind kind);
SNMPCORE_API bool is_fatal_error(SNMPError error);
SNMPCORE_API bool is_retryable_error(SNMPError error);

#define SNMPCORE_THROW_IF_ERROR(error) \
    do { \
        if ((error) != ::snmpcore::v1::SNMPError::SUCCESS) { \
            throw ::snmpcore::v1::SNMPException((error)); \
        } \
    } while (0)

} // namespace v1
} // namespace snmpcore

namespace std {
template<>
struct is_error_code_enum<snmpcore::v1::SNMPError> : true_type {};
}

#endif // SNMPCORE_ERROR_H
