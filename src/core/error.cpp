#include <snmpcore/error.h>
#include <unordered_map>

namespace snmpcore {
namespace v1 {

std::string SNMPErrorCategory::message(int ev) const {
    SNMPError error = static_cast<SNMPError>(ev);

    static const std::unordered_map<SNMPError, std::string> error_messages = {
        {SNMPError::SUCCESS, "Success"},

        // Validation errors (1-19)
        {SNMPError::INVALID_PARAMETER, "Invalid parameter provided"},
        {SNMPError::INVALID_HOST, "Invalid host"},
        {SNMPError::INVALID_OID, "Invalid OID"},
        {SNMPError::INVALID_PORT, "Port must be between 1 and 65535"},
        {SNMPError::INVALID_COMMUNITY, "Invalid community string"},
        {SNMPError::INVALID_TIMEOUT, "Timeout must be between 1000 and 60000 ms"},
        {SNMPError::INVALID_RETRIES, "Retries must be between 0 and 10"},
        {SNMPError::INVALID_MAX_VARBINDS, "Max varbinds must be between 1 and 10000"},
        {SNMPError::INVALID_CONFIGURATION, "Invalid configuration"},

        // Capacity errors (20-29)
        {SNMPError::SESSION_POOL_EXHAUSTED, "Session pool is full and all sessions are active"},
        {SNMPError::CACHE_CAPACITY_EXCEEDED, "Cache capacity exceeded"},
        {SNMPError::QUOTA_EXCEEDED, "Quota exceeded"},

        // Rate limiting (30-39)
        {SNMPError::RATE_LIMITED, "Rate limit exceeded for device"},

        // Transport errors (40-59)
        {SNMPError::HANDLE_CREATION_FAILED, "Failed to create device session"},
        {SNMPError::REQUEST_FAILED, "Device request failed"},
        {SNMPError::TIMEOUT, "Request timed out"},
        {SNMPError::TRANSPORT_ERROR, "Transport error"},
        {SNMPError::SESSION_NOT_FOUND, "Session not found"},
        {SNMPError::NO_SUCH_OBJECT, "No such object on device"},

        // Parse errors (60-69)
        {SNMPError::DECODE_ERROR, "Failed to decode packet"},
        {SNMPError::UNSUPPORTED_PDU, "Unsupported PDU type"},

        // Socket errors (70-89)
        {SNMPError::SOCKET_ERROR, "Socket error"},
        {SNMPError::ADDRESS_IN_USE, "Address already in use"},
        {SNMPError::PORT_IN_USE, "Port is already in use by another trap listener"},
        {SNMPError::ADDRESS_RESOLUTION_FAILED, "Address resolution failed"},
        {SNMPError::RECEIVE_ERROR, "Receive failed"},

        // State errors (90-99)
        {SNMPError::NOT_INITIALIZED, "Component not initialized"},
        {SNMPError::ALREADY_INITIALIZED, "Component already initialized"},
        {SNMPError::STATE_MACHINE_ERROR, "Invalid state for operation"},
        {SNMPError::INTERNAL_ERROR, "Internal implementation error"}
    };

    auto it = error_messages.find(error);
    if (it != error_messages.end()) {
        return it->second;
    }

    return "Unknown snmpcore error (" + std::to_string(ev) + ")";
}

std::string error_message(SNMPError error) {
    return SNMPErrorCategory::instance().message(static_cast<int>(error));
}

ErrorKind error_kind(SNMPError error) {
    int code = static_cast<int>(error);
    if (code == 0) return ErrorKind::NONE;
    if (code < 20) return ErrorKind::VALIDATION;
    if (code < 30) return ErrorKind::CAPACITY;
    if (code < 40) return ErrorKind::RATE_LIMIT;
    if (code < 60) return ErrorKind::TRANSPORT;
    if (code < 70) return ErrorKind::PARSE;
    if (code < 90) return ErrorKind::FATAL_SOCKET;
    return ErrorKind::STATE;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::CAPACITY: return "capacity";
        case ErrorKind::RATE_LIMIT: return "rate_limit";
        case ErrorKind::TRANSPORT: return "transport";
        case ErrorKind::PARSE: return "parse";
        case ErrorKind::FATAL_SOCKET: return "fatal_socket";
        case ErrorKind::STATE: return "state";
    }
    return "unknown";
}

bool is_fatal_error(SNMPError error) {
    switch (error) {
        case SNMPError::SOCKET_ERROR:
        case SNMPError::ADDRESS_IN_USE:
        case SNMPError::INTERNAL_ERROR:
            return true;
        default:
            return false;
    }
}

bool is_retryable_error(SNMPError error) {
    switch (error) {
        case SNMPError::TIMEOUT:
        case SNMPError::REQUEST_FAILED:
        case SNMPError::TRANSPORT_ERROR:
        case SNMPError::HANDLE_CREATION_FAILED:
        case SNMPError::RATE_LIMITED:
        case SNMPError::SESSION_POOL_EXHAUSTED:
            return true;

        case SNMPError::NO_SUCH_OBJECT:
        case SNMPError::DECODE_ERROR:
            return false;

        default:
            // Conservative approach: don't retry unknown errors
            return false;
    }
}

} // namespace v1
} // namespace snmpcore
