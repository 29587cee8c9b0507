#ifndef SNMPCORE_TYPES_H
#define SNMPCORE_TYPES_H

#include <snmpcore/config.h>
#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <chrono>
#include <optional>
#include <variant>

namespace snmpcore {
namespace v1 {

// Clock aliases
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using SystemTimestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Protocol versions, numbered as on the wire
enum class SnmpVersion : uint8_t {
    V1 = 0,
    V2C = 1,
    V3 = 3
};

// ASN.1 / SMI value tags
enum class ObjectType : uint8_t {
    BOOLEAN = 1,
    INTEGER = 2,
    OCTET_STRING = 4,
    NULL_VALUE = 5,
    OBJECT_IDENTIFIER = 6,
    IP_ADDRESS = 64,
    COUNTER32 = 65,
    GAUGE32 = 66,
    TIME_TICKS = 67,
    OPAQUE = 68,
    COUNTER64 = 70,
    NO_SUCH_OBJECT = 128,
    NO_SUCH_INSTANCE = 129,
    END_OF_MIB_VIEW = 130
};

// PDU types carried by notifications
enum class PduType : uint8_t {
    GET_REQUEST = 0xA0,
    GET_NEXT_REQUEST = 0xA1,
    GET_RESPONSE = 0xA2,
    SET_REQUEST = 0xA3,
    TRAP_V1 = 0xA4,
    GET_BULK_REQUEST = 0xA5,
    INFORM_REQUEST = 0xA6,
    TRAP_V2 = 0xA7,
    REPORT = 0xA8
};

using Bytes = std::vector<uint8_t>;

/**
 * Value of a variable binding. Integers are signed, counters and gauges
 * unsigned, OIDs and addresses are kept in dotted text form.
 */
using VarBindValue = std::variant<std::monostate, int64_t, uint64_t, std::string, Bytes>;

struct VarBind {
    std::string oid;
    ObjectType type = ObjectType::NULL_VALUE;
    VarBindValue value;
    std::optional<std::string> error;   // noSuchObject / noSuchInstance / endOfMibView

    VarBind() = default;
    VarBind(std::string o, ObjectType t, VarBindValue v)
        : oid(std::move(o)), type(t), value(std::move(v)) {}

    bool operator==(const VarBind& other) const {
        return oid == other.oid && type == other.type && value == other.value &&
               error == other.error;
    }
    bool operator!=(const VarBind& other) const { return !(*this == other); }
};

using VarBindList = std::vector<VarBind>;

// v3 security
enum class AuthProtocol : uint8_t { NONE, MD5, SHA };
enum class PrivProtocol : uint8_t { NONE, DES, AES };

/**
 * Credential material for one device. The community is used for v1/v2c,
 * the user-based fields for v3.
 */
struct Credentials {
    std::string community;
    std::string username;
    AuthProtocol auth_protocol = AuthProtocol::NONE;
    std::string auth_key;
    PrivProtocol priv_protocol = PrivProtocol::NONE;
    std::string priv_key;

    static Credentials from_community(std::string community) {
        Credentials c;
        c.community = std::move(community);
        return c;
    }
};

// String conversions
std::string to_string(SnmpVersion version);
std::string to_string(ObjectType type);
std::string to_string(PduType type);
std::string to_string(const VarBindValue& value);
std::string to_string(const VarBind& varbind);

// Generic trap names for v1 generic-trap codes 0..6
std::string generic_trap_name(int generic_trap);

// Milliseconds since the Unix epoch
int64_t to_unix_millis(SystemTimestamp ts);
SystemTimestamp from_unix_millis(int64_t millis);

// Map between the monotonic clock and wall-clock time at the current instant
SystemTimestamp to_system_timestamp(Timestamp ts);
Timestamp to_steady_timestamp(SystemTimestamp ts);

std::string to_lower_ascii(const std::string& input);
std::string trim_whitespace(const std::string& input);

} // namespace v1
} // namespace snmpcore

#endif // SNMPCORE_TYPES_H
