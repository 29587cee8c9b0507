#include <snmpcore/types.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace snmpcore {
namespace v1 {

std::string to_string(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "v1";
        case SnmpVersion::V2C: return "v2c";
        case SnmpVersion::V3: return "v3";
    }
    std::ostringstream oss;
    oss << "UNKNOWN_VERSION(" << static_cast<int>(version) << ")";
    return oss.str();
}

std::string to_string(ObjectType type) {
    static const std::unordered_map<ObjectType, std::string> type_names = {
        {ObjectType::BOOLEAN, "Boolean"},
        {ObjectType::INTEGER, "Integer"},
        {ObjectType::OCTET_STRING, "OctetString"},
        {ObjectType::NULL_VALUE, "Null"},
        {ObjectType::OBJECT_IDENTIFIER, "OID"},
        {ObjectType::IP_ADDRESS, "IpAddress"},
        {ObjectType::COUNTER32, "Counter"},
        {ObjectType::GAUGE32, "Gauge"},
        {ObjectType::TIME_TICKS, "TimeTicks"},
        {ObjectType::OPAQUE, "Opaque"},
        {ObjectType::COUNTER64, "Counter64"},
        {ObjectType::NO_SUCH_OBJECT, "NoSuchObject"},
        {ObjectType::NO_SUCH_INSTANCE, "NoSuchInstance"},
        {ObjectType::END_OF_MIB_VIEW, "EndOfMibView"}
    };

    auto it = type_names.find(type);
    if (it != type_names.end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "Unknown(" << static_cast<int>(type) << ")";
    return oss.str();
}

std::string to_string(PduType type) {
    static const std::unordered_map<PduType, std::string> pdu_names = {
        {PduType::GET_REQUEST, "GetRequest"},
        {PduType::GET_NEXT_REQUEST, "GetNextRequest"},
        {PduType::GET_RESPONSE, "GetResponse"},
        {PduType::SET_REQUEST, "SetRequest"},
        {PduType::TRAP_V1, "Trap"},
        {PduType::GET_BULK_REQUEST, "GetBulkRequest"},
        {PduType::INFORM_REQUEST, "InformRequest"},
        {PduType::TRAP_V2, "TrapV2"},
        {PduType::REPORT, "Report"}
    };

    auto it = pdu_names.find(type);
    if (it != pdu_names.end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "Unknown(0x" << std::hex << static_cast<int>(type) << ")";
    return oss.str();
}

std::string to_string(const VarBindValue& value) {
    std::ostringstream oss;
    if (std::holds_alternative<std::monostate>(value)) {
        oss << "null";
    } else if (auto i = std::get_if<int64_t>(&value)) {
        oss << *i;
    } else if (auto u = std::get_if<uint64_t>(&value)) {
        oss << *u;
    } else if (auto s = std::get_if<std::string>(&value)) {
        oss << *s;
    } else if (auto b = std::get_if<Bytes>(&value)) {
        for (uint8_t byte : *b) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }
    }
    return oss.str();
}

std::string to_string(const VarBind& varbind) {
    std::ostringstream oss;
    oss << varbind.oid << " = " << to_string(varbind.type) << ": ";
    if (varbind.error) {
        oss << *varbind.error;
    } else {
        oss << to_string(varbind.value);
    }
    return oss.str();
}

std::string generic_trap_name(int generic_trap) {
    switch (generic_trap) {
        case 0: return "coldStart";
        case 1: return "warmStart";
        case 2: return "linkDown";
        case 3: return "linkUp";
        case 4: return "authenticationFailure";
        case 5: return "egpNeighborLoss";
        case 6: return "enterpriseSpecific";
        default: return "unknown";
    }
}

int64_t to_unix_millis(SystemTimestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

SystemTimestamp from_unix_millis(int64_t millis) {
    return SystemTimestamp(std::chrono::milliseconds(millis));
}

SystemTimestamp to_system_timestamp(Timestamp ts) {
    auto age = Clock::now() - ts;
    return std::chrono::system_clock::now() -
           std::chrono::duration_cast<std::chrono::system_clock::duration>(age);
}

Timestamp to_steady_timestamp(SystemTimestamp ts) {
    auto age = std::chrono::system_clock::now() - ts;
    return Clock::now() - std::chrono::duration_cast<Clock::duration>(age);
}

std::string to_lower_ascii(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim_whitespace(const std::string& input) {
    const char* ws = " \t\r\n\f\v";
    auto first = input.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    auto last = input.find_last_not_of(ws);
    return input.substr(first, last - first + 1);
}

} // namespace v1
} // namespace snmpcore
