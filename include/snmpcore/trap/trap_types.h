#pragma once

#include <snmpcore/config.h>
#include <snmpcore/result.h>
#include <snmpcore/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace trap {

/**
 * Decoded content of one notification datagram, as produced by a TrapParser
 */
struct ParsedTrap {
    PduType pdu_type = PduType::TRAP_V2;
    SnmpVersion version = SnmpVersion::V2C;
    std::optional<std::string> community;     // community or v3 security name
    std::optional<std::string> enterprise;
    std::optional<std::string> agent_address;
    std::optional<int32_t> generic_trap;
    std::optional<int32_t> specific_trap;
    std::optional<uint64_t> uptime;            // TimeTicks
    VarBindList varbinds;
};

/**
 * One accepted notification. Built by the listener, then moved into the sink.
 */
struct TrapRecord {
    std::string trap_id;
    SystemTimestamp received_at;
    std::string source_address;
    uint16_t source_port = 0;
    SnmpVersion version = SnmpVersion::V2C;
    std::string community;
    uint8_t pdu_type_code = 0;
    std::string pdu_type_name;
    std::optional<std::string> enterprise;
    std::optional<std::string> agent_address;
    std::optional<int32_t> generic_trap;
    std::optional<int32_t> specific_trap;
    std::optional<uint64_t> uptime;
    VarBindList varbinds;
    std::optional<std::string> raw_payload;    // base64, only with include_raw_payload
    size_t payload_size = 0;
};

using TrapSink = std::function<void(TrapRecord)>;

/**
 * Turns a raw datagram into a ParsedTrap. Implementations may return an
 * error or throw on malformed input; the listener contains both.
 */
class TrapParser {
public:
    virtual ~TrapParser() = default;

    virtual Result<ParsedTrap> parse(const Bytes& datagram) = 0;
};

/**
 * Default parser. Reads only the message header (version, community and
 * PDU tag) and reports every datagram as a notification, falling back to
 * a v2c enterpriseSpecific trap when the header cannot be read. Variable
 * bindings are left to a full decoder.
 */
class SNMPCORE_API RawTrapParser : public TrapParser {
public:
    Result<ParsedTrap> parse(const Bytes& datagram) override;
};

/**
 * Unique id of the form trap-<unix ms>-<9 random base36 chars>
 */
SNMPCORE_API std::string generate_trap_id();

SNMPCORE_API std::string base64_encode(const Bytes& data);

/**
 * Display name of a notification PDU ("TrapV1", "TrapV2", "Inform")
 */
SNMPCORE_API std::string pdu_display_name(PduType type);

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
