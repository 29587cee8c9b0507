#include <snmpcore/trap/trap_types.h>

#include <openssl/evp.h>

#include <random>

namespace snmpcore {
namespace v1 {
namespace trap {

namespace {

constexpr uint8_t BER_INTEGER = 0x02;
constexpr uint8_t BER_OCTET_STRING = 0x04;
constexpr uint8_t BER_SEQUENCE = 0x30;

/**
 * Minimal BER cursor over a datagram. Only definite lengths up to four
 * octets are accepted.
 */
class BerCursor {
public:
    BerCursor(const Bytes& data, size_t begin, size_t end)
        : data_(data), pos_(begin), end_(end) {}

    bool read_header(uint8_t& tag, size_t& length) {
        if (pos_ + 2 > end_) {
            return false;
        }
        tag = data_[pos_++];
        uint8_t first = data_[pos_++];
        if ((first & 0x80) == 0) {
            length = first;
        } else {
            size_t octets = first & 0x7F;
            if (octets == 0 || octets > 4 || pos_ + octets > end_) {
                return false;
            }
            length = 0;
            for (size_t i = 0; i < octets; ++i) {
                length = (length << 8) | data_[pos_++];
            }
        }
        return pos_ + length <= end_;
    }

    bool read_integer(int64_t& value) {
        uint8_t tag = 0;
        size_t length = 0;
        if (!read_header(tag, length) || tag != BER_INTEGER || length == 0 || length > 8) {
            return false;
        }
        value = (data_[pos_] & 0x80) ? -1 : 0;
        for (size_t i = 0; i < length; ++i) {
            value = static_cast<int64_t>((static_cast<uint64_t>(value) << 8) | data_[pos_++]);
        }
        return true;
    }

    bool read_octet_string(std::string& value) {
        uint8_t tag = 0;
        size_t length = 0;
        if (!read_header(tag, length) || tag != BER_OCTET_STRING) {
            return false;
        }
        value.assign(reinterpret_cast<const char*>(data_.data() + pos_), length);
        pos_ += length;
        return true;
    }

    bool peek_tag(uint8_t& tag) const {
        if (pos_ >= end_) {
            return false;
        }
        tag = data_[pos_];
        return true;
    }

    size_t position() const { return pos_; }

private:
    const Bytes& data_;
    size_t pos_;
    size_t end_;
};

bool is_notification_tag(uint8_t tag) {
    return tag == static_cast<uint8_t>(PduType::TRAP_V1) ||
           tag == static_cast<uint8_t>(PduType::TRAP_V2) ||
           tag == static_cast<uint8_t>(PduType::INFORM_REQUEST);
}

}  // namespace

Result<ParsedTrap> RawTrapParser::parse(const Bytes& datagram) {
    ParsedTrap parsed;
    parsed.generic_trap = 6;
    parsed.specific_trap = 0;

    BerCursor outer(datagram, 0, datagram.size());
    uint8_t tag = 0;
    size_t length = 0;
    if (!outer.read_header(tag, length) || tag != BER_SEQUENCE) {
        return make_result(std::move(parsed));
    }

    BerCursor message(datagram, outer.position(), outer.position() + length);
    int64_t version = 0;
    if (!message.read_integer(version)) {
        return make_result(std::move(parsed));
    }

    switch (version) {
        case 0:
            parsed.version = SnmpVersion::V1;
            parsed.pdu_type = PduType::TRAP_V1;
            break;
        case 1:
            parsed.version = SnmpVersion::V2C;
            break;
        case 3:
            // USM header is not read here; the security name stays unset
            parsed.version = SnmpVersion::V3;
            parsed.generic_trap.reset();
            parsed.specific_trap.reset();
            return make_result(std::move(parsed));
        default:
            return make_result(std::move(parsed));
    }

    std::string community;
    if (!message.read_octet_string(community)) {
        return make_result(std::move(parsed));
    }
    parsed.community = std::move(community);

    uint8_t pdu_tag = 0;
    if (message.peek_tag(pdu_tag) && is_notification_tag(pdu_tag)) {
        parsed.pdu_type = static_cast<PduType>(pdu_tag);
    }
    if (parsed.pdu_type != PduType::TRAP_V1) {
        parsed.generic_trap.reset();
        parsed.specific_trap.reset();
    }

    return make_result(std::move(parsed));
}

std::string generate_trap_id() {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string suffix(9, '0');
    for (auto& c : suffix) {
        c = kAlphabet[pick(engine)];
    }
    return "trap-" + std::to_string(to_unix_millis(std::chrono::system_clock::now())) + "-" +
           suffix;
}

std::string base64_encode(const Bytes& data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string pdu_display_name(PduType type) {
    switch (type) {
        case PduType::TRAP_V1: return "TrapV1";
        case PduType::TRAP_V2: return "TrapV2";
        case PduType::INFORM_REQUEST: return "Inform";
        default: return to_string(type);
    }
}

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
