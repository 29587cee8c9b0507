#include <snmpcore/security/input_validator.h>
#include <snmpcore/types.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace snmpcore {
namespace v1 {
namespace security {

namespace {

const char* const kValidRootOids[] = {"1.0", "1.1", "1.2", "1.3", "2.1"};

const std::regex& numeric_oid_pattern() {
    static const std::regex pattern(R"(^[0-9]+(\.[0-9]+)*$)");
    return pattern;
}

const std::regex& ipv4_pattern() {
    static const std::regex pattern(R"(^(\d{1,3}\.){3}\d{1,3}$)");
    return pattern;
}

const std::regex& ipv6_pattern() {
    static const std::regex pattern(R"(^([0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}$)");
    return pattern;
}

const std::regex& hostname_pattern() {
    static const std::regex pattern(
        R"(^[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(\.[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$)");
    return pattern;
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream stream(value);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

}  // namespace

Result<void> InputValidator::validate_oid(const std::string& raw_oid) {
    const std::string oid = trim_whitespace(raw_oid);

    if (oid.empty()) {
        return make_error<void>(SNMPError::INVALID_OID, "OID must be a non-empty string");
    }

    if (!std::regex_match(oid, numeric_oid_pattern())) {
        return make_error<void>(SNMPError::INVALID_OID,
                                "OID must be in numeric format (e.g., 1.3.6.1.2.1.1.1.0)");
    }

    auto parts = split(oid, '.');
    if (parts.size() < 2) {
        return make_error<void>(SNMPError::INVALID_OID, "OID must have at least 2 components");
    }

    const std::string root = parts[0] + "." + parts[1];
    bool valid_root = std::any_of(std::begin(kValidRootOids), std::end(kValidRootOids),
                                  [&root](const char* r) { return root == r; });
    if (!valid_root) {
        return make_error<void>(SNMPError::INVALID_OID,
                                "OID must start with a valid root (1.0, 1.1, 1.2, 1.3, 2.1)");
    }

    if (oid.size() > MAX_OID_LENGTH) {
        return make_error<void>(SNMPError::INVALID_OID, "OID too long (maximum 255 characters)");
    }

    for (const auto& part : parts) {
        // Any component longer than 10 digits exceeds 2^32 - 1
        if (part.size() > 10 || std::stoull(part) > 4294967295ULL) {
            return make_error<void>(SNMPError::INVALID_OID, "Invalid OID component: " + part);
        }
    }

    return make_result();
}

Result<void> InputValidator::validate_oids(const std::vector<std::string>& oids) {
    if (oids.empty()) {
        return make_error<void>(SNMPError::INVALID_OID, "At least one OID must be provided");
    }
    if (oids.size() > MAX_OIDS_PER_REQUEST) {
        return make_error<void>(SNMPError::INVALID_OID, "Too many OIDs (maximum 100 per request)");
    }

    std::unordered_set<std::string> seen;
    std::vector<std::string> errors;

    for (size_t i = 0; i < oids.size(); ++i) {
        const auto& oid = oids[i];
        if (!seen.insert(oid).second) {
            errors.push_back("Duplicate OID at index " + std::to_string(i) + ": " + oid);
            continue;
        }
        auto result = validate_oid(oid);
        if (!result) {
            errors.push_back("Invalid OID at index " + std::to_string(i) + ": " +
                             result.error_message());
        }
    }

    if (!errors.empty()) {
        std::ostringstream oss;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) {
                oss << "; ";
            }
            oss << errors[i];
        }
        return make_error<void>(SNMPError::INVALID_OID, oss.str());
    }

    return make_result();
}

Result<void> InputValidator::validate_host(const std::string& raw_host, const HostPolicy& policy) {
    const std::string host = to_lower_ascii(trim_whitespace(raw_host));

    if (host.empty()) {
        return make_error<void>(SNMPError::INVALID_HOST, "Host must be a non-empty string");
    }
    if (host.size() > MAX_HOST_LENGTH) {
        return make_error<void>(SNMPError::INVALID_HOST,
                                "Hostname too long (maximum 253 characters)");
    }

    static const char* const malicious[] = {
        "file://", "ftp://", "data:", "javascript:", "vbscript:", "@"
    };
    for (const char* pattern : malicious) {
        if (host.find(pattern) != std::string::npos) {
            return make_error<void>(SNMPError::INVALID_HOST,
                                    "Host contains potentially malicious pattern");
        }
    }

    if (!policy.allow_loopback &&
        (host.find("localhost") != std::string::npos ||
         host.find("127.0.0.1") != std::string::npos ||
         host.find("::1") != std::string::npos)) {
        return make_error<void>(SNMPError::INVALID_HOST, "Loopback hosts are not allowed");
    }

    if (std::regex_match(host, ipv4_pattern())) {
        for (const auto& octet : split(host, '.')) {
            if (std::stoi(octet) > 255) {
                return make_error<void>(SNMPError::INVALID_HOST, "Invalid IPv4 address format");
            }
        }
        if (!policy.allow_private_addresses && is_private_ipv4(host)) {
            return make_error<void>(SNMPError::INVALID_HOST,
                                    "Private/reserved IP addresses not allowed");
        }
        return make_result();
    }

    if (host.find(':') != std::string::npos) {
        if (host == "::1" && policy.allow_loopback) {
            return make_result();
        }
        if (!std::regex_match(host, ipv6_pattern())) {
            return make_error<void>(SNMPError::INVALID_HOST, "Invalid IPv6 address format");
        }
        return make_result();
    }

    if (!std::regex_match(host, hostname_pattern())) {
        return make_error<void>(SNMPError::INVALID_HOST, "Invalid hostname format");
    }

    return make_result();
}

Result<void> InputValidator::validate_community(const std::string& community) {
    if (community.empty()) {
        return make_error<void>(SNMPError::INVALID_COMMUNITY,
                                "Community string must be a non-empty string");
    }
    if (community.size() > 32) {
        return make_error<void>(SNMPError::INVALID_COMMUNITY,
                                "Community string must be between 1 and 32 characters");
    }
    bool valid_chars = std::all_of(community.begin(), community.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
    if (!valid_chars) {
        return make_error<void>(SNMPError::INVALID_COMMUNITY,
                                "Community string contains invalid characters");
    }
    return make_result();
}

Result<void> InputValidator::validate_port(uint32_t port) {
    if (port < 1 || port > 65535) {
        return make_error<void>(SNMPError::INVALID_PORT, "Port must be between 1 and 65535");
    }
    return make_result();
}

Result<void> InputValidator::validate_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() < 1000 || timeout.count() > 60000) {
        return make_error<void>(SNMPError::INVALID_TIMEOUT,
                                "Timeout must be between 1000ms and 60000ms");
    }
    return make_result();
}

Result<void> InputValidator::validate_retries(uint32_t retries) {
    if (retries > 10) {
        return make_error<void>(SNMPError::INVALID_RETRIES, "Retries must be between 0 and 10");
    }
    return make_result();
}

Result<void> InputValidator::validate_max_varbinds(uint32_t max_varbinds) {
    if (max_varbinds < 1 || max_varbinds > 10000) {
        return make_error<void>(SNMPError::INVALID_MAX_VARBINDS,
                                "Max varbinds must be between 1 and 10000");
    }
    return make_result();
}

bool InputValidator::is_ipv4_literal(const std::string& host) {
    if (!std::regex_match(host, ipv4_pattern())) {
        return false;
    }
    for (const auto& octet : split(host, '.')) {
        if (std::stoi(octet) > 255) {
            return false;
        }
    }
    return true;
}

bool InputValidator::is_private_ipv4(const std::string& address) {
    static const std::regex private_patterns[] = {
        std::regex(R"(^127\.)"),
        std::regex(R"(^10\.)"),
        std::regex(R"(^192\.168\.)"),
        std::regex(R"(^172\.(1[6-9]|2\d|3[01])\.)"),
        std::regex(R"(^169\.254\.)"),
        std::regex(R"(^224\.)"),
        std::regex(R"(^0\.)"),
        std::regex(R"(^255\.)")
    };
    for (const auto& pattern : private_patterns) {
        if (std::regex_search(address, pattern)) {
            return true;
        }
    }
    return false;
}

}  // namespace security
}  // namespace v1
}  // namespace snmpcore
