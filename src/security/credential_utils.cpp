#include <snmpcore/security/credential_utils.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>

namespace snmpcore {
namespace v1 {
namespace security {

namespace {

const char* const kCommonDefaults[] = {
    "public", "private", "read", "write", "admin", "snmp", "community"
};

const char* const kCommonWords[] = {
    "password", "secret", "123", "test", "default", "guest"
};

const char kCommunityAlphabet[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-";

std::string to_hex(const unsigned char* data, size_t length) {
    std::ostringstream oss;
    for (size_t i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool is_community_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

}  // namespace

Result<std::string> CredentialUtils::credential_fingerprint(const std::string& host,
                                                            SnmpVersion version,
                                                            uint16_t port,
                                                            const Credentials& credentials) {
    std::ostringstream input;
    input << to_lower_ascii(host) << ':' << to_string(version) << ':' << port
          << ':' << credentials.community.size() << ':' << checksum(credentials.community);

    if (version == SnmpVersion::V3) {
        input << ':' << credentials.username
              << ':' << static_cast<int>(credentials.auth_protocol)
              << ':' << credentials.auth_key.size() << ':' << checksum(credentials.auth_key)
              << ':' << static_cast<int>(credentials.priv_protocol)
              << ':' << credentials.priv_key.size() << ':' << checksum(credentials.priv_key);
    }

    const std::string data = input.str();

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return make_error<std::string>(SNMPError::INTERNAL_ERROR,
                                       "Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    int result = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    if (result == 1) {
        result = EVP_DigestUpdate(ctx, data.data(), data.size());
    }
    if (result == 1) {
        result = EVP_DigestFinal_ex(ctx, digest, &digest_len);
    }

    EVP_MD_CTX_free(ctx);

    if (result != 1) {
        return make_error<std::string>(SNMPError::INTERNAL_ERROR,
                                       "Failed to compute credential fingerprint");
    }

    return make_result(to_hex(digest, digest_len).substr(0, 16));
}

std::string CredentialUtils::redact_sensitive_data(const std::string& text) {
    static const std::regex json_pattern(
        R"re(("(?:community|password|secret|token|key|authKey|privKey|passphrase)"\s*:\s*")[^"]+("))re",
        std::regex::icase);
    static const std::regex param_pattern(
        R"(\b((?:community|password|secret|token|authKey|privKey)=)[^&\s]+)",
        std::regex::icase);
    static const std::regex colon_pattern(
        R"(\b((?:community|password|secret|authKey|privKey):\s*)[^\s,}"]+)",
        std::regex::icase);

    std::string redacted = std::regex_replace(text, json_pattern, "$1[REDACTED]$2");
    redacted = std::regex_replace(redacted, param_pattern, "$1[REDACTED]");
    redacted = std::regex_replace(redacted, colon_pattern, "$1[REDACTED]");
    return redacted;
}

CommunityAssessment CredentialUtils::assess_community_strength(const std::string& community) {
    CommunityAssessment assessment;

    if (community.empty()) {
        assessment.errors.push_back("Community string must be a non-empty string");
        return assessment;
    }

    if (community.size() > 32) {
        assessment.errors.push_back("Community string cannot exceed 32 characters");
    }

    if (!std::all_of(community.begin(), community.end(), is_community_char)) {
        assessment.errors.push_back(
            "Community string can only contain alphanumeric characters, underscores, and hyphens");
    }

    const std::string lower = to_lower_ascii(community);
    for (const char* def : kCommonDefaults) {
        if (lower == def) {
            assessment.warnings.push_back(
                "Using common default community string is not recommended for security");
            break;
        }
    }
    for (const char* word : kCommonWords) {
        if (lower.find(word) != std::string::npos) {
            assessment.warnings.push_back(
                "Community string contains common words that may be easily guessed");
            break;
        }
    }

    if (community.size() >= 8) {
        bool has_digits = std::any_of(community.begin(), community.end(),
                                      [](unsigned char c) { return std::isdigit(c); });
        bool has_letters = std::any_of(community.begin(), community.end(),
                                       [](unsigned char c) { return std::isalpha(c); });
        bool has_special = community.find_first_of("_-") != std::string::npos;

        if (has_digits && has_letters && has_special) {
            assessment.strength = CredentialStrength::STRONG;
        } else if ((has_digits && has_letters) || has_special) {
            assessment.strength = CredentialStrength::MODERATE;
        }
    } else if (community.size() >= 4) {
        assessment.strength = CredentialStrength::MODERATE;
    }

    assessment.valid = assessment.errors.empty();
    return assessment;
}

CredentialSecurityReport CredentialUtils::validate_credential_security(SnmpVersion version,
                                                                       const Credentials& credentials,
                                                                       Duration timeout,
                                                                       uint32_t retries) {
    CredentialSecurityReport report;

    if (version != SnmpVersion::V3 && !credentials.community.empty()) {
        auto assessment = assess_community_strength(credentials.community);
        report.issues.insert(report.issues.end(),
                             assessment.errors.begin(), assessment.errors.end());
        report.recommendations.insert(report.recommendations.end(),
                                      assessment.warnings.begin(), assessment.warnings.end());
    }

    if (version == SnmpVersion::V1) {
        report.recommendations.push_back("SNMPv1 is less secure than v2c; consider upgrading");
    }

    if (version == SnmpVersion::V3) {
        if (credentials.username.empty()) {
            report.issues.push_back("SNMPv3 requires a security name");
        }
        if (credentials.auth_protocol == AuthProtocol::NONE) {
            report.recommendations.push_back("SNMPv3 without authentication (noAuthNoPriv)");
        } else if (credentials.priv_protocol == PrivProtocol::NONE) {
            report.recommendations.push_back("SNMPv3 without privacy sends data in clear text");
        }
    }

    if (timeout > std::chrono::milliseconds(30000)) {
        report.recommendations.push_back("Long timeout values may impact performance");
    }
    if (retries > 5) {
        report.recommendations.push_back("High retry counts may cause device stress");
    }

    report.secure = report.issues.empty();
    return report;
}

std::string CredentialUtils::safe_error_message(const std::string& message,
                                                const std::map<std::string, std::string>& context) {
    std::string safe = redact_sensitive_data(message);

    if (!context.empty()) {
        std::ostringstream oss;
        oss << " Context: {";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) {
                oss << ",";
            }
            first = false;
            oss << "\"" << key << "\":\""
                << (is_sensitive_key(key) ? std::string(REDACTED) : redact_sensitive_data(value))
                << "\"";
        }
        oss << "}";
        safe += oss.str();
    }

    return safe;
}

std::string CredentialUtils::safe_description(SnmpVersion version, const Credentials& credentials) {
    std::ostringstream oss;
    oss << to_string(version);
    if (version == SnmpVersion::V3) {
        oss << " user=" << credentials.username
            << " auth=" << (credentials.auth_protocol == AuthProtocol::NONE ? "none" : REDACTED)
            << " priv=" << (credentials.priv_protocol == PrivProtocol::NONE ? "none" : REDACTED);
    } else {
        oss << " community=" << REDACTED;
    }
    return oss.str();
}

Result<std::string> CredentialUtils::generate_secure_community(size_t length) {
    if (length == 0 || length > 32) {
        return make_error<std::string>(SNMPError::INVALID_PARAMETER,
                                       "Community length must be between 1 and 32");
    }

    std::vector<unsigned char> random_bytes(length);
    if (RAND_bytes(random_bytes.data(), static_cast<int>(length)) != 1) {
        return make_error<std::string>(SNMPError::INTERNAL_ERROR,
                                       "Random generation failed");
    }

    const size_t alphabet_size = sizeof(kCommunityAlphabet) - 1;
    std::string community;
    community.reserve(length);
    for (unsigned char b : random_bytes) {
        community.push_back(kCommunityAlphabet[b % alphabet_size]);
    }
    return make_result(std::move(community));
}

const char* CredentialUtils::strength_to_string(CredentialStrength strength) {
    switch (strength) {
        case CredentialStrength::WEAK: return "weak";
        case CredentialStrength::MODERATE: return "moderate";
        case CredentialStrength::STRONG: return "strong";
    }
    return "unknown";
}

uint32_t CredentialUtils::checksum(const std::string& value) {
    int32_t hash = 0;
    for (char c : value) {
        hash = static_cast<int32_t>(static_cast<uint32_t>(hash) * 31u +
                                    static_cast<unsigned char>(c));
    }
    return static_cast<uint32_t>(std::abs(static_cast<int64_t>(hash)));
}

bool CredentialUtils::is_sensitive_key(const std::string& key) {
    static const char* const sensitive[] = {
        "community", "password", "secret", "key", "token", "auth",
        "authkey", "privkey", "passphrase", "credentials"
    };
    const std::string lower = to_lower_ascii(key);
    for (const char* s : sensitive) {
        if (lower == s) {
            return true;
        }
    }
    return false;
}

}  // namespace security
}  // namespace v1
}  // namespace snmpcore
