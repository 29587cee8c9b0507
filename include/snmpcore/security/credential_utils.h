#pragma once

#include <snmpcore/result.h>
#include <snmpcore/types.h>

#include <string>
#include <vector>
#include <map>

namespace snmpcore {
namespace v1 {
namespace security {

/**
 * Strength rating of a community string
 */
enum class CredentialStrength : uint8_t {
    WEAK,
    MODERATE,
    STRONG
};

/**
 * Result of assessing a community string
 */
struct CommunityAssessment {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    CredentialStrength strength = CredentialStrength::WEAK;
};

/**
 * Result of checking a full credential set for insecure choices
 */
struct CredentialSecurityReport {
    bool secure = true;
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
};

/**
 * Helpers for handling credential material without exposing it.
 *
 * Nothing in this class returns or logs a raw community string or key.
 */
class SNMPCORE_API CredentialUtils {
public:
    static constexpr const char* REDACTED = "[REDACTED]";

    /**
     * Compute an opaque fingerprint identifying a credential combination
     * for one device. The input is the lowercase host, version, port and the
     * length plus a 32-bit checksum of each secret; the output is the
     * hex-encoded SHA-256 of that string truncated to 16 characters.
     * @return fingerprint or CRYPTO failure mapped to INTERNAL_ERROR
     */
    static Result<std::string> credential_fingerprint(const std::string& host,
                                                      SnmpVersion version,
                                                      uint16_t port,
                                                      const Credentials& credentials);

    /**
     * Replace values of community / password / secret / token / key fields
     * in free text (JSON, key=value and key: value forms) with [REDACTED].
     */
    static std::string redact_sensitive_data(const std::string& text);

    /**
     * Validate a community string and rate its strength
     */
    static CommunityAssessment assess_community_strength(const std::string& community);

    /**
     * Check a credential set for insecure settings
     */
    static CredentialSecurityReport validate_credential_security(SnmpVersion version,
                                                                 const Credentials& credentials,
                                                                 Duration timeout,
                                                                 uint32_t retries);

    /**
     * Build a loggable error message: the message is redacted and each
     * context value whose key names a secret is replaced.
     */
    static std::string safe_error_message(const std::string& message,
                                          const std::map<std::string, std::string>& context = {});

    /**
     * Describe a credential set without any secret ("v2c community=[REDACTED]")
     */
    static std::string safe_description(SnmpVersion version, const Credentials& credentials);

    /**
     * Generate a random community string of the given length from
     * [A-Za-z0-9_-] using the OpenSSL CSPRNG.
     */
    static Result<std::string> generate_secure_community(size_t length = 12);

    static const char* strength_to_string(CredentialStrength strength);

private:
    static uint32_t checksum(const std::string& value);
    static bool is_sensitive_key(const std::string& key);
};

}  // namespace security
}  // namespace v1
}  // namespace snmpcore
