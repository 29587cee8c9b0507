#pragma once

#include <snmpcore/result.h>

#include <chrono>
#include <string>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace security {

/**
 * Host acceptance policy
 */
struct HostPolicy {
    bool allow_private_addresses = true;   // RFC 1918, link-local, multicast
    bool allow_loopback = false;           // localhost, 127.0.0.1, ::1
};

/**
 * Syntactic and range validation for every externally supplied value.
 *
 * Each check returns an empty Result on success or a validation error
 * code with a message describing the first problem found.
 */
class SNMPCORE_API InputValidator {
public:
    static constexpr size_t MAX_OID_LENGTH = 255;
    static constexpr size_t MAX_OIDS_PER_REQUEST = 100;
    static constexpr size_t MAX_HOST_LENGTH = 253;

    /**
     * Numeric dotted OID with at least two components under one of the
     * roots 1.0, 1.1, 1.2, 1.3 or 2.1; every component fits in 32 bits.
     */
    static Result<void> validate_oid(const std::string& oid);

    /**
     * 1..100 OIDs, no duplicates, each valid. The message lists every
     * offending index.
     */
    static Result<void> validate_oids(const std::vector<std::string>& oids);

    static Result<void> validate_host(const std::string& host,
                                      const HostPolicy& policy = HostPolicy{});

    static Result<void> validate_community(const std::string& community);

    static Result<void> validate_port(uint32_t port);

    static Result<void> validate_timeout(std::chrono::milliseconds timeout);

    static Result<void> validate_retries(uint32_t retries);

    static Result<void> validate_max_varbinds(uint32_t max_varbinds);

    static bool is_ipv4_literal(const std::string& host);

    static bool is_private_ipv4(const std::string& address);
};

}  // namespace security
}  // namespace v1
}  // namespace snmpcore
