#pragma once

#include <snmpcore/config.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace trap {

/**
 * Allow-list of notification sources.
 *
 * Each rule is either an exact address ("192.0.2.7", "fe80::1") or an IPv4
 * CIDR block ("10.0.0.0/8"). An empty list allows every source. IPv4-mapped
 * IPv6 sources ("::ffff:10.1.2.3") are matched as their IPv4 address.
 * CIDR blocks apply to IPv4 only; IPv6 sources match exact rules only.
 */
class SNMPCORE_API SourceFilter {
public:
    SourceFilter() = default;
    explicit SourceFilter(const std::vector<std::string>& rules);

    bool allows(const std::string& address) const;

    bool empty() const { return rules_.empty() && rejected_.empty(); }

    /**
     * Rules as given, trimmed, with blank entries removed
     */
    std::vector<std::string> rules() const;

    /**
     * Rules that could not be parsed and never match
     */
    const std::vector<std::string>& rejected_rules() const { return rejected_; }

    /**
     * Dotted-quad to host-order integer; nullopt if not a valid IPv4 address
     */
    static std::optional<uint32_t> ipv4_to_uint(const std::string& address);

private:
    struct Rule {
        std::string text;
        bool is_cidr = false;
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    std::vector<Rule> rules_;
    std::vector<std::string> rejected_;
};

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
