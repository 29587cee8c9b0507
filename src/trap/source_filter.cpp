#include <snmpcore/trap/source_filter.h>
#include <snmpcore/types.h>

#include <cctype>

namespace snmpcore {
namespace v1 {
namespace trap {

namespace {

const std::string kMappedPrefix = "::ffff:";

std::string unmap_ipv4(const std::string& address) {
    if (address.size() > kMappedPrefix.size() &&
        to_lower_ascii(address.substr(0, kMappedPrefix.size())) == kMappedPrefix) {
        std::string tail = address.substr(kMappedPrefix.size());
        if (SourceFilter::ipv4_to_uint(tail)) {
            return tail;
        }
    }
    return address;
}

}  // namespace

std::optional<uint32_t> SourceFilter::ipv4_to_uint(const std::string& address) {
    uint32_t result = 0;
    int octets = 0;
    size_t pos = 0;

    while (octets < 4) {
        if (pos >= address.size() || !std::isdigit(static_cast<unsigned char>(address[pos]))) {
            return std::nullopt;
        }
        uint32_t octet = 0;
        size_t digits = 0;
        while (pos < address.size() && std::isdigit(static_cast<unsigned char>(address[pos]))) {
            octet = octet * 10 + static_cast<uint32_t>(address[pos] - '0');
            if (++digits > 3 || octet > 255) {
                return std::nullopt;
            }
            ++pos;
        }
        result = (result << 8) | octet;
        ++octets;

        if (octets < 4) {
            if (pos >= address.size() || address[pos] != '.') {
                return std::nullopt;
            }
            ++pos;
        }
    }

    if (pos != address.size()) {
        return std::nullopt;
    }
    return result;
}

SourceFilter::SourceFilter(const std::vector<std::string>& rules) {
    for (const auto& raw : rules) {
        std::string text = trim_whitespace(raw);
        if (text.empty()) {
            continue;
        }

        Rule rule;
        rule.text = text;

        auto slash = text.find('/');
        if (slash == std::string::npos) {
            rules_.push_back(std::move(rule));
            continue;
        }

        auto base = ipv4_to_uint(text.substr(0, slash));
        std::string prefix_text = text.substr(slash + 1);
        bool prefix_ok = !prefix_text.empty() && prefix_text.size() <= 2;
        for (char c : prefix_text) {
            prefix_ok = prefix_ok && std::isdigit(static_cast<unsigned char>(c));
        }
        int prefix = prefix_ok ? std::stoi(prefix_text) : -1;

        if (!base || prefix < 0 || prefix > 32) {
            rejected_.push_back(text);
            continue;
        }

        rule.is_cidr = true;
        rule.mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
        rule.network = *base & rule.mask;
        rules_.push_back(std::move(rule));
    }
}

bool SourceFilter::allows(const std::string& address) const {
    if (rules_.empty() && rejected_.empty()) {
        return true;
    }

    const std::string source = unmap_ipv4(address);
    const auto source_v4 = ipv4_to_uint(source);

    for (const auto& rule : rules_) {
        if (rule.is_cidr) {
            if (source_v4 && (*source_v4 & rule.mask) == rule.network) {
                return true;
            }
        } else if (rule.text == source || rule.text == address) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> SourceFilter::rules() const {
    std::vector<std::string> out;
    out.reserve(rules_.size() + rejected_.size());
    for (const auto& rule : rules_) {
        out.push_back(rule.text);
    }
    out.insert(out.end(), rejected_.begin(), rejected_.end());
    return out;
}

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
