#include "threat_guard/network/ip_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace threat_guard {
namespace network {

namespace {

struct CidrV4 {
    IPv4Bytes base;
    int prefix;
};

struct CidrV6 {
    IPv6Bytes base;
    int prefix;
};

// RFC 1918
const std::vector<CidrV4> PRIVATE_V4 = {
    {{10, 0, 0, 0}, 8},
    {{172, 16, 0, 0}, 12},
    {{192, 168, 0, 0}, 16}
};

// RFC 5735 special use
const std::vector<CidrV4> RESERVED_V4 = {
    {{0, 0, 0, 0}, 8},
    {{127, 0, 0, 0}, 8},
    {{224, 0, 0, 0}, 4},
    {{240, 0, 0, 0}, 4},
    {{255, 255, 255, 255}, 32}
};

const CidrV4 LOOPBACK_V4 = {{127, 0, 0, 0}, 8};
const CidrV4 MULTICAST_V4 = {{224, 0, 0, 0}, 4};
const CidrV4 LINK_LOCAL_V4 = {{169, 254, 0, 0}, 16};

const std::vector<CidrV4> CLOUD_METADATA_V4 = {
    {{169, 254, 169, 254}, 32},
    {{169, 254, 169, 253}, 32},
    {{169, 254, 169, 250}, 32},
    {{100, 100, 100, 200}, 32}
};

// RFC 4193
const std::vector<CidrV6> PRIVATE_V6 = {
    {{0xfc}, 7}
};

// RFC 4291 special use
const std::vector<CidrV6> RESERVED_V6 = {
    {{}, 128},
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}, 128},
    {{0xff}, 8},
    {{0xfe, 0x80}, 10},
    {{0x20, 0x01, 0x0d, 0xb8}, 32},
    {{0x20, 0x01, 0x00, 0x00}, 32},
    {{0x20, 0x02}, 16},
    {{0xfc}, 7},
    {{0xfe, 0xc0}, 10}
};

const CidrV6 LOOPBACK_V6 = {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}, 128};
const CidrV6 MULTICAST_V6 = {{0xff}, 8};
const CidrV6 LINK_LOCAL_V6 = {{0xfe, 0x80}, 10};

const std::vector<CidrV6> CLOUD_METADATA_V6 = {
    {{0xfd, 0x00, 0x0e, 0xc2, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x02, 0x54}, 128}
};

template<size_t N>
bool prefixMatches(const std::array<uint8_t, N>& addr, const std::array<uint8_t, N>& base, int prefix) {
    int full_bytes = prefix / 8;
    int rest_bits = prefix % 8;

    for (int i = 0; i < full_bytes; ++i) {
        if (addr[i] != base[i]) return false;
    }
    if (rest_bits == 0) return true;

    uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rest_bits));
    return (addr[full_bytes] & mask) == (base[full_bytes] & mask);
}

bool inRange(const IPv4Bytes& addr, const CidrV4& range) {
    return prefixMatches(addr, range.base, range.prefix);
}

bool inRange(const IPv6Bytes& addr, const CidrV6& range) {
    return prefixMatches(addr, range.base, range.prefix);
}

template<typename Addr, typename Range>
bool inAny(const Addr& addr, const std::vector<Range>& ranges) {
    return std::any_of(ranges.begin(), ranges.end(),
                       [&addr](const Range& range) { return inRange(addr, range); });
}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

std::vector<std::string> split(const std::string& text, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool parseHexGroup(const std::string& group, uint16_t& value) {
    if (group.empty() || group.size() > 4) return false;
    value = 0;
    for (char c : group) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc)) return false;
        int digit = std::isdigit(uc) ? uc - '0' : std::tolower(uc) - 'a' + 10;
        value = static_cast<uint16_t>((value << 4) | digit);
    }
    return true;
}

// Parses colon-separated groups; a dotted IPv4 tail is allowed in the last
// position when allow_v4_tail is set and counts as two groups.
bool parseGroupList(const std::string& text, bool allow_v4_tail, std::vector<uint16_t>& out) {
    if (text.empty()) return true;

    auto groups = split(text, ':');
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& group = groups[i];
        bool last = (i + 1 == groups.size());

        if (last && allow_v4_tail && group.find('.') != std::string::npos) {
            auto v4 = parseIPv4(group);
            if (!v4) return false;
            out.push_back(static_cast<uint16_t>(((*v4)[0] << 8) | (*v4)[1]));
            out.push_back(static_cast<uint16_t>(((*v4)[2] << 8) | (*v4)[3]));
            continue;
        }

        uint16_t value = 0;
        if (!parseHexGroup(group, value)) return false;
        out.push_back(value);
    }
    return true;
}

bool isIPv4Mapped(const IPv6Bytes& addr) {
    for (int i = 0; i < 10; ++i) {
        if (addr[i] != 0) return false;
    }
    return addr[10] == 0xff && addr[11] == 0xff;
}

// Deprecated IPv4-compatible form ::a.b.c.d (::/96).
bool isIPv4Compatible(const IPv6Bytes& addr) {
    for (int i = 0; i < 12; ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

}

std::string to_string(AddressFamily family) {
    switch (family) {
        case AddressFamily::IPV4: return "ipv4";
        case AddressFamily::IPV6: return "ipv6";
        default: return "invalid";
    }
}

std::optional<IPv4Bytes> parseIPv4(const std::string& text) {
    auto parts = split(text, '.');
    if (parts.size() != 4) return std::nullopt;

    IPv4Bytes bytes{};
    for (size_t i = 0; i < 4; ++i) {
        const auto& octet = parts[i];
        if (octet.empty() || octet.size() > 3) return std::nullopt;
        if (!std::all_of(octet.begin(), octet.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        if (octet.size() > 1 && octet[0] == '0') return std::nullopt;

        int value = std::stoi(octet);
        if (value > 255) return std::nullopt;
        bytes[i] = static_cast<uint8_t>(value);
    }
    return bytes;
}

std::optional<IPv6Bytes> parseIPv6(const std::string& text) {
    if (text.find(':') == std::string::npos) return std::nullopt;

    std::vector<uint16_t> head;
    std::vector<uint16_t> tail;
    size_t gap = text.find("::");

    if (gap == std::string::npos) {
        if (!parseGroupList(text, true, head) || head.size() != 8) return std::nullopt;
    } else {
        if (text.find("::", gap + 1) != std::string::npos) return std::nullopt;

        std::string left = text.substr(0, gap);
        std::string right = text.substr(gap + 2);
        if (!parseGroupList(left, false, head)) return std::nullopt;
        if (!parseGroupList(right, true, tail)) return std::nullopt;
        // "::" stands for at least one zero group.
        if (head.size() + tail.size() >= 8) return std::nullopt;
    }

    std::array<uint16_t, 8> groups{};
    std::copy(head.begin(), head.end(), groups.begin());
    std::copy(tail.begin(), tail.end(), groups.end() - tail.size());

    IPv6Bytes bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[i * 2] = static_cast<uint8_t>(groups[i] >> 8);
        bytes[i * 2 + 1] = static_cast<uint8_t>(groups[i] & 0xFF);
    }
    return bytes;
}

std::optional<UrlAuthority> parseUrlAuthority(const std::string& url) {
    std::string input = trim(url);

    size_t scheme_end = input.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;

    std::string scheme = input.substr(0, scheme_end);
    if (!std::isalpha(static_cast<unsigned char>(scheme[0]))) return std::nullopt;
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = input.find_first_of("/?#\\", authority_start);
    std::string authority = input.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) return std::nullopt;

    UrlAuthority result;
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    result.scheme = scheme;

    std::string port_text;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        result.host = authority.substr(1, close - 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') return std::nullopt;
            port_text = rest.substr(1);
        }
    } else {
        size_t colon = authority.find(':');
        result.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (result.host.empty()) return std::nullopt;

    if (!port_text.empty()) {
        if (port_text.size() > 5 || !std::all_of(port_text.begin(), port_text.end(),
                [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        int port = std::stoi(port_text);
        if (port > 65535) return std::nullopt;
        result.port = static_cast<uint16_t>(port);
    }

    std::transform(result.host.begin(), result.host.end(), result.host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

IPClassification IPClassifier::classify(const std::string& address) const {
    std::string candidate = trim(address);

    if (auto v4 = parseIPv4(candidate)) {
        IPClassification result;
        result.is_valid = true;
        result.address_family = AddressFamily::IPV4;
        classifyV4(*v4, result);
        finalize(result);
        return result;
    }

    if (auto v6 = parseIPv6(candidate)) {
        IPClassification result;
        result.is_valid = true;
        result.address_family = AddressFamily::IPV6;
        classifyV6(*v6, result);
        finalize(result);
        return result;
    }

    return invalidResult();
}

std::optional<IPClassification> IPClassifier::classifyUrlHost(const std::string& url) const {
    auto authority = parseUrlAuthority(url);
    if (!authority) return std::nullopt;

    const auto& host = authority->host;
    if (!parseIPv4(host) && !parseIPv6(host)) {
        return std::nullopt;
    }
    return classify(host);
}

bool IPClassifier::isSafeForOutbound(const std::string& address) const {
    auto result = classify(address);
    return result.is_valid && result.allowed_for_outbound;
}

IPClassification IPClassifier::invalidResult() {
    IPClassification result;
    result.is_valid = false;
    result.address_family = AddressFamily::INVALID;
    result.risk_level = common::RiskLevel::HIGH;
    result.allowed_for_outbound = false;
    result.reason = "Invalid IP address format";
    return result;
}

void IPClassifier::classifyV4(const IPv4Bytes& addr, IPClassification& result) {
    result.is_private = result.is_private || inAny(addr, PRIVATE_V4);
    result.is_reserved = result.is_reserved || inAny(addr, RESERVED_V4);
    result.is_loopback = result.is_loopback || inRange(addr, LOOPBACK_V4);
    result.is_multicast = result.is_multicast || inRange(addr, MULTICAST_V4);
    result.is_link_local = result.is_link_local || inRange(addr, LINK_LOCAL_V4);
    result.is_cloud_metadata = result.is_cloud_metadata || inAny(addr, CLOUD_METADATA_V4);
}

void IPClassifier::classifyV6(const IPv6Bytes& addr, IPClassification& result) {
    result.is_private = inAny(addr, PRIVATE_V6);
    result.is_reserved = inAny(addr, RESERVED_V6);
    result.is_loopback = inRange(addr, LOOPBACK_V6);
    result.is_multicast = inRange(addr, MULTICAST_V6);
    result.is_link_local = inRange(addr, LINK_LOCAL_V6);
    result.is_cloud_metadata = inAny(addr, CLOUD_METADATA_V6);

    if (isIPv4Mapped(addr) || isIPv4Compatible(addr)) {
        IPv4Bytes embedded = {addr[12], addr[13], addr[14], addr[15]};
        classifyV4(embedded, result);
    }
}

void IPClassifier::finalize(IPClassification& result) {
    using common::RiskLevel;

    if (result.is_cloud_metadata || result.is_loopback) {
        result.risk_level = RiskLevel::CRITICAL;
    } else if (result.is_private || result.is_link_local) {
        result.risk_level = RiskLevel::HIGH;
    } else if (result.is_reserved || result.is_multicast) {
        result.risk_level = RiskLevel::MEDIUM;
    } else {
        result.risk_level = RiskLevel::LOW;
    }

    result.allowed_for_outbound = !(result.is_private || result.is_reserved || result.is_loopback ||
                                    result.is_multicast || result.is_link_local || result.is_cloud_metadata);

    if (result.is_cloud_metadata) {
        result.reason = "Cloud metadata endpoint - critical SSRF risk";
    } else if (result.is_loopback) {
        result.reason = "Loopback address - potential local service access";
    } else if (result.is_private) {
        result.reason = "Private network address - internal resource access risk";
    } else if (result.is_link_local) {
        result.reason = "Link-local address - local network access risk";
    } else if (result.is_reserved) {
        result.reason = "Reserved address range - special use IP";
    } else if (result.is_multicast) {
        result.reason = "Multicast address - group communication protocol";
    } else {
        result.reason = "Public IP address - low risk for SSRF";
    }
}

}}
