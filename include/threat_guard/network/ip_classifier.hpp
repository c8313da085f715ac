#pragma once

#include "../common/types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace threat_guard {
namespace network {

enum class AddressFamily {
    IPV4,
    IPV6,
    INVALID
};

std::string to_string(AddressFamily family);

struct IPClassification {
    bool is_valid = false;
    AddressFamily address_family = AddressFamily::INVALID;
    bool is_private = false;
    bool is_reserved = false;
    bool is_loopback = false;
    bool is_multicast = false;
    bool is_link_local = false;
    bool is_cloud_metadata = false;
    common::RiskLevel risk_level = common::RiskLevel::HIGH;
    bool allowed_for_outbound = false;
    std::string reason;
};

struct UrlAuthority {
    std::string scheme;
    std::string host;
    std::optional<uint16_t> port;
};

using IPv4Bytes = std::array<uint8_t, 4>;
using IPv6Bytes = std::array<uint8_t, 16>;

std::optional<IPv4Bytes> parseIPv4(const std::string& text);
std::optional<IPv6Bytes> parseIPv6(const std::string& text);

// Splits scheme://[userinfo@]host[:port][/...]. IPv6 brackets are stripped
// and the host is lower-cased.
std::optional<UrlAuthority> parseUrlAuthority(const std::string& url);

// Pure classification of IP literals. Never resolves names and never throws;
// malformed input is reported as INVALID with HIGH risk.
class IPClassifier {
public:
    IPClassification classify(const std::string& address) const;

    // Empty when the URL does not parse or its host is a domain name.
    std::optional<IPClassification> classifyUrlHost(const std::string& url) const;

    bool isSafeForOutbound(const std::string& address) const;

private:
    static IPClassification invalidResult();
    static void classifyV4(const IPv4Bytes& addr, IPClassification& result);
    static void classifyV6(const IPv6Bytes& addr, IPClassification& result);
    static void finalize(IPClassification& result);
};

}}
