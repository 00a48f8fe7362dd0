#include "ip_access_controller.hpp"

#include <algorithm>
#include <cctype>

namespace streamguard {

namespace ip = boost::asio::ip;

static std::string trim(boost::beast::string_view sv) {
    size_t b = 0, e = sv.size();
    while (b < e && std::isspace(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(sv[e - 1]))) --e;
    return std::string(sv.substr(b, e - b));
}

static bool parse_address(const std::string& text, ip::address& out) {
    boost::system::error_code ec;
    out = ip::make_address(trim(text), ec);
    return !ec;
}

std::vector<CidrRange> CidrAccessController::parse_list(const std::vector<std::string>& entries) {
    std::vector<CidrRange> ranges;
    ranges.reserve(entries.size());
    for (const auto& entry : entries) {
        if (trim(entry).empty()) continue;
        ranges.push_back(CidrRange::parse(entry));
    }
    return ranges;
}

CidrAccessController::CidrAccessController(const std::vector<std::string>& allowlist,
                                           const std::vector<std::string>& blocklist,
                                           bool enabled)
    : allowlist_(parse_list(allowlist))
    , blocklist_(parse_list(blocklist))
    , enabled_(enabled)
{}

bool CidrAccessController::is_blocked(const std::string& addr) const {
    if (!enabled_ || blocklist_.empty()) return false;

    ip::address parsed;
    if (!parse_address(addr, parsed)) {
        // Unparsable addresses are left to the allowlist decision.
        return false;
    }

    return std::any_of(blocklist_.begin(), blocklist_.end(),
                       [&](const CidrRange& r) { return r.contains(parsed); });
}

bool CidrAccessController::is_allowed(const std::string& addr) const {
    if (!enabled_) return true;
    if (allowlist_.empty()) return true;  // block-only mode

    ip::address parsed;
    if (!parse_address(addr, parsed)) return false;

    return std::any_of(allowlist_.begin(), allowlist_.end(),
                       [&](const CidrRange& r) { return r.contains(parsed); });
}

std::string strip_port(const std::string& host_port) {
    if (host_port.empty()) return host_port;

    // [v6]:port or [v6]
    if (host_port.front() == '[') {
        auto close = host_port.find(']');
        if (close == std::string::npos) return host_port;
        return host_port.substr(1, close - 1);
    }

    // Exactly one colon means host:port; more than one is a bare IPv6 address.
    auto first = host_port.find(':');
    if (first != std::string::npos && host_port.find(':', first + 1) == std::string::npos) {
        return host_port.substr(0, first);
    }
    return host_port;
}

std::string extract_client_address(const http::request_header<>& headers,
                                   const std::string& peer_addr) {
    auto cf = headers.find("CF-Connecting-IP");
    if (cf != headers.end()) {
        std::string v = trim(cf->value());
        if (!v.empty()) return v;
    }

    auto real = headers.find("X-Real-IP");
    if (real != headers.end()) {
        std::string v = trim(real->value());
        if (!v.empty()) return v;
    }

    auto xff = headers.find("X-Forwarded-For");
    if (xff != headers.end()) {
        auto value = xff->value();
        auto comma = value.find(',');
        std::string first_hop = trim(comma == boost::beast::string_view::npos ? value : value.substr(0, comma));
        if (!first_hop.empty()) return first_hop;
    }

    return strip_port(trim(peer_addr));
}

}
