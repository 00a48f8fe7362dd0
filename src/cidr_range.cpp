#include "cidr_range.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace streamguard {

namespace ip = boost::asio::ip;

static std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

CidrRange::CidrRange(const Bytes& network, int prefix, bool v4)
    : network_(network), prefix_(prefix), v4_(v4)
{
    // Clear host bits so contains() can compare whole bytes.
    for (int i = 0; i < 16; ++i) {
        int bits_left = prefix_ - i * 8;
        if (bits_left >= 8) continue;
        if (bits_left <= 0) {
            network_[i] = 0;
        } else {
            network_[i] &= static_cast<unsigned char>(0xFF << (8 - bits_left));
        }
    }
}

CidrRange::Bytes CidrRange::normalize(const ip::address& addr) {
    if (addr.is_v4()) {
        return ip::make_address_v6(ip::v4_mapped, addr.to_v4()).to_bytes();
    }
    return addr.to_v6().to_bytes();
}

CidrRange CidrRange::parse(const std::string& text) {
    std::string entry = trim(text);
    if (entry.empty()) {
        throw std::invalid_argument("empty entry");
    }

    std::string addr_part = entry;
    std::string prefix_part;
    auto slash = entry.find('/');
    if (slash != std::string::npos) {
        addr_part = entry.substr(0, slash);
        prefix_part = entry.substr(slash + 1);
        if (prefix_part.empty()) {
            throw std::invalid_argument("missing prefix length");
        }
    }

    boost::system::error_code ec;
    ip::address addr = ip::make_address(addr_part, ec);
    if (ec) {
        throw std::invalid_argument("invalid IP address");
    }

    // An IPv4-mapped IPv6 literal is treated as the IPv4 address it carries.
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        addr = ip::make_address_v4(ip::v4_mapped, addr.to_v6());
    }

    const bool v4 = addr.is_v4();
    const int max_prefix = v4 ? 32 : 128;
    int prefix = max_prefix;

    if (!prefix_part.empty()) {
        if (prefix_part.size() > 3 ||
            !std::all_of(prefix_part.begin(), prefix_part.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("invalid prefix length");
        }
        prefix = std::stoi(prefix_part);
        if (prefix > max_prefix) {
            throw std::invalid_argument("prefix length out of range");
        }
    }

    return CidrRange(normalize(addr), v4 ? prefix + 96 : prefix, v4);
}

bool CidrRange::contains(const ip::address& addr) const {
    // Ranges only match addresses of their own family; a mapped peer counts as IPv4.
    const bool candidate_v4 = addr.is_v4() || addr.to_v6().is_v4_mapped();
    if (candidate_v4 != v4_) return false;

    Bytes candidate = normalize(addr);

    int full_bytes = prefix_ / 8;
    for (int i = 0; i < full_bytes; ++i) {
        if (candidate[i] != network_[i]) return false;
    }

    int rem_bits = prefix_ % 8;
    if (rem_bits == 0) return true;

    auto mask = static_cast<unsigned char>(0xFF << (8 - rem_bits));
    return (candidate[full_bytes] & mask) == network_[full_bytes];
}

std::string CidrRange::to_string() const {
    ip::address_v6 v6(network_);
    if (v4_) {
        return ip::make_address_v4(ip::v4_mapped, v6).to_string() + "/" + std::to_string(prefix_ - 96);
    }
    return v6.to_string() + "/" + std::to_string(prefix_);
}

}
