#pragma once

#include <array>
#include <string>
#include <boost/asio/ip/address.hpp>

namespace streamguard {

// A parsed network prefix. IPv4 ranges are stored as IPv4-mapped IPv6
// (::ffff:a.b.c.d/96+n) so both families share one byte comparison; a range
// never matches an address of the other family.
class CidrRange {
public:
    using Bytes = std::array<unsigned char, 16>;

    /**
     * Parses "a.b.c.d/n", "x::y/n" or a bare address. A bare address becomes
     * a host-only range (/32 or /128). Host bits below the prefix are cleared.
     * @throws std::invalid_argument on a malformed address or prefix length.
     */
    static CidrRange parse(const std::string& text);

    // Converts any address to the 16-byte normalized form.
    static Bytes normalize(const boost::asio::ip::address& addr);

    bool contains(const boost::asio::ip::address& addr) const;

    // Prefix length in the 128-bit normalized space.
    int prefix_length() const { return prefix_; }
    bool is_v4() const { return v4_; }

    // Canonical text form, e.g. "10.0.0.0/24".
    std::string to_string() const;

private:
    CidrRange(const Bytes& network, int prefix, bool v4);

    Bytes network_;
    int prefix_;
    bool v4_;
};

}
