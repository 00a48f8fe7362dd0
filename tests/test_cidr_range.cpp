#include <gtest/gtest.h>
#include "cidr_range.hpp"

using namespace streamguard;
namespace ip = boost::asio::ip;

TEST(CidrRangeTest, ParsesIpv4Prefix) {
    auto r = CidrRange::parse("10.0.0.0/24");
    EXPECT_TRUE(r.is_v4());
    EXPECT_EQ(r.to_string(), "10.0.0.0/24");
    EXPECT_TRUE(r.contains(ip::make_address("10.0.0.5")));
    EXPECT_TRUE(r.contains(ip::make_address("10.0.0.255")));
    EXPECT_FALSE(r.contains(ip::make_address("10.0.1.0")));
}

TEST(CidrRangeTest, ClearsHostBits) {
    EXPECT_EQ(CidrRange::parse("192.168.1.77/16").to_string(), "192.168.0.0/16");
}

TEST(CidrRangeTest, BareAddressIsHostRange) {
    auto v4 = CidrRange::parse("203.0.113.9");
    EXPECT_EQ(v4.to_string(), "203.0.113.9/32");
    EXPECT_TRUE(v4.contains(ip::make_address("203.0.113.9")));
    EXPECT_FALSE(v4.contains(ip::make_address("203.0.113.10")));

    auto v6 = CidrRange::parse("2001:db8::1");
    EXPECT_EQ(v6.prefix_length(), 128);
    EXPECT_TRUE(v6.contains(ip::make_address("2001:db8::1")));
    EXPECT_FALSE(v6.contains(ip::make_address("2001:db8::2")));
}

TEST(CidrRangeTest, Ipv6Prefix) {
    auto r = CidrRange::parse("2001:db8:abcd::/48");
    EXPECT_FALSE(r.is_v4());
    EXPECT_TRUE(r.contains(ip::make_address("2001:db8:abcd:12::1")));
    EXPECT_FALSE(r.contains(ip::make_address("2001:db8:abce::1")));
}

TEST(CidrRangeTest, FamiliesDoNotCrossMatch) {
    auto v4 = CidrRange::parse("0.0.0.0/0");
    EXPECT_TRUE(v4.contains(ip::make_address("8.8.8.8")));
    EXPECT_FALSE(v4.contains(ip::make_address("2001:db8::1")));

    auto v6 = CidrRange::parse("::/0");
    EXPECT_TRUE(v6.contains(ip::make_address("2001:db8::1")));
    EXPECT_FALSE(v6.contains(ip::make_address("10.0.0.5")));
    EXPECT_FALSE(v6.contains(ip::make_address("::ffff:10.0.0.5")));
    EXPECT_FALSE(CidrRange::parse("::/80").contains(ip::make_address("192.168.1.1")));

    // IPv4-mapped IPv6 peers are the IPv4 address they carry.
    EXPECT_TRUE(CidrRange::parse("10.0.0.0/8").contains(ip::make_address("::ffff:10.1.2.3")));
}

TEST(CidrRangeTest, NonByteAlignedPrefix) {
    auto r = CidrRange::parse("172.16.0.0/12");
    EXPECT_TRUE(r.contains(ip::make_address("172.31.255.255")));
    EXPECT_FALSE(r.contains(ip::make_address("172.32.0.0")));
}

TEST(CidrRangeTest, RejectsMalformedEntries) {
    EXPECT_THROW(CidrRange::parse(""), std::invalid_argument);
    EXPECT_THROW(CidrRange::parse("10.0.0.0/"), std::invalid_argument);
    EXPECT_THROW(CidrRange::parse("10.0.0.0/33"), std::invalid_argument);
    EXPECT_THROW(CidrRange::parse("2001:db8::/129"), std::invalid_argument);
    EXPECT_THROW(CidrRange::parse("10.0.0.0/-1"), std::invalid_argument);
    EXPECT_THROW(CidrRange::parse("300.1.1.1"), std::invalid_argument);
    EXPECT_THROW(CidrRange::parse("example.com"), std::invalid_argument);
}
