#include <gtest/gtest.h>
#include "ip_access_controller.hpp"

using namespace streamguard;

TEST(IpAccessControllerTest, DisabledIsPermissive) {
    CidrAccessController ctl({"10.0.0.0/8"}, {"0.0.0.0/0"}, false);
    EXPECT_FALSE(ctl.is_blocked("1.2.3.4"));
    EXPECT_TRUE(ctl.is_allowed("1.2.3.4"));
    EXPECT_TRUE(ctl.is_allowed("garbage"));
}

TEST(IpAccessControllerTest, EmptyAllowlistAllowsAll) {
    CidrAccessController ctl({}, {"10.0.0.0/24"}, true);
    EXPECT_TRUE(ctl.is_allowed("8.8.8.8"));
    EXPECT_TRUE(ctl.is_blocked("10.0.0.5"));
    EXPECT_FALSE(ctl.is_blocked("10.0.1.5"));
}

TEST(IpAccessControllerTest, AllowlistDeniesUnlisted) {
    CidrAccessController ctl({"192.168.0.0/16", "2001:db8::/32"}, {}, true);
    EXPECT_TRUE(ctl.is_allowed("192.168.4.4"));
    EXPECT_TRUE(ctl.is_allowed("2001:db8::7"));
    EXPECT_FALSE(ctl.is_allowed("10.0.0.1"));
    EXPECT_FALSE(ctl.is_allowed("not-an-address"));
}

TEST(IpAccessControllerTest, BlocklistTakesPrecedence) {
    CidrAccessController ctl({"10.0.0.0/8"}, {"10.0.0.5"}, true);
    EXPECT_TRUE(ctl.is_allowed("10.0.0.5"));
    EXPECT_TRUE(ctl.is_blocked("10.0.0.5"));
    EXPECT_FALSE(ctl.is_blocked("10.0.0.6"));
}

TEST(IpAccessControllerTest, HostRangeMatchesExactlyOneAddress) {
    CidrAccessController ctl({}, {"198.51.100.20/32", "2001:db8::20/128"}, true);
    EXPECT_TRUE(ctl.is_blocked("198.51.100.20"));
    EXPECT_FALSE(ctl.is_blocked("198.51.100.21"));
    EXPECT_FALSE(ctl.is_blocked("198.51.100.19"));
    EXPECT_TRUE(ctl.is_blocked("2001:db8::20"));
    EXPECT_FALSE(ctl.is_blocked("2001:db8::21"));
}

TEST(IpAccessControllerTest, Ipv6RangeDoesNotCoverIpv4Clients) {
    CidrAccessController blocked({}, {"::/0"}, true);
    EXPECT_FALSE(blocked.is_blocked("10.0.0.5"));
    EXPECT_TRUE(blocked.is_blocked("2001:db8::5"));

    CidrAccessController allowed({"::/0"}, {}, true);
    EXPECT_FALSE(allowed.is_allowed("10.0.0.5"));
}

TEST(IpAccessControllerTest, MalformedEntryThrows) {
    EXPECT_THROW(CidrAccessController({"10.0.0.0/40"}, {}, true), std::invalid_argument);
}

TEST(IpAccessControllerTest, StripPort) {
    EXPECT_EQ(strip_port("1.2.3.4:5678"), "1.2.3.4");
    EXPECT_EQ(strip_port("1.2.3.4"), "1.2.3.4");
    EXPECT_EQ(strip_port("[2001:db8::1]:443"), "2001:db8::1");
    EXPECT_EQ(strip_port("2001:db8::1"), "2001:db8::1");
    EXPECT_EQ(strip_port(""), "");
}

TEST(IpAccessControllerTest, ClientAddressHeaderPriority) {
    http::request_header<> h;
    EXPECT_EQ(extract_client_address(h, "9.9.9.9:1234"), "9.9.9.9");

    h.set("X-Forwarded-For", " 7.7.7.7 , 6.6.6.6");
    EXPECT_EQ(extract_client_address(h, "9.9.9.9:1234"), "7.7.7.7");

    h.set("X-Real-IP", "5.5.5.5");
    EXPECT_EQ(extract_client_address(h, "9.9.9.9:1234"), "5.5.5.5");

    h.set("CF-Connecting-IP", "4.4.4.4");
    EXPECT_EQ(extract_client_address(h, "9.9.9.9:1234"), "4.4.4.4");
}

TEST(IpAccessControllerTest, EmptyHeadersFallThrough) {
    http::request_header<> h;
    h.set("CF-Connecting-IP", "  ");
    h.set("X-Forwarded-For", "");
    EXPECT_EQ(extract_client_address(h, "[2001:db8::9]:80"), "2001:db8::9");
}
