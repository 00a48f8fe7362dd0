#include <gtest/gtest.h>
#include "security_headers.hpp"
#include <iterator>

using namespace streamguard;

static std::string header(const http::response<http::string_body>& res, const char* name) {
    auto it = res.find(name);
    return it == res.end() ? std::string() : std::string(it->value());
}

TEST(SecurityHeadersTest, DefaultPolicyEmitsSevenHeaders) {
    SecurityPolicy policy;
    SecurityHeaders composer(policy);
    EXPECT_EQ(composer.headers().size(), 7u);

    http::response<http::string_body> res{http::status::ok, 11};
    composer.apply(res);

    EXPECT_EQ(header(res, "X-Content-Type-Options"), "nosniff");
    EXPECT_EQ(header(res, "X-Frame-Options"), "DENY");
    EXPECT_EQ(header(res, "X-XSS-Protection"), "1; mode=block");
    EXPECT_EQ(header(res, "Content-Security-Policy"), "default-src 'self'");
    EXPECT_EQ(header(res, "Referrer-Policy"), "strict-origin-when-cross-origin");
    EXPECT_EQ(header(res, "Permissions-Policy"), "geolocation=(), microphone=(), camera=()");
    EXPECT_EQ(header(res, "Strict-Transport-Security"), "max-age=31536000; includeSubDomains; preload");
}

TEST(SecurityHeadersTest, HstsAbsentWhenDisabled) {
    SecurityPolicy policy;
    policy.enable_hsts = false;
    SecurityHeaders composer(policy);

    http::response<http::string_body> res{http::status::forbidden, 11};
    composer.apply(res);
    EXPECT_EQ(res.find("Strict-Transport-Security"), res.end());
    EXPECT_EQ(header(res, "X-Frame-Options"), "DENY");
}

TEST(SecurityHeadersTest, PolicyStringsVerbatim) {
    SecurityPolicy policy;
    policy.csp_directives = "default-src 'none'; img-src https:";
    policy.referrer_policy = "no-referrer";
    policy.hsts_max_age = 63072000;
    SecurityHeaders composer(policy);

    http::response<http::string_body> res{http::status::ok, 11};
    composer.apply(res);
    EXPECT_EQ(header(res, "Content-Security-Policy"), "default-src 'none'; img-src https:");
    EXPECT_EQ(header(res, "Referrer-Policy"), "no-referrer");
    EXPECT_EQ(header(res, "Strict-Transport-Security"), "max-age=63072000; includeSubDomains; preload");
}

TEST(SecurityHeadersTest, ApplyOverwritesExistingValues) {
    SecurityHeaders composer(SecurityPolicy{});
    http::response<http::string_body> res{http::status::ok, 11};
    res.set("X-Frame-Options", "SAMEORIGIN");
    composer.apply(res);
    EXPECT_EQ(header(res, "X-Frame-Options"), "DENY");
    EXPECT_EQ(std::distance(res.equal_range("X-Frame-Options").first,
                            res.equal_range("X-Frame-Options").second), 1);
}
