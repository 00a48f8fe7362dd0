#include <gtest/gtest.h>
#include "request_size_limiter.hpp"

using namespace streamguard;

class RequestSizeLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy.max_url_length = 100;
        policy.max_query_length = 40;
        policy.max_header_size = 64;
        policy.max_request_body_size = 128;
    }

    http::request<http::string_body> get(const std::string& target) {
        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "example.com");
        return req;
    }

    SecurityPolicy policy;
};

TEST_F(RequestSizeLimiterTest, WithinLimitsPasses) {
    RequestSizeLimiter limiter(policy);
    EXPECT_FALSE(limiter.check(get("/videos/youtube/abc?quality=720p")).has_value());
}

TEST_F(RequestSizeLimiterTest, UrlTooLong) {
    RequestSizeLimiter limiter(policy);
    auto v = limiter.check(get("/" + std::string(100, 'a')));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->dimension, SizeDimension::Url);
    EXPECT_EQ(v->size, 101);
    EXPECT_EQ(v->limit, 100);
}

TEST_F(RequestSizeLimiterTest, QueryTooLong) {
    RequestSizeLimiter limiter(policy);
    auto v = limiter.check(get("/x?" + std::string(41, 'q')));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->dimension, SizeDimension::Query);
    EXPECT_EQ(v->size, 41);
    EXPECT_STREQ(to_string(v->dimension), "query");
}

TEST_F(RequestSizeLimiterTest, QueryAtLimitPasses) {
    RequestSizeLimiter limiter(policy);
    EXPECT_FALSE(limiter.check(get("/x?" + std::string(40, 'q'))).has_value());
}

TEST_F(RequestSizeLimiterTest, SingleHeaderTooLarge) {
    RequestSizeLimiter limiter(policy);
    auto req = get("/x");
    req.set("X-Padding", std::string(60, 'p'));
    auto v = limiter.check(req);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->dimension, SizeDimension::Header);
    EXPECT_EQ(v->header_name, "X-Padding");
}

TEST_F(RequestSizeLimiterTest, DeclaredContentLengthCheckedBeforeBody) {
    RequestSizeLimiter limiter(policy);
    http::request_header<> h;
    h.method(http::verb::post);
    h.target("/x");
    h.set(http::field::content_length, "4096");
    auto v = limiter.check_header(h);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->dimension, SizeDimension::Body);
    EXPECT_EQ(v->size, 4096);
}

TEST_F(RequestSizeLimiterTest, ReceivedBodyTooLarge) {
    RequestSizeLimiter limiter(policy);
    EXPECT_FALSE(limiter.check_body(128).has_value());
    auto v = limiter.check_body(129);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->dimension, SizeDimension::Body);
}

TEST_F(RequestSizeLimiterTest, ParserCeilingMatchesPolicy) {
    RequestSizeLimiter limiter(policy);
    EXPECT_EQ(limiter.body_read_limit(), 128u);

    http::request_parser<http::string_body> parser;
    limiter.apply_body_limit(parser);

    std::string wire =
        "POST /x HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Content-Length: 200\r\n"
        "\r\n" + std::string(200, 'b');

    boost::beast::error_code ec;
    parser.put(boost::asio::buffer(wire), ec);
    EXPECT_EQ(ec, http::error::body_limit);
}
