#include <gtest/gtest.h>
#include "api_router.hpp"
#include "request_pipeline.hpp"
#include "route_matcher.hpp"
#include "metrics.hpp"
#include "test_support.hpp"

using namespace streamguard;
using fakes::CapturingAuditLogger;
using fakes::FakeVideoLookup;
using fakes::make_get;
using fakes::make_request;
using fakes::parse_body;

class ApiRouterTest : public ::testing::Test {
protected:
    Response dispatch(const Request& req) {
        RequestContext ctx;
        ctx.request_id = "5d1b9c9e-0000-4000-8000-000000000001";
        ctx.request = RequestInfo{"198.51.100.10", std::string(req.method_string()),
                                  std::string(req.target()), "streamguard-tests/1.0"};
        ctx.version = req.version();
        ctx.keep_alive = req.keep_alive();
        ctx.cancelled = cancelled;
        populate_context(std::string(req.target()), ctx);
        ctx.clean_path = ctx.raw_path;

        SecureErrorHandler errors(config.security, audit);
        ApiRouter router(config, lookup, audit, errors);
        return router.handle(req, ctx);
    }

    static std::string header(const Response& res, http::field name) {
        auto it = res.find(name);
        return it == res.end() ? std::string() : std::string(it->value());
    }

    ServerConfig config;
    CapturingAuditLogger audit;
    FakeVideoLookup lookup;
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);
};

TEST_F(ApiRouterTest, RootDescribesService) {
    auto res = dispatch(make_get("/api/v2"));
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = parse_body(res);
    EXPECT_EQ(body["name"].as_string(), "streamguard");
    EXPECT_FALSE(body["supported_platforms"].as_array().empty());
    EXPECT_TRUE(body["endpoints"].as_object().contains("smart"));
}

TEST_F(ApiRouterTest, HealthReportsCacheState) {
    auto ok = dispatch(make_get("/api/v2/system/health"));
    EXPECT_EQ(ok.result(), http::status::ok);
    EXPECT_EQ(parse_body(ok)["status"].as_string(), "healthy");

    lookup.healthy = false;
    auto degraded = dispatch(make_get("/health"));
    EXPECT_EQ(degraded.result(), http::status::service_unavailable);
    auto body = parse_body(degraded);
    EXPECT_EQ(body["status"].as_string(), "degraded");
    EXPECT_EQ(body["services"].as_object().at("cache").as_string(), "unhealthy");
}

TEST_F(ApiRouterTest, MetricsArePrometheusText) {
    MetricsRegistry::instance().increment_counter(metric::kRequestsTotal);
    auto res = dispatch(make_get("/api/v2/stream/metrics"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(header(res, http::field::content_type), "text/plain; version=0.0.4");
    EXPECT_NE(res.body().find("# TYPE streamguard_requests_total counter"), std::string::npos);
}

TEST_F(ApiRouterTest, VideoInfoWrappedInSuccessBody) {
    auto res = dispatch(make_get("/api/v2/videos/YouTube/dQw4w9WgXcQ"));
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = parse_body(res);
    EXPECT_TRUE(body["success"].as_bool());
    EXPECT_EQ(body["message"].as_string(), "Video information retrieved successfully");
    EXPECT_EQ(body["data"].as_object().at("platform").as_string(), "youtube");
    EXPECT_EQ(lookup.video_calls, 1);
}

TEST_F(ApiRouterTest, PlaylistInfo) {
    auto res = dispatch(make_get("/playlists/youtube/PL123"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(parse_body(res)["data"].as_object().at("id").as_string(), "PL123");
    EXPECT_EQ(lookup.playlist_calls, 1);
}

TEST_F(ApiRouterTest, DirectStreamRedirects) {
    auto res = dispatch(make_get("/api/v2/stream/youtube/abc?quality=720p&mode=direct"));
    EXPECT_EQ(res.result(), http::status::found);
    EXPECT_EQ(header(res, http::field::location), "https://cdn.example.com/youtube/abc/720p.mp4");
    EXPECT_EQ(lookup.last_quality, "720p");
}

TEST_F(ApiRouterTest, ProxyStreamReturnsDescriptor) {
    auto res = dispatch(make_get("/api/v2/stream/youtube/abc?mode=proxy"));
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = parse_body(res);
    EXPECT_TRUE(body["success"].as_bool());
    EXPECT_EQ(body["stream_url"].as_string(), "https://cdn.example.com/youtube/abc/best.mp4");
    EXPECT_TRUE(body.contains("expires_at"));
    EXPECT_EQ(body["video_info"].as_object().at("id").as_string(), "abc");
}

TEST_F(ApiRouterTest, SmartProxyFollowsCountry) {
    auto req = make_get("/api/v2/stream/youtube/abc");
    req.set("CF-IPCountry", "cn");
    EXPECT_EQ(dispatch(req).result(), http::status::ok);

    auto us = make_get("/api/v2/stream/youtube/abc?country=US");
    EXPECT_EQ(dispatch(us).result(), http::status::found);

    auto unknown = make_get("/api/v2/stream/youtube/abc");
    unknown.set("CF-IPCountry", "XX");
    EXPECT_EQ(dispatch(unknown).result(), http::status::found);
}

TEST_F(ApiRouterTest, SmartProxyDisabledUsesDefaultMode) {
    config.smart_proxy_enabled = false;
    config.default_stream_mode = "proxy";
    auto req = make_get("/api/v2/stream/youtube/abc?country=US");
    EXPECT_EQ(dispatch(req).result(), http::status::ok);
}

TEST_F(ApiRouterTest, DetectCountryPrefersQuery) {
    auto req = make_get("/stream/youtube/abc?country=de");
    req.set("X-Country-Code", "FR");
    RequestContext ctx;
    populate_context(std::string(req.target()), ctx);
    EXPECT_EQ(VideoHandler::detect_country(req, ctx), "DE");

    auto headers_only = make_get("/stream/youtube/abc");
    headers_only.set("X-Country-Code", "fr");
    RequestContext ctx2;
    populate_context(std::string(headers_only.target()), ctx2);
    EXPECT_EQ(VideoHandler::detect_country(headers_only, ctx2), "FR");
}

TEST_F(ApiRouterTest, LookupTimeoutIsGatewayTimeout) {
    lookup.error = LookupError(LookupError::Kind::Timeout, "extractor exceeded 60s");
    auto res = dispatch(make_get("/api/v2/videos/youtube/abc"));
    EXPECT_EQ(res.result(), http::status::gateway_timeout);
    EXPECT_EQ(parse_body(res)["error"].as_string(), "Failed to get video info");
}

TEST_F(ApiRouterTest, LookupFailureIsBadGatewayWithoutInternals) {
    lookup.error = LookupError(LookupError::Kind::Unavailable,
                               "extractor not found in PATH: /opt/tools/yt-dlp");
    auto res = dispatch(make_get("/api/v2/stream/youtube/abc"));
    EXPECT_EQ(res.result(), http::status::bad_gateway);
    EXPECT_EQ(parse_body(res)["error"].as_string(), "Failed to get stream URL");
    EXPECT_EQ(res.body().find("/opt/tools"), std::string::npos);
}

TEST_F(ApiRouterTest, CancelledStreamSkipsLookup) {
    cancelled->store(true);
    auto res = dispatch(make_get("/api/v2/stream/youtube/abc"));
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    EXPECT_EQ(lookup.stream_calls, 0);
}

TEST_F(ApiRouterTest, UnknownRouteIs404) {
    auto res = dispatch(make_get("/api/v2/unknown"));
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(parse_body(res)["error"].as_string(), "Resource not found");
}

TEST_F(ApiRouterTest, NonGetIs405WithAllow) {
    auto res = dispatch(make_request(http::verb::delete_, "/api/v2/videos/youtube/abc"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(header(res, http::field::allow), "GET, OPTIONS");
    EXPECT_EQ(lookup.video_calls, 0);
}

TEST_F(ApiRouterTest, PreflightAndCorsHeaders) {
    auto res = dispatch(make_request(http::verb::options, "/api/v2/videos/youtube/abc"));
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(header(res, http::field::access_control_allow_origin), "*");
    EXPECT_EQ(header(res, http::field::access_control_allow_methods), "GET, OPTIONS");

    auto get = dispatch(make_get("/health"));
    EXPECT_EQ(header(get, http::field::access_control_expose_headers), "X-Request-ID");
}

// The router installed behind the full chain, as the server wires it.
TEST_F(ApiRouterTest, ServesThroughPipeline) {
    RequestPipeline pipeline(config.security, audit);
    ApiRouter router(config, lookup, audit, pipeline.errors());
    RequestPipeline::Handler handler = [&router](const Request& req, RequestContext& ctx) {
        return router.handle(req, ctx);
    };

    auto ok = pipeline.process(make_get("/api/v2/videos/youtube/dQw4w9WgXcQ"), "198.51.100.10:40000", handler);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->result(), http::status::ok);
    EXPECT_EQ(header(*ok, http::field::access_control_allow_origin), "*");
    EXPECT_FALSE(header(*ok, http::field::server).empty());
    EXPECT_NE(ok->find("X-Request-ID"), ok->end());

    auto rejected = pipeline.process(make_get("/api/v2/videos/myspace/abc"), "198.51.100.10:40000", handler);
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->result(), http::status::bad_request);
    EXPECT_EQ(lookup.video_calls, 1);
}
