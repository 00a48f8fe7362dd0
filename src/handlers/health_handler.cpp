#include "handlers/health_handler.hpp"
#include "json_response.hpp"
#include "metrics.hpp"

namespace streamguard {

static constexpr const char* kVersion = "2.0.0";

http::response<http::string_body> HealthHandler::handle_root(const RequestContext& ctx) {
    json::object endpoints;
    endpoints["health"] = "/api/v2/system/health";
    endpoints["info"] = "/api/v2/videos/{platform}/{video_id}";
    endpoints["playlist"] = "/api/v2/playlists/{platform}/{playlist_id}";
    endpoints["smart"] = "/api/v2/stream/{platform}/{video_id}";
    endpoints["metrics"] = "/api/v2/stream/metrics";

    json::array platforms;
    for (const auto& p : config_.security.allowed_platforms) {
        platforms.push_back(json::string(p));
    }

    json::object response;
    response["name"] = "streamguard";
    response["version"] = kVersion;
    response["description"] = "Video streaming API behind a request-security pipeline";
    response["health_url"] = "/api/v2/system/health";
    response["endpoints"] = std::move(endpoints);
    response["supported_platforms"] = std::move(platforms);
    response["timestamp"] = utc_timestamp();

    auto res = make_json_response(http::status::ok, ctx.version, response);
    res.keep_alive(ctx.keep_alive);
    return res;
}

http::response<http::string_body> HealthHandler::handle_health(const RequestContext& ctx) {
    bool cache_ok = lookup_.is_healthy();

    json::object services;
    services["cache"] = cache_ok ? "healthy" : "unhealthy";
    services["extractor"] = "available";
    services["audit_log"] = audit_.is_enabled() ? "enabled" : "disabled";

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();

    json::object response;
    response["status"] = cache_ok ? "healthy" : "degraded";
    response["timestamp"] = utc_timestamp();
    response["version"] = kVersion;
    response["services"] = std::move(services);
    response["uptime_seconds"] = static_cast<int64_t>(uptime);
    response["tls"] = config_.enable_tls;

    auto res = make_json_response(cache_ok ? http::status::ok : http::status::service_unavailable,
                                  ctx.version, response);
    res.keep_alive(ctx.keep_alive);
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(const RequestContext& ctx) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, ctx.version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    res.keep_alive(ctx.keep_alive);
    return res;
}

}
