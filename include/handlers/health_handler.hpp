#pragma once

#include <chrono>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include "server_config.hpp"
#include "request_context.hpp"
#include "video_lookup.hpp"
#include "audit_logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace streamguard {

// Service descriptor, health and metrics endpoints.
class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, VideoLookup& lookup, const AuditLogger& audit)
        : config_(config), lookup_(lookup), audit_(audit)
        , started_(std::chrono::steady_clock::now()) {}

    http::response<http::string_body> handle_root(const RequestContext& ctx);

    // 200 when the cache answers, 503 (degraded) otherwise.
    http::response<http::string_body> handle_health(const RequestContext& ctx);

    http::response<http::string_body> handle_metrics(const RequestContext& ctx);

private:
    const ServerConfig& config_;
    VideoLookup& lookup_;
    const AuditLogger& audit_;
    std::chrono::steady_clock::time_point started_;
};

}
